//
// Created by Malik T on 05/11/2025.
//

#ifndef YAHTZEE_RECORDINGPLAYER_HPP
#define YAHTZEE_RECORDINGPLAYER_HPP

#include <memory>
#include <utility>
#include <vector>

#include "../core/Player.hpp"

namespace yahtzee::core::debug
{
    class RecordingPlayer final : public Player
    {
    public:
        explicit RecordingPlayer(std::unique_ptr<Player> inner)
            : inner_{std::move(inner)}
        {
        }

        auto Play(std::shared_ptr<const GameSnapshot> s) -> PlayerAction override
        {
            last_action_ = inner_->Play(std::move(s));
            ++count_;
            return last_action_;
        }

        auto HasLast() const -> bool
        {
            return count_ != 0;
        }

        auto Last() const -> PlayerAction const&
        {
            return last_action_;
        }

        auto Count() const -> size_t
        {
            return count_;
        }

    private:
        std::unique_ptr<Player> inner_;
        PlayerAction last_action_{EndTurnAction{}};
        size_t count_{0};
    };

    // Helper to wrap a vector<unique_ptr<Player>>; empty (local) seats stay empty
    inline auto WrapRecording(std::vector<std::unique_ptr<Player>>& players)
        -> std::vector<std::unique_ptr<Player>>
    {
        std::vector<std::unique_ptr<Player>> out;
        out.reserve(players.size());

        for (auto& p : players)
        {
            if (p) out.emplace_back(std::make_unique<RecordingPlayer>(std::move(p)));
            else   out.emplace_back(nullptr);
        }

        return out;
    }

    // Downcast helper (only safe if you used WrapRecording at construction)
    inline auto AsRecording(Player* p) -> RecordingPlayer*
    {
        return dynamic_cast<RecordingPlayer*>(p);
    }
} // namespace yahtzee::core::debug

#endif //YAHTZEE_RECORDINGPLAYER_HPP
