//
// Created by Malik T on 03/11/2025.
//

#ifndef YAHTZEE_GAME_HPP
#define YAHTZEE_GAME_HPP

#include <random>
#include <span>
#include <string>
#include "Types.hpp"
#include "Actions.hpp"
#include "State.hpp"
#include "Rules.hpp"
#include "Player.hpp"
#include "Scoreboard.hpp"

namespace yahtzee::core::debug {struct Inspector;}
namespace yahtzee::core
{
    class GameImpl
    {
    public:
        GameImpl() = delete;
        // players[seat] == nullptr marks a seat driven by local input. An empty
        // vector means every seat is local.
        GameImpl(Config const& config,
                 std::unique_ptr<Rules> rules,
                 std::vector<std::unique_ptr<Player>> players = {});

        // Validate/apply/advance one action for the player whose turn it is.
        auto Submit(PlayerAction const& action) -> MoveOutcome;
        // Ask the computer player on the current seat for its next action.
        auto Propose() -> PlayerAction;
        // Propose() followed by Submit().
        auto Step() -> MoveOutcome;
        // Dry-run validation, state is untouched.
        auto Check(PlayerAction const& action) const -> Rules::CheckResult;

        // Clears every scoreboard and starts again from round 1, seat 0.
        auto Restart() -> void;

        auto Snapshot() const -> std::shared_ptr<GameSnapshot const>;

        auto CurrentPlayer() const noexcept -> PlyrIdxT { return current_idx_; }
        auto Round()         const noexcept -> uint8_t  { return round_; }
        auto PhaseNow()      const noexcept -> Phase    { return phase_; }
        auto RollsLeft()     const noexcept -> uint8_t  { return rolls_left_; }
        auto ZeroMode()      const noexcept -> bool     { return zero_mode_; }
        auto Dice()          const noexcept -> DiceT const& { return dice_; }
        auto PlayerCount()   const noexcept -> size_t   { return scoreboards_.size(); }
        auto IsOver()        const noexcept -> bool     { return phase_ == Phase::GameOver; }
        auto Seed()          const noexcept -> uint64_t { return cfg_.seed; }

        auto Board(PlyrIdxT seat) const -> Scoreboard const& { return scoreboards_.at(seat); }
        auto PossibleScores() const -> ScoreTableT;
        auto IsComputerSeat(PlyrIdxT seat) const -> bool { return static_cast<bool>(players_.at(seat)); }
        auto PlayerAt(PlyrIdxT seat) -> Player* { return players_.at(seat).get(); }

        //allows class to directly access private data on an instance
        friend class ClassicRules;
        friend struct debug::Inspector;

    private:
        // Fresh keep flags, mandatory first roll, full re-roll budget.
        auto BeginTurn(PlyrIdxT seat) -> void;
        auto RollUnkept() -> void;
        inline auto NextSeat(PlyrIdxT const idx) const -> PlyrIdxT { return static_cast<PlyrIdxT>((idx + 1) % scoreboards_.size()); }

    private:
        Config cfg_;
        std::unique_ptr<Rules> rules_;
        std::vector<std::unique_ptr<Player>> players_;
        std::mt19937_64 rng_;
        std::uniform_int_distribution<int> face_dist_{1, static_cast<int>(constants::NumFaces)};

        // Authoritative state
        std::vector<Scoreboard> scoreboards_;                 // [seat]
        DiceT dice_{};

        // Turn/round state
        PlyrIdxT current_idx_{0};
        uint8_t  round_{1};
        uint8_t  rolls_left_{constants::MaxRollsPerTurn};
        Phase    phase_{Phase::Rolling};
        bool     zero_mode_{false};
    };
}
#endif //YAHTZEE_GAME_HPP
