//
// Created by Malik T on 05/11/2025.
//

#ifndef YAHTZEE_INSPECTOR_HPP
#define YAHTZEE_INSPECTOR_HPP

#include <vector>
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>

#include "../core/Types.hpp"
#include "../core/Game.hpp"

namespace yahtzee::core::debug
{
    struct Inspector
    {
        struct SnapshotAll
        {
            std::vector<std::array<std::optional<ScoreT>, constants::NumCategories>> boards;
            DiceT dice{};
            uint8_t n_players{};
            PlyrIdxT current_idx{};
            uint8_t round{};
            uint8_t rolls_left{};
            Phase phase{};
            bool zero_mode{};
        };

        static inline auto Gather(GameImpl const& g) -> SnapshotAll
        {
            SnapshotAll ret{};
            ret.n_players = static_cast<uint8_t>(g.scoreboards_.size());
            ret.current_idx = g.current_idx_;
            ret.round = g.round_;
            ret.rolls_left = g.rolls_left_;
            ret.phase = g.phase_;
            ret.zero_mode = g.zero_mode_;
            ret.dice = g.dice_;

            ret.boards.resize(g.scoreboards_.size());
            for (size_t i{}; i < g.scoreboards_.size(); ++i)
            {
                for (Category const c : AllCategories)
                {
                    ret.boards[i][Index(c)] = g.scoreboards_[i].Get(c);
                }
            }
            return ret;
        }

#if YTZ_ENABLE_TEST_HOOKS == true
        // Test-only: put specific faces on the table, keep flags untouched.
        static inline auto ForceFaces(GameImpl& g, FacesT const& faces) -> void
        {
            for (size_t i{}; i < constants::NumDice; ++i)
            {
                g.dice_[i].value = faces[i];
            }
        }
#endif
    };
}

#endif //YAHTZEE_INSPECTOR_HPP
