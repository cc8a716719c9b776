//
// Created by Malik T on 04/11/2025.
//

#include "RandomAi.hpp"
#include <random>
#include <ranges>
#include <utility>

#include "Category.hpp"
#include "Exception.hpp"

namespace yahtzee::core
{
    RandomAI::RandomAI(uint64_t rng_seed):
        rng_(static_cast<std::mt19937::result_type>(rng_seed)) {}

    auto RandomAI::Play(std::shared_ptr<const GameSnapshot> snapshot) -> PlayerAction
    {
        YTZ_ASSERT(snapshot != nullptr, "RandomAI given a null snapshot");

        if (snapshot->phase == Phase::Rolling)
        {
            return RollMove(*snapshot);
        }
        if (snapshot->phase == Phase::ChoosingCategory)
        {
            return ScoreMove(*snapshot);
        }
        YTZ_THROW(error::Code::State, "RandomAI asked to move outside of a turn");
    }

    auto RandomAI::RollMove(GameSnapshot const& s) -> PlayerAction
    {
        if (s.rolls_left == 0) return EndTurnAction{};

        // 0..4 toggle that die, 5 rolls, 6 ends the turn
        std::uniform_int_distribution<int> choice{0, static_cast<int>(constants::NumDice) + 1};
        int const c = choice(rng_);
        if (c < static_cast<int>(constants::NumDice))
        {
            return ToggleKeepAction{static_cast<uint8_t>(c)};
        }
        if (c == static_cast<int>(constants::NumDice))
        {
            return RollAction{};
        }
        return EndTurnAction{};
    }

    auto RandomAI::ScoreMove(GameSnapshot const& s) -> PlayerAction
    {
        Scoreboard const& board = s.scoreboards.at(s.current_player);

        auto const unused = [&](Category const c) { return !board.IsUsed(c); };
        auto const eligible = [&](Category const c)
        {
            return s.zero_mode || !RequiresEligibility(c) || s.possible[Index(c)] > 0;
        };

        auto cand = std::ranges::to<std::vector<Category>>(
            AllCategories | std::views::filter(unused) | std::views::filter(eligible));

        if (!cand.empty())
        {
            return ChooseCategoryAction{cand[pick(cand)]};
        }

        // Only ineligible lower categories remain: forfeit one of them.
        YTZ_ASSERT(!s.zero_mode, "No unused category left in zero mode");
        return ZeroModeAction{};
    }
}
