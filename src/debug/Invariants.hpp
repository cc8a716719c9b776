//
// Created by Malik T on 05/11/2025.
//

#ifndef YAHTZEE_INVARIANTS_HPP
#define YAHTZEE_INVARIANTS_HPP

#include "../core/Game.hpp"
#include "Inspector.hpp"
#include <cassert>
#include <algorithm>
#include <ranges>

namespace yahtzee::core::debug
{
    // A second layer of checks run by the self-play tests after every step.
    inline auto CheckInvariants(GameImpl const& g) -> void
    {
#if YTZ_ENABLE_TEST_HOOKS == false
        (void)g;
#else
        using namespace std;

        Inspector::SnapshotAll const s = Inspector::Gather(g);

        // 1) Every face on the table is a real die face
        for (Die const& d : s.dice)
        {
            assert(d.value >= 1 && d.value <= constants::NumFaces && "Die face outside [1,6]");
        }

        // 2) Seat and round in range, re-roll budget never exceeded
        assert(s.current_idx < s.n_players && "Current seat out of range");
        assert(s.round >= 1 && s.round <= constants::MaxRounds && "Round out of range");
        assert(s.rolls_left <= constants::MaxRollsPerTurn && "More rolls left than a turn allows");

        // 3) Scored is transient, Advance must have resolved it
        assert(s.phase != Phase::Scored && "Scored phase leaked out of Advance");

        // 4) A rolling player with no re-rolls would have been moved to the scorecard
        if (s.phase == Phase::Rolling)
        {
            assert(s.rolls_left > 0 && "Rolling phase with no rolls left");
            assert(!s.zero_mode && "Zero mode active while rolling");
        }

        // 5) Scorecards fill in lockstep: before seat `current` has taken round r's
        //    score, seats [0, current) hold r entries and the rest r-1.
        if (s.phase != Phase::GameOver)
        {
            for (size_t seat{}; seat < s.boards.size(); ++seat)
            {
                auto const filled = static_cast<size_t>(ranges::count_if(s.boards[seat],
                    [](optional<ScoreT> const& e) { return e.has_value(); }));
                size_t const expected = s.round - 1 + (seat < s.current_idx ? 1u : 0u);
                assert(filled == expected && "Scorecard fill count out of step with the round");
            }
        }
        else
        {
            for (auto const& board : s.boards)
            {
                assert(ranges::all_of(board, [](optional<ScoreT> const& e) { return e.has_value(); })
                       && "Game over with unscored categories");
            }
        }
#endif // YTZ_ENABLE_TEST_HOOKS == true
    }
}
#endif //YAHTZEE_INVARIANTS_HPP
