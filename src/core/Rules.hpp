//
// Created by Malik T on 03/11/2025.
//

#ifndef YAHTZEE_RULES_HPP
#define YAHTZEE_RULES_HPP

#include "Actions.hpp"
#include "Types.hpp"
#include "Exception.hpp"

namespace yahtzee::core
{
    //forward declaration
    class GameImpl;

    class Rules
    {
    public:
        using CheckResult = error::ValidateResult;

        virtual ~Rules() = default;

        // Returns unexpected(reason) for ordinary rule violations (NOT exceptions).
        // Throw only for engine misuse / broken invariants.
        virtual auto Validate(GameImpl const& game, PlayerAction const& a) const -> CheckResult = 0;

        // Mutate authoritative state (dice, keep flags, scoreboards).
        virtual auto Apply(GameImpl& game, PlayerAction const& a) -> void = 0;

        // Resolve automatic transitions (out of rolls, scored -> next seat/round/game over).
        virtual auto Advance(GameImpl& game) -> MoveOutcome = 0;
    };
}

#endif //YAHTZEE_RULES_HPP
