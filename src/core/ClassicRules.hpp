//
// Created by Malik T on 03/11/2025.
//

#ifndef YAHTZEE_CLASSICRULES_HPP
#define YAHTZEE_CLASSICRULES_HPP
#include "Rules.hpp"

namespace yahtzee::core
{
    // Standard 13-round Yahtzee without joker or extra-yahtzee bonuses.
    class ClassicRules final : public Rules
    {
    public:
        auto Validate(GameImpl const& game, PlayerAction const& a) const -> CheckResult override;
        auto Apply(GameImpl& game, PlayerAction const& a) -> void override;
        auto Advance(GameImpl& game) -> MoveOutcome override;
    };
}

#endif //YAHTZEE_CLASSICRULES_HPP
