//
// Created by Malik T on 02/11/2025.
//

#ifndef YAHTZEE_ACTIONS_HPP
#define YAHTZEE_ACTIONS_HPP

#include "Types.hpp"

namespace yahtzee::core
{
    // re-roll every die that is not kept
    struct RollAction           {};
    struct ToggleKeepAction     { uint8_t die{}; };
    // stop rolling and move to the scorecard
    struct EndTurnAction        {};
    // next category choice is forced to 0
    struct ZeroModeAction       {};
    struct ChooseCategoryAction { Category category{}; };

    using PlayerAction = std::variant<
      RollAction, ToggleKeepAction, EndTurnAction, ZeroModeAction, ChooseCategoryAction>;

    enum class MoveOutcome : uint8_t
    {
        Invalid,
        Applied,
        TurnEnded,
        RoundEnded,
        GameEnded
    };

    enum class Phase : uint8_t
    {
        Rolling,
        ChoosingCategory,
        Scored,
        GameOver
    };
} // namespace yahtzee::core

#endif //YAHTZEE_ACTIONS_HPP
