//
// Created by Malik T on 10/11/2025.
//

#ifndef YAHTZEE_SCREENS_HPP
#define YAHTZEE_SCREENS_HPP

#include <optional>
#include <string>
#include <vector>
#include "Renderer.hpp"
#include "CupAnimation.hpp"
#include "../core/State.hpp"

namespace yahtzee::ui
{
    auto DrawPromptScreen(Renderer& r, std::optional<uint32_t> chosen) -> void;

    // Rolling table; cup animation drives dice positions while active.
    auto DrawRollingScreen(Renderer& r, core::GameSnapshot const& s, CupAnimation const& anim,
                           bool computer_seat) -> void;

    auto DrawScorecardScreen(Renderer& r, core::GameSnapshot const& s, bool computer_seat) -> void;

    auto DrawGameOverScreen(Renderer& r, std::vector<core::Scoreboard> const& boards) -> void;

    // "Possible Score = 12", "Not eligible" or "USED (Score: 9)" for one scorecard row.
    auto ScorecardCellText(core::GameSnapshot const& s, core::Category c) -> std::string;
}

#endif //YAHTZEE_SCREENS_HPP
