//
// Created by Malik T on 08/11/2025.
//

#include "Input.hpp"

#include "Layout.hpp"
#include "../core/Category.hpp"

namespace yahtzee::ui
{
    using namespace yahtzee::core;

    auto ScreenFor(Phase const phase) -> Screen
    {
        switch (phase)
        {
        case Phase::Rolling: return Screen::Rolling;
        case Phase::ChoosingCategory:
        case Phase::Scored: return Screen::Scorecard;
        case Phase::GameOver: return Screen::GameOver;
        }
        return Screen::Rolling;
    }

    auto PlayerCountFromKey(unsigned char const key) -> std::optional<uint32_t>
    {
        if (key >= '1' && key <= '0' + constants::MaxPlayers)
            return static_cast<uint32_t>(key - '0');
        return std::nullopt;
    }

    auto ActionFromKey(Screen const screen, unsigned char const key) -> std::optional<PlayerAction>
    {
        switch (screen)
        {
        case Screen::Rolling:
            if (key == 'r' || key == 'R') return RollAction{};
            if (key == 'e' || key == 'E') return EndTurnAction{};
            return std::nullopt;

        case Screen::Scorecard:
            if (key == '0') return ZeroModeAction{};
            if (auto const c = CategoryFromKey(static_cast<char>(key)))
                return ChooseCategoryAction{*c};
            return std::nullopt;

        case Screen::PromptPlayers:
        case Screen::GameOver:
            return std::nullopt;
        }
        return std::nullopt;
    }

    auto ActionFromClick(Screen const screen, int const x, int const y) -> std::optional<PlayerAction>
    {
        if (screen != Screen::Rolling) return std::nullopt;
        if (auto const die = layout::HitDie(x, y))
            return ToggleKeepAction{*die};
        return std::nullopt;
    }

    auto IsPlayAgainClick(Screen const screen, int const x, int const y) -> bool
    {
        return screen == Screen::GameOver && layout::PlayAgainButton.Contains(x, y);
    }
}
