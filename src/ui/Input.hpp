//
// Created by Malik T on 08/11/2025.
//

#ifndef YAHTZEE_INPUT_HPP
#define YAHTZEE_INPUT_HPP

#include <cstdint>
#include <optional>
#include "../core/Actions.hpp"

namespace yahtzee::ui
{
    enum class Screen : uint8_t
    {
        PromptPlayers,
        Rolling,
        Scorecard,
        GameOver
    };

    inline constexpr unsigned char KeyEnter = '\r';
    inline constexpr unsigned char KeyEscape = 27;

    // Screen that presents a given engine phase.
    auto ScreenFor(core::Phase phase) -> Screen;

    // '1'..'9' on the prompt screen.
    auto PlayerCountFromKey(unsigned char key) -> std::optional<uint32_t>;

    // Keyboard → engine action for the current screen; nullopt means the key is ignored.
    // Die keep toggles come from the mouse, see HitDie.
    auto ActionFromKey(Screen screen, unsigned char key) -> std::optional<core::PlayerAction>;

    // Left click → engine action (die keep toggle on the rolling screen).
    auto ActionFromClick(Screen screen, int x, int y) -> std::optional<core::PlayerAction>;

    // Left click on the game-over "Play Again" button.
    auto IsPlayAgainClick(Screen screen, int x, int y) -> bool;
}

#endif //YAHTZEE_INPUT_HPP
