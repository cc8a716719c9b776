//
// Created by Malik T on 08/11/2025.
//

#ifndef YAHTZEE_LAYOUT_HPP
#define YAHTZEE_LAYOUT_HPP

#include <array>
#include <optional>
#include "../core/Types.hpp"

// Window-space geometry shared by drawing and hit testing. Origin is the
// top-left corner, y grows downwards.
namespace yahtzee::ui::layout
{
    inline constexpr int WindowWidth = 1000;
    inline constexpr int WindowHeight = 700;
    inline constexpr int Fps = 30;
    inline constexpr unsigned FrameMs = 1000u / Fps;

    struct Point
    {
        float x{};
        float y{};
    };

    struct Rect
    {
        int x{};
        int y{};
        int w{};
        int h{};

        [[nodiscard]]
        constexpr auto Contains(int const px, int const py) const -> bool
        {
            return px >= x && px < x + w && py >= y && py < y + h;
        }

        [[nodiscard]]
        constexpr auto Center() const -> Point
        {
            return {static_cast<float>(x) + static_cast<float>(w) / 2.f,
                    static_cast<float>(y) + static_cast<float>(h) / 2.f};
        }
    };

    inline constexpr int DieSize = 64;
    inline constexpr int DieOutline = 3;

    // top-left corners of the five dice on the rolling screen
    inline constexpr std::array<Point, core::constants::NumDice> DicePositions{{
        {100.f, 250.f}, {250.f, 250.f}, {400.f, 250.f}, {550.f, 250.f}, {700.f, 250.f}
    }};

    inline constexpr auto DieRect(size_t const i) -> Rect
    {
        return {static_cast<int>(DicePositions[i].x), static_cast<int>(DicePositions[i].y), DieSize, DieSize};
    }

    inline constexpr int CupFrameCount = 4;
    inline constexpr int CupFrameWidth = 50;
    inline constexpr int CupFrameHeight = 60;
    inline constexpr float CupScale = 2.5f;
    inline constexpr int CupWidth = static_cast<int>(CupFrameWidth * CupScale);
    inline constexpr int CupHeight = static_cast<int>(CupFrameHeight * CupScale);
    inline constexpr Rect CupRect{WindowWidth / 2 - CupWidth / 2, 400, CupWidth, CupHeight};

    // Dice gather here (centre) while the cup shakes.
    inline constexpr Point CupMouth{CupRect.x + CupWidth / 2.f, CupRect.y + CupHeight / 4.f};

    inline constexpr Rect StatusBox{(WindowWidth - 600) / 2, 20, 600, 150};
    inline constexpr Rect PromptBox{(WindowWidth - 700) / 2, (WindowHeight - 150) / 2, 700, 150};
    inline constexpr Rect ResultsBox{(WindowWidth - 600) / 2, 50, 600, 300};
    inline constexpr Rect PlayAgainButton{(WindowWidth - 200) / 2, ResultsBox.y + ResultsBox.h + 20, 200, 50};

    // Scorecard rows
    inline constexpr int ScorecardPromptX = 50;
    inline constexpr int ScorecardScoreX = 600;
    inline constexpr int ScorecardFirstRowY = 100;
    inline constexpr int ScorecardRowHeight = 36;
    inline constexpr int ScorecardDieSize = DieSize / 2;
    inline constexpr int ScorecardDieGap = 20;

    // Index of the die under (x, y) on the rolling screen.
    inline constexpr auto HitDie(int const x, int const y) -> std::optional<uint8_t>
    {
        for (size_t i{}; i < core::constants::NumDice; ++i)
        {
            if (DieRect(i).Contains(x, y)) return static_cast<uint8_t>(i);
        }
        return std::nullopt;
    }
}

#endif //YAHTZEE_LAYOUT_HPP
