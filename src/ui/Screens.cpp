//
// Created by Malik T on 10/11/2025.
//

#include "Screens.hpp"

#include <format>
#include "Layout.hpp"
#include "../core/Category.hpp"
#include "../core/Scoring.hpp"

namespace yahtzee::ui
{
    using namespace yahtzee::core;

    namespace
    {
        auto PanelWithBorder(Renderer& r, layout::Rect const box) -> void
        {
            r.FillRect(box, colors::White);
            r.StrokeRect(box, colors::Black, 2.f);
        }

        auto SeatLabel(PlyrIdxT const seat, bool const computer) -> std::string
        {
            return std::format("Player {}{}", static_cast<int>(seat) + 1, computer ? " (CPU)" : "");
        }
    }

    auto DrawPromptScreen(Renderer& r, std::optional<uint32_t> const chosen) -> void
    {
        r.Clear(colors::Brown);
        PanelWithBorder(r, layout::PromptBox);

        std::string const text = chosen
            ? std::format("You selected {} player{}. Press Enter to start.", *chosen, *chosen > 1 ? "s" : "")
            : std::string{"Select Number of Players: Press [1]-[9]"};

        layout::Point const c = layout::PromptBox.Center();
        r.TextCentered(text, static_cast<int>(c.x), static_cast<int>(c.y), colors::Red, Font::Large);
    }

    auto DrawRollingScreen(Renderer& r, GameSnapshot const& s, CupAnimation const& anim,
                           bool const computer_seat) -> void
    {
        r.Clear(colors::Green);
        PanelWithBorder(r, layout::StatusBox);

        int const tx = layout::StatusBox.x + 20;
        int const ty = layout::StatusBox.y + 20;
        if (anim.Active())
        {
            r.Text("Rolling Dice...", tx, ty, colors::Black);
        }
        else
        {
            r.Text(std::format("{} - Round {} of {}", SeatLabel(s.current_player, computer_seat),
                               static_cast<int>(s.round), static_cast<int>(constants::MaxRounds)),
                   tx, ty, colors::Red);
            r.Text(std::format("Rolls Left: {}", static_cast<int>(s.rolls_left)), tx, ty + 30, colors::Black);
            r.Text("Press R to roll, E to end turn.", tx, ty + 60, colors::Black);
            r.Text("Click a die to keep/unkeep it.", tx, ty + 90, colors::Black);
        }

        for (size_t i{}; i < constants::NumDice; ++i)
        {
            if (anim.DieHidden(i)) continue;
            r.Die(s.dice[i].value, anim.DieCenter(i),
                  static_cast<float>(layout::DieSize) * anim.DieScale(i), s.dice[i].kept);
        }

        r.Cup(layout::CupRect, anim.CupFrame());
    }

    auto ScorecardCellText(GameSnapshot const& s, Category const c) -> std::string
    {
        Scoreboard const& board = s.scoreboards.at(s.current_player);
        if (auto const used = board.Get(c))
            return std::format("USED (Score: {})", *used);

        ScoreT const possible = s.possible[Index(c)];
        if (RequiresEligibility(c) && possible == 0)
            return "Not eligible";
        return std::format("Possible Score = {}", possible);
    }

    auto DrawScorecardScreen(Renderer& r, GameSnapshot const& s, bool const computer_seat) -> void
    {
        r.Clear(colors::Brown);

        std::string const header = std::format("{} Scorecard - Round {} of {}",
                                               SeatLabel(s.current_player, computer_seat),
                                               static_cast<int>(s.round), static_cast<int>(constants::MaxRounds));
        r.TextCentered(header, layout::WindowWidth / 2, 30, colors::Red, Font::Large);
        r.DashedLine(50, layout::WindowWidth - 50, 30 + r.LineHeight(Font::Large) / 2 + 5, colors::Black);

        r.TextCentered(s.zero_mode ? "ZERO MODE ACTIVE: Choose category to assign 0"
                                   : "Press [0] to take a 0 on a category",
                       layout::WindowWidth / 2, 70, colors::Red);

        int y = layout::ScorecardFirstRowY;
        for (Category const c : AllCategories)
        {
            r.Text(std::format("Press [{}] for {}", CategoryKey(c), CategoryName(c)),
                   layout::ScorecardPromptX, y, colors::Black);
            r.Text(ScorecardCellText(s, c), layout::ScorecardScoreX, y, colors::Black);
            y += layout::ScorecardRowHeight;
        }

        constexpr int n = static_cast<int>(constants::NumDice);
        constexpr int total_w = n * layout::ScorecardDieSize + (n - 1) * layout::ScorecardDieGap;
        constexpr int start_x = (layout::WindowWidth - total_w) / 2;
        constexpr float half = layout::ScorecardDieSize / 2.f;
        constexpr float cy = layout::WindowHeight - layout::ScorecardDieSize - 20 + half;
        for (int i = 0; i < n; ++i)
        {
            float const cx = static_cast<float>(start_x + i * (layout::ScorecardDieSize + layout::ScorecardDieGap)) + half;
            r.Die(s.dice[static_cast<size_t>(i)].value, {cx, cy}, static_cast<float>(layout::ScorecardDieSize), false);
        }
    }

    auto DrawGameOverScreen(Renderer& r, std::vector<Scoreboard> const& boards) -> void
    {
        r.Clear(colors::Brown);
        PanelWithBorder(r, layout::ResultsBox);

        int const cx = layout::ResultsBox.x + layout::ResultsBox.w / 2;
        r.TextCentered("Game Over!", cx, layout::ResultsBox.y + 30, colors::Red, Font::Large);

        // Up to 9 rows; shrink the spacing so they stay inside the box.
        int const rows = static_cast<int>(boards.size());
        int const step = rows > 6 ? 22 : 30;
        int y = layout::ResultsBox.y + 60;
        r.Text(std::format("{:<8}{:>8}{:>8}{:>8}{:>8}", "Player", "Upper", "Bonus", "Lower", "Total"),
               layout::ResultsBox.x + 20, y, colors::Black);
        y += step;

        for (size_t i{}; i < boards.size(); ++i)
        {
            scoring::FinalScore const fs = scoring::CalculateFinalScore(boards[i]);
            r.Text(std::format("{:<8}{:>8}{:>8}{:>8}{:>8}", std::format("P{}", i + 1),
                               fs.upper, fs.bonus, fs.lower, fs.total),
                   layout::ResultsBox.x + 20, y, colors::Black);
            y += step;
        }

        PanelWithBorder(r, layout::PlayAgainButton);
        layout::Point const b = layout::PlayAgainButton.Center();
        r.TextCentered("Play Again", static_cast<int>(b.x), static_cast<int>(b.y), colors::Red, Font::Large);
    }
}
