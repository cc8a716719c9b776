//
// Created by Malik T on 10/11/2025.
//
#include <gtest/gtest.h>
#include <stdexcept>
#include <variant>
#include <vector>

#include "../core/Scoring.hpp"
#include "../core/Exception.hpp"
#include "../ui/CupAnimation.hpp"
#include "../ui/Guarded.hpp"
#include "../ui/Input.hpp"
#include "../ui/Layout.hpp"
#include "../ui/Screens.hpp"

using namespace yahtzee::core;
using namespace yahtzee::ui;

namespace
{
    auto SnapshotWith(FacesT const& faces) -> GameSnapshot
    {
        GameSnapshot s{};
        s.n_players = 1;
        s.phase = Phase::ChoosingCategory;
        for (size_t i{}; i < constants::NumDice; ++i) s.dice[i].value = faces[i];
        s.possible = scoring::PossibleScores(faces);
        s.scoreboards.resize(1);
        return s;
    }

    auto RunUntil(CupAnimation& a, CupAnimation::Event const want, int limit = 1000) -> int
    {
        for (int n = 1; n <= limit; ++n)
        {
            if (a.Tick() == want) return n;
        }
        return -1;
    }
}

TEST(Input, RollingKeys)
{
    EXPECT_TRUE(std::holds_alternative<RollAction>(*ActionFromKey(Screen::Rolling, 'r')));
    EXPECT_TRUE(std::holds_alternative<RollAction>(*ActionFromKey(Screen::Rolling, 'R')));
    EXPECT_TRUE(std::holds_alternative<EndTurnAction>(*ActionFromKey(Screen::Rolling, 'e')));
    EXPECT_FALSE(ActionFromKey(Screen::Rolling, '1').has_value());
    EXPECT_FALSE(ActionFromKey(Screen::Rolling, '0').has_value());
}

TEST(Input, ScorecardKeys)
{
    EXPECT_TRUE(std::holds_alternative<ZeroModeAction>(*ActionFromKey(Screen::Scorecard, '0')));

    auto const ones = ActionFromKey(Screen::Scorecard, '1');
    ASSERT_TRUE(ones.has_value());
    EXPECT_EQ(std::get<ChooseCategoryAction>(*ones).category, Category::Ones);

    auto const chance = ActionFromKey(Screen::Scorecard, 'g');
    ASSERT_TRUE(chance.has_value());
    EXPECT_EQ(std::get<ChooseCategoryAction>(*chance).category, Category::Chance);

    EXPECT_FALSE(ActionFromKey(Screen::Scorecard, 'r').has_value());
    EXPECT_FALSE(ActionFromKey(Screen::GameOver, '1').has_value());
    EXPECT_FALSE(ActionFromKey(Screen::PromptPlayers, 'r').has_value());
}

TEST(Input, PlayerCountKeys)
{
    EXPECT_EQ(PlayerCountFromKey('1'), 1u);
    EXPECT_EQ(PlayerCountFromKey('9'), 9u);
    EXPECT_FALSE(PlayerCountFromKey('0').has_value());
    EXPECT_FALSE(PlayerCountFromKey('a').has_value());
}

TEST(Input, ClickOnDie_TogglesIt)
{
    layout::Rect const third = layout::DieRect(2);
    auto const a = ActionFromClick(Screen::Rolling, third.x + 5, third.y + 5);
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(std::get<ToggleKeepAction>(*a).die, 2);

    EXPECT_FALSE(ActionFromClick(Screen::Rolling, 5, 5).has_value());
    EXPECT_FALSE(ActionFromClick(Screen::Scorecard, third.x + 5, third.y + 5).has_value());
}

TEST(Input, PlayAgainOnlyOnGameOver)
{
    layout::Point const c = layout::PlayAgainButton.Center();
    int const x = static_cast<int>(c.x);
    int const y = static_cast<int>(c.y);
    EXPECT_TRUE(IsPlayAgainClick(Screen::GameOver, x, y));
    EXPECT_FALSE(IsPlayAgainClick(Screen::Rolling, x, y));
    EXPECT_FALSE(IsPlayAgainClick(Screen::GameOver, 0, 0));
}

TEST(Input, ScreenForPhase)
{
    EXPECT_EQ(ScreenFor(Phase::Rolling), Screen::Rolling);
    EXPECT_EQ(ScreenFor(Phase::ChoosingCategory), Screen::Scorecard);
    EXPECT_EQ(ScreenFor(Phase::GameOver), Screen::GameOver);
}

TEST(CupAnimation, StagesAndEvents)
{
    CupAnimation a;
    EXPECT_FALSE(a.Active());
    EXPECT_EQ(a.Tick(), CupAnimation::Event::None);

    DiceT dice{};
    dice[1].kept = true;
    a.Start(dice);
    EXPECT_TRUE(a.Active());
    EXPECT_EQ(a.CurrentStage(), CupAnimation::Stage::MoveIn);

    EXPECT_EQ(RunUntil(a, CupAnimation::Event::RollNow),
              CupAnimation::MoveInFrames + CupAnimation::ShakeFrames);
    EXPECT_EQ(a.CurrentStage(), CupAnimation::Stage::MoveOut);

    EXPECT_EQ(RunUntil(a, CupAnimation::Event::Finished), CupAnimation::MoveOutFrames);
    EXPECT_FALSE(a.Active());
}

TEST(CupAnimation, KeptDiceStayPut)
{
    CupAnimation a;
    DiceT dice{};
    dice[0].kept = true;
    a.Start(dice);

    for (int i = 0; i < CupAnimation::MoveInFrames; ++i) a.Tick();
    ASSERT_EQ(a.CurrentStage(), CupAnimation::Stage::Shake);

    EXPECT_FALSE(a.DieHidden(0));
    EXPECT_FLOAT_EQ(a.DieScale(0), 1.f);
    EXPECT_FLOAT_EQ(a.DieCenter(0).x, layout::DieRect(0).Center().x);

    EXPECT_TRUE(a.DieHidden(1));
    EXPECT_FLOAT_EQ(a.DieScale(1), 0.5f);
    EXPECT_FLOAT_EQ(a.DieCenter(1).x, layout::CupMouth.x);

    a.Tick();
    EXPECT_EQ(a.CupFrame(), 1);
}

TEST(Screens, ScorecardCellText)
{
    GameSnapshot s = SnapshotWith(FacesT{1, 2, 3, 5, 6});
    s.scoreboards[0].Record(Category::Chance, 22);

    EXPECT_EQ(ScorecardCellText(s, Category::Chance), "USED (Score: 22)");
    EXPECT_EQ(ScorecardCellText(s, Category::Yahtzee), "Not eligible");
    EXPECT_EQ(ScorecardCellText(s, Category::Fives), "Possible Score = 5");
    EXPECT_EQ(ScorecardCellText(s, Category::Fours), "Possible Score = 0");
}

TEST(Guarded, CallbackErrorsEndTheLoop)
{
    int failures{};
    auto const on_fail = [&] { ++failures; };

    EXPECT_TRUE(Guarded([] {}, on_fail));
    EXPECT_EQ(failures, 0);

    EXPECT_FALSE(Guarded([] { YTZ_THROW(error::Code::State, "engine misuse"); }, on_fail));
    EXPECT_EQ(failures, 1);

    EXPECT_FALSE(Guarded([] { (void)std::vector<int>{}.at(3); }, on_fail));
    EXPECT_EQ(failures, 2);

    EXPECT_FALSE(Guarded([] { throw std::runtime_error("boom"); }, on_fail));
    EXPECT_EQ(failures, 3);
}
