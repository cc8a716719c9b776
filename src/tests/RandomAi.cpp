//
// Created by Malik T on 06/11/2025.
//
#include <gtest/gtest.h>
#include <memory>
#include <variant>

#include "../core/Category.hpp"
#include "../core/ClassicRules.hpp"
#include "../core/Game.hpp"
#include "../core/RandomAi.hpp"
#include "../core/Scoring.hpp"

using namespace yahtzee::core;

namespace
{
    auto MakeCpuGame(uint64_t const seed) -> GameImpl
    {
        std::vector<std::unique_ptr<Player>> ps;
        ps.emplace_back(std::make_unique<RandomAI>(seed));
        return GameImpl(Config{.n_players = 1, .seed = seed}, std::make_unique<ClassicRules>(), std::move(ps));
    }
}

TEST(RandomAI, ProposalsAlwaysValid)
{
    for (uint64_t seed : {1ull, 2ull, 3ull, 99ull})
    {
        auto g = MakeCpuGame(seed);
        while (!g.IsOver())
        {
            PlayerAction const a = g.Propose();
            ASSERT_TRUE(g.Check(a).has_value()) << "seed " << seed;
            ASSERT_NE(g.Submit(a), MoveOutcome::Invalid);
        }
    }
}

TEST(RandomAI, NothingEligible_AsksForZeroMode)
{
    RandomAI ai{7};

    auto s = std::make_shared<GameSnapshot>();
    s->n_players = 1;
    s->phase = Phase::ChoosingCategory;
    s->possible = {};
    s->scoreboards.resize(1);
    for (Category const c : AllCategories)
    {
        if (c != Category::Yahtzee) s->scoreboards[0].Record(c, 1);
    }

    PlayerAction const first = ai.Play(s);
    EXPECT_TRUE(std::holds_alternative<ZeroModeAction>(first));

    s->zero_mode = true;
    PlayerAction const second = ai.Play(s);
    ASSERT_TRUE(std::holds_alternative<ChooseCategoryAction>(second));
    EXPECT_EQ(std::get<ChooseCategoryAction>(second).category, Category::Yahtzee);
}

TEST(RandomAI, PicksOnlyOpenEligibleCategories)
{
    RandomAI ai{11};

    auto s = std::make_shared<GameSnapshot>();
    s->n_players = 1;
    s->phase = Phase::ChoosingCategory;
    s->possible = scoring::PossibleScores(FacesT{1, 2, 3, 4, 6});
    s->scoreboards.resize(1);
    s->scoreboards[0].Record(Category::Chance, 16);

    for (int i = 0; i < 200; ++i)
    {
        PlayerAction const a = ai.Play(s);
        ASSERT_TRUE(std::holds_alternative<ChooseCategoryAction>(a));
        Category const c = std::get<ChooseCategoryAction>(a).category;
        EXPECT_NE(c, Category::Chance);
        if (IsLower(c)) EXPECT_GT(s->possible[Index(c)], 0) << CategoryName(c);
    }
}

TEST(RandomAI, OutOfRolls_EndsTurn)
{
    RandomAI ai{5};
    auto s = std::make_shared<GameSnapshot>();
    s->n_players = 1;
    s->phase = Phase::Rolling;
    s->rolls_left = 0;
    s->scoreboards.resize(1);
    EXPECT_TRUE(std::holds_alternative<EndTurnAction>(ai.Play(s)));
}
