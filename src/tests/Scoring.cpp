//
// Created by Malik T on 06/11/2025.
//
#include <gtest/gtest.h>
#include <array>

#include "../core/Category.hpp"
#include "../core/Exception.hpp"
#include "../core/Scoreboard.hpp"
#include "../core/Scoring.hpp"

using namespace yahtzee::core;
using namespace yahtzee::core::scoring;

namespace
{
    auto Score(Category const c, FacesT const& f) -> ScoreT
    {
        return ScoreFor(c, f);
    }

    // Upper section from the given entries, Chance as the only lower entry.
    auto BoardWith(std::array<ScoreT, 6> const& upper, ScoreT const chance) -> Scoreboard
    {
        Scoreboard b;
        for (size_t i{}; i < upper.size(); ++i)
        {
            b.Record(static_cast<Category>(i), upper[i]);
        }
        b.Record(Category::Chance, chance);
        return b;
    }
}

TEST(Scoring, UpperSection_CountTimesFace)
{
    FacesT const f{1, 1, 3, 4, 1};
    EXPECT_EQ(Score(Category::Ones, f), 3);
    EXPECT_EQ(Score(Category::Twos, f), 0);
    EXPECT_EQ(Score(Category::Threes, f), 3);
    EXPECT_EQ(Score(Category::Fours, f), 4);
    EXPECT_EQ(Score(Category::Fives, f), 0);
    EXPECT_EQ(Score(Category::Sixes, f), 0);

    FacesT const g{6, 6, 6, 6, 2};
    EXPECT_EQ(Score(Category::Sixes, g), 24);
    EXPECT_EQ(Score(Category::Twos, g), 2);
}

TEST(Scoring, UpperSection_AllFacesAllValues)
{
    for (FaceT face = 1; face <= 6; ++face)
    {
        for (int count = 0; count <= 5; ++count)
        {
            FacesT f{};
            FaceT const other = face == 1 ? 2 : 1;
            for (int i = 0; i < 5; ++i) f[static_cast<size_t>(i)] = i < count ? face : other;

            Category const c = static_cast<Category>(face - 1);
            EXPECT_EQ(Score(c, f), count * face) << "face " << int(face) << " count " << count;
        }
    }
}

TEST(Scoring, Kinds_SumAllDice)
{
    FacesT const three{3, 3, 3, 4, 5};
    EXPECT_EQ(Score(Category::ThreeOfAKind, three), 18);
    EXPECT_EQ(Score(Category::FourOfAKind, three), 0);

    FacesT const four{2, 2, 2, 2, 6};
    EXPECT_EQ(Score(Category::ThreeOfAKind, four), 14);
    EXPECT_EQ(Score(Category::FourOfAKind, four), 14);

    FacesT const none{1, 2, 3, 5, 5};
    EXPECT_EQ(Score(Category::ThreeOfAKind, none), 0);
}

TEST(Scoring, FullHouse_OnlyPairPlusTriple)
{
    EXPECT_EQ(Score(Category::FullHouse, FacesT{2, 2, 3, 3, 3}), 25);
    EXPECT_EQ(Score(Category::FullHouse, FacesT{6, 1, 6, 1, 1}), 25);

    EXPECT_EQ(Score(Category::FullHouse, FacesT{2, 2, 2, 2, 3}), 0);
    EXPECT_EQ(Score(Category::FullHouse, FacesT{2, 2, 3, 3, 4}), 0);
    EXPECT_EQ(Score(Category::FullHouse, FacesT{1, 2, 3, 4, 5}), 0);
}

TEST(Scoring, Yahtzee_IsNotAFullHouse)
{
    FacesT const f{5, 5, 5, 5, 5};
    EXPECT_EQ(Score(Category::Yahtzee, f), 50);
    EXPECT_EQ(Score(Category::FullHouse, f), 0);
    EXPECT_EQ(Score(Category::ThreeOfAKind, f), 25);
    EXPECT_EQ(Score(Category::FourOfAKind, f), 25);
    EXPECT_EQ(Score(Category::Chance, f), 25);
}

TEST(Scoring, Straights_SmallOnly)
{
    for (FacesT const f : {FacesT{1, 2, 3, 4, 6}, FacesT{2, 3, 4, 5, 5}, FacesT{6, 4, 3, 5, 1}})
    {
        EXPECT_EQ(Score(Category::SmallStraight, f), 30);
        EXPECT_EQ(Score(Category::LargeStraight, f), 0);
    }
}

TEST(Scoring, Straights_LargeAlsoCountsAsSmall)
{
    for (FacesT const f : {FacesT{1, 2, 3, 4, 5}, FacesT{6, 5, 4, 3, 2}})
    {
        EXPECT_EQ(Score(Category::LargeStraight, f), 40);
        EXPECT_EQ(Score(Category::SmallStraight, f), 30);
    }
}

// Large straight never scores without small straight also scoring, over every roll.
TEST(Scoring, Straights_ExhaustiveConsistency)
{
    for (int code = 0; code < 6 * 6 * 6 * 6 * 6; ++code)
    {
        FacesT f{};
        int c = code;
        for (FaceT& v : f)
        {
            v = static_cast<FaceT>(c % 6 + 1);
            c /= 6;
        }
        ScoreTableT const t = PossibleScores(f);
        if (t[Index(Category::LargeStraight)] != 0)
        {
            ASSERT_EQ(t[Index(Category::SmallStraight)], 30);
        }
    }
}

TEST(Scoring, NoStraight_BothZero)
{
    FacesT const f{1, 2, 3, 5, 6};
    EXPECT_EQ(Score(Category::SmallStraight, f), 0);
    EXPECT_EQ(Score(Category::LargeStraight, f), 0);
}

TEST(Scoring, PossibleScores_MatchesScoreFor)
{
    FacesT const f{3, 3, 4, 4, 4};
    ScoreTableT const t = PossibleScores(f);
    for (Category const c : AllCategories)
    {
        EXPECT_EQ(t[Index(c)], ScoreFor(c, f)) << CategoryName(c);
    }
    EXPECT_EQ(t[Index(Category::Chance)], 18);
}

TEST(Scoring, InvalidFace_Throws)
{
    EXPECT_THROW((void)PossibleScores(FacesT{0, 1, 2, 3, 4}), error::InvalidDiceError);
    EXPECT_THROW((void)ScoreFor(Category::Chance, FacesT{1, 2, 3, 4, 7}), error::InvalidDiceError);
}

TEST(FinalScore, EmptyBoard_AllZero)
{
    Scoreboard const b;
    EXPECT_EQ(CalculateFinalScore(b), (FinalScore{0, 0, 0, 0}));
}

TEST(FinalScore, Bonus_At63)
{
    // 3 of each face: 3+6+9+12+15+18 = 63
    Scoreboard const b = BoardWith({3, 6, 9, 12, 15, 18}, 20);
    FinalScore const fs = CalculateFinalScore(b);
    EXPECT_EQ(fs.upper, 63);
    EXPECT_EQ(fs.bonus, 35);
    EXPECT_EQ(fs.lower, 20);
    EXPECT_EQ(fs.total, 118);
}

TEST(FinalScore, NoBonus_At62)
{
    Scoreboard const b = BoardWith({2, 6, 9, 12, 15, 18}, 20);
    FinalScore const fs = CalculateFinalScore(b);
    EXPECT_EQ(fs.upper, 62);
    EXPECT_EQ(fs.bonus, 0);
    EXPECT_EQ(fs.total, 82);
}

TEST(Scoreboard, RecordTwice_Throws)
{
    Scoreboard b;
    b.Record(Category::Chance, 17);
    EXPECT_TRUE(b.IsUsed(Category::Chance));
    EXPECT_EQ(b.Get(Category::Chance), 17);
    EXPECT_THROW(b.Record(Category::Chance, 20), error::StateError);
    EXPECT_EQ(b.Get(Category::Chance), 17);
}

TEST(Scoreboard, ZeroIsStillUsed)
{
    Scoreboard b;
    b.Record(Category::Yahtzee, 0);
    EXPECT_TRUE(b.IsUsed(Category::Yahtzee));
    EXPECT_EQ(b.Filled(), 1u);
    b.Clear();
    EXPECT_EQ(b.Filled(), 0u);
    EXPECT_FALSE(b.IsUsed(Category::Yahtzee));
}

TEST(Category, KeysRoundTrip)
{
    EXPECT_EQ(CategoryFromKey('1'), Category::Ones);
    EXPECT_EQ(CategoryFromKey('6'), Category::Sixes);
    EXPECT_EQ(CategoryFromKey('a'), Category::ThreeOfAKind);
    EXPECT_EQ(CategoryFromKey('G'), Category::Chance);
    EXPECT_EQ(CategoryFromKey('7'), std::nullopt);
    EXPECT_EQ(CategoryFromKey('H'), std::nullopt);
    for (Category const c : AllCategories)
    {
        EXPECT_EQ(CategoryFromKey(CategoryKey(c)), c);
    }
}
