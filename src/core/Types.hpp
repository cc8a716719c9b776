//
// Created by Malik T on 02/11/2025.
//

#ifndef YAHTZEE_TYPES_HPP
#define YAHTZEE_TYPES_HPP

#define YTZ_ALLOW_EXCEPTIONS true
#define YTZ_ENABLE_TEST_HOOKS true

#include <cstdint>
#include <cstddef>
#include <memory>
#include <optional>
#include <vector>
#include <array>
#include <random>
#include <variant>

namespace yahtzee::core::constants
{
    inline constexpr size_t NumDice = 5;
    inline constexpr size_t NumFaces = 6;
    inline constexpr size_t NumCategories = 13;
    inline constexpr uint8_t MaxRounds = 13;
    // re-rolls after the mandatory first roll of a turn
    inline constexpr uint8_t MaxRollsPerTurn = 2;
    inline constexpr uint32_t MinPlayers = 1;
    inline constexpr uint32_t MaxPlayers = 9;

    inline constexpr uint16_t UpperBonusThreshold = 63;
    inline constexpr uint16_t UpperBonus = 35;
    inline constexpr uint16_t FullHouseScore = 25;
    inline constexpr uint16_t SmallStraightScore = 30;
    inline constexpr uint16_t LargeStraightScore = 40;
    inline constexpr uint16_t YahtzeeScore = 50;
}
namespace yahtzee::core
{
    enum class Category : uint8_t
    {
        Ones = 0,
        Twos,
        Threes,
        Fours,
        Fives,
        Sixes,
        ThreeOfAKind,
        FourOfAKind,
        FullHouse,
        SmallStraight,
        LargeStraight,
        Yahtzee,
        Chance
    };

    inline constexpr std::array<Category, constants::NumCategories> AllCategories{
        Category::Ones, Category::Twos, Category::Threes,
        Category::Fours, Category::Fives, Category::Sixes,
        Category::ThreeOfAKind, Category::FourOfAKind, Category::FullHouse,
        Category::SmallStraight, Category::LargeStraight, Category::Yahtzee,
        Category::Chance
    };

    using FaceT = uint8_t;
    using ScoreT = uint16_t;
    using PlyrIdxT = uint8_t;

    struct Die
    {
        FaceT value{1};
        bool  kept{false};
    };
    inline auto operator==(Die const& a, Die const& b) -> bool { return a.value == b.value && a.kept == b.kept; }

    using DiceT = std::array<Die, constants::NumDice>;
    using FacesT = std::array<FaceT, constants::NumDice>;
    // indexed by Category
    using ScoreTableT = std::array<ScoreT, constants::NumCategories>;

    struct Config
    {
        uint32_t n_players{1};
        uint64_t seed{std::random_device{}()};
    };
}

#endif //YAHTZEE_TYPES_HPP
