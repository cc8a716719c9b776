//
// Created by Malik T on 03/11/2025.
//

#ifndef YAHTZEE_CATEGORY_HPP
#define YAHTZEE_CATEGORY_HPP

#include <optional>
#include <string_view>
#include <utility>
#include "Types.hpp"

namespace yahtzee::core
{
    inline constexpr auto Index(Category const c) -> size_t
    {
        return static_cast<size_t>(std::to_underlying(c));
    }

    inline constexpr auto IsUpper(Category const c) -> bool
    {
        return c <= Category::Sixes;
    }

    inline constexpr auto IsLower(Category const c) -> bool
    {
        return !IsUpper(c);
    }

    // Face scored by an upper-section category (Ones -> 1 ... Sixes -> 6).
    inline constexpr auto FaceOf(Category const c) -> FaceT
    {
        return static_cast<FaceT>(Index(c) + 1);
    }

    // Combination categories worth 0 for the current dice may only be taken in zero mode.
    inline constexpr auto RequiresEligibility(Category const c) -> bool
    {
        return IsLower(c) && c != Category::Chance;
    }

    inline constexpr auto CategoryName(Category const c) -> std::string_view
    {
        switch (c)
        {
        case Category::Ones:          return "Ones";
        case Category::Twos:          return "Twos";
        case Category::Threes:        return "Threes";
        case Category::Fours:         return "Fours";
        case Category::Fives:         return "Fives";
        case Category::Sixes:         return "Sixes";
        case Category::ThreeOfAKind:  return "3 of a Kind";
        case Category::FourOfAKind:   return "4 of a Kind";
        case Category::FullHouse:     return "Full House";
        case Category::SmallStraight: return "Small Straight";
        case Category::LargeStraight: return "Large Straight";
        case Category::Yahtzee:       return "Yahtzee";
        case Category::Chance:        return "Chance";
        }
        return "?";
    }

    // Scorecard key: digits for the upper section, A-G for the lower one.
    inline constexpr auto CategoryKey(Category const c) -> char
    {
        return IsUpper(c) ? static_cast<char>('1' + Index(c))
                          : static_cast<char>('A' + (Index(c) - Index(Category::ThreeOfAKind)));
    }

    inline constexpr auto CategoryFromKey(char key) -> std::optional<Category>
    {
        if (key >= 'a' && key <= 'z') key = static_cast<char>(key - 'a' + 'A');
        for (Category const c : AllCategories)
        {
            if (CategoryKey(c) == key) return c;
        }
        return std::nullopt;
    }
}

#endif //YAHTZEE_CATEGORY_HPP
