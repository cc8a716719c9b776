//
// Created by Malik T on 03/11/2025.
//

#ifndef YAHTZEE_SCOREBOARD_HPP
#define YAHTZEE_SCOREBOARD_HPP

#include <array>
#include <optional>
#include "Types.hpp"
#include "Category.hpp"

namespace yahtzee::core
{
    // One player's scorecard. An entry is written at most once per game.
    class Scoreboard
    {
    public:
        Scoreboard() = default;

        [[nodiscard]]
        auto Get(Category const c) const -> std::optional<ScoreT> { return entries_[Index(c)]; }

        [[nodiscard]]
        auto IsUsed(Category const c) const -> bool { return entries_[Index(c)].has_value(); }

        // Throws StateError if the category already holds a score.
        auto Record(Category c, ScoreT score) -> void;

        auto Clear() -> void;

        [[nodiscard]]
        auto Filled() const -> size_t;

        [[nodiscard]]
        auto IsComplete() const -> bool { return Filled() == constants::NumCategories; }

    private:
        std::array<std::optional<ScoreT>, constants::NumCategories> entries_{};
    };
}

#endif //YAHTZEE_SCOREBOARD_HPP
