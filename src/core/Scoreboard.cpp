//
// Created by Malik T on 03/11/2025.
//

#include "Scoreboard.hpp"

#include <algorithm>
#include <format>
#include "Exception.hpp"

namespace yahtzee::core
{
    auto Scoreboard::Record(Category const c, ScoreT const score) -> void
    {
        auto& entry = entries_[Index(c)];
        if (entry.has_value())
            YTZ_THROW(error::Code::State, std::format("Category {} already scored ({})", CategoryName(c), *entry));
        entry = score;
    }

    auto Scoreboard::Clear() -> void
    {
        std::ranges::fill(entries_, std::nullopt);
    }

    auto Scoreboard::Filled() const -> size_t
    {
        return static_cast<size_t>(std::ranges::count_if(entries_,
            [](std::optional<ScoreT> const& e) { return e.has_value(); }));
    }
}
