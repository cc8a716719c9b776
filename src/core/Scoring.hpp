//
// Created by Malik T on 03/11/2025.
//

#ifndef YAHTZEE_SCORING_HPP
#define YAHTZEE_SCORING_HPP

#include <span>
#include "Types.hpp"
#include "Scoreboard.hpp"

namespace yahtzee::core::scoring
{
    // Score every category would earn with these dice. Throws InvalidDiceError
    // if any face is outside [1,6].
    auto PossibleScores(FacesT const& faces) -> ScoreTableT;

    auto ScoreFor(Category c, FacesT const& faces) -> ScoreT;

    struct FinalScore
    {
        ScoreT upper{};
        ScoreT bonus{};
        ScoreT lower{};
        ScoreT total{};

        auto operator==(FinalScore const&) const -> bool = default;
    };

    // Unscored entries count as 0.
    auto CalculateFinalScore(Scoreboard const& board) -> FinalScore;
}

#endif //YAHTZEE_SCORING_HPP
