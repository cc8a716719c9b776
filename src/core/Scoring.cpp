//
// Created by Malik T on 03/11/2025.
//

#include "Scoring.hpp"

#include <span>
#include <vector>
#include "Util.hpp"

namespace yahtzee::core::scoring
{
    namespace
    {
        auto SumIfKind(util::FaceCounts const& counts, ScoreT const sum, uint8_t const need) -> ScoreT
        {
            return counts.MaxOfAKind() >= need ? sum : ScoreT{0};
        }

        auto IsFullHouse(util::FaceCounts const& counts) -> bool
        {
            return counts.Partition() == std::vector<uint8_t>{2, 3};
        }

        auto IsSmallStraight(util::FaceCounts const& counts) -> bool
        {
            return counts.ContainsRun(1, 4) || counts.ContainsRun(2, 5) || counts.ContainsRun(3, 6);
        }

        // with five dice a 5-long run means every face is distinct
        auto IsLargeStraight(util::FaceCounts const& counts) -> bool
        {
            return counts.ContainsRun(1, 5) || counts.ContainsRun(2, 6);
        }

        auto Evaluate(Category const c, util::FaceCounts const& counts, ScoreT const sum) -> ScoreT
        {
            using namespace constants;
            switch (c)
            {
            case Category::Ones:
            case Category::Twos:
            case Category::Threes:
            case Category::Fours:
            case Category::Fives:
            case Category::Sixes:
                return static_cast<ScoreT>(counts.Of(FaceOf(c)) * FaceOf(c));
            case Category::ThreeOfAKind:  return SumIfKind(counts, sum, 3);
            case Category::FourOfAKind:   return SumIfKind(counts, sum, 4);
            case Category::FullHouse:     return IsFullHouse(counts) ? FullHouseScore : ScoreT{0};
            case Category::SmallStraight: return IsSmallStraight(counts) ? SmallStraightScore : ScoreT{0};
            case Category::LargeStraight: return IsLargeStraight(counts) ? LargeStraightScore : ScoreT{0};
            case Category::Yahtzee:       return counts.MaxOfAKind() == NumDice ? YahtzeeScore : ScoreT{0};
            case Category::Chance:        return sum;
            }
            YTZ_THROW(error::Code::Rules, "Unhandled category in score evaluation");
        }
    }

    auto PossibleScores(FacesT const& faces) -> ScoreTableT
    {
        util::RequireValidFaces(faces);
        util::FaceCounts const counts{faces};
        ScoreT const sum = util::SumFaces(faces);

        ScoreTableT table{};
        for (Category const c : AllCategories)
        {
            table[Index(c)] = Evaluate(c, counts, sum);
        }
        return table;
    }

    auto ScoreFor(Category const c, FacesT const& faces) -> ScoreT
    {
        util::RequireValidFaces(faces);
        return Evaluate(c, util::FaceCounts{faces}, util::SumFaces(faces));
    }

    auto CalculateFinalScore(Scoreboard const& board) -> FinalScore
    {
        FinalScore fs{};
        for (Category const c : AllCategories)
        {
            ScoreT const v = board.Get(c).value_or(0);
            (IsUpper(c) ? fs.upper : fs.lower) += v;
        }
        fs.bonus = fs.upper >= constants::UpperBonusThreshold ? constants::UpperBonus : ScoreT{0};
        fs.total = static_cast<ScoreT>(fs.upper + fs.bonus + fs.lower);
        return fs;
    }
}
