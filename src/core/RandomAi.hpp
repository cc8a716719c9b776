//
// Created by Malik T on 04/11/2025.
//

#ifndef YAHTZEE_RANDOMAI_HPP
#define YAHTZEE_RANDOMAI_HPP

#include "Player.hpp"
#include "State.hpp"
#include "Types.hpp"

namespace yahtzee::core
{
    // Never proposes an invalid action, so self-play cannot stall.
    class RandomAI final : public yahtzee::core::Player
    {
    public:
        explicit RandomAI(uint64_t rng_seed);

        auto Play(std::shared_ptr<const yahtzee::core::GameSnapshot> snapshot)
            -> yahtzee::core::PlayerAction override;

    private:
        template <class Vec>
        auto pick(Vec const& v) -> size_t
        {
            return std::uniform_int_distribution<size_t>{0, v.size() - 1}(rng_);
        }

        auto RollMove(yahtzee::core::GameSnapshot const&) -> yahtzee::core::PlayerAction;
        auto ScoreMove(yahtzee::core::GameSnapshot const&) -> yahtzee::core::PlayerAction;

    private:
        std::mt19937 rng_;
    };
}

#endif //YAHTZEE_RANDOMAI_HPP
