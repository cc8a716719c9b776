//
// Created by Malik T on 02/11/2025.
//

#ifndef YAHTZEE_PLAYER_HPP
#define YAHTZEE_PLAYER_HPP

#include "Actions.hpp"
#include "State.hpp"

namespace yahtzee::core
{
    class Player
    {
    public:
        virtual ~Player() = default;

        // Called for computer-driven seats whenever it is their move.
        virtual PlayerAction Play(std::shared_ptr<const GameSnapshot> snapshot) = 0;
    };
}
#endif //YAHTZEE_PLAYER_HPP
