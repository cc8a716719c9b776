//
// Created by Malik T on 02/11/2025.
//

#ifndef YAHTZEE_STATE_HPP
#define YAHTZEE_STATE_HPP

#include "Types.hpp"
#include "Actions.hpp"
#include "Scoreboard.hpp"


namespace yahtzee::core
{
    // Immutable copy of the public game state handed to UI/AI
    struct GameSnapshot
    {
        uint8_t  n_players{};
        PlyrIdxT current_player{};
        uint8_t  round{1};
        Phase    phase{Phase::Rolling};

        DiceT   dice{};
        uint8_t rolls_left{};
        bool    zero_mode{false};

        // what each category would score with the current dice
        ScoreTableT possible{};
        std::vector<Scoreboard> scoreboards;
    };

} // namespace yahtzee::core

#endif //YAHTZEE_STATE_HPP
