//
// Created by Malik T on 05/11/2025.
//
#include "AuditLogger.hpp"

#include <format>
#include <string_view>

#include "../core/Category.hpp"
#include "../core/Exception.hpp"
#include "../core/Scoring.hpp"

using namespace yahtzee::core;

namespace
{

auto s_dice(DiceT const& dice) -> std::string
{
    std::string body;
    for (size_t i{}; i < dice.size(); ++i)
    {
        body += (i ? " " : "");
        body += std::format("{}{}", static_cast<int>(dice[i].value), dice[i].kept ? "*" : "");
    }
    return body;
}

auto s_action(PlayerAction const& a) -> std::string
{
    return std::visit(
        [&]<typename T0>(T0 const& act) -> std::string
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, RollAction>)
            {
                return "Roll";
            }
            else if constexpr (std::is_same_v<T, ToggleKeepAction>)
            {
                return std::format("Keep({})", static_cast<int>(act.die));
            }
            else if constexpr (std::is_same_v<T, EndTurnAction>)
            {
                return "EndTurn";
            }
            else if constexpr (std::is_same_v<T, ZeroModeAction>)
            {
                return "ZeroMode";
            }
            else
            {
                return std::format("Score[{}]", CategoryName(act.category));
            }
        },
        a
    );
}

auto s_outcome(MoveOutcome const m) -> std::string_view
{
    switch (m)
    {
        case MoveOutcome::Invalid:    return "Invalid";
        case MoveOutcome::Applied:    return "Applied";
        case MoveOutcome::TurnEnded:  return "TurnEnded";
        case MoveOutcome::RoundEnded: return "RoundEnded";
        case MoveOutcome::GameEnded:  return "GameEnded";
    }
    return "?";
}

} // anonymous namespace

namespace yahtzee::core::debug
{

AuditLogger::AuditLogger(std::string path)
    : out_(std::move(path), std::ios::out | std::ios::trunc)
{
}

AuditLogger::~AuditLogger() = default;

auto AuditLogger::start(GameImpl const& game, uint64_t seed) -> void
{
    out_ << std::format("Seed={}\n", seed);
    out_ << std::format("Players={}\n", game.PlayerCount());
    out_.flush();
}

auto AuditLogger::turn(GameSnapshot const& s, PlayerAction const& a) -> void
{
    out_ << std::format(
        "Turn actor=P{} round={} phase={} rolls={} dice=[{}]\n",
        static_cast<int>(s.current_player) + 1,
        static_cast<int>(s.round),
        error::to_string(s.phase),
        static_cast<int>(s.rolls_left),
        s_dice(s.dice)
    );

    out_ << std::format("Action: {}{}\n", s_action(a), s.zero_mode ? " (zero)" : "");
}

auto AuditLogger::outcome(MoveOutcome m) -> void
{
    out_ << std::format("Outcome: {}\n", s_outcome(m));
}

auto AuditLogger::end(GameImpl const& game) -> void
{
    for (PlyrIdxT i = 0; i < game.PlayerCount(); ++i)
    {
        scoring::FinalScore const fs = scoring::CalculateFinalScore(game.Board(i));
        out_ << std::format("Final P{}: upper={} bonus={} lower={} total={}\n",
                            static_cast<int>(i) + 1, fs.upper, fs.bonus, fs.lower, fs.total);
    }
    out_.flush();
}

auto AuditLogger::flush() -> void
{
    out_.flush();
}

} // namespace yahtzee::core::debug
