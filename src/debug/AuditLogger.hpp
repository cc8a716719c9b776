//
// Created by Malik T on 05/11/2025.
//

#ifndef YAHTZEE_AUDITLOGGER_HPP
#define YAHTZEE_AUDITLOGGER_HPP

#include <cstdint>
#include <fstream>
#include <string>

#include "../core/Game.hpp"
#include "../core/State.hpp"
#include "../core/Actions.hpp"
#include "../core/Types.hpp"

namespace yahtzee::core::debug
{
    class AuditLogger
    {
    public:
        explicit AuditLogger(std::string path);
        ~AuditLogger();

        AuditLogger(AuditLogger const&) = delete;
        auto operator=(AuditLogger const&) -> AuditLogger& = delete;

        AuditLogger(AuditLogger&&) noexcept = default;
        auto operator=(AuditLogger&&) noexcept -> AuditLogger& = default;

        [[nodiscard]]
        auto IsOpen() const -> bool { return out_.is_open(); }

        // Session header (seed, player count)
        auto start(GameImpl const& game, std::uint64_t seed) -> void;

        // Per action (before Submit): snapshot and the proposed action
        auto turn(GameSnapshot const& s, PlayerAction const& a) -> void;

        // Per action outcome (after Submit)
        auto outcome(MoveOutcome m) -> void;

        // Game end footer: final score breakdown for every seat
        auto end(GameImpl const& game) -> void;

        // Manual flush
        auto flush() -> void;

    private:
        std::ofstream out_;
    };
}

#endif //YAHTZEE_AUDITLOGGER_HPP
