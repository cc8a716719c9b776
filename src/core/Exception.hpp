//
// Created by Malik T on 02/11/2025.
//

#ifndef YAHTZEE_EXCEPTION_HPP
#define YAHTZEE_EXCEPTION_HPP

#include "OmegaException.hpp"

#include <expected>
#include <stdexcept>
#include <format>
#include <string_view>
#include <utility>
#include "Types.hpp"
#include "Actions.hpp"

namespace yahtzee::core::error
{
    enum class Code : unsigned
    {
        Unknown, // unknown error
        Rules, // rules engine misuse (not user invalid move)
        State, // state engine misuse (not user invalid move)
        InvalidAction, // proposed action cannot be applied
        InvalidDice, // die face outside [1,6]
        Config, // bad game configuration (player count, seats)
        Assertion // internal assertion failed
    };

    struct UnknownError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct RulesError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct StateError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct InvalidActionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct InvalidDiceError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct ConfigError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct AssertionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    [[noreturn]]
    inline auto fail(Code c, std::string msg,
                     std::source_location const& loc = std::source_location::current()) -> void
    {
        switch (c)
        {
        case Code::Unknown: throw UnknownError(std::move(msg), c, loc);
        case Code::Rules: throw RulesError(std::move(msg), c, loc);
        case Code::State: throw StateError(std::move(msg), c, loc);
        case Code::InvalidAction: throw InvalidActionError(std::move(msg), c, loc);
        case Code::InvalidDice: throw InvalidDiceError(std::move(msg), c, loc);
        case Code::Config: throw ConfigError(std::move(msg), c, loc);
        case Code::Assertion: throw AssertionError(std::move(msg), c, loc);
        }
        throw std::runtime_error(msg);
    }

#define YTZ_THROW(code_enum, msg) ::yahtzee::core::error::fail((code_enum), (msg))
#define YTZ_ASSERT(cond, msg) do { if(!(cond)) ::yahtzee::core::error::fail(::yahtzee::core::error::Code::Assertion, (msg)); } while(0)

    // Fine-grained reasons; grouped by action type.
    enum class RuleViolationCode : std::uint16_t
    {
        // Generic/flow
        WrongPhase_RollingRequired,
        WrongPhase_ChoosingRequired,
        GameAlreadyOver,

        // Roll
        Roll_NoRollsLeft,

        // Keep
        Keep_DieOutOfRange,

        // Category
        Category_OutOfRange,
        Category_AlreadyUsed,
        Category_NotEligible,

        // Safety net
        Internal_Unreachable
    };

    // Compact, optional context carried with the violation.
    struct RuleViolation
    {
        RuleViolationCode code{};
        std::optional<Phase> phase{};
        std::optional<PlyrIdxT> actor{};
        std::optional<Category> category{};
        std::optional<std::uint8_t> die{};
        std::optional<std::uint8_t> rolls_left{};

        auto with_phase(Phase p) -> RuleViolation&
        {
            phase = p;
            return *this;
        }

        auto with_actor(PlyrIdxT s) -> RuleViolation&
        {
            actor = s;
            return *this;
        }

        auto with_category(Category c) -> RuleViolation&
        {
            category = c;
            return *this;
        }

        auto with_die(std::uint8_t d) -> RuleViolation&
        {
            die = d;
            return *this;
        }

        auto with_rolls_left(std::uint8_t r) -> RuleViolation&
        {
            rolls_left = r;
            return *this;
        }
    };

    inline auto to_string(RuleViolationCode c) -> std::string_view
    {
        using E = RuleViolationCode;
        switch (c)
        {
        case E::WrongPhase_RollingRequired: return "Wrong phase (rolling required)";
        case E::WrongPhase_ChoosingRequired: return "Wrong phase (category choice required)";
        case E::GameAlreadyOver: return "Game is over";

        case E::Roll_NoRollsLeft: return "Roll: no rolls left this turn";
        case E::Keep_DieOutOfRange: return "Keep: die index out of range";

        case E::Category_OutOfRange: return "Category: unknown category";
        case E::Category_AlreadyUsed: return "Category: already scored";
        case E::Category_NotEligible: return "Category: dice not eligible (use zero mode)";

        case E::Internal_Unreachable: return "Internal: unreachable";
        }
        return "Unknown";
    }

    inline auto to_string(Phase p) -> std::string_view
    {
        switch (p)
        {
        case Phase::Rolling: return "R";
        case Phase::ChoosingCategory: return "C";
        case Phase::Scored: return "S";
        case Phase::GameOver: return "X";
        }
        return "?";
    }

    inline auto describe(RuleViolation const& v) -> std::string
    {
        // Build a compact, reproducible message for logs/tests.
        auto s = std::format("{}", to_string(v.code));
        if (v.phase) s += std::format(" | phase={}", to_string(*v.phase));
        if (v.actor) s += std::format(" | actor=P{}", static_cast<int>(*v.actor) + 1);
        if (v.category) s += std::format(" | cat={}", static_cast<int>(std::to_underlying(*v.category)));
        if (v.die) s += std::format(" | die={}", static_cast<int>(*v.die));
        if (v.rolls_left) s += std::format(" | rolls={}", static_cast<int>(*v.rolls_left));
        return s;
    }

    using ValidateResult = std::expected<void, RuleViolation>;
}

#endif //YAHTZEE_EXCEPTION_HPP
