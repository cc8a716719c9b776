//
// Created by Malik T on 03/11/2025.
//

#include "ClassicRules.hpp"

#include "Game.hpp"
#include "Scoring.hpp"
#include "Util.hpp"
#include <algorithm>
namespace
{
    inline auto Viol(yahtzee::core::error::RuleViolationCode code) -> yahtzee::core::error::RuleViolation
    {
        return yahtzee::core::error::RuleViolation{ .code = code };
    }
}

namespace yahtzee::core
{
auto ClassicRules::Validate(GameImpl const& game, PlayerAction const& a) const -> CheckResult
{
    using RVC = ::yahtzee::core::error::RuleViolationCode;

    PlyrIdxT const actor = game.current_idx_;

    if (game.phase_ == Phase::GameOver)
        return std::unexpected(Viol(RVC::GameAlreadyOver).with_phase(game.phase_));

    return std::visit([&]<typename T0>(T0 const& act) -> CheckResult
    {
        using T = std::decay_t<T0>;

        if constexpr (std::is_same_v<T, RollAction>)
        {
            if (game.phase_ != Phase::Rolling)
                return std::unexpected(Viol(RVC::WrongPhase_RollingRequired)
                                       .with_phase(game.phase_).with_actor(actor));

            if (game.rolls_left_ == 0)
                return std::unexpected(Viol(RVC::Roll_NoRollsLeft)
                                       .with_actor(actor).with_rolls_left(game.rolls_left_));
            return {};
        }
        else if constexpr (std::is_same_v<T, ToggleKeepAction>)
        {
            if (game.phase_ != Phase::Rolling)
                return std::unexpected(Viol(RVC::WrongPhase_RollingRequired)
                                       .with_phase(game.phase_).with_actor(actor));

            if (act.die >= constants::NumDice)
                return std::unexpected(Viol(RVC::Keep_DieOutOfRange)
                                       .with_actor(actor).with_die(act.die));
            return {};
        }
        else if constexpr (std::is_same_v<T, EndTurnAction>)
        {
            if (game.phase_ != Phase::Rolling)
                return std::unexpected(Viol(RVC::WrongPhase_RollingRequired)
                                       .with_phase(game.phase_).with_actor(actor));
            return {};
        }
        else if constexpr (std::is_same_v<T, ZeroModeAction>)
        {
            if (game.phase_ != Phase::ChoosingCategory)
                return std::unexpected(Viol(RVC::WrongPhase_ChoosingRequired)
                                       .with_phase(game.phase_).with_actor(actor));
            return {};
        }
        else if constexpr (std::is_same_v<T, ChooseCategoryAction>)
        {
            if (game.phase_ != Phase::ChoosingCategory)
                return std::unexpected(Viol(RVC::WrongPhase_ChoosingRequired)
                                       .with_phase(game.phase_).with_actor(actor));

            if (Index(act.category) >= constants::NumCategories)
                return std::unexpected(Viol(RVC::Category_OutOfRange)
                                       .with_actor(actor).with_category(act.category));

            if (game.scoreboards_[actor].IsUsed(act.category))
                return std::unexpected(Viol(RVC::Category_AlreadyUsed)
                                       .with_actor(actor).with_category(act.category));

            if (!game.zero_mode_ && RequiresEligibility(act.category)
                && scoring::ScoreFor(act.category, util::FacesOf(game.dice_)) == 0)
                return std::unexpected(Viol(RVC::Category_NotEligible)
                                       .with_actor(actor).with_category(act.category));
            return {};
        }
        else
        {
            return std::unexpected(Viol(RVC::Internal_Unreachable));
        }
    }, a);
}

auto ClassicRules::Apply(GameImpl& game, PlayerAction const& a) -> void
{
    std::visit([&]<typename T0>(T0 const& act)
    {
        using T = std::decay_t<T0>;

        if constexpr (std::is_same_v<T, RollAction>)
        {
            YTZ_ASSERT(game.rolls_left_ > 0, "Roll applied with no rolls left");
            game.RollUnkept();
            --game.rolls_left_;
        }
        else if constexpr (std::is_same_v<T, ToggleKeepAction>)
        {
            Die& d = game.dice_.at(act.die);
            d.kept = !d.kept;
        }
        else if constexpr (std::is_same_v<T, EndTurnAction>)
        {
            game.phase_ = Phase::ChoosingCategory;
        }
        else if constexpr (std::is_same_v<T, ZeroModeAction>)
        {
            game.zero_mode_ = true;
        }
        else if constexpr (std::is_same_v<T, ChooseCategoryAction>)
        {
            ScoreT const score = game.zero_mode_
                                     ? ScoreT{0}
                                     : scoring::ScoreFor(act.category, util::FacesOf(game.dice_));
            game.scoreboards_[game.current_idx_].Record(act.category, score);
            game.phase_ = Phase::Scored;
        }
    }, a);
}

auto ClassicRules::Advance(GameImpl& game) -> MoveOutcome
{
    // Out of re-rolls: the turn ends on its own and the scorecard opens.
    if (game.phase_ == Phase::Rolling && game.rolls_left_ == 0)
    {
        game.phase_ = Phase::ChoosingCategory;
        return MoveOutcome::Applied;
    }

    if (game.phase_ != Phase::Scored) return MoveOutcome::Applied;

    PlyrIdxT const next = game.NextSeat(game.current_idx_);
    if (next != 0)
    {
        game.BeginTurn(next);
        return MoveOutcome::TurnEnded;
    }

    if (game.round_ >= constants::MaxRounds)
    {
        game.phase_ = Phase::GameOver;
        game.zero_mode_ = false;
        return MoveOutcome::GameEnded;
    }

    ++game.round_;
    game.BeginTurn(next);
    return MoveOutcome::RoundEnded;
}
}
