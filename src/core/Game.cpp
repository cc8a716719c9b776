//
// Created by Malik T on 03/11/2025.
//
#include "Game.hpp"
#include <algorithm>
#include <format>
#include <print>
#include <ranges>
#include <utility>

#include "Scoring.hpp"
#include "Util.hpp"

namespace yahtzee::core
{
    GameImpl::GameImpl(Config const& config,
                       std::unique_ptr<Rules> rules,
                       std::vector<std::unique_ptr<Player>> players) :
        cfg_(config),
        rules_(std::move(rules)),
        players_(std::move(players)),
        rng_{cfg_.seed}
    {
        if (cfg_.n_players < constants::MinPlayers || cfg_.n_players > constants::MaxPlayers)
            YTZ_THROW(error::Code::Config,
                      std::format("Player count {} outside [{}, {}]", cfg_.n_players,
                                  constants::MinPlayers, constants::MaxPlayers));
        YTZ_ASSERT(rules_ != nullptr, "No rules supplied to game");

        if (players_.empty()) players_.resize(cfg_.n_players);
        if (players_.size() != cfg_.n_players)
            YTZ_THROW(error::Code::Config,
                      std::format("{} seat players supplied for {} players", players_.size(), cfg_.n_players));

        scoreboards_.resize(cfg_.n_players);
        BeginTurn(0);
    }

    auto GameImpl::BeginTurn(PlyrIdxT const seat) -> void
    {
        current_idx_ = seat;
        phase_ = Phase::Rolling;
        zero_mode_ = false;
        rolls_left_ = constants::MaxRollsPerTurn;
        for (Die& d : dice_) d.kept = false;
        RollUnkept();
    }

    auto GameImpl::RollUnkept() -> void
    {
        for (Die& d : dice_)
        {
            if (!d.kept) d.value = static_cast<FaceT>(face_dist_(rng_));
        }
    }

    auto GameImpl::Restart() -> void
    {
        for (Scoreboard& sb : scoreboards_) sb.Clear();
        round_ = 1;
        BeginTurn(0);
    }

    auto GameImpl::PossibleScores() const -> ScoreTableT
    {
        return scoring::PossibleScores(util::FacesOf(dice_));
    }

    auto GameImpl::Snapshot() const -> std::shared_ptr<GameSnapshot const>
    {
        auto snap = std::make_shared<GameSnapshot>();
        snap->n_players = static_cast<uint8_t>(scoreboards_.size());
        snap->current_player = current_idx_;
        snap->round = round_;
        snap->phase = phase_;
        snap->dice = dice_;
        snap->rolls_left = rolls_left_;
        snap->zero_mode = zero_mode_;
        snap->possible = PossibleScores();
        snap->scoreboards = scoreboards_;
        return snap;
    }

    auto GameImpl::Check(PlayerAction const& action) const -> Rules::CheckResult
    {
        return rules_->Validate(*this, action);
    }

    auto GameImpl::Submit(PlayerAction const& action) -> MoveOutcome
    {
        if (auto const ok = rules_->Validate(*this, action); !ok.has_value())
        {
            std::print("[yahtzee] {}\n", error::describe(ok.error()));
            return MoveOutcome::Invalid;
        }
        rules_->Apply(*this, action);
        return rules_->Advance(*this);
    }

    auto GameImpl::Propose() -> PlayerAction
    {
        Player* const p = players_[current_idx_].get();
        if (!p)
            YTZ_THROW(error::Code::State,
                      std::format("Seat {} takes local input, no computer player to ask", current_idx_));
        return p->Play(Snapshot());
    }

    auto GameImpl::Step() -> MoveOutcome
    {
        if (phase_ == Phase::GameOver) return MoveOutcome::GameEnded;
        return Submit(Propose());
    }
}
