//
// Created by Malik T on 06/11/2025.
//
#include <gtest/gtest.h>
#include <filesystem>
#include <format>
#include <print>

#include "../core/Game.hpp"
#include "../core/ClassicRules.hpp"
#include "../core/RandomAi.hpp"
#include "../core/Scoring.hpp"
#include "../debug/AuditLogger.hpp"
#include "../debug/Invariants.hpp"
#include "../debug/RecordingPlayer.hpp"

using namespace yahtzee::core;

namespace
{

auto make_players(std::uint64_t seed, std::size_t n) -> std::vector<std::unique_ptr<Player>>
{
    std::vector<std::unique_ptr<Player>> ps;
    ps.reserve(n);
    for (std::size_t i{}; i < n; ++i)
    {
        ps.emplace_back(std::make_unique<RandomAI>(seed + static_cast<std::uint64_t>(i + 1)));
    }
    return ps;
}

auto make_game(std::uint64_t seed, std::size_t n_players) -> GameImpl
{
    Config cfg{
        .n_players = static_cast<std::uint32_t>(n_players),
        .seed      = seed
    };

    auto ps = make_players(seed, n_players);
    ps = yahtzee::core::debug::WrapRecording(ps);

    return GameImpl(cfg, std::make_unique<ClassicRules>(), std::move(ps));
}

// Plays one full game, logging every step. Returns the number of scored turns.
auto play_out(GameImpl& game, yahtzee::core::debug::AuditLogger& log, std::uint64_t seed) -> std::size_t
{
    std::size_t scored{};
    log.start(game, seed);

    for (;;)
    {
        PlyrIdxT const actor = game.CurrentPlayer();
        auto const snap = game.Snapshot();

        MoveOutcome const out = game.Step();
        yahtzee::core::debug::CheckInvariants(game);

        auto* rec = yahtzee::core::debug::AsRecording(game.PlayerAt(actor));
        EXPECT_NE(rec, nullptr) << "Player not wrapped with RecordingPlayer";
        if (!rec) return scored;
        EXPECT_TRUE(rec->HasLast()) << "No action recorded for actor seat";

        log.turn(*snap, rec->Last());
        log.outcome(out);

        EXPECT_NE(out, MoveOutcome::Invalid) << "RandomAI proposed an invalid action";
        if (out == MoveOutcome::TurnEnded || out == MoveOutcome::RoundEnded || out == MoveOutcome::GameEnded)
        {
            ++scored;
        }

        if (out == MoveOutcome::GameEnded)
        {
            log.end(game);
            return scored;
        }
    }
}

} // anonymous namespace

TEST(SelfPlay, Transcripts_And_End)
{
    namespace fs = std::filesystem;
    fs::create_directories("_artifacts");
    try
    {
        for (std::uint64_t seed : {111ull, 222ull, 333ull})
        {
            auto game = make_game(seed, 2);
            auto const path = fs::path(std::format("_artifacts/game_{}.log", seed));
            {
                yahtzee::core::debug::AuditLogger log(path.string());
                ASSERT_TRUE(log.IsOpen());

                std::size_t const scored = play_out(game, log, seed);
                EXPECT_EQ(scored, constants::MaxRounds * 2u);
            }

            ASSERT_TRUE(game.IsOver());
            for (PlyrIdxT s = 0; s < 2; ++s)
            {
                EXPECT_TRUE(game.Board(s).IsComplete());
                scoring::FinalScore const score = scoring::CalculateFinalScore(game.Board(s));
                EXPECT_EQ(score.total, score.upper + score.bonus + score.lower);
            }

            ASSERT_TRUE(fs::exists(path));
            ASSERT_GT(fs::file_size(path), 0u);
        }
    }
    catch (yahtzee::core::OmegaException<yahtzee::core::error::Code> const& e)
    {
        std::print("{}", e.to_str());
        FAIL() << e.what();
    }
}

TEST(SelfPlay9P, AllSeats_Restart)
{
    namespace fs = std::filesystem;
    fs::create_directories("_artifacts");
    try
    {
        for (std::uint64_t seed : {1ull, 23ull, 44ull})
        {
            auto game = make_game(seed, constants::MaxPlayers);
            yahtzee::core::debug::AuditLogger log(std::format("_artifacts/game9p_{}.log", seed));

            EXPECT_EQ(play_out(game, log, seed), constants::MaxRounds * constants::MaxPlayers);

            // second game on the same seats
            game.Restart();
            yahtzee::core::debug::CheckInvariants(game);
            EXPECT_EQ(play_out(game, log, seed), constants::MaxRounds * constants::MaxPlayers);
        }
    }
    catch (yahtzee::core::OmegaException<yahtzee::core::error::Code> const& e)
    {
        std::print("{}", e.to_str());
        FAIL() << e.what();
    }
}
