//
// Created by Malik T on 10/11/2025.
//

#include "App.hpp"

#include <GL/freeglut.h>

#include <algorithm>
#include <print>
#include <utility>
#include <vector>

#include "Guarded.hpp"
#include "Screens.hpp"
#include "../core/ClassicRules.hpp"
#include "../core/Exception.hpp"
#include "../core/RandomAi.hpp"
#include "../core/Scoring.hpp"

namespace yahtzee::ui
{
    using namespace yahtzee::core;

    namespace
    {
        App* g_app = nullptr;

        // GLUT calls back through C frames; errors are reported here and end the loop.
        template <typename Fn>
        auto Dispatched(Fn&& fn) -> void
        {
            if (!g_app) return;
            App& app = *g_app;
            Guarded([&] { fn(app); }, [&] { app.Quit(1); });
        }

        void DisplayCb() { Dispatched([](App& a) { a.OnDisplay(); }); }
        void ReshapeCb(int w, int h) { Dispatched([=](App& a) { a.OnReshape(w, h); }); }
        void KeyboardCb(unsigned char key, int, int) { Dispatched([=](App& a) { a.OnKey(key); }); }
        void MouseCb(int button, int state, int x, int y) { Dispatched([=](App& a) { a.OnMouse(button, state, x, y); }); }
        void TimerCb(int)
        {
            Dispatched([](App& a) { a.OnTimer(); });
            glutTimerFunc(layout::FrameMs, TimerCb, 0);
        }
    }

    App::App(AppConfig cfg) :
        cfg_(std::move(cfg))
    {
        if (g_app) YTZ_THROW(error::Code::State, "Only one App may be alive at a time");
        g_app = this;

        if (!cfg_.audit_path.empty())
        {
            audit_ = std::make_unique<debug::AuditLogger>(cfg_.audit_path);
            if (!audit_->IsOpen())
            {
                std::print("[yahtzee] cannot open audit file {}, transcript disabled\n", cfg_.audit_path);
                audit_.reset();
            }
        }
    }

    App::~App()
    {
        g_app = nullptr;
    }

    auto App::Run(int& argc, char** argv) -> int
    {
        glutInit(&argc, argv);
        glutInitDisplayMode(GLUT_DOUBLE | GLUT_RGBA);
        glutInitWindowSize(layout::WindowWidth, layout::WindowHeight);
        glutCreateWindow("Yahtzee");
        glutSetOption(GLUT_ACTION_ON_WINDOW_CLOSE, GLUT_ACTION_GLUTMAINLOOP_RETURNS);

        renderer_.Init();

        glutDisplayFunc(DisplayCb);
        glutReshapeFunc(ReshapeCb);
        glutKeyboardFunc(KeyboardCb);
        glutMouseFunc(MouseCb);
        glutTimerFunc(layout::FrameMs, TimerCb, 0);

        if (cfg_.n_players) StartGame(*cfg_.n_players);

        glutMainLoop();

        if (audit_) audit_->flush();
        return exit_code_;
    }

    auto App::Quit(int const code) -> void
    {
        exit_code_ = code;
        glutLeaveMainLoop();
    }

    auto App::StartGame(uint32_t const n_players) -> void
    {
        Config cfg;
        cfg.n_players = n_players;
        cfg.seed = cfg_.seed + games_started_++;

        uint32_t const n_cpu = std::min(cfg_.n_cpu, n_players);
        std::vector<std::unique_ptr<Player>> players(n_players);
        for (uint32_t seat = n_players - n_cpu; seat < n_players; ++seat)
        {
            players[seat] = std::make_unique<RandomAI>(cfg.seed + static_cast<uint64_t>(seat * 1337u));
        }

        game_ = std::make_unique<GameImpl>(cfg, std::make_unique<ClassicRules>(), std::move(players));
        std::print("[yahtzee] new game: {} player(s), {} computer, seed {}\n", n_players, n_cpu, cfg.seed);

        if (audit_) audit_->start(*game_, cfg.seed);
        cpu_wait_ = 0;
        SyncScreen();
    }

    auto App::PlayAgain() -> void
    {
        if (cfg_.n_players && game_)
        {
            game_->Restart();
            std::print("[yahtzee] restarting with {} player(s)\n", game_->PlayerCount());
            if (audit_) audit_->start(*game_, game_->Seed());
            SyncScreen();
            return;
        }

        game_.reset();
        chosen_players_.reset();
        screen_ = Screen::PromptPlayers;
    }

    auto App::SyncScreen() -> void
    {
        if (!game_)
        {
            screen_ = Screen::PromptPlayers;
            return;
        }
        // the table stays up until the dice are back out of the cup
        screen_ = anim_.Active() ? Screen::Rolling : ScreenFor(game_->PhaseNow());
    }

    auto App::HumanToMove() const -> bool
    {
        return game_ && !game_->IsOver() && !game_->IsComputerSeat(game_->CurrentPlayer());
    }

    auto App::Dispatch(PlayerAction const& a) -> void
    {
        if (!game_ || anim_.Active()) return;

        if (std::holds_alternative<RollAction>(a))
        {
            if (auto const ok = game_->Check(a); !ok.has_value())
            {
                std::print("[yahtzee] {}\n", error::describe(ok.error()));
                return;
            }
            anim_.Start(game_->Dice());
            return;
        }
        Commit(a);
    }

    auto App::Commit(PlayerAction const& a) -> MoveOutcome
    {
        if (audit_) audit_->turn(*game_->Snapshot(), a);
        MoveOutcome const out = game_->Submit(a);
        if (audit_) audit_->outcome(out);

        if (out == MoveOutcome::GameEnded)
        {
            for (PlyrIdxT i = 0; i < game_->PlayerCount(); ++i)
            {
                scoring::FinalScore const fs = scoring::CalculateFinalScore(game_->Board(i));
                std::print("[yahtzee] P{}: upper={} bonus={} lower={} total={}\n",
                           static_cast<int>(i) + 1, fs.upper, fs.bonus, fs.lower, fs.total);
            }
            if (audit_) audit_->end(*game_);
        }

        if (out != MoveOutcome::Invalid) SyncScreen();
        return out;
    }

    auto App::DriveComputerSeat() -> void
    {
        if (!game_ || game_->IsOver() || anim_.Active()) return;
        if (!game_->IsComputerSeat(game_->CurrentPlayer())) return;

        if (++cpu_wait_ < cfg_.cpu_delay_frames) return;
        cpu_wait_ = 0;
        Dispatch(game_->Propose());
    }

    auto App::OnTimer() -> void
    {
        if (anim_.Active())
        {
            switch (anim_.Tick())
            {
            case CupAnimation::Event::RollNow:
                Commit(RollAction{});
                break;
            case CupAnimation::Event::Finished:
                SyncScreen();
                break;
            case CupAnimation::Event::None:
                break;
            }
        }
        else
        {
            DriveComputerSeat();
        }
        glutPostRedisplay();
    }

    auto App::OnKey(unsigned char const key) -> void
    {
        if (key == KeyEscape)
        {
            Quit(0);
            return;
        }

        switch (screen_)
        {
        case Screen::PromptPlayers:
            if (auto const n = PlayerCountFromKey(key))
            {
                chosen_players_ = n;
            }
            else if (key == KeyEnter && chosen_players_)
            {
                StartGame(*chosen_players_);
            }
            break;

        case Screen::Rolling:
        case Screen::Scorecard:
            if (!HumanToMove()) break;
            if (auto const a = ActionFromKey(screen_, key)) Dispatch(*a);
            break;

        case Screen::GameOver:
            break;
        }
        glutPostRedisplay();
    }

    auto App::ToLayout(int const x, int const y) const -> std::pair<int, int>
    {
        int const w = std::max(win_w_, 1);
        int const h = std::max(win_h_, 1);
        return {x * layout::WindowWidth / w, y * layout::WindowHeight / h};
    }

    auto App::OnMouse(int const button, int const state, int const x, int const y) -> void
    {
        if (button != GLUT_LEFT_BUTTON || state != GLUT_DOWN) return;
        auto const [lx, ly] = ToLayout(x, y);

        if (IsPlayAgainClick(screen_, lx, ly))
        {
            PlayAgain();
        }
        else if (HumanToMove())
        {
            if (auto const a = ActionFromClick(screen_, lx, ly)) Dispatch(*a);
        }
        glutPostRedisplay();
    }

    auto App::OnReshape(int const w, int const h) -> void
    {
        win_w_ = w;
        win_h_ = h;
    }

    auto App::OnDisplay() -> void
    {
        renderer_.BeginFrame(win_w_, win_h_);

        switch (screen_)
        {
        case Screen::PromptPlayers:
            DrawPromptScreen(renderer_, chosen_players_);
            break;
        case Screen::Rolling:
            DrawRollingScreen(renderer_, *game_->Snapshot(), anim_, game_->IsComputerSeat(game_->CurrentPlayer()));
            break;
        case Screen::Scorecard:
            DrawScorecardScreen(renderer_, *game_->Snapshot(), game_->IsComputerSeat(game_->CurrentPlayer()));
            break;
        case Screen::GameOver:
            DrawGameOverScreen(renderer_, game_->Snapshot()->scoreboards);
            break;
        }

        glutSwapBuffers();
    }
}
