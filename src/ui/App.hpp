//
// Created by Malik T on 10/11/2025.
//

#ifndef YAHTZEE_APP_HPP
#define YAHTZEE_APP_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <utility>

#include "CupAnimation.hpp"
#include "Input.hpp"
#include "Renderer.hpp"
#include "../core/Game.hpp"
#include "../debug/AuditLogger.hpp"

namespace yahtzee::ui
{
    struct AppConfig
    {
        // set: skip the prompt, "Play Again" restarts with the same count
        std::optional<uint32_t> n_players{};
        uint64_t seed{std::random_device{}()};
        // last N seats are played by RandomAI
        uint32_t n_cpu{0};
        // empty = no transcript
        std::string audit_path{};
        // frames between two computer moves
        int cpu_delay_frames{8};
    };

    // Owns the window, the game and the per-frame state. GLUT callbacks are
    // routed to the single live instance.
    class App
    {
    public:
        explicit App(AppConfig cfg);
        ~App();

        App(App const&) = delete;
        auto operator=(App const&) -> App& = delete;

        // Creates the window and blocks in the GLUT main loop. Returns the process exit code.
        auto Run(int& argc, char** argv) -> int;

        auto OnDisplay() -> void;
        auto OnReshape(int w, int h) -> void;
        auto OnKey(unsigned char key) -> void;
        auto OnMouse(int button, int state, int x, int y) -> void;
        auto OnTimer() -> void;

        // Leave the main loop; Run() returns `code`.
        auto Quit(int code) -> void;

    private:
        auto StartGame(uint32_t n_players) -> void;
        auto PlayAgain() -> void;
        // Roll actions start the cup animation, the engine roll lands mid-animation.
        auto Dispatch(core::PlayerAction const& a) -> void;
        auto Commit(core::PlayerAction const& a) -> core::MoveOutcome;
        auto SyncScreen() -> void;
        auto DriveComputerSeat() -> void;
        [[nodiscard]] auto HumanToMove() const -> bool;
        [[nodiscard]] auto ToLayout(int x, int y) const -> std::pair<int, int>;

    private:
        AppConfig cfg_;
        Renderer renderer_{};
        CupAnimation anim_{};
        std::unique_ptr<core::GameImpl> game_;
        std::unique_ptr<core::debug::AuditLogger> audit_;

        Screen screen_{Screen::PromptPlayers};
        std::optional<uint32_t> chosen_players_{};
        uint32_t games_started_{0};
        int cpu_wait_{0};
        int win_w_{layout::WindowWidth};
        int win_h_{layout::WindowHeight};
        int exit_code_{0};
    };
}

#endif //YAHTZEE_APP_HPP
