//
// Created by Malik T on 10/11/2025.
//

//
// main.cpp: Yahtzee desktop client (FreeGLUT)
//

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <cstring>
#include <print>
#include <string>

#include "core/Exception.hpp"
#include "core/Types.hpp"
#include "ui/App.hpp"

namespace
{
    auto ParseArgs(int argc, char** argv) -> yahtzee::ui::AppConfig
    {
        using namespace yahtzee::core;
        yahtzee::ui::AppConfig cfg{};

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];

            auto next_uint = [&](std::uint64_t& out)
            {
                if (i + 1 >= argc) { return false; }
                char const* s = argv[++i];
                auto res = std::from_chars(s, s + std::strlen(s), out);
                return res.ec == std::errc{};
            };

            if (arg == "--players")
            {
                std::uint64_t v{};
                if (next_uint(v))
                {
                    cfg.n_players = static_cast<std::uint32_t>(
                        std::clamp<std::uint64_t>(v, constants::MinPlayers, constants::MaxPlayers));
                }
            }
            else if (arg == "--seed")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.seed = v; }
            }
            else if (arg == "--cpu")
            {
                std::uint64_t v{};
                if (next_uint(v))
                {
                    cfg.n_cpu = static_cast<std::uint32_t>(std::min<std::uint64_t>(v, constants::MaxPlayers));
                }
            }
            else if (arg == "--audit")
            {
                if (i + 1 < argc) { cfg.audit_path = argv[++i]; }
            }
            else
            {
                std::print("[yahtzee] ignoring unknown argument {}\n", arg);
            }
        }
        return cfg;
    }
}

int main(int argc, char** argv)
{
    using namespace yahtzee;

    ui::AppConfig const cfg = ParseArgs(argc, argv);

    std::print("[yahtzee] starting ({} player(s), {} computer, seed {})\n",
               cfg.n_players ? std::to_string(*cfg.n_players) : std::string{"prompt"}, cfg.n_cpu, cfg.seed);

    try
    {
        ui::App app(cfg);
        return app.Run(argc, argv);
    }
    catch (core::OmegaException<core::error::Code> const& e)
    {
        std::print(stderr, "[yahtzee] {}", e);
        return 1;
    }
}
