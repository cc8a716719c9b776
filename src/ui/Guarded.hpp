//
// Created by Malik T on 10/11/2025.
//

#ifndef YAHTZEE_GUARDED_HPP
#define YAHTZEE_GUARDED_HPP

#include <cstdio>
#include <exception>
#include <print>
#include <utility>

#include "../core/Exception.hpp"

namespace yahtzee::ui
{
    // Runs fn; if it throws, logs the error and calls on_fail instead of letting the
    // exception unwind into the windowing library. Returns false when fn threw.
    template <typename Fn, typename OnFail>
    auto Guarded(Fn&& fn, OnFail&& on_fail) -> bool
    {
        try
        {
            std::forward<Fn>(fn)();
            return true;
        }
        catch (core::OmegaException<core::error::Code> const& e)
        {
            std::print(stderr, "[yahtzee] {}", e);
        }
        catch (std::exception const& e)
        {
            std::print(stderr, "[yahtzee] error: {}\n", e.what());
        }
        std::forward<OnFail>(on_fail)();
        return false;
    }
}

#endif //YAHTZEE_GUARDED_HPP
