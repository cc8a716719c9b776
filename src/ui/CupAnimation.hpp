//
// Created by Malik T on 09/11/2025.
//

#ifndef YAHTZEE_CUPANIMATION_HPP
#define YAHTZEE_CUPANIMATION_HPP

#include <array>
#include <cstdint>
#include "Layout.hpp"
#include "../core/Types.hpp"

namespace yahtzee::ui
{
    // Frame-stepped cup shake: unkept dice slide into the cup, the cup rattles,
    // then the dice slide back out. The engine roll happens between shake and
    // move-out, signalled by Tick() returning RollNow.
    class CupAnimation
    {
    public:
        static constexpr int MoveInFrames = 15;
        static constexpr int ShakeFrames = 36;
        static constexpr int MoveOutFrames = 15;

        enum class Stage : uint8_t
        {
            Idle,
            MoveIn,
            Shake,
            MoveOut
        };

        enum class Event : uint8_t
        {
            None,
            RollNow,
            Finished
        };

        CupAnimation();

        auto Start(core::DiceT const& dice) -> void;
        // Advance one frame.
        auto Tick() -> Event;

        [[nodiscard]] auto Active() const noexcept -> bool { return stage_ != Stage::Idle; }
        [[nodiscard]] auto CurrentStage() const noexcept -> Stage { return stage_; }

        // Centre and scale of die i for the current frame.
        [[nodiscard]] auto DieCenter(size_t i) const -> layout::Point;
        [[nodiscard]] auto DieScale(size_t i) const -> float;
        // Unkept dice are inside the cup while it shakes.
        [[nodiscard]] auto DieHidden(size_t i) const -> bool;
        [[nodiscard]] auto CupFrame() const -> int;

    private:
        // 0..1 progress through the current stage
        [[nodiscard]] auto Progress() const -> float;

        Stage stage_{Stage::Idle};
        int frame_{0};
        std::array<bool, core::constants::NumDice> moving_{};
    };
}

#endif //YAHTZEE_CUPANIMATION_HPP
