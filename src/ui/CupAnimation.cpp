//
// Created by Malik T on 09/11/2025.
//

#include "CupAnimation.hpp"

namespace yahtzee::ui
{
    namespace
    {
        auto Lerp(float const a, float const b, float const t) -> float
        {
            return a + (b - a) * t;
        }

        auto RestCenter(size_t const i) -> layout::Point
        {
            return layout::DieRect(i).Center();
        }
    }

    CupAnimation::CupAnimation() = default;

    auto CupAnimation::Start(core::DiceT const& dice) -> void
    {
        for (size_t i{}; i < dice.size(); ++i)
        {
            moving_[i] = !dice[i].kept;
        }
        stage_ = Stage::MoveIn;
        frame_ = 0;
    }

    auto CupAnimation::Tick() -> Event
    {
        if (stage_ == Stage::Idle) return Event::None;

        ++frame_;
        switch (stage_)
        {
        case Stage::MoveIn:
            if (frame_ >= MoveInFrames)
            {
                stage_ = Stage::Shake;
                frame_ = 0;
            }
            return Event::None;

        case Stage::Shake:
            if (frame_ >= ShakeFrames)
            {
                stage_ = Stage::MoveOut;
                frame_ = 0;
                return Event::RollNow;
            }
            return Event::None;

        case Stage::MoveOut:
            if (frame_ >= MoveOutFrames)
            {
                stage_ = Stage::Idle;
                frame_ = 0;
                return Event::Finished;
            }
            return Event::None;

        case Stage::Idle:
            break;
        }
        return Event::None;
    }

    auto CupAnimation::Progress() const -> float
    {
        switch (stage_)
        {
        case Stage::MoveIn:  return static_cast<float>(frame_) / MoveInFrames;
        case Stage::Shake:   return static_cast<float>(frame_) / ShakeFrames;
        case Stage::MoveOut: return static_cast<float>(frame_) / MoveOutFrames;
        case Stage::Idle:    break;
        }
        return 0.f;
    }

    auto CupAnimation::DieCenter(size_t const i) const -> layout::Point
    {
        layout::Point const rest = RestCenter(i);
        if (stage_ == Stage::Idle || !moving_[i]) return rest;

        float t = 1.f;
        if (stage_ == Stage::MoveIn) t = Progress();
        else if (stage_ == Stage::MoveOut) t = 1.f - Progress();

        return {Lerp(rest.x, layout::CupMouth.x, t), Lerp(rest.y, layout::CupMouth.y, t)};
    }

    auto CupAnimation::DieScale(size_t const i) const -> float
    {
        if (stage_ == Stage::Idle || !moving_[i]) return 1.f;
        if (stage_ == Stage::MoveIn) return 1.f - 0.5f * Progress();
        if (stage_ == Stage::MoveOut) return 0.5f + 0.5f * Progress();
        return 0.5f;
    }

    auto CupAnimation::DieHidden(size_t const i) const -> bool
    {
        return stage_ == Stage::Shake && moving_[i];
    }

    auto CupAnimation::CupFrame() const -> int
    {
        return stage_ == Stage::Shake ? frame_ % layout::CupFrameCount : 0;
    }
}
