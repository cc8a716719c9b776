//
// Created by Malik T on 09/11/2025.
//

#ifndef YAHTZEE_RENDERER_HPP
#define YAHTZEE_RENDERER_HPP

#include <array>
#include <cstdint>
#include <string_view>
#include "Layout.hpp"
#include "../core/Types.hpp"

namespace yahtzee::ui
{
    struct Color
    {
        float r{};
        float g{};
        float b{};
    };

    inline constexpr auto Rgb(int const r, int const g, int const b) -> Color
    {
        return {static_cast<float>(r) / 255.f, static_cast<float>(g) / 255.f, static_cast<float>(b) / 255.f};
    }

    namespace colors
    {
        inline constexpr Color White = Rgb(255, 255, 255);
        inline constexpr Color Black = Rgb(0, 0, 0);
        inline constexpr Color Red   = Rgb(255, 0, 0);
        inline constexpr Color Green = Rgb(34, 139, 34);    // rolling table
        inline constexpr Color Brown = Rgb(222, 184, 135);  // scorecard and final screens
        inline constexpr Color CupBody = Rgb(120, 72, 40);
        inline constexpr Color CupRim  = Rgb(84, 48, 24);
    }

    enum class Font : uint8_t
    {
        Large,
        Small
    };

    // Immediate-mode 2D drawing on top of fixed-function OpenGL. Die faces and
    // cup frames are compiled into display lists once by Init() and replayed
    // like sprites afterwards. Requires a current GL context; the lists live
    // as long as that context does.
    class Renderer
    {
    public:
        Renderer() = default;

        Renderer(Renderer const&) = delete;
        auto operator=(Renderer const&) -> Renderer& = delete;

        auto Init() -> void;
        // Pixel projection with a top-left origin for the given viewport size.
        auto BeginFrame(int width, int height) -> void;

        auto Clear(Color c) -> void;
        auto FillRect(layout::Rect r, Color c) -> void;
        auto StrokeRect(layout::Rect r, Color c, float thickness = 2.f) -> void;
        auto DashedLine(int x1, int x2, int y, Color c, float thickness = 2.f, int dash = 10) -> void;

        // (x, y) is the top-left corner of the text line.
        auto Text(std::string_view s, int x, int y, Color c, Font f = Font::Small) -> void;
        auto TextCentered(std::string_view s, int cx, int cy, Color c, Font f = Font::Small) -> void;
        [[nodiscard]] auto TextWidth(std::string_view s, Font f) const -> int;
        [[nodiscard]] auto LineHeight(Font f) const -> int;

        // Die face centred on (cx, cy); red outline when kept.
        auto Die(core::FaceT face, layout::Point center, float size, bool kept) -> void;
        auto Cup(layout::Rect r, int frame) -> void;

    private:
        auto BuildDieFace(core::FaceT face) -> void;
        auto BuildCupFrame(int frame) -> void;

        unsigned int die_lists_{0};  // first of 6 lists, face f at die_lists_ + f - 1
        unsigned int cup_lists_{0};  // first of CupFrameCount lists
    };
}

#endif //YAHTZEE_RENDERER_HPP
