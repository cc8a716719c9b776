//
// Created by Malik T on 09/11/2025.
//

#include "Renderer.hpp"

#include <GL/freeglut.h>

#include <algorithm>
#include <cmath>
#include <numbers>
#include <string>
#include <utility>
#include <vector>
#include "../core/Exception.hpp"

namespace yahtzee::ui
{
    namespace
    {
        auto GlutFont(Font const f) -> void*
        {
            return f == Font::Large ? GLUT_BITMAP_TIMES_ROMAN_24 : GLUT_BITMAP_HELVETICA_18;
        }

        auto SetColor(Color const c) -> void
        {
            glColor3f(c.r, c.g, c.b);
        }

        auto Disc(float const cx, float const cy, float const rx, float const ry) -> void
        {
            constexpr int Segments = 20;
            glBegin(GL_TRIANGLE_FAN);
            glVertex2f(cx, cy);
            for (int i = 0; i <= Segments; ++i)
            {
                float const a = 2.f * std::numbers::pi_v<float> * static_cast<float>(i) / Segments;
                glVertex2f(cx + rx * std::cos(a), cy + ry * std::sin(a));
            }
            glEnd();
        }

        // (column, row) pip cells on a 3x3 grid
        auto PipCells(core::FaceT const face) -> std::vector<std::pair<int, int>>
        {
            switch (face)
            {
            case 1: return {{1, 1}};
            case 2: return {{0, 0}, {2, 2}};
            case 3: return {{0, 0}, {1, 1}, {2, 2}};
            case 4: return {{0, 0}, {2, 0}, {0, 2}, {2, 2}};
            case 5: return {{0, 0}, {2, 0}, {1, 1}, {0, 2}, {2, 2}};
            case 6: return {{0, 0}, {0, 1}, {0, 2}, {2, 0}, {2, 1}, {2, 2}};
            default: break;
            }
            YTZ_THROW(core::error::Code::InvalidDice, "No pip layout for face");
        }

        // frame tilt in degrees and sideways shift as a fraction of the cup width
        constexpr std::array<std::pair<float, float>, layout::CupFrameCount> CupPose{{
            {0.f, 0.f}, {-12.f, -0.04f}, {0.f, 0.f}, {12.f, 0.04f}
        }};
    }

    auto Renderer::Init() -> void
    {
        die_lists_ = glGenLists(static_cast<GLsizei>(core::constants::NumFaces));
        cup_lists_ = glGenLists(layout::CupFrameCount);
        if (!die_lists_ || !cup_lists_)
            YTZ_THROW(core::error::Code::State, "glGenLists failed, is there a current GL context?");

        for (core::FaceT f = 1; f <= core::constants::NumFaces; ++f)
        {
            glNewList(die_lists_ + f - 1, GL_COMPILE);
            BuildDieFace(f);
            glEndList();
        }
        for (int i = 0; i < layout::CupFrameCount; ++i)
        {
            glNewList(cup_lists_ + static_cast<GLuint>(i), GL_COMPILE);
            BuildCupFrame(i);
            glEndList();
        }

        glDisable(GL_DEPTH_TEST);
        glEnable(GL_LINE_SMOOTH);
        glEnable(GL_BLEND);
        glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);
    }

    // Unit square, top-left origin.
    auto Renderer::BuildDieFace(core::FaceT const face) -> void
    {
        SetColor(colors::White);
        glBegin(GL_QUADS);
        glVertex2f(0.f, 0.f);
        glVertex2f(1.f, 0.f);
        glVertex2f(1.f, 1.f);
        glVertex2f(0.f, 1.f);
        glEnd();

        SetColor(colors::Black);
        glLineWidth(2.f);
        glBegin(GL_LINE_LOOP);
        glVertex2f(0.f, 0.f);
        glVertex2f(1.f, 0.f);
        glVertex2f(1.f, 1.f);
        glVertex2f(0.f, 1.f);
        glEnd();

        for (auto const& [col, row] : PipCells(face))
        {
            Disc(0.22f + 0.28f * static_cast<float>(col), 0.22f + 0.28f * static_cast<float>(row), 0.09f, 0.09f);
        }
    }

    // Unit box, top-left origin; the cup pivots around its base.
    auto Renderer::BuildCupFrame(int const frame) -> void
    {
        auto const [tilt, shift] = CupPose[static_cast<size_t>(frame)];

        glPushMatrix();
        glTranslatef(0.5f + shift, 1.f, 0.f);
        glRotatef(tilt, 0.f, 0.f, 1.f);
        glTranslatef(-0.5f, -1.f, 0.f);

        SetColor(colors::CupBody);
        glBegin(GL_QUADS);
        glVertex2f(0.08f, 0.12f);
        glVertex2f(0.92f, 0.12f);
        glVertex2f(0.80f, 1.00f);
        glVertex2f(0.20f, 1.00f);
        glEnd();

        // mouth
        SetColor(colors::CupRim);
        Disc(0.5f, 0.12f, 0.42f, 0.08f);
        SetColor(colors::Black);
        Disc(0.5f, 0.12f, 0.36f, 0.05f);

        // bands
        SetColor(colors::CupRim);
        glLineWidth(3.f);
        glBegin(GL_LINES);
        glVertex2f(0.12f, 0.35f); glVertex2f(0.88f, 0.35f);
        glVertex2f(0.17f, 0.80f); glVertex2f(0.83f, 0.80f);
        glEnd();

        glPopMatrix();
    }

    auto Renderer::BeginFrame(int const width, int const height) -> void
    {
        glViewport(0, 0, width, height);
        glMatrixMode(GL_PROJECTION);
        glLoadIdentity();
        // logical layout is fixed; stretch it over whatever the window is
        glOrtho(0.0, layout::WindowWidth, layout::WindowHeight, 0.0, -1.0, 1.0);
        glMatrixMode(GL_MODELVIEW);
        glLoadIdentity();
    }

    auto Renderer::Clear(Color const c) -> void
    {
        glClearColor(c.r, c.g, c.b, 1.f);
        glClear(GL_COLOR_BUFFER_BIT);
    }

    auto Renderer::FillRect(layout::Rect const r, Color const c) -> void
    {
        SetColor(c);
        glRecti(r.x, r.y, r.x + r.w, r.y + r.h);
    }

    auto Renderer::StrokeRect(layout::Rect const r, Color const c, float const thickness) -> void
    {
        SetColor(c);
        glLineWidth(thickness);
        glBegin(GL_LINE_LOOP);
        glVertex2i(r.x, r.y);
        glVertex2i(r.x + r.w, r.y);
        glVertex2i(r.x + r.w, r.y + r.h);
        glVertex2i(r.x, r.y + r.h);
        glEnd();
    }

    auto Renderer::DashedLine(int const x1, int const x2, int const y, Color const c,
                              float const thickness, int const dash) -> void
    {
        SetColor(c);
        glLineWidth(thickness);
        glBegin(GL_LINES);
        for (int x = x1; x < x2; x += dash * 2)
        {
            glVertex2i(x, y);
            glVertex2i(std::min(x + dash, x2), y);
        }
        glEnd();
    }

    auto Renderer::TextWidth(std::string_view const s, Font const f) const -> int
    {
        int w{};
        for (char const ch : s) w += glutBitmapWidth(GlutFont(f), static_cast<unsigned char>(ch));
        return w;
    }

    auto Renderer::LineHeight(Font const f) const -> int
    {
        return f == Font::Large ? 24 : 18;
    }

    auto Renderer::Text(std::string_view const s, int const x, int const y, Color const c, Font const f) -> void
    {
        SetColor(c);
        // raster position is the baseline
        glRasterPos2i(x, y + LineHeight(f) * 4 / 5);
        for (char const ch : s) glutBitmapCharacter(GlutFont(f), static_cast<unsigned char>(ch));
    }

    auto Renderer::TextCentered(std::string_view const s, int const cx, int const cy, Color const c, Font const f) -> void
    {
        Text(s, cx - TextWidth(s, f) / 2, cy - LineHeight(f) / 2, c, f);
    }

    auto Renderer::Die(core::FaceT const face, layout::Point const center, float const size, bool const kept) -> void
    {
        if (face < 1 || face > core::constants::NumFaces)
            YTZ_THROW(core::error::Code::InvalidDice, "Cannot draw a die without a face in [1,6]");

        float const x = center.x - size / 2.f;
        float const y = center.y - size / 2.f;

        glPushMatrix();
        glTranslatef(x, y, 0.f);
        glScalef(size, size, 1.f);
        glCallList(die_lists_ + face - 1);
        glPopMatrix();

        if (kept)
        {
            StrokeRect({static_cast<int>(x), static_cast<int>(y), static_cast<int>(size), static_cast<int>(size)},
                       colors::Red, static_cast<float>(layout::DieOutline));
        }
    }

    auto Renderer::Cup(layout::Rect const r, int const frame) -> void
    {
        glPushMatrix();
        glTranslatef(static_cast<float>(r.x), static_cast<float>(r.y), 0.f);
        glScalef(static_cast<float>(r.w), static_cast<float>(r.h), 1.f);
        glCallList(cup_lists_ + static_cast<GLuint>(frame % layout::CupFrameCount));
        glPopMatrix();
    }
}
