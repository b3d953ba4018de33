// BSD 3-Clause License
//
// Copyright (c) 2021-2025, 🍀☀🌕🌥 🌊
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are met:
//
// 1. Redistributions of source code must retain the above copyright notice, this
//    list of conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright notice,
//    this list of conditions and the following disclaimer in the documentation
//    and/or other materials provided with the distribution.
//
// 3. Neither the name of the copyright holder nor the names of its
//    contributors may be used to endorse or promote products derived from
//    this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
// AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
// IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
// DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE
// FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
// DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR
// SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER
// CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY,
// OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
// OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

/**
 * @file render_types.hpp
 * @brief Colors and stroke/fill/text styles for drawing-surface primitives
 * @details Styles carry sizes in the units of the surface they are issued
 *          to: pixels for the interactive preview, millimeters for the
 *          fixed-scale document.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace graft_template::services {

/**
 * @brief 8-bit RGBA color
 */
struct RgbColor {
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;
    std::uint8_t a = 255;

    RgbColor() = default;
    constexpr RgbColor(std::uint8_t red, std::uint8_t green, std::uint8_t blue,
                       std::uint8_t alpha = 255)
        : r(red), g(green), b(blue), a(alpha) {}

    /// Same color with a different alpha
    [[nodiscard]] constexpr RgbColor withAlpha(std::uint8_t alpha) const {
        return RgbColor(r, g, b, alpha);
    }

    /// "#rrggbb" (alpha is not encoded)
    [[nodiscard]] std::string toHex() const;

    [[nodiscard]] bool operator==(const RgbColor& other) const noexcept {
        return r == other.r && g == other.g && b == other.b && a == other.a;
    }
};

namespace colors {
inline constexpr RgbColor Black{0, 0, 0};
inline constexpr RgbColor White{255, 255, 255};
inline constexpr RgbColor Grid{170, 170, 170};
inline constexpr RgbColor Gold{212, 160, 23};
inline constexpr RgbColor ClockGuide{40, 90, 200};
inline constexpr RgbColor Canvas{236, 236, 236};
inline constexpr RgbColor Notice{190, 30, 30};
}  // namespace colors

struct LineStyle {
    RgbColor color = colors::Black;
    double width = 1.0;
    bool dashed = false;
};

/**
 * @brief Stroke and optional fill for closed shapes (circles, rectangles)
 */
struct ShapeStyle {
    LineStyle stroke;
    std::optional<RgbColor> fill;
};

enum class TextAlign {
    Left,    ///< Position is the left edge, vertically centered
    Center,  ///< Position is the text center
    Right    ///< Position is the right edge, vertically centered
};

struct TextStyle {
    RgbColor color = colors::Black;
    /// Cap-to-descender height of the font in surface units
    double height = 12.0;
    TextAlign align = TextAlign::Left;
    bool bold = false;
};

}  // namespace graft_template::services
