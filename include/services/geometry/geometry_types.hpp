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
 * @file geometry_types.hpp
 * @brief Planar template coordinates and the surface transform
 * @details PlanarPoint is a position on the unwrapped graft in millimeters
 *          (x around the circumference, y from the proximal end).
 *          SurfacePoint is a position on a drawing surface in that
 *          surface's own units. SurfaceTransform is the only way to go from
 *          one to the other.
 */

#pragma once

namespace graft_template::services {

/**
 * @brief Point on the unwrapped template (mm)
 */
struct PlanarPoint {
    double xMm = 0.0;
    double yMm = 0.0;

    PlanarPoint() = default;
    PlanarPoint(double x, double y) : xMm(x), yMm(y) {}

    [[nodiscard]] bool operator==(const PlanarPoint& other) const noexcept {
        return xMm == other.xMm && yMm == other.yMm;
    }
};

/**
 * @brief Point on a drawing surface (surface units)
 */
struct SurfacePoint {
    double x = 0.0;
    double y = 0.0;

    SurfacePoint() = default;
    SurfacePoint(double px, double py) : x(px), y(py) {}

    [[nodiscard]] bool operator==(const SurfacePoint& other) const noexcept {
        return x == other.x && y == other.y;
    }
};

/**
 * @brief Axis-aligned rectangle on the template (mm)
 */
struct PlanarRect {
    double minXMm = 0.0;
    double minYMm = 0.0;
    double maxXMm = 0.0;
    double maxYMm = 0.0;

    [[nodiscard]] double widthMm() const noexcept { return maxXMm - minXMm; }
    [[nodiscard]] double heightMm() const noexcept { return maxYMm - minYMm; }
};

/**
 * @brief Uniform scale plus origin offset from template mm to surface units
 *
 * The scale is the same on both axes so relative placements (x / C,
 * y / L) are identical on every surface.
 */
struct SurfaceTransform {
    /// Surface units per millimeter
    double unitsPerMm = 1.0;
    /// Surface position of the template origin (proximal end, 12 o'clock)
    double originX = 0.0;
    double originY = 0.0;

    [[nodiscard]] SurfacePoint apply(const PlanarPoint& point) const noexcept {
        return {originX + point.xMm * unitsPerMm, originY + point.yMm * unitsPerMm};
    }

    [[nodiscard]] double length(double mm) const noexcept {
        return mm * unitsPerMm;
    }

    /**
     * @brief Inverse of apply()
     */
    [[nodiscard]] PlanarPoint invert(const SurfacePoint& point) const noexcept {
        return {(point.x - originX) / unitsPerMm, (point.y - originY) / unitsPerMm};
    }
};

}  // namespace graft_template::services
