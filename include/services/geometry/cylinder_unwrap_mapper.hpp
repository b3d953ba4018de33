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
 * @file cylinder_unwrap_mapper.hpp
 * @brief Cylinder surface (clock angle, distance) to flat template mapping
 * @details The circumferential axis is unrolled linearly:
 *          x = (angle / 360) x circumference, y = distance from proximal.
 *          Both the preview and the printable document place every
 *          fenestration through this mapping, and only apply their own
 *          SurfaceTransform afterwards.
 *
 * ## Thread Safety
 * - Stateless and pure; safe from any thread
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include "services/geometry/geometry_types.hpp"
#include "services/planning/fenestration.hpp"
#include "services/planning/graft_specification.hpp"

namespace graft_template::services {

class CylinderUnwrapMapper {
public:
    /**
     * @brief Map a cylinder surface position to the template plane
     *
     * The angle is normalized into [0, 360) first, so 0 and 360 degrees map
     * to the same x and x always lies in [0, circumference).
     *
     * @param circumferenceMm Unrolled width of the template
     * @param lengthMm Template height; y is not clamped against it
     * @param clockAngleDegrees Angle from 12 o'clock, clockwise
     * @param distanceFromProximalMm Longitudinal position
     * @return Planar position in millimeters
     */
    [[nodiscard]] static PlanarPoint map(double circumferenceMm,
                                         double lengthMm,
                                         double clockAngleDegrees,
                                         double distanceFromProximalMm) noexcept;

    /**
     * @brief Map a fenestration center on a given graft
     */
    [[nodiscard]] static PlanarPoint map(const GraftSpecification& graft,
                                         const Fenestration& fenestration) noexcept;

    /**
     * @brief Normalize an angle into [0, 360)
     */
    [[nodiscard]] static double normalizeDegrees(double degrees) noexcept;

    /**
     * @brief Nearest clock hour for an angle from 12 o'clock
     * @return 1..12, with 0 degrees (and anything rounding to it) as 12
     */
    [[nodiscard]] static int clockHourFromAngle(double degrees) noexcept;

    /**
     * @brief Inverse of map() on the circumferential axis
     * @return Angle from 12 o'clock in [0, 360)
     */
    [[nodiscard]] static double angleFromX(double circumferenceMm, double xMm) noexcept;
};

}  // namespace graft_template::services
