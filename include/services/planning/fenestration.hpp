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
 * @file fenestration.hpp
 * @brief Fenestration record and clock-position arithmetic
 * @details A fenestration is a circular opening placed by longitudinal
 *          distance from the proximal end and by clock position, where
 *          12 o'clock is anterior (0 degrees) and each hour adds 30 degrees.
 */

#pragma once

#include "services/catalog/vessel_catalog.hpp"

#include <string>

namespace graft_template::services {

/// Smallest fenestration diameter that can be cut reliably (mm)
inline constexpr double kMinFenestrationDiameterMm = 4.0;

/// Largest fenestration diameter (mm)
inline constexpr double kMaxFenestrationDiameterMm = 12.0;

/// Minimum longitudinal separation between any two fenestrations (mm)
inline constexpr double kMinLongitudinalSpacingMm = 4.0;

inline constexpr double kDegreesPerClockHour = 30.0;

/**
 * @brief A planned opening in the graft wall
 */
struct Fenestration {
    /// Target branch vessel
    Vessel vessel = Vessel::SuperiorMesenteric;

    /// Longitudinal position of the center, measured from the proximal end (mm)
    double distanceFromProximalMm = 0.0;

    /// Clock position 1..12, 12 = anterior
    int clockHour = 12;

    /// Opening diameter (mm)
    double diameterMm = kMinFenestrationDiameterMm;

    /// Angular position derived from clockHour, in [0, 360)
    [[nodiscard]] double clockAngleDegrees() const noexcept;

    [[nodiscard]] double radiusMm() const noexcept { return diameterMm / 2.0; }

    [[nodiscard]] bool operator==(const Fenestration& other) const noexcept {
        return vessel == other.vessel &&
               distanceFromProximalMm == other.distanceFromProximalMm &&
               clockHour == other.clockHour &&
               diameterMm == other.diameterMm;
    }
};

[[nodiscard]] constexpr bool isValidClockHour(int hour) noexcept {
    return hour >= 1 && hour <= 12;
}

/**
 * @brief 12 -> 0 degrees, otherwise hour x 30 degrees
 */
[[nodiscard]] constexpr double clockHourToDegrees(int hour) noexcept {
    return hour == 12 ? 0.0 : hour * kDegreesPerClockHour;
}

/**
 * @brief Annotation printed next to a fenestration marker
 *
 * Format: "Ø6 @ 50 / 12 o'clock" (diameter, distance from proximal,
 * clock hour).
 */
[[nodiscard]] std::string formatAnnotation(const Fenestration& fenestration);

/**
 * @brief One-line description for lists and log messages
 *
 * Format: "SMA Ø6 @ 50 / 12 o'clock".
 */
[[nodiscard]] std::string describe(const Fenestration& fenestration);

}  // namespace graft_template::services
