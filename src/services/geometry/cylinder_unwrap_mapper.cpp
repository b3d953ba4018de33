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

#include "services/geometry/cylinder_unwrap_mapper.hpp"

#include <cmath>

namespace graft_template::services {

double CylinderUnwrapMapper::normalizeDegrees(double degrees) noexcept {
    double normalized = std::fmod(degrees, 360.0);
    if (normalized < 0.0) {
        normalized += 360.0;
    }
    // fmod of a tiny negative value can round back up to exactly 360
    if (normalized >= 360.0) {
        normalized = 0.0;
    }
    return normalized;
}

int CylinderUnwrapMapper::clockHourFromAngle(double degrees) noexcept {
    const int hour = static_cast<int>(std::lround(normalizeDegrees(degrees) / kDegreesPerClockHour)) % 12;
    return hour == 0 ? 12 : hour;
}

double CylinderUnwrapMapper::angleFromX(double circumferenceMm, double xMm) noexcept {
    if (circumferenceMm <= 0.0) {
        return 0.0;
    }
    return normalizeDegrees(xMm / circumferenceMm * 360.0);
}

PlanarPoint CylinderUnwrapMapper::map(double circumferenceMm,
                                      double /*lengthMm*/,
                                      double clockAngleDegrees,
                                      double distanceFromProximalMm) noexcept {
    const double angle = normalizeDegrees(clockAngleDegrees);
    return {(angle / 360.0) * circumferenceMm, distanceFromProximalMm};
}

PlanarPoint CylinderUnwrapMapper::map(const GraftSpecification& graft,
                                      const Fenestration& fenestration) noexcept {
    return map(graft.circumferenceMm(), graft.lengthMm(),
               fenestration.clockAngleDegrees(),
               fenestration.distanceFromProximalMm);
}

}  // namespace graft_template::services
