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

#include "services/geometry/calibration_marker_set.hpp"

#include "services/geometry/cylinder_unwrap_mapper.hpp"
#include "services/planning/fenestration.hpp"

#include <algorithm>
#include <cmath>
#include <format>

namespace graft_template::services {

namespace {

// Tolerance for the last grid line landing exactly on the distal end
constexpr double kGridEpsilonMm = 1e-9;

constexpr double kLabelGapMm = 2.0;
constexpr double kClockLabelOffsetMm = 4.0;

}  // anonymous namespace

double ReferenceBar::lengthMm() const noexcept {
    return std::hypot(end.xMm - start.xMm, end.yMm - start.yMm);
}

CalibrationMarkers CalibrationMarkerSet::generate(const GraftSpecification& graft) {
    const double circumference = graft.circumferenceMm();
    const double length = graft.lengthMm();

    CalibrationMarkers markers;

    for (int step = 0; step * kGridIntervalMm <= length + kGridEpsilonMm; ++step) {
        const double y = step * kGridIntervalMm;
        markers.gridLines.push_back(GridLine{
            y,
            std::format("{:g}", y),
            PlanarPoint(-kLabelGapMm, y)
        });
    }

    for (double offset : kAlignmentOffsetsMm) {
        if (offset <= length) {
            markers.alignmentLinesMm.push_back(offset);
        }
    }

    // Verification bars sit in the side column, clear of the cut outline.
    // One per axis: printers can scale width and height independently.
    const double barX = circumference + 3.0;

    ReferenceBar horizontalBar;
    horizontalBar.start = PlanarPoint(barX, 12.0);
    horizontalBar.end = PlanarPoint(barX + kReferenceBarLengthMm, 12.0);
    horizontalBar.labelPosition = PlanarPoint(barX + kReferenceBarLengthMm / 2.0, 15.5);
    horizontalBar.horizontal = true;
    markers.referenceBars.push_back(horizontalBar);

    ReferenceBar verticalBar;
    verticalBar.start = PlanarPoint(barX + 2.0, 22.0);
    verticalBar.end = PlanarPoint(barX + 2.0, 22.0 + kReferenceBarLengthMm);
    verticalBar.labelPosition = PlanarPoint(barX + 4.0, 22.0 + kReferenceBarLengthMm / 2.0);
    verticalBar.horizontal = false;
    markers.referenceBars.push_back(verticalBar);

    markers.proximalLabel = TemplateLabel{PlanarPoint(barX, 0.0), "PROXIMAL"};
    markers.distalLabel = TemplateLabel{PlanarPoint(barX, length), "DISTAL"};

    for (int hour : kGuideHours) {
        const auto point = CylinderUnwrapMapper::map(
            circumference, length, clockHourToDegrees(hour), 0.0);
        markers.clockGuides.push_back(ClockGuide{
            hour, point.xMm, PlanarPoint(point.xMm, -kClockLabelOffsetMm)
        });
    }
    // The seam: the right edge joins the left edge at 12 o'clock
    markers.clockGuides.push_back(ClockGuide{
        12, circumference, PlanarPoint(circumference, -kClockLabelOffsetMm)
    });

    const double barsBottom = verticalBar.end.yMm;
    markers.bounds = PlanarRect{
        -kLabelColumnMm,
        -kTopBandMm,
        circumference + kSideColumnMm,
        std::max(length, barsBottom) + kBottomBandMm
    };

    return markers;
}

}  // namespace graft_template::services
