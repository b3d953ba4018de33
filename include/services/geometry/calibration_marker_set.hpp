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
 * @file calibration_marker_set.hpp
 * @brief Reference artifacts drawn on every template
 * @details Generates, for one graft, the longitudinal grid, the gold
 *          alignment lines at device landmarks, the 10 mm verification bars,
 *          the proximal/distal end labels and the clock-position guides.
 *          All positions are template millimeters; renderers transform them
 *          exactly like fenestration centers.
 *
 * If a printed 10 mm bar does not measure 10 mm the whole template is
 * invalid and must be printed again at 100 % scale.
 */

#pragma once

#include "services/geometry/geometry_types.hpp"
#include "services/planning/graft_specification.hpp"

#include <array>
#include <string>
#include <vector>

namespace graft_template::services {

/**
 * @brief Horizontal grid line across the template at a fixed distance
 */
struct GridLine {
    double yMm = 0.0;
    std::string label;         ///< Distance value, e.g. "45"
    PlanarPoint labelPosition; ///< Right-aligned, left of the outline
};

/**
 * @brief Verification bar of known physical length
 */
struct ReferenceBar {
    PlanarPoint start;
    PlanarPoint end;
    PlanarPoint labelPosition;
    std::string label = "10 mm";
    bool horizontal = true;

    [[nodiscard]] double lengthMm() const noexcept;
};

/**
 * @brief Text anchored to a template position
 */
struct TemplateLabel {
    PlanarPoint position;
    std::string text;
};

/**
 * @brief Vertical guide at a clock position, labeled above the outline
 */
struct ClockGuide {
    int hour = 12;
    double xMm = 0.0;
    PlanarPoint labelPosition;
};

/**
 * @brief Everything CalibrationMarkerSet generates for one graft
 */
struct CalibrationMarkers {
    std::vector<GridLine> gridLines;
    std::vector<double> alignmentLinesMm;
    std::vector<ReferenceBar> referenceBars;
    TemplateLabel proximalLabel;
    TemplateLabel distalLabel;
    std::vector<ClockGuide> clockGuides;

    /// Extent of outline plus all markers and their labels
    PlanarRect bounds;
};

class CalibrationMarkerSet {
public:
    /// Spacing of the longitudinal grid
    static constexpr double kGridIntervalMm = 15.0;

    /// Device landmark offsets from the proximal end
    static constexpr std::array<double, 4> kAlignmentOffsetsMm = {30.0, 60.0, 90.0, 120.0};

    static constexpr double kReferenceBarLengthMm = 10.0;

    /// Clock positions that receive a guide line
    static constexpr std::array<int, 4> kGuideHours = {12, 3, 6, 9};

    // Layout of the annotation bands around the outline
    static constexpr double kLabelColumnMm = 12.0;
    static constexpr double kSideColumnMm = 30.0;
    static constexpr double kTopBandMm = 10.0;
    static constexpr double kBottomBandMm = 8.0;

    /**
     * @brief Generate the markers for a graft
     *
     * Deterministic: the same graft always yields the same markers.
     */
    [[nodiscard]] static CalibrationMarkers generate(const GraftSpecification& graft);
};

}  // namespace graft_template::services
