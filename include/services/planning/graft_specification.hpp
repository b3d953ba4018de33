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
 * @file graft_specification.hpp
 * @brief Immutable tubular graft geometry
 * @details Holds the device diameter and length chosen for a planning
 *          session. The circumference is always derived from the diameter
 *          so the two can never disagree.
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include "services/template_error.hpp"

#include <expected>
#include <string>

namespace graft_template::services {

/**
 * @brief Geometry of the graft a template is planned for
 *
 * Instances are only obtainable through create(), which rejects
 * non-positive or non-finite dimensions. Once created the geometry does not
 * change; switching devices means building a new specification.
 */
class GraftSpecification {
public:
    /**
     * @brief Validate and build a specification
     * @param diameterMm Outer diameter (> 0)
     * @param lengthMm Usable length from proximal to distal end (> 0)
     * @param name Device identifier printed on the template
     * @return Specification or InvalidParameter
     */
    [[nodiscard]] static std::expected<GraftSpecification, TemplateError>
    create(double diameterMm, double lengthMm, std::string name);

    [[nodiscard]] double diameterMm() const noexcept { return diameterMm_; }
    [[nodiscard]] double lengthMm() const noexcept { return lengthMm_; }
    [[nodiscard]] const std::string& name() const noexcept { return name_; }

    /**
     * @brief pi x diameter, recomputed on every call
     */
    [[nodiscard]] double circumferenceMm() const noexcept;

    /**
     * @brief Check a longitudinal position against [0, length]
     */
    [[nodiscard]] bool containsDistance(double distanceMm) const noexcept;

private:
    GraftSpecification(double diameterMm, double lengthMm, std::string name);

    double diameterMm_;
    double lengthMm_;
    std::string name_;
};

}  // namespace graft_template::services
