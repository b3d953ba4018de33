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

#include "services/planning/graft_specification.hpp"

#include <cmath>
#include <format>
#include <numbers>
#include <utility>

namespace graft_template::services {

GraftSpecification::GraftSpecification(double diameterMm, double lengthMm,
                                       std::string name)
    : diameterMm_(diameterMm)
    , lengthMm_(lengthMm)
    , name_(std::move(name))
{
}

std::expected<GraftSpecification, TemplateError>
GraftSpecification::create(double diameterMm, double lengthMm, std::string name) {
    if (!std::isfinite(diameterMm) || diameterMm <= 0.0) {
        return std::unexpected(TemplateError{
            TemplateError::Code::InvalidParameter,
            std::format("graft diameter must be positive, got {} mm", diameterMm)
        });
    }
    if (!std::isfinite(lengthMm) || lengthMm <= 0.0) {
        return std::unexpected(TemplateError{
            TemplateError::Code::InvalidParameter,
            std::format("graft length must be positive, got {} mm", lengthMm)
        });
    }
    return GraftSpecification(diameterMm, lengthMm, std::move(name));
}

double GraftSpecification::circumferenceMm() const noexcept {
    return std::numbers::pi * diameterMm_;
}

bool GraftSpecification::containsDistance(double distanceMm) const noexcept {
    return std::isfinite(distanceMm) && distanceMm >= 0.0 && distanceMm <= lengthMm_;
}

}  // namespace graft_template::services
