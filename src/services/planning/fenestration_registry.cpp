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

#include "services/planning/fenestration_registry.hpp"

#include "core/logging.hpp"

#include <cmath>
#include <format>

namespace graft_template::services {

namespace {

auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("FenestrationRegistry");
    return logger;
}

// Distances entered at 0.1 mm resolution do not subtract exactly
constexpr double kSpacingToleranceMm = 1e-9;

}  // anonymous namespace

std::expected<void, TemplateError>
validateFenestration(const Fenestration& fenestration, const GraftSpecification& graft) {
    if (!isKnownVessel(fenestration.vessel)) {
        return std::unexpected(TemplateError{
            TemplateError::Code::InvalidParameter,
            std::format("unknown vessel (value {})", static_cast<int>(fenestration.vessel))
        });
    }

    if (!isValidClockHour(fenestration.clockHour)) {
        return std::unexpected(TemplateError{
            TemplateError::Code::InvalidParameter,
            std::format("clock hour must be 1..12, got {}", fenestration.clockHour)
        });
    }

    if (!graft.containsDistance(fenestration.distanceFromProximalMm)) {
        return std::unexpected(TemplateError{
            TemplateError::Code::InvalidParameter,
            std::format("distance {:g} mm is outside the graft (0 - {:g} mm)",
                        fenestration.distanceFromProximalMm, graft.lengthMm())
        });
    }

    if (!std::isfinite(fenestration.diameterMm) ||
        fenestration.diameterMm < kMinFenestrationDiameterMm ||
        fenestration.diameterMm > kMaxFenestrationDiameterMm) {
        return std::unexpected(TemplateError{
            TemplateError::Code::InvalidParameter,
            std::format("fenestration diameter {:g} mm is outside {:g} - {:g} mm",
                        fenestration.diameterMm,
                        kMinFenestrationDiameterMm, kMaxFenestrationDiameterMm)
        });
    }

    return {};
}

std::expected<std::size_t, TemplateError>
FenestrationRegistry::add(const Fenestration& fenestration, const GraftSpecification& graft) {
    auto valid = validateFenestration(fenestration, graft);
    if (!valid) {
        getLogger()->warn("Rejected {}: {}", describe(fenestration), valid.error().message);
        return std::unexpected(valid.error());
    }

    if (auto conflictIndex = findSpacingConflict(fenestration.distanceFromProximalMm)) {
        const auto& existing = entries_[*conflictIndex];
        TemplateError error{
            TemplateError::Code::SpacingConflict,
            std::format("{} is {:g} mm from F{} ({}), minimum spacing is {:g} mm",
                        describe(fenestration),
                        std::abs(fenestration.distanceFromProximalMm -
                                 existing.distanceFromProximalMm),
                        *conflictIndex + 1, describe(existing),
                        kMinLongitudinalSpacingMm)
        };
        error.conflict = ConflictingEntry{*conflictIndex, existing};
        getLogger()->warn("Rejected: {}", error.message);
        return std::unexpected(error);
    }

    entries_.push_back(fenestration);
    getLogger()->debug("Added F{}: {}", entries_.size(), describe(fenestration));
    return entries_.size() - 1;
}

std::expected<Fenestration, TemplateError> FenestrationRegistry::remove(std::size_t index) {
    if (index >= entries_.size()) {
        return std::unexpected(TemplateError{
            TemplateError::Code::IndexOutOfRange,
            std::format("no fenestration at index {} (registry holds {})",
                        index, entries_.size())
        });
    }

    Fenestration removed = entries_[index];
    entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(index));
    getLogger()->debug("Removed F{}: {}", index + 1, describe(removed));
    return removed;
}

void FenestrationRegistry::clear() noexcept {
    entries_.clear();
}

std::optional<std::size_t> FenestrationRegistry::findSpacingConflict(double distanceMm) const {
    for (std::size_t i = 0; i < entries_.size(); ++i) {
        if (std::abs(distanceMm - entries_[i].distanceFromProximalMm) <
            kMinLongitudinalSpacingMm - kSpacingToleranceMm) {
            return i;
        }
    }
    return std::nullopt;
}

}  // namespace graft_template::services
