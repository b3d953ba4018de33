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
 * @file fenestration_registry.hpp
 * @brief Ordered fenestration collection with the longitudinal spacing rule
 * @details Entries keep insertion order and are identified by position.
 *          Additions are validated against the graft geometry and against
 *          every existing entry; removals never need re-validation because
 *          they can only relax the spacing constraint.
 *
 * ## Thread Safety
 * - Not synchronized. A registry belongs to exactly one planning session.
 */

#pragma once

#include "services/planning/fenestration.hpp"
#include "services/planning/graft_specification.hpp"
#include "services/template_error.hpp"

#include <cstddef>
#include <expected>
#include <optional>
#include <vector>

namespace graft_template::services {

/**
 * @brief Check a fenestration's own parameters against a graft
 *
 * Rejects a clock hour outside 1..12, a distance outside [0, length] and a
 * diameter outside [4, 12] mm.
 */
[[nodiscard]] std::expected<void, TemplateError>
validateFenestration(const Fenestration& fenestration, const GraftSpecification& graft);

class FenestrationRegistry {
public:
    FenestrationRegistry() = default;

    /**
     * @brief Append a fenestration
     *
     * The registry is left untouched when the request is rejected.
     *
     * @param fenestration Candidate entry
     * @param graft Graft the layout belongs to (bounds the distance)
     * @return Index of the new entry, InvalidParameter or SpacingConflict
     */
    [[nodiscard]] std::expected<std::size_t, TemplateError>
    add(const Fenestration& fenestration, const GraftSpecification& graft);

    /**
     * @brief Remove the entry at @p index, shifting later entries down
     * @return The removed entry, or IndexOutOfRange
     */
    [[nodiscard]] std::expected<Fenestration, TemplateError> remove(std::size_t index);

    void clear() noexcept;

    /**
     * @brief First existing entry closer than the minimum spacing
     * @param distanceMm Candidate longitudinal position
     * @return Index of the conflicting entry, if any
     */
    [[nodiscard]] std::optional<std::size_t> findSpacingConflict(double distanceMm) const;

    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

    /// @pre index < size()
    [[nodiscard]] const Fenestration& at(std::size_t index) const { return entries_.at(index); }

    [[nodiscard]] const std::vector<Fenestration>& entries() const noexcept { return entries_; }

private:
    std::vector<Fenestration> entries_;
};

}  // namespace graft_template::services
