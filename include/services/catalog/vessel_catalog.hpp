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
 * @file vessel_catalog.hpp
 * @brief Closed set of target branch vessels and their display metadata
 * @details Every Vessel has a canonical short label, a display name and a
 *          display color. The lookup is an exhaustive switch, so adding an
 *          enumerator without metadata is a compile-time warning
 *          (-Wswitch) rather than a runtime miss.
 */

#pragma once

#include "services/render/render_types.hpp"

#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace graft_template::services {

/**
 * @brief Visceral branch vessels a fenestration can be planned for
 */
enum class Vessel {
    CeliacTrunk,
    SuperiorMesenteric,
    RightRenal,
    LeftRenal,
    AccessoryRightRenal,
    AccessoryLeftRenal,
    InferiorMesenteric
};

/**
 * @brief Static display metadata of a vessel
 */
struct VesselInfo {
    std::string_view shortLabel;   ///< e.g. "SMA"
    std::string_view displayName;  ///< e.g. "Superior mesenteric artery"
    RgbColor color;
};

/// All vessels in catalog order (used to populate selection lists)
inline constexpr std::array<Vessel, 7> kAllVessels = {
    Vessel::CeliacTrunk,
    Vessel::SuperiorMesenteric,
    Vessel::RightRenal,
    Vessel::LeftRenal,
    Vessel::AccessoryRightRenal,
    Vessel::AccessoryLeftRenal,
    Vessel::InferiorMesenteric
};

/**
 * @brief True for the enumerators listed in kAllVessels
 */
[[nodiscard]] constexpr bool isKnownVessel(Vessel vessel) noexcept {
    for (auto known : kAllVessels) {
        if (known == vessel) {
            return true;
        }
    }
    return false;
}

/**
 * @brief Metadata lookup
 */
[[nodiscard]] VesselInfo vesselInfo(Vessel vessel) noexcept;

/**
 * @brief Resolve a user-facing key to a vessel
 *
 * Accepts the short label ("RRA") or the display name
 * ("Right renal artery"), case-insensitive, surrounding blanks ignored.
 *
 * @return Vessel, or std::nullopt for an unknown key
 */
[[nodiscard]] std::optional<Vessel> vesselFromKey(std::string_view key);

}  // namespace graft_template::services
