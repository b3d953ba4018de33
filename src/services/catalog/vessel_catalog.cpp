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

#include "services/catalog/vessel_catalog.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace graft_template::services {

namespace {

std::string normalizeKey(std::string_view key) {
    auto first = key.find_first_not_of(" \t");
    if (first == std::string_view::npos) {
        return {};
    }
    auto last = key.find_last_not_of(" \t");
    std::string result(key.substr(first, last - first + 1));
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

}  // anonymous namespace

VesselInfo vesselInfo(Vessel vessel) noexcept {
    switch (vessel) {
        case Vessel::CeliacTrunk:
            return {"CT", "Celiac trunk", RgbColor(46, 139, 87)};
        case Vessel::SuperiorMesenteric:
            return {"SMA", "Superior mesenteric artery", RgbColor(220, 20, 60)};
        case Vessel::RightRenal:
            return {"RRA", "Right renal artery", RgbColor(30, 144, 255)};
        case Vessel::LeftRenal:
            return {"LRA", "Left renal artery", RgbColor(255, 140, 0)};
        case Vessel::AccessoryRightRenal:
            return {"ARRA", "Accessory right renal artery", RgbColor(106, 90, 205)};
        case Vessel::AccessoryLeftRenal:
            return {"ALRA", "Accessory left renal artery", RgbColor(199, 21, 133)};
        case Vessel::InferiorMesenteric:
            return {"IMA", "Inferior mesenteric artery", RgbColor(139, 69, 19)};
    }
    return {"?", "Unknown vessel", colors::Black};
}

std::optional<Vessel> vesselFromKey(std::string_view key) {
    const auto normalized = normalizeKey(key);
    if (normalized.empty()) {
        return std::nullopt;
    }

    for (Vessel vessel : kAllVessels) {
        const auto info = vesselInfo(vessel);
        if (normalized == normalizeKey(info.shortLabel) ||
            normalized == normalizeKey(info.displayName)) {
            return vessel;
        }
    }
    return std::nullopt;
}

}  // namespace graft_template::services
