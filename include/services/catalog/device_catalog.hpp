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
 * @file device_catalog.hpp
 * @brief Graft device table: display label to diameter, length and name
 * @details The catalog ships with a built-in set of straight tube grafts and
 *          can be replaced by a JSON file so new devices are a
 *          configuration change:
 *
 * @code
 * {
 *   "version": "1.0.0",
 *   "devices": [
 *     { "label": "Tube 24 x 145", "name": "TUBE-24-145",
 *       "diameterMm": 24, "lengthMm": 145 }
 *   ]
 * }
 * @endcode
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include "services/planning/graft_specification.hpp"
#include "services/template_error.hpp"

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace graft_template::services {

/**
 * @brief One selectable device
 */
struct DeviceEntry {
    /// Human-readable label shown in the device selector (unique)
    std::string label;

    /// Device identifier printed on the template
    std::string name;

    double diameterMm = 0.0;
    double lengthMm = 0.0;

    /**
     * @brief Build the session geometry for this device
     */
    [[nodiscard]] std::expected<GraftSpecification, TemplateError> toSpecification() const;
};

class DeviceCatalog {
public:
    DeviceCatalog() = default;

    /**
     * @brief Built-in tube grafts (diameters 20 to 36 mm)
     */
    [[nodiscard]] static DeviceCatalog builtin();

    /**
     * @brief Build a catalog from a parsed JSON document
     * @return Catalog, or InvalidParameter describing the first bad entry
     */
    [[nodiscard]] static std::expected<DeviceCatalog, TemplateError>
    fromJson(const nlohmann::json& root);

    /**
     * @brief Read and parse a catalog file
     * @return Catalog, FileCreationFailed if unreadable, InvalidParameter if malformed
     */
    [[nodiscard]] static std::expected<DeviceCatalog, TemplateError>
    loadFromFile(const std::filesystem::path& filePath);

    /**
     * @brief Add a device
     * @return InvalidParameter for an empty/duplicate label or bad dimensions
     */
    [[nodiscard]] std::expected<void, TemplateError> addDevice(const DeviceEntry& entry);

    [[nodiscard]] std::optional<DeviceEntry> find(const std::string& label) const;

    [[nodiscard]] std::vector<std::string> labels() const;

    [[nodiscard]] const std::vector<DeviceEntry>& devices() const noexcept { return devices_; }

    [[nodiscard]] std::size_t size() const noexcept { return devices_.size(); }
    [[nodiscard]] bool empty() const noexcept { return devices_.empty(); }

private:
    std::vector<DeviceEntry> devices_;
};

}  // namespace graft_template::services
