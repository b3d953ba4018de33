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

#include "services/catalog/device_catalog.hpp"

#include "core/logging.hpp"

#include <QFile>
#include <QTextStream>

#include <nlohmann/json.hpp>

#include <format>

namespace graft_template::services {

using json = nlohmann::json;

namespace {

auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("DeviceCatalog");
    return logger;
}

DeviceEntry jsonToDevice(const json& j) {
    DeviceEntry entry;
    entry.label = j.value("label", "");
    entry.name = j.value("name", entry.label);
    entry.diameterMm = j.value("diameterMm", 0.0);
    entry.lengthMm = j.value("lengthMm", 0.0);
    return entry;
}

}  // anonymous namespace

std::expected<GraftSpecification, TemplateError> DeviceEntry::toSpecification() const {
    return GraftSpecification::create(diameterMm, lengthMm, name);
}

DeviceCatalog DeviceCatalog::builtin() {
    DeviceCatalog catalog;
    catalog.devices_ = {
        {"Tube 20 x 120 mm", "TUBE-20-120", 20.0, 120.0},
        {"Tube 24 x 145 mm", "TUBE-24-145", 24.0, 145.0},
        {"Tube 28 x 120 mm", "TUBE-28-120", 28.0, 120.0},
        {"Tube 28 x 160 mm", "TUBE-28-160", 28.0, 160.0},
        {"Tube 32 x 160 mm", "TUBE-32-160", 32.0, 160.0},
        {"Tube 36 x 200 mm", "TUBE-36-200", 36.0, 200.0}
    };
    return catalog;
}

std::expected<DeviceCatalog, TemplateError> DeviceCatalog::fromJson(const json& root) {
    if (!root.is_object() || !root.contains("devices") || !root["devices"].is_array()) {
        return std::unexpected(TemplateError{
            TemplateError::Code::InvalidParameter,
            "device catalog must be an object with a \"devices\" array"
        });
    }

    DeviceCatalog catalog;
    std::size_t position = 0;
    for (const auto& item : root["devices"]) {
        ++position;
        if (!item.is_object()) {
            return std::unexpected(TemplateError{
                TemplateError::Code::InvalidParameter,
                std::format("device #{} is not an object", position)
            });
        }

        DeviceEntry entry;
        try {
            entry = jsonToDevice(item);
        } catch (const json::type_error& e) {
            return std::unexpected(TemplateError{
                TemplateError::Code::InvalidParameter,
                std::format("device #{}: {}", position, e.what())
            });
        }

        auto added = catalog.addDevice(entry);
        if (!added) {
            return std::unexpected(TemplateError{
                TemplateError::Code::InvalidParameter,
                std::format("device #{}: {}", position, added.error().message)
            });
        }
    }

    if (catalog.empty()) {
        return std::unexpected(TemplateError{
            TemplateError::Code::InvalidParameter,
            "device catalog contains no devices"
        });
    }

    return catalog;
}

std::expected<DeviceCatalog, TemplateError>
DeviceCatalog::loadFromFile(const std::filesystem::path& filePath) {
    QFile file(QString::fromStdString(filePath.string()));
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        return std::unexpected(TemplateError{
            TemplateError::Code::FileCreationFailed,
            "Cannot open device catalog for reading: " + filePath.string()
        });
    }

    QTextStream stream(&file);
    stream.setEncoding(QStringConverter::Utf8);
    QString content = stream.readAll();
    file.close();

    json root;
    try {
        root = json::parse(content.toStdString());
    } catch (const json::parse_error& e) {
        return std::unexpected(TemplateError{
            TemplateError::Code::InvalidParameter,
            std::string("JSON parse error: ") + e.what()
        });
    }

    auto catalog = fromJson(root);
    if (catalog) {
        getLogger()->info("Loaded {} devices from {}", catalog->size(), filePath.string());
    }
    return catalog;
}

std::expected<void, TemplateError> DeviceCatalog::addDevice(const DeviceEntry& entry) {
    if (entry.label.empty()) {
        return std::unexpected(TemplateError{
            TemplateError::Code::InvalidParameter,
            "device label must not be empty"
        });
    }
    if (find(entry.label)) {
        return std::unexpected(TemplateError{
            TemplateError::Code::InvalidParameter,
            "duplicate device label: " + entry.label
        });
    }

    auto spec = entry.toSpecification();
    if (!spec) {
        return std::unexpected(spec.error());
    }

    devices_.push_back(entry);
    return {};
}

std::optional<DeviceEntry> DeviceCatalog::find(const std::string& label) const {
    for (const auto& device : devices_) {
        if (device.label == label) {
            return device;
        }
    }
    return std::nullopt;
}

std::vector<std::string> DeviceCatalog::labels() const {
    std::vector<std::string> result;
    result.reserve(devices_.size());
    for (const auto& device : devices_) {
        result.push_back(device.label);
    }
    return result;
}

}  // namespace graft_template::services
