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
 * @file settings_dialog.hpp
 * @brief Preferences for logging and the device catalog file
 * @details Values persist in QSettings under "logging/level",
 *          "logging/fileEnabled" and "catalog/devicesPath". The log level is
 *          applied immediately to both logging backends on accept; the
 *          catalog path is reported to the caller, which reloads devices.
 *
 * ## Thread Safety
 * - All methods must be called from the Qt UI thread
 */

#pragma once

#include "core/app_log_level.hpp"

#include <QDialog>
#include <QString>

#include <memory>

namespace graft_template::ui {

/// QSettings keys shared by the dialog and application startup
namespace settings_keys {
inline constexpr const char* kLogLevel = "logging/level";
inline constexpr const char* kLogFileEnabled = "logging/fileEnabled";
inline constexpr const char* kDevicesPath = "catalog/devicesPath";
}  // namespace settings_keys

class SettingsDialog : public QDialog {
    Q_OBJECT

public:
    explicit SettingsDialog(QWidget* parent = nullptr);
    ~SettingsDialog() override;

    /// Level currently selected in the dialog
    [[nodiscard]] AppLogLevel selectedLogLevel() const;

    /// Catalog file currently entered (empty for built-in devices)
    [[nodiscard]] QString devicesPath() const;

    /**
     * @brief Push @p level to the spdlog loggers and the ecosystem logger
     */
    static void applyLogLevel(AppLogLevel level);

public slots:
    void accept() override;

signals:
    /// Emitted on accept when the catalog path differs from the stored one
    void devicesPathChanged(const QString& path);

private slots:
    void onLogLevelChanged(int index);
    void onBrowseDevices();

private:
    void setupUI();
    void loadSettings();
    void saveSettings();

    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace graft_template::ui
