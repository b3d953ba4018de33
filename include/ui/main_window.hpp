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
 * @file main_window.hpp
 * @brief Main application window for planning a fenestration template
 * @details Owns the planning session and the TemplatePlanner, routes panel
 *          requests through the planner and refreshes the preview after
 *          every accepted mutation. Export writes the artifact returned by
 *          the planner to a file the user picks.
 *
 * ## Thread Safety
 * - All methods must be called from the Qt UI thread (QMainWindow-derived)
 *
 * @author kcenon
 * @since 1.0.0
 */
#pragma once

#include "services/catalog/device_catalog.hpp"
#include "services/planning/planning_session.hpp"
#include "services/template_error.hpp"

#include <expected>
#include <memory>

#include <QMainWindow>
#include <QString>

namespace graft_template::ui {

class FenestrationPanel;
class TemplatePreviewWidget;

class MainWindow : public QMainWindow {
    Q_OBJECT

public:
    /**
     * @param catalog Devices offered in the selector; the first one opens the session
     */
    explicit MainWindow(services::DeviceCatalog catalog = services::DeviceCatalog::builtin(),
                        QWidget* parent = nullptr);
    ~MainWindow() override;

    // Non-copyable
    MainWindow(const MainWindow&) = delete;
    MainWindow& operator=(const MainWindow&) = delete;

    /// Current session (nullptr when the catalog could not open one)
    [[nodiscard]] const services::PlanningSession* session() const;

    [[nodiscard]] FenestrationPanel* fenestrationPanel() const;
    [[nodiscard]] TemplatePreviewWidget* previewWidget() const;

    /**
     * @brief Export the template and write it to @p filePath
     */
    [[nodiscard]] std::expected<void, services::TemplateError>
    saveTemplate(const QString& filePath);

public slots:
    void onDeviceSelected(const QString& label);
    void onAddFenestration();
    void onRemoveFenestration(int index);
    void onClearFenestrations();
    void onExportTemplate();
    void onShowSettings();
    void onShowAbout();

    /**
     * @brief Replace the device catalog from a JSON file
     *
     * An empty path restores the built-in devices. On failure the current
     * catalog and session are kept.
     */
    void onLoadDeviceCatalog(const QString& path);

protected:
    /**
     * @brief Ask before a device change drops the planned layout
     * @return true to proceed
     */
    virtual bool confirmDiscardLayout(const QString& title, int fenestrationCount);

private:
    void setupMenuBar();
    void setupLayout();
    void setupConnections();
    void openSession(const QString& deviceLabel);
    void syncViews();

    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace graft_template::ui
