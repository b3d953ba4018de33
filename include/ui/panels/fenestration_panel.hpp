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
 * @file fenestration_panel.hpp
 * @brief Device selection and fenestration entry/list panel
 * @details Collects the device and fenestration parameters from the user and
 *          turns button presses into request signals. The panel holds no
 *          model state of its own: the owner validates each request through
 *          TemplatePlanner and pushes the resulting layout back with
 *          setFenestrations() or the rejection with showError().
 *
 * ## Thread Safety
 * - All methods must be called from the Qt UI thread (QWidget-derived)
 */
#pragma once

#include "services/planning/fenestration_registry.hpp"
#include "services/planning/template_planner.hpp"

#include <memory>

#include <QString>
#include <QStringList>
#include <QWidget>

namespace graft_template::ui {

class FenestrationPanel : public QWidget {
    Q_OBJECT

public:
    explicit FenestrationPanel(QWidget* parent = nullptr);
    ~FenestrationPanel() override;

    /**
     * @brief Fill the device selector
     * @param labels Catalog labels in display order
     * @param current Label to select (first entry when not found)
     */
    void setDevices(const QStringList& labels, const QString& current);

    [[nodiscard]] QString currentDevice() const;

    /**
     * @brief Show the graft the layout is planned on ("Ø24 x 145 mm, C 75.4 mm")
     */
    void setGraftSummary(const services::GraftSpecification& graft);

    /**
     * @brief Replace the listed fenestrations with the registry contents
     */
    void setFenestrations(const services::FenestrationRegistry& registry);

    [[nodiscard]] int fenestrationCount() const;

    /**
     * @brief Request built from the current input fields
     */
    [[nodiscard]] services::FenestrationRequest currentRequest() const;

    /**
     * @brief Preset the input fields (used by tests and to re-edit)
     */
    void setRequest(const services::FenestrationRequest& request);

    /**
     * @brief Set the upper limit of the distance field to the graft length
     */
    void setMaximumDistance(double lengthMm);

    /**
     * @brief Highlight a list row
     */
    void selectFenestration(int index);

    [[nodiscard]] int selectedFenestration() const;

    void showError(const QString& message);
    void clearError();
    [[nodiscard]] QString errorText() const;

signals:
    /// User picked another device
    void deviceSelected(const QString& label);

    /// User clicked "Add Fenestration"; read currentRequest()
    void addRequested();

    /// User asked to delete the fenestration at @p index
    void removeRequested(int index);

    /// User clicked "Clear All"
    void clearRequested();

    /// User clicked "Export Template"
    void exportRequested();

private:
    void setupUI();
    void connectSignals();
    void updateButtons();

    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace graft_template::ui
