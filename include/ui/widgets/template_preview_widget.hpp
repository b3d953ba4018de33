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
 * @file template_preview_widget.hpp
 * @brief Live on-screen preview of the unwrapped fenestration template
 * @details Paints the current planning session through PreviewRenderer on
 *          every paint event, so the preview always reflects the last
 *          accepted mutation. Shows a placeholder when nothing is planned.
 *          Clicking a fenestration disc reports its index.
 *
 * ## Thread Safety
 * - All methods must be called from the Qt UI thread (QWidget-derived)
 *
 * @author kcenon
 * @since 1.0.0
 */
#pragma once

#include "services/planning/planning_session.hpp"
#include "services/planning/template_planner.hpp"
#include "services/render/preview_renderer.hpp"

#include <memory>
#include <optional>

#include <QImage>
#include <QString>
#include <QWidget>

namespace graft_template::ui {

class TemplatePreviewWidget : public QWidget {
    Q_OBJECT

public:
    explicit TemplatePreviewWidget(QWidget* parent = nullptr);
    ~TemplatePreviewWidget() override;

    // Non-copyable
    TemplatePreviewWidget(const TemplatePreviewWidget&) = delete;
    TemplatePreviewWidget& operator=(const TemplatePreviewWidget&) = delete;

    /**
     * @brief Attach the model to preview
     * @param planner Planner used for rendering; must outlive the widget or be detached
     * @param session Session to draw; nullptr detaches
     */
    void setSession(const services::TemplatePlanner* planner,
                    const services::PlanningSession* session);

    /**
     * @brief Schedule a repaint after the model changed
     */
    void refresh();

    /**
     * @brief Outcome of the most recent paint (nullopt before the first one)
     */
    [[nodiscard]] std::optional<services::PreviewResult> lastResult() const;

    /**
     * @brief Text shown instead of the template when nothing is planned
     */
    [[nodiscard]] QString placeholderText() const;
    void setPlaceholderText(const QString& text);

    /**
     * @brief Render the preview offscreen at the widget's current size
     */
    [[nodiscard]] QImage previewImage();

    /**
     * @brief Registry index of the fenestration under a widget position
     * @return Index, or -1 when no disc contains the point
     */
    [[nodiscard]] int fenestrationAt(const QPointF& position) const;

    /**
     * @brief Template position under a widget point ("3 o'clock, 54.0 mm")
     * @return Empty string outside the unwrapped outline or without a layout
     */
    [[nodiscard]] QString positionLabel(const QPointF& position) const;

signals:
    /// Emitted when the user clicks on a fenestration disc
    void fenestrationClicked(int index);

protected:
    void paintEvent(QPaintEvent* event) override;
    void mousePressEvent(QMouseEvent* event) override;
    void mouseMoveEvent(QMouseEvent* event) override;

private:
    void paintPreview(QPaintDevice* device);

    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace graft_template::ui
