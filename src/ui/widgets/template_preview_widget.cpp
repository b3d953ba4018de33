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

#include "ui/widgets/template_preview_widget.hpp"

#include "services/geometry/cylinder_unwrap_mapper.hpp"
#include "services/render/painter_surface.hpp"

#include <QMouseEvent>
#include <QPainter>
#include <QToolTip>

#include <cmath>

namespace graft_template::ui {

class TemplatePreviewWidget::Impl {
public:
    const services::TemplatePlanner* planner = nullptr;
    const services::PlanningSession* session = nullptr;
    std::optional<services::PreviewResult> lastResult;
    QString placeholder;

    static constexpr double marginPx = 12.0;
};

TemplatePreviewWidget::TemplatePreviewWidget(QWidget* parent)
    : QWidget(parent)
    , impl_(std::make_unique<Impl>())
{
    impl_->placeholder = tr("No fenestrations planned.\nAdd one to preview the template.");
    setMinimumSize(240, 320);
    setSizePolicy(QSizePolicy::Expanding, QSizePolicy::Expanding);
    setAttribute(Qt::WA_OpaquePaintEvent);
    setMouseTracking(true);
}

TemplatePreviewWidget::~TemplatePreviewWidget() = default;

void TemplatePreviewWidget::setSession(const services::TemplatePlanner* planner,
                                       const services::PlanningSession* session)
{
    impl_->planner = planner;
    impl_->session = session;
    impl_->lastResult.reset();
    update();
}

void TemplatePreviewWidget::refresh()
{
    update();
}

std::optional<services::PreviewResult> TemplatePreviewWidget::lastResult() const
{
    return impl_->lastResult;
}

QString TemplatePreviewWidget::placeholderText() const
{
    return impl_->placeholder;
}

void TemplatePreviewWidget::setPlaceholderText(const QString& text)
{
    impl_->placeholder = text;
    update();
}

QImage TemplatePreviewWidget::previewImage()
{
    QImage image(size(), QImage::Format_ARGB32_Premultiplied);
    paintPreview(&image);
    return image;
}

int TemplatePreviewWidget::fenestrationAt(const QPointF& position) const
{
    if (!impl_->lastResult || !impl_->lastResult->hasData()) {
        return -1;
    }
    // Last drawn disc is on top
    const auto& placements = impl_->lastResult->placements;
    for (auto it = placements.rbegin(); it != placements.rend(); ++it) {
        const double dx = position.x() - it->center.x;
        const double dy = position.y() - it->center.y;
        if (std::hypot(dx, dy) <= it->radius) {
            return static_cast<int>(it->index);
        }
    }
    return -1;
}

QString TemplatePreviewWidget::positionLabel(const QPointF& position) const
{
    if (!impl_->session || !impl_->lastResult || !impl_->lastResult->hasData()) {
        return {};
    }
    const auto& transform = impl_->lastResult->transform;
    if (transform.unitsPerMm <= 0.0) {
        return {};
    }

    const auto& graft = impl_->session->graft;
    const auto point = transform.invert({position.x(), position.y()});
    if (point.xMm < 0.0 || point.xMm > graft.circumferenceMm() ||
        point.yMm < 0.0 || point.yMm > graft.lengthMm()) {
        return {};
    }

    const double angle = services::CylinderUnwrapMapper::angleFromX(
        graft.circumferenceMm(), point.xMm);
    return tr("%1 o'clock, %2 mm")
        .arg(services::CylinderUnwrapMapper::clockHourFromAngle(angle))
        .arg(point.yMm, 0, 'f', 1);
}

void TemplatePreviewWidget::paintEvent(QPaintEvent* /*event*/)
{
    paintPreview(this);
}

void TemplatePreviewWidget::paintPreview(QPaintDevice* device)
{
    QPainter painter(device);
    painter.setRenderHint(QPainter::Antialiasing);
    painter.setRenderHint(QPainter::TextAntialiasing);
    painter.fillRect(QRect(0, 0, device->width(), device->height()), Qt::white);

    if (impl_->planner && impl_->session) {
        services::PainterSurface surface(painter);
        services::PreviewViewport viewport;
        viewport.widthPx = device->width();
        viewport.heightPx = device->height();
        viewport.marginPx = Impl::marginPx;

        impl_->lastResult = impl_->planner->renderPreview(*impl_->session, surface, viewport);
        if (impl_->lastResult->hasData()) {
            return;
        }
    } else {
        impl_->lastResult.reset();
    }

    painter.setPen(QColor(120, 120, 120));
    painter.drawText(QRect(0, 0, device->width(), device->height()),
                     Qt::AlignCenter, impl_->placeholder);
}

void TemplatePreviewWidget::mousePressEvent(QMouseEvent* event)
{
    if (event->button() == Qt::LeftButton) {
        const int index = fenestrationAt(event->position());
        if (index >= 0) {
            emit fenestrationClicked(index);
        }
    }
    QWidget::mousePressEvent(event);
}

void TemplatePreviewWidget::mouseMoveEvent(QMouseEvent* event)
{
    const QString label = positionLabel(event->position());
    if (label.isEmpty()) {
        QToolTip::hideText();
    } else {
        QToolTip::showText(event->globalPosition().toPoint(), label, this);
    }
    QWidget::mouseMoveEvent(event);
}

} // namespace graft_template::ui
