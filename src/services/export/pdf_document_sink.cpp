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

#include "services/export/pdf_document_sink.hpp"

#include "core/logging.hpp"
#include "services/render/painter_surface.hpp"

#include <QBuffer>
#include <QMarginsF>
#include <QPageLayout>
#include <QPageSize>
#include <QPainter>
#include <QPdfWriter>

#include <utility>

namespace graft_template::services {

namespace {

auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("PdfDocumentSink");
    return logger;
}

}  // anonymous namespace

class PdfDocumentSink::Impl {
public:
    PdfSinkOptions options;

    QByteArray bytes;
    std::unique_ptr<QBuffer> buffer;
    std::unique_ptr<QPdfWriter> writer;
    std::unique_ptr<QPainter> painter;
    std::unique_ptr<PainterSurface> surface;
    double unitsPerMm = 0.0;

    void release() {
        surface.reset();
        if (painter && painter->isActive()) {
            painter->end();
        }
        painter.reset();
        writer.reset();
        if (buffer && buffer->isOpen()) {
            buffer->close();
        }
        buffer.reset();
        unitsPerMm = 0.0;
    }
};

PdfDocumentSink::PdfDocumentSink(PdfSinkOptions options)
    : impl_(std::make_unique<Impl>())
{
    impl_->options = std::move(options);
}

PdfDocumentSink::~PdfDocumentSink() {
    impl_->release();
}

double PdfDocumentSink::devicePixelsPerMm(int resolutionDpi) noexcept {
    return static_cast<double>(resolutionDpi) / kMillimetersPerInch;
}

std::expected<DrawingSurface*, TemplateError>
PdfDocumentSink::beginDocument(const PageSpec& page) {
    if (impl_->painter) {
        return std::unexpected(TemplateError{
            TemplateError::Code::InternalError,
            "a document is already open on this sink"
        });
    }
    if (page.widthMm <= 0.0 || page.heightMm <= 0.0) {
        return std::unexpected(TemplateError{
            TemplateError::Code::InvalidParameter,
            "page size must be positive"
        });
    }

    impl_->bytes.clear();
    impl_->buffer = std::make_unique<QBuffer>(&impl_->bytes);
    if (!impl_->buffer->open(QIODevice::WriteOnly)) {
        impl_->release();
        return std::unexpected(TemplateError{
            TemplateError::Code::FileCreationFailed,
            "Failed to open in-memory PDF buffer"
        });
    }

    impl_->writer = std::make_unique<QPdfWriter>(impl_->buffer.get());
    impl_->writer->setResolution(impl_->options.resolutionDpi);
    impl_->writer->setTitle(impl_->options.title);
    impl_->writer->setCreator(impl_->options.creator);

    // QPageSize is always given portrait; orientation turns it
    const bool landscape = page.isLandscape();
    const QSizeF portraitSize = landscape
        ? QSizeF(page.heightMm, page.widthMm)
        : QSizeF(page.widthMm, page.heightMm);
    const QPageSize pageSize(portraitSize, QPageSize::Millimeter,
                             QString::fromStdString(page.name), QPageSize::ExactMatch);
    const QPageLayout layout(pageSize,
                             landscape ? QPageLayout::Landscape : QPageLayout::Portrait,
                             QMarginsF(0, 0, 0, 0), QPageLayout::Millimeter);
    if (!impl_->writer->setPageLayout(layout)) {
        impl_->release();
        return std::unexpected(TemplateError{
            TemplateError::Code::RenderingFailed,
            "PDF writer rejected the page layout"
        });
    }

    impl_->painter = std::make_unique<QPainter>();
    if (!impl_->painter->begin(impl_->writer.get())) {
        impl_->release();
        return std::unexpected(TemplateError{
            TemplateError::Code::RenderingFailed,
            "Failed to initialize PDF painter"
        });
    }

    // Use the resolution the writer actually adopted, not the requested one
    impl_->unitsPerMm = devicePixelsPerMm(impl_->writer->resolution());
    impl_->painter->scale(impl_->unitsPerMm, impl_->unitsPerMm);
    impl_->painter->setRenderHint(QPainter::Antialiasing);
    impl_->painter->setRenderHint(QPainter::TextAntialiasing);

    impl_->surface = std::make_unique<PainterSurface>(*impl_->painter);

    getLogger()->debug("PDF page {} ({:.1f} x {:.1f} mm) at {} dpi, {:.4f} px/mm",
                       page.name, page.widthMm, page.heightMm,
                       impl_->writer->resolution(), impl_->unitsPerMm);

    return impl_->surface.get();
}

std::expected<QByteArray, TemplateError> PdfDocumentSink::finalize() {
    if (!impl_->painter) {
        return std::unexpected(TemplateError{
            TemplateError::Code::InternalError,
            "no open document to finalize"
        });
    }

    impl_->surface.reset();
    const bool finished = impl_->painter->end();
    impl_->release();

    if (!finished || !impl_->bytes.startsWith("%PDF")) {
        return std::unexpected(TemplateError{
            TemplateError::Code::RenderingFailed,
            "PDF writer produced no document"
        });
    }

    getLogger()->debug("PDF finalized: {} bytes", impl_->bytes.size());
    return impl_->bytes;
}

std::string PdfDocumentSink::mimeType() const {
    return "application/pdf";
}

double PdfDocumentSink::deviceUnitsPerMm() const noexcept {
    return impl_->unitsPerMm;
}

std::optional<PageSpec> PdfDocumentSink::writerPageSize() const {
    if (!impl_->writer) {
        return std::nullopt;
    }
    const QRectF full = impl_->writer->pageLayout().fullRect(QPageLayout::Millimeter);
    PageSpec page;
    page.name = impl_->writer->pageLayout().pageSize().name().toStdString();
    page.widthMm = full.width();
    page.heightMm = full.height();
    return page;
}

std::optional<double> PdfDocumentSink::paintDeviceWidthMm() const {
    if (!impl_->writer || impl_->unitsPerMm <= 0.0) {
        return std::nullopt;
    }
    return impl_->writer->width() / impl_->unitsPerMm;
}

}  // namespace graft_template::services
