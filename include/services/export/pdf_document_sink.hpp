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
 * @file pdf_document_sink.hpp
 * @brief DocumentSink writing a true-scale PDF page into memory
 * @details The QPdfWriter paint device counts pixels at the configured
 *          resolution. The painter is scaled by resolution / 25.4 once, at
 *          the start of the page, so that every surface unit is exactly one
 *          millimeter on paper printed at 100 %. This is the only place in
 *          the application where a device unit is converted to millimeters.
 *
 * ## Thread Safety
 * - QPainter on QPdfWriter; use from one thread at a time
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include "services/export/document_sink.hpp"

#include <QString>

#include <memory>
#include <optional>

namespace graft_template::services {

/// Definition of the inch; not a tunable
inline constexpr double kMillimetersPerInch = 25.4;

struct PdfSinkOptions {
    /// Paint device resolution; higher keeps thin strokes exact
    int resolutionDpi = 1200;
    QString title = "Fenestration template";
    QString creator = "Graft Template Planner";
};

class PdfDocumentSink : public DocumentSink {
public:
    explicit PdfDocumentSink(PdfSinkOptions options = {});
    ~PdfDocumentSink() override;

    // Non-copyable
    PdfDocumentSink(const PdfDocumentSink&) = delete;
    PdfDocumentSink& operator=(const PdfDocumentSink&) = delete;

    [[nodiscard]] std::expected<DrawingSurface*, TemplateError>
    beginDocument(const PageSpec& page) override;

    [[nodiscard]] std::expected<QByteArray, TemplateError> finalize() override;

    [[nodiscard]] std::string mimeType() const override;

    /**
     * @brief Device pixels in one millimeter at @p resolutionDpi
     */
    [[nodiscard]] static double devicePixelsPerMm(int resolutionDpi) noexcept;

    /**
     * @brief Scale applied to the painter for the open page (0 when closed)
     */
    [[nodiscard]] double deviceUnitsPerMm() const noexcept;

    /**
     * @brief Page size as the PDF writer reports it, in millimeters
     */
    [[nodiscard]] std::optional<PageSpec> writerPageSize() const;

    /**
     * @brief Width of the paint device converted back to millimeters
     *
     * Equals the page width when no implicit margins or rescaling apply.
     */
    [[nodiscard]] std::optional<double> paintDeviceWidthMm() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace graft_template::services
