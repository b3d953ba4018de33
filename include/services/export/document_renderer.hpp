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
 * @file document_renderer.hpp
 * @brief Fixed-scale printable fenestration template
 * @details Emits the same template content as the preview to a single
 *          document page whose units are true millimeters, plus a title
 *          block, printing and cutting instructions, and a disclaimer. The
 *          page is the smallest standard sheet the content fits on.
 *
 * The renderer never touches the file system: the finished bytes are
 * returned in a TemplateArtifact and the caller decides where they go.
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include "services/export/document_sink.hpp"
#include "services/planning/fenestration_registry.hpp"
#include "services/planning/graft_specification.hpp"
#include "services/render/template_scene.hpp"
#include "services/template_error.hpp"

#include <expected>
#include <string>
#include <vector>

namespace graft_template::services {

/**
 * @brief Page layout options for the printable template
 */
struct DocumentOptions {
    /// Blank border kept on every page edge
    double marginMm = 10.0;

    /// Print the instruction block and disclaimer under the template
    bool includeInstructions = true;
};

class DocumentRenderer {
public:
    /// Height reserved for the title block above the template
    static constexpr double kTitleBlockMm = 14.0;

    /// Line pitch of the instruction block
    static constexpr double kInstructionLineMm = 4.5;

    DocumentRenderer();
    explicit DocumentRenderer(DocumentOptions options, SceneStyle style = defaultStyle());

    /**
     * @brief Render the template and finalize it through @p sink
     *
     * An empty registry still produces a complete template carrying a
     * notice, flagged with TemplateArtifact::layoutEmpty.
     *
     * @return Artifact, or the sink's RenderingFailed / FileCreationFailed
     */
    [[nodiscard]] std::expected<TemplateArtifact, TemplateError>
    render(const GraftSpecification& graft,
           const FenestrationRegistry& registry,
           DocumentSink& sink) const;

    /**
     * @brief Page chosen for a graft under the current options
     */
    [[nodiscard]] PageSpec pageFor(const GraftSpecification& graft) const;

    /**
     * @brief Instruction lines printed under the template
     */
    [[nodiscard]] std::vector<std::string>
    instructionLines(const GraftSpecification& graft) const;

    [[nodiscard]] const DocumentOptions& options() const noexcept { return options_; }

    /**
     * @brief A4 and A3 in portrait and landscape, smallest first
     */
    [[nodiscard]] static std::vector<PageSpec> standardPages();

    /**
     * @brief Smallest standard page holding @p widthMm x @p heightMm
     *
     * Falls back to a custom page of exactly that size when even A3
     * landscape is too small.
     */
    [[nodiscard]] static PageSpec choosePage(double widthMm, double heightMm);

    /**
     * @brief "graft_template_<d>mm_<l>mm.pdf"
     */
    [[nodiscard]] static std::string suggestedFileName(const GraftSpecification& graft);

    /// Print style: no outline fill, opaque-looking discs
    [[nodiscard]] static SceneStyle defaultStyle();

    static constexpr const char* kDisclaimer =
        "Planning aid only. Verify every position against patient imaging "
        "before modifying a device.";

    static constexpr const char* kEmptyLayoutNotice = "NO FENESTRATIONS PLANNED";

private:
    [[nodiscard]] double instructionBlockHeightMm(const GraftSpecification& graft) const;

    DocumentOptions options_;
    SceneStyle style_;
};

}  // namespace graft_template::services
