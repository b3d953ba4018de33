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

// Ecosystem logging header must precede Qt headers (emit macro conflict)
#include <kcenon/common/logging/log_macros.h>

#include "services/planning/template_planner.hpp"

#include <format>
#include <utility>

namespace graft_template::services {

TemplatePlanner::TemplatePlanner(DeviceCatalog catalog,
                                 DocumentOptions documentOptions,
                                 PdfSinkOptions pdfOptions)
    : catalog_(std::move(catalog))
    , documentRenderer_(std::move(documentOptions))
    , pdfOptions_(std::move(pdfOptions))
{
}

void TemplatePlanner::setCatalog(DeviceCatalog catalog) {
    catalog_ = std::move(catalog);
    LOG_INFO(std::format("Device catalog replaced: {} devices", catalog_.size()));
}

std::expected<GraftSpecification, TemplateError>
TemplatePlanner::resolveDevice(const std::string& deviceLabel) const {
    auto device = catalog_.find(deviceLabel);
    if (!device) {
        LOG_WARNING(std::format("Unknown device '{}'", deviceLabel));
        return std::unexpected(TemplateError{
            TemplateError::Code::InvalidParameter,
            std::format("unknown device '{}'", deviceLabel)
        });
    }
    return device->toSpecification();
}

std::expected<PlanningSession, TemplateError>
TemplatePlanner::startSession(const std::string& deviceLabel) const {
    auto graft = resolveDevice(deviceLabel);
    if (!graft) {
        return std::unexpected(graft.error());
    }

    LOG_INFO(std::format("Planning session started on {} ({:g} x {:g} mm)",
                         graft->name(), graft->diameterMm(), graft->lengthMm()));
    return PlanningSession(std::move(*graft));
}

std::expected<void, TemplateError>
TemplatePlanner::selectDevice(PlanningSession& session, const std::string& deviceLabel) const {
    auto graft = resolveDevice(deviceLabel);
    if (!graft) {
        return std::unexpected(graft.error());
    }

    const std::size_t discarded = session.registry.size();
    session.graft = std::move(*graft);
    session.registry.clear();

    LOG_INFO(std::format("Device changed to {} ({:g} x {:g} mm), {} fenestrations discarded",
                         session.graft.name(), session.graft.diameterMm(),
                         session.graft.lengthMm(), discarded));
    return {};
}

std::expected<std::size_t, TemplateError>
TemplatePlanner::addFenestration(PlanningSession& session,
                                 const FenestrationRequest& request) const {
    auto vessel = vesselFromKey(request.vesselKey);
    if (!vessel) {
        LOG_WARNING(std::format("Rejected fenestration: unknown vessel '{}'", request.vesselKey));
        return std::unexpected(TemplateError{
            TemplateError::Code::InvalidParameter,
            std::format("unknown vessel '{}'", request.vesselKey)
        });
    }

    Fenestration fenestration;
    fenestration.vessel = *vessel;
    fenestration.distanceFromProximalMm = request.distanceFromProximalMm;
    fenestration.clockHour = request.clockHour;
    fenestration.diameterMm = request.diameterMm;
    return addFenestration(session, fenestration);
}

std::expected<std::size_t, TemplateError>
TemplatePlanner::addFenestration(PlanningSession& session,
                                 const Fenestration& fenestration) const {
    auto index = session.registry.add(fenestration, session.graft);
    if (!index) {
        // Registry has already logged the rejection
        return std::unexpected(index.error());
    }

    LOG_INFO(std::format("Added F{}: {}", *index + 1, describe(fenestration)));
    return *index;
}

std::expected<Fenestration, TemplateError>
TemplatePlanner::removeFenestration(PlanningSession& session, std::size_t index) const {
    auto removed = session.registry.remove(index);
    if (!removed) {
        LOG_WARNING(std::format("Remove rejected: {}", removed.error().toString()));
        return std::unexpected(removed.error());
    }

    LOG_INFO(std::format("Removed F{}: {}", index + 1, describe(*removed)));
    return removed;
}

std::size_t TemplatePlanner::clearFenestrations(PlanningSession& session) const {
    const std::size_t count = session.registry.size();
    session.registry.clear();
    LOG_INFO(std::format("Cleared {} fenestrations", count));
    return count;
}

PreviewResult TemplatePlanner::renderPreview(const PlanningSession& session,
                                             DrawingSurface& surface,
                                             const PreviewViewport& viewport) const {
    return previewRenderer_.render(session.graft, session.registry, surface, viewport);
}

std::expected<TemplateArtifact, TemplateError>
TemplatePlanner::exportDocument(const PlanningSession& session) const {
    PdfDocumentSink sink(pdfOptions_);
    return exportDocument(session, sink);
}

std::expected<TemplateArtifact, TemplateError>
TemplatePlanner::exportDocument(const PlanningSession& session, DocumentSink& sink) const {
    auto artifact = documentRenderer_.render(session.graft, session.registry, sink);
    if (!artifact) {
        LOG_WARNING(std::format("Template export failed: {}", artifact.error().toString()));
        return artifact;
    }

    LOG_INFO(std::format("Exported {} ({} fenestrations)",
                         artifact->suggestedFileName, artifact->placements.size()));
    return artifact;
}

}  // namespace graft_template::services
