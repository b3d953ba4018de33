#pragma once

/// @file recording_document_sink.hpp
/// @brief DocumentSink that keeps the draw calls instead of producing a PDF
///
/// Lets document tests inspect exactly what the renderer issued in page
/// millimeters, and inject backend failures at either stage.

#include "services/export/document_sink.hpp"
#include "services/planning/fenestration.hpp"
#include "services/planning/graft_specification.hpp"
#include "services/render/recording_surface.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace graft_template::test_utils {

class RecordingDocumentSink : public services::DocumentSink {
public:
    std::expected<services::DrawingSurface*, services::TemplateError>
    beginDocument(const services::PageSpec& page) override {
        ++beginCount;
        if (beginError) {
            return std::unexpected(*beginError);
        }
        openedPage = page;
        surface.clear();
        return &surface;
    }

    std::expected<QByteArray, services::TemplateError> finalize() override {
        ++finalizeCount;
        if (finalizeError) {
            return std::unexpected(*finalizeError);
        }
        return QByteArray("recorded");
    }

    std::string mimeType() const override { return "application/x-recording"; }

    services::RecordingSurface surface;
    std::optional<services::PageSpec> openedPage;
    std::optional<services::TemplateError> beginError;
    std::optional<services::TemplateError> finalizeError;
    int beginCount = 0;
    int finalizeCount = 0;
};

/// Graft that must be valid for the test to make sense
inline services::GraftSpecification makeGraft(double diameterMm, double lengthMm,
                                              std::string name = "TEST-GRAFT") {
    auto graft = services::GraftSpecification::create(diameterMm, lengthMm, std::move(name));
    if (!graft) {
        throw std::invalid_argument(graft.error().toString());
    }
    return *graft;
}

/// Fenestration literal in the field order used throughout the tests
inline services::Fenestration makeFenestration(services::Vessel vessel, double distanceMm,
                                               int clockHour, double diameterMm) {
    services::Fenestration fenestration;
    fenestration.vessel = vessel;
    fenestration.distanceFromProximalMm = distanceMm;
    fenestration.clockHour = clockHour;
    fenestration.diameterMm = diameterMm;
    return fenestration;
}

}  // namespace graft_template::test_utils
