#include "services/render/recording_surface.hpp"

namespace graft_template::services {

void RecordingSurface::drawLine(const SurfacePoint& from, const SurfacePoint& to,
                                const LineStyle& style) {
    commands_.emplace_back(LineCommand{from, to, style});
}

void RecordingSurface::drawCircle(const SurfacePoint& center, double radius,
                                  const ShapeStyle& style) {
    commands_.emplace_back(CircleCommand{center, radius, style});
}

void RecordingSurface::drawRect(const SurfacePoint& origin, double width, double height,
                                const ShapeStyle& style) {
    commands_.emplace_back(RectCommand{origin, width, height, style});
}

void RecordingSurface::drawText(const SurfacePoint& position, const std::string& text,
                                const TextStyle& style) {
    commands_.emplace_back(TextCommand{position, text, style});
}

std::vector<LineCommand> RecordingSurface::lines() const {
    return collect<LineCommand>();
}

std::vector<CircleCommand> RecordingSurface::circles() const {
    return collect<CircleCommand>();
}

std::vector<RectCommand> RecordingSurface::rects() const {
    return collect<RectCommand>();
}

std::vector<TextCommand> RecordingSurface::texts() const {
    return collect<TextCommand>();
}

std::vector<TextCommand> RecordingSurface::textsContaining(const std::string& fragment) const {
    std::vector<TextCommand> result;
    for (const auto& text : texts()) {
        if (text.text.find(fragment) != std::string::npos) {
            result.push_back(text);
        }
    }
    return result;
}

}  // namespace graft_template::services
