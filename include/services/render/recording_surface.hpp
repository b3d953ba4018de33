#pragma once

#include "services/render/drawing_surface.hpp"

#include <cstddef>
#include <string>
#include <variant>
#include <vector>

namespace graft_template::services {

struct LineCommand {
    SurfacePoint from;
    SurfacePoint to;
    LineStyle style;
};

struct CircleCommand {
    SurfacePoint center;
    double radius = 0.0;
    ShapeStyle style;
};

struct RectCommand {
    SurfacePoint origin;
    double width = 0.0;
    double height = 0.0;
    ShapeStyle style;
};

struct TextCommand {
    SurfacePoint position;
    std::string text;
    TextStyle style;
};

using DrawCommand = std::variant<LineCommand, CircleCommand, RectCommand, TextCommand>;

/**
 * @brief DrawingSurface that stores every call in issue order
 *
 * Used to inspect the drawing instructions a renderer produces without a
 * paint device.
 */
class RecordingSurface : public DrawingSurface {
public:
    void drawLine(const SurfacePoint& from, const SurfacePoint& to,
                  const LineStyle& style) override;
    void drawCircle(const SurfacePoint& center, double radius,
                    const ShapeStyle& style) override;
    void drawRect(const SurfacePoint& origin, double width, double height,
                  const ShapeStyle& style) override;
    void drawText(const SurfacePoint& position, const std::string& text,
                  const TextStyle& style) override;

    [[nodiscard]] const std::vector<DrawCommand>& commands() const noexcept { return commands_; }

    [[nodiscard]] std::vector<LineCommand> lines() const;
    [[nodiscard]] std::vector<CircleCommand> circles() const;
    [[nodiscard]] std::vector<RectCommand> rects() const;
    [[nodiscard]] std::vector<TextCommand> texts() const;

    /**
     * @brief Text commands whose text contains @p fragment
     */
    [[nodiscard]] std::vector<TextCommand> textsContaining(const std::string& fragment) const;

    [[nodiscard]] bool empty() const noexcept { return commands_.empty(); }

    void clear() noexcept { commands_.clear(); }

private:
    template <typename T>
    std::vector<T> collect() const {
        std::vector<T> result;
        for (const auto& command : commands_) {
            if (const auto* typed = std::get_if<T>(&command)) {
                result.push_back(*typed);
            }
        }
        return result;
    }

    std::vector<DrawCommand> commands_;
};

}  // namespace graft_template::services
