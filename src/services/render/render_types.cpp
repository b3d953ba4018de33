#include "services/render/render_types.hpp"

#include <format>

namespace graft_template::services {

std::string RgbColor::toHex() const {
    return std::format("#{:02x}{:02x}{:02x}", r, g, b);
}

}  // namespace graft_template::services
