#include <inbetween/anim/element.hpp>
#include <inbetween/core/math.hpp>
#include <algorithm>
#include <cmath>
#include <unordered_set>

namespace inbetween::anim {

using core::finite_or;

const char* to_string(BlendMode mode) {
    switch (mode) {
        case BlendMode::Normal:   return "normal";
        case BlendMode::Multiply: return "multiply";
        case BlendMode::Screen:   return "screen";
        case BlendMode::Overlay:  return "overlay";
        case BlendMode::Darken:   return "darken";
        case BlendMode::Lighten:  return "lighten";
    }
    return "normal";
}

std::optional<BlendMode> parse_blend_mode(const std::string& name) {
    if (name == "normal") return BlendMode::Normal;
    if (name == "multiply") return BlendMode::Multiply;
    if (name == "screen") return BlendMode::Screen;
    if (name == "overlay") return BlendMode::Overlay;
    if (name == "darken") return BlendMode::Darken;
    if (name == "lighten") return BlendMode::Lighten;
    return std::nullopt;
}

Element sanitize_element(const Element& element) {
    const Element defaults;
    Element result = element;

    result.x = finite_or(element.x, defaults.x);
    result.y = finite_or(element.y, defaults.y);
    result.width = std::max(0.0f, finite_or(element.width, defaults.width));
    result.height = std::max(0.0f, finite_or(element.height, defaults.height));

    result.rotation = finite_or(element.rotation, defaults.rotation);
    if (std::abs(result.rotation) > 360.0f) {
        result.rotation = std::fmod(result.rotation, 360.0f);
    }

    result.opacity = std::clamp(finite_or(element.opacity, defaults.opacity), 0.0f, 100.0f);
    result.blur = std::max(0.0f, finite_or(element.blur, defaults.blur));
    result.brightness = std::max(0.0f, finite_or(element.brightness, defaults.brightness));
    result.glow = std::max(0.0f, finite_or(element.glow, defaults.glow));

    if (result.motion_blur) {
        result.motion_blur->amount = std::max(0.0f, finite_or(result.motion_blur->amount, 0.0f));
        result.motion_blur->angle = finite_or(result.motion_blur->angle, 0.0f);
    }

    return result;
}

bool has_unique_element_ids(const std::vector<Element>& elements) {
    std::unordered_set<std::string> seen;
    seen.reserve(elements.size());
    for (const auto& element : elements) {
        if (!seen.insert(element.id).second) {
            return false;
        }
    }
    return true;
}

} // namespace inbetween::anim
