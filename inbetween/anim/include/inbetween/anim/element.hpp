#pragma once

#include <inbetween/anim/easing.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace inbetween::anim {

// Pixel compositing operator used when drawing an element
enum class BlendMode : uint8_t {
    Normal,
    Multiply,
    Screen,
    Overlay,
    Darken,
    Lighten
};

const char* to_string(BlendMode mode);
std::optional<BlendMode> parse_blend_mode(const std::string& name);

// Directional blur derived from element velocity between two frames
struct MotionBlur {
    float amount = 0.0f;  // Blur radius in pixels, added on top of Element::blur
    float angle = 0.0f;   // Direction of travel in degrees, atan2(dy, dx)

    bool operator==(const MotionBlur&) const = default;
};

// A positioned, styled layer drawn over a frame's base image
struct Element {
    // Identity
    std::string id;
    std::string label;
    std::string image;  // Content reference of the source image

    // Geometry (x, y is the top-left corner, rotation pivots around the centre)
    float x = 0.0f;
    float y = 0.0f;
    float width = 0.0f;
    float height = 0.0f;
    float rotation = 0.0f;  // Degrees

    // Appearance
    float opacity = 100.0f;     // 0-100
    float blur = 0.0f;          // Radius in pixels
    float brightness = 100.0f;  // Percent, 100 = unchanged
    float glow = 0.0f;          // Halo radius in pixels
    BlendMode blend_mode = BlendMode::Normal;

    std::optional<std::string> mask_image;
    std::optional<EaseType> easing;
    std::optional<MotionBlur> motion_blur;

    // Placeholder used to choreograph an entrance, tweens into a newcomer
    // with the same label or image instead of fading out
    bool is_placeholder = false;

    bool operator==(const Element&) const = default;
};

// Clamp opacity to [0,100], width/height/blur/glow/brightness to >= 0 and
// wrap rotation beyond +-360. Non-finite values fall back to their defaults.
Element sanitize_element(const Element& element);

bool has_unique_element_ids(const std::vector<Element>& elements);

} // namespace inbetween::anim
