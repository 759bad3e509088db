#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace inbetween::anim {

// Easing curves, each maps [0,1] onto [0,1] with f(0) = 0 and f(1) = 1
enum class EaseType : uint8_t {
    Linear,
    EaseIn,         // Quadratic
    EaseOut,
    EaseInOut,
    EaseInCubic,
    EaseOutCubic,
    EaseInOutCubic,
    EaseInQuart,
    EaseOutQuart,
    EaseInOutQuart
};

// Input is clamped to [0,1], non-finite input evaluates as 0
float apply_easing(float t, EaseType type);

// Returns a exactly at t = 0 and b exactly at t = 1
float lerp(float a, float b, float t);

// Shortest-path angle interpolation in degrees. The delta is normalised into
// (-180, 180] so 350 -> 10 passes through 0 rather than 180. Equal angles
// are returned unchanged, other results are wrapped only past +-360.
float lerp_angle(float a, float b, float t);

// "linear", "easeIn", "easeInOutCubic", ...
const char* to_string(EaseType type);
std::optional<EaseType> parse_ease_type(const std::string& name);

} // namespace inbetween::anim
