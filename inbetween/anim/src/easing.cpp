#include <inbetween/anim/easing.hpp>
#include <algorithm>
#include <cmath>

namespace inbetween::anim {

float apply_easing(float t, EaseType type) {
    if (!std::isfinite(t)) {
        t = 0.0f;
    }
    t = std::clamp(t, 0.0f, 1.0f);

    switch (type) {
        case EaseType::Linear:
            return t;

        case EaseType::EaseIn:
            return t * t;

        case EaseType::EaseOut:
            return 1.0f - (1.0f - t) * (1.0f - t);

        case EaseType::EaseInOut:
            return t < 0.5f
                ? 2.0f * t * t
                : 1.0f - std::pow(-2.0f * t + 2.0f, 2.0f) / 2.0f;

        case EaseType::EaseInCubic:
            return t * t * t;

        case EaseType::EaseOutCubic:
            return 1.0f - std::pow(1.0f - t, 3.0f);

        case EaseType::EaseInOutCubic:
            return t < 0.5f
                ? 4.0f * t * t * t
                : 1.0f - std::pow(-2.0f * t + 2.0f, 3.0f) / 2.0f;

        case EaseType::EaseInQuart:
            return t * t * t * t;

        case EaseType::EaseOutQuart:
            return 1.0f - std::pow(1.0f - t, 4.0f);

        case EaseType::EaseInOutQuart:
            return t < 0.5f
                ? 8.0f * t * t * t * t
                : 1.0f - std::pow(-2.0f * t + 2.0f, 4.0f) / 2.0f;

        default:
            return t;
    }
}

float lerp(float a, float b, float t) {
    if (a == b) {
        return a;
    }
    return (1.0f - t) * a + t * b;
}

float lerp_angle(float a, float b, float t) {
    if (t <= 0.0f) return a;
    if (t >= 1.0f) return b;

    float delta = std::fmod(b - a, 360.0f);
    if (delta > 180.0f) {
        delta -= 360.0f;
    } else if (delta <= -180.0f) {
        delta += 360.0f;
    }

    if (delta == 0.0f) {
        return a;
    }

    // Same rule as sanitize_element, +-360 itself stays as authored
    const float result = a + delta * t;
    return std::abs(result) > 360.0f ? std::fmod(result, 360.0f) : result;
}

const char* to_string(EaseType type) {
    switch (type) {
        case EaseType::Linear:         return "linear";
        case EaseType::EaseIn:         return "easeIn";
        case EaseType::EaseOut:        return "easeOut";
        case EaseType::EaseInOut:      return "easeInOut";
        case EaseType::EaseInCubic:    return "easeInCubic";
        case EaseType::EaseOutCubic:   return "easeOutCubic";
        case EaseType::EaseInOutCubic: return "easeInOutCubic";
        case EaseType::EaseInQuart:    return "easeInQuart";
        case EaseType::EaseOutQuart:   return "easeOutQuart";
        case EaseType::EaseInOutQuart: return "easeInOutQuart";
    }
    return "linear";
}

std::optional<EaseType> parse_ease_type(const std::string& name) {
    static constexpr EaseType all[] = {
        EaseType::Linear, EaseType::EaseIn, EaseType::EaseOut, EaseType::EaseInOut,
        EaseType::EaseInCubic, EaseType::EaseOutCubic, EaseType::EaseInOutCubic,
        EaseType::EaseInQuart, EaseType::EaseOutQuart, EaseType::EaseInOutQuart
    };

    for (EaseType type : all) {
        if (name == to_string(type)) {
            return type;
        }
    }
    return std::nullopt;
}

} // namespace inbetween::anim
