#include <inbetween/anim/tween.hpp>
#include <inbetween/core/log.hpp>
#include <inbetween/core/settings.hpp>
#include <algorithm>
#include <cmath>

namespace inbetween::anim {

namespace {

constexpr size_t NO_MATCH = static_cast<size_t>(-1);

float clamp_progress(float t) {
    if (!std::isfinite(t)) return 0.0f;
    return std::clamp(t, 0.0f, 1.0f);
}

size_t find_unconsumed(const std::vector<Element>& next,
                       const std::vector<bool>& consumed,
                       auto&& predicate) {
    for (size_t i = 0; i < next.size(); ++i) {
        if (!consumed[i] && predicate(next[i])) {
            return i;
        }
    }
    return NO_MATCH;
}

} // namespace

const char* to_string(UnmatchedPolicy policy) {
    switch (policy) {
        case UnmatchedPolicy::Hold: return "hold";
        case UnmatchedPolicy::Fade: return "fade";
    }
    return "fade";
}

std::optional<UnmatchedPolicy> parse_unmatched_policy(const std::string& name) {
    if (name == "hold") return UnmatchedPolicy::Hold;
    if (name == "fade") return UnmatchedPolicy::Fade;
    return std::nullopt;
}

Element tween_element(const Element& a, const Element& b, float t,
                      bool motion_blur, EaseType default_easing) {
    const float eased = apply_easing(t, a.easing.value_or(default_easing));

    Element result = a;
    result.x = lerp(a.x, b.x, eased);
    result.y = lerp(a.y, b.y, eased);
    result.width = lerp(a.width, b.width, eased);
    result.height = lerp(a.height, b.height, eased);
    result.rotation = lerp_angle(a.rotation, b.rotation, eased);

    result.opacity = lerp(a.opacity, b.opacity, eased);
    result.blur = lerp(a.blur, b.blur, eased);
    result.brightness = lerp(a.brightness, b.brightness, eased);
    result.glow = lerp(a.glow, b.glow, eased);
    result.blend_mode = b.blend_mode;
    result.motion_blur.reset();

    if (motion_blur && t > 0.0f && t < 1.0f) {
        const float dx = b.x - a.x;
        const float dy = b.y - a.y;
        const float velocity = std::sqrt(dx * dx + dy * dy);

        if (velocity > MOTION_BLUR_MIN_VELOCITY) {
            MotionBlur descriptor;
            descriptor.amount = std::min(velocity / MOTION_BLUR_VELOCITY_SCALE, MOTION_BLUR_MAX_AMOUNT);
            descriptor.angle = std::atan2(dy, dx) * (180.0f / 3.14159265358979f);
            result.motion_blur = descriptor;
        }
    }

    return sanitize_element(result);
}

std::vector<Element> tween_elements(const std::vector<Element>& current,
                                    const std::vector<Element>& next,
                                    float t,
                                    const TweenOptions& options) {
    t = clamp_progress(t);

    std::vector<bool> consumed(next.size(), false);
    std::vector<size_t> match(current.size(), NO_MATCH);

    // Regular matching, one pass in current order
    for (size_t i = 0; i < current.size(); ++i) {
        const Element& element = current[i];

        size_t found = find_unconsumed(next, consumed, [&](const Element& candidate) {
            return candidate.id == element.id;
        });
        if (found == NO_MATCH) {
            found = find_unconsumed(next, consumed, [&](const Element& candidate) {
                return candidate.label == element.label && candidate.image == element.image;
            });
        }

        if (found != NO_MATCH) {
            consumed[found] = true;
            match[i] = found;
        }
    }

    // Placeholders take over newcomers that nothing else claimed
    std::vector<bool> ghost(current.size(), false);
    if (options.ghost_linkage) {
        for (size_t i = 0; i < current.size(); ++i) {
            const Element& element = current[i];
            if (match[i] != NO_MATCH || !element.is_placeholder) {
                continue;
            }

            size_t found = find_unconsumed(next, consumed, [&](const Element& candidate) {
                return candidate.label == element.label;
            });
            if (found == NO_MATCH) {
                found = find_unconsumed(next, consumed, [&](const Element& candidate) {
                    return candidate.image == element.image;
                });
            }

            if (found != NO_MATCH) {
                consumed[found] = true;
                match[i] = found;
                ghost[i] = true;
            }
        }
    }

    std::vector<Element> result;
    result.reserve(current.size() + next.size());

    for (size_t i = 0; i < current.size(); ++i) {
        const Element& element = current[i];

        if (match[i] != NO_MATCH) {
            const Element& target = next[match[i]];
            Element tweened = tween_element(element, target, t, options.motion_blur, options.default_easing);

            if (ghost[i]) {
                tweened.id = target.id;
                tweened.label = target.label;
                tweened.image = target.image;
                tweened.mask_image = target.mask_image;
                tweened.easing = target.easing;
                tweened.is_placeholder = false;
            }
            result.push_back(std::move(tweened));
            continue;
        }

        Element unmatched = element;
        unmatched.motion_blur.reset();
        if (options.unmatched_policy == UnmatchedPolicy::Fade) {
            unmatched.opacity = element.opacity * (1.0f - t);
        }
        result.push_back(sanitize_element(unmatched));
    }

    // Newcomers fade in after everything derived from the current frame
    for (size_t j = 0; j < next.size(); ++j) {
        if (consumed[j]) {
            continue;
        }
        Element newcomer = next[j];
        newcomer.motion_blur.reset();
        newcomer.opacity = next[j].opacity * t;
        result.push_back(sanitize_element(newcomer));
    }

    return result;
}

TweenOptions tween_options_from(const core::StudioSettings& settings) {
    TweenOptions options;
    options.motion_blur = settings.tween.motion_blur;
    options.ghost_linkage = settings.tween.ghost_linkage;

    if (auto policy = parse_unmatched_policy(settings.tween.unmatched_policy)) {
        options.unmatched_policy = *policy;
    } else {
        core::log(core::LogLevel::Warn, "[Tween] Unknown unmatched policy '{}', using '{}'",
                  settings.tween.unmatched_policy, to_string(options.unmatched_policy));
    }

    if (auto easing = parse_ease_type(settings.tween.default_easing)) {
        options.default_easing = *easing;
    } else {
        core::log(core::LogLevel::Warn, "[Tween] Unknown easing '{}', using '{}'",
                  settings.tween.default_easing, to_string(options.default_easing));
    }

    return options;
}

} // namespace inbetween::anim
