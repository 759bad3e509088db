#pragma once

#include <inbetween/anim/element.hpp>
#include <inbetween/anim/easing.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace inbetween::core {
struct StudioSettings;
}

namespace inbetween::anim {

// What happens to a current element that has no counterpart in the next frame
enum class UnmatchedPolicy : uint8_t {
    Hold,  // Unchanged for the whole transition
    Fade   // Opacity scaled by (1 - t)
};

const char* to_string(UnmatchedPolicy policy);
std::optional<UnmatchedPolicy> parse_unmatched_policy(const std::string& name);

// Motion blur is derived only above this displacement (pixels between frames)
constexpr float MOTION_BLUR_MIN_VELOCITY = 50.0f;
// Pixels of displacement per pixel of blur
constexpr float MOTION_BLUR_VELOCITY_SCALE = 100.0f;
constexpr float MOTION_BLUR_MAX_AMOUNT = 10.0f;

struct TweenOptions {
    bool motion_blur = true;
    UnmatchedPolicy unmatched_policy = UnmatchedPolicy::Fade;
    bool ghost_linkage = true;
    EaseType default_easing = EaseType::EaseInOutCubic;
};

// Interpolate one matched pair. Easing comes from a.easing, else default_easing.
// Identity fields come from a, blend mode from b. With motion_blur enabled and
// 0 < t < 1, a MotionBlur descriptor is attached when the displacement exceeds
// MOTION_BLUR_MIN_VELOCITY; the static blur value is left untouched.
Element tween_element(const Element& a, const Element& b, float t,
                      bool motion_blur = false,
                      EaseType default_easing = EaseType::EaseInOutCubic);

// Match current against next and produce the in-between element set.
//
// Each current element, in order, first matches the unconsumed next element
// with the same id, then the first unconsumed one with the same label and
// image. Placeholders still unmatched afterwards link to the first unconsumed
// newcomer with the same label (then image) when ghost_linkage is on.
// Remaining current elements follow unmatched_policy; remaining next elements
// are appended in their order with opacity scaled by t.
std::vector<Element> tween_elements(const std::vector<Element>& current,
                                    const std::vector<Element>& next,
                                    float t,
                                    const TweenOptions& options = {});

TweenOptions tween_options_from(const core::StudioSettings& settings);

} // namespace inbetween::anim
