#pragma once

#include <inbetween/anim/camera_track.hpp>
#include <inbetween/anim/frame.hpp>
#include <inbetween/anim/tween.hpp>
#include <inbetween/compositor/compositor.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace inbetween::compositor {

constexpr int MAX_INTERPOLATED_FRAMES = 120;

// Prefix of cache keys under which rendered in-between frames are registered
constexpr const char* RENDERED_REFERENCE_PREFIX = "rendered://";

enum class InterpolationError : uint8_t {
    None,
    InvalidSelection  // b not after a, or count outside [1, MAX_INTERPOLATED_FRAMES]
};

struct InterpolationOptions {
    anim::TweenOptions tween;
    std::optional<anim::CameraTransform> camera;
    bool render_thumbnails = true;

    // 0 = use the compositor's configured size
    uint32_t width = 0;
    uint32_t height = 0;
};

// An in-between frame that was kept with its source thumbnail
struct RenderFailure {
    std::string frame_id;
    CompositeError error = CompositeError::None;
    std::string message;
};

struct InterpolationResult {
    std::vector<anim::Frame> frames;
    std::vector<RenderFailure> render_failures;
    InterpolationError error = InterpolationError::None;
    std::string message;

    bool ok() const { return error == InterpolationError::None; }
};

// Synthesize count frames strictly between a and b at t = i / (count + 1).
// Each frame is tweened from a towards b, inherits a's base image and, when
// rendering succeeds, gets its composited image as thumbnail.
InterpolationResult interpolate_between_keyframe_frames(const anim::Frame& a,
                                                        const anim::Frame& b,
                                                        int count,
                                                        const Compositor& compositor,
                                                        const InterpolationOptions& options = {});

// "rendered://<frame id>/<content hash>"
std::string rendered_reference(const std::string& frame_id, const Image& image);

} // namespace inbetween::compositor
