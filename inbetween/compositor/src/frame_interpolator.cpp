#include <inbetween/compositor/frame_interpolator.hpp>
#include <inbetween/anim/easing.hpp>
#include <inbetween/core/log.hpp>
#include <format>
#include <memory>
#include <vector>

namespace inbetween::compositor {

namespace {

// FNV-1a, 64 bit
uint64_t hash_bytes(const std::vector<uint8_t>& bytes) {
    uint64_t hash = 14695981039346656037ull;
    for (uint8_t byte : bytes) {
        hash ^= byte;
        hash *= 1099511628211ull;
    }
    return hash;
}

} // namespace

std::string rendered_reference(const std::string& frame_id, const Image& image) {
    return std::format("{}{}/{:016x}", RENDERED_REFERENCE_PREFIX, frame_id, hash_bytes(image.pixels));
}

InterpolationResult interpolate_between_keyframe_frames(const anim::Frame& a,
                                                        const anim::Frame& b,
                                                        int count,
                                                        const Compositor& compositor,
                                                        const InterpolationOptions& options) {
    InterpolationResult result;

    if (!(b.timestamp > a.timestamp)) {
        result.error = InterpolationError::InvalidSelection;
        result.message = std::format("frame '{}' does not come after '{}'", b.id, a.id);
        core::log(core::LogLevel::Warn, "[Interpolate] Rejected: {}", result.message);
        return result;
    }
    if (count < 1 || count > MAX_INTERPOLATED_FRAMES) {
        result.error = InterpolationError::InvalidSelection;
        result.message = std::format("frame count {} outside [1, {}]", count, MAX_INTERPOLATED_FRAMES);
        core::log(core::LogLevel::Warn, "[Interpolate] Rejected: {}", result.message);
        return result;
    }

    // Every timestamp must land strictly between its neighbours
    std::vector<float> timestamps;
    timestamps.reserve(static_cast<size_t>(count));
    float previous = a.timestamp;
    for (int i = 1; i <= count; ++i) {
        const double t = static_cast<double>(i) / static_cast<double>(count + 1);
        const auto timestamp = static_cast<float>(
            static_cast<double>(a.timestamp) + (static_cast<double>(b.timestamp) - static_cast<double>(a.timestamp)) * t);
        if (!(timestamp > previous && timestamp < b.timestamp)) {
            result.error = InterpolationError::InvalidSelection;
            result.message = std::format("span between '{}' and '{}' too narrow for {} frames", a.id, b.id, count);
            core::log(core::LogLevel::Warn, "[Interpolate] Rejected: {}", result.message);
            return result;
        }
        timestamps.push_back(timestamp);
        previous = timestamp;
    }

    const uint32_t width = options.width > 0 ? options.width : compositor.config().width;
    const uint32_t height = options.height > 0 ? options.height : compositor.config().height;

    result.frames.reserve(static_cast<size_t>(count));
    for (int i = 1; i <= count; ++i) {
        const float t = static_cast<float>(i) / static_cast<float>(count + 1);

        anim::Frame frame;
        frame.id = std::format("{}_tween_{}", a.id, i);
        frame.timestamp = timestamps[static_cast<size_t>(i - 1)];
        frame.elements = anim::tween_elements(a.elements, b.elements, t, options.tween);
        frame.view_state = anim::lerp_view_state(a.view_state, b.view_state, t);
        frame.base_frame = a.base_image();
        frame.thumbnail = a.thumbnail;
        frame.is_tween = true;

        if (options.render_thumbnails) {
            CompositeResult render = compositor.composite(frame, nullptr, options.camera, width, height);
            if (render.ok()) {
                auto image = std::make_shared<const Image>(render.surface->to_image());
                std::string reference = rendered_reference(frame.id, *image);
                if (!compositor.cache()->insert(reference, std::move(image))) {
                    // Identical render from an earlier run
                    core::log(core::LogLevel::Debug, "[Interpolate] {} already cached", reference);
                }
                frame.thumbnail = std::move(reference);
            } else {
                result.render_failures.push_back({frame.id, render.error, render.message});
            }
        }

        result.frames.push_back(std::move(frame));
    }

    if (!result.render_failures.empty()) {
        core::log(core::LogLevel::Warn, "[Interpolate] {} of {} frames kept their source thumbnail",
                  result.render_failures.size(), count);
    }
    core::log(core::LogLevel::Info, "[Interpolate] Generated {} frames between '{}' and '{}'",
              count, a.id, b.id);

    return result;
}

} // namespace inbetween::compositor
