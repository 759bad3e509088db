#include <inbetween/compositor/compositor.hpp>
#include <inbetween/compositor/raster.hpp>
#include <inbetween/anim/tween.hpp>
#include <inbetween/core/log.hpp>
#include <inbetween/core/settings.hpp>
#include <algorithm>
#include <cmath>
#include <unordered_map>

namespace inbetween::compositor {

namespace {

// Streak copies share this much alpha between them
constexpr float STREAK_TOTAL_ALPHA = 0.3f;
// Distance of the furthest streak copy per pixel of motion blur
constexpr float STREAK_DISTANCE_SCALE = 3.0f;

using DecodeMap = std::unordered_map<std::string, std::shared_future<ImageLoadResult>>;

struct ElementPlacement {
    Mat3 local;  // Pivot at the element centre, rotated
    Mat3 fit;    // Image pixels onto the rectangle centred on the pivot
};

ElementPlacement place_element(const anim::Element& element, uint32_t image_width, uint32_t image_height) {
    const Vec2 size(element.width, element.height);
    ElementPlacement placement;
    placement.local = translate_2d(Vec2(element.x, element.y) + size * 0.5f) * rotate_2d(element.rotation);
    placement.fit = translate_2d(-size * 0.5f) *
                    scale_2d(size / Vec2(static_cast<float>(image_width), static_cast<float>(image_height)));
    return placement;
}

IRect unite(const IRect& a, const IRect& b) {
    if (a.empty()) return b;
    if (b.empty()) return a;
    return IRect(glm::min(a.min, b.min), glm::max(a.max, b.max));
}

void request_image(ImageCache& cache, DecodeMap& decodes, const std::string& reference) {
    if (reference.empty() || decodes.count(reference) > 0) {
        return;
    }
    decodes.emplace(reference, cache.request(reference));
}

ImageLoadResult await_image(const DecodeMap& decodes, const std::string& reference,
                            std::chrono::steady_clock::time_point deadline) {
    if (reference.empty()) {
        return {nullptr, "empty image reference"};
    }
    auto it = decodes.find(reference);
    if (it == decodes.end()) {
        return {nullptr, "image was not requested"};
    }
    if (it->second.wait_until(deadline) != std::future_status::ready) {
        return {nullptr, "decode timed out"};
    }
    return it->second.get();
}

} // namespace

RenderConfig render_config_from(const core::StudioSettings& settings) {
    RenderConfig config;
    config.width = settings.render.width;
    config.height = settings.render.height;
    config.enable_filters = settings.render.enable_filters;
    config.motion_streaks = settings.render.motion_streaks;
    config.dolly_factor = settings.render.dolly_factor;
    config.decode_timeout = std::chrono::milliseconds(settings.decode.timeout_ms);
    return config;
}

const char* to_string(CompositeError error) {
    switch (error) {
        case CompositeError::None: return "none";
        case CompositeError::InvalidSize: return "invalid size";
        case CompositeError::BaseImageUnavailable: return "base image unavailable";
    }
    return "unknown";
}

Mat3 camera_matrix(const anim::CameraTransform& camera, uint32_t width, uint32_t height,
                   float dolly_factor) {
    const Vec2 centre(static_cast<float>(width) * 0.5f, static_cast<float>(height) * 0.5f);
    const Vec2 pan(core::finite_or(camera.pan_x, 0.0f), core::finite_or(camera.pan_y, 0.0f));
    const float scale = core::finite_or(camera.zoom, 1.0f) +
                        core::finite_or(camera.dolly, 0.0f) * core::finite_or(dolly_factor, 0.0f);

    return translate_2d(centre + pan) *
           rotate_2d(core::finite_or(camera.rotate, 0.0f)) *
           scale_2d(Vec2(scale)) *
           translate_2d(-centre);
}

Mat3 element_matrix(const anim::Element& element, uint32_t image_width, uint32_t image_height) {
    const ElementPlacement placement = place_element(element, image_width, image_height);
    return placement.local * placement.fit;
}

Compositor::Compositor(std::shared_ptr<ImageCache> cache, RenderConfig config)
    : m_cache(std::move(cache))
    , m_config(config) {
}

CompositeResult Compositor::composite(const anim::Frame& frame,
                                      const std::vector<anim::Element>* elements,
                                      const std::optional<anim::CameraTransform>& camera) const {
    return composite(frame, elements, camera, m_config.width, m_config.height);
}

CompositeResult Compositor::composite(const anim::Frame& frame,
                                      const std::vector<anim::Element>* elements,
                                      const std::optional<anim::CameraTransform>& camera,
                                      uint32_t width, uint32_t height) const {
    CompositeResult result;

    if (width == 0 || height == 0 || width > MAX_SURFACE_DIMENSION || height > MAX_SURFACE_DIMENSION) {
        result.error = CompositeError::InvalidSize;
        result.message = std::format("invalid output size {}x{}", width, height);
        core::log(core::LogLevel::Error, "[Compositor] Frame '{}': {}", frame.id, result.message);
        return result;
    }
    if (!m_cache) {
        result.error = CompositeError::BaseImageUnavailable;
        result.message = "no image cache";
        core::log(core::LogLevel::Error, "[Compositor] Frame '{}': {}", frame.id, result.message);
        return result;
    }

    const std::vector<anim::Element>& source_elements = elements ? *elements : frame.elements;

    // Sanitised working copies, the caller's data is never touched
    std::vector<anim::Element> layers;
    layers.reserve(source_elements.size());
    for (const auto& element : source_elements) {
        anim::Element sanitized = anim::sanitize_element(element);
        if (sanitized.opacity > 0.0f) {
            layers.push_back(std::move(sanitized));
        }
    }

    // Fan out every decode up front, then wait for them in paint order
    const std::string& base_reference = frame.base_image();
    DecodeMap decodes;
    request_image(*m_cache, decodes, base_reference);
    for (const auto& element : layers) {
        request_image(*m_cache, decodes, element.image);
        if (element.mask_image) {
            request_image(*m_cache, decodes, *element.mask_image);
        }
    }

    const auto deadline = std::chrono::steady_clock::now() + m_config.decode_timeout;

    const ImageLoadResult base = await_image(decodes, base_reference, deadline);
    if (!base.ok()) {
        result.error = CompositeError::BaseImageUnavailable;
        result.message = base.error;
        core::log(core::LogLevel::Error, "[Compositor] Frame '{}': base image unavailable: {}",
                  frame.id, base.error);
        return result;
    }

    Surface surface(width, height);

    const Mat3 view = camera
        ? camera_matrix(*camera, width, height, m_config.dolly_factor)
        : Mat3(1.0f);

    // Base image stretched over the whole output
    const Mat3 base_fit = scale_2d(Vec2(static_cast<float>(width) / static_cast<float>(base.image->width),
                                        static_cast<float>(height) / static_cast<float>(base.image->height)));
    if (!draw_image(surface, IVec2(0), *base.image, view * base_fit)) {
        core::log(core::LogLevel::Debug, "[Compositor] Frame '{}': degenerate camera, base not drawn", frame.id);
    }

    for (const auto& element : layers) {
        const ImageLoadResult image = await_image(decodes, element.image, deadline);
        if (!image.ok()) {
            core::log(core::LogLevel::Warn, "[Compositor] Skipping element '{}': {}", element.id, image.error);
            result.skipped_elements.push_back({element.id, element.image, image.error});
            continue;
        }

        ImageLoadResult mask;
        if (element.mask_image) {
            mask = await_image(decodes, *element.mask_image, deadline);
            if (!mask.ok()) {
                core::log(core::LogLevel::Warn, "[Compositor] Skipping element '{}': mask: {}",
                          element.id, mask.error);
                result.skipped_elements.push_back({element.id, *element.mask_image, mask.error});
                continue;
            }
        }

        if (element.width <= 0.0f || element.height <= 0.0f) {
            continue;
        }

        const ElementPlacement placement = place_element(element, image.image->width, image.image->height);
        const Mat3 transform = view * placement.local * placement.fit;

        // Trailing copies against the direction of travel, furthest first
        std::vector<Mat3> streaks;
        int streak_steps = 0;
        if (m_config.motion_streaks && element.motion_blur && element.motion_blur->amount > 0.0f) {
            const anim::MotionBlur& motion = *element.motion_blur;
            const float amount = std::min(motion.amount, anim::MOTION_BLUR_MAX_AMOUNT);
            streak_steps = static_cast<int>(std::ceil(amount * 0.5f));
            const float step_distance = amount * STREAK_DISTANCE_SCALE;
            const float radians = glm::radians(motion.angle);
            const Vec2 direction(std::cos(radians), std::sin(radians));

            for (int i = streak_steps; i >= 1; --i) {
                const Vec2 offset = direction * (step_distance * static_cast<float>(i) / static_cast<float>(streak_steps));
                streaks.push_back(view * placement.local * translate_2d(-offset) * placement.fit);
            }
        }

        const float motion_amount = element.motion_blur
            ? std::min(element.motion_blur->amount, anim::MOTION_BLUR_MAX_AMOUNT) : 0.0f;

        // Past the output diagonal a wider filter only spreads the layer thinner,
        // the cap keeps the scratch layer within a few output sizes
        const float filter_limit = std::ceil(glm::length(
            Vec2(static_cast<float>(surface.width()), static_cast<float>(surface.height()))));
        const float blur_sigma = std::min(element.blur + motion_amount, filter_limit);
        const float glow = std::min(element.glow, filter_limit);

        int margin = 0;
        if (m_config.enable_filters) {
            margin = static_cast<int>(std::min(std::ceil(3.0f * blur_sigma + 3.0f * glow), filter_limit)) + 1;
        }

        IRect area = transformed_bounds(*image.image, transform);
        for (const Mat3& streak : streaks) {
            area = unite(area, transformed_bounds(*image.image, streak));
        }
        area = area.expanded(margin).intersect(surface.bounds().expanded(margin));
        if (area.empty()) {
            continue;
        }

        Surface layer(static_cast<uint32_t>(area.width()), static_cast<uint32_t>(area.height()));
        const IVec2 origin = area.min;

        const float streak_alpha = streak_steps > 0 ? STREAK_TOTAL_ALPHA / static_cast<float>(streak_steps) : 0.0f;
        for (const Mat3& streak : streaks) {
            draw_image(layer, origin, *image.image, streak, streak_alpha);
        }
        if (!draw_image(layer, origin, *image.image, transform)) {
            continue;
        }

        if (m_config.enable_filters) {
            gaussian_blur(layer, blur_sigma);
            apply_brightness(layer, element.brightness);
            apply_glow(layer, glow);
        }

        if (mask.ok()) {
            apply_mask(layer, origin, *mask.image, transform);
        }

        blend_layer(surface, layer, origin, element.blend_mode, element.opacity / 100.0f);
    }

    if (!result.skipped_elements.empty()) {
        core::log(core::LogLevel::Debug, "[Compositor] Frame '{}': {} of {} elements skipped",
                  frame.id, result.skipped_elements.size(), layers.size());
    }

    result.surface = std::move(surface);
    return result;
}

} // namespace inbetween::compositor
