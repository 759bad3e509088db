#pragma once

#include <inbetween/anim/camera_track.hpp>
#include <inbetween/anim/element.hpp>
#include <inbetween/anim/frame.hpp>
#include <inbetween/compositor/image_cache.hpp>
#include <inbetween/compositor/surface.hpp>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace inbetween::core {
struct StudioSettings;
}

namespace inbetween::compositor {

// Largest accepted output dimension
constexpr uint32_t MAX_SURFACE_DIMENSION = 16384;

struct RenderConfig {
    uint32_t width = 1920;
    uint32_t height = 1080;
    bool enable_filters = true;
    bool motion_streaks = false;
    float dolly_factor = 0.1f;
    std::chrono::milliseconds decode_timeout{5000};
};

RenderConfig render_config_from(const core::StudioSettings& settings);

enum class CompositeError : uint8_t {
    None,
    InvalidSize,
    BaseImageUnavailable
};

const char* to_string(CompositeError error);

// An element left out of the output because one of its images failed
struct SkippedElement {
    std::string element_id;
    std::string reference;
    std::string reason;
};

struct CompositeResult {
    std::optional<Surface> surface;
    CompositeError error = CompositeError::None;
    std::string message;
    std::vector<SkippedElement> skipped_elements;

    bool ok() const { return error == CompositeError::None && surface.has_value(); }
};

// Camera matrix pivoting around the centre of a width x height output
Mat3 camera_matrix(const anim::CameraTransform& camera, uint32_t width, uint32_t height,
                   float dolly_factor = 0.1f);

// Maps an element's source image (image_width x image_height pixels) onto its
// rectangle, rotated around the rectangle centre, in output pixels
Mat3 element_matrix(const anim::Element& element, uint32_t image_width, uint32_t image_height);

// Renders one frame: base image, then every element in paint order, each in
// its own scratch layer. Holds no drawing state, so one instance may serve
// several threads.
class Compositor {
public:
    explicit Compositor(std::shared_ptr<ImageCache> cache, RenderConfig config = {});

    // elements overrides frame.elements when given (tweened sets)
    CompositeResult composite(const anim::Frame& frame,
                              const std::vector<anim::Element>* elements = nullptr,
                              const std::optional<anim::CameraTransform>& camera = std::nullopt) const;

    CompositeResult composite(const anim::Frame& frame,
                              const std::vector<anim::Element>* elements,
                              const std::optional<anim::CameraTransform>& camera,
                              uint32_t width, uint32_t height) const;

    const RenderConfig& config() const { return m_config; }
    const std::shared_ptr<ImageCache>& cache() const { return m_cache; }

private:
    std::shared_ptr<ImageCache> m_cache;
    RenderConfig m_config;
};

} // namespace inbetween::compositor
