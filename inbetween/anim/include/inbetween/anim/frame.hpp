#pragma once

#include <inbetween/anim/element.hpp>
#include <optional>
#include <string>
#include <vector>

namespace inbetween::anim {

// Per-frame zoom/pan, independent of the global camera
struct ViewState {
    float zoom = 1.0f;
    float pan_x = 0.0f;
    float pan_y = 0.0f;

    bool operator==(const ViewState&) const = default;
};

// One authored (or synthesized) instant of the sequence
struct Frame {
    std::string id;
    std::string thumbnail;                  // Raw base image reference
    std::optional<std::string> base_frame;  // Background-only variant with elements masked out
    float timestamp = 0.0f;                 // Seconds

    // Paint order, back to front
    std::vector<Element> elements;

    ViewState view_state;
    bool is_tween = false;  // Produced by frame interpolation

    // Background-only variant if present, else the thumbnail
    const std::string& base_image() const {
        return base_frame ? *base_frame : thumbnail;
    }
};

ViewState lerp_view_state(const ViewState& a, const ViewState& b, float t);

} // namespace inbetween::anim
