#include <inbetween/anim/frame.hpp>
#include <inbetween/core/math.hpp>
#include <algorithm>

namespace inbetween::anim {

ViewState lerp_view_state(const ViewState& a, const ViewState& b, float t) {
    ViewState result;
    result.zoom = std::max(0.0f, core::finite_or(lerp(a.zoom, b.zoom, t), 1.0f));
    result.pan_x = core::finite_or(lerp(a.pan_x, b.pan_x, t), 0.0f);
    result.pan_y = core::finite_or(lerp(a.pan_y, b.pan_y, t), 0.0f);
    return result;
}

} // namespace inbetween::anim
