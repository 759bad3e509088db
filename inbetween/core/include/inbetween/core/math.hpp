#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>

#include <cmath>

namespace inbetween::core {

// Vector types
using Vec2 = glm::vec2;
using Vec3 = glm::vec3;
using Vec4 = glm::vec4;

// Integer vector types
using IVec2 = glm::ivec2;

// 2D affine transforms are stored as 3x3 matrices (column-major, glm convention)
using Mat3 = glm::mat3;

// Integer pixel rectangle, max is exclusive
struct IRect {
    IVec2 min{0};
    IVec2 max{0};

    IRect() = default;
    IRect(const IVec2& min_, const IVec2& max_) : min(min_), max(max_) {}

    int width() const { return max.x - min.x; }
    int height() const { return max.y - min.y; }
    bool empty() const { return max.x <= min.x || max.y <= min.y; }

    IRect intersect(const IRect& other) const {
        return IRect(glm::max(min, other.min), glm::min(max, other.max));
    }

    IRect expanded(int amount) const {
        return IRect(min - IVec2(amount), max + IVec2(amount));
    }
};

// 2D affine helpers (angles in degrees)
Mat3 translate_2d(const Vec2& offset);
Mat3 rotate_2d(float degrees);
Mat3 scale_2d(const Vec2& factors);
Vec2 transform_point(const Mat3& m, const Vec2& p);

// Replace NaN/inf with a fallback
inline float finite_or(float value, float fallback) {
    return std::isfinite(value) ? value : fallback;
}

} // namespace inbetween::core
