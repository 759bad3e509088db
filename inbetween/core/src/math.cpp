#include <inbetween/core/math.hpp>
#include <cmath>

namespace inbetween::core {

Mat3 translate_2d(const Vec2& offset) {
    Mat3 m(1.0f);
    m[2][0] = offset.x;
    m[2][1] = offset.y;
    return m;
}

Mat3 rotate_2d(float degrees) {
    const float radians = glm::radians(degrees);
    const float c = std::cos(radians);
    const float s = std::sin(radians);

    // Columns: x axis, y axis, translation. Positive angles rotate clockwise
    // on screen since y points down.
    Mat3 m(1.0f);
    m[0][0] = c;
    m[0][1] = s;
    m[1][0] = -s;
    m[1][1] = c;
    return m;
}

Mat3 scale_2d(const Vec2& factors) {
    Mat3 m(1.0f);
    m[0][0] = factors.x;
    m[1][1] = factors.y;
    return m;
}

Vec2 transform_point(const Mat3& m, const Vec2& p) {
    const Vec3 r = m * Vec3(p, 1.0f);
    return Vec2(r.x, r.y);
}

} // namespace inbetween::core
