#pragma once

#include <inbetween/core/math.hpp>
#include <cstdint>
#include <vector>

namespace inbetween::compositor {

using namespace inbetween::core;

// Decoded bitmap, 8-bit RGBA with straight alpha
struct Image {
    uint32_t width = 0;
    uint32_t height = 0;
    std::vector<uint8_t> pixels;  // width * height * 4

    Image() = default;
    Image(uint32_t w, uint32_t h) : width(w), height(h), pixels(static_cast<size_t>(w) * h * 4, 0) {}

    bool empty() const { return width == 0 || height == 0; }

    // Premultiplied colour in [0,1], coordinates must be in range
    Vec4 texel(uint32_t x, uint32_t y) const {
        const uint8_t* p = &pixels[(static_cast<size_t>(y) * width + x) * 4];
        const float a = p[3] / 255.0f;
        return Vec4(p[0] / 255.0f * a, p[1] / 255.0f * a, p[2] / 255.0f * a, a);
    }

    void set_pixel(uint32_t x, uint32_t y, uint8_t r, uint8_t g, uint8_t b, uint8_t a) {
        uint8_t* p = &pixels[(static_cast<size_t>(y) * width + x) * 4];
        p[0] = r;
        p[1] = g;
        p[2] = b;
        p[3] = a;
    }
};

// Filled with one straight-alpha colour
Image make_solid_image(uint32_t width, uint32_t height, uint8_t r, uint8_t g, uint8_t b, uint8_t a = 255);

} // namespace inbetween::compositor
