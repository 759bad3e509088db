#include <inbetween/compositor/surface.hpp>
#include <inbetween/core/log.hpp>

#define STB_IMAGE_WRITE_IMPLEMENTATION

#if defined(__GNUC__) || defined(__clang__)
    #pragma GCC diagnostic push
    #pragma GCC diagnostic ignored "-Wall"
    #pragma GCC diagnostic ignored "-Wextra"
    #pragma GCC diagnostic ignored "-Wmissing-field-initializers"
#endif

#include <stb_image_write.h>

#if defined(__GNUC__) || defined(__clang__)
    #pragma GCC diagnostic pop
#endif

#include <algorithm>
#include <cmath>

namespace inbetween::compositor {

namespace {

uint8_t to_byte(float value) {
    return static_cast<uint8_t>(std::lround(std::clamp(value, 0.0f, 1.0f) * 255.0f));
}

} // namespace

Surface::Surface(uint32_t width, uint32_t height)
    : m_width(width)
    , m_height(height)
    , m_pixels(static_cast<size_t>(width) * height, Vec4(0.0f)) {
}

void Surface::clear(const Vec4& color) {
    std::fill(m_pixels.begin(), m_pixels.end(), color);
}

Image Surface::to_image() const {
    Image image(m_width, m_height);
    image.pixels = to_rgba8();
    return image;
}

std::vector<uint8_t> Surface::to_rgba8() const {
    std::vector<uint8_t> out(m_pixels.size() * 4, 0);

    for (size_t i = 0; i < m_pixels.size(); ++i) {
        const Vec4& p = m_pixels[i];
        if (p.a <= 0.0f) {
            continue;
        }
        const float inv_alpha = 1.0f / std::min(p.a, 1.0f);
        out[i * 4 + 0] = to_byte(p.r * inv_alpha);
        out[i * 4 + 1] = to_byte(p.g * inv_alpha);
        out[i * 4 + 2] = to_byte(p.b * inv_alpha);
        out[i * 4 + 3] = to_byte(p.a);
    }

    return out;
}

Surface Surface::from_image(const Image& image) {
    Surface surface(image.width, image.height);
    for (uint32_t y = 0; y < image.height; ++y) {
        for (uint32_t x = 0; x < image.width; ++x) {
            surface.at(static_cast<int>(x), static_cast<int>(y)) = image.texel(x, y);
        }
    }
    return surface;
}

bool Surface::save_png(const std::string& path) const {
    if (empty()) {
        core::log(core::LogLevel::Error, "[Surface] Refusing to write empty surface to {}", path);
        return false;
    }

    std::vector<uint8_t> rgba = to_rgba8();
    const int stride = static_cast<int>(m_width) * 4;
    if (!stbi_write_png(path.c_str(), static_cast<int>(m_width), static_cast<int>(m_height), 4,
                        rgba.data(), stride)) {
        core::log(core::LogLevel::Error, "[Surface] Failed to write PNG: {}", path);
        return false;
    }
    return true;
}

bool Surface::operator==(const Surface& other) const {
    return m_width == other.m_width && m_height == other.m_height && m_pixels == other.m_pixels;
}

std::optional<double> compare_surfaces(const Surface& a, const Surface& b) {
    if (a.width() != b.width() || a.height() != b.height()) {
        return std::nullopt;
    }

    const size_t total_pixels = static_cast<size_t>(a.width()) * a.height();
    if (total_pixels == 0) {
        return 0.0;
    }

    const std::vector<uint8_t> pa = a.to_rgba8();
    const std::vector<uint8_t> pb = b.to_rgba8();

    double sum_sq = 0.0;
    for (size_t i = 0; i < total_pixels; ++i) {
        const size_t base = i * 4;
        double pixel_diff_sq = 0.0;
        for (int c = 0; c < 3; ++c) { // Compare RGB only
            double d = (static_cast<double>(pa[base + c]) - static_cast<double>(pb[base + c])) / 255.0;
            pixel_diff_sq += d * d;
        }
        sum_sq += pixel_diff_sq / 3.0;  // Average across channels
    }

    return std::sqrt(sum_sq / static_cast<double>(total_pixels));
}

} // namespace inbetween::compositor
