#pragma once

#include <inbetween/compositor/image.hpp>
#include <inbetween/core/math.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace inbetween::compositor {

using namespace inbetween::core;

// Render target holding premultiplied float RGBA
class Surface {
public:
    Surface() = default;
    Surface(uint32_t width, uint32_t height);

    uint32_t width() const { return m_width; }
    uint32_t height() const { return m_height; }
    bool empty() const { return m_width == 0 || m_height == 0; }
    IRect bounds() const { return IRect({0, 0}, {static_cast<int>(m_width), static_cast<int>(m_height)}); }

    Vec4& at(int x, int y) { return m_pixels[static_cast<size_t>(y) * m_width + x]; }
    const Vec4& at(int x, int y) const { return m_pixels[static_cast<size_t>(y) * m_width + x]; }

    std::vector<Vec4>& pixels() { return m_pixels; }
    const std::vector<Vec4>& pixels() const { return m_pixels; }

    void clear(const Vec4& color = Vec4(0.0f));

    // Straight-alpha 8-bit copy, rounding is deterministic
    Image to_image() const;
    std::vector<uint8_t> to_rgba8() const;
    static Surface from_image(const Image& image);

    bool save_png(const std::string& path) const;

    bool operator==(const Surface& other) const;

private:
    uint32_t m_width = 0;
    uint32_t m_height = 0;
    std::vector<Vec4> m_pixels;
};

// Root mean square error over RGB of the 8-bit output, normalised to [0,1].
// Empty if the sizes differ.
std::optional<double> compare_surfaces(const Surface& a, const Surface& b);

} // namespace inbetween::compositor
