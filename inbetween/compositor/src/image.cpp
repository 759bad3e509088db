#include <inbetween/compositor/image.hpp>

namespace inbetween::compositor {

Image make_solid_image(uint32_t width, uint32_t height, uint8_t r, uint8_t g, uint8_t b, uint8_t a) {
    Image image(width, height);
    for (uint32_t y = 0; y < height; ++y) {
        for (uint32_t x = 0; x < width; ++x) {
            image.set_pixel(x, y, r, g, b, a);
        }
    }
    return image;
}

} // namespace inbetween::compositor
