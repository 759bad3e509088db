#include <inbetween/compositor/raster.hpp>
#include <inbetween/core/job_system.hpp>
#include <algorithm>
#include <cmath>
#include <vector>

namespace inbetween::compositor {

namespace {

constexpr float DEGENERATE_DETERMINANT = 1e-8f;

// One box pass over a row or column, in place
void box_line(Vec4* data, int count, int stride, int radius, std::vector<Vec4>& scratch) {
    scratch.resize(static_cast<size_t>(count));
    for (int i = 0; i < count; ++i) {
        scratch[i] = data[static_cast<size_t>(i) * stride];
    }

    const float scale = 1.0f / static_cast<float>(2 * radius + 1);
    Vec4 sum(0.0f);
    for (int i = 0; i <= radius && i < count; ++i) {
        sum += scratch[i];
    }

    for (int i = 0; i < count; ++i) {
        data[static_cast<size_t>(i) * stride] = glm::max(sum * scale, Vec4(0.0f));

        const int add = i + radius + 1;
        if (add < count) {
            sum += scratch[add];
        }
        const int sub = i - radius;
        if (sub >= 0) {
            sum -= scratch[sub];
        }
    }
}

// Lines are independent, any split across workers gives the same result
void box_blur(Surface& surface, int radius) {
    const int width = static_cast<int>(surface.width());
    const int height = static_cast<int>(surface.height());
    Vec4* pixels = surface.pixels().data();

    JobSystem::parallel_for(static_cast<size_t>(height), [&](size_t start, size_t end) {
        std::vector<Vec4> scratch;
        for (size_t y = start; y < end; ++y) {
            box_line(pixels + y * width, width, 1, radius, scratch);
        }
    });
    JobSystem::parallel_for(static_cast<size_t>(width), [&](size_t start, size_t end) {
        std::vector<Vec4> scratch;
        for (size_t x = start; x < end; ++x) {
            box_line(pixels + x, height, width, radius, scratch);
        }
    });
}

// Keep premultiplied colour valid
Vec4 clamp_premultiplied(const Vec4& c) {
    const float a = std::clamp(c.a, 0.0f, 1.0f);
    return Vec4(std::clamp(c.r, 0.0f, a), std::clamp(c.g, 0.0f, a), std::clamp(c.b, 0.0f, a), a);
}

float screen(float cb, float cs) {
    return cb + cs - cb * cs;
}

} // namespace

Vec4 sample_bilinear(const Image& image, const Vec2& position) {
    if (image.empty()) {
        return Vec4(0.0f);
    }

    const float fx = position.x - 0.5f;
    const float fy = position.y - 0.5f;
    const float x_floor = std::floor(fx);
    const float y_floor = std::floor(fy);
    const float tx = fx - x_floor;
    const float ty = fy - y_floor;

    const int max_x = static_cast<int>(image.width) - 1;
    const int max_y = static_cast<int>(image.height) - 1;
    const int x0 = std::clamp(static_cast<int>(x_floor), 0, max_x);
    const int y0 = std::clamp(static_cast<int>(y_floor), 0, max_y);
    const int x1 = std::clamp(static_cast<int>(x_floor) + 1, 0, max_x);
    const int y1 = std::clamp(static_cast<int>(y_floor) + 1, 0, max_y);

    const Vec4 top = glm::mix(image.texel(x0, y0), image.texel(x1, y0), tx);
    const Vec4 bottom = glm::mix(image.texel(x0, y1), image.texel(x1, y1), tx);
    return glm::mix(top, bottom, ty);
}

IRect transformed_bounds(const Image& image, const Mat3& transform) {
    const float w = static_cast<float>(image.width);
    const float h = static_cast<float>(image.height);
    const Vec2 corners[4] = {
        transform_point(transform, Vec2(0.0f, 0.0f)),
        transform_point(transform, Vec2(w, 0.0f)),
        transform_point(transform, Vec2(0.0f, h)),
        transform_point(transform, Vec2(w, h)),
    };

    Vec2 lo = corners[0];
    Vec2 hi = corners[0];
    for (const Vec2& corner : corners) {
        if (!std::isfinite(corner.x) || !std::isfinite(corner.y)) {
            return IRect();
        }
        lo = glm::min(lo, corner);
        hi = glm::max(hi, corner);
    }

    // Keep the integer conversion in range for wild transforms
    constexpr float LIMIT = 1.0e6f;
    lo = glm::clamp(glm::floor(lo), Vec2(-LIMIT), Vec2(LIMIT));
    hi = glm::clamp(glm::ceil(hi), Vec2(-LIMIT), Vec2(LIMIT));
    return IRect(IVec2(lo), IVec2(hi));
}

bool draw_image(Surface& target, const IVec2& origin, const Image& image,
                const Mat3& transform, float alpha) {
    const float det = glm::determinant(transform);
    if (!std::isfinite(det) || std::abs(det) < DEGENERATE_DETERMINANT) {
        return false;
    }
    if (image.empty() || target.empty() || alpha <= 0.0f) {
        return true;
    }

    const Mat3 inverse = glm::inverse(transform);
    const float w = static_cast<float>(image.width);
    const float h = static_cast<float>(image.height);

    IRect canvas = transformed_bounds(image, transform);
    IRect local(canvas.min - origin, canvas.max - origin);
    local = local.intersect(target.bounds());
    if (local.empty()) {
        return true;
    }

    for (int y = local.min.y; y < local.max.y; ++y) {
        for (int x = local.min.x; x < local.max.x; ++x) {
            const Vec2 centre(static_cast<float>(origin.x + x) + 0.5f,
                              static_cast<float>(origin.y + y) + 0.5f);
            const Vec2 p = transform_point(inverse, centre);
            if (p.x < 0.0f || p.y < 0.0f || p.x >= w || p.y >= h) {
                continue;
            }

            const Vec4 src = sample_bilinear(image, p) * alpha;
            Vec4& dst = target.at(x, y);
            dst = src + dst * (1.0f - src.a);
        }
    }

    return true;
}

void gaussian_blur(Surface& surface, float sigma) {
    if (!std::isfinite(sigma) || sigma <= 0.0f || surface.empty()) {
        return;
    }

    // Box width giving the same variance over three passes
    const float ideal_width = std::sqrt(4.0f * sigma * sigma + 1.0f);
    const int radius = std::max(1, static_cast<int>(std::lround((ideal_width - 1.0f) * 0.5f)));

    for (int pass = 0; pass < 3; ++pass) {
        box_blur(surface, radius);
    }
}

void apply_brightness(Surface& surface, float percent) {
    const float factor = std::max(0.0f, percent / 100.0f);
    if (!std::isfinite(factor) || factor == 1.0f) {
        return;
    }

    for (Vec4& p : surface.pixels()) {
        p = clamp_premultiplied(Vec4(p.r * factor, p.g * factor, p.b * factor, p.a));
    }
}

void apply_glow(Surface& surface, float radius, float strength) {
    if (!std::isfinite(radius) || radius <= 0.0f || surface.empty()) {
        return;
    }

    Surface halo(surface.width(), surface.height());
    const std::vector<Vec4>& src = surface.pixels();
    std::vector<Vec4>& dst = halo.pixels();
    for (size_t i = 0; i < src.size(); ++i) {
        dst[i] = Vec4(src[i].a * strength);
    }

    // Drop-shadow radius is twice the standard deviation
    gaussian_blur(halo, radius * 0.5f);

    std::vector<Vec4>& pixels = surface.pixels();
    for (size_t i = 0; i < pixels.size(); ++i) {
        pixels[i] = clamp_premultiplied(pixels[i] + dst[i] * (1.0f - pixels[i].a));
    }
}

void apply_mask(Surface& layer, const IVec2& origin, const Image& mask, const Mat3& transform) {
    Surface coverage(layer.width(), layer.height());
    draw_image(coverage, origin, mask, transform);

    std::vector<Vec4>& pixels = layer.pixels();
    const std::vector<Vec4>& mask_pixels = coverage.pixels();
    for (size_t i = 0; i < pixels.size(); ++i) {
        pixels[i] *= mask_pixels[i].a;
    }
}

float blend_channel(anim::BlendMode mode, float backdrop, float source) {
    switch (mode) {
        case anim::BlendMode::Normal:   return source;
        case anim::BlendMode::Multiply: return backdrop * source;
        case anim::BlendMode::Screen:   return screen(backdrop, source);
        case anim::BlendMode::Overlay:
            // Hard light with the layers swapped
            return backdrop <= 0.5f
                ? 2.0f * backdrop * source
                : screen(source, 2.0f * backdrop - 1.0f);
        case anim::BlendMode::Darken:   return std::min(backdrop, source);
        case anim::BlendMode::Lighten:  return std::max(backdrop, source);
    }
    return source;
}

void blend_layer(Surface& target, const Surface& layer, const IVec2& origin,
                 anim::BlendMode mode, float opacity) {
    opacity = std::clamp(core::finite_or(opacity, 0.0f), 0.0f, 1.0f);
    if (opacity <= 0.0f) {
        return;
    }

    const IRect canvas(origin, origin + IVec2(static_cast<int>(layer.width()), static_cast<int>(layer.height())));
    const IRect area = canvas.intersect(target.bounds());
    if (area.empty()) {
        return;
    }

    for (int y = area.min.y; y < area.max.y; ++y) {
        for (int x = area.min.x; x < area.max.x; ++x) {
            const Vec4 src = layer.at(x - origin.x, y - origin.y) * opacity;
            if (src.a <= 0.0f) {
                continue;
            }

            Vec4& dst = target.at(x, y);
            if (mode == anim::BlendMode::Normal) {
                dst = clamp_premultiplied(src + dst * (1.0f - src.a));
                continue;
            }

            const float as = src.a;
            const float ab = dst.a;
            Vec4 result(0.0f, 0.0f, 0.0f, as + ab * (1.0f - as));
            for (int c = 0; c < 3; ++c) {
                const float cs = src[c] / as;
                const float cb = ab > 0.0f ? dst[c] / ab : 0.0f;
                result[c] = (1.0f - ab) * src[c] + (1.0f - as) * dst[c] + as * ab * blend_channel(mode, cb, cs);
            }
            dst = clamp_premultiplied(result);
        }
    }
}

} // namespace inbetween::compositor
