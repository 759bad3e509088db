#pragma once

#include <inbetween/anim/element.hpp>
#include <inbetween/compositor/image.hpp>
#include <inbetween/compositor/surface.hpp>
#include <inbetween/core/math.hpp>

namespace inbetween::compositor {

// Software rasteriser behind the compositor. Every routine works on
// premultiplied colour, processes pixels in a fixed order and keeps no
// state between calls.

// Premultiplied bilinear sample at image pixel coordinates (texel centres at
// +0.5), clamped to the edge
Vec4 sample_bilinear(const Image& image, const Vec2& position);

// Source-over image into target. transform maps image pixels to canvas
// pixels, target covers the canvas rectangle starting at origin.
// Returns false for a degenerate transform, nothing is drawn then.
bool draw_image(Surface& target, const IVec2& origin, const Image& image,
                const Mat3& transform, float alpha = 1.0f);

// Canvas-space bounding box of the transformed image, rounded outwards
IRect transformed_bounds(const Image& image, const Mat3& transform);

// Gaussian blur with standard deviation sigma, approximated by three box
// passes. Pixels outside the surface count as transparent.
void gaussian_blur(Surface& surface, float sigma);

// Scale colour by percent / 100 (100 = unchanged)
void apply_brightness(Surface& surface, float percent);

// White outward halo drawn under the layer from its blurred alpha
void apply_glow(Surface& surface, float radius, float strength = 0.8f);

// Multiply the layer alpha by the alpha of mask drawn with transform
void apply_mask(Surface& layer, const IVec2& origin, const Image& mask, const Mat3& transform);

// Separable blend function B(cb, cs) on straight colour channels
float blend_channel(anim::BlendMode mode, float backdrop, float source);

// Composite layer (positioned at origin) onto target with the given mode and
// opacity in [0,1], pixels outside target are dropped
void blend_layer(Surface& target, const Surface& layer, const IVec2& origin,
                 anim::BlendMode mode, float opacity);

} // namespace inbetween::compositor
