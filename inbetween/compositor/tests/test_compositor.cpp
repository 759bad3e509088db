#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <inbetween/compositor/compositor.hpp>
#include <inbetween/compositor/raster.hpp>
#include <inbetween/core/job_system.hpp>
#include <inbetween/core/log.hpp>
#include <inbetween/core/settings.hpp>
#include <thread>

using namespace inbetween::compositor;
using namespace inbetween::anim;
using Catch::Matchers::WithinAbs;

namespace {

class WarnSink : public inbetween::core::ILogSink {
public:
    void log(inbetween::core::LogLevel level, const std::string& category, const std::string&) override {
        if (level == inbetween::core::LogLevel::Warn && category == "Compositor") {
            warnings++;
        }
    }

    int warnings = 0;
};

struct Rgba {
    int r, g, b, a;
};

Rgba pixel(const Surface& surface, int x, int y) {
    const std::vector<uint8_t> rgba = surface.to_rgba8();
    const size_t i = (static_cast<size_t>(y) * surface.width() + x) * 4;
    return {rgba[i], rgba[i + 1], rgba[i + 2], rgba[i + 3]};
}

Element make_element(const std::string& id, const std::string& image, float x, float y, float size) {
    Element element;
    element.id = id;
    element.label = id;
    element.image = image;
    element.x = x;
    element.y = y;
    element.width = size;
    element.height = size;
    return element;
}

// 16x16 output over an in-memory image library
class CompositorFixture {
protected:
    CompositorFixture()
        : source(std::make_shared<MemoryImageSource>())
        , cache(std::make_shared<ImageCache>(source)) {
        source->add("black", make_solid_image(4, 4, 0, 0, 0));
        source->add("white", make_solid_image(2, 2, 255, 255, 255));
        source->add("red", make_solid_image(4, 4, 255, 0, 0));
        source->add("green", make_solid_image(2, 2, 0, 255, 0));
        source->add("blue", make_solid_image(2, 2, 0, 0, 255));

        Image halves(2, 1);
        halves.set_pixel(0, 0, 255, 0, 0, 255);
        halves.set_pixel(1, 0, 0, 0, 255, 255);
        source->add("red|blue", halves);

        Image mask(2, 1);
        mask.set_pixel(0, 0, 255, 255, 255, 255);
        mask.set_pixel(1, 0, 255, 255, 255, 0);
        source->add("left-mask", mask);

        config.width = 16;
        config.height = 16;
        config.decode_timeout = std::chrono::milliseconds(2000);
    }

    Compositor make_compositor() const { return Compositor(cache, config); }

    Frame make_frame(const std::string& base) const {
        Frame frame;
        frame.id = "frame";
        frame.thumbnail = base;
        return frame;
    }

    std::shared_ptr<MemoryImageSource> source;
    std::shared_ptr<ImageCache> cache;
    RenderConfig config;
};

} // namespace

// ============================================================================
// Base Image Tests
// ============================================================================

TEST_CASE_METHOD(CompositorFixture, "Base image fills the surface", "[compositor]") {
    CompositeResult result = make_compositor().composite(make_frame("red"));

    REQUIRE(result.ok());
    REQUIRE(result.surface->width() == 16);
    REQUIRE(result.surface->height() == 16);

    for (int y = 0; y < 16; y += 5) {
        for (int x = 0; x < 16; x += 5) {
            Rgba p = pixel(*result.surface, x, y);
            REQUIRE(p.r == 255);
            REQUIRE(p.g == 0);
            REQUIRE(p.a == 255);
        }
    }
}

TEST_CASE_METHOD(CompositorFixture, "Background variant takes precedence", "[compositor]") {
    Frame frame = make_frame("red");
    frame.base_frame = "black";

    CompositeResult result = make_compositor().composite(frame);
    REQUIRE(result.ok());
    REQUIRE(pixel(*result.surface, 8, 8).r == 0);
}

TEST_CASE_METHOD(CompositorFixture, "Missing base image is fatal", "[compositor]") {
    Frame frame = make_frame("nowhere");
    frame.elements.push_back(make_element("a", "green", 0, 0, 4));

    CompositeResult result = make_compositor().composite(frame);

    REQUIRE_FALSE(result.ok());
    REQUIRE(result.error == CompositeError::BaseImageUnavailable);
    REQUIRE_FALSE(result.surface.has_value());
    REQUIRE_FALSE(result.message.empty());
}

TEST_CASE_METHOD(CompositorFixture, "Invalid output size", "[compositor]") {
    Compositor compositor = make_compositor();

    REQUIRE(compositor.composite(make_frame("red"), nullptr, std::nullopt, 0, 16).error == CompositeError::InvalidSize);
    REQUIRE(compositor.composite(make_frame("red"), nullptr, std::nullopt, 16, 0).error == CompositeError::InvalidSize);
    REQUIRE(compositor.composite(make_frame("red"), nullptr, std::nullopt, MAX_SURFACE_DIMENSION + 1, 16).error ==
            CompositeError::InvalidSize);

    CompositeResult resized = compositor.composite(make_frame("red"), nullptr, std::nullopt, 5, 3);
    REQUIRE(resized.ok());
    REQUIRE(resized.surface->width() == 5);
    REQUIRE(resized.surface->height() == 3);
}

// ============================================================================
// Element Tests
// ============================================================================

TEST_CASE_METHOD(CompositorFixture, "Elements are drawn in paint order", "[compositor]") {
    Frame frame = make_frame("red");
    frame.elements.push_back(make_element("a", "green", 0, 0, 8));
    frame.elements.push_back(make_element("b", "blue", 4, 4, 8));

    CompositeResult result = make_compositor().composite(frame);
    REQUIRE(result.ok());

    Rgba only_a = pixel(*result.surface, 1, 1);
    REQUIRE(only_a.g == 255);
    REQUIRE(only_a.r == 0);

    Rgba overlap = pixel(*result.surface, 6, 6);
    REQUIRE(overlap.b == 255);
    REQUIRE(overlap.g == 0);

    Rgba outside = pixel(*result.surface, 14, 1);
    REQUIRE(outside.r == 255);
}

TEST_CASE_METHOD(CompositorFixture, "Missing element image skips only that element", "[compositor]") {
    WarnSink sink;
    inbetween::core::add_log_sink(&sink);

    Frame frame = make_frame("red");
    frame.elements.push_back(make_element("a", "green", 0, 0, 4));
    frame.elements.push_back(make_element("lost", "missing.png", 4, 4, 4));
    frame.elements.push_back(make_element("c", "blue", 8, 8, 4));

    CompositeResult result = make_compositor().composite(frame);

    inbetween::core::remove_log_sink(&sink);

    REQUIRE(result.ok());
    REQUIRE(result.skipped_elements.size() == 1);
    REQUIRE(result.skipped_elements[0].element_id == "lost");
    REQUIRE(result.skipped_elements[0].reference == "missing.png");
    REQUIRE(sink.warnings >= 1);

    REQUIRE(pixel(*result.surface, 1, 1).g == 255);
    REQUIRE(pixel(*result.surface, 5, 5).r == 255);  // Base shows through
    REQUIRE(pixel(*result.surface, 9, 9).b == 255);
}

TEST_CASE_METHOD(CompositorFixture, "Invisible elements are not loaded", "[compositor]") {
    Frame frame = make_frame("red");
    Element ghost = make_element("ghost", "missing.png", 0, 0, 4);
    ghost.opacity = 0.0f;
    frame.elements.push_back(ghost);

    CompositeResult result = make_compositor().composite(frame);
    REQUIRE(result.ok());
    REQUIRE(result.skipped_elements.empty());
    REQUIRE_FALSE(cache->contains("missing.png"));
}

TEST_CASE_METHOD(CompositorFixture, "Override elements replace the frame's", "[compositor]") {
    Frame frame = make_frame("red");
    frame.elements.push_back(make_element("a", "green", 0, 0, 16));

    std::vector<Element> override_elements = {make_element("a", "blue", 0, 0, 16)};

    CompositeResult result = make_compositor().composite(frame, &override_elements);
    REQUIRE(result.ok());
    REQUIRE(pixel(*result.surface, 8, 8).b == 255);
}

TEST_CASE_METHOD(CompositorFixture, "Element opacity", "[compositor]") {
    Frame frame = make_frame("black");
    Element element = make_element("a", "white", 0, 0, 16);
    element.opacity = 50.0f;
    frame.elements.push_back(element);

    CompositeResult result = make_compositor().composite(frame);
    REQUIRE(result.ok());

    Rgba p = pixel(*result.surface, 8, 8);
    REQUIRE(p.r >= 127);
    REQUIRE(p.r <= 128);
    REQUIRE(p.a == 255);
}

TEST_CASE_METHOD(CompositorFixture, "Rotation pivots around the element centre", "[compositor]") {
    Frame frame = make_frame("black");
    Element element = make_element("a", "red|blue", 0, 0, 16);
    element.rotation = 180.0f;
    frame.elements.push_back(element);

    CompositeResult result = make_compositor().composite(frame);
    REQUIRE(result.ok());

    // Left and right halves swap
    REQUIRE(pixel(*result.surface, 1, 8).b == 255);
    REQUIRE(pixel(*result.surface, 14, 8).r == 255);
}

TEST_CASE_METHOD(CompositorFixture, "Inputs are not mutated", "[compositor]") {
    Frame frame = make_frame("red");
    Element element = make_element("a", "green", 2, 2, 6);
    element.opacity = 150.0f;
    element.rotation = 400.0f;
    element.blur = 1.0f;
    frame.elements.push_back(element);

    const std::vector<Element> before = frame.elements;
    CompositeResult result = make_compositor().composite(frame);

    REQUIRE(result.ok());
    REQUIRE(frame.elements == before);
    REQUIRE(frame.thumbnail == "red");
}

// ============================================================================
// Determinism Tests
// ============================================================================

TEST_CASE_METHOD(CompositorFixture, "Identical inputs give identical output", "[compositor]") {
    Frame frame = make_frame("red");
    Element a = make_element("a", "green", 1.3f, 2.7f, 7.5f);
    a.rotation = 33.0f;
    a.blur = 1.5f;
    a.glow = 2.0f;
    a.blend_mode = BlendMode::Screen;
    Element b = make_element("b", "blue", 6.0f, 5.0f, 6.0f);
    b.opacity = 60.0f;
    b.brightness = 140.0f;
    frame.elements = {a, b};

    const CameraTransform camera{1.2f, 1.0f, -2.0f, 10.0f, 0.5f};

    Compositor compositor = make_compositor();
    CompositeResult first = compositor.composite(frame, nullptr, camera);
    CompositeResult second = compositor.composite(frame, nullptr, camera);

    REQUIRE(first.ok());
    REQUIRE(second.ok());
    REQUIRE(*first.surface == *second.surface);

    auto rmse = compare_surfaces(*first.surface, *second.surface);
    REQUIRE(rmse.has_value());
    REQUIRE(*rmse == 0.0);
}

TEST_CASE_METHOD(CompositorFixture, "Parallel composites match serial output", "[compositor]") {
    inbetween::core::JobSystem::init(4);

    Frame frame = make_frame("red");
    frame.elements.push_back(make_element("a", "green", 2, 2, 6));
    frame.elements.push_back(make_element("b", "blue", 7, 7, 6));

    const Compositor compositor = make_compositor();
    CompositeResult serial = compositor.composite(frame);

    CompositeResult results[4];
    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&, i]() { results[i] = compositor.composite(frame); });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    inbetween::core::JobSystem::shutdown();

    REQUIRE(serial.ok());
    for (const auto& result : results) {
        REQUIRE(result.ok());
        REQUIRE(*result.surface == *serial.surface);
    }
}

// ============================================================================
// Camera Tests
// ============================================================================

TEST_CASE("camera_matrix", "[compositor][camera]") {
    SECTION("Identity camera is the identity matrix") {
        Mat3 m = camera_matrix(CameraTransform{}, 1920, 1080);
        Vec2 p = transform_point(m, Vec2(100.0f, 200.0f));
        REQUIRE_THAT(p.x, WithinAbs(100.0f, 0.001f));
        REQUIRE_THAT(p.y, WithinAbs(200.0f, 0.001f));
    }

    SECTION("Zoom and rotation keep the centre fixed") {
        CameraTransform camera;
        camera.zoom = 2.0f;
        camera.rotate = 45.0f;
        Vec2 centre = transform_point(camera_matrix(camera, 1920, 1080), Vec2(960.0f, 540.0f));
        REQUIRE_THAT(centre.x, WithinAbs(960.0f, 0.001f));
        REQUIRE_THAT(centre.y, WithinAbs(540.0f, 0.001f));
    }

    SECTION("Pan moves the centre") {
        CameraTransform camera;
        camera.pan_x = 10.0f;
        camera.pan_y = -5.0f;
        Vec2 centre = transform_point(camera_matrix(camera, 100, 100), Vec2(50.0f, 50.0f));
        REQUIRE_THAT(centre.x, WithinAbs(60.0f, 0.001f));
        REQUIRE_THAT(centre.y, WithinAbs(45.0f, 0.001f));
    }

    SECTION("Dolly adds to the zoom") {
        CameraTransform camera;
        camera.dolly = 10.0f;
        Vec2 corner = transform_point(camera_matrix(camera, 100, 100, 0.1f), Vec2(100.0f, 100.0f));
        REQUIRE_THAT(corner.x, WithinAbs(150.0f, 0.001f));  // Scale 2 around (50, 50)
        REQUIRE_THAT(corner.y, WithinAbs(150.0f, 0.001f));
    }
}

TEST_CASE_METHOD(CompositorFixture, "Camera transforms the whole frame around the centre", "[compositor][camera]") {
    Compositor compositor = make_compositor();
    Frame frame = make_frame("red");

    SECTION("Identity camera changes nothing") {
        CompositeResult plain = compositor.composite(frame);
        CompositeResult camera = compositor.composite(frame, nullptr, CameraTransform{});
        REQUIRE(*plain.surface == *camera.surface);
    }

    SECTION("Zooming out leaves the corners empty") {
        CameraTransform camera;
        camera.zoom = 0.5f;
        CompositeResult result = compositor.composite(frame, nullptr, camera);
        REQUIRE(result.ok());
        REQUIRE(pixel(*result.surface, 0, 0).a == 0);
        REQUIRE(pixel(*result.surface, 8, 8).a == 255);
    }

    SECTION("Dolly out behaves like zoom") {
        CameraTransform camera;
        camera.dolly = -5.0f;
        CompositeResult result = compositor.composite(frame, nullptr, camera);
        REQUIRE(pixel(*result.surface, 0, 0).a == 0);
        REQUIRE(pixel(*result.surface, 8, 8).a == 255);
    }

    SECTION("Pan shifts the image") {
        CameraTransform camera;
        camera.pan_x = 4.0f;
        CompositeResult result = compositor.composite(frame, nullptr, camera);
        REQUIRE(pixel(*result.surface, 1, 8).a == 0);
        REQUIRE(pixel(*result.surface, 8, 8).a == 255);
    }

    SECTION("Rotation turns the frame over") {
        frame.thumbnail = "red|blue";
        CameraTransform camera;
        camera.rotate = 180.0f;
        CompositeResult plain = compositor.composite(frame);
        CompositeResult turned = compositor.composite(frame, nullptr, camera);
        REQUIRE(pixel(*plain.surface, 1, 8).r == 255);
        REQUIRE(pixel(*turned.surface, 1, 8).b == 255);
    }

    SECTION("Elements move with the camera") {
        frame.elements.push_back(make_element("a", "green", 0, 0, 4));
        CameraTransform camera;
        camera.pan_x = 8.0f;
        camera.pan_y = 8.0f;
        CompositeResult result = compositor.composite(frame, nullptr, camera);
        REQUIRE(pixel(*result.surface, 9, 9).g == 255);
        REQUIRE(pixel(*result.surface, 1, 1).a == 0);
    }
}

// ============================================================================
// Blend Mode Tests
// ============================================================================

TEST_CASE("blend_channel", "[compositor][blend]") {
    REQUIRE_THAT(blend_channel(BlendMode::Normal, 0.2f, 0.7f), WithinAbs(0.7f, 1e-6f));
    REQUIRE_THAT(blend_channel(BlendMode::Multiply, 0.5f, 0.5f), WithinAbs(0.25f, 1e-6f));
    REQUIRE_THAT(blend_channel(BlendMode::Screen, 0.5f, 0.5f), WithinAbs(0.75f, 1e-6f));
    REQUIRE_THAT(blend_channel(BlendMode::Overlay, 0.25f, 0.5f), WithinAbs(0.25f, 1e-6f));
    REQUIRE_THAT(blend_channel(BlendMode::Overlay, 0.75f, 0.5f), WithinAbs(0.75f, 1e-6f));
    REQUIRE_THAT(blend_channel(BlendMode::Darken, 0.3f, 0.6f), WithinAbs(0.3f, 1e-6f));
    REQUIRE_THAT(blend_channel(BlendMode::Lighten, 0.3f, 0.6f), WithinAbs(0.6f, 1e-6f));
}

TEST_CASE_METHOD(CompositorFixture, "Blend modes against the base", "[compositor][blend]") {
    Frame frame = make_frame("red");
    Element element = make_element("a", "blue", 0, 0, 16);

    auto render = [&](BlendMode mode) {
        element.blend_mode = mode;
        frame.elements = {element};
        CompositeResult result = make_compositor().composite(frame);
        REQUIRE(result.ok());
        return pixel(*result.surface, 8, 8);
    };

    Rgba normal = render(BlendMode::Normal);
    REQUIRE((normal.r == 0 && normal.b == 255));

    Rgba multiply = render(BlendMode::Multiply);
    REQUIRE((multiply.r == 0 && multiply.g == 0 && multiply.b == 0));

    Rgba screen = render(BlendMode::Screen);
    REQUIRE((screen.r == 255 && screen.g == 0 && screen.b == 255));

    Rgba darken = render(BlendMode::Darken);
    REQUIRE((darken.r == 0 && darken.b == 0));

    Rgba lighten = render(BlendMode::Lighten);
    REQUIRE((lighten.r == 255 && lighten.b == 255));

    // Red backdrop channel 1 -> screen, blue channel 0 -> multiply
    Rgba overlay = render(BlendMode::Overlay);
    REQUIRE((overlay.r == 255 && overlay.b == 0));

    REQUIRE(normal.a == 255);
    REQUIRE(overlay.a == 255);
}

TEST_CASE_METHOD(CompositorFixture, "Blend mode does not leak to later elements", "[compositor][blend]") {
    Frame frame = make_frame("red");
    Element multiply = make_element("a", "blue", 0, 0, 8);
    multiply.blend_mode = BlendMode::Multiply;
    Element normal = make_element("b", "green", 8, 8, 8);
    frame.elements = {multiply, normal};

    CompositeResult result = make_compositor().composite(frame);
    REQUIRE(result.ok());

    Rgba p = pixel(*result.surface, 12, 12);
    REQUIRE((p.r == 0 && p.g == 255 && p.b == 0));
}

// ============================================================================
// Filter Tests
// ============================================================================

TEST_CASE_METHOD(CompositorFixture, "Blur spreads beyond the element", "[compositor][filters]") {
    Frame frame = make_frame("black");
    Element element = make_element("a", "white", 4, 4, 4);
    element.blur = 2.0f;
    frame.elements.push_back(element);

    CompositeResult blurred = make_compositor().composite(frame);
    REQUIRE(blurred.ok());
    REQUIRE(pixel(*blurred.surface, 9, 6).r > 0);

    config.enable_filters = false;
    CompositeResult sharp = make_compositor().composite(frame);
    REQUIRE(pixel(*sharp.surface, 9, 6).r == 0);
    REQUIRE(pixel(*sharp.surface, 6, 6).r == 255);
}

TEST_CASE_METHOD(CompositorFixture, "Motion blur amount adds to the blur", "[compositor][filters]") {
    Frame frame = make_frame("black");
    Element element = make_element("a", "white", 4, 4, 4);
    element.motion_blur = MotionBlur{2.0f, 0.0f};
    frame.elements.push_back(element);

    CompositeResult result = make_compositor().composite(frame);
    REQUIRE(result.ok());
    REQUIRE(pixel(*result.surface, 9, 6).r > 0);
}

TEST_CASE_METHOD(CompositorFixture, "Brightness scales colour", "[compositor][filters]") {
    Frame frame = make_frame("black");
    Element element = make_element("a", "white", 0, 0, 16);
    element.brightness = 50.0f;
    frame.elements.push_back(element);

    CompositeResult result = make_compositor().composite(frame);
    REQUIRE(result.ok());

    Rgba p = pixel(*result.surface, 8, 8);
    REQUIRE(p.r >= 127);
    REQUIRE(p.r <= 128);

    element.brightness = 300.0f;
    frame.elements = {element};
    REQUIRE(pixel(*make_compositor().composite(frame).surface, 8, 8).r == 255);
}

TEST_CASE_METHOD(CompositorFixture, "Glow draws a white halo", "[compositor][filters]") {
    Frame frame = make_frame("black");
    Element element = make_element("a", "red", 6, 6, 4);
    element.glow = 4.0f;
    frame.elements.push_back(element);

    CompositeResult result = make_compositor().composite(frame);
    REQUIRE(result.ok());

    Rgba halo = pixel(*result.surface, 11, 8);
    REQUIRE(halo.r > 0);
    REQUIRE(halo.g > 0);
    REQUIRE(halo.b > 0);

    Rgba body = pixel(*result.surface, 8, 8);
    REQUIRE((body.r == 255 && body.g == 0));
}

TEST_CASE_METHOD(CompositorFixture, "Extreme filter sizes stay bounded", "[compositor][filters]") {
    Frame frame = make_frame("black");
    Element element = make_element("a", "white", 6, 6, 4);
    element.blur = 1.0e6f;
    element.glow = 1.0e9f;
    frame.elements.push_back(element);

    CompositeResult huge = make_compositor().composite(frame);
    REQUIRE(huge.ok());
    REQUIRE(huge.surface->width() == 16);
    REQUIRE(huge.surface->height() == 16);

    // Anything past the output diagonal renders the same
    frame.elements[0].blur = 3.0e38f;
    frame.elements[0].glow = 3.0e38f;
    CompositeResult larger = make_compositor().composite(frame);
    REQUIRE(larger.ok());
    REQUIRE(larger.surface->pixels() == huge.surface->pixels());

    frame.elements[0].motion_blur = MotionBlur{1.0e9f, 0.0f};
    config.motion_streaks = true;
    REQUIRE(make_compositor().composite(frame).ok());
}

TEST_CASE_METHOD(CompositorFixture, "Mask multiplies element alpha", "[compositor][filters]") {
    Frame frame = make_frame("black");
    Element element = make_element("a", "white", 0, 0, 4);
    element.mask_image = "left-mask";
    frame.elements.push_back(element);

    CompositeResult result = make_compositor().composite(frame);
    REQUIRE(result.ok());
    REQUIRE(pixel(*result.surface, 0, 1).r == 255);
    REQUIRE(pixel(*result.surface, 3, 1).r == 0);
}

TEST_CASE_METHOD(CompositorFixture, "Missing mask skips the element", "[compositor][filters]") {
    Frame frame = make_frame("black");
    Element element = make_element("a", "white", 0, 0, 4);
    element.mask_image = "no-mask";
    frame.elements.push_back(element);

    CompositeResult result = make_compositor().composite(frame);
    REQUIRE(result.ok());
    REQUIRE(result.skipped_elements.size() == 1);
    REQUIRE(result.skipped_elements[0].reference == "no-mask");
    REQUIRE(pixel(*result.surface, 1, 1).r == 0);
}

TEST_CASE_METHOD(CompositorFixture, "Motion streaks trail the element", "[compositor][filters]") {
    Frame frame = make_frame("black");
    Element element = make_element("a", "white", 8, 4, 4);
    element.motion_blur = MotionBlur{4.0f, 0.0f};
    frame.elements.push_back(element);

    config.enable_filters = false;

    CompositeResult plain = make_compositor().composite(frame);
    REQUIRE(pixel(*plain.surface, 3, 6).r == 0);

    config.motion_streaks = true;
    CompositeResult streaked = make_compositor().composite(frame);
    Rgba trail = pixel(*streaked.surface, 3, 6);
    REQUIRE(trail.r > 0);
    REQUIRE(trail.r < 128);
    REQUIRE(pixel(*streaked.surface, 10, 6).r == 255);
}

// ============================================================================
// Configuration Tests
// ============================================================================

TEST_CASE("render_config_from settings", "[compositor]") {
    inbetween::core::StudioSettings settings;
    settings.render.width = 640;
    settings.render.height = 360;
    settings.render.enable_filters = false;
    settings.render.motion_streaks = true;
    settings.render.dolly_factor = 0.25f;
    settings.decode.timeout_ms = 1234;

    RenderConfig config = render_config_from(settings);
    REQUIRE(config.width == 640);
    REQUIRE(config.height == 360);
    REQUIRE_FALSE(config.enable_filters);
    REQUIRE(config.motion_streaks);
    REQUIRE(config.dolly_factor == 0.25f);
    REQUIRE(config.decode_timeout == std::chrono::milliseconds(1234));
}
