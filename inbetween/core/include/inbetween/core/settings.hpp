#pragma once

#include <cstdint>
#include <string>

namespace inbetween::core {

struct RenderSettings {
    uint32_t width = 1920;
    uint32_t height = 1080;
    bool enable_filters = true;
    bool motion_streaks = false;   // Trailing copies along the motion-blur angle
    float dolly_factor = 0.1f;     // Camera scale contribution per unit of dolly
};

struct TweenSettings {
    bool motion_blur = true;
    std::string unmatched_policy = "fade";  // "fade" or "hold"
    bool ghost_linkage = true;
    std::string default_easing = "easeInOutCubic";
};

struct PlaybackSettings {
    float fps = 12.0f;
    float playback_speed = 1.0f;
    bool loop = false;
};

struct CameraSettings {
    float duration_ms = 5000.0f;
};

struct DecodeSettings {
    uint32_t timeout_ms = 5000;
    int worker_threads = 0;  // 0 = hardware_concurrency - 1
};

struct StudioSettings {
    std::string log_level = "info";

    RenderSettings render;
    TweenSettings tween;
    PlaybackSettings playback;
    CameraSettings camera;
    DecodeSettings decode;

    // Application-wide instance. Library code takes options explicitly and
    // never reads this.
    static StudioSettings& get();

    // Load settings from JSON file, missing keys keep their current value
    bool load(const std::string& path);
    bool load_from_string(const std::string& content);

    // Save settings to JSON file
    bool save(const std::string& path) const;
    std::string to_json_string() const;

    // Reset to defaults
    void reset();
};

} // namespace inbetween::core
