#pragma once

#include <cstdint>
#include <vector>

namespace inbetween::anim {

constexpr float DEFAULT_CAMERA_DURATION_MS = 5000.0f;

// Global virtual camera, pivoting around the output centre
struct CameraTransform {
    float zoom = 1.0f;
    float pan_x = 0.0f;   // Pixels
    float pan_y = 0.0f;   // Pixels
    float rotate = 0.0f;  // Degrees
    float dolly = 0.0f;   // Secondary scale contribution

    bool operator==(const CameraTransform&) const = default;
};

struct CameraKeyframe {
    uint32_t id = 0;
    float time = 0.0f;  // Milliseconds
    CameraTransform transform;
};

// Sample a keyframe list sorted by ascending time.
// Empty -> identity, before first / after last -> held, in between an
// ease-in-out-cubic blend of all five fields. Non-finite time samples at 0.
CameraTransform transform_at_time(const std::vector<CameraKeyframe>& keyframes, float time);

// Editable camera timeline, keyframes stay sorted and inside [0, duration]
class CameraTrack {
public:
    explicit CameraTrack(float duration_ms = DEFAULT_CAMERA_DURATION_MS);

    // Keyframe management, time is clamped into [0, duration]
    uint32_t add_keyframe(float time, const CameraTransform& transform);
    bool remove_keyframe(uint32_t id);
    bool update_keyframe(uint32_t id, const CameraTransform& transform);
    bool move_keyframe(uint32_t id, float time);
    void clear_keyframes();

    const CameraKeyframe* find_keyframe(uint32_t id) const;
    size_t keyframe_count() const { return m_keyframes.size(); }
    const std::vector<CameraKeyframe>& keyframes() const { return m_keyframes; }

    // Shrinking the duration pulls later keyframes back onto the new end
    void set_duration(float duration_ms);
    float get_duration() const { return m_duration; }

    CameraTransform sample(float time) const;

private:
    void sort_keyframes();
    float clamp_time(float time) const;
    CameraKeyframe* find_mutable(uint32_t id);

    std::vector<CameraKeyframe> m_keyframes;
    float m_duration = DEFAULT_CAMERA_DURATION_MS;
    uint32_t m_next_id = 1;
};

} // namespace inbetween::anim
