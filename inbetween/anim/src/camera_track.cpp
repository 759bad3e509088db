#include <inbetween/anim/camera_track.hpp>
#include <inbetween/anim/easing.hpp>
#include <inbetween/core/log.hpp>
#include <inbetween/core/math.hpp>
#include <algorithm>
#include <cmath>

namespace inbetween::anim {

using core::finite_or;

namespace {

CameraTransform sanitize_transform(const CameraTransform& transform) {
    const CameraTransform identity;
    CameraTransform result;
    result.zoom = std::max(0.0f, finite_or(transform.zoom, identity.zoom));
    result.pan_x = finite_or(transform.pan_x, identity.pan_x);
    result.pan_y = finite_or(transform.pan_y, identity.pan_y);
    result.rotate = finite_or(transform.rotate, identity.rotate);
    result.dolly = finite_or(transform.dolly, identity.dolly);
    return result;
}

} // namespace

CameraTransform transform_at_time(const std::vector<CameraKeyframe>& keyframes, float time) {
    if (keyframes.empty()) {
        return CameraTransform{};
    }
    if (!std::isfinite(time)) {
        time = 0.0f;
    }

    // Before first keyframe
    if (time <= keyframes.front().time) {
        return sanitize_transform(keyframes.front().transform);
    }

    // After last keyframe
    if (time >= keyframes.back().time) {
        return sanitize_transform(keyframes.back().transform);
    }

    // First keyframe strictly after time, its predecessor is at or before it
    auto next = std::upper_bound(keyframes.begin(), keyframes.end(), time,
        [](float t, const CameraKeyframe& k) { return t < k.time; });
    const CameraKeyframe& k1 = *next;
    const CameraKeyframe& k0 = *(next - 1);

    const float span = k1.time - k0.time;
    float t = span > 0.0f ? (time - k0.time) / span : 0.0f;
    t = apply_easing(t, EaseType::EaseInOutCubic);

    const CameraTransform& a = k0.transform;
    const CameraTransform& b = k1.transform;

    CameraTransform result;
    result.zoom = lerp(a.zoom, b.zoom, t);
    result.pan_x = lerp(a.pan_x, b.pan_x, t);
    result.pan_y = lerp(a.pan_y, b.pan_y, t);
    result.rotate = lerp(a.rotate, b.rotate, t);
    result.dolly = lerp(a.dolly, b.dolly, t);
    return sanitize_transform(result);
}

CameraTrack::CameraTrack(float duration_ms)
    : m_duration(std::max(0.0f, finite_or(duration_ms, DEFAULT_CAMERA_DURATION_MS))) {
}

uint32_t CameraTrack::add_keyframe(float time, const CameraTransform& transform) {
    CameraKeyframe keyframe;
    keyframe.id = m_next_id++;
    keyframe.time = clamp_time(time);
    keyframe.transform = sanitize_transform(transform);

    m_keyframes.push_back(keyframe);
    sort_keyframes();
    return keyframe.id;
}

bool CameraTrack::remove_keyframe(uint32_t id) {
    auto it = std::find_if(m_keyframes.begin(), m_keyframes.end(),
        [id](const CameraKeyframe& k) { return k.id == id; });
    if (it == m_keyframes.end()) {
        return false;
    }
    m_keyframes.erase(it);
    return true;
}

bool CameraTrack::update_keyframe(uint32_t id, const CameraTransform& transform) {
    CameraKeyframe* keyframe = find_mutable(id);
    if (!keyframe) {
        return false;
    }
    keyframe->transform = sanitize_transform(transform);
    return true;
}

bool CameraTrack::move_keyframe(uint32_t id, float time) {
    CameraKeyframe* keyframe = find_mutable(id);
    if (!keyframe) {
        return false;
    }
    keyframe->time = clamp_time(time);
    sort_keyframes();
    return true;
}

void CameraTrack::clear_keyframes() {
    m_keyframes.clear();
}

const CameraKeyframe* CameraTrack::find_keyframe(uint32_t id) const {
    for (const auto& keyframe : m_keyframes) {
        if (keyframe.id == id) {
            return &keyframe;
        }
    }
    return nullptr;
}

void CameraTrack::set_duration(float duration_ms) {
    if (!std::isfinite(duration_ms) || duration_ms < 0.0f) {
        core::log(core::LogLevel::Warn, "[Camera] Ignoring invalid duration {}", duration_ms);
        return;
    }

    m_duration = duration_ms;
    for (auto& keyframe : m_keyframes) {
        keyframe.time = std::min(keyframe.time, m_duration);
    }
    sort_keyframes();
}

CameraTransform CameraTrack::sample(float time) const {
    return transform_at_time(m_keyframes, time);
}

void CameraTrack::sort_keyframes() {
    std::stable_sort(m_keyframes.begin(), m_keyframes.end(),
        [](const CameraKeyframe& a, const CameraKeyframe& b) {
            return a.time < b.time;
        });
}

float CameraTrack::clamp_time(float time) const {
    return std::clamp(finite_or(time, 0.0f), 0.0f, m_duration);
}

CameraKeyframe* CameraTrack::find_mutable(uint32_t id) {
    for (auto& keyframe : m_keyframes) {
        if (keyframe.id == id) {
            return &keyframe;
        }
    }
    return nullptr;
}

} // namespace inbetween::anim
