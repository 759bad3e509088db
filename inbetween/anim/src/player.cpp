#include <inbetween/anim/player.hpp>
#include <inbetween/core/log.hpp>
#include <inbetween/core/math.hpp>
#include <inbetween/core/settings.hpp>
#include <algorithm>
#include <cmath>

namespace inbetween::anim {

float frame_interval_ms(float fps) {
    if (!std::isfinite(fps) || fps <= 0.0f) {
        return 0.0f;
    }
    return 1000.0f / fps;
}

float sequence_duration_ms(size_t frame_count, float fps) {
    return static_cast<float>(frame_count) * frame_interval_ms(fps);
}

SequenceSample sample_sequence(const std::vector<Frame>& frames,
                               const std::vector<CameraKeyframe>& camera,
                               float time_ms,
                               float fps,
                               const TweenOptions& options) {
    SequenceSample sample;
    sample.camera = transform_at_time(camera, time_ms);

    if (frames.empty()) {
        return sample;
    }

    const float time = std::max(0.0f, core::finite_or(time_ms, 0.0f));
    const float interval = frame_interval_ms(fps);

    size_t index = 0;
    float progress = 0.0f;
    if (interval > 0.0f) {
        // Clamp before the integer conversion, the quotient can exceed size_t
        const float last = static_cast<float>(frames.size() - 1);
        const float position = std::min(time / interval, last);
        index = std::min(static_cast<size_t>(std::floor(position)), frames.size() - 1);
        progress = std::clamp(position - static_cast<float>(index), 0.0f, 1.0f);
    }

    sample.frame_index = index;

    if (index + 1 < frames.size()) {
        sample.next_index = index + 1;
        sample.progress = progress;
        sample.elements = tween_elements(frames[index].elements, frames[index + 1].elements,
                                         progress, options);
    } else {
        // Last frame holds
        sample.next_index = index;
        sample.progress = 0.0f;
        sample.elements.reserve(frames[index].elements.size());
        for (const auto& element : frames[index].elements) {
            sample.elements.push_back(sanitize_element(element));
        }
    }

    return sample;
}

// ============================================================================
// SequencePlayer
// ============================================================================

SequencePlayer::SequencePlayer() = default;
SequencePlayer::~SequencePlayer() = default;

void SequencePlayer::load(const std::vector<Frame>* frames, const CameraTrack* camera) {
    stop();
    m_frames = frames;
    m_camera = camera;
    m_current_time = 0.0f;

    if (m_frames && m_frames->empty()) {
        core::log(core::LogLevel::Warn, "[Playback] Loaded an empty frame sequence");
    }
}

void SequencePlayer::unload() {
    stop();
    m_frames = nullptr;
    m_camera = nullptr;
}

void SequencePlayer::play() {
    if (!has_sequence()) return;

    m_stop_requested = false;

    if (m_state == PlaybackState::Stopped) {
        fire_event(PlaybackEvent::Started);
    } else if (m_state == PlaybackState::Paused) {
        fire_event(PlaybackEvent::Resumed);
    }

    m_state = PlaybackState::Playing;
}

void SequencePlayer::pause() {
    if (m_state == PlaybackState::Playing) {
        m_state = PlaybackState::Paused;
        fire_event(PlaybackEvent::Paused);
    }
}

void SequencePlayer::stop() {
    if (m_state != PlaybackState::Stopped) {
        m_state = PlaybackState::Stopped;
        m_current_time = 0.0f;
        fire_event(PlaybackEvent::Stopped);
    }
}

void SequencePlayer::toggle_play_pause() {
    if (m_state == PlaybackState::Playing) {
        pause();
    } else {
        play();
    }
}

void SequencePlayer::seek(float time_ms) {
    if (!std::isfinite(time_ms)) return;

    const size_t old_index = get_current_frame_index();
    m_current_time = std::clamp(time_ms, 0.0f, get_duration());
    check_frame_change(old_index);
}

void SequencePlayer::seek_to_start() {
    seek(0.0f);
}

void SequencePlayer::seek_to_end() {
    // Start of the last frame, the end itself is past the sequence
    if (has_sequence()) {
        seek_to_frame(m_frames->size() - 1);
    }
}

void SequencePlayer::seek_to_frame(size_t index) {
    if (!has_sequence()) return;
    index = std::min(index, m_frames->size() - 1);
    seek(static_cast<float>(index) * frame_interval_ms(m_frame_rate));
}

void SequencePlayer::step_forward() {
    if (has_sequence()) {
        seek_to_frame(get_current_frame_index() + 1);
    }
}

void SequencePlayer::step_backward() {
    const size_t index = get_current_frame_index();
    if (has_sequence() && index > 0) {
        seek_to_frame(index - 1);
    }
}

void SequencePlayer::configure(const core::PlaybackSettings& settings) {
    m_frame_rate = settings.fps;
    m_playback_speed = settings.playback_speed;
    m_looping = settings.loop;
}

float SequencePlayer::get_duration() const {
    return m_frames ? sequence_duration_ms(m_frames->size(), m_frame_rate) : 0.0f;
}

float SequencePlayer::get_progress() const {
    float duration = get_duration();
    return duration > 0.0f ? m_current_time / duration : 0.0f;
}

size_t SequencePlayer::get_current_frame_index() const {
    const float interval = frame_interval_ms(m_frame_rate);
    if (!has_sequence() || interval <= 0.0f) {
        return 0;
    }
    const float last = static_cast<float>(m_frames->size() - 1);
    return static_cast<size_t>(std::floor(std::min(m_current_time / interval, last)));
}

bool SequencePlayer::update(float delta_ms) {
    if (m_stop_requested.exchange(false)) {
        stop();
        return false;
    }

    if (m_state != PlaybackState::Playing || !has_sequence()) {
        return false;
    }

    const float advance = delta_ms * m_playback_speed;
    if (!std::isfinite(advance) || advance <= 0.0f) {
        return false;
    }

    const size_t old_index = get_current_frame_index();
    const float duration = get_duration();

    m_current_time += advance;

    if (m_current_time >= duration) {
        if (m_looping && duration > 0.0f) {
            m_current_time = std::fmod(m_current_time, duration);
            fire_event(PlaybackEvent::Looped);
        } else {
            stop();
            fire_event(PlaybackEvent::Finished);
            return true;
        }
    }

    check_frame_change(old_index);
    return true;
}

SequenceSample SequencePlayer::sample() const {
    static const std::vector<Frame> no_frames;
    static const std::vector<CameraKeyframe> no_keyframes;

    return sample_sequence(m_frames ? *m_frames : no_frames,
                           m_camera ? m_camera->keyframes() : no_keyframes,
                           m_current_time, m_frame_rate, m_tween_options);
}

void SequencePlayer::fire_event(PlaybackEvent event, const std::string& data) {
    if (m_event_callback) {
        m_event_callback(event, data);
    }
}

void SequencePlayer::check_frame_change(size_t old_index) {
    const size_t index = get_current_frame_index();
    if (index != old_index && has_sequence()) {
        fire_event(PlaybackEvent::FrameChanged, (*m_frames)[index].id);
    }
}

} // namespace inbetween::anim
