#pragma once

#include <inbetween/anim/camera_track.hpp>
#include <inbetween/anim/frame.hpp>
#include <inbetween/anim/tween.hpp>
#include <atomic>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace inbetween::core {
struct PlaybackSettings;
}

namespace inbetween::anim {

// Playback state
enum class PlaybackState : uint8_t {
    Stopped,
    Playing,
    Paused
};

// Playback events
enum class PlaybackEvent : uint8_t {
    Started,
    Paused,
    Resumed,
    Stopped,
    Finished,
    Looped,
    FrameChanged  // data = id of the frame now showing
};

// Event callback
using PlaybackEventCallback = std::function<void(PlaybackEvent, const std::string& data)>;

// Everything needed to draw the sequence at one instant
struct SequenceSample {
    size_t frame_index = 0;
    size_t next_index = 0;   // Equal to frame_index on the last frame
    float progress = 0.0f;   // Tween progress towards next_index
    std::vector<Element> elements;
    CameraTransform camera;
};

// 1000 / fps, 0 for a non-positive rate
float frame_interval_ms(float fps);
float sequence_duration_ms(size_t frame_count, float fps);

// Each frame is shown for one interval and tweens towards its successor over
// that interval. The camera is sampled at the same time on the global timeline.
SequenceSample sample_sequence(const std::vector<Frame>& frames,
                               const std::vector<CameraKeyframe>& camera,
                               float time_ms,
                               float fps,
                               const TweenOptions& options = {});

// Tick-driven preview playback over frames owned by the caller
class SequencePlayer {
public:
    SequencePlayer();
    ~SequencePlayer();

    // Data is referenced, not copied, and must outlive the player or be unloaded
    void load(const std::vector<Frame>* frames, const CameraTrack* camera = nullptr);
    void unload();

    bool has_sequence() const { return m_frames != nullptr && !m_frames->empty(); }

    // Playback control
    void play();
    void pause();
    void stop();
    void toggle_play_pause();

    // May be called from any thread, the next update() stops instead of advancing
    void request_stop() { m_stop_requested = true; }

    // Seek (milliseconds)
    void seek(float time_ms);
    void seek_to_start();
    void seek_to_end();
    void seek_to_frame(size_t index);

    // Frame stepping
    void step_forward();
    void step_backward();

    // Playback settings
    void set_frame_rate(float fps) { m_frame_rate = fps; }
    float get_frame_rate() const { return m_frame_rate; }

    void set_playback_speed(float speed) { m_playback_speed = speed; }
    float get_playback_speed() const { return m_playback_speed; }

    void set_looping(bool loop) { m_looping = loop; }
    bool is_looping() const { return m_looping; }

    void set_tween_options(const TweenOptions& options) { m_tween_options = options; }
    const TweenOptions& get_tween_options() const { return m_tween_options; }

    void configure(const core::PlaybackSettings& settings);

    // State queries
    PlaybackState get_state() const { return m_state; }
    bool is_playing() const { return m_state == PlaybackState::Playing; }
    bool is_paused() const { return m_state == PlaybackState::Paused; }
    bool is_stopped() const { return m_state == PlaybackState::Stopped; }

    float get_current_time() const { return m_current_time; }
    float get_duration() const;
    float get_progress() const; // 0-1
    size_t get_current_frame_index() const;

    // Advance by wall-clock milliseconds, returns false if nothing advanced
    bool update(float delta_ms);

    // Tweened elements and camera at the current time
    SequenceSample sample() const;

    // Event callbacks
    void set_event_callback(PlaybackEventCallback callback) { m_event_callback = std::move(callback); }

private:
    void fire_event(PlaybackEvent event, const std::string& data = "");
    void check_frame_change(size_t old_index);

    const std::vector<Frame>* m_frames = nullptr;
    const CameraTrack* m_camera = nullptr;

    PlaybackState m_state = PlaybackState::Stopped;
    std::atomic<bool> m_stop_requested{false};

    float m_current_time = 0.0f;
    float m_playback_speed = 1.0f;
    float m_frame_rate = 12.0f;
    bool m_looping = false;

    TweenOptions m_tween_options;
    PlaybackEventCallback m_event_callback;
};

} // namespace inbetween::anim
