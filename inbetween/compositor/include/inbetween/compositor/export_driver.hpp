#pragma once

#include <inbetween/anim/camera_track.hpp>
#include <inbetween/anim/frame.hpp>
#include <inbetween/anim/tween.hpp>
#include <inbetween/compositor/compositor.hpp>
#include <atomic>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace inbetween::compositor {

struct ExportOptions {
    float fps = 12.0f;         // Authoring rate, one source frame per interval
    float output_fps = 0.0f;   // Rate of the rendered sequence, 0 = fps
    uint32_t width = 0;        // 0 = compositor's configured size
    uint32_t height = 0;
    std::string output_directory;  // PNGs are written only when set
    std::string file_prefix = "frame_";
    anim::TweenOptions tween;
};

enum class ExportError : uint8_t {
    None,
    NothingToExport,
    AllFramesFailed,
    Cancelled
};

const char* to_string(ExportError error);

struct ExportFailure {
    size_t index = 0;
    std::string message;
};

struct ExportResult {
    size_t frames_rendered = 0;
    size_t frames_total = 0;
    std::vector<ExportFailure> failures;
    std::vector<std::string> written_files;
    ExportError error = ExportError::None;
    float export_time_ms = 0.0f;

    bool ok() const { return error == ExportError::None; }
};

// Receives every successfully rendered output frame in order
using ExportFrameCallback = std::function<void(size_t index, const Surface& surface)>;

// Progress in [0,1] after each output frame
using ExportProgressCallback = std::function<void(float progress)>;

// Renders a timeline to a sequence of surfaces, one output frame at a time.
// cancel() may be called from any thread and is checked between frames.
class ExportDriver {
public:
    explicit ExportDriver(const Compositor& compositor);

    ExportResult run(const std::vector<anim::Frame>& frames,
                     const std::vector<anim::CameraKeyframe>& camera,
                     const ExportOptions& options,
                     const ExportFrameCallback& on_frame = nullptr);

    void cancel() { m_cancel_requested = true; }
    bool is_running() const { return m_running; }

    void set_progress_callback(ExportProgressCallback callback) { m_progress_callback = std::move(callback); }

    // Number of output frames a run with these options produces
    static size_t output_frame_count(size_t source_frames, const ExportOptions& options);

private:
    const Compositor& m_compositor;
    std::atomic<bool> m_cancel_requested{false};
    std::atomic<bool> m_running{false};
    ExportProgressCallback m_progress_callback;
};

} // namespace inbetween::compositor
