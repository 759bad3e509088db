#include <inbetween/compositor/export_driver.hpp>
#include <inbetween/anim/player.hpp>
#include <inbetween/core/filesystem.hpp>
#include <inbetween/core/log.hpp>
#include <chrono>
#include <cmath>
#include <format>

namespace inbetween::compositor {

const char* to_string(ExportError error) {
    switch (error) {
        case ExportError::None: return "none";
        case ExportError::NothingToExport: return "nothing to export";
        case ExportError::AllFramesFailed: return "all frames failed";
        case ExportError::Cancelled: return "cancelled";
    }
    return "unknown";
}

ExportDriver::ExportDriver(const Compositor& compositor)
    : m_compositor(compositor) {
}

size_t ExportDriver::output_frame_count(size_t source_frames, const ExportOptions& options) {
    const float output_fps = options.output_fps > 0.0f ? options.output_fps : options.fps;
    const float duration = anim::sequence_duration_ms(source_frames, options.fps);
    if (duration <= 0.0f || !std::isfinite(output_fps) || output_fps <= 0.0f) {
        return 0;
    }
    return static_cast<size_t>(std::lround(duration * output_fps / 1000.0f));
}

ExportResult ExportDriver::run(const std::vector<anim::Frame>& frames,
                               const std::vector<anim::CameraKeyframe>& camera,
                               const ExportOptions& options,
                               const ExportFrameCallback& on_frame) {
    auto start_time = std::chrono::high_resolution_clock::now();

    ExportResult result;
    m_cancel_requested = false;
    m_running = true;

    result.frames_total = output_frame_count(frames.size(), options);
    if (result.frames_total == 0) {
        result.error = ExportError::NothingToExport;
        core::log(core::LogLevel::Warn, "[Export] Nothing to export ({} frames at {} fps)",
                  frames.size(), options.fps);
        m_running = false;
        return result;
    }

    const bool write_files = !options.output_directory.empty();
    if (write_files && !core::FileSystem::create_directories(options.output_directory)) {
        core::log(core::LogLevel::Error, "[Export] Cannot create output directory: {}", options.output_directory);
        result.failures.push_back({0, "cannot create " + options.output_directory});
        result.error = ExportError::AllFramesFailed;
        m_running = false;
        return result;
    }

    const uint32_t width = options.width > 0 ? options.width : m_compositor.config().width;
    const uint32_t height = options.height > 0 ? options.height : m_compositor.config().height;
    const float output_fps = options.output_fps > 0.0f ? options.output_fps : options.fps;
    const float output_interval = 1000.0f / output_fps;

    core::log(core::LogLevel::Info, "[Export] Rendering {} frames at {}x{}", result.frames_total, width, height);

    for (size_t index = 0; index < result.frames_total; ++index) {
        if (m_cancel_requested) {
            result.error = ExportError::Cancelled;
            core::log(core::LogLevel::Info, "[Export] Cancelled after {} frames", index);
            break;
        }

        const float time = static_cast<float>(index) * output_interval;
        const anim::SequenceSample sample = anim::sample_sequence(frames, camera, time, options.fps, options.tween);

        CompositeResult render = m_compositor.composite(frames[sample.frame_index], &sample.elements,
                                                        sample.camera, width, height);
        if (!render.ok()) {
            core::log(core::LogLevel::Warn, "[Export] Frame {} failed: {}", index, render.message);
            result.failures.push_back({index, render.message});
        } else {
            bool written = true;
            if (write_files) {
                const std::string path = core::FileSystem::join(
                    options.output_directory, std::format("{}{:05}.png", options.file_prefix, index));
                written = render.surface->save_png(path);
                if (written) {
                    result.written_files.push_back(path);
                } else {
                    result.failures.push_back({index, "cannot write " + path});
                }
            }

            if (written) {
                result.frames_rendered++;
                if (on_frame) {
                    on_frame(index, *render.surface);
                }
            }
        }

        if (m_progress_callback) {
            m_progress_callback(static_cast<float>(index + 1) / static_cast<float>(result.frames_total));
        }
    }

    if (result.error == ExportError::None && result.frames_rendered == 0) {
        result.error = ExportError::AllFramesFailed;
        core::log(core::LogLevel::Error, "[Export] All {} frames failed", result.frames_total);
    }

    auto end_time = std::chrono::high_resolution_clock::now();
    result.export_time_ms = std::chrono::duration<float, std::milli>(end_time - start_time).count();

    if (result.ok()) {
        core::log(core::LogLevel::Info, "[Export] Rendered {} of {} frames in {:.1f} ms",
                  result.frames_rendered, result.frames_total, result.export_time_ms);
    }

    m_running = false;
    return result;
}

} // namespace inbetween::compositor
