#include <inbetween/core/settings.hpp>
#include <inbetween/core/filesystem.hpp>
#include <inbetween/core/log.hpp>
#include <nlohmann/json.hpp>

namespace inbetween::core {

using json = nlohmann::json;

StudioSettings& StudioSettings::get() {
    static StudioSettings instance;
    return instance;
}

bool StudioSettings::load(const std::string& path) {
    std::string content = FileSystem::read_text(path);
    if (content.empty()) {
        log(LogLevel::Error, "[Settings] Failed to read {}", path);
        return false;
    }
    return load_from_string(content);
}

bool StudioSettings::load_from_string(const std::string& content) {
    try {
        json j = json::parse(content);

        log_level = j.value("log_level", log_level);

        if (j.contains("render")) {
            auto& r = j["render"];
            render.width = r.value("width", render.width);
            render.height = r.value("height", render.height);
            render.enable_filters = r.value("enable_filters", render.enable_filters);
            render.motion_streaks = r.value("motion_streaks", render.motion_streaks);
            render.dolly_factor = r.value("dolly_factor", render.dolly_factor);
        }

        if (j.contains("tween")) {
            auto& t = j["tween"];
            tween.motion_blur = t.value("motion_blur", tween.motion_blur);
            tween.unmatched_policy = t.value("unmatched_policy", tween.unmatched_policy);
            tween.ghost_linkage = t.value("ghost_linkage", tween.ghost_linkage);
            tween.default_easing = t.value("default_easing", tween.default_easing);
        }

        if (j.contains("playback")) {
            auto& p = j["playback"];
            playback.fps = p.value("fps", playback.fps);
            playback.playback_speed = p.value("playback_speed", playback.playback_speed);
            playback.loop = p.value("loop", playback.loop);
        }

        if (j.contains("camera")) {
            camera.duration_ms = j["camera"].value("duration_ms", camera.duration_ms);
        }

        if (j.contains("decode")) {
            auto& d = j["decode"];
            decode.timeout_ms = d.value("timeout_ms", decode.timeout_ms);
            decode.worker_threads = d.value("worker_threads", decode.worker_threads);
        }

        return true;
    } catch (const json::exception& e) {
        log(LogLevel::Error, "[Settings] Invalid settings JSON: {}", e.what());
        return false;
    }
}

std::string StudioSettings::to_json_string() const {
    json j;

    j["log_level"] = log_level;

    j["render"] = {
        {"width", render.width},
        {"height", render.height},
        {"enable_filters", render.enable_filters},
        {"motion_streaks", render.motion_streaks},
        {"dolly_factor", render.dolly_factor}
    };

    j["tween"] = {
        {"motion_blur", tween.motion_blur},
        {"unmatched_policy", tween.unmatched_policy},
        {"ghost_linkage", tween.ghost_linkage},
        {"default_easing", tween.default_easing}
    };

    j["playback"] = {
        {"fps", playback.fps},
        {"playback_speed", playback.playback_speed},
        {"loop", playback.loop}
    };

    j["camera"] = {
        {"duration_ms", camera.duration_ms}
    };

    j["decode"] = {
        {"timeout_ms", decode.timeout_ms},
        {"worker_threads", decode.worker_threads}
    };

    return j.dump(4);
}

bool StudioSettings::save(const std::string& path) const {
    return FileSystem::write_text(path, to_json_string());
}

void StudioSettings::reset() {
    *this = StudioSettings{};
}

} // namespace inbetween::core
