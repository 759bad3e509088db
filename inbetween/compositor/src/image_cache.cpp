#include <inbetween/compositor/image_cache.hpp>
#include <inbetween/core/job_system.hpp>
#include <inbetween/core/log.hpp>

namespace inbetween::compositor {

ImageCache::ImageCache(std::shared_ptr<IImageSource> source)
    : m_source(std::move(source))
    , m_state(std::make_shared<State>()) {
}

ImageCache::~ImageCache() = default;

std::shared_future<ImageLoadResult> ImageCache::request(const std::string& reference) {
    auto promise = std::make_shared<std::promise<ImageLoadResult>>();
    std::shared_future<ImageLoadResult> future;
    uint64_t generation = 0;

    {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        auto it = m_state->entries.find(reference);
        if (it != m_state->entries.end()) {
            m_state->stats.hits++;
            return it->second.future;
        }

        future = promise->get_future().share();
        generation = m_state->next_generation++;
        m_state->entries.emplace(reference, Entry{future, generation});
        m_state->stats.decodes++;
    }

    // Submitted outside the lock, the job may run inline on this thread
    JobSystem::submit([state = m_state, source = m_source, reference, promise, generation]() {
        ImageLoadResult result = source
            ? source->load(reference)
            : ImageLoadResult{nullptr, "no image source"};

        if (!result.ok()) {
            core::log(core::LogLevel::Warn, "[ImageCache] Failed to decode '{}': {}",
                      reference.substr(0, 96), result.error);

            std::lock_guard<std::mutex> lock(state->mutex);
            auto it = state->entries.find(reference);
            if (it != state->entries.end() && it->second.generation == generation) {
                state->entries.erase(it);
            }
            state->stats.failures++;
        }

        promise->set_value(std::move(result));
    });

    return future;
}

ImageLoadResult ImageCache::get(const std::string& reference, std::chrono::milliseconds timeout) {
    std::shared_future<ImageLoadResult> future = request(reference);
    if (future.wait_for(timeout) != std::future_status::ready) {
        return {nullptr, "decode timed out"};
    }
    return future.get();
}

bool ImageCache::insert(const std::string& reference, std::shared_ptr<const Image> image) {
    if (!image) {
        return false;
    }

    std::promise<ImageLoadResult> promise;
    promise.set_value(ImageLoadResult{std::move(image), {}});

    std::lock_guard<std::mutex> lock(m_state->mutex);
    if (m_state->entries.count(reference) > 0) {
        return false;
    }
    m_state->entries.emplace(reference, Entry{promise.get_future().share(), m_state->next_generation++});
    return true;
}

bool ImageCache::contains(const std::string& reference) const {
    std::lock_guard<std::mutex> lock(m_state->mutex);
    return m_state->entries.count(reference) > 0;
}

bool ImageCache::evict(const std::string& reference) {
    std::lock_guard<std::mutex> lock(m_state->mutex);
    return m_state->entries.erase(reference) > 0;
}

void ImageCache::clear() {
    std::lock_guard<std::mutex> lock(m_state->mutex);
    m_state->entries.clear();
}

size_t ImageCache::size() const {
    std::lock_guard<std::mutex> lock(m_state->mutex);
    return m_state->entries.size();
}

ImageCacheStats ImageCache::stats() const {
    std::lock_guard<std::mutex> lock(m_state->mutex);
    return m_state->stats;
}

} // namespace inbetween::compositor
