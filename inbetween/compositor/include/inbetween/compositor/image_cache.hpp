#pragma once

#include <inbetween/compositor/image_source.hpp>
#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace inbetween::compositor {

struct ImageCacheStats {
    uint64_t hits = 0;       // Requests served by an existing or in-flight entry
    uint64_t decodes = 0;    // Decodes started
    uint64_t failures = 0;   // Decodes that failed and were evicted
};

// Decoded images keyed by content reference, shared read-mostly across
// composite calls. Each key is written once: concurrent requests for the
// same reference share one in-flight decode, and failed decodes are evicted
// so a later request retries. Decodes run on the JobSystem.
class ImageCache {
public:
    explicit ImageCache(std::shared_ptr<IImageSource> source);
    ~ImageCache();

    ImageCache(const ImageCache&) = delete;
    ImageCache& operator=(const ImageCache&) = delete;

    // Start (or join) the decode for reference
    std::shared_future<ImageLoadResult> request(const std::string& reference);

    // request() and wait up to timeout
    ImageLoadResult get(const std::string& reference, std::chrono::milliseconds timeout);

    // Register an already decoded image. Returns false if the key is taken.
    bool insert(const std::string& reference, std::shared_ptr<const Image> image);

    bool contains(const std::string& reference) const;
    bool evict(const std::string& reference);
    void clear();
    size_t size() const;

    ImageCacheStats stats() const;

private:
    struct Entry {
        std::shared_future<ImageLoadResult> future;
        uint64_t generation = 0;
    };

    // Shared with in-flight decode jobs so they never outlive it
    struct State {
        mutable std::mutex mutex;
        std::unordered_map<std::string, Entry> entries;
        uint64_t next_generation = 1;
        ImageCacheStats stats;
    };

    std::shared_ptr<IImageSource> m_source;
    std::shared_ptr<State> m_state;
};

} // namespace inbetween::compositor
