#pragma once

#include <inbetween/compositor/image.hpp>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace inbetween::compositor {

// Outcome of resolving one content reference
struct ImageLoadResult {
    std::shared_ptr<const Image> image;
    std::string error;

    bool ok() const { return image != nullptr; }
};

// Resolves a content reference (file path, data: URI, ...) to a decoded bitmap.
// Implementations must be callable from several threads at once.
class IImageSource {
public:
    virtual ~IImageSource() = default;
    virtual ImageLoadResult load(const std::string& reference) = 0;
};

// Decodes PNG/JPEG/BMP/TGA/... from files and "data:<mime>;base64,<payload>" URIs
class FileImageSource : public IImageSource {
public:
    // Relative paths are resolved against root_directory
    explicit FileImageSource(std::string root_directory = "");

    ImageLoadResult load(const std::string& reference) override;

private:
    std::string m_root;
};

// Pre-decoded images registered by reference, mostly for embedding and tests
class MemoryImageSource : public IImageSource {
public:
    void add(const std::string& reference, Image image);
    bool remove(const std::string& reference);
    size_t size() const;

    ImageLoadResult load(const std::string& reference) override;

private:
    mutable std::mutex m_mutex;
    std::unordered_map<std::string, std::shared_ptr<const Image>> m_images;
};

// Decode an encoded image held in memory
ImageLoadResult decode_image(const uint8_t* data, size_t size);

bool is_data_uri(const std::string& reference);

// Payload bytes of a base64 data: URI, empty on malformed input
std::optional<std::vector<uint8_t>> decode_data_uri(const std::string& uri);

} // namespace inbetween::compositor
