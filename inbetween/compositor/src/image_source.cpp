#include <inbetween/compositor/image_source.hpp>
#include <inbetween/core/filesystem.hpp>
#include <inbetween/core/log.hpp>

// Define STB_IMAGE_IMPLEMENTATION in exactly one .cpp file
#define STB_IMAGE_IMPLEMENTATION
#define STBI_FAILURE_USERMSG  // Get human-readable error messages

// Disable warnings for stb_image (external code)
#if defined(__GNUC__) || defined(__clang__)
    #pragma GCC diagnostic push
    #pragma GCC diagnostic ignored "-Wall"
    #pragma GCC diagnostic ignored "-Wextra"
    #pragma GCC diagnostic ignored "-Wpedantic"
    #pragma GCC diagnostic ignored "-Wunused-but-set-variable"
    #pragma GCC diagnostic ignored "-Wunused-variable"
    #pragma GCC diagnostic ignored "-Wunused-function"
#endif

#include <stb_image.h>

#if defined(__GNUC__) || defined(__clang__)
    #pragma GCC diagnostic pop
#endif

#include <cstring>
#include <limits>

namespace inbetween::compositor {

namespace {

// Value of a base64 digit, -1 for anything else
int base64_value(unsigned char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+' || c == '-') return 62;
    if (c == '/' || c == '_') return 63;
    return -1;
}

std::optional<std::vector<uint8_t>> decode_base64(const char* data, size_t length) {
    std::vector<uint8_t> out;
    out.reserve(length / 4 * 3);

    uint32_t accumulator = 0;
    int bits = 0;
    bool padding = false;

    for (size_t i = 0; i < length; ++i) {
        const unsigned char c = static_cast<unsigned char>(data[i]);
        if (c == ' ' || c == '\n' || c == '\r' || c == '\t') {
            continue;
        }
        if (c == '=') {
            padding = true;
            continue;
        }
        if (padding) {
            return std::nullopt;  // Data after padding
        }

        const int value = base64_value(c);
        if (value < 0) {
            return std::nullopt;
        }

        accumulator = (accumulator << 6) | static_cast<uint32_t>(value);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<uint8_t>((accumulator >> bits) & 0xFF));
        }
    }

    return out;
}

} // namespace

ImageLoadResult decode_image(const uint8_t* data, size_t size) {
    ImageLoadResult result;

    if (!data || size == 0) {
        result.error = "empty image data";
        return result;
    }
    if (size > static_cast<size_t>(std::numeric_limits<int>::max())) {
        result.error = "image data too large";
        return result;
    }

    int width = 0;
    int height = 0;
    int channels = 0;
    stbi_uc* pixels = stbi_load_from_memory(data, static_cast<int>(size), &width, &height, &channels, 4);
    if (!pixels) {
        const char* reason = stbi_failure_reason();
        result.error = reason ? reason : "decode failed";
        return result;
    }

    auto image = std::make_shared<Image>(static_cast<uint32_t>(width), static_cast<uint32_t>(height));
    std::memcpy(image->pixels.data(), pixels, image->pixels.size());
    stbi_image_free(pixels);

    result.image = std::move(image);
    return result;
}

bool is_data_uri(const std::string& reference) {
    return reference.rfind("data:", 0) == 0;
}

std::optional<std::vector<uint8_t>> decode_data_uri(const std::string& uri) {
    // Header looks like "data:image/png;base64,"
    if (!is_data_uri(uri)) {
        return std::nullopt;
    }
    const size_t comma = uri.find(',');
    if (comma == std::string::npos) {
        return std::nullopt;
    }
    const std::string header = uri.substr(0, comma);
    if (header.size() < 7 || header.compare(header.size() - 7, 7, ";base64") != 0) {
        return std::nullopt;
    }

    return decode_base64(uri.data() + comma + 1, uri.size() - comma - 1);
}

// ============================================================================
// FileImageSource
// ============================================================================

FileImageSource::FileImageSource(std::string root_directory)
    : m_root(std::move(root_directory)) {
}

ImageLoadResult FileImageSource::load(const std::string& reference) {
    if (reference.empty()) {
        return {nullptr, "empty image reference"};
    }

    if (is_data_uri(reference)) {
        auto bytes = decode_data_uri(reference);
        if (!bytes) {
            return {nullptr, "malformed data URI"};
        }
        return decode_image(bytes->data(), bytes->size());
    }

    const std::string path = (m_root.empty() || reference.front() == '/')
        ? reference
        : FileSystem::join(m_root, reference);

    std::vector<uint8_t> bytes = FileSystem::read_binary(path);
    if (bytes.empty()) {
        return {nullptr, "cannot read " + path};
    }

    ImageLoadResult result = decode_image(bytes.data(), bytes.size());
    if (!result.ok()) {
        result.error = path + ": " + result.error;
    }
    return result;
}

// ============================================================================
// MemoryImageSource
// ============================================================================

void MemoryImageSource::add(const std::string& reference, Image image) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_images[reference] = std::make_shared<const Image>(std::move(image));
}

bool MemoryImageSource::remove(const std::string& reference) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_images.erase(reference) > 0;
}

size_t MemoryImageSource::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_images.size();
}

ImageLoadResult MemoryImageSource::load(const std::string& reference) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_images.find(reference);
    if (it == m_images.end()) {
        return {nullptr, "unknown image reference"};
    }
    return {it->second, {}};
}

} // namespace inbetween::compositor
