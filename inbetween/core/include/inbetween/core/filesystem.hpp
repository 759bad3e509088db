#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace inbetween::core {

struct FileSystem {
    static bool exists(const std::string& path);
    static std::vector<uint8_t> read_binary(const std::string& path);
    static std::string read_text(const std::string& path);
    static bool write_text(const std::string& path, const std::string& text);

    // Creates the directory and any missing parents
    static bool create_directories(const std::string& path);

    static std::string join(const std::string& directory, const std::string& name);
};

} // namespace inbetween::core
