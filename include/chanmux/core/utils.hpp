#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <cstdint>
#include <optional>
#include <filesystem>

namespace chanmux::core::utils {

class StringUtils {
public:
    static std::string trim(const std::string& str);
    static std::string to_lower(const std::string& str);
    static bool starts_with(const std::string& str, const std::string& prefix);
    static std::string format_bytes(size_t bytes);
    static std::string format_duration(std::chrono::milliseconds duration);
};

class FileUtils {
public:
    static bool exists(const std::filesystem::path& path);
    static bool is_file(const std::filesystem::path& path);
    static bool is_directory(const std::filesystem::path& path);
    static bool is_writable_directory(const std::filesystem::path& path);
    static std::optional<size_t> file_size(const std::filesystem::path& path);
    static std::optional<std::vector<std::uint8_t>> read_binary_file(const std::filesystem::path& path);
    static bool write_binary_file(const std::filesystem::path& path, const std::vector<std::uint8_t>& content);
};

}
