#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace mediaharvest::core::utils {

class StringUtils {
public:
    static std::vector<std::string> split(const std::string& str, char delimiter);
    static std::string trim(const std::string& str);
    static std::string to_lower(const std::string& str);
    static bool starts_with(const std::string& str, const std::string& prefix);
    static bool ends_with(const std::string& str, const std::string& suffix);
    static bool contains_ci(const std::string& haystack, const std::string& needle);
    static std::string replace_all(std::string str, const std::string& from, const std::string& to);
    
    // %XX sequences are decoded; malformed escapes are kept verbatim.
    static std::string percent_decode(const std::string& str);
    
    static std::string format_bytes(std::uint64_t bytes);
    static std::string format_duration(std::chrono::milliseconds duration);
};

class FileUtils {
public:
    // Keeps [A-Za-z0-9._-], everything else becomes '_'.
    static std::string sanitize_filename(const std::string& name);
    
    static std::optional<std::uint64_t> file_size(const std::filesystem::path& path);
    static bool create_directories(const std::filesystem::path& path);
    static std::string read_prefix(const std::filesystem::path& path, std::size_t max_bytes);
    static std::filesystem::path absolute_normal(const std::filesystem::path& path);
};

class TimeUtils {
public:
    static std::int64_t unix_seconds(const std::chrono::system_clock::time_point& time);
    static std::string to_iso_string(const std::chrono::system_clock::time_point& time);
};

}
