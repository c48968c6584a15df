#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace filejet::core::utils {

class StringUtils {
public:
    static std::vector<std::string> split(const std::string& str, char delimiter);
    static std::string join(const std::vector<std::string>& parts, const std::string& delimiter);
    static std::string trim(const std::string& str);
    static std::string to_lower(const std::string& str);
    
    // Splits on the delimiter, trims every item and drops empty ones.
    static std::vector<std::string> split_list(const std::string& str, char delimiter = ',');
    
    static std::string format_bytes(std::uint64_t bytes);
    static std::string format_duration(std::chrono::milliseconds duration);
};

class FileUtils {
public:
    static bool exists(const std::filesystem::path& path);
    static bool is_file(const std::filesystem::path& path);
    static std::optional<std::uint64_t> file_size(const std::filesystem::path& path);
    static bool create_directories(const std::filesystem::path& path);
    static std::filesystem::path expand_home(const std::string& path);
    
    // Reduces a peer-supplied name to a bare file name that cannot escape
    // the output directory. Returns fallback when nothing usable is left.
    static std::string sanitize_file_name(const std::string& name, const std::string& fallback = "received.bin");
};

} // namespace filejet::core::utils
