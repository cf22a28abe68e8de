#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace partvault::core::utils {

class StringUtils {
public:
    static std::string trim(const std::string& str);
    static std::string to_lower(const std::string& str);
    static bool starts_with(const std::string& str, const std::string& prefix);

    static std::string format_bytes(std::uint64_t bytes);
    static std::string format_duration(std::chrono::milliseconds duration);

    // RFC 3986 percent-encoding of everything outside the unreserved set
    static std::string url_encode(const std::string& value);
};

class FileUtils {
public:
    static bool exists(const std::filesystem::path& path);
    static bool is_file(const std::filesystem::path& path);
    static std::optional<std::uint64_t> file_size(const std::filesystem::path& path);
    static bool create_directories(const std::filesystem::path& path);

    static std::filesystem::path get_home_dir();

    // Expands a leading "~" to the home directory
    static std::filesystem::path expand_user(const std::string& path);

    // Recursive, never throws; returns false only when something was left behind
    static bool remove_all(const std::filesystem::path& path);

    // Creates parent/stem, or parent/stem.1, stem.2, ... when taken. The
    // returned directory did not exist before the call.
    static std::optional<std::filesystem::path> create_unique_directory(const std::filesystem::path& parent,
                                                                        const std::string& stem);

private:
    static constexpr int MAX_UNIQUE_ATTEMPTS = 1000;
};

// Removes a path tree when it goes out of scope
class ScopedRemoval {
public:
    explicit ScopedRemoval(std::filesystem::path path) : path_(std::move(path)) {}
    ~ScopedRemoval();

    ScopedRemoval(const ScopedRemoval&) = delete;
    ScopedRemoval& operator=(const ScopedRemoval&) = delete;

    void release() { path_.clear(); }

private:
    std::filesystem::path path_;
};

} // namespace partvault::core::utils
