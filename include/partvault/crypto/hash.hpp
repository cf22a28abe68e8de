#pragma once

#include "../core/result.hpp"
#include <array>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <string>

namespace partvault::crypto {

constexpr size_t CONTENT_HASH_SIZE = 32;

using ContentHash = std::array<std::uint8_t, CONTENT_HASH_SIZE>;

// Incremental BLAKE2b-256 (libsodium generichash)
class Blake2bHasher {
public:
    Blake2bHasher();
    ~Blake2bHasher();

    Blake2bHasher(const Blake2bHasher&) = delete;
    Blake2bHasher& operator=(const Blake2bHasher&) = delete;

    core::Result initialize();
    core::Result update(std::span<const std::uint8_t> data);
    core::Result finalize(ContentHash& output);

    static ContentHash hash(std::span<const std::uint8_t> data);
    static core::Result hash_file(const std::filesystem::path& file_path, ContentHash& output);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    bool initialized_;
};

// Safe to call from any thread, any number of times
bool ensure_sodium_initialized();

namespace hash_utils {

std::string hash_to_hex(const ContentHash& hash);

} // namespace hash_utils

} // namespace partvault::crypto
