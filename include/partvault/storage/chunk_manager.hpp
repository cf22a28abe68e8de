#pragma once

#include "../core/result.hpp"
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace partvault::storage {

struct Part {
    std::uint32_t index = 0;
    std::uint64_t size_bytes = 0;
    std::filesystem::path local_path;
    std::string content_hash; // BLAKE2b-256, hex
};

struct SplitResult {
    std::vector<Part> parts;        // parts written by this split, in index order
    std::uint32_t total_parts = 0;  // parts in the whole file
    std::filesystem::path parts_directory;
};

class ChunkManager {
public:
    // Stays under the transport's per-message payload ceiling
    static constexpr std::uint64_t DEFAULT_CHUNK_SIZE = 19ULL * 1024 * 1024;

    explicit ChunkManager(std::uint64_t chunk_size = DEFAULT_CHUNK_SIZE);

    // Writes parts first_part..total_parts-1 of source into parts_directory,
    // or get_parts_directory(source) when it is empty.
    // An empty source yields no parts and total_parts == 0.
    core::Result split_file(const std::filesystem::path& source,
                            SplitResult& result,
                            std::uint32_t first_part = 0,
                            const std::filesystem::path& parts_directory = {}) const;

    // Concatenates part files in the given order. No validation of count or content.
    core::Result join_files(const std::vector<std::filesystem::path>& part_paths,
                            const std::filesystem::path& output_path) const;

    static std::uint32_t calculate_total_parts(std::uint64_t file_size, std::uint64_t chunk_size);

    static std::filesystem::path get_parts_directory(const std::filesystem::path& source);

    // "<filename>.part000001" for index 0; lexical order matches index order
    static std::string get_part_name(const std::string& filename, std::uint32_t index);

private:
    std::uint64_t chunk_size_;

    static constexpr size_t IO_BUFFER_SIZE = 1024 * 1024;
};

} // namespace partvault::storage
