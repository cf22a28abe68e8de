#pragma once

#include "chunk_manager.hpp"
#include <cstdint>
#include <filesystem>
#include <string>

namespace partvault::core {
class Config;
}

namespace partvault::storage {

struct StorageConfig {
    std::filesystem::path data_directory;     // progress store lives here
    std::filesystem::path download_directory; // default download destination
    std::string owner_id = "default";
    std::uint64_t chunk_size = ChunkManager::DEFAULT_CHUNK_SIZE;

    static StorageConfig from_config(const core::Config& config);

    bool validate() const;

    std::uint64_t get_available_space(const std::filesystem::path& directory) const;

    bool has_sufficient_space(const std::filesystem::path& directory, std::uint64_t required_bytes) const;

    std::filesystem::path get_progress_store_path() const;
};

} // namespace partvault::storage
