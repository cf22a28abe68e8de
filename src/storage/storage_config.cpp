#include "partvault/storage/storage_config.hpp"
#include "partvault/storage/progress_store.hpp"
#include "partvault/core/config.hpp"
#include "partvault/core/utils.hpp"

namespace partvault::storage {

StorageConfig StorageConfig::from_config(const core::Config& config) {
    StorageConfig storage;
    storage.data_directory = core::utils::FileUtils::expand_user(
        config.get_string("storage.data_dir", "~/.partvault"));
    storage.download_directory = core::utils::FileUtils::expand_user(
        config.get_string("storage.download_dir", "downloads"));
    storage.owner_id = config.get_string("owner.id", "default");
    storage.chunk_size = config.get_uint64("transfer.chunk_size", ChunkManager::DEFAULT_CHUNK_SIZE);
    return storage;
}

bool StorageConfig::validate() const {
    if (data_directory.empty() || download_directory.empty()) {
        return false;
    }

    if (owner_id.empty() || owner_id.find_first_of("/\\") != std::string::npos) {
        return false;
    }

    // 1KB up to the transport's 20MB document ceiling
    if (chunk_size < 1024 || chunk_size > 20ULL * 1024 * 1024) {
        return false;
    }

    return true;
}

std::uint64_t StorageConfig::get_available_space(const std::filesystem::path& directory) const {
    try {
        auto space_info = std::filesystem::space(directory);
        return space_info.available;
    } catch (const std::filesystem::filesystem_error&) {
        return 0;
    }
}

bool StorageConfig::has_sufficient_space(const std::filesystem::path& directory,
                                         std::uint64_t required_bytes) const {
    uint64_t available = get_available_space(directory);

    // Keep at least 100MB free after the transfer
    uint64_t safety_margin = 100ULL * 1024 * 1024;

    return available > (required_bytes + safety_margin);
}

std::filesystem::path StorageConfig::get_progress_store_path() const {
    return ProgressStore::path_for_owner(data_directory, owner_id);
}

} // namespace partvault::storage
