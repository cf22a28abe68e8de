#pragma once

#include "retry_policy.hpp"
#include "transfer_types.hpp"
#include "../storage/chunk_manager.hpp"
#include "../storage/progress_store.hpp"
#include "../transport/part_transport.hpp"
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>

namespace partvault::core {
class Config;
}

namespace partvault::transfer {

struct UploadOptions {
    RetryPolicy retry = RetryPolicy::fixed_delay(10, std::chrono::milliseconds(5000));
    std::chrono::milliseconds inter_part_delay{1000};
    std::uint64_t chunk_size = storage::ChunkManager::DEFAULT_CHUNK_SIZE;

    static UploadOptions from_config(const core::Config& config);
};

// Sends the parts of one file in order, saving the manifest after every
// acknowledged part so an interrupted upload resumes where it stopped.
class UploadManager {
public:
    UploadManager(std::shared_ptr<storage::ProgressStore> store,
                  transport::TransportFactory transport_factory,
                  UploadOptions options = {},
                  Sleeper sleeper = real_sleeper());

    TransferResult upload(const transport::TransportCredentials& credentials,
                          const std::string& destination_chat,
                          const std::filesystem::path& source_path,
                          const CancellationToken* cancel = nullptr);

    void set_progress_callback(ProgressCallback callback) { progress_callback_ = std::move(callback); }

private:
    std::shared_ptr<storage::ProgressStore> store_;
    transport::TransportFactory transport_factory_;
    UploadOptions options_;
    Sleeper sleeper_;
    ProgressCallback progress_callback_;

    // Either the resumable manifest on record or a fresh one for the current size
    storage::TransferManifest prepare_manifest(const std::string& filename, std::uint64_t file_size) const;
};

} // namespace partvault::transfer
