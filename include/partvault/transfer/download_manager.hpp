#pragma once

#include "retry_policy.hpp"
#include "transfer_types.hpp"
#include "../storage/transfer_manifest.hpp"
#include "../transport/part_transport.hpp"
#include <filesystem>
#include <memory>
#include <string>

namespace partvault::core {
class Config;
}

namespace partvault::transfer {

struct DownloadOptions {
    std::uint32_t max_workers = 35;
    RetryPolicy retry = RetryPolicy::exponential(5, std::chrono::milliseconds(1000), 2.0,
                                                 std::chrono::milliseconds(500));

    static DownloadOptions from_config(const core::Config& config);
};

// Fetches every part of a completely uploaded file on a bounded worker pool
// and joins them in index order. Either the whole file appears in the
// destination directory or nothing does.
class DownloadManager {
public:
    explicit DownloadManager(transport::TransportFactory transport_factory,
                             DownloadOptions options = {},
                             Sleeper sleeper = real_sleeper());

    TransferResult download(const transport::TransportCredentials& credentials,
                            const storage::TransferManifest& manifest,
                            const std::filesystem::path& destination_dir,
                            const CancellationToken* cancel = nullptr);

    // Called from worker threads as parts finish
    void set_progress_callback(ProgressCallback callback) { progress_callback_ = std::move(callback); }

private:
    struct PartOutcome {
        std::uint32_t index = 0;
        std::filesystem::path path;
        transport::TransportResult result;
        bool cancelled = false;
    };

    transport::TransportFactory transport_factory_;
    DownloadOptions options_;
    Sleeper sleeper_;
    ProgressCallback progress_callback_;

    PartOutcome fetch_part(transport::PartTransport& transport,
                           const storage::TransferManifest& manifest,
                           std::uint32_t index,
                           const std::filesystem::path& parts_dir,
                           const CancellationToken* cancel) const;

    static transport::TransportResult verify_part(const std::filesystem::path& path,
                                                  const std::string& expected_hash);
};

} // namespace partvault::transfer
