#include "partvault/transfer/download_manager.hpp"
#include "partvault/core/config.hpp"
#include "partvault/core/logger.hpp"
#include "partvault/core/utils.hpp"
#include "partvault/crypto/hash.hpp"
#include "partvault/storage/chunk_manager.hpp"
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <algorithm>
#include <mutex>
#include <vector>

namespace partvault::transfer {

DownloadOptions DownloadOptions::from_config(const core::Config& config) {
    DownloadOptions options;
    options.max_workers = static_cast<std::uint32_t>(std::max(1, config.get_int("download.max_workers", 35)));
    options.retry = RetryPolicy::exponential(
        static_cast<std::uint32_t>(std::max(1, config.get_int("download.max_attempts", 5))),
        std::chrono::milliseconds(std::max(0, config.get_int("download.base_delay_ms", 1000))),
        2.0,
        std::chrono::milliseconds(std::max(0, config.get_int("download.jitter_max_ms", 500))));
    return options;
}

DownloadManager::DownloadManager(transport::TransportFactory transport_factory,
                                 DownloadOptions options,
                                 Sleeper sleeper)
    : transport_factory_(std::move(transport_factory))
    , options_(std::move(options))
    , sleeper_(std::move(sleeper)) {
}

TransferResult DownloadManager::download(const transport::TransportCredentials& credentials,
                                         const storage::TransferManifest& manifest,
                                         const std::filesystem::path& destination_dir,
                                         const CancellationToken* cancel) {
    const auto& filename = manifest.filename;

    if (filename.empty() || filename == "." || filename == ".." ||
        filename.find_first_of("/\\") != std::string::npos) {
        return TransferResult::failed(core::ErrorCode::INVALID_ARGUMENT, "Invalid filename '" + filename + "'");
    }

    if (!manifest.is_complete()) {
        return TransferResult::failed(core::ErrorCode::INCOMPLETE_MANIFEST,
                                      "'" + filename + "' has " + std::to_string(manifest.recorded_parts()) +
                                      " of " + std::to_string(manifest.total_parts) + " parts uploaded");
    }

    if (!core::utils::FileUtils::create_directories(destination_dir)) {
        return TransferResult::failed(core::ErrorCode::IO_ERROR, "Cannot create " + destination_dir.string());
    }

    const auto output_path = destination_dir / filename;
    auto created_dir = core::utils::FileUtils::create_unique_directory(destination_dir, filename + "_parts");
    if (!created_dir) {
        return TransferResult::failed(core::ErrorCode::IO_ERROR,
                                      "Cannot create a parts directory in " + destination_dir.string());
    }
    const auto parts_dir = *created_dir;
    core::utils::ScopedRemoval parts_cleanup(parts_dir);

    if (cancel && cancel->is_cancelled()) {
        return TransferResult::cancelled();
    }

    const auto started = std::chrono::steady_clock::now();
    std::vector<PartOutcome> outcomes;

    if (manifest.total_parts > 0) {
        auto transport = transport_factory_(credentials);
        if (!transport) {
            return TransferResult::failed(core::ErrorCode::INVALID_ARGUMENT, "No transport available");
        }

        auto workers = std::min<std::uint32_t>(std::max<std::uint32_t>(options_.max_workers, 1),
                                               manifest.total_parts);
        LOG_INFO("Downloading '{}' ({} parts, {} workers)", filename, manifest.total_parts, workers);

        std::mutex outcomes_mutex;
        outcomes.reserve(manifest.total_parts);

        boost::asio::thread_pool pool(workers);
        for (std::uint32_t index = 0; index < manifest.total_parts; ++index) {
            boost::asio::post(pool, [&, index]() {
                auto outcome = fetch_part(*transport, manifest, index, parts_dir, cancel);

                std::lock_guard<std::mutex> lock(outcomes_mutex);
                outcomes.push_back(std::move(outcome));
                if (progress_callback_) {
                    progress_callback_(static_cast<std::uint32_t>(outcomes.size()), manifest.total_parts);
                }
            });
        }
        pool.join();

        std::sort(outcomes.begin(), outcomes.end(),
                  [](const PartOutcome& a, const PartOutcome& b) { return a.index < b.index; });
    }

    if (cancel && cancel->is_cancelled()) {
        LOG_WARN("Download of '{}' cancelled", filename);
        return TransferResult::cancelled();
    }

    std::vector<std::uint32_t> failed_parts;
    std::string first_failure;
    std::vector<std::filesystem::path> part_paths;

    for (const auto& outcome : outcomes) {
        if (outcome.result.success() && !outcome.cancelled) {
            part_paths.push_back(outcome.path);
            continue;
        }

        failed_parts.push_back(outcome.index);
        if (first_failure.empty()) {
            first_failure = "part " + std::to_string(outcome.index + 1) + ": " + outcome.result.message;
        }
    }

    if (!failed_parts.empty()) {
        LOG_ERROR("Download of '{}' failed: {} of {} parts missing", filename,
                  failed_parts.size(), manifest.total_parts);
        auto result = TransferResult::failed(core::ErrorCode::PARTIAL_DOWNLOAD, first_failure,
                                             static_cast<std::uint32_t>(part_paths.size()));
        result.failed_parts = std::move(failed_parts);
        return result;
    }

    const auto staging_path = parts_dir / (filename + ".joining");
    storage::ChunkManager joiner(manifest.chunk_size);

    auto joined = joiner.join_files(part_paths, staging_path);
    if (!joined) {
        return TransferResult::failed(joined.error, joined.message, manifest.total_parts);
    }

    auto joined_size = core::utils::FileUtils::file_size(staging_path);
    if (!joined_size || *joined_size != manifest.file_size_bytes) {
        return TransferResult::failed(core::ErrorCode::INTEGRITY_ERROR,
                                      "Joined size " + std::to_string(joined_size.value_or(0)) +
                                      " does not match recorded " + std::to_string(manifest.file_size_bytes),
                                      manifest.total_parts);
    }

    std::error_code ec;
    std::filesystem::rename(staging_path, output_path, ec);
    if (ec) {
        return TransferResult::failed(core::ErrorCode::IO_ERROR,
                                      "Cannot move file into " + output_path.string() + ": " + ec.message(),
                                      manifest.total_parts);
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
    LOG_INFO("Downloaded '{}' to {} in {}", filename, output_path.string(),
             core::utils::StringUtils::format_duration(elapsed));
    return TransferResult::succeeded(manifest.total_parts, output_path.string());
}

DownloadManager::PartOutcome DownloadManager::fetch_part(transport::PartTransport& transport,
                                                         const storage::TransferManifest& manifest,
                                                         std::uint32_t index,
                                                         const std::filesystem::path& parts_dir,
                                                         const CancellationToken* cancel) const {
    PartOutcome outcome;
    outcome.index = index;
    outcome.path = parts_dir / storage::ChunkManager::get_part_name(manifest.filename, index);

    if (cancel && cancel->is_cancelled()) {
        outcome.cancelled = true;
        outcome.result = transport::TransportResult(transport::TransportErrorKind::TRANSIENT, "cancelled");
        return outcome;
    }

    const auto& remote = manifest.parts[index];
    const auto description = "Download of " + outcome.path.filename().string();

    RetryExecutor executor(options_.retry, sleeper_, cancel);
    auto retry = executor.run([&]() -> transport::TransportResult {
        try {
            std::string fetch_url;
            auto result = transport.resolve_locator(remote.locator_id, fetch_url);
            if (!result) {
                return result;
            }

            result = transport.fetch_to_file(fetch_url, outcome.path);
            if (!result) {
                return result;
            }

            return verify_part(outcome.path, remote.content_hash);
        } catch (const std::exception& e) {
            return transport::TransportResult(transport::TransportErrorKind::TRANSIENT, e.what());
        }
    }, description);

    outcome.result = retry.result;
    outcome.cancelled = retry.cancelled;
    if (retry.cancelled) {
        outcome.result = transport::TransportResult(transport::TransportErrorKind::TRANSIENT, "cancelled");
    } else if (retry.result.success()) {
        LOG_DEBUG("{} finished after {} attempt(s)", description, retry.attempts);
    }

    return outcome;
}

transport::TransportResult DownloadManager::verify_part(const std::filesystem::path& path,
                                                        const std::string& expected_hash) {
    if (expected_hash.empty()) {
        return transport::TransportResult();
    }

    crypto::ContentHash digest;
    auto hashed = crypto::Blake2bHasher::hash_file(path, digest);
    if (!hashed) {
        return transport::TransportResult(transport::TransportErrorKind::TRANSIENT, hashed.message);
    }

    if (crypto::hash_utils::hash_to_hex(digest) != expected_hash) {
        std::error_code ec;
        std::filesystem::remove(path, ec);
        return transport::TransportResult(transport::TransportErrorKind::TRANSIENT, "content hash mismatch");
    }

    return transport::TransportResult();
}

} // namespace partvault::transfer
