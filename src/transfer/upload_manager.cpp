#include "partvault/transfer/upload_manager.hpp"
#include "partvault/core/config.hpp"
#include "partvault/core/logger.hpp"
#include "partvault/core/utils.hpp"
#include <algorithm>

namespace partvault::transfer {

UploadOptions UploadOptions::from_config(const core::Config& config) {
    UploadOptions options;
    options.retry = RetryPolicy::fixed_delay(
        static_cast<std::uint32_t>(std::max(1, config.get_int("upload.max_attempts", 10))),
        std::chrono::milliseconds(std::max(0, config.get_int("upload.retry_delay_ms", 5000))));
    options.inter_part_delay = std::chrono::milliseconds(
        std::max(0, config.get_int("upload.inter_part_delay_ms", 1000)));
    options.chunk_size = config.get_uint64("transfer.chunk_size", storage::ChunkManager::DEFAULT_CHUNK_SIZE);
    return options;
}

UploadManager::UploadManager(std::shared_ptr<storage::ProgressStore> store,
                             transport::TransportFactory transport_factory,
                             UploadOptions options,
                             Sleeper sleeper)
    : store_(std::move(store))
    , transport_factory_(std::move(transport_factory))
    , options_(std::move(options))
    , sleeper_(std::move(sleeper)) {
}

storage::TransferManifest UploadManager::prepare_manifest(const std::string& filename,
                                                          std::uint64_t file_size) const {
    auto existing = store_->load(filename);
    if (existing) {
        bool same_file = existing->file_size_bytes == file_size &&
                         existing->total_parts ==
                             storage::ChunkManager::calculate_total_parts(file_size, existing->chunk_size);

        if (existing->is_resumable() && same_file) {
            LOG_INFO("Resuming upload of '{}' from part {} of {}", filename,
                     existing->recorded_parts() + 1, existing->total_parts);
            return *existing;
        }

        if (existing->is_resumable()) {
            LOG_WARN("'{}' changed size since its partial upload ({} -> {} bytes); starting over",
                     filename, existing->file_size_bytes, file_size);
        } else {
            LOG_INFO("Existing record for '{}' is not resumable; starting a fresh upload", filename);
        }
    }

    return storage::TransferManifest(filename, file_size, options_.chunk_size);
}

TransferResult UploadManager::upload(const transport::TransportCredentials& credentials,
                                     const std::string& destination_chat,
                                     const std::filesystem::path& source_path,
                                     const CancellationToken* cancel) {
    using core::utils::FileUtils;

    if (!FileUtils::is_file(source_path)) {
        return TransferResult::failed(core::ErrorCode::NOT_FOUND, "File not found: " + source_path.string());
    }

    auto file_size = FileUtils::file_size(source_path);
    if (!file_size) {
        return TransferResult::failed(core::ErrorCode::IO_ERROR, "Cannot stat " + source_path.string());
    }

    const auto filename = source_path.filename().string();

    if (*file_size == 0) {
        LOG_INFO("'{}' is empty; nothing to upload", filename);
        return TransferResult::succeeded(0, "empty file");
    }

    auto manifest = prepare_manifest(filename, *file_size);
    const auto first_part = manifest.recorded_parts();

    if (cancel && cancel->is_cancelled()) {
        return TransferResult::cancelled();
    }

    const auto default_parts_dir = storage::ChunkManager::get_parts_directory(source_path);
    auto parts_dir = FileUtils::create_unique_directory(default_parts_dir.parent_path(),
                                                        default_parts_dir.filename().string());
    if (!parts_dir) {
        return TransferResult::failed(core::ErrorCode::IO_ERROR,
                                      "Cannot create a parts directory next to " + source_path.string());
    }
    core::utils::ScopedRemoval parts_cleanup(*parts_dir);

    storage::ChunkManager chunker(manifest.chunk_size);
    storage::SplitResult split;
    auto split_result = chunker.split_file(source_path, split, first_part, *parts_dir);
    if (!split_result) {
        return TransferResult::failed(split_result.error, split_result.message);
    }

    auto transport = transport_factory_(credentials);
    if (!transport) {
        return TransferResult::failed(core::ErrorCode::INVALID_ARGUMENT, "No transport available");
    }

    LOG_INFO("Uploading '{}' ({}) in {} parts", filename,
             core::utils::StringUtils::format_bytes(*file_size), manifest.total_parts);

    RetryExecutor executor(options_.retry, sleeper_, cancel);
    const auto started = std::chrono::steady_clock::now();
    std::uint32_t transferred = 0;

    for (const auto& part : split.parts) {
        if (cancel && cancel->is_cancelled()) {
            LOG_WARN("Upload of '{}' cancelled after part {}", filename, part.index);
            return TransferResult::cancelled(transferred);
        }

        const auto part_name = storage::ChunkManager::get_part_name(filename, part.index);
        transport::UploadedPart uploaded;

        auto outcome = executor.run([&]() -> transport::TransportResult {
            try {
                return transport->put_part(destination_chat, part.local_path, part_name, uploaded);
            } catch (const std::exception& e) {
                return transport::TransportResult(transport::TransportErrorKind::TRANSIENT, e.what());
            }
        }, "Upload of " + part_name);

        if (outcome.cancelled) {
            return TransferResult::cancelled(transferred);
        }

        if (!outcome.result.success()) {
            auto reason = outcome.result.kind == transport::TransportErrorKind::PERMANENT
                              ? core::ErrorCode::PERMANENT_TRANSPORT_ERROR
                              : core::ErrorCode::TRANSIENT_TRANSPORT_ERROR;
            return TransferResult::failed(reason,
                                          "Part " + part_name + ": " + outcome.result.message,
                                          transferred);
        }

        manifest.parts.push_back(storage::RemotePart{uploaded.message_id, uploaded.locator_id, part.content_hash});

        auto saved = store_->save(manifest);
        if (!saved) {
            LOG_ERROR("Could not record part {} of '{}': {}", part.index + 1, filename, saved.message);
            return TransferResult::failed(saved.error, saved.message, transferred);
        }

        transferred++;
        LOG_INFO("Uploaded part {}/{} of '{}'", manifest.recorded_parts(), manifest.total_parts, filename);

        if (progress_callback_) {
            progress_callback_(manifest.recorded_parts(), manifest.total_parts);
        }

        if (!manifest.is_complete() && options_.inter_part_delay.count() > 0) {
            sleeper_(options_.inter_part_delay);
        }
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
    LOG_INFO("Upload of '{}' complete ({} parts in {})", filename, manifest.total_parts,
             core::utils::StringUtils::format_duration(elapsed));
    return TransferResult::succeeded(transferred);
}

} // namespace partvault::transfer
