#include "partvault/transfer/job_dispatcher.hpp"
#include "partvault/core/logger.hpp"

namespace partvault::transfer {

JobDispatcher::JobDispatcher(DispatchSettings settings,
                             std::shared_ptr<storage::ProgressStore> store,
                             std::shared_ptr<UploadManager> uploader,
                             std::shared_ptr<DownloadManager> downloader,
                             const CancellationToken* cancel)
    : settings_(std::move(settings))
    , store_(std::move(store))
    , uploader_(std::move(uploader))
    , downloader_(std::move(downloader))
    , cancel_(cancel) {
}

TransferJob JobDispatcher::make_job(const JobDescriptor& descriptor) const {
    TransferJob job;
    job.owner_id = settings_.owner_id;
    job.descriptor = descriptor;

    if (descriptor.type == JobType::UPLOAD) {
        job.source_path = descriptor.filename;
    } else {
        job.destination_dir = settings_.download_directory;
    }

    return job;
}

TransferResult JobDispatcher::dispatch(const TransferJob& job) {
    const auto& descriptor = job.descriptor;

    if (descriptor.type == JobType::UPLOAD) {
        if (settings_.destination_chat.empty()) {
            return TransferResult::failed(core::ErrorCode::INVALID_ARGUMENT, "No destination chat configured");
        }
        return uploader_->upload(settings_.credentials, settings_.destination_chat, job.source_path, cancel_);
    }

    auto manifest = store_->load(descriptor.filename);
    if (!manifest) {
        return TransferResult::failed(core::ErrorCode::NOT_FOUND,
                                      "No upload record for '" + descriptor.filename + "'");
    }

    return downloader_->download(settings_.credentials, *manifest, job.destination_dir, cancel_);
}

size_t JobDispatcher::run(JobQueue& queue, const CompletionHandler& on_done) {
    size_t jobs_run = 0;

    while (!(cancel_ && cancel_->is_cancelled())) {
        auto descriptor = queue.pop();
        if (!descriptor) {
            break;
        }

        if (descriptor->status != JobStatus::PENDING) {
            LOG_DEBUG("Skipping job for '{}' that is already processing", descriptor->filename);
            continue;
        }

        auto job = make_job(*descriptor);
        job.descriptor.status = JobStatus::PROCESSING;

        LOG_INFO("Starting {} of '{}'", descriptor->type == JobType::UPLOAD ? "upload" : "download",
                 descriptor->filename);

        auto result = dispatch(job);
        jobs_run++;

        if (result.success()) {
            LOG_INFO("Job for '{}' finished", descriptor->filename);
        } else {
            LOG_ERROR("Job for '{}' {}", descriptor->filename, result.describe());
        }

        if (on_done) {
            on_done(job, result);
        }
    }

    return jobs_run;
}

} // namespace partvault::transfer
