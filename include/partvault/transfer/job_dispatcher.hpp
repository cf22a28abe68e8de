#pragma once

#include "download_manager.hpp"
#include "job_queue.hpp"
#include "upload_manager.hpp"
#include "../storage/progress_store.hpp"
#include <filesystem>
#include <functional>
#include <memory>
#include <string>

namespace partvault::transfer {

struct DispatchSettings {
    std::string owner_id = "default";
    transport::TransportCredentials credentials;
    std::string destination_chat;
    std::filesystem::path download_directory;
};

// Turns job descriptors into upload or download runs, one job at a time
class JobDispatcher {
public:
    using CompletionHandler = std::function<void(const TransferJob&, const TransferResult&)>;

    JobDispatcher(DispatchSettings settings,
                  std::shared_ptr<storage::ProgressStore> store,
                  std::shared_ptr<UploadManager> uploader,
                  std::shared_ptr<DownloadManager> downloader,
                  const CancellationToken* cancel = nullptr);

    TransferJob make_job(const JobDescriptor& descriptor) const;

    TransferResult dispatch(const TransferJob& job);

    // Drains the queue until it is closed or the token is cancelled.
    // Descriptors not in the pending state are skipped. Returns jobs run.
    size_t run(JobQueue& queue, const CompletionHandler& on_done = nullptr);

private:
    DispatchSettings settings_;
    std::shared_ptr<storage::ProgressStore> store_;
    std::shared_ptr<UploadManager> uploader_;
    std::shared_ptr<DownloadManager> downloader_;
    const CancellationToken* cancel_;
};

} // namespace partvault::transfer
