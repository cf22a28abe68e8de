#pragma once

#include "../core/result.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace partvault::transfer {

enum class TransferStatus {
    SUCCESS,
    FAILED,
    CANCELLED
};

const char* to_string(TransferStatus status);

struct TransferResult {
    TransferStatus status = TransferStatus::SUCCESS;
    core::ErrorCode reason = core::ErrorCode::SUCCESS;
    std::string message;
    std::uint32_t parts_transferred = 0;
    std::vector<std::uint32_t> failed_parts; // download only, ascending

    static TransferResult succeeded(std::uint32_t parts, std::string msg = "");
    static TransferResult failed(core::ErrorCode reason, std::string msg, std::uint32_t parts = 0);
    static TransferResult cancelled(std::uint32_t parts = 0);

    bool success() const { return status == TransferStatus::SUCCESS; }
    bool is_cancelled() const { return status == TransferStatus::CANCELLED; }

    std::string describe() const;
};

// (parts done so far, total parts)
using ProgressCallback = std::function<void(std::uint32_t, std::uint32_t)>;

// Cooperative stop flag shared between a job and whoever may abort it
class CancellationToken {
public:
    void cancel() noexcept { cancelled_.store(true, std::memory_order_release); }
    bool is_cancelled() const noexcept { return cancelled_.load(std::memory_order_acquire); }
    void reset() noexcept { cancelled_.store(false, std::memory_order_release); }

private:
    std::atomic<bool> cancelled_{false};
};

enum class JobType {
    UPLOAD,
    DOWNLOAD
};

enum class JobStatus {
    PENDING,
    PROCESSING
};

// {"task": "upload"|"download", "filename": "...", "status": "pending"|"processing"}
struct JobDescriptor {
    JobType type = JobType::UPLOAD;
    std::string filename;
    JobStatus status = JobStatus::PENDING;

    nlohmann::json to_json() const;
    static std::optional<JobDescriptor> from_json(const nlohmann::json& value);
    static std::optional<JobDescriptor> parse(const std::string& line);
};

struct TransferJob {
    std::string owner_id;
    JobDescriptor descriptor;
    std::filesystem::path source_path;      // upload
    std::filesystem::path destination_dir;  // download
};

} // namespace partvault::transfer
