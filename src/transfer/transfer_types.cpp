#include "partvault/transfer/transfer_types.hpp"

namespace partvault::transfer {

const char* to_string(TransferStatus status) {
    switch (status) {
        case TransferStatus::SUCCESS: return "success";
        case TransferStatus::FAILED: return "failed";
        case TransferStatus::CANCELLED: return "cancelled";
    }
    return "unknown";
}

TransferResult TransferResult::succeeded(std::uint32_t parts, std::string msg) {
    TransferResult result;
    result.parts_transferred = parts;
    result.message = std::move(msg);
    return result;
}

TransferResult TransferResult::failed(core::ErrorCode reason, std::string msg, std::uint32_t parts) {
    TransferResult result;
    result.status = TransferStatus::FAILED;
    result.reason = reason;
    result.message = std::move(msg);
    result.parts_transferred = parts;
    return result;
}

TransferResult TransferResult::cancelled(std::uint32_t parts) {
    TransferResult result;
    result.status = TransferStatus::CANCELLED;
    result.reason = core::ErrorCode::CANCELLED;
    result.message = "Transfer cancelled";
    result.parts_transferred = parts;
    return result;
}

std::string TransferResult::describe() const {
    std::string text = to_string(status);
    if (status == TransferStatus::FAILED) {
        text += std::string(" (") + core::to_string(reason) + ")";
    }
    if (!message.empty()) {
        text += ": " + message;
    }
    if (!failed_parts.empty()) {
        text += " [failed parts:";
        for (auto index : failed_parts) {
            text += " " + std::to_string(index);
        }
        text += "]";
    }
    return text;
}

nlohmann::json JobDescriptor::to_json() const {
    return {
        {"task", type == JobType::UPLOAD ? "upload" : "download"},
        {"filename", filename},
        {"status", status == JobStatus::PENDING ? "pending" : "processing"}
    };
}

std::optional<JobDescriptor> JobDescriptor::from_json(const nlohmann::json& value) {
    if (!value.is_object()) {
        return std::nullopt;
    }

    try {
        JobDescriptor descriptor;

        auto task = value.at("task").get<std::string>();
        if (task == "upload") {
            descriptor.type = JobType::UPLOAD;
        } else if (task == "download") {
            descriptor.type = JobType::DOWNLOAD;
        } else {
            return std::nullopt;
        }

        descriptor.filename = value.at("filename").get<std::string>();
        if (descriptor.filename.empty()) {
            return std::nullopt;
        }

        auto status = value.value("status", std::string("pending"));
        if (status == "pending") {
            descriptor.status = JobStatus::PENDING;
        } else if (status == "processing") {
            descriptor.status = JobStatus::PROCESSING;
        } else {
            return std::nullopt;
        }

        return descriptor;
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    }
}

std::optional<JobDescriptor> JobDescriptor::parse(const std::string& line) {
    auto value = nlohmann::json::parse(line, nullptr, false);
    if (value.is_discarded()) {
        return std::nullopt;
    }
    return from_json(value);
}

} // namespace partvault::transfer
