#include "partvault/storage/transfer_manifest.hpp"

namespace partvault::storage {

bool RemotePart::operator==(const RemotePart& other) const {
    return message_id == other.message_id &&
           locator_id == other.locator_id &&
           content_hash == other.content_hash;
}

TransferManifest::TransferManifest(const std::string& name, std::uint64_t size, std::uint64_t chunk)
    : filename(name)
    , chunk_size(chunk)
    , total_parts(ChunkManager::calculate_total_parts(size, chunk))
    , file_size_bytes(size)
{
}

bool TransferManifest::is_complete() const {
    return parts.size() == total_parts;
}

bool TransferManifest::is_resumable() const {
    return !parts.empty() && parts.size() < total_parts;
}

double TransferManifest::progress() const {
    if (total_parts == 0) return 1.0;
    return static_cast<double>(parts.size()) / total_parts;
}

nlohmann::json TransferManifest::to_json() const {
    nlohmann::json messages = nlohmann::json::array();
    for (const auto& part : parts) {
        nlohmann::json entry = {
            {"message_id", part.message_id},
            {"file_id", part.locator_id}
        };
        if (!part.content_hash.empty()) {
            entry["hash"] = part.content_hash;
        }
        messages.push_back(std::move(entry));
    }

    return {
        {"messages", std::move(messages)},
        {"total_parts", total_parts},
        {"file_size_bytes", file_size_bytes},
        {"chunk_size", chunk_size},
        {"upload_method", upload_method}
    };
}

std::optional<TransferManifest> TransferManifest::from_json(const std::string& name,
                                                            const nlohmann::json& value) {
    if (!value.is_object()) {
        return std::nullopt;
    }

    try {
        TransferManifest manifest;
        manifest.filename = name;
        manifest.total_parts = value.at("total_parts").get<std::uint32_t>();
        manifest.file_size_bytes = value.at("file_size_bytes").get<std::uint64_t>();
        manifest.chunk_size = value.value("chunk_size", ChunkManager::DEFAULT_CHUNK_SIZE);
        manifest.upload_method = value.value("upload_method", std::string("bot"));

        if (manifest.chunk_size == 0) {
            return std::nullopt;
        }

        for (const auto& entry : value.value("messages", nlohmann::json::array())) {
            RemotePart part;
            part.message_id = entry.at("message_id").get<std::int64_t>();
            part.locator_id = entry.at("file_id").get<std::string>();
            part.content_hash = entry.value("hash", std::string());
            manifest.parts.push_back(std::move(part));
        }

        return manifest;
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    }
}

bool TransferManifest::operator==(const TransferManifest& other) const {
    return filename == other.filename &&
           chunk_size == other.chunk_size &&
           total_parts == other.total_parts &&
           file_size_bytes == other.file_size_bytes &&
           parts == other.parts &&
           upload_method == other.upload_method;
}

bool TransferManifest::operator!=(const TransferManifest& other) const {
    return !(*this == other);
}

} // namespace partvault::storage
