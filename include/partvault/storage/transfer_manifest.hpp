#pragma once

#include "chunk_manager.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace partvault::storage {

// One part acknowledged by the remote side
struct RemotePart {
    std::int64_t message_id = 0;
    std::string locator_id;
    std::string content_hash; // empty for manifests written without hashes

    bool operator==(const RemotePart& other) const;
};

// Upload progress for one (owner, filename). parts is always a prefix of the
// full part sequence: parts[i] holds part index i.
struct TransferManifest {
    std::string filename;
    std::uint64_t chunk_size = ChunkManager::DEFAULT_CHUNK_SIZE;
    std::uint32_t total_parts = 0;
    std::uint64_t file_size_bytes = 0;
    std::vector<RemotePart> parts;
    std::string upload_method = "bot";

    TransferManifest() = default;
    TransferManifest(const std::string& name, std::uint64_t size, std::uint64_t chunk);

    std::uint32_t recorded_parts() const { return static_cast<std::uint32_t>(parts.size()); }

    bool is_complete() const;

    // Partially uploaded: some but not all parts recorded
    bool is_resumable() const;

    double progress() const;

    nlohmann::json to_json() const;

    // Missing chunk_size falls back to the default; nullopt on malformed input
    static std::optional<TransferManifest> from_json(const std::string& name, const nlohmann::json& value);

    bool operator==(const TransferManifest& other) const;
    bool operator!=(const TransferManifest& other) const;
};

} // namespace partvault::storage
