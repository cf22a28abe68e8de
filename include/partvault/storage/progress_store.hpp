#pragma once

#include "transfer_manifest.hpp"
#include "../core/result.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace partvault::storage {

// Durable manifest store: one JSON document per owner, keyed by filename.
// Every save re-reads the document, replaces a single entry, writes a
// temporary sibling and renames it over the target, so readers only ever
// observe a complete document.
class ProgressStore {
public:
    explicit ProgressStore(const std::filesystem::path& database_path);

    std::optional<TransferManifest> load(const std::string& filename) const;

    core::Result save(const TransferManifest& manifest);

    core::Result remove(const std::string& filename);

    std::vector<TransferManifest> list() const;

    static std::filesystem::path path_for_owner(const std::filesystem::path& data_directory,
                                                const std::string& owner_id);

private:
    std::filesystem::path db_path_;
    mutable std::mutex mutex_;

    core::Result read_document(nlohmann::json& document) const;
    core::Result write_document(const nlohmann::json& document);
    nlohmann::json read_document_for_update();
};

} // namespace partvault::storage
