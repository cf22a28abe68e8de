#include "partvault/storage/progress_store.hpp"
#include "partvault/core/logger.hpp"
#include <fstream>

namespace partvault::storage {

ProgressStore::ProgressStore(const std::filesystem::path& database_path)
    : db_path_(database_path) {
}

std::optional<TransferManifest> ProgressStore::load(const std::string& filename) const {
    std::lock_guard<std::mutex> lock(mutex_);

    nlohmann::json document;
    auto result = read_document(document);
    if (!result) {
        if (result.error != core::ErrorCode::NOT_FOUND) {
            LOG_WARN("Ignoring unreadable progress store {}: {}", db_path_.string(), result.message);
        }
        return std::nullopt;
    }

    auto it = document.find(filename);
    if (it == document.end()) {
        return std::nullopt;
    }

    auto manifest = TransferManifest::from_json(filename, *it);
    if (!manifest) {
        LOG_WARN("Malformed manifest entry for '{}' in {}", filename, db_path_.string());
    }
    return manifest;
}

core::Result ProgressStore::save(const TransferManifest& manifest) {
    if (manifest.filename.empty()) {
        return core::Result(core::ErrorCode::INVALID_ARGUMENT, "Manifest has no filename");
    }

    std::lock_guard<std::mutex> lock(mutex_);

    auto document = read_document_for_update();
    document[manifest.filename] = manifest.to_json();
    return write_document(document);
}

core::Result ProgressStore::remove(const std::string& filename) {
    std::lock_guard<std::mutex> lock(mutex_);

    nlohmann::json document;
    auto result = read_document(document);
    if (!result) {
        return result;
    }

    if (document.erase(filename) == 0) {
        return core::Result(core::ErrorCode::NOT_FOUND, "No manifest for " + filename);
    }

    return write_document(document);
}

std::vector<TransferManifest> ProgressStore::list() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<TransferManifest> manifests;
    nlohmann::json document;
    if (!read_document(document)) {
        return manifests;
    }

    for (const auto& [name, value] : document.items()) {
        auto manifest = TransferManifest::from_json(name, value);
        if (manifest) {
            manifests.push_back(std::move(*manifest));
        } else {
            LOG_WARN("Skipping malformed manifest entry '{}'", name);
        }
    }

    return manifests;
}

std::filesystem::path ProgressStore::path_for_owner(const std::filesystem::path& data_directory,
                                                    const std::string& owner_id) {
    return data_directory / ("user_" + owner_id + "_files.json");
}

core::Result ProgressStore::read_document(nlohmann::json& document) const {
    std::ifstream file(db_path_);
    if (!file.is_open()) {
        return core::Result(core::ErrorCode::NOT_FOUND, "No progress store at " + db_path_.string());
    }

    document = nlohmann::json::parse(file, nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        document = nlohmann::json::object();
        return core::Result(core::ErrorCode::PARSE_ERROR, "Corrupt progress store " + db_path_.string());
    }

    return core::Result();
}

nlohmann::json ProgressStore::read_document_for_update() {
    nlohmann::json document;
    auto result = read_document(document);

    if (result.error == core::ErrorCode::PARSE_ERROR) {
        auto backup = db_path_;
        backup += ".corrupt";

        std::error_code ec;
        std::filesystem::copy_file(db_path_, backup,
                                   std::filesystem::copy_options::overwrite_existing, ec);
        if (ec) {
            LOG_ERROR("Failed to preserve corrupt progress store as {}: {}", backup.string(), ec.message());
        } else {
            LOG_ERROR("Progress store {} was corrupt; preserved as {}", db_path_.string(), backup.string());
        }
    }

    if (!result) {
        document = nlohmann::json::object();
    }
    return document;
}

core::Result ProgressStore::write_document(const nlohmann::json& document) {
    std::error_code ec;
    if (db_path_.has_parent_path()) {
        std::filesystem::create_directories(db_path_.parent_path(), ec);
        if (ec) {
            return core::Result(core::ErrorCode::IO_ERROR,
                                "Cannot create " + db_path_.parent_path().string() + ": " + ec.message());
        }
    }

    auto temp_path = db_path_;
    temp_path += ".tmp";

    {
        std::ofstream file(temp_path, std::ios::trunc);
        if (!file.is_open()) {
            return core::Result(core::ErrorCode::IO_ERROR, "Cannot write " + temp_path.string());
        }

        file << document.dump(4);
        file.flush();
        if (!file) {
            file.close();
            std::filesystem::remove(temp_path, ec);
            return core::Result(core::ErrorCode::IO_ERROR, "Write failed on " + temp_path.string());
        }
    }

    std::filesystem::rename(temp_path, db_path_, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(temp_path, ignored);
        return core::Result(core::ErrorCode::IO_ERROR,
                            "Cannot replace " + db_path_.string() + ": " + ec.message());
    }

    return core::Result();
}

} // namespace partvault::storage
