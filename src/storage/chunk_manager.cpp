#include "partvault/storage/chunk_manager.hpp"
#include "partvault/core/logger.hpp"
#include "partvault/crypto/hash.hpp"
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace partvault::storage {

ChunkManager::ChunkManager(std::uint64_t chunk_size) : chunk_size_(chunk_size) {
}

core::Result ChunkManager::split_file(const std::filesystem::path& source,
                                      SplitResult& result,
                                      std::uint32_t first_part,
                                      const std::filesystem::path& parts_directory) const {
    result = SplitResult{};

    if (chunk_size_ == 0) {
        return core::Result(core::ErrorCode::INVALID_ARGUMENT, "Chunk size must be positive");
    }

    std::error_code ec;
    if (!std::filesystem::is_regular_file(source, ec)) {
        return core::Result(core::ErrorCode::NOT_FOUND, "File not found: " + source.string());
    }

    auto file_size = std::filesystem::file_size(source, ec);
    if (ec) {
        return core::Result(core::ErrorCode::IO_ERROR,
                            "Cannot stat " + source.string() + ": " + ec.message());
    }

    result.total_parts = calculate_total_parts(file_size, chunk_size_);
    result.parts_directory = parts_directory.empty() ? get_parts_directory(source) : parts_directory;

    if (first_part >= result.total_parts) {
        return core::Result();
    }

    std::ifstream input(source, std::ios::binary);
    if (!input.is_open()) {
        return core::Result(core::ErrorCode::IO_ERROR, "Cannot open " + source.string());
    }

    std::filesystem::create_directories(result.parts_directory, ec);
    if (ec) {
        return core::Result(core::ErrorCode::IO_ERROR,
                            "Cannot create " + result.parts_directory.string() + ": " + ec.message());
    }

    input.seekg(static_cast<std::streamoff>(first_part * chunk_size_), std::ios::beg);

    const auto filename = source.filename().string();
    std::vector<char> buffer(static_cast<size_t>(std::min<std::uint64_t>(chunk_size_, IO_BUFFER_SIZE)));

    for (std::uint32_t index = first_part; index < result.total_parts; ++index) {
        Part part;
        part.index = index;
        part.local_path = result.parts_directory / get_part_name(filename, index);

        std::ofstream output(part.local_path, std::ios::binary | std::ios::trunc);
        if (!output.is_open()) {
            return core::Result(core::ErrorCode::IO_ERROR, "Cannot create " + part.local_path.string());
        }

        crypto::Blake2bHasher hasher;
        auto hash_result = hasher.initialize();
        if (!hash_result) {
            return hash_result;
        }

        std::uint64_t remaining = chunk_size_;
        while (remaining > 0 && input.good()) {
            auto to_read = static_cast<std::streamsize>(std::min<std::uint64_t>(remaining, buffer.size()));
            input.read(buffer.data(), to_read);
            auto bytes_read = input.gcount();
            if (bytes_read <= 0) {
                break;
            }

            output.write(buffer.data(), bytes_read);
            hash_result = hasher.update(std::span(reinterpret_cast<const std::uint8_t*>(buffer.data()),
                                                  static_cast<size_t>(bytes_read)));
            if (!hash_result) {
                return hash_result;
            }
            part.size_bytes += static_cast<std::uint64_t>(bytes_read);
            remaining -= static_cast<std::uint64_t>(bytes_read);
        }

        if (input.bad()) {
            return core::Result(core::ErrorCode::IO_ERROR, "Read failed on " + source.string());
        }

        output.close();
        if (!output) {
            return core::Result(core::ErrorCode::IO_ERROR, "Write failed on " + part.local_path.string());
        }

        crypto::ContentHash digest;
        hash_result = hasher.finalize(digest);
        if (!hash_result) {
            return hash_result;
        }
        part.content_hash = crypto::hash_utils::hash_to_hex(digest);

        result.parts.push_back(std::move(part));
    }

    LOG_DEBUG("Split {} into parts {}..{} of {}", source.string(), first_part,
              result.total_parts - 1, result.total_parts);
    return core::Result();
}

core::Result ChunkManager::join_files(const std::vector<std::filesystem::path>& part_paths,
                                      const std::filesystem::path& output_path) const {
    std::ofstream output(output_path, std::ios::binary | std::ios::trunc);
    if (!output.is_open()) {
        return core::Result(core::ErrorCode::IO_ERROR, "Cannot create " + output_path.string());
    }

    std::vector<char> buffer(IO_BUFFER_SIZE);
    core::Result failure;

    for (const auto& part_path : part_paths) {
        std::ifstream input(part_path, std::ios::binary);
        if (!input.is_open()) {
            failure = core::Result(core::ErrorCode::NOT_FOUND, "Missing part " + part_path.string());
            break;
        }

        while (input.good()) {
            input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            auto bytes_read = input.gcount();
            if (bytes_read > 0) {
                output.write(buffer.data(), bytes_read);
            }
        }

        if (input.bad() || !output) {
            failure = core::Result(core::ErrorCode::IO_ERROR, "Failed to append " + part_path.string());
            break;
        }
    }

    output.close();
    if (failure.success() && !output) {
        failure = core::Result(core::ErrorCode::IO_ERROR, "Write failed on " + output_path.string());
    }

    if (!failure.success()) {
        std::error_code ec;
        std::filesystem::remove(output_path, ec);
        return failure;
    }

    return core::Result();
}

std::uint32_t ChunkManager::calculate_total_parts(std::uint64_t file_size, std::uint64_t chunk_size) {
    if (file_size == 0 || chunk_size == 0) {
        return 0;
    }
    return static_cast<std::uint32_t>((file_size + chunk_size - 1) / chunk_size);
}

std::filesystem::path ChunkManager::get_parts_directory(const std::filesystem::path& source) {
    auto absolute = std::filesystem::absolute(source);
    return absolute.parent_path() / (absolute.filename().string() + "_parts");
}

std::string ChunkManager::get_part_name(const std::string& filename, std::uint32_t index) {
    std::ostringstream name;
    name << filename << ".part" << std::setfill('0') << std::setw(6) << (index + 1);
    return name.str();
}

} // namespace partvault::storage
