#include "partvault/crypto/hash.hpp"
#include "partvault/core/logger.hpp"
#include <sodium.h>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <vector>

namespace partvault::crypto {

bool ensure_sodium_initialized() {
    static std::once_flag once;
    static bool ready = false;

    std::call_once(once, [] {
        if (sodium_init() < 0) {
            LOG_CRITICAL("Failed to initialize libsodium");
            return;
        }
        ready = true;
    });

    return ready;
}

struct Blake2bHasher::Impl {
    crypto_generichash_state state;
};

Blake2bHasher::Blake2bHasher()
    : impl_(std::make_unique<Impl>())
    , initialized_(false) {
}

Blake2bHasher::~Blake2bHasher() = default;

core::Result Blake2bHasher::initialize() {
    if (!ensure_sodium_initialized()) {
        return core::Result(core::ErrorCode::IO_ERROR, "libsodium unavailable");
    }

    if (crypto_generichash_init(&impl_->state, nullptr, 0, CONTENT_HASH_SIZE) != 0) {
        return core::Result(core::ErrorCode::IO_ERROR, "Failed to initialize hasher");
    }

    initialized_ = true;
    return core::Result();
}

core::Result Blake2bHasher::update(std::span<const std::uint8_t> data) {
    if (!initialized_) {
        return core::Result(core::ErrorCode::INVALID_ARGUMENT, "Hasher not initialized");
    }

    if (crypto_generichash_update(&impl_->state, data.data(), data.size()) != 0) {
        return core::Result(core::ErrorCode::IO_ERROR, "Failed to update hash");
    }

    return core::Result();
}

core::Result Blake2bHasher::finalize(ContentHash& output) {
    if (!initialized_) {
        return core::Result(core::ErrorCode::INVALID_ARGUMENT, "Hasher not initialized");
    }

    if (crypto_generichash_final(&impl_->state, output.data(), output.size()) != 0) {
        return core::Result(core::ErrorCode::IO_ERROR, "Failed to finalize hash");
    }

    initialized_ = false; // Hasher is consumed
    return core::Result();
}

ContentHash Blake2bHasher::hash(std::span<const std::uint8_t> data) {
    ensure_sodium_initialized();

    ContentHash result;
    crypto_generichash(result.data(), result.size(), data.data(), data.size(), nullptr, 0);
    return result;
}

core::Result Blake2bHasher::hash_file(const std::filesystem::path& file_path, ContentHash& output) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) {
        return core::Result(core::ErrorCode::NOT_FOUND, "Cannot open file for hashing: " + file_path.string());
    }

    Blake2bHasher hasher;
    auto result = hasher.initialize();
    if (!result.success()) {
        return result;
    }

    constexpr size_t buffer_size = 65536;
    std::vector<std::uint8_t> buffer(buffer_size);

    while (file.good()) {
        file.read(reinterpret_cast<char*>(buffer.data()), buffer_size);
        size_t bytes_read = static_cast<size_t>(file.gcount());

        if (bytes_read > 0) {
            result = hasher.update(std::span(buffer.data(), bytes_read));
            if (!result.success()) {
                return result;
            }
        }
    }

    if (file.bad()) {
        return core::Result(core::ErrorCode::IO_ERROR, "Read failed while hashing: " + file_path.string());
    }

    return hasher.finalize(output);
}

namespace hash_utils {

std::string hash_to_hex(const ContentHash& hash) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (auto byte : hash) {
        oss << std::setw(2) << static_cast<unsigned>(byte);
    }
    return oss.str();
}

}

} // namespace partvault::crypto
