#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <utility>

namespace partvault::transport {

// Resolved once at the transport boundary; callers never inspect messages
enum class TransportErrorKind {
    NONE = 0,
    RATE_LIMITED, // retry after the server-specified delay
    TRANSIENT,    // network trouble, 5xx, malformed replies
    PERMANENT     // invalid locator, bad credentials, rejected request
};

const char* to_string(TransportErrorKind kind);

struct TransportResult {
    TransportErrorKind kind;
    std::string message;
    std::chrono::seconds retry_after;

    TransportResult(TransportErrorKind k = TransportErrorKind::NONE,
                    std::string msg = "",
                    std::chrono::seconds retry = std::chrono::seconds(0))
        : kind(k), message(std::move(msg)), retry_after(retry) {}

    static TransportResult rate_limited(std::chrono::seconds retry, std::string msg = "rate limited") {
        return TransportResult(TransportErrorKind::RATE_LIMITED, std::move(msg), retry);
    }

    bool success() const { return kind == TransportErrorKind::NONE; }
    bool retryable() const {
        return kind == TransportErrorKind::RATE_LIMITED || kind == TransportErrorKind::TRANSIENT;
    }
    operator bool() const { return success(); }
};

struct TransportCredentials {
    std::string bot_token;
    std::string api_host = "api.telegram.org";
};

struct UploadedPart {
    std::int64_t message_id = 0;
    std::string locator_id;
};

class PartTransport {
public:
    virtual ~PartTransport() = default;

    // Posts one part file to chat_target under display_name
    virtual TransportResult put_part(const std::string& chat_target,
                                     const std::filesystem::path& part_path,
                                     const std::string& display_name,
                                     UploadedPart& uploaded) = 0;

    virtual TransportResult resolve_locator(const std::string& locator_id, std::string& fetch_url) = 0;

    // Streams the bytes behind fetch_url into destination (truncating it)
    virtual TransportResult fetch_to_file(const std::string& fetch_url,
                                          const std::filesystem::path& destination) = 0;
};

using TransportFactory = std::function<std::shared_ptr<PartTransport>(const TransportCredentials&)>;

} // namespace partvault::transport
