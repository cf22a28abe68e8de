#pragma once

#include "part_transport.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <string>

namespace partvault::transport {

struct TelegramTimeouts {
    std::chrono::seconds upload{90};
    std::chrono::seconds metadata{20};
    std::chrono::seconds fetch{120};
};

// PartTransport over the Telegram Bot API. Holds no connection state, so one
// instance can be shared by any number of download workers.
class TelegramTransport : public PartTransport {
public:
    explicit TelegramTransport(TransportCredentials credentials, TelegramTimeouts timeouts = {});

    TransportResult put_part(const std::string& chat_target,
                             const std::filesystem::path& part_path,
                             const std::string& display_name,
                             UploadedPart& uploaded) override;

    TransportResult resolve_locator(const std::string& locator_id, std::string& fetch_url) override;

    TransportResult fetch_to_file(const std::string& fetch_url,
                                  const std::filesystem::path& destination) override;

    // Maps an HTTP status and Bot API reply onto a TransportErrorKind.
    // reply receives the parsed body (null when it is not JSON).
    static TransportResult classify_response(unsigned status, const std::string& body, nlohmann::json& reply);

    static TransportFactory factory(TelegramTimeouts timeouts = {});

private:
    TransportCredentials credentials_;
    TelegramTimeouts timeouts_;

    std::string method_target(const std::string& method) const;
    TransportResult without_token(TransportResult result) const;
};

} // namespace partvault::transport
