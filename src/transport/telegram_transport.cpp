#include "partvault/transport/telegram_transport.hpp"
#include "partvault/transport/https_client.hpp"
#include "partvault/core/logger.hpp"
#include "partvault/core/utils.hpp"
#include <memory>
#include <string_view>

namespace partvault::transport {

namespace {

constexpr std::chrono::seconds DEFAULT_RETRY_AFTER{1};
constexpr std::string_view TOKEN_MASK = "<token>";

// Local problems (unreadable part, unwritable destination) will not improve on retry
TransportResult from_client_failure(const core::Result& result) {
    if (result.error == core::ErrorCode::IO_ERROR) {
        return TransportResult(TransportErrorKind::PERMANENT, result.message);
    }
    return TransportResult(TransportErrorKind::TRANSIENT, result.message);
}

} // namespace

TelegramTransport::TelegramTransport(TransportCredentials credentials, TelegramTimeouts timeouts)
    : credentials_(std::move(credentials))
    , timeouts_(timeouts) {
}

TransportResult TelegramTransport::put_part(const std::string& chat_target,
                                            const std::filesystem::path& part_path,
                                            const std::string& display_name,
                                            UploadedPart& uploaded) {
    std::vector<MultipartField> fields(3);
    fields[0].name = "chat_id";
    fields[0].value = chat_target;
    fields[1].name = "caption";
    fields[1].value = display_name;
    fields[2].name = "document";
    fields[2].file_path = part_path;
    fields[2].filename = display_name;

    HttpsClient client(credentials_.api_host);
    HttpResponse response;
    auto sent = client.post_multipart(method_target("sendDocument"), fields, timeouts_.upload, response);
    if (!sent) {
        auto failure = without_token(from_client_failure(sent));
        LOG_DEBUG("sendDocument for {} failed: {}", display_name, failure.message);
        return failure;
    }

    nlohmann::json reply;
    auto result = classify_response(response.status, response.body, reply);
    if (!result) {
        return without_token(result);
    }

    try {
        const auto& message = reply.at("result");
        uploaded.message_id = message.at("message_id").get<std::int64_t>();
        uploaded.locator_id = message.at("document").at("file_id").get<std::string>();
    } catch (const nlohmann::json::exception& e) {
        return TransportResult(TransportErrorKind::TRANSIENT,
                               std::string("Unexpected sendDocument reply: ") + e.what());
    }

    LOG_TRACE("Stored {} as message {}", display_name, uploaded.message_id);
    return TransportResult();
}

TransportResult TelegramTransport::resolve_locator(const std::string& locator_id, std::string& fetch_url) {
    HttpsClient client(credentials_.api_host);
    HttpResponse response;
    auto target = method_target("getFile") + "?file_id=" + core::utils::StringUtils::url_encode(locator_id);

    auto sent = client.get(target, timeouts_.metadata, response);
    if (!sent) {
        return without_token(from_client_failure(sent));
    }

    nlohmann::json reply;
    auto result = classify_response(response.status, response.body, reply);
    if (!result) {
        return without_token(result);
    }

    std::string file_path;
    try {
        file_path = reply.at("result").at("file_path").get<std::string>();
    } catch (const nlohmann::json::exception& e) {
        return TransportResult(TransportErrorKind::TRANSIENT,
                               std::string("Unexpected getFile reply: ") + e.what());
    }

    fetch_url = "https://" + credentials_.api_host + "/file/bot" + credentials_.bot_token + "/" + file_path;
    return TransportResult();
}

TransportResult TelegramTransport::fetch_to_file(const std::string& fetch_url,
                                                 const std::filesystem::path& destination) {
    std::string host;
    std::string target;
    if (!HttpsClient::split_url(fetch_url, host, target)) {
        return TransportResult(TransportErrorKind::PERMANENT, "Unsupported fetch URL");
    }

    HttpsClient client(host);
    unsigned status = 0;
    auto received = client.download(target, timeouts_.fetch, destination, status);

    if (received && status == 200) {
        return TransportResult();
    }

    std::error_code ec;
    std::filesystem::remove(destination, ec);

    if (!received) {
        return without_token(from_client_failure(received));
    }

    // Download paths expire; the next attempt resolves a fresh one
    if (status == 404) {
        return TransportResult(TransportErrorKind::TRANSIENT, "Fetch path expired (HTTP 404)");
    }

    nlohmann::json ignored;
    return classify_response(status, "", ignored);
}

TransportResult TelegramTransport::classify_response(unsigned status,
                                                     const std::string& body,
                                                     nlohmann::json& reply) {
    reply = nlohmann::json::parse(body, nullptr, false);
    if (reply.is_discarded() || !reply.is_object()) {
        reply = nullptr;
    }

    int code = static_cast<int>(status);
    std::string description = "HTTP " + std::to_string(status);
    std::chrono::seconds retry_after = DEFAULT_RETRY_AFTER;

    if (reply.is_object()) {
        try {
            if (status == 200 && reply.value("ok", false)) {
                return TransportResult();
            }

            code = reply.value("error_code", code);
            description = reply.value("description", description);

            auto parameters = reply.find("parameters");
            if (parameters != reply.end() && parameters->is_object()) {
                retry_after = std::chrono::seconds(parameters->value("retry_after", DEFAULT_RETRY_AFTER.count()));
            }
        } catch (const nlohmann::json::exception& e) {
            return TransportResult(TransportErrorKind::TRANSIENT,
                                   std::string("Malformed API reply: ") + e.what());
        }
    }

    if (code == 429) {
        if (retry_after.count() < 0) {
            retry_after = DEFAULT_RETRY_AFTER;
        }
        return TransportResult::rate_limited(retry_after, description);
    }

    if (code == 408) {
        return TransportResult(TransportErrorKind::TRANSIENT, description);
    }

    if (code >= 400 && code < 500) {
        return TransportResult(TransportErrorKind::PERMANENT, description);
    }

    if (code >= 200 && code < 300) {
        return TransportResult(TransportErrorKind::TRANSIENT, "Malformed API reply");
    }

    return TransportResult(TransportErrorKind::TRANSIENT, description);
}

TransportFactory TelegramTransport::factory(TelegramTimeouts timeouts) {
    return [timeouts](const TransportCredentials& credentials) -> std::shared_ptr<PartTransport> {
        return std::make_shared<TelegramTransport>(credentials, timeouts);
    };
}

// Fetch URLs and method targets embed the bot token; no failure message may
TransportResult TelegramTransport::without_token(TransportResult result) const {
    const auto& token = credentials_.bot_token;
    if (token.empty()) {
        return result;
    }
    for (auto pos = result.message.find(token); pos != std::string::npos;
         pos = result.message.find(token, pos)) {
        result.message.replace(pos, token.size(), TOKEN_MASK);
        pos += TOKEN_MASK.size();
    }
    return result;
}

std::string TelegramTransport::method_target(const std::string& method) const {
    return "/bot" + credentials_.bot_token + "/" + method;
}

} // namespace partvault::transport
