#include <gtest/gtest.h>
#include "partvault/transport/https_client.hpp"
#include "partvault/transport/telegram_transport.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>

using namespace partvault::transport;

class TelegramClassificationTest : public ::testing::Test {
protected:
    TransportResult classify(unsigned status, const std::string& body) {
        return TelegramTransport::classify_response(status, body, reply);
    }

    nlohmann::json reply;
};

TEST_F(TelegramClassificationTest, OkReply) {
    auto result = classify(200, R"({"ok":true,"result":{"message_id":5,"document":{"file_id":"BQAC"}}})");

    EXPECT_TRUE(result.success());
    EXPECT_EQ(reply["result"]["message_id"], 5);
}

TEST_F(TelegramClassificationTest, TooManyRequestsCarriesRetryAfter) {
    auto result = classify(429, R"({"ok":false,"error_code":429,
        "description":"Too Many Requests: retry after 17","parameters":{"retry_after":17}})");

    EXPECT_EQ(result.kind, TransportErrorKind::RATE_LIMITED);
    EXPECT_EQ(result.retry_after, std::chrono::seconds(17));
    EXPECT_TRUE(result.retryable());
}

TEST_F(TelegramClassificationTest, TooManyRequestsWithoutParameters) {
    auto result = classify(429, "");

    EXPECT_EQ(result.kind, TransportErrorKind::RATE_LIMITED);
    EXPECT_EQ(result.retry_after, std::chrono::seconds(1));
}

TEST_F(TelegramClassificationTest, ClientErrorsArePermanent) {
    EXPECT_EQ(classify(400, R"({"ok":false,"error_code":400,"description":"Bad Request: chat not found"})").kind,
              TransportErrorKind::PERMANENT);
    EXPECT_EQ(classify(401, R"({"ok":false,"error_code":401,"description":"Unauthorized"})").kind,
              TransportErrorKind::PERMANENT);
    EXPECT_EQ(classify(413, "Request Entity Too Large").kind, TransportErrorKind::PERMANENT);

    auto result = classify(400, R"({"ok":false,"error_code":400,"description":"Bad Request: file is too big"})");
    EXPECT_EQ(result.message, "Bad Request: file is too big");
    EXPECT_FALSE(result.retryable());
}

TEST_F(TelegramClassificationTest, RequestTimeoutIsTransient) {
    EXPECT_EQ(classify(408, "").kind, TransportErrorKind::TRANSIENT);
}

TEST_F(TelegramClassificationTest, ServerErrorsAreTransient) {
    EXPECT_EQ(classify(500, "").kind, TransportErrorKind::TRANSIENT);
    EXPECT_EQ(classify(502, "<html>Bad Gateway</html>").kind, TransportErrorKind::TRANSIENT);
    EXPECT_EQ(classify(503, R"({"ok":false,"error_code":503})").kind, TransportErrorKind::TRANSIENT);
}

TEST_F(TelegramClassificationTest, MalformedSuccessIsTransient) {
    EXPECT_EQ(classify(200, "not json").kind, TransportErrorKind::TRANSIENT);
    EXPECT_EQ(classify(200, R"({"ok":false})").kind, TransportErrorKind::TRANSIENT);
    EXPECT_EQ(classify(200, R"({"ok":false,"error_code":"x"})").kind, TransportErrorKind::TRANSIENT);
}

TEST_F(TelegramClassificationTest, ApiErrorCodeOverridesHttpStatus) {
    auto result = classify(200, R"({"ok":false,"error_code":429,"parameters":{"retry_after":3}})");
    EXPECT_EQ(result.kind, TransportErrorKind::RATE_LIMITED);
    EXPECT_EQ(result.retry_after, std::chrono::seconds(3));
}

TEST(TransportErrorKindTest, Names) {
    EXPECT_STREQ(to_string(TransportErrorKind::NONE), "none");
    EXPECT_STREQ(to_string(TransportErrorKind::RATE_LIMITED), "rate_limited");
    EXPECT_STREQ(to_string(TransportErrorKind::PERMANENT), "permanent");
}

TEST(HttpsClientTest, SplitUrl) {
    std::string host;
    std::string target;

    ASSERT_TRUE(HttpsClient::split_url("https://api.telegram.org/file/botTOKEN/documents/file_1.bin", host, target));
    EXPECT_EQ(host, "api.telegram.org");
    EXPECT_EQ(target, "/file/botTOKEN/documents/file_1.bin");

    ASSERT_TRUE(HttpsClient::split_url("https://example.org", host, target));
    EXPECT_EQ(host, "example.org");
    EXPECT_EQ(target, "/");

    EXPECT_FALSE(HttpsClient::split_url("http://example.org/x", host, target));
    EXPECT_FALSE(HttpsClient::split_url("https:///x", host, target));
}

TEST(HttpsClientTest, MultipartBodyLayout) {
    auto part_path = std::filesystem::temp_directory_path() / "partvault_multipart.part000001";
    std::ofstream(part_path, std::ios::binary) << "PAYLOAD";

    std::vector<MultipartField> fields(2);
    fields[0].name = "chat_id";
    fields[0].value = "-100123";
    fields[1].name = "document";
    fields[1].file_path = part_path;
    fields[1].filename = "a.bin.part000001";

    std::string body;
    ASSERT_TRUE(HttpsClient::build_multipart_body(fields, "XYZ", body));

    EXPECT_EQ(body,
              "--XYZ\r\n"
              "Content-Disposition: form-data; name=\"chat_id\"\r\n\r\n"
              "-100123\r\n"
              "--XYZ\r\n"
              "Content-Disposition: form-data; name=\"document\"; filename=\"a.bin.part000001\"\r\n"
              "Content-Type: application/octet-stream\r\n\r\n"
              "PAYLOAD\r\n"
              "--XYZ--\r\n");

    std::filesystem::remove(part_path);
}

TEST(HttpsClientTest, MultipartBodyMissingFile) {
    std::vector<MultipartField> fields(1);
    fields[0].name = "document";
    fields[0].file_path = "/nonexistent/partvault/part";

    std::string body;
    auto result = HttpsClient::build_multipart_body(fields, "XYZ", body);
    EXPECT_EQ(result.error, partvault::core::ErrorCode::IO_ERROR);
}

TEST(TelegramTransportTest, FetchRejectsForeignUrl) {
    TelegramTransport transport(TransportCredentials{"TOKEN", "api.telegram.org"});
    auto result = transport.fetch_to_file("ftp://elsewhere/file",
                                          std::filesystem::temp_directory_path() / "partvault_never");
    EXPECT_EQ(result.kind, TransportErrorKind::PERMANENT);
}

TEST(HttpsClientTest, UnresolvableHostFailsWithinDeadline) {
    HttpsClient client("partvault.invalid");
    HttpResponse response;

    auto started = std::chrono::steady_clock::now();
    auto result = client.get("/", std::chrono::seconds(2), response);
    auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_FALSE(result);
    EXPECT_EQ(result.message.rfind("resolve", 0), 0u) << result.message;
    EXPECT_LT(elapsed, std::chrono::seconds(30));
}

class TelegramTokenTest : public ::testing::Test {
protected:
    static constexpr const char* TOKEN = "SECRETabc";

    void SetUp() override {
        part_path_ = std::filesystem::temp_directory_path() / "partvault_token_test.part";
        std::ofstream(part_path_, std::ios::binary) << "payload";
    }

    void TearDown() override {
        std::filesystem::remove(part_path_);
        std::filesystem::remove(part_path_.string() + ".fetched");
    }

    // The host carries the token so that network errors would echo it
    TelegramTransport make_transport() {
        TelegramTimeouts timeouts;
        timeouts.upload = std::chrono::seconds(2);
        timeouts.metadata = std::chrono::seconds(2);
        timeouts.fetch = std::chrono::seconds(2);
        return TelegramTransport(TransportCredentials{TOKEN, std::string(TOKEN) + ".invalid"}, timeouts);
    }

    std::filesystem::path part_path_;
};

TEST_F(TelegramTokenTest, FailureMessagesNeverContainToken) {
    auto transport = make_transport();
    const std::string secret = TOKEN;

    UploadedPart uploaded;
    auto put = transport.put_part("-100", part_path_, "x.part0", uploaded);
    EXPECT_FALSE(put);
    EXPECT_EQ(put.message.find(secret), std::string::npos) << put.message;

    std::string fetch_url;
    auto resolved = transport.resolve_locator("BQAC", fetch_url);
    EXPECT_FALSE(resolved);
    EXPECT_EQ(resolved.message.find(secret), std::string::npos) << resolved.message;

    auto fetched = transport.fetch_to_file("https://" + secret + ".invalid/file/bot" + TOKEN + "/documents/x",
                                           part_path_.string() + ".fetched");
    EXPECT_FALSE(fetched);
    EXPECT_EQ(fetched.message.find(secret), std::string::npos) << fetched.message;

    auto foreign = transport.fetch_to_file(std::string("http://host/file/bot") + TOKEN + "/x",
                                           part_path_.string() + ".fetched");
    EXPECT_EQ(foreign.kind, TransportErrorKind::PERMANENT);
    EXPECT_EQ(foreign.message.find(secret), std::string::npos) << foreign.message;
}
