#pragma once

#include "../core/result.hpp"
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace partvault::transport {

struct HttpResponse {
    unsigned status = 0;
    std::string body;
};

struct MultipartField {
    std::string name;
    std::string value;                // used when file_path is empty
    std::filesystem::path file_path;  // sent as a file upload when set
    std::string filename;
    std::string content_type = "application/octet-stream";
};

// Blocking HTTPS/1.1 client; one connection per request, each step bounded
// by the given timeout. Network failures come back as
// TRANSIENT_TRANSPORT_ERROR, local file problems as IO_ERROR.
class HttpsClient {
public:
    explicit HttpsClient(std::string host, std::string port = "443");

    core::Result get(const std::string& target,
                     std::chrono::seconds timeout,
                     HttpResponse& response);

    // Streams the response body into destination; status is set whenever a
    // response was received, whatever its code
    core::Result download(const std::string& target,
                          std::chrono::seconds timeout,
                          const std::filesystem::path& destination,
                          unsigned& status);

    core::Result post_multipart(const std::string& target,
                                const std::vector<MultipartField>& fields,
                                std::chrono::seconds timeout,
                                HttpResponse& response);

    static core::Result build_multipart_body(const std::vector<MultipartField>& fields,
                                             const std::string& boundary,
                                             std::string& body);

    // "https://host/path?query" -> host, "/path?query"
    static bool split_url(const std::string& url, std::string& host, std::string& target);

    const std::string& get_host() const { return host_; }

private:
    std::string host_;
    std::string port_;

    template <class Request, class Parser>
    core::Result perform(Request& request, Parser& parser, std::chrono::seconds timeout);
};

} // namespace partvault::transport
