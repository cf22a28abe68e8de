#include "partvault/transport/https_client.hpp"
#include "partvault/core/logger.hpp"
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <fstream>
#include <iterator>

namespace beast = boost::beast;
namespace http = beast::http;
namespace asio = boost::asio;
namespace ssl = asio::ssl;
using tcp = asio::ip::tcp;

namespace partvault::transport {

namespace {

constexpr std::uint64_t MAX_STRING_BODY = 8 * 1024 * 1024;
constexpr auto SHUTDOWN_TIMEOUT = std::chrono::seconds(5);

// Runs one asynchronous operation to completion so the stream's deadline applies
template <typename Initiate>
boost::system::error_code run_operation(asio::io_context& ioc, Initiate&& initiate) {
    boost::system::error_code result = asio::error::would_block;
    initiate([&result](boost::system::error_code ec, auto&&...) { result = ec; });
    ioc.restart();
    ioc.run();
    return result;
}

core::Result network_failure(const std::string& step, const boost::system::error_code& ec) {
    return core::Result(core::ErrorCode::TRANSIENT_TRANSPORT_ERROR, step + " failed: " + ec.message());
}

} // namespace

HttpsClient::HttpsClient(std::string host, std::string port)
    : host_(std::move(host))
    , port_(std::move(port)) {
}

template <class Request, class Parser>
core::Result HttpsClient::perform(Request& request, Parser& parser, std::chrono::seconds timeout) {
    asio::io_context ioc;
    ssl::context ctx(ssl::context::tls_client);
    ctx.set_default_verify_paths();
    ctx.set_verify_mode(ssl::verify_peer);

    beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);
    if (!SSL_set_tlsext_host_name(stream.native_handle(), host_.c_str())) {
        return core::Result(core::ErrorCode::TRANSIENT_TRANSPORT_ERROR, "Failed to set SNI host name");
    }
    stream.set_verify_callback(ssl::host_name_verification(host_));

    // tcp_stream deadlines do not cover name resolution, so it gets its own timer
    tcp::resolver resolver(ioc);
    tcp::resolver::results_type endpoints;
    asio::steady_timer resolve_deadline(ioc, timeout);
    bool resolve_timed_out = false;

    resolve_deadline.async_wait([&](boost::system::error_code wait_ec) {
        if (!wait_ec) {
            resolve_timed_out = true;
            resolver.cancel();
        }
    });

    auto ec = run_operation(ioc, [&](auto handler) {
        resolver.async_resolve(host_, port_,
            [&, handler = std::move(handler)](boost::system::error_code resolve_ec,
                                              tcp::resolver::results_type results) mutable {
                resolve_deadline.cancel();
                endpoints = std::move(results);
                handler(resolve_ec);
            });
    });
    if (resolve_timed_out) {
        ec = asio::error::timed_out;
    }
    if (ec) {
        return network_failure("resolve " + host_, ec);
    }

    auto& socket = beast::get_lowest_layer(stream);

    socket.expires_after(timeout);
    ec = run_operation(ioc, [&](auto handler) {
        socket.async_connect(endpoints, std::move(handler));
    });
    if (ec) {
        return network_failure("connect", ec);
    }

    socket.expires_after(timeout);
    ec = run_operation(ioc, [&](auto handler) {
        stream.async_handshake(ssl::stream_base::client, std::move(handler));
    });
    if (ec) {
        return network_failure("TLS handshake", ec);
    }

    request.set(http::field::host, host_);
    request.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    request.prepare_payload();

    socket.expires_after(timeout);
    ec = run_operation(ioc, [&](auto handler) {
        http::async_write(stream, request, std::move(handler));
    });
    if (ec) {
        return network_failure("send request", ec);
    }

    beast::flat_buffer buffer;
    socket.expires_after(timeout);
    ec = run_operation(ioc, [&](auto handler) {
        http::async_read(stream, buffer, parser, std::move(handler));
    });
    if (ec) {
        return network_failure("read response", ec);
    }

    // Servers commonly drop the connection without close_notify; the
    // response is complete at this point so the shutdown outcome is only logged
    socket.expires_after(SHUTDOWN_TIMEOUT);
    ec = run_operation(ioc, [&](auto handler) {
        stream.async_shutdown(std::move(handler));
    });
    if (ec && ec != asio::error::eof && ec != ssl::error::stream_truncated) {
        LOG_DEBUG("TLS shutdown with {}: {}", host_, ec.message());
    }

    return core::Result();
}

core::Result HttpsClient::get(const std::string& target,
                              std::chrono::seconds timeout,
                              HttpResponse& response) {
    http::request<http::empty_body> request{http::verb::get, target, 11};

    http::response_parser<http::string_body> parser;
    parser.body_limit(MAX_STRING_BODY);

    auto result = perform(request, parser, timeout);
    if (!result) {
        return result;
    }

    response.status = parser.get().result_int();
    response.body = std::move(parser.get().body());
    return core::Result();
}

core::Result HttpsClient::download(const std::string& target,
                                   std::chrono::seconds timeout,
                                   const std::filesystem::path& destination,
                                   unsigned& status) {
    http::request<http::empty_body> request{http::verb::get, target, 11};

    http::response_parser<http::file_body> parser;
    parser.body_limit(boost::none);

    boost::system::error_code ec;
    parser.get().body().open(destination.string().c_str(), beast::file_mode::write, ec);
    if (ec) {
        return core::Result(core::ErrorCode::IO_ERROR,
                            "Cannot open " + destination.string() + ": " + ec.message());
    }

    auto result = perform(request, parser, timeout);
    parser.get().body().close();
    if (!result) {
        return result;
    }

    status = parser.get().result_int();
    return core::Result();
}

core::Result HttpsClient::post_multipart(const std::string& target,
                                         const std::vector<MultipartField>& fields,
                                         std::chrono::seconds timeout,
                                         HttpResponse& response) {
    const std::string boundary = "----partvault" + std::to_string(
        std::chrono::steady_clock::now().time_since_epoch().count());

    http::request<http::string_body> request{http::verb::post, target, 11};
    request.set(http::field::content_type, "multipart/form-data; boundary=" + boundary);

    auto result = build_multipart_body(fields, boundary, request.body());
    if (!result) {
        return result;
    }

    http::response_parser<http::string_body> parser;
    parser.body_limit(MAX_STRING_BODY);

    result = perform(request, parser, timeout);
    if (!result) {
        return result;
    }

    response.status = parser.get().result_int();
    response.body = std::move(parser.get().body());
    return core::Result();
}

core::Result HttpsClient::build_multipart_body(const std::vector<MultipartField>& fields,
                                               const std::string& boundary,
                                               std::string& body) {
    body.clear();

    for (const auto& field : fields) {
        body += "--" + boundary + "\r\n";

        if (field.file_path.empty()) {
            body += "Content-Disposition: form-data; name=\"" + field.name + "\"\r\n\r\n";
            body += field.value;
        } else {
            std::ifstream file(field.file_path, std::ios::binary);
            if (!file.is_open()) {
                return core::Result(core::ErrorCode::IO_ERROR, "Cannot read " + field.file_path.string());
            }

            body += "Content-Disposition: form-data; name=\"" + field.name +
                    "\"; filename=\"" + field.filename + "\"\r\n";
            body += "Content-Type: " + field.content_type + "\r\n\r\n";
            body.append(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());

            if (file.bad()) {
                return core::Result(core::ErrorCode::IO_ERROR, "Read failed on " + field.file_path.string());
            }
        }

        body += "\r\n";
    }

    body += "--" + boundary + "--\r\n";
    return core::Result();
}

bool HttpsClient::split_url(const std::string& url, std::string& host, std::string& target) {
    const std::string scheme = "https://";
    if (url.compare(0, scheme.size(), scheme) != 0) {
        return false;
    }

    auto slash = url.find('/', scheme.size());
    host = url.substr(scheme.size(), slash == std::string::npos ? std::string::npos : slash - scheme.size());
    target = slash == std::string::npos ? "/" : url.substr(slash);
    return !host.empty();
}

} // namespace partvault::transport
