#pragma once

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include <boost/asio.hpp>

#include "llmgate/core/error.hpp"

namespace llmgate::infra {

struct HttpResponse {
    int status = 0;
    std::map<std::string, std::string> headers;
    std::string body;

    [[nodiscard]] auto is_success() const noexcept -> bool {
        return status >= 200 && status < 300;
    }
};

/// One upstream endpoint. `default_headers` carry the credential and are
/// sent with every request.
struct HttpClientConfig {
    std::string base_url;
    int connect_timeout_seconds = 10;
    int read_timeout_seconds = 60;
    bool verify_ssl = true;
    std::map<std::string, std::string> default_headers;
};

/// Maps a non-2xx HTTP status to the error code adapters report:
/// 429 and 5xx are transient, auth and request errors are permanent.
auto classify_http_status(int status) -> ErrorCode;

/// Splits "https://host:port/prefix" into the origin httplib connects to
/// and the path prefix prepended to every request path.
auto split_base_url(const std::string& base_url) -> std::pair<std::string, std::string>;

/// Asynchronous HTTP client wrapping cpp-httplib.
///
/// Each request runs on its own background thread with a private
/// httplib::Client (httplib clients are not thread-safe) while the calling
/// coroutine waits on a steady_timer. Cancelling the coroutine abandons the
/// wait immediately; the background request then finishes on its own and
/// only touches its shared completion state.
class HttpClient {
public:
    explicit HttpClient(boost::asio::io_context& ioc, HttpClientConfig config);
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    /// POSTs a JSON body to base_url + `path`. Non-2xx replies are returned
    /// as responses; only transport failures become errors.
    auto post_json(std::string_view path, std::string body)
        -> boost::asio::awaitable<Result<HttpResponse>>;

    [[nodiscard]] auto base_url() const -> const std::string&;

    [[nodiscard]] auto config() const -> const HttpClientConfig&;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace llmgate::infra
