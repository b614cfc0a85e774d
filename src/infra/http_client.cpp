#include "llmgate/infra/http_client.hpp"
#include "llmgate/core/logger.hpp"

#include <httplib.h>

#include <mutex>
#include <optional>
#include <thread>
#include <tuple>
#include <utility>

#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace llmgate::infra {

namespace {

auto transport_error(httplib::Error err) -> Error {
    switch (err) {
        case httplib::Error::ConnectionTimeout:
            return make_error(ErrorCode::Timeout, "HTTP request timed out",
                              "connection timeout");
        case httplib::Error::Read:
            return make_error(ErrorCode::ConnectionClosed, "HTTP request failed",
                              "read error or read timeout");
        case httplib::Error::Write:
            return make_error(ErrorCode::ConnectionClosed, "HTTP request failed",
                              "write error");
        case httplib::Error::Connection:
            return make_error(ErrorCode::ConnectionFailed, "HTTP request failed",
                              "connection failed");
        case httplib::Error::Canceled:
            return make_error(ErrorCode::Cancelled, "HTTP request canceled");
        case httplib::Error::SSLConnection:
            return make_error(ErrorCode::ConnectionFailed, "HTTP request failed",
                              "SSL connection error");
        case httplib::Error::SSLLoadingCerts:
        case httplib::Error::SSLServerVerification:
            return make_error(ErrorCode::ProviderError, "HTTP request failed",
                              "SSL certificate verification failed");
        default:
            return make_error(ErrorCode::ConnectionFailed, "HTTP request failed",
                              httplib::to_string(err));
    }
}

/// Completion state shared between the request thread and the waiter.
/// Outlives an abandoned waiter through shared ownership. Once `abandoned`
/// is set the thread must not touch the executor or the timer again.
struct PendingRequest {
    std::mutex mtx;
    std::optional<Result<HttpResponse>> result;
    bool abandoned = false;
};

} // anonymous namespace

auto split_base_url(const std::string& base_url) -> std::pair<std::string, std::string> {
    auto scheme_end = base_url.find("://");
    auto host_start = scheme_end == std::string::npos ? 0 : scheme_end + 3;
    auto path_start = base_url.find('/', host_start);
    if (path_start == std::string::npos) {
        return {base_url, ""};
    }
    auto prefix = base_url.substr(path_start);
    while (!prefix.empty() && prefix.back() == '/') prefix.pop_back();
    return {base_url.substr(0, path_start), prefix};
}

auto classify_http_status(int status) -> ErrorCode {
    switch (status) {
        case 400:
        case 422:
            return ErrorCode::InvalidArgument;
        case 401:
            return ErrorCode::Unauthorized;
        case 402:
        case 403:
            return ErrorCode::Forbidden;
        case 404:
            return ErrorCode::NotFound;
        case 408:
            return ErrorCode::Timeout;
        case 429:
            return ErrorCode::RateLimited;
        default:
            break;
    }
    if (status >= 500) return ErrorCode::ServiceUnavailable;
    return ErrorCode::ProviderError;
}

struct HttpClient::Impl {
    boost::asio::io_context& ioc;
    HttpClientConfig config;
    std::string origin;
    std::string path_prefix;

    Impl(boost::asio::io_context& ioc_, HttpClientConfig config_)
        : ioc(ioc_), config(std::move(config_)) {
        std::tie(origin, path_prefix) = split_base_url(config.base_url);
        LOG_DEBUG("HTTP client created for {}", config.base_url);
    }
};

HttpClient::HttpClient(boost::asio::io_context& ioc, HttpClientConfig config)
    : impl_(std::make_unique<Impl>(ioc, std::move(config))) {}

HttpClient::~HttpClient() = default;

auto HttpClient::post_json(std::string_view path, std::string body)
    -> boost::asio::awaitable<Result<HttpResponse>> {
    auto executor = co_await boost::asio::this_coro::executor;

    auto state = std::make_shared<PendingRequest>();
    auto timer = std::make_shared<boost::asio::steady_timer>(
        executor, boost::asio::steady_timer::time_point::max());

    // The coroutine owns the timer. The thread sees it only through a
    // weak_ptr, and only while the waiter has not given up.
    std::weak_ptr<boost::asio::steady_timer> weak_timer = timer;

    std::thread([state, weak_timer, executor,
                 config = impl_->config,
                 origin = impl_->origin,
                 p = impl_->path_prefix + std::string(path),
                 b = std::move(body)]() mutable {
        httplib::Client client(origin);
        client.set_connection_timeout(config.connect_timeout_seconds);
        client.set_read_timeout(config.read_timeout_seconds);
        client.set_write_timeout(config.read_timeout_seconds);
        if (!config.verify_ssl) {
            client.enable_server_certificate_verification(false);
        }

        httplib::Headers headers;
        for (const auto& [k, v] : config.default_headers) {
            headers.emplace(k, v);
        }

        LOG_DEBUG("POST {}{}", origin, p);
        auto res = client.Post(p, headers, b, "application/json");

        Result<HttpResponse> result;
        if (!res) {
            result = std::unexpected(transport_error(res.error()));
        } else {
            HttpResponse response;
            response.status = res->status;
            response.body = std::move(res->body);
            for (const auto& [k, v] : res->headers) {
                response.headers[k] = v;
            }
            result = std::move(response);
        }

        std::lock_guard lock(state->mtx);
        state->result = std::move(result);
        if (state->abandoned) {
            LOG_DEBUG("POST {}{} finished after the caller gave up", origin, p);
            return;
        }
        if (!weak_timer.expired()) {
            // Moving the expiry into the past also covers a waiter that has
            // not started waiting yet.
            boost::asio::post(executor, [weak_timer] {
                if (auto t = weak_timer.lock()) {
                    t->expires_at(boost::asio::steady_timer::time_point::min());
                }
            });
        }
    }).detach();

    boost::system::error_code ec;
    {
        std::lock_guard lock(state->mtx);
        if (state->result.has_value()) {
            state->abandoned = true;
            co_return std::move(*state->result);
        }
    }
    co_await timer->async_wait(
        boost::asio::redirect_error(boost::asio::use_awaitable, ec));

    std::lock_guard lock(state->mtx);
    state->abandoned = true;
    if (!state->result.has_value()) {
        LOG_DEBUG("POST to {} abandoned: {}", impl_->config.base_url, ec.message());
        co_return make_fail(make_error(ErrorCode::Cancelled,
                                       "HTTP request was cancelled",
                                       ec.message()));
    }
    co_return std::move(*state->result);
}

auto HttpClient::base_url() const -> const std::string& {
    return impl_->config.base_url;
}

auto HttpClient::config() const -> const HttpClientConfig& {
    return impl_->config;
}

} // namespace llmgate::infra
