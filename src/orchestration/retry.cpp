#include "llmgate/orchestration/retry.hpp"

#include <algorithm>
#include <cmath>

#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "llmgate/core/logger.hpp"

namespace llmgate::orchestration {

RetryPolicy::RetryPolicy(RetryConfig config)
    : config_(std::move(config)) {}

auto RetryPolicy::max_attempts() const -> int {
    return std::max(config_.max_attempts, 1);
}

auto RetryPolicy::backoff_delay(const RetryConfig& config, int attempt)
    -> std::chrono::milliseconds {
    if (attempt <= 0 || config.base_delay_ms <= 0) return std::chrono::milliseconds{0};

    double delay = static_cast<double>(config.base_delay_ms) *
                   std::pow(std::max(config.multiplier, 1.0), attempt - 1);
    if (config.max_delay_ms > 0) {
        delay = std::min(delay, static_cast<double>(config.max_delay_ms));
    }
    return std::chrono::milliseconds{static_cast<long long>(delay)};
}

auto RetryPolicy::run(Operation op) const -> boost::asio::awaitable<RetryOutcome> {
    RetryOutcome outcome;
    auto executor = co_await boost::asio::this_coro::executor;
    const int limit = max_attempts();

    for (int attempt = 1; attempt <= limit; ++attempt) {
        outcome.attempts = attempt;
        outcome.result = co_await op();

        if (outcome.result.has_value()) {
            co_return outcome;
        }

        const auto& err = outcome.result.error();
        if (!is_transient(err.code())) {
            LOG_DEBUG("Attempt {} failed permanently: {}", attempt, err.what());
            co_return outcome;
        }
        if (attempt == limit) {
            LOG_WARN("Giving up after {} attempts: {}", attempt, err.what());
            co_return outcome;
        }

        auto delay = backoff_delay(config_, attempt);
        LOG_INFO("Attempt {}/{} failed ({}), retrying in {} ms",
                 attempt, limit, err.what(), delay.count());

        boost::asio::steady_timer timer(executor, delay);
        boost::system::error_code ec;
        co_await timer.async_wait(
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec == boost::asio::error::operation_aborted) {
            outcome.result = std::unexpected(make_error(
                ErrorCode::Cancelled, "Retry wait cancelled"));
            co_return outcome;
        }
    }

    co_return outcome;
}

} // namespace llmgate::orchestration
