#pragma once

#include <chrono>
#include <functional>
#include <string>

#include <boost/asio.hpp>

#include "llmgate/core/config.hpp"
#include "llmgate/core/error.hpp"

namespace llmgate::orchestration {

/// Result of one retried call plus the number of attempts it took.
struct RetryOutcome {
    Result<std::string> result;
    int attempts = 0;
};

/// Bounded retry with exponential backoff.
///
/// Only transient errors (is_transient()) are retried; any other error ends
/// the loop after one call. When every attempt fails the last transient
/// error is returned. Backoff waits honour the coroutine's cancellation
/// slot and end with ErrorCode::Cancelled.
class RetryPolicy {
public:
    using Operation = std::function<boost::asio::awaitable<Result<std::string>>()>;

    explicit RetryPolicy(RetryConfig config = {});

    auto run(Operation op) const -> boost::asio::awaitable<RetryOutcome>;

    /// Wait after the given 1-based attempt: base * multiplier^(attempt-1),
    /// capped at max_delay_ms.
    static auto backoff_delay(const RetryConfig& config, int attempt)
        -> std::chrono::milliseconds;

    [[nodiscard]] auto max_attempts() const -> int;
    [[nodiscard]] auto config() const -> const RetryConfig& { return config_; }

private:
    RetryConfig config_;
};

} // namespace llmgate::orchestration
