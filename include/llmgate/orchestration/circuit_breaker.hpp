#pragma once

#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <string_view>

#include "llmgate/core/config.hpp"

namespace llmgate::orchestration {

enum class CircuitState {
    Closed,
    Open,
    HalfOpen,
};

auto circuit_state_to_string(CircuitState state) -> std::string_view;

/// Per-provider circuit breakers.
///
/// A closed circuit lets every call through and counts consecutive
/// failures. At `failure_threshold` it opens and refuses calls until
/// `recovery_timeout_seconds` have passed, then lets calls through
/// half-open. Any failure while half-open reopens the circuit;
/// `success_threshold` successes close it.
///
/// Thread-safe. Providers never seen are closed.
class CircuitBreaker {
public:
    using TimePoint = std::chrono::steady_clock::time_point;

    explicit CircuitBreaker(CircuitBreakerConfig config = {});

    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;

    /// Whether a call to `provider` may go ahead. An open circuit whose
    /// cooldown has elapsed moves to half-open here.
    [[nodiscard]] auto allow(std::string_view provider,
                             TimePoint now = std::chrono::steady_clock::now()) -> bool;

    /// Records the outcome of a call. Both return the resulting state.
    auto record_success(std::string_view provider) -> CircuitState;
    auto record_failure(std::string_view provider,
                        TimePoint now = std::chrono::steady_clock::now()) -> CircuitState;

    [[nodiscard]] auto state(std::string_view provider) const -> CircuitState;

    /// Closes every circuit and adopts `config`.
    void reset(CircuitBreakerConfig config);

private:
    struct Circuit {
        CircuitState state = CircuitState::Closed;
        int failure_count = 0;
        int success_count = 0;
        TimePoint opened_at{};
    };

    [[nodiscard]] auto enabled() const -> bool { return config_.failure_threshold > 0; }

    mutable std::mutex mutex_;
    CircuitBreakerConfig config_;
    std::map<std::string, Circuit, std::less<>> circuits_;
};

} // namespace llmgate::orchestration
