#include "llmgate/orchestration/circuit_breaker.hpp"

#include <algorithm>

#include "llmgate/core/logger.hpp"

namespace llmgate::orchestration {

auto circuit_state_to_string(CircuitState state) -> std::string_view {
    switch (state) {
        case CircuitState::Closed: return "closed";
        case CircuitState::Open: return "open";
        case CircuitState::HalfOpen: return "half_open";
    }
    return "closed";
}

CircuitBreaker::CircuitBreaker(CircuitBreakerConfig config)
    : config_(config) {}

auto CircuitBreaker::allow(std::string_view provider, TimePoint now) -> bool {
    std::lock_guard lock(mutex_);
    if (!enabled()) return true;

    auto it = circuits_.find(provider);
    if (it == circuits_.end()) return true;

    auto& c = it->second;
    if (c.state != CircuitState::Open) return true;

    auto cooldown = std::chrono::seconds(std::max(0, config_.recovery_timeout_seconds));
    if (now - c.opened_at < cooldown) return false;

    c.state = CircuitState::HalfOpen;
    c.success_count = 0;
    LOG_INFO("Circuit for {} is half-open", provider);
    return true;
}

auto CircuitBreaker::record_success(std::string_view provider) -> CircuitState {
    std::lock_guard lock(mutex_);
    if (!enabled()) return CircuitState::Closed;

    auto it = circuits_.find(provider);
    if (it == circuits_.end()) return CircuitState::Closed;

    auto& c = it->second;
    if (c.state == CircuitState::HalfOpen) {
        if (++c.success_count >= std::max(1, config_.success_threshold)) {
            c.state = CircuitState::Closed;
            c.failure_count = 0;
            c.success_count = 0;
            LOG_INFO("Circuit for {} closed", provider);
        }
    } else if (c.state == CircuitState::Closed) {
        c.failure_count = 0;
    }
    return c.state;
}

auto CircuitBreaker::record_failure(std::string_view provider, TimePoint now) -> CircuitState {
    std::lock_guard lock(mutex_);
    if (!enabled()) return CircuitState::Closed;

    auto it = circuits_.find(provider);
    if (it == circuits_.end()) {
        it = circuits_.emplace(std::string(provider), Circuit{}).first;
    }

    auto& c = it->second;
    ++c.failure_count;
    if (c.state == CircuitState::HalfOpen) {
        c.state = CircuitState::Open;
        c.opened_at = now;
        LOG_WARN("Circuit for {} reopened after a half-open failure", provider);
    } else if (c.state == CircuitState::Closed && c.failure_count >= config_.failure_threshold) {
        c.state = CircuitState::Open;
        c.opened_at = now;
        LOG_WARN("Circuit for {} opened after {} consecutive failures",
                 provider, c.failure_count);
    }
    return c.state;
}

auto CircuitBreaker::state(std::string_view provider) const -> CircuitState {
    std::lock_guard lock(mutex_);
    auto it = circuits_.find(provider);
    return it == circuits_.end() ? CircuitState::Closed : it->second.state;
}

void CircuitBreaker::reset(CircuitBreakerConfig config) {
    std::lock_guard lock(mutex_);
    config_ = config;
    circuits_.clear();
}

} // namespace llmgate::orchestration
