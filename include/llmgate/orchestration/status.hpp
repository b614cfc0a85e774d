#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "llmgate/core/types.hpp"
#include "llmgate/orchestration/circuit_breaker.hpp"

namespace llmgate::orchestration {

enum class AttemptPhase {
    Probe,
    Call,
};

auto phase_to_string(AttemptPhase phase) -> std::string_view;

/// One availability probe or generation call against one provider.
struct AttemptEvent {
    std::string provider;
    AttemptPhase phase = AttemptPhase::Call;
    bool available = false;
    std::optional<std::string> error;
    std::chrono::milliseconds latency{0};
    Timestamp at = Clock::now();
    /// Circuit state after the attempt, when the attempt changed or observed it.
    std::optional<CircuitState> circuit;
};

/// Receives per-attempt events from the orchestrator. Implementations may
/// throw; the orchestrator logs and ignores sink failures.
class StatusSink {
public:
    virtual ~StatusSink() = default;
    virtual void record(const AttemptEvent& event) = 0;
};

struct ProviderStatus {
    bool available = false;
    std::optional<std::string> last_error;
    std::optional<Timestamp> last_check;
    std::uint64_t consecutive_successes = 0;
    std::uint64_t consecutive_failures = 0;
    std::uint64_t request_count = 0;
    double average_latency_ms = 0.0;
    CircuitState circuit = CircuitState::Closed;
};

/// In-memory StatusSink keeping the latest status and a bounded history
/// per provider. Nothing survives a restart.
class StatusMonitor final : public StatusSink {
public:
    static constexpr std::size_t kMaxHistory = 1000;

    explicit StatusMonitor(std::size_t max_history = kMaxHistory);

    void record(const AttemptEvent& event) override;

    [[nodiscard]] auto status(std::string_view provider) const -> std::optional<ProviderStatus>;
    [[nodiscard]] auto history(std::string_view provider) const -> std::deque<AttemptEvent>;

    /// All providers' status plus per-provider history sizes.
    [[nodiscard]] auto snapshot() const -> nlohmann::json;

    void clear();

private:
    std::size_t max_history_;
    mutable std::mutex mutex_;
    std::map<std::string, ProviderStatus, std::less<>> status_;
    std::map<std::string, std::deque<AttemptEvent>, std::less<>> history_;
};

} // namespace llmgate::orchestration
