#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <boost/asio.hpp>
#include <nlohmann/json.hpp>

#include "llmgate/core/config.hpp"
#include "llmgate/core/error.hpp"
#include "llmgate/core/types.hpp"
#include "llmgate/orchestration/availability.hpp"
#include "llmgate/orchestration/circuit_breaker.hpp"
#include "llmgate/orchestration/status.hpp"
#include "llmgate/providers/registry.hpp"

namespace llmgate::orchestration {

enum class CandidateOutcome {
    Succeeded,
    NotConfigured,
    Unavailable,
    Failed,
    Cancelled,
};

auto outcome_to_string(CandidateOutcome outcome) -> std::string_view;

/// What happened to one candidate during a request.
struct AttemptDiagnostic {
    std::string provider;
    CandidateOutcome outcome = CandidateOutcome::Failed;
    std::optional<std::string> error;
    std::optional<ErrorCode> error_code;
    int attempts = 0;
};

/// Final result of one request. Exactly one of `text` and `error` is set.
struct FallbackResult {
    std::optional<std::string> text;
    std::optional<std::string> chosen_provider;
    std::optional<std::string> error;
    std::optional<ErrorCode> error_code;
    std::vector<AttemptDiagnostic> attempts;

    [[nodiscard]] auto ok() const -> bool { return text.has_value(); }
    [[nodiscard]] auto to_json() const -> nlohmann::json;
};

/// Drives one request through SELECT, ATTEMPT and SUCCESS / NEXT / EXHAUSTED.
///
/// Candidates are tried strictly in order: the explicitly requested
/// provider (if any), then the registry's priority order. Each candidate is
/// probed first; an unavailable one is skipped without spending retry
/// budget. Expected failures, including exhaustion and cancellation, come
/// back as a FallbackResult rather than an exception.
class FallbackOrchestrator {
public:
    explicit FallbackOrchestrator(std::shared_ptr<providers::ProviderRegistry> registry,
                                  std::shared_ptr<StatusSink> sink = nullptr);

    FallbackOrchestrator(const FallbackOrchestrator&) = delete;
    FallbackOrchestrator& operator=(const FallbackOrchestrator&) = delete;

    auto generate(RequestSpec req) -> boost::asio::awaitable<FallbackResult>;

    /// Availability of one configured provider, through the probe cache.
    auto check(std::string_view provider) -> boost::asio::awaitable<AvailabilityRecord>;

    /// Rebuilds the registry from `config`, drops every cached probe result
    /// and closes every circuit. Returns the new registry generation.
    auto refresh(Config config) -> std::uint64_t;

private:
    void report(const AttemptEvent& event) const;

    std::shared_ptr<providers::ProviderRegistry> registry_;
    std::shared_ptr<StatusSink> sink_;
    AvailabilityProbe probe_;
    CircuitBreaker breakers_;
};

} // namespace llmgate::orchestration
