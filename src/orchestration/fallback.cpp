#include "llmgate/orchestration/fallback.hpp"

#include <unordered_set>

#include "llmgate/core/logger.hpp"
#include "llmgate/core/utils.hpp"
#include "llmgate/orchestration/retry.hpp"

namespace llmgate::orchestration {

namespace {

constexpr auto kCancelledMessage = "request cancelled";

auto is_cancelled(const boost::asio::cancellation_state& state) -> bool {
    return state.cancelled() != boost::asio::cancellation_type::none;
}

auto elapsed_ms(std::chrono::steady_clock::time_point start) -> std::chrono::milliseconds {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
}

auto fail(FallbackResult result, ErrorCode code, std::string message) -> FallbackResult {
    result.text.reset();
    result.chosen_provider.reset();
    result.error = std::move(message);
    result.error_code = code;
    return result;
}

} // anonymous namespace

auto outcome_to_string(CandidateOutcome outcome) -> std::string_view {
    switch (outcome) {
        case CandidateOutcome::Succeeded: return "succeeded";
        case CandidateOutcome::NotConfigured: return "not_configured";
        case CandidateOutcome::Unavailable: return "unavailable";
        case CandidateOutcome::Failed: return "failed";
        case CandidateOutcome::Cancelled: return "cancelled";
    }
    return "failed";
}

auto FallbackResult::to_json() const -> nlohmann::json {
    auto diag = nlohmann::json::array();
    for (const auto& a : attempts) {
        diag.push_back({
            {"provider", a.provider},
            {"outcome", outcome_to_string(a.outcome)},
            {"error", a.error ? nlohmann::json(*a.error) : nlohmann::json()},
            {"attempts", a.attempts},
        });
    }
    return {
        {"text", text ? nlohmann::json(*text) : nlohmann::json()},
        {"chosen_provider", chosen_provider ? nlohmann::json(*chosen_provider)
                                            : nlohmann::json()},
        {"error", error ? nlohmann::json(*error) : nlohmann::json()},
        {"attempts", diag},
    };
}

FallbackOrchestrator::FallbackOrchestrator(
    std::shared_ptr<providers::ProviderRegistry> registry,
    std::shared_ptr<StatusSink> sink)
    : registry_(std::move(registry))
    , sink_(std::move(sink))
    , breakers_(registry_->snapshot()->config.circuit_breaker) {}

void FallbackOrchestrator::report(const AttemptEvent& event) const {
    if (!sink_) return;
    try {
        sink_->record(event);
    } catch (const std::exception& e) {
        LOG_WARN("Status sink failed for {}: {}", event.provider, e.what());
    } catch (...) {
        LOG_WARN("Status sink failed for {}: unknown exception", event.provider);
    }
}

auto FallbackOrchestrator::refresh(Config config) -> std::uint64_t {
    auto breaker_config = config.circuit_breaker;
    auto generation = registry_->refresh(std::move(config));
    probe_.invalidate();
    breakers_.reset(breaker_config);
    return generation;
}

auto FallbackOrchestrator::check(std::string_view provider)
    -> boost::asio::awaitable<AvailabilityRecord> {
    auto snap = registry_->snapshot();
    auto adapter = snap->find(provider);
    if (!adapter) {
        AvailabilityRecord record;
        record.provider = std::string(provider);
        record.last_error = "Provider not configured";
        record.error_code = ErrorCode::ProviderNotConfigured;
        record.checked_at = Clock::now();
        record.generation = snap->generation;
        co_return record;
    }

    auto record = co_await probe_.check(adapter, snap->generation, snap->config.probe);
    if (!record.cached) {
        report(AttemptEvent{
            .provider = record.provider,
            .phase = AttemptPhase::Probe,
            .available = record.available,
            .error = record.last_error,
            .latency = record.latency,
            .at = record.checked_at,
        });
    }
    co_return record;
}

auto FallbackOrchestrator::generate(RequestSpec req) -> boost::asio::awaitable<FallbackResult> {
    co_await boost::asio::this_coro::throw_if_cancelled(false);
    auto cancel_state = co_await boost::asio::this_coro::cancellation_state;

    FallbackResult result;
    auto request_id = utils::new_request_id();

    if (req.empty()) {
        co_return fail(std::move(result), ErrorCode::InvalidArgument,
                       "Request has neither a prompt nor messages");
    }

    // One snapshot per request: a concurrent refresh never changes the
    // candidate set mid-request.
    auto snap = registry_->snapshot();
    const auto& config = snap->config;

    if (!req.temperature) req.temperature = config.default_temperature;
    if (!req.max_tokens) req.max_tokens = config.default_max_tokens;

    // SELECT
    std::vector<std::string> candidates;
    std::unordered_set<std::string> seen;
    if (req.provider && !req.provider->empty()) {
        auto explicit_name = utils::to_lower(*req.provider);
        seen.insert(explicit_name);
        if (snap->find(explicit_name)) {
            candidates.push_back(explicit_name);
        } else {
            LOG_WARN("[{}] Requested provider '{}' is not configured", request_id, explicit_name);
            result.attempts.push_back(AttemptDiagnostic{
                .provider = explicit_name,
                .outcome = CandidateOutcome::NotConfigured,
                .error = "Provider not configured: " + explicit_name,
                .error_code = ErrorCode::ProviderNotConfigured,
            });
        }
    }
    for (const auto& name : snap->order) {
        if (seen.insert(name).second) candidates.push_back(name);
    }

    if (candidates.empty()) {
        std::string message = "No LLM providers are configured";
        if (!result.attempts.empty()) {
            message += "; " + *result.attempts.back().error;
        }
        LOG_ERROR("[{}] {}", request_id, message);
        co_return fail(std::move(result), ErrorCode::Exhausted, std::move(message));
    }

    LOG_DEBUG("[{}] Candidates: {}", request_id, candidates.size());

    RetryPolicy retry(config.retry);
    std::optional<std::string> last_error;
    std::optional<std::string> last_provider;
    bool cancelled = false;

    for (const auto& name : candidates) {
        if (is_cancelled(cancel_state)) {
            cancelled = true;
            break;
        }

        auto adapter = snap->find(name);

        // ATTEMPT: an open circuit skips the provider without probing it.
        if (!breakers_.allow(name)) {
            LOG_INFO("[{}] Skipping provider {}: circuit open", request_id, name);
            result.attempts.push_back(AttemptDiagnostic{
                .provider = name,
                .outcome = CandidateOutcome::Unavailable,
                .error = "circuit open",
                .error_code = ErrorCode::ServiceUnavailable,
            });
            last_error = "circuit open";
            last_provider = name;
            continue;
        }

        // Availability next.
        auto availability = co_await probe_.check(adapter, snap->generation, config.probe);
        if (is_cancelled(cancel_state) || availability.error_code == ErrorCode::Cancelled) {
            cancelled = true;
            break;
        }

        if (!availability.cached) {
            report(AttemptEvent{
                .provider = name,
                .phase = AttemptPhase::Probe,
                .available = availability.available,
                .error = availability.last_error,
                .latency = availability.latency,
                .at = availability.checked_at,
            });
        }

        if (!availability.available) {
            auto err = availability.last_error.value_or("unavailable");
            LOG_INFO("[{}] Skipping unavailable provider {}: {}", request_id, name, err);
            result.attempts.push_back(AttemptDiagnostic{
                .provider = name,
                .outcome = CandidateOutcome::Unavailable,
                .error = err,
                .error_code = availability.error_code,
            });
            last_error = std::move(err);
            last_provider = name;
            continue;
        }

        auto start = std::chrono::steady_clock::now();
        auto outcome = co_await retry.run([adapter, req]() {
            return adapter->generate_text(req);
        });
        auto latency = elapsed_ms(start);

        if (outcome.result.has_value()) {
            report(AttemptEvent{
                .provider = name,
                .phase = AttemptPhase::Call,
                .available = true,
                .latency = latency,
                .circuit = breakers_.record_success(name),
            });
            result.attempts.push_back(AttemptDiagnostic{
                .provider = name,
                .outcome = CandidateOutcome::Succeeded,
                .attempts = outcome.attempts,
            });
            LOG_INFO("[{}] Generated with {} ({} ms, {} attempt(s))",
                     request_id, name, latency.count(), outcome.attempts);

            // SUCCESS
            result.text = std::move(*outcome.result);
            result.chosen_provider = name;
            result.error.reset();
            result.error_code.reset();
            co_return result;
        }

        const auto& err = outcome.result.error();
        cancelled = err.code() == ErrorCode::Cancelled || is_cancelled(cancel_state);

        // An abandoned call says nothing about the provider's health.
        std::optional<CircuitState> circuit;
        if (!cancelled) circuit = breakers_.record_failure(name);

        report(AttemptEvent{
            .provider = name,
            .phase = AttemptPhase::Call,
            .available = false,
            .error = err.what(),
            .latency = latency,
            .circuit = circuit,
        });
        result.attempts.push_back(AttemptDiagnostic{
            .provider = name,
            .outcome = cancelled ? CandidateOutcome::Cancelled : CandidateOutcome::Failed,
            .error = err.what(),
            .error_code = err.code(),
            .attempts = outcome.attempts,
        });

        if (cancelled) break;

        // NEXT
        LOG_WARN("[{}] Provider {} failed after {} attempt(s): {}",
                 request_id, name, outcome.attempts, err.what());
        last_error = err.what();
        last_provider = name;
    }

    if (cancelled || is_cancelled(cancel_state)) {
        LOG_INFO("[{}] Request cancelled", request_id);
        co_return fail(std::move(result), ErrorCode::Cancelled, kCancelledMessage);
    }

    // EXHAUSTED
    std::string message = "All LLM providers failed";
    if (last_error) {
        message += ". Last error from " + *last_provider + ": " + *last_error;
    }
    LOG_ERROR("[{}] {}", request_id, message);
    co_return fail(std::move(result), ErrorCode::Exhausted, std::move(message));
}

} // namespace llmgate::orchestration
