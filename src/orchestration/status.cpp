#include "llmgate/orchestration/status.hpp"

#include "llmgate/core/utils.hpp"

namespace llmgate::orchestration {

auto phase_to_string(AttemptPhase phase) -> std::string_view {
    switch (phase) {
        case AttemptPhase::Probe: return "probe";
        case AttemptPhase::Call: return "call";
    }
    return "call";
}

StatusMonitor::StatusMonitor(std::size_t max_history)
    : max_history_(max_history == 0 ? 1 : max_history) {}

void StatusMonitor::record(const AttemptEvent& event) {
    std::lock_guard lock(mutex_);

    auto& st = status_[event.provider];
    st.available = event.available;
    st.last_error = event.error;
    st.last_check = event.at;
    if (event.circuit) st.circuit = *event.circuit;

    if (event.available) {
        ++st.consecutive_successes;
        st.consecutive_failures = 0;
    } else {
        ++st.consecutive_failures;
        st.consecutive_successes = 0;
    }

    if (event.phase == AttemptPhase::Call) {
        ++st.request_count;
        auto n = static_cast<double>(st.request_count);
        auto ms = static_cast<double>(event.latency.count());
        st.average_latency_ms += (ms - st.average_latency_ms) / n;
    }

    auto& hist = history_[event.provider];
    hist.push_back(event);
    while (hist.size() > max_history_) {
        hist.pop_front();
    }
}

auto StatusMonitor::status(std::string_view provider) const -> std::optional<ProviderStatus> {
    std::lock_guard lock(mutex_);
    auto it = status_.find(provider);
    if (it == status_.end()) return std::nullopt;
    return it->second;
}

auto StatusMonitor::history(std::string_view provider) const -> std::deque<AttemptEvent> {
    std::lock_guard lock(mutex_);
    auto it = history_.find(provider);
    if (it == history_.end()) return {};
    return it->second;
}

auto StatusMonitor::snapshot() const -> nlohmann::json {
    std::lock_guard lock(mutex_);

    auto providers = nlohmann::json::object();
    for (const auto& [name, st] : status_) {
        providers[name] = {
            {"available", st.available},
            {"last_error", st.last_error ? nlohmann::json(*st.last_error) : nlohmann::json()},
            {"last_check", st.last_check ? nlohmann::json(utils::format_iso8601(*st.last_check))
                                         : nlohmann::json()},
            {"consecutive_successes", st.consecutive_successes},
            {"consecutive_failures", st.consecutive_failures},
            {"request_count", st.request_count},
            {"average_response_time_ms", st.average_latency_ms},
            {"circuit_state", circuit_state_to_string(st.circuit)},
        };
    }

    auto history_points = nlohmann::json::object();
    for (const auto& [name, hist] : history_) {
        history_points[name] = hist.size();
    }

    return {
        {"timestamp", utils::now_iso8601()},
        {"providers", providers},
        {"provider_count", status_.size()},
        {"history_points", history_points},
    };
}

void StatusMonitor::clear() {
    std::lock_guard lock(mutex_);
    status_.clear();
    history_.clear();
}

} // namespace llmgate::orchestration
