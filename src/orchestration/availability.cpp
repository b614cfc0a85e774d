#include "llmgate/orchestration/availability.hpp"

#include "llmgate/core/logger.hpp"

namespace llmgate::orchestration {

auto AvailabilityProbe::probe_request(const ProbeConfig& config) -> RequestSpec {
    RequestSpec req;
    req.prompt = config.prompt;
    req.max_tokens = config.max_tokens;
    return req;
}

auto AvailabilityProbe::cached(std::string_view provider,
                               std::uint64_t generation,
                               std::chrono::seconds ttl) const
    -> std::optional<AvailabilityRecord> {
    if (ttl.count() <= 0) return std::nullopt;

    std::lock_guard lock(mutex_);
    auto it = cache_.find(provider);
    if (it == cache_.end()) return std::nullopt;

    const auto& entry = it->second;
    if (entry.record.generation != generation) return std::nullopt;
    if (std::chrono::steady_clock::now() - entry.taken >= ttl) return std::nullopt;

    auto record = entry.record;
    record.cached = true;
    return record;
}

auto AvailabilityProbe::check(std::shared_ptr<providers::Provider> provider,
                              std::uint64_t generation,
                              ProbeConfig config) -> boost::asio::awaitable<AvailabilityRecord> {
    std::string name(provider->name());

    if (auto hit = cached(name, generation, std::chrono::seconds(config.ttl_seconds))) {
        LOG_DEBUG("Availability of {} served from cache ({})", name,
                  hit->available ? "available" : "unavailable");
        co_return *hit;
    }

    auto start = std::chrono::steady_clock::now();
    auto result = co_await provider->probe(probe_request(config));

    AvailabilityRecord record;
    record.provider = name;
    record.available = result.has_value();
    record.checked_at = Clock::now();
    record.generation = generation;
    record.latency = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    if (!result) {
        record.last_error = result.error().what();
        record.error_code = result.error().code();
        LOG_WARN("Provider {} unavailable: {}", name, *record.last_error);
    } else {
        LOG_DEBUG("Provider {} available ({} ms)", name, record.latency.count());
    }

    if (record.error_code != ErrorCode::Cancelled) {
        store(record);
    }
    co_return record;
}

void AvailabilityProbe::store(const AvailabilityRecord& record) {
    std::lock_guard lock(mutex_);
    // A probe that started before a refresh must not replace a newer entry.
    if (auto it = cache_.find(record.provider);
        it != cache_.end() && it->second.record.generation > record.generation) {
        return;
    }
    cache_.insert_or_assign(record.provider,
                            Entry{record, std::chrono::steady_clock::now()});
}

void AvailabilityProbe::invalidate() {
    std::lock_guard lock(mutex_);
    cache_.clear();
}

void AvailabilityProbe::invalidate(std::string_view provider) {
    std::lock_guard lock(mutex_);
    if (auto it = cache_.find(provider); it != cache_.end()) {
        cache_.erase(it);
    }
}

} // namespace llmgate::orchestration
