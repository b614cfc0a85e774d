#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include <boost/asio.hpp>

#include "llmgate/core/config.hpp"
#include "llmgate/core/error.hpp"
#include "llmgate/core/types.hpp"
#include "llmgate/providers/provider.hpp"

namespace llmgate::orchestration {

/// Outcome of the latest liveness check for one provider.
struct AvailabilityRecord {
    std::string provider;
    bool available = false;
    std::optional<std::string> last_error;
    std::optional<ErrorCode> error_code;
    Timestamp checked_at{};
    std::uint64_t generation = 0;
    std::chrono::milliseconds latency{0};
    /// True when served from the cache instead of a fresh probe.
    bool cached = false;
};

/// Liveness checks with a per-provider TTL cache.
///
/// A check sends one minimal request through Provider::probe() with no
/// retry. Entries are tagged with the registry generation they were taken
/// under; an entry from another generation is never served. A probe that
/// was cancelled is not cached.
class AvailabilityProbe {
public:
    AvailabilityProbe() = default;

    AvailabilityProbe(const AvailabilityProbe&) = delete;
    AvailabilityProbe& operator=(const AvailabilityProbe&) = delete;

    auto check(std::shared_ptr<providers::Provider> provider,
               std::uint64_t generation,
               ProbeConfig config) -> boost::asio::awaitable<AvailabilityRecord>;

    /// Fresh cached record, if any.
    [[nodiscard]] auto cached(std::string_view provider,
                              std::uint64_t generation,
                              std::chrono::seconds ttl) const
        -> std::optional<AvailabilityRecord>;

    /// The request a probe sends.
    static auto probe_request(const ProbeConfig& config) -> RequestSpec;

    void invalidate();
    void invalidate(std::string_view provider);

private:
    struct Entry {
        AvailabilityRecord record;
        std::chrono::steady_clock::time_point taken;
    };

    void store(const AvailabilityRecord& record);

    mutable std::mutex mutex_;
    std::map<std::string, Entry, std::less<>> cache_;
};

} // namespace llmgate::orchestration
