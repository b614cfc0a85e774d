#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <boost/asio.hpp>

#include "llmgate/core/config.hpp"
#include "llmgate/core/error.hpp"
#include "llmgate/providers/provider.hpp"

namespace llmgate::providers {

/// Builds one adapter from its configuration. Fails with InvalidConfig for
/// provider names it does not know.
using ProviderFactory =
    std::function<Result<std::shared_ptr<Provider>>(const ProviderConfig&)>;

/// Names with a built-in adapter, in default priority order.
auto known_provider_names() -> const std::vector<std::string>&;

/// Constructs the built-in adapter for `config.name`.
auto make_provider(boost::asio::io_context& ioc, const ProviderConfig& config)
    -> Result<std::shared_ptr<Provider>>;

/// Immutable result of one registry build. Readers keep it alive through
/// shared ownership while a refresh swaps in its successor.
struct RegistrySnapshot {
    std::uint64_t generation = 0;
    Config config;
    std::unordered_map<std::string, std::shared_ptr<Provider>> providers;
    /// Candidate order (default provider first, then the priority list)
    /// restricted to built providers.
    std::vector<std::string> order;

    [[nodiscard]] auto find(std::string_view name) const -> std::shared_ptr<Provider>;
};

/// Owns one adapter per usable provider.
///
/// The adapter map is built lazily on first use and rebuilt wholesale by
/// refresh(). Providers whose credential is missing or a placeholder are
/// skipped. Readers always see a complete snapshot: either the one before a
/// refresh or the one after it.
class ProviderRegistry {
public:
    ProviderRegistry(Config config, ProviderFactory factory);
    ProviderRegistry(boost::asio::io_context& ioc, Config config);

    ProviderRegistry(const ProviderRegistry&) = delete;
    ProviderRegistry& operator=(const ProviderRegistry&) = delete;

    /// Returns the adapter registered under `name`, or ProviderNotConfigured.
    auto get(std::string_view name) -> Result<std::shared_ptr<Provider>>;

    /// Current snapshot, building the first one if needed.
    auto snapshot() -> std::shared_ptr<const RegistrySnapshot>;

    /// Replaces the configuration and swaps in a freshly built snapshot.
    /// Returns the new generation number.
    auto refresh(Config config) -> std::uint64_t;

    /// Built provider names in candidate order.
    auto names() -> std::vector<std::string>;

    [[nodiscard]] auto generation() const -> std::uint64_t;

private:
    auto build(const Config& config, std::uint64_t generation) const
        -> std::shared_ptr<const RegistrySnapshot>;

    ProviderFactory factory_;

    // Serializes builds so generations are installed in order.
    std::mutex build_mutex_;
    Config pending_config_;
    std::uint64_t last_generation_ = 0;

    mutable std::mutex mutex_;
    std::shared_ptr<const RegistrySnapshot> current_;
};

} // namespace llmgate::providers
