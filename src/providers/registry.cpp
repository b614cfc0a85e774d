#include "llmgate/providers/registry.hpp"

#include <unordered_set>

#include "llmgate/core/logger.hpp"
#include "llmgate/providers/anthropic.hpp"
#include "llmgate/providers/openai.hpp"
#include "llmgate/providers/openrouter.hpp"
#include "llmgate/providers/zai.hpp"

namespace llmgate::providers {

auto known_provider_names() -> const std::vector<std::string>& {
    static const std::vector<std::string> names = default_priority();
    return names;
}

auto make_provider(boost::asio::io_context& ioc, const ProviderConfig& config)
    -> Result<std::shared_ptr<Provider>> {
    if (config.name == "anthropic") {
        return std::make_shared<AnthropicProvider>(ioc, config);
    }
    if (config.name == "openai") {
        return std::make_shared<OpenAIProvider>(ioc, config);
    }
    if (config.name == "openrouter") {
        return std::make_shared<OpenRouterProvider>(ioc, config);
    }
    if (config.name == "zai") {
        return std::make_shared<ZaiProvider>(ioc, config);
    }
    return std::unexpected(make_error(
        ErrorCode::InvalidConfig, "Unknown provider", config.name));
}

auto RegistrySnapshot::find(std::string_view name) const -> std::shared_ptr<Provider> {
    auto it = providers.find(std::string(name));
    if (it == providers.end()) return nullptr;
    return it->second;
}

ProviderRegistry::ProviderRegistry(Config config, ProviderFactory factory)
    : factory_(std::move(factory))
    , pending_config_(std::move(config)) {}

ProviderRegistry::ProviderRegistry(boost::asio::io_context& ioc, Config config)
    : ProviderRegistry(std::move(config), [&ioc](const ProviderConfig& pc) {
          return make_provider(ioc, pc);
      }) {}

auto ProviderRegistry::build(const Config& config, std::uint64_t generation) const
    -> std::shared_ptr<const RegistrySnapshot> {
    auto snap = std::make_shared<RegistrySnapshot>();
    snap->generation = generation;
    snap->config = config;

    for (const auto& pc : config.providers) {
        if (snap->providers.contains(pc.name)) {
            LOG_WARN("Provider '{}' configured more than once; keeping the first entry",
                     pc.name);
            continue;
        }
        if (is_placeholder(pc.api_key)) {
            LOG_INFO("Provider '{}' skipped: credential missing or placeholder", pc.name);
            continue;
        }

        Result<std::shared_ptr<Provider>> built = std::unexpected(
            make_error(ErrorCode::InternalError, "Provider factory not set"));
        try {
            if (factory_) built = factory_(pc);
        } catch (const std::exception& e) {
            built = std::unexpected(make_error(
                ErrorCode::InvalidConfig, "Failed to construct provider", e.what()));
        }

        if (!built || !*built) {
            auto what = built ? std::string("factory returned null") : built.error().what();
            LOG_ERROR("Provider '{}' excluded: {}", pc.name, what);
            continue;
        }
        snap->providers.emplace(pc.name, std::move(*built));
    }

    for (const auto& name : effective_priority(config)) {
        if (snap->providers.contains(name)) {
            snap->order.push_back(name);
        }
    }
    // Built providers absent from the priority list are tried last, in
    // configuration order.
    std::unordered_set<std::string> listed(snap->order.begin(), snap->order.end());
    for (const auto& pc : config.providers) {
        if (snap->providers.contains(pc.name) && listed.insert(pc.name).second) {
            snap->order.push_back(pc.name);
        }
    }

    LOG_INFO("Provider registry generation {}: {} provider(s) available",
             generation, snap->providers.size());
    return snap;
}

auto ProviderRegistry::snapshot() -> std::shared_ptr<const RegistrySnapshot> {
    {
        std::lock_guard lock(mutex_);
        if (current_) return current_;
    }

    std::lock_guard build_lock(build_mutex_);
    {
        std::lock_guard lock(mutex_);
        if (current_) return current_;
    }
    auto snap = build(pending_config_, ++last_generation_);

    std::lock_guard lock(mutex_);
    current_ = snap;
    return snap;
}

auto ProviderRegistry::refresh(Config config) -> std::uint64_t {
    std::lock_guard build_lock(build_mutex_);
    pending_config_ = std::move(config);
    auto snap = build(pending_config_, ++last_generation_);

    std::lock_guard lock(mutex_);
    current_ = std::move(snap);
    return current_->generation;
}

auto ProviderRegistry::get(std::string_view name) -> Result<std::shared_ptr<Provider>> {
    auto snap = snapshot();
    if (auto provider = snap->find(name)) {
        return provider;
    }
    return std::unexpected(make_error(
        ErrorCode::ProviderNotConfigured,
        "Provider not configured",
        std::string(name)));
}

auto ProviderRegistry::names() -> std::vector<std::string> {
    return snapshot()->order;
}

auto ProviderRegistry::generation() const -> std::uint64_t {
    std::lock_guard lock(mutex_);
    return current_ ? current_->generation : 0;
}

} // namespace llmgate::providers
