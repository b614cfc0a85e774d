#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "llmgate/core/error.hpp"
#include "llmgate/core/types.hpp"

// std::optional serializer for nlohmann/json so the NLOHMANN_DEFINE macros
// accept optional members.
namespace nlohmann {
template <typename T>
struct adl_serializer<std::optional<T>> {
    static void to_json(json& j, const std::optional<T>& opt) {
        if (opt.has_value()) {
            j = *opt;
        } else {
            j = nullptr;
        }
    }

    static void from_json(const json& j, std::optional<T>& opt) {
        if (j.is_null()) {
            opt = std::nullopt;
        } else {
            opt = j.get<T>();
        }
    }
};
} // namespace nlohmann

namespace llmgate {

struct ProviderConfig {
    std::string name;
    std::string api_key;
    std::optional<std::string> base_url;
    std::optional<std::string> model;
    /// Narrows the adapter's declared option allow-list. Names the adapter
    /// does not support are ignored.
    std::optional<std::vector<std::string>> allowed_options;
    int connect_timeout_seconds = 10;
    int read_timeout_seconds = 60;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(ProviderConfig, name, api_key, base_url, model,
                                                allowed_options, connect_timeout_seconds,
                                                read_timeout_seconds)

struct RetryConfig {
    int max_attempts = 3;
    int base_delay_ms = 4000;
    int max_delay_ms = 10000;
    double multiplier = 2.0;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(RetryConfig, max_attempts, base_delay_ms,
                                                max_delay_ms, multiplier)

/// Liveness probing. Results are cached per provider for `ttl_seconds`;
/// 0 probes before every selection decision.
struct ProbeConfig {
    int ttl_seconds = 60;
    std::string prompt = "Hello";
    int max_tokens = 5;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(ProbeConfig, ttl_seconds, prompt, max_tokens)

/// Per-provider circuit breaker. `failure_threshold` consecutive failed
/// calls open the circuit; after `recovery_timeout_seconds` it lets calls
/// through again half-open and closes after `success_threshold` successes.
/// A threshold of 0 disables the breaker.
struct CircuitBreakerConfig {
    int failure_threshold = 5;
    int recovery_timeout_seconds = 60;
    int success_threshold = 3;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(CircuitBreakerConfig, failure_threshold,
                                                recovery_timeout_seconds, success_threshold)

auto default_priority() -> std::vector<std::string>;

struct Config {
    std::vector<ProviderConfig> providers;
    std::optional<std::string> default_provider;
    std::vector<std::string> priority = default_priority();
    double default_temperature = 0.7;
    int default_max_tokens = 2048;
    RetryConfig retry;
    ProbeConfig probe;
    CircuitBreakerConfig circuit_breaker;
    std::string log_level = "info";
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(Config, providers, default_provider, priority,
                                                default_temperature, default_max_tokens, retry,
                                                probe, circuit_breaker, log_level)

/// Loads a JSON configuration file. `${VAR}` references in credentials are
/// resolved from the environment.
auto load_config(const std::filesystem::path& path) -> Result<Config>;

/// Builds a configuration from the process environment
/// (ANTHROPIC_API_KEY, OPENAI_API_KEY, OPENROUTER_API_KEY, ZAI_API_KEY,
/// DEFAULT_LLM_PROVIDER, DEFAULT_MODEL, TEMPERATURE, MAX_TOKENS,
/// LLMGATE_PRIORITY, LLMGATE_LOG_LEVEL).
auto load_config_from_env() -> Config;

auto default_config() -> Config;

/// True for credentials that must be treated as absent: empty strings,
/// template values such as "your_openai_api_key_here", and unresolved
/// `${VAR}` references.
auto is_placeholder(std::string_view value) -> bool;

/// Candidate order: the default provider first, then the priority list,
/// duplicates removed.
auto effective_priority(const Config& config) -> std::vector<std::string>;

/// Resolves `${VAR}` environment variable references in a string.
/// Supports `$${VAR}` escape (literal `${VAR}`).
auto resolve_env_refs(std::string_view input) -> std::string;

} // namespace llmgate
