#include "llmgate/core/config.hpp"
#include "llmgate/core/logger.hpp"
#include "llmgate/core/utils.hpp"

#include <cstdlib>
#include <fstream>
#include <unordered_set>

namespace llmgate {

namespace {

struct EnvProvider {
    const char* name;
    const char* key_var;
};

// Order mirrors default_priority() so env-built configs list providers in
// the order they are tried.
constexpr EnvProvider kEnvProviders[] = {
    {"anthropic", "ANTHROPIC_API_KEY"},
    {"openrouter", "OPENROUTER_API_KEY"},
    {"zai", "ZAI_API_KEY"},
    {"openai", "OPENAI_API_KEY"},
};

auto env_or_empty(const char* var) -> std::string {
    const char* val = std::getenv(var);
    return val ? std::string(val) : std::string{};
}

} // anonymous namespace

auto default_priority() -> std::vector<std::string> {
    return {"anthropic", "openrouter", "zai", "openai"};
}

auto load_config(const std::filesystem::path& path) -> Result<Config> {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected(make_error(
            ErrorCode::InvalidConfig,
            "Cannot open config file",
            path.string()));
    }

    Config config;
    try {
        json j = json::parse(file);
        config = j.get<Config>();
    } catch (const json::exception& e) {
        return std::unexpected(make_error(
            ErrorCode::InvalidConfig,
            "Failed to parse config " + path.string(),
            e.what()));
    }

    for (auto& pc : config.providers) {
        pc.api_key = resolve_env_refs(pc.api_key);
        if (pc.base_url) {
            pc.base_url = resolve_env_refs(*pc.base_url);
        }
    }

    LOG_DEBUG("Config: loaded {} provider entries from {}",
              config.providers.size(), path.string());
    return config;
}

auto load_config_from_env() -> Config {
    Config config;

    if (auto* val = std::getenv("LLMGATE_LOG_LEVEL")) {
        config.log_level = val;
    }
    if (auto* val = std::getenv("DEFAULT_LLM_PROVIDER")) {
        if (*val != '\0') config.default_provider = utils::to_lower(val);
    }
    if (auto* val = std::getenv("TEMPERATURE")) {
        try {
            config.default_temperature = std::stod(val);
        } catch (const std::exception&) {
            LOG_WARN("Config: ignoring non-numeric TEMPERATURE '{}'", val);
        }
    }
    if (auto* val = std::getenv("MAX_TOKENS")) {
        try {
            config.default_max_tokens = std::stoi(val);
        } catch (const std::exception&) {
            LOG_WARN("Config: ignoring non-numeric MAX_TOKENS '{}'", val);
        }
    }
    if (auto* val = std::getenv("LLMGATE_PRIORITY")) {
        std::vector<std::string> priority;
        for (const auto& part : utils::split_list(val, ',')) {
            priority.push_back(utils::to_lower(part));
        }
        if (!priority.empty()) config.priority = std::move(priority);
    }

    auto default_model = env_or_empty("DEFAULT_MODEL");

    for (const auto& entry : kEnvProviders) {
        auto key = env_or_empty(entry.key_var);
        if (key.empty()) continue;

        ProviderConfig pc;
        pc.name = entry.name;
        pc.api_key = std::move(key);
        if (!default_model.empty() && config.default_provider == pc.name) {
            pc.model = default_model;
        }
        config.providers.push_back(std::move(pc));
    }

    return config;
}

auto default_config() -> Config {
    return Config{};
}

auto is_placeholder(std::string_view value) -> bool {
    auto trimmed = utils::trim(value);
    if (trimmed.empty()) return true;
    if (trimmed.find("${") != std::string::npos) return true;

    auto lower = utils::to_lower(trimmed);
    return lower.starts_with("your_") && lower.ends_with("_here");
}

auto effective_priority(const Config& config) -> std::vector<std::string> {
    std::vector<std::string> order;
    std::unordered_set<std::string> seen;

    auto push = [&](const std::string& name) {
        if (!name.empty() && seen.insert(name).second) {
            order.push_back(name);
        }
    };

    if (config.default_provider) push(*config.default_provider);
    for (const auto& name : config.priority) push(name);
    return order;
}

auto resolve_env_refs(std::string_view input) -> std::string {
    std::string result;
    result.reserve(input.size());

    size_t i = 0;
    while (i < input.size()) {
        // $${VAR} -> literal ${VAR}
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '$') {
            result += '$';
            i += 2;
            continue;
        }

        if (i + 2 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            auto close = input.find('}', i + 2);
            if (close != std::string_view::npos) {
                std::string var_name(input.substr(i + 2, close - i - 2));

                if (auto* val = std::getenv(var_name.c_str())) {
                    result += val;
                } else {
                    // Left in place so is_placeholder() rejects the credential.
                    result += input.substr(i, close - i + 1);
                    LOG_DEBUG("Config: unresolved env ref ${{{}}}", var_name);
                }
                i = close + 1;
                continue;
            }
        }

        result += input[i];
        ++i;
    }

    return result;
}

} // namespace llmgate
