#include "llmgate/providers/options.hpp"

#include <algorithm>

#include "llmgate/core/logger.hpp"

namespace llmgate::providers {

auto matches_type(const nlohmann::json& value, OptionType type) -> bool {
    switch (type) {
        case OptionType::Number:
            return value.is_number();
        case OptionType::Integer:
            return value.is_number_integer();
        case OptionType::Boolean:
            return value.is_boolean();
        case OptionType::String:
            return value.is_string();
        case OptionType::StringList:
            return value.is_array() &&
                   std::ranges::all_of(value, [](const auto& v) { return v.is_string(); });
        case OptionType::StringOrList:
            return value.is_string() || matches_type(value, OptionType::StringList);
        case OptionType::Object:
            return value.is_object();
    }
    return false;
}

auto filter_options(const ExtraOptions& options,
                    const std::vector<OptionSpec>& allow_list,
                    std::string_view provider) -> nlohmann::json {
    auto out = nlohmann::json::object();

    for (const auto& [key, value] : options) {
        auto it = std::ranges::find(allow_list, key, &OptionSpec::name);
        if (it == allow_list.end()) {
            LOG_DEBUG("[{}] dropping unsupported option '{}'", provider, key);
            continue;
        }
        if (!matches_type(value, it->type)) {
            LOG_DEBUG("[{}] dropping option '{}' with mismatched type", provider, key);
            continue;
        }
        out[it->wire_key] = value;
    }

    return out;
}

auto restrict_options(std::vector<OptionSpec> declared,
                      const std::optional<std::vector<std::string>>& configured)
    -> std::vector<OptionSpec> {
    if (!configured) return declared;

    std::erase_if(declared, [&](const OptionSpec& spec) {
        return std::ranges::find(*configured, spec.name) == configured->end();
    });
    return declared;
}

} // namespace llmgate::providers
