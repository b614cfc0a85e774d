#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "llmgate/core/types.hpp"

namespace llmgate::providers {

enum class OptionType {
    Number,
    Integer,
    Boolean,
    String,
    StringList,
    StringOrList,
    Object,
};

/// One entry of an adapter's extra-option allow-list: the caller-facing
/// name, the JSON type it must carry, and the payload key it is written to.
struct OptionSpec {
    std::string name;
    OptionType type = OptionType::String;
    std::string wire_key;
};

[[nodiscard]] auto matches_type(const nlohmann::json& value, OptionType type) -> bool;

/// Keeps only options named in `allow_list` whose value has the declared
/// type, keyed by their wire name. Everything else is dropped and logged at
/// debug level.
[[nodiscard]] auto filter_options(const ExtraOptions& options,
                                  const std::vector<OptionSpec>& allow_list,
                                  std::string_view provider) -> nlohmann::json;

/// Narrows a declared allow-list to the names listed in configuration.
/// Configured names the adapter does not declare are ignored.
[[nodiscard]] auto restrict_options(std::vector<OptionSpec> declared,
                                    const std::optional<std::vector<std::string>>& configured)
    -> std::vector<OptionSpec>;

} // namespace llmgate::providers
