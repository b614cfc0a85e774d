#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <utility>

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include "llmgate/core/config.hpp"
#include "llmgate/core/error.hpp"
#include "llmgate/core/types.hpp"

namespace llmgate::cli {

/// A registered subcommand and the action run once configuration is loaded.
struct Command {
    CLI::App* sub = nullptr;
    std::function<int(const Config&)> action;
};

/// Register the `generate` subcommand.
/// Sends one request through the fallback chain and prints the text.
auto register_generate_command(CLI::App& app) -> Command;

/// Register the `providers` subcommand.
/// Lists usable providers in candidate order and probes each one.
auto register_providers_command(CLI::App& app) -> Command;

/// Register the `config` subcommand.
/// Prints the effective configuration with credentials redacted.
auto register_config_command(CLI::App& app) -> Command;

/// Register the `version` subcommand.
auto register_version_command(CLI::App& app) -> Command;

/// Recursively replaces non-empty credential values with "***REDACTED***".
void redact_config_json(nlohmann::json& j);

/// Parses `key=<json>`. A value that is not valid JSON is taken as a string.
auto parse_option_assignment(std::string_view text)
    -> Result<std::pair<std::string, nlohmann::json>>;

} // namespace llmgate::cli
