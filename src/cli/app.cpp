#include "llmgate/cli/app.hpp"
#include "llmgate/core/logger.hpp"
#include "llmgate/infra/dotenv.hpp"

#include <filesystem>
#include <iostream>

#ifndef LLMGATE_VERSION_STRING
#define LLMGATE_VERSION_STRING "0.1.0-dev"
#endif

namespace llmgate::cli {

App::App()
    : cli_("llmgate", "Resilient text generation across LLM providers")
{
    cli_.set_version_flag("--version", LLMGATE_VERSION_STRING,
                          "Display version information");

    cli_.add_option("-c,--config", config_path_,
                    "Path to configuration file (JSON)")
        ->envname("LLMGATE_CONFIG")
        ->check(CLI::ExistingFile);

    cli_.add_option("--env-file", env_file_,
                    "Load environment variables from this .env file")
        ->check(CLI::ExistingFile);

    cli_.add_option("--log-level", log_level_,
                    "Log level (trace, debug, info, warn, error, critical, off)")
        ->check(CLI::IsMember(Logger::level_names()));

    cli_.require_subcommand(1);

    commands_.push_back(register_generate_command(cli_));
    commands_.push_back(register_providers_command(cli_));
    commands_.push_back(register_config_command(cli_));
    commands_.push_back(register_version_command(cli_));
}

auto App::run(int argc, char** argv) -> int {
    try {
        cli_.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return cli_.exit(e);
    }

    // Until the configured level is known, only warnings reach stderr.
    Logger::init("llmgate", log_level_.empty() ? "warn" : log_level_);

    auto loaded = load_effective_config();
    if (!loaded) {
        std::cerr << "Error: " << loaded.error().what() << "\n";
        return 1;
    }
    auto config = std::move(*loaded);

    if (!log_level_.empty()) {
        config.log_level = log_level_;
    }
    Logger::set_level(config.log_level);

    for (const auto& cmd : commands_) {
        if (cmd.sub->parsed()) {
            int rc = cmd.action(config);
            Logger::flush();
            return rc;
        }
    }
    return 0;
}

auto App::load_effective_config() -> Result<Config> {
    if (!env_file_.empty()) {
        infra::load_dotenv(env_file_);
    } else if (std::filesystem::exists(".env")) {
        infra::load_dotenv(".env");
    }

    if (!config_path_.empty()) {
        LOG_INFO("Loading configuration from: {}", config_path_);
        return load_config(std::filesystem::path(config_path_));
    }
    return load_config_from_env();
}

} // namespace llmgate::cli
