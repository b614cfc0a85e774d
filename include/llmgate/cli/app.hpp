#pragma once

#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include "llmgate/cli/commands.hpp"
#include "llmgate/core/config.hpp"

namespace llmgate::cli {

/// The `llmgate` command line.
///
/// Global options select where configuration comes from. run() loads it
/// once (a .env file first, then `--config` or the environment) and hands
/// the result to the chosen subcommand.
class App {
public:
    App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// Returns the process exit code.
    auto run(int argc, char** argv) -> int;

private:
    auto load_effective_config() -> Result<Config>;

    CLI::App cli_;
    std::string config_path_;
    std::string env_file_;
    std::string log_level_;
    std::vector<Command> commands_;
};

} // namespace llmgate::cli
