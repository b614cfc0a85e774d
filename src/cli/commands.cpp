#include "llmgate/cli/commands.hpp"
#include "llmgate/core/logger.hpp"
#include "llmgate/core/utils.hpp"

#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <vector>

#include <boost/asio/bind_cancellation_slot.hpp>
#include <boost/asio/cancellation_signal.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "llmgate/orchestration/fallback.hpp"
#include "llmgate/providers/registry.hpp"

#ifndef LLMGATE_VERSION_STRING
#define LLMGATE_VERSION_STRING "0.1.0-dev"
#endif

namespace llmgate::cli {

using json = nlohmann::json;

namespace {

struct GenerateOptions {
    std::string prompt;
    std::string system;
    std::string provider;
    std::string model;
    std::optional<double> temperature;
    std::optional<int> max_tokens;
    std::vector<std::string> options;
    bool as_json = false;
};

/// Runs `task` on a private io_context. SIGINT/SIGTERM cancel it through
/// its cancellation slot.
template <typename T>
auto run_cancellable(boost::asio::io_context& ioc, boost::asio::awaitable<T> task)
    -> std::optional<T> {
    std::optional<T> out;
    std::exception_ptr error;

    boost::asio::cancellation_signal cancel;
    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&cancel](const boost::system::error_code& ec, int /*sig*/) {
        if (!ec) {
            LOG_INFO("Received shutdown signal, cancelling request");
            cancel.emit(boost::asio::cancellation_type::terminal);
        }
    });

    boost::asio::co_spawn(ioc, std::move(task),
        boost::asio::bind_cancellation_slot(cancel.slot(),
            [&](std::exception_ptr ep, T value) {
                error = ep;
                if (!ep) out = std::move(value);
                signals.cancel();
            }));

    ioc.run();

    if (error) std::rethrow_exception(error);
    return out;
}

} // anonymous namespace

void redact_config_json(json& j) {
    static const std::vector<std::string> sensitive_keys = {
        "api_key", "token", "secret",
    };

    if (j.is_object()) {
        for (auto it = j.begin(); it != j.end(); ++it) {
            bool is_sensitive = false;
            for (const auto& key : sensitive_keys) {
                if (it.key() == key) {
                    is_sensitive = true;
                    break;
                }
            }
            if (is_sensitive && it->is_string() && !it->get<std::string>().empty()) {
                *it = "***REDACTED***";
            } else {
                redact_config_json(*it);
            }
        }
    } else if (j.is_array()) {
        for (auto& elem : j) {
            redact_config_json(elem);
        }
    }
}

auto parse_option_assignment(std::string_view text)
    -> Result<std::pair<std::string, json>> {
    auto eq = text.find('=');
    if (eq == std::string_view::npos) {
        return std::unexpected(make_error(
            ErrorCode::InvalidArgument, "Expected key=value", std::string(text)));
    }

    auto key = utils::trim(text.substr(0, eq));
    if (key.empty()) {
        return std::unexpected(make_error(
            ErrorCode::InvalidArgument, "Option name is empty", std::string(text)));
    }

    std::string raw(text.substr(eq + 1));
    auto value = json::parse(raw, nullptr, /*allow_exceptions=*/false);
    if (value.is_discarded()) {
        value = raw;
    }
    return std::make_pair(std::move(key), std::move(value));
}

// ---------------------------------------------------------------------------
// generate command
// ---------------------------------------------------------------------------

auto register_generate_command(CLI::App& app) -> Command {
    auto* sub = app.add_subcommand("generate", "Generate text through the provider chain");
    auto opts = std::make_shared<GenerateOptions>();

    sub->add_option("-p,--prompt", opts->prompt, "Prompt text")->required();
    sub->add_option("-s,--system", opts->system, "System prompt");
    sub->add_option("--provider", opts->provider, "Try this provider first");
    sub->add_option("-m,--model", opts->model, "Model override");
    sub->add_option("-t,--temperature", opts->temperature, "Sampling temperature")
        ->check(CLI::Range(0.0, 2.0));
    sub->add_option("--max-tokens", opts->max_tokens, "Maximum output tokens")
        ->check(CLI::PositiveNumber);
    sub->add_option("-o,--option", opts->options,
                    "Extra provider option as key=json (repeatable)");
    sub->add_flag("--json", opts->as_json, "Print the full result as JSON");

    auto action = [opts](const Config& config) -> int {
        RequestSpec req;
        req.prompt = opts->prompt;
        if (!opts->system.empty()) req.system_prompt = opts->system;
        if (!opts->provider.empty()) req.provider = opts->provider;
        if (!opts->model.empty()) req.model = opts->model;
        req.temperature = opts->temperature;
        req.max_tokens = opts->max_tokens;

        for (const auto& assignment : opts->options) {
            auto parsed = parse_option_assignment(assignment);
            if (!parsed) {
                std::cerr << "Error: " << parsed.error().what() << "\n";
                return 2;
            }
            req.options.insert_or_assign(parsed->first, parsed->second);
        }

        boost::asio::io_context ioc;
        auto registry = std::make_shared<providers::ProviderRegistry>(ioc, config);
        orchestration::FallbackOrchestrator orchestrator(registry);

        auto result = run_cancellable(ioc, orchestrator.generate(std::move(req)));
        if (!result) {
            std::cerr << "Error: request did not complete\n";
            return 1;
        }

        if (opts->as_json) {
            std::cout << result->to_json().dump(2) << "\n";
            return result->ok() ? 0 : 1;
        }
        if (!result->ok()) {
            std::cerr << "Error: " << result->error.value_or("unknown error") << "\n";
            return 1;
        }
        LOG_INFO("Answered by {}", result->chosen_provider.value_or("?"));
        std::cout << *result->text << "\n";
        return 0;
    };

    return Command{sub, std::move(action)};
}

// ---------------------------------------------------------------------------
// providers command
// ---------------------------------------------------------------------------

auto register_providers_command(CLI::App& app) -> Command {
    auto* sub = app.add_subcommand("providers", "List configured providers and probe them");

    auto no_probe = std::make_shared<bool>(false);
    sub->add_flag("--no-probe", *no_probe, "List providers without probing");

    auto action = [no_probe](const Config& config) -> int {
        boost::asio::io_context ioc;
        auto registry = std::make_shared<providers::ProviderRegistry>(ioc, config);
        orchestration::FallbackOrchestrator orchestrator(registry);

        auto names = registry->names();
        if (names.empty()) {
            std::cout << "No providers configured.\n";
            return 1;
        }

        if (*no_probe) {
            for (const auto& name : names) {
                std::cout << name << "\n";
            }
            return 0;
        }

        auto probe_all = [&]() -> boost::asio::awaitable<std::vector<orchestration::AvailabilityRecord>> {
            std::vector<orchestration::AvailabilityRecord> records;
            for (const auto& name : names) {
                records.push_back(co_await orchestrator.check(name));
            }
            co_return records;
        };

        auto records = run_cancellable(ioc, probe_all());
        if (!records) return 1;

        int available = 0;
        for (const auto& rec : *records) {
            if (rec.available) {
                ++available;
                std::cout << rec.provider << "  available (" << rec.latency.count() << " ms)\n";
            } else {
                std::cout << rec.provider << "  unavailable: "
                          << utils::truncate(rec.last_error.value_or("unknown error"), 200)
                          << "\n";
            }
        }
        return available > 0 ? 0 : 1;
    };

    return Command{sub, std::move(action)};
}

// ---------------------------------------------------------------------------
// config command
// ---------------------------------------------------------------------------

auto register_config_command(CLI::App& app) -> Command {
    auto* sub = app.add_subcommand("config", "Show the effective configuration");

    auto action = [](const Config& config) -> int {
        // Pretty-print the configuration as JSON (with secrets redacted).
        json j = config;
        redact_config_json(j);
        std::cout << j.dump(2) << "\n";
        return 0;
    };

    return Command{sub, std::move(action)};
}

// ---------------------------------------------------------------------------
// version command
// ---------------------------------------------------------------------------

auto register_version_command(CLI::App& app) -> Command {
    auto* sub = app.add_subcommand("version", "Print version information");

    auto action = [](const Config&) -> int {
        std::cout << "llmgate " << LLMGATE_VERSION_STRING << "\n";
        std::cout << "C++ standard: " << __cplusplus << "\n";
#if defined(__clang__)
        std::cout << "Compiler: clang " << __clang_major__ << "."
                  << __clang_minor__ << "." << __clang_patchlevel__ << "\n";
#elif defined(__GNUC__)
        std::cout << "Compiler: gcc " << __GNUC__ << "."
                  << __GNUC_MINOR__ << "." << __GNUC_PATCHLEVEL__ << "\n";
#else
        std::cout << "Compiler: unknown\n";
#endif
        return 0;
    };

    return Command{sub, std::move(action)};
}

} // namespace llmgate::cli
