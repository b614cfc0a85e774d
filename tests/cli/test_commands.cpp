#include <catch2/catch_test_macros.hpp>

#include "llmgate/cli/commands.hpp"

using namespace llmgate;
using namespace llmgate::cli;
using json = nlohmann::json;

TEST_CASE("Credentials are redacted at any depth", "[cli][redaction]") {
    json cfg = {
        {"providers", json::array({
            {{"name", "anthropic"}, {"api_key", "sk-ant-123"}},
            {{"name", "openai"}, {"api_key", ""}},
        })},
        {"nested", {{"token", "abc"}, {"secret", "xyz"}, {"model", "gpt-4"}}},
        {"log_level", "info"},
    };

    redact_config_json(cfg);

    CHECK(cfg["providers"][0]["api_key"] == "***REDACTED***");
    CHECK(cfg["providers"][0]["name"] == "anthropic");
    // Empty values stay empty so a missing key is still visible.
    CHECK(cfg["providers"][1]["api_key"] == "");
    CHECK(cfg["nested"]["token"] == "***REDACTED***");
    CHECK(cfg["nested"]["secret"] == "***REDACTED***");
    CHECK(cfg["nested"]["model"] == "gpt-4");
    CHECK(cfg["log_level"] == "info");
}

TEST_CASE("Option assignments parse JSON values", "[cli][options]") {
    auto number = parse_option_assignment("top_p=0.9");
    REQUIRE(number.has_value());
    CHECK(number->first == "top_p");
    CHECK(number->second == 0.9);

    auto list = parse_option_assignment("stop=[\"END\",\"STOP\"]");
    REQUIRE(list.has_value());
    CHECK(list->second.is_array());
    CHECK(list->second.size() == 2);

    auto object = parse_option_assignment(" logit_bias ={\"50256\": -100}");
    REQUIRE(object.has_value());
    CHECK(object->first == "logit_bias");
    CHECK(object->second["50256"] == -100);
}

TEST_CASE("Non-JSON option values are strings", "[cli][options]") {
    auto plain = parse_option_assignment("user=alice");
    REQUIRE(plain.has_value());
    CHECK(plain->second == "alice");

    auto empty = parse_option_assignment("stop=");
    REQUIRE(empty.has_value());
    CHECK(empty->second == "");
}

TEST_CASE("Malformed option assignments are rejected", "[cli][options]") {
    auto no_equals = parse_option_assignment("top_p");
    REQUIRE_FALSE(no_equals.has_value());
    CHECK(no_equals.error().code() == ErrorCode::InvalidArgument);

    auto no_key = parse_option_assignment("=1");
    REQUIRE_FALSE(no_key.has_value());
    CHECK(no_key.error().code() == ErrorCode::InvalidArgument);
}

TEST_CASE("Generate command parses its flags", "[cli][generate]") {
    CLI::App app{"llmgate"};
    auto generate = register_generate_command(app);
    auto providers = register_providers_command(app);

    app.parse("llmgate generate --prompt hello --provider openai --temperature 0.5 "
              "-o top_p=0.9 -o stop=END --json", true);

    CHECK(generate.sub->parsed());
    CHECK_FALSE(providers.sub->parsed());
    CHECK(generate.sub->count("--prompt") == 1);
    CHECK(generate.sub->count("--option") == 2);
    CHECK(generate.sub->count("--json") == 1);
}

TEST_CASE("Generate command validates its flags", "[cli][generate]") {
    CLI::App app{"llmgate"};
    (void)register_generate_command(app);

    CHECK_THROWS_AS(app.parse("llmgate generate", true), CLI::RequiredError);

    CLI::App ranged{"llmgate"};
    (void)register_generate_command(ranged);
    CHECK_THROWS_AS(ranged.parse("llmgate generate --prompt hi --temperature 3", true),
                    CLI::ValidationError);
}

TEST_CASE("Every subcommand registers", "[cli]") {
    CLI::App app{"llmgate"};
    auto commands = {
        register_generate_command(app),
        register_providers_command(app),
        register_config_command(app),
        register_version_command(app),
    };

    for (const auto& cmd : commands) {
        REQUIRE(cmd.sub != nullptr);
        CHECK(static_cast<bool>(cmd.action));
    }
    CHECK(app.get_subcommand("providers")->get_name() == "providers");
    CHECK(app.get_subcommand("version")->get_name() == "version");
}
