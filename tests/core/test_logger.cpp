#include <catch2/catch_test_macros.hpp>

#include "llmgate/core/logger.hpp"

using namespace llmgate;

TEST_CASE("Log level names parse", "[logger]") {
    CHECK(Logger::parse_level("debug") == spdlog::level::debug);
    CHECK(Logger::parse_level("warn") == spdlog::level::warn);
    CHECK(Logger::parse_level("warning") == spdlog::level::warn);
    CHECK(Logger::parse_level("error") == spdlog::level::err);
    CHECK(Logger::parse_level("off") == spdlog::level::off);
    CHECK_FALSE(Logger::parse_level("verbose").has_value());

    for (const auto& name : Logger::level_names()) {
        CHECK(Logger::parse_level(name).has_value());
    }
}

TEST_CASE("Unknown levels keep the current one", "[logger]") {
    Logger::init("llmgate-test", "error");
    CHECK(Logger::get()->level() == spdlog::level::err);

    Logger::set_level("nonsense");
    CHECK(Logger::get()->level() == spdlog::level::err);

    Logger::set_level("debug");
    CHECK(Logger::get()->level() == spdlog::level::debug);

    Logger::init("llmgate-test", "warn");
    CHECK(Logger::get()->level() == spdlog::level::warn);
}
