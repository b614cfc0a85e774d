#include <catch2/catch_test_macros.hpp>

#include "llmgate/providers/options.hpp"

using namespace llmgate;
using namespace llmgate::providers;

namespace {

auto sample_allow_list() -> std::vector<OptionSpec> {
    return {
        {"stop", OptionType::StringOrList, "stop"},
        {"top_p", OptionType::Number, "top_p"},
        {"top_k", OptionType::Integer, "top_k"},
        {"stop_words", OptionType::StringList, "stop_sequences"},
    };
}

} // namespace

TEST_CASE("filter_options drops keys outside the allow-list", "[providers][options]") {
    ExtraOptions opts = {
        {"top_p", 0.9},
        {"logit_bias", json{{"50256", -100}}},
        {"stream", true},
    };

    auto out = filter_options(opts, sample_allow_list(), "test");

    CHECK(out.size() == 1);
    CHECK(out["top_p"] == 0.9);
    CHECK_FALSE(out.contains("logit_bias"));
    CHECK_FALSE(out.contains("stream"));
}

TEST_CASE("filter_options renames to the wire key", "[providers][options]") {
    ExtraOptions opts = {{"stop_words", json::array({"END"})}};

    auto out = filter_options(opts, sample_allow_list(), "test");

    CHECK(out.contains("stop_sequences"));
    CHECK_FALSE(out.contains("stop_words"));
}

TEST_CASE("filter_options drops values of the wrong type", "[providers][options]") {
    ExtraOptions opts = {
        {"top_p", "high"},
        {"top_k", 1.5},
        {"stop_words", json::array({"a", 3})},
    };

    auto out = filter_options(opts, sample_allow_list(), "test");
    CHECK(out.empty());
}

TEST_CASE("filter_options with an empty allow-list forwards nothing", "[providers][options]") {
    ExtraOptions opts = {{"top_p", 0.5}};
    CHECK(filter_options(opts, {}, "test").empty());
}

TEST_CASE("matches_type accepts the declared JSON shapes", "[providers][options]") {
    CHECK(matches_type(json(1), OptionType::Number));
    CHECK(matches_type(json(0.5), OptionType::Number));
    CHECK(matches_type(json(3), OptionType::Integer));
    CHECK_FALSE(matches_type(json(0.5), OptionType::Integer));
    CHECK(matches_type(json(true), OptionType::Boolean));
    CHECK(matches_type(json("x"), OptionType::String));
    CHECK(matches_type(json::array(), OptionType::StringList));
    CHECK(matches_type(json("END"), OptionType::StringOrList));
    CHECK(matches_type(json::array({"a", "b"}), OptionType::StringOrList));
    CHECK_FALSE(matches_type(json(1), OptionType::StringOrList));
    CHECK(matches_type(json::object(), OptionType::Object));
}

TEST_CASE("restrict_options narrows to configured names", "[providers][options]") {
    auto declared = sample_allow_list();

    auto unchanged = restrict_options(declared, std::nullopt);
    CHECK(unchanged.size() == declared.size());

    auto narrowed = restrict_options(declared, std::vector<std::string>{"top_p", "not_declared"});
    REQUIRE(narrowed.size() == 1);
    CHECK(narrowed[0].name == "top_p");

    auto none = restrict_options(declared, std::vector<std::string>{});
    CHECK(none.empty());
}
