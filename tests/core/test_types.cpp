#include <catch2/catch_test_macros.hpp>

#include "llmgate/core/types.hpp"

using namespace llmgate;

TEST_CASE("RequestSpec conversation prefers messages", "[types]") {
    RequestSpec req;
    req.prompt = "ignored";
    req.messages = {
        {Role::System, "be brief"},
        {Role::User, "hi"},
    };

    auto conv = req.conversation();
    REQUIRE(conv.size() == 2);
    CHECK(conv[0].role == Role::System);
    CHECK(conv[1].content == "hi");
}

TEST_CASE("RequestSpec prompt becomes a single user turn", "[types]") {
    RequestSpec req;
    req.prompt = "Write a haiku";

    auto conv = req.conversation();
    REQUIRE(conv.size() == 1);
    CHECK(conv[0].role == Role::User);
    CHECK(conv[0].content == "Write a haiku");
    CHECK_FALSE(req.empty());
}

TEST_CASE("RequestSpec without prompt or messages is empty", "[types]") {
    RequestSpec req;
    CHECK(req.empty());
    CHECK(req.conversation().empty());

    req.prompt = "";
    CHECK(req.empty());
}

TEST_CASE("Message serializes role as lowercase string", "[types]") {
    json j = Message{Role::Assistant, "done"};
    CHECK(j["role"] == "assistant");
    CHECK(j["content"] == "done");

    auto back = json{{"role", "system"}, {"content", "rules"}}.get<Message>();
    CHECK(back.role == Role::System);
    CHECK(back.content == "rules");
}
