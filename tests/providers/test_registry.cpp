#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

#include "llmgate/providers/registry.hpp"
#include "support/fake_provider.hpp"

using namespace llmgate;
using namespace llmgate::providers;
using llmgate::testing::FakeFactory;
using llmgate::testing::fake_config;

TEST_CASE("Registry builds lazily on first use", "[providers][registry]") {
    FakeFactory fakes;
    fakes.add("a");
    fakes.add("b");
    ProviderRegistry registry(fake_config({"a", "b"}), fakes.factory());

    CHECK(registry.generation() == 0);
    CHECK(fakes.builds == 0);

    auto snap = registry.snapshot();
    CHECK(snap->generation == 1);
    CHECK(fakes.builds == 2);
    CHECK(snap->order == std::vector<std::string>{"a", "b"});

    // A second read reuses the snapshot.
    auto again = registry.snapshot();
    CHECK(again.get() == snap.get());
    CHECK(fakes.builds == 2);
}

TEST_CASE("Registry skips placeholder credentials", "[providers][registry]") {
    FakeFactory fakes;
    fakes.add("a");
    fakes.add("b");
    fakes.add("c");

    auto cfg = fake_config({"a", "b", "c"});
    cfg.providers[0].api_key = "your_anthropic_api_key_here";
    cfg.providers[2].api_key = "";

    ProviderRegistry registry(cfg, fakes.factory());
    CHECK(registry.names() == std::vector<std::string>{"b"});
    CHECK(fakes.builds == 1);

    auto missing = registry.get("a");
    REQUIRE_FALSE(missing.has_value());
    CHECK(missing.error().code() == ErrorCode::ProviderNotConfigured);
    CHECK(missing.error().detail() == "a");
}

TEST_CASE("Registry excludes providers the factory rejects", "[providers][registry]") {
    FakeFactory fakes;
    fakes.add("a");
    auto cfg = fake_config({"a", "mystery"});

    ProviderRegistry registry(cfg, fakes.factory());
    CHECK(registry.names() == std::vector<std::string>{"a"});
    CHECK_FALSE(registry.get("mystery").has_value());
}

TEST_CASE("Registry survives a throwing factory", "[providers][registry]") {
    ProviderFactory throwing = [](const ProviderConfig& pc)
        -> Result<std::shared_ptr<Provider>> {
        if (pc.name == "bad") throw std::runtime_error("boom");
        return std::shared_ptr<Provider>(std::make_shared<testing::FakeProvider>(pc.name));
    };

    ProviderRegistry registry(fake_config({"bad", "good"}), throwing);
    CHECK(registry.names() == std::vector<std::string>{"good"});
}

TEST_CASE("Registry keeps the first of duplicate entries", "[providers][registry]") {
    FakeFactory fakes;
    fakes.add("a");
    auto cfg = fake_config({"a"});
    cfg.providers.push_back(ProviderConfig{.name = "a", .api_key = "second-key"});

    ProviderRegistry registry(cfg, fakes.factory());
    auto snap = registry.snapshot();
    CHECK(snap->providers.size() == 1);
    CHECK(fakes.builds == 1);
}

TEST_CASE("Registry orders by default provider then priority", "[providers][registry]") {
    FakeFactory fakes;
    fakes.add("a");
    fakes.add("b");
    fakes.add("c");

    auto cfg = fake_config({"a", "b", "c"});
    cfg.priority = {"b"};
    cfg.default_provider = "c";

    ProviderRegistry registry(cfg, fakes.factory());
    // Unlisted "a" comes last, after the default and the priority list.
    CHECK(registry.names() == std::vector<std::string>{"c", "b", "a"});
}

TEST_CASE("Registry refresh swaps in a new generation", "[providers][registry]") {
    FakeFactory fakes;
    fakes.add("a");
    fakes.add("b");
    ProviderRegistry registry(fake_config({"a"}), fakes.factory());

    auto before = registry.snapshot();
    CHECK(before->generation == 1);

    auto gen = registry.refresh(fake_config({"b"}));
    CHECK(gen == 2);
    CHECK(registry.generation() == 2);
    CHECK(registry.names() == std::vector<std::string>{"b"});

    // Holders of the old snapshot still see it whole.
    CHECK(before->order == std::vector<std::string>{"a"});
    CHECK(before->find("a") != nullptr);
    CHECK(before->find("b") == nullptr);
}

TEST_CASE("Registry readers never see a partial refresh", "[providers][registry]") {
    FakeFactory fakes;
    fakes.add("a");
    fakes.add("b");
    fakes.add("x");
    fakes.add("y");

    const std::vector<std::string> old_set{"a", "b"};
    const std::vector<std::string> new_set{"x", "y"};
    ProviderRegistry registry(fake_config(old_set), fakes.factory());
    (void)registry.snapshot();

    std::atomic<bool> stop{false};
    std::atomic<int> torn{0};
    std::vector<std::thread> readers;
    for (int i = 0; i < 4; ++i) {
        readers.emplace_back([&] {
            while (!stop) {
                auto snap = registry.snapshot();
                bool is_old = snap->order == old_set && snap->providers.size() == 2 &&
                              snap->find("a") && snap->find("b");
                bool is_new = snap->order == new_set && snap->providers.size() == 2 &&
                              snap->find("x") && snap->find("y");
                if (!is_old && !is_new) ++torn;
            }
        });
    }

    for (int i = 0; i < 50; ++i) {
        registry.refresh(fake_config(i % 2 == 0 ? new_set : old_set));
    }
    stop = true;
    for (auto& t : readers) t.join();

    CHECK(torn == 0);
    CHECK(registry.generation() == 51);
}

TEST_CASE("Built-in factory rejects unknown names", "[providers][registry]") {
    boost::asio::io_context ioc;
    auto unknown = make_provider(ioc, ProviderConfig{.name = "gemini", .api_key = "k"});
    REQUIRE_FALSE(unknown.has_value());
    CHECK(unknown.error().code() == ErrorCode::InvalidConfig);

    for (const auto& name : known_provider_names()) {
        auto built = make_provider(ioc, ProviderConfig{.name = name, .api_key = "k"});
        REQUIRE(built.has_value());
        CHECK((*built)->name() == name);
    }
}
