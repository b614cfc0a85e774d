#include <catch2/catch_test_macros.hpp>

#include <httplib.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>

#include "llmgate/infra/http_client.hpp"
#include "llmgate/orchestration/fallback.hpp"
#include "llmgate/providers/anthropic.hpp"
#include "llmgate/providers/openai.hpp"
#include "support/fake_provider.hpp"

using namespace llmgate;
using namespace llmgate::infra;
using llmgate::testing::run_sync;

namespace {

/// httplib server on 127.0.0.1 with an ephemeral port, serving the routes
/// installed by `routes` until destroyed.
class LocalServer {
public:
    explicit LocalServer(const std::function<void(httplib::Server&)>& routes) {
        routes(server_);
        port_ = server_.bind_to_any_port("127.0.0.1");
        thread_ = std::thread([this] { server_.listen_after_bind(); });
        server_.wait_until_ready();
    }

    ~LocalServer() {
        server_.stop();
        if (thread_.joinable()) thread_.join();
    }

    LocalServer(const LocalServer&) = delete;
    LocalServer& operator=(const LocalServer&) = delete;

    auto url(const std::string& prefix = "") const -> std::string {
        return "http://127.0.0.1:" + std::to_string(port_) + prefix;
    }

private:
    httplib::Server server_;
    int port_ = 0;
    std::thread thread_;
};

auto reply(int status, std::string body, const char* type = "application/json") {
    return [status, body = std::move(body), type](const httplib::Request&,
                                                  httplib::Response& res) {
        res.status = status;
        res.set_content(body, type);
    };
}

auto chat_reply(const std::string& text) -> std::string {
    json message = {{"role", "assistant"}, {"content", text}};
    json choice = {{"message", message}};
    return json{{"choices", json::array({choice})}}.dump();
}

auto openai_config(const std::string& base_url) -> ProviderConfig {
    ProviderConfig pc;
    pc.name = "openai";
    pc.api_key = "sk-local-test";
    pc.base_url = base_url;
    pc.connect_timeout_seconds = 2;
    pc.read_timeout_seconds = 5;
    return pc;
}

auto prompt(std::string text) -> RequestSpec {
    RequestSpec req;
    req.prompt = std::move(text);
    return req;
}

} // namespace

TEST_CASE("post_json sends to the base URL's path prefix", "[infra][http][local]") {
    std::string seen_type;
    std::string seen_header;
    std::string seen_body;
    LocalServer server([&](httplib::Server& s) {
        s.Post("/v1/echo", [&](const httplib::Request& req, httplib::Response& res) {
            seen_type = req.get_header_value("Content-Type");
            seen_header = req.get_header_value("X-Test");
            seen_body = req.body;
            res.set_header("X-Reply", "yes");
            res.set_content(R"({"echo":true})", "application/json");
        });
    });

    boost::asio::io_context ioc;
    HttpClient client(ioc, HttpClientConfig{
        .base_url = server.url("/v1/"),
        .connect_timeout_seconds = 2,
        .read_timeout_seconds = 5,
        .default_headers = {{"X-Test", "present"}},
    });

    auto resp = run_sync(client.post_json("/echo", R"({"hello":"world"})"));

    REQUIRE(resp.has_value());
    CHECK(resp->status == 200);
    CHECK(resp->is_success());
    CHECK(resp->body == R"({"echo":true})");
    CHECK(resp->headers.at("X-Reply") == "yes");
    CHECK(seen_type == "application/json");
    CHECK(seen_header == "present");
    CHECK(seen_body == R"({"hello":"world"})");
}

TEST_CASE("OpenAI adapter returns the completion text", "[infra][http][local]") {
    std::string auth;
    LocalServer server([&](httplib::Server& s) {
        s.Post("/v1/chat/completions", [&](const httplib::Request& req, httplib::Response& res) {
            auth = req.get_header_value("Authorization");
            auto body = json::parse(req.body);
            res.set_content(chat_reply("echo: " + body["messages"].back()["content"].get<std::string>()),
                            "application/json");
        });
    });

    boost::asio::io_context ioc;
    providers::OpenAIProvider openai(ioc, openai_config(server.url("/v1")));

    auto text = run_sync(openai.generate_text(prompt("ping")));

    REQUIRE(text.has_value());
    CHECK(*text == "echo: ping");
    CHECK(auth == "Bearer sk-local-test");
}

TEST_CASE("Anthropic adapter posts to the messages endpoint", "[infra][http][local]") {
    std::string key;
    std::string version;
    LocalServer server([&](httplib::Server& s) {
        s.Post("/v1/messages", [&](const httplib::Request& req, httplib::Response& res) {
            key = req.get_header_value("x-api-key");
            version = req.get_header_value("anthropic-version");
            res.set_content(R"({"content":[{"type":"text","text":"hello from claude"}]})",
                            "application/json");
        });
    });

    ProviderConfig pc;
    pc.name = "anthropic";
    pc.api_key = "sk-ant-local";
    pc.base_url = server.url();

    boost::asio::io_context ioc;
    providers::AnthropicProvider anthropic(ioc, pc);
    auto text = run_sync(anthropic.generate_text(prompt("hi")));

    REQUIRE(text.has_value());
    CHECK(*text == "hello from claude");
    CHECK(key == "sk-ant-local");
    CHECK(version == "2023-06-01");
}

TEST_CASE("HTTP error replies map to error codes", "[infra][http][local]") {
    LocalServer server([](httplib::Server& s) {
        s.Post("/limited/chat/completions",
               reply(429, R"({"error":{"message":"Rate limit reached"}})"));
        s.Post("/denied/chat/completions",
               reply(401, R"({"error":{"message":"Incorrect API key provided"}})"));
        s.Post("/down/chat/completions", reply(503, "upstream unavailable", "text/plain"));
    });

    boost::asio::io_context ioc;

    SECTION("429 is a transient rate limit") {
        providers::OpenAIProvider openai(ioc, openai_config(server.url("/limited")));
        auto r = run_sync(openai.generate_text(prompt("hi")));
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code() == ErrorCode::RateLimited);
        CHECK(is_transient(r.error().code()));
        CHECK(r.error().detail() == "Rate limit reached");
    }

    SECTION("401 is a permanent authorization failure") {
        providers::OpenAIProvider openai(ioc, openai_config(server.url("/denied")));
        auto r = run_sync(openai.generate_text(prompt("hi")));
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code() == ErrorCode::Unauthorized);
        CHECK_FALSE(is_transient(r.error().code()));
    }

    SECTION("503 with a plain-text body keeps the body as detail") {
        providers::OpenAIProvider openai(ioc, openai_config(server.url("/down")));
        auto r = run_sync(openai.probe(prompt("Hello")));
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code() == ErrorCode::ServiceUnavailable);
        CHECK(r.error().detail() == "upstream unavailable");
    }
}

TEST_CASE("A slow reply hits the read timeout as a transient error", "[infra][http][local]") {
    LocalServer server([](httplib::Server& s) {
        s.Post("/slow/chat/completions", [](const httplib::Request&, httplib::Response& res) {
            std::this_thread::sleep_for(std::chrono::milliseconds(2500));
            res.set_content(chat_reply("too late"), "application/json");
        });
    });

    auto pc = openai_config(server.url("/slow"));
    pc.read_timeout_seconds = 1;

    boost::asio::io_context ioc;
    providers::OpenAIProvider openai(ioc, pc);

    auto start = std::chrono::steady_clock::now();
    auto r = run_sync(openai.generate_text(prompt("hi")));
    auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE_FALSE(r.has_value());
    CHECK(is_transient(r.error().code()));
    CHECK(elapsed < std::chrono::milliseconds(2400));
}

TEST_CASE("Cancelling returns at once and the late reply is dropped",
          "[infra][http][local]") {
    std::atomic<bool> handled{false};
    LocalServer server([&](httplib::Server& s) {
        s.Post("/v1/chat/completions", [&](const httplib::Request&, httplib::Response& res) {
            std::this_thread::sleep_for(std::chrono::milliseconds(800));
            res.set_content(chat_reply("nobody is listening"), "application/json");
            handled = true;
        });
    });

    std::optional<Result<std::string>> result;
    std::chrono::steady_clock::duration elapsed{};
    {
        boost::asio::io_context ioc;
        providers::OpenAIProvider openai(ioc, openai_config(server.url("/v1")));
        boost::asio::cancellation_signal cancel;

        auto start = std::chrono::steady_clock::now();
        auto call = [&]() -> boost::asio::awaitable<Result<std::string>> {
            co_await boost::asio::this_coro::throw_if_cancelled(false);
            co_return co_await openai.generate_text(prompt("hi"));
        };
        boost::asio::co_spawn(ioc, call(),
            boost::asio::bind_cancellation_slot(cancel.slot(),
                [&](std::exception_ptr ep, Result<std::string> r) {
                    if (!ep) result = std::move(r);
                }));

        boost::asio::steady_timer trigger(ioc, std::chrono::milliseconds(50));
        trigger.async_wait([&](const boost::system::error_code&) {
            cancel.emit(boost::asio::cancellation_type::terminal);
        });

        ioc.run();
        elapsed = std::chrono::steady_clock::now() - start;
    }

    REQUIRE(result.has_value());
    REQUIRE_FALSE(result->has_value());
    CHECK(result->error().code() == ErrorCode::Cancelled);
    CHECK(elapsed < std::chrono::milliseconds(700));

    // The request thread finishes after its io_context is gone.
    while (!handled) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    SUCCEED("late completion left the destroyed io_context alone");
}

TEST_CASE("Fallback over real adapters skips a rejected key", "[infra][http][local]") {
    LocalServer server([](httplib::Server& s) {
        s.Post("/bad/v1/messages",
               reply(401, R"({"type":"error","error":{"type":"authentication_error","message":"invalid x-api-key"}})"));
        s.Post("/good/chat/completions", reply(200, chat_reply("served by openai")));
    });

    Config cfg;
    ProviderConfig anthropic;
    anthropic.name = "anthropic";
    anthropic.api_key = "sk-ant-revoked";
    anthropic.base_url = server.url("/bad");
    cfg.providers.push_back(anthropic);
    cfg.providers.push_back(openai_config(server.url("/good")));
    cfg.priority = {"anthropic", "openai"};
    cfg.retry.base_delay_ms = 1;
    cfg.retry.max_delay_ms = 2;

    boost::asio::io_context ioc;
    auto registry = std::make_shared<providers::ProviderRegistry>(ioc, cfg);
    orchestration::FallbackOrchestrator orch(registry);

    auto result = run_sync(orch.generate(prompt("hi")));

    REQUIRE(result.ok());
    CHECK(result.text.value() == "served by openai");
    CHECK(result.chosen_provider.value() == "openai");
    REQUIRE(result.attempts.size() == 2);
    CHECK(result.attempts[0].outcome == orchestration::CandidateOutcome::Unavailable);
    CHECK(result.attempts[0].error_code == ErrorCode::Unauthorized);
}
