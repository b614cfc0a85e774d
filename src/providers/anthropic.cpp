#include "llmgate/providers/anthropic.hpp"

#include <string>

#include "llmgate/core/logger.hpp"

namespace llmgate::providers {

namespace {

constexpr auto kName = "anthropic";
constexpr auto kDefaultBaseUrl = "https://api.anthropic.com";
constexpr auto kDefaultModel = "claude-3-5-sonnet-20241022";
constexpr auto kApiVersion = "2023-06-01";
constexpr auto kMessagesPath = "/v1/messages";
constexpr int kDefaultMaxTokens = 2048;

/// Convert a unified Role to the Anthropic role string. System messages
/// that survive folding are sent as user turns.
auto role_to_string(Role role) -> std::string {
    switch (role) {
        case Role::Assistant: return "assistant";
        case Role::User:
        case Role::System:
        default: return "user";
    }
}

} // anonymous namespace

AnthropicProvider::AnthropicProvider(boost::asio::io_context& ioc,
                                     const ProviderConfig& config)
    : default_model_(config.model.value_or(kDefaultModel))
    , options_(restrict_options(declared_options(), config.allowed_options))
    , http_(ioc, infra::HttpClientConfig{
          .base_url = config.base_url.value_or(kDefaultBaseUrl),
          .connect_timeout_seconds = config.connect_timeout_seconds,
          .read_timeout_seconds = config.read_timeout_seconds,
          .verify_ssl = true,
          .default_headers = {
              {"x-api-key", config.api_key},
              {"anthropic-version", kApiVersion},
          },
      })
{
    LOG_INFO("Anthropic provider initialized (model: {}, base: {})",
             default_model_, http_.base_url());
}

AnthropicProvider::~AnthropicProvider() = default;

auto AnthropicProvider::declared_options() -> std::vector<OptionSpec> {
    return {
        {"stop_sequences", OptionType::StringList, "stop_sequences"},
        {"top_p", OptionType::Number, "top_p"},
        {"top_k", OptionType::Integer, "top_k"},
    };
}

auto AnthropicProvider::build_request_body(const RequestSpec& req) const -> json {
    json body;

    body["model"] = req.model.value_or(default_model_);

    auto conversation = req.conversation();

    // Leading system messages join the explicit system prompt; the rest of
    // the transcript keeps its order.
    std::string system;
    if (req.system_prompt && !req.system_prompt->empty()) {
        system = *req.system_prompt;
    }
    auto first = conversation.begin();
    for (; first != conversation.end() && first->role == Role::System; ++first) {
        if (first->content.empty()) continue;
        if (!system.empty()) system += "\n\n";
        system += first->content;
    }
    if (!system.empty()) {
        body["system"] = system;
    }

    json messages = json::array();
    for (auto it = first; it != conversation.end(); ++it) {
        messages.push_back({
            {"role", role_to_string(it->role)},
            {"content", it->content},
        });
    }
    body["messages"] = messages;

    body["max_tokens"] = req.max_tokens.value_or(kDefaultMaxTokens);

    if (req.temperature.has_value()) {
        body["temperature"] = *req.temperature;
    }

    body.update(filter_options(req.options, options_, kName));

    return body;
}

auto AnthropicProvider::parse_response(const std::string& body) -> Result<std::string> {
    json j;
    try {
        j = json::parse(body);
    } catch (const json::parse_error& e) {
        return std::unexpected(make_error(
            ErrorCode::SerializationError,
            "Failed to parse Anthropic response",
            e.what()));
    }

    if (j.contains("error")) {
        const auto& err = j["error"];
        auto err_msg = err.is_object() ? err.value("message", "Unknown error") : err.dump();
        return std::unexpected(make_error(
            ErrorCode::ProviderError, "Anthropic API error", err_msg));
    }

    if (!j.contains("content") || !j["content"].is_array()) {
        return std::unexpected(make_error(
            ErrorCode::SerializationError,
            "Anthropic response has no content"));
    }

    std::string text;
    for (const auto& block : j["content"]) {
        if (block.value("type", "") == "text") {
            text += block.value("text", "");
        }
    }
    return text;
}

auto AnthropicProvider::generate_text(RequestSpec req) -> awaitable<Result<std::string>> {
    auto body = build_request_body(req);

    LOG_DEBUG("Anthropic request: model={}", body.value("model", ""));

    auto result = co_await http_.post_json(kMessagesPath, body.dump());
    if (!result.has_value()) {
        co_return make_fail(transport_failure(kName, result.error()));
    }

    const auto& http_resp = result.value();
    if (!http_resp.is_success()) {
        co_return make_fail(error_from_response(kName, http_resp));
    }

    auto text = parse_response(http_resp.body);
    if (!text) {
        co_return make_fail(std::move(text.error()));
    }
    co_return std::move(*text);
}

auto AnthropicProvider::name() const -> std::string_view {
    return kName;
}

auto AnthropicProvider::default_model() const -> std::string_view {
    return default_model_;
}

auto AnthropicProvider::allowed_options() const -> const std::vector<OptionSpec>& {
    return options_;
}

} // namespace llmgate::providers
