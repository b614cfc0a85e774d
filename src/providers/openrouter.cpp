#include "llmgate/providers/openrouter.hpp"

#include "llmgate/core/logger.hpp"
#include "llmgate/providers/chat_completions.hpp"

namespace llmgate::providers {

namespace {

constexpr auto kName = "openrouter";
constexpr auto kDefaultBaseUrl = "https://openrouter.ai/api/v1";
constexpr auto kDefaultModel = "anthropic/claude-3-haiku";
constexpr auto kCompletionsPath = "/chat/completions";
constexpr auto kAppReferer = "https://github.com/llmgate/llmgate";
constexpr auto kAppTitle = "llmgate";

} // anonymous namespace

OpenRouterProvider::OpenRouterProvider(boost::asio::io_context& ioc,
                                       const ProviderConfig& config)
    : default_model_(config.model.value_or(kDefaultModel))
    , options_(restrict_options(declared_options(), config.allowed_options))
    , http_(ioc, infra::HttpClientConfig{
          .base_url = config.base_url.value_or(kDefaultBaseUrl),
          .connect_timeout_seconds = config.connect_timeout_seconds,
          .read_timeout_seconds = config.read_timeout_seconds,
          .verify_ssl = true,
          .default_headers = {
              {"Authorization", "Bearer " + config.api_key},
              {"HTTP-Referer", kAppReferer},
              {"X-Title", kAppTitle},
          },
      })
{
    LOG_INFO("OpenRouter provider initialized (model: {}, base: {})",
             default_model_, http_.base_url());
}

OpenRouterProvider::~OpenRouterProvider() = default;

auto OpenRouterProvider::declared_options() -> std::vector<OptionSpec> {
    return {
        {"stop", OptionType::StringOrList, "stop"},
        {"top_p", OptionType::Number, "top_p"},
        {"frequency_penalty", OptionType::Number, "frequency_penalty"},
        {"presence_penalty", OptionType::Number, "presence_penalty"},
    };
}

auto OpenRouterProvider::build_request_body(const RequestSpec& req) const -> json {
    return chat::build_request_body(req, default_model_, options_, kName);
}

auto OpenRouterProvider::generate_text(RequestSpec req) -> awaitable<Result<std::string>> {
    auto body = build_request_body(req);

    LOG_DEBUG("OpenRouter request: model={}", body.value("model", ""));

    auto result = co_await http_.post_json(kCompletionsPath, body.dump());
    if (!result.has_value()) {
        co_return make_fail(transport_failure(kName, result.error()));
    }

    const auto& http_resp = result.value();
    if (!http_resp.is_success()) {
        co_return make_fail(error_from_response(kName, http_resp));
    }

    auto text = chat::parse_response(http_resp.body, "OpenRouter");
    if (!text) {
        co_return make_fail(std::move(text.error()));
    }
    co_return std::move(*text);
}

auto OpenRouterProvider::name() const -> std::string_view {
    return kName;
}

auto OpenRouterProvider::default_model() const -> std::string_view {
    return default_model_;
}

auto OpenRouterProvider::allowed_options() const -> const std::vector<OptionSpec>& {
    return options_;
}

} // namespace llmgate::providers
