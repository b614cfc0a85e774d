#include "llmgate/providers/zai.hpp"

#include "llmgate/core/logger.hpp"
#include "llmgate/providers/chat_completions.hpp"

namespace llmgate::providers {

namespace {

constexpr auto kName = "zai";
constexpr auto kDefaultBaseUrl = "https://api.z.ai/api/coding/paas/v4";
constexpr auto kDefaultModel = "glm-4.7";
constexpr auto kCompletionsPath = "/chat/completions";

} // anonymous namespace

ZaiProvider::ZaiProvider(boost::asio::io_context& ioc, const ProviderConfig& config)
    : default_model_(config.model.value_or(kDefaultModel))
    , options_(restrict_options(declared_options(), config.allowed_options))
    , http_(ioc, infra::HttpClientConfig{
          .base_url = config.base_url.value_or(kDefaultBaseUrl),
          .connect_timeout_seconds = config.connect_timeout_seconds,
          .read_timeout_seconds = config.read_timeout_seconds,
          .verify_ssl = true,
          .default_headers = {
              {"Authorization", "Bearer " + config.api_key},
          },
      })
{
    LOG_INFO("Z.AI provider initialized (model: {}, base: {})",
             default_model_, http_.base_url());
}

ZaiProvider::~ZaiProvider() = default;

auto ZaiProvider::declared_options() -> std::vector<OptionSpec> {
    return {
        {"top_p", OptionType::Number, "top_p"},
        {"stop", OptionType::StringOrList, "stop"},
    };
}

auto ZaiProvider::build_request_body(const RequestSpec& req) const -> json {
    return chat::build_request_body(req, default_model_, options_, kName);
}

auto ZaiProvider::generate_text(RequestSpec req) -> awaitable<Result<std::string>> {
    auto body = build_request_body(req);

    LOG_DEBUG("Z.AI request: model={}", body.value("model", ""));

    auto result = co_await http_.post_json(kCompletionsPath, body.dump());
    if (!result.has_value()) {
        co_return make_fail(transport_failure(kName, result.error()));
    }

    const auto& http_resp = result.value();
    if (!http_resp.is_success()) {
        co_return make_fail(error_from_response(kName, http_resp));
    }

    auto text = chat::parse_response(http_resp.body, "Z.AI", /*reasoning_fallback=*/true);
    if (!text) {
        co_return make_fail(std::move(text.error()));
    }
    co_return std::move(*text);
}

auto ZaiProvider::name() const -> std::string_view {
    return kName;
}

auto ZaiProvider::default_model() const -> std::string_view {
    return default_model_;
}

auto ZaiProvider::allowed_options() const -> const std::vector<OptionSpec>& {
    return options_;
}

} // namespace llmgate::providers
