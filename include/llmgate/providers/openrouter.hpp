#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <boost/asio.hpp>

#include "llmgate/core/config.hpp"
#include "llmgate/infra/http_client.hpp"
#include "llmgate/providers/provider.hpp"

namespace llmgate::providers {

/// OpenRouter provider.
///
/// OpenAI-compatible gateway at https://openrouter.ai/api/v1. Requests carry
/// the HTTP-Referer and X-Title attribution headers OpenRouter ranks apps by.
class OpenRouterProvider final : public Provider {
public:
    /// Default model: anthropic/claude-3-haiku
    OpenRouterProvider(boost::asio::io_context& ioc, const ProviderConfig& config);
    ~OpenRouterProvider() override;

    OpenRouterProvider(const OpenRouterProvider&) = delete;
    OpenRouterProvider& operator=(const OpenRouterProvider&) = delete;

    auto generate_text(RequestSpec req) -> awaitable<Result<std::string>> override;

    [[nodiscard]] auto name() const -> std::string_view override;
    [[nodiscard]] auto default_model() const -> std::string_view override;
    [[nodiscard]] auto allowed_options() const -> const std::vector<OptionSpec>& override;

    /// Build the JSON request body for the Chat Completions API.
    [[nodiscard]] auto build_request_body(const RequestSpec& req) const -> json;

    static auto declared_options() -> std::vector<OptionSpec>;

private:
    std::string default_model_;
    std::vector<OptionSpec> options_;
    infra::HttpClient http_;
};

} // namespace llmgate::providers
