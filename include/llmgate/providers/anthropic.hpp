#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <boost/asio.hpp>

#include "llmgate/core/config.hpp"
#include "llmgate/infra/http_client.hpp"
#include "llmgate/providers/provider.hpp"

namespace llmgate::providers {

/// Anthropic Claude provider.
///
/// Communicates with the Anthropic Messages API at
/// https://api.anthropic.com/v1/messages
///
/// The Messages API has no system role inside `messages`, so leading
/// system messages are folded into the top-level `system` field.
class AnthropicProvider final : public Provider {
public:
    /// Construct with an io_context reference and provider configuration.
    /// The config must contain at least `api_key`. Optional fields:
    ///   - base_url (default: "https://api.anthropic.com")
    ///   - model (default: "claude-3-5-sonnet-20241022")
    AnthropicProvider(boost::asio::io_context& ioc, const ProviderConfig& config);
    ~AnthropicProvider() override;

    AnthropicProvider(const AnthropicProvider&) = delete;
    AnthropicProvider& operator=(const AnthropicProvider&) = delete;

    auto generate_text(RequestSpec req) -> awaitable<Result<std::string>> override;

    [[nodiscard]] auto name() const -> std::string_view override;
    [[nodiscard]] auto default_model() const -> std::string_view override;
    [[nodiscard]] auto allowed_options() const -> const std::vector<OptionSpec>& override;

    /// Build the JSON request body for the Messages API.
    [[nodiscard]] auto build_request_body(const RequestSpec& req) const -> json;

    /// Concatenates the text blocks of a Messages API response.
    static auto parse_response(const std::string& body) -> Result<std::string>;

    /// Options the Messages API accepts beyond the common fields.
    static auto declared_options() -> std::vector<OptionSpec>;

private:
    std::string default_model_;
    std::vector<OptionSpec> options_;
    infra::HttpClient http_;
};

} // namespace llmgate::providers
