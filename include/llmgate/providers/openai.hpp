#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <boost/asio.hpp>

#include "llmgate/core/config.hpp"
#include "llmgate/infra/http_client.hpp"
#include "llmgate/providers/provider.hpp"

namespace llmgate::providers {

/// OpenAI GPT provider.
///
/// Communicates with the OpenAI Chat Completions API at
/// https://api.openai.com/v1/chat/completions
///
/// Also usable against OpenAI-compatible servers through `base_url`.
class OpenAIProvider final : public Provider {
public:
    /// Optional config fields:
    ///   - base_url (default: "https://api.openai.com/v1")
    ///   - model (default: "gpt-4")
    OpenAIProvider(boost::asio::io_context& ioc, const ProviderConfig& config);
    ~OpenAIProvider() override;

    OpenAIProvider(const OpenAIProvider&) = delete;
    OpenAIProvider& operator=(const OpenAIProvider&) = delete;

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
