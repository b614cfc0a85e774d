#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <boost/asio.hpp>

#include "llmgate/core/config.hpp"
#include "llmgate/infra/http_client.hpp"
#include "llmgate/providers/provider.hpp"

namespace llmgate::providers {

/// Z.AI (GLM) provider.
///
/// OpenAI-compatible coding endpoint at
/// https://api.z.ai/api/coding/paas/v4/chat/completions
///
/// GLM reasoning models can answer with an empty `content` and the text in
/// `reasoning_content`; that text is returned instead.
class ZaiProvider final : public Provider {
public:
    ZaiProvider(boost::asio::io_context& ioc, const ProviderConfig& config);
    ~ZaiProvider() override;

    ZaiProvider(const ZaiProvider&) = delete;
    ZaiProvider& operator=(const ZaiProvider&) = delete;

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
