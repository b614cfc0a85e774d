#include "llmgate/providers/provider.hpp"

#include "llmgate/core/utils.hpp"

namespace llmgate::providers {

auto Provider::probe(RequestSpec probe_request) -> awaitable<VoidResult> {
    auto result = co_await generate_text(std::move(probe_request));
    if (!result) {
        co_return make_fail(std::move(result.error()));
    }
    co_return VoidResult{};
}

auto error_from_response(std::string_view provider, const infra::HttpResponse& resp) -> Error {
    auto code = infra::classify_http_status(resp.status);
    std::string label = std::string(provider) + " API error (HTTP " +
                        std::to_string(resp.status) + ")";

    try {
        auto body = json::parse(resp.body);
        if (body.contains("error")) {
            const auto& err = body["error"];
            if (err.is_object()) {
                return make_error(code, std::move(label), err.value("message", resp.body));
            }
            if (err.is_string()) {
                return make_error(code, std::move(label), err.get<std::string>());
            }
        }
    } catch (const json::parse_error&) {
        // Plain-text bodies (proxies, load balancers) are reported verbatim.
    }

    return make_error(code, std::move(label), utils::truncate(resp.body, 500));
}

auto transport_failure(std::string_view provider, const Error& cause) -> Error {
    return make_error(cause.code(),
                      std::string(provider) + " API request failed",
                      cause.what());
}

} // namespace llmgate::providers
