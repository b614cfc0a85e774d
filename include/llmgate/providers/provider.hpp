#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <boost/asio.hpp>
#include <nlohmann/json.hpp>

#include "llmgate/core/error.hpp"
#include "llmgate/core/types.hpp"
#include "llmgate/infra/http_client.hpp"
#include "llmgate/providers/options.hpp"

namespace llmgate::providers {

using boost::asio::awaitable;

/// Abstract base class for text-generation backends.
///
/// Each implementation translates the generic RequestSpec into one
/// service's wire format and parses its reply. Failures carry the precise
/// ErrorCode so the retry layer can tell transient causes (rate limiting,
/// 5xx, timeouts) from permanent ones (credentials, bad request, unknown
/// model). Instances are immutable after construction and may serve many
/// requests concurrently.
class Provider {
public:
    virtual ~Provider() = default;

    /// Generate text for the request. Extra options outside the adapter's
    /// allow-list are dropped before the payload is built.
    virtual auto generate_text(RequestSpec req) -> awaitable<Result<std::string>> = 0;

    /// Single minimal request used for liveness checks. The default sends
    /// `probe_request` through generate_text() and discards the text.
    virtual auto probe(RequestSpec probe_request) -> awaitable<VoidResult>;

    /// Return the provider name (e.g. "anthropic", "openai").
    [[nodiscard]] virtual auto name() const -> std::string_view = 0;

    /// Model used when the request does not name one.
    [[nodiscard]] virtual auto default_model() const -> std::string_view = 0;

    /// Extra options this adapter forwards.
    [[nodiscard]] virtual auto allowed_options() const -> const std::vector<OptionSpec>& = 0;
};

/// Builds the error an adapter reports for a non-2xx reply. The upstream
/// message is taken from `{"error": {"message": ...}}` when present.
auto error_from_response(std::string_view provider, const infra::HttpResponse& resp) -> Error;

/// Re-labels a transport failure while keeping its code, so timeouts stay
/// retriable and cancellation stays recognisable.
auto transport_failure(std::string_view provider, const Error& cause) -> Error;

} // namespace llmgate::providers
