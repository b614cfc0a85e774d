#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "llmgate/core/error.hpp"
#include "llmgate/core/types.hpp"
#include "llmgate/providers/options.hpp"

namespace llmgate::providers::chat {

/// Builds an OpenAI-style Chat Completions body. The explicit system prompt
/// becomes a leading system message; the conversation follows unchanged.
auto build_request_body(const RequestSpec& req,
                        std::string_view default_model,
                        const std::vector<OptionSpec>& allow_list,
                        std::string_view provider) -> nlohmann::json;

/// Extracts `choices[0].message.content`. With `reasoning_fallback`, an
/// empty content falls back to `reasoning_content`.
auto parse_response(const std::string& body,
                    std::string_view provider,
                    bool reasoning_fallback = false) -> Result<std::string>;

} // namespace llmgate::providers::chat
