#include "llmgate/providers/chat_completions.hpp"

#include "llmgate/core/logger.hpp"

namespace llmgate::providers::chat {

using json = nlohmann::json;

namespace {

auto role_to_string(Role role) -> std::string {
    switch (role) {
        case Role::Assistant: return "assistant";
        case Role::System: return "system";
        case Role::User:
        default: return "user";
    }
}

auto content_text(const json& value) -> std::string {
    if (value.is_string()) return value.get<std::string>();
    // Some gateways return content as an array of typed parts.
    if (value.is_array()) {
        std::string text;
        for (const auto& part : value) {
            if (part.is_object() && part.value("type", "") == "text") {
                text += part.value("text", "");
            }
        }
        return text;
    }
    return {};
}

} // anonymous namespace

auto build_request_body(const RequestSpec& req,
                        std::string_view default_model,
                        const std::vector<OptionSpec>& allow_list,
                        std::string_view provider) -> json {
    json body;
    body["model"] = req.model.value_or(std::string(default_model));

    json messages = json::array();
    if (req.system_prompt && !req.system_prompt->empty()) {
        messages.push_back({{"role", "system"}, {"content", *req.system_prompt}});
    }
    for (const auto& msg : req.conversation()) {
        messages.push_back({
            {"role", role_to_string(msg.role)},
            {"content", msg.content},
        });
    }
    body["messages"] = messages;

    if (req.temperature.has_value()) {
        body["temperature"] = *req.temperature;
    }
    if (req.max_tokens.has_value()) {
        body["max_tokens"] = *req.max_tokens;
    }

    body.update(filter_options(req.options, allow_list, provider));

    return body;
}

auto parse_response(const std::string& body,
                    std::string_view provider,
                    bool reasoning_fallback) -> Result<std::string> {
    json j;
    try {
        j = json::parse(body);
    } catch (const json::parse_error& e) {
        return std::unexpected(make_error(
            ErrorCode::SerializationError,
            "Failed to parse " + std::string(provider) + " response",
            e.what()));
    }

    if (j.contains("error") && !j["error"].is_null()) {
        const auto& err = j["error"];
        auto err_msg = err.is_object() ? err.value("message", "Unknown error") : err.dump();
        return std::unexpected(make_error(
            ErrorCode::ProviderError,
            std::string(provider) + " API error", err_msg));
    }

    if (!j.contains("choices") || !j["choices"].is_array() || j["choices"].empty()) {
        return std::unexpected(make_error(
            ErrorCode::SerializationError,
            std::string(provider) + " response has no choices"));
    }

    const auto& choice = j["choices"][0];
    if (!choice.contains("message") || !choice["message"].is_object()) {
        return std::unexpected(make_error(
            ErrorCode::SerializationError,
            std::string(provider) + " response has no message"));
    }

    const auto& message = choice["message"];
    auto text = message.contains("content") ? content_text(message["content"]) : std::string{};

    if (text.empty() && reasoning_fallback && message.contains("reasoning_content")) {
        LOG_DEBUG("[{}] empty content, using reasoning_content", provider);
        text = content_text(message["reasoning_content"]);
    }

    return text;
}

} // namespace llmgate::providers::chat
