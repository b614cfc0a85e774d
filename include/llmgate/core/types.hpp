#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace llmgate {

using json = nlohmann::json;
using Clock = std::chrono::system_clock;
using Timestamp = std::chrono::time_point<Clock>;

enum class Role {
    User,
    Assistant,
    System,
};

NLOHMANN_JSON_SERIALIZE_ENUM(Role, {
    {Role::User, "user"},
    {Role::Assistant, "assistant"},
    {Role::System, "system"},
})

/// One role-tagged entry of a chat transcript.
struct Message {
    Role role = Role::User;
    std::string content;
};

void to_json(json& j, const Message& m);
void from_json(const json& j, Message& m);

/// Opaque caller-supplied options; each adapter keeps only the keys it
/// declares in its allow-list.
using ExtraOptions = std::map<std::string, json>;

/// Generic text-generation request accepted by the orchestrator.
struct RequestSpec {
    std::optional<std::string> prompt;
    std::vector<Message> messages;
    std::optional<std::string> system_prompt;
    std::optional<double> temperature;
    std::optional<int> max_tokens;
    std::optional<std::string> provider;
    std::optional<std::string> model;
    ExtraOptions options;

    /// Messages take precedence; a bare prompt becomes a single user turn.
    [[nodiscard]] auto conversation() const -> std::vector<Message>;

    [[nodiscard]] auto empty() const -> bool {
        return messages.empty() && (!prompt || prompt->empty());
    }
};

} // namespace llmgate
