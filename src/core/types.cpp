#include "llmgate/core/types.hpp"

namespace llmgate {

void to_json(json& j, const Message& m) {
    j = json{{"role", m.role}, {"content", m.content}};
}

void from_json(const json& j, Message& m) {
    j.at("role").get_to(m.role);
    j.at("content").get_to(m.content);
}

auto RequestSpec::conversation() const -> std::vector<Message> {
    if (!messages.empty()) return messages;
    if (prompt && !prompt->empty()) {
        return {Message{.role = Role::User, .content = *prompt}};
    }
    return {};
}

} // namespace llmgate
