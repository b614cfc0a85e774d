#include "llmgate/infra/dotenv.hpp"
#include "llmgate/core/logger.hpp"
#include "llmgate/core/utils.hpp"

#include <cstdlib>
#include <fstream>
#include <string_view>

namespace llmgate::infra {

namespace {

auto unescape_char(char c) -> std::string {
    switch (c) {
        case 'n': return "\n";
        case 'r': return "\r";
        case 't': return "\t";
        case '\\': return "\\";
        case '"': return "\"";
        default: return std::string{'\\', c};
    }
}

/// `raw` starts just after the opening quote. An unterminated quote keeps
/// everything up to the end of the line.
auto read_quoted(std::string_view raw, char quote) -> std::string {
    std::string value;
    for (size_t i = 0; i < raw.size(); ++i) {
        char c = raw[i];
        if (c == quote) break;
        if (quote == '"' && c == '\\' && i + 1 < raw.size()) {
            value += unescape_char(raw[++i]);
        } else {
            value += c;
        }
    }
    return value;
}

auto read_unquoted(std::string_view raw) -> std::string {
    for (size_t i = 1; i < raw.size(); ++i) {
        if (raw[i] == '#' && (raw[i - 1] == ' ' || raw[i - 1] == '\t')) {
            raw = raw.substr(0, i);
            break;
        }
    }
    return utils::trim(raw);
}

} // anonymous namespace

auto parse_dotenv(const std::filesystem::path& path)
    -> std::unordered_map<std::string, std::string> {
    std::unordered_map<std::string, std::string> vars;

    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_WARN("Could not open .env file: {}", path.string());
        return vars;
    }

    std::string raw_line;
    int line_number = 0;
    while (std::getline(file, raw_line)) {
        ++line_number;
        auto line = utils::trim(raw_line);
        if (line.empty() || line.front() == '#') continue;

        std::string_view view(line);
        if (view.starts_with("export ")) {
            view.remove_prefix(7);
        }

        auto eq = view.find('=');
        if (eq == std::string_view::npos) {
            LOG_WARN("{}:{}: skipping line without '='", path.string(), line_number);
            continue;
        }

        auto key = utils::trim(view.substr(0, eq));
        if (key.empty()) {
            LOG_WARN("{}:{}: skipping line with empty key", path.string(), line_number);
            continue;
        }

        auto value_view = std::string_view(view).substr(eq + 1);
        auto value_trimmed = utils::trim(value_view);
        std::string value;
        if (!value_trimmed.empty() &&
            (value_trimmed.front() == '"' || value_trimmed.front() == '\'')) {
            value = read_quoted(std::string_view(value_trimmed).substr(1),
                                value_trimmed.front());
        } else {
            value = read_unquoted(value_trimmed);
        }

        vars[std::move(key)] = std::move(value);
    }

    LOG_DEBUG("Parsed {} variables from {}", vars.size(), path.string());
    return vars;
}

void load_dotenv(const std::filesystem::path& path, bool overwrite) {
    for (const auto& [key, value] : parse_dotenv(path)) {
        if (!overwrite && std::getenv(key.c_str()) != nullptr) {
            LOG_TRACE("Keeping existing env var {}", key);
            continue;
        }
        if (::setenv(key.c_str(), value.c_str(), 1) != 0) {
            LOG_WARN("Failed to set env var {}", key);
        }
    }
}

} // namespace llmgate::infra
