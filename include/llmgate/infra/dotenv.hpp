#pragma once

#include <filesystem>
#include <string>
#include <unordered_map>

namespace llmgate::infra {

/// Parses a .env file into key/value pairs.
/// Accepts `KEY=VALUE`, `export KEY=VALUE`, double-quoted values with
/// \n \r \t \\ \" escapes, literal single-quoted values, and `#` comments
/// (full-line, or after whitespace in an unquoted value).
auto parse_dotenv(const std::filesystem::path& path)
    -> std::unordered_map<std::string, std::string>;

/// Exports the parsed pairs into the process environment. Variables that
/// are already set win unless `overwrite` is true.
void load_dotenv(const std::filesystem::path& path, bool overwrite = false);

} // namespace llmgate::infra
