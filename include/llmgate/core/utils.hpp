#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

namespace llmgate::utils {

/// Random v4 UUID used to correlate the log lines of one request.
auto new_request_id() -> std::string;

/// UTC time as "YYYY-MM-DDTHH:MM:SSZ".
auto format_iso8601(std::chrono::system_clock::time_point tp) -> std::string;
auto now_iso8601() -> std::string;

auto trim(std::string_view s) -> std::string;
auto to_lower(std::string_view s) -> std::string;

/// Splits a delimited list, trimming each entry and dropping empty ones.
auto split_list(std::string_view s, char delim) -> std::vector<std::string>;

/// Cuts `s` to `max_len` characters, marking the cut with "...".
auto truncate(std::string_view s, std::size_t max_len) -> std::string;

} // namespace llmgate::utils
