#include "llmgate/core/utils.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <random>

#include <uuid.h>

namespace llmgate::utils {

namespace {

constexpr std::string_view kWhitespace = " \t\n\r";

} // anonymous namespace

auto new_request_id() -> std::string {
    static thread_local std::mt19937 engine(std::random_device{}());
    uuids::uuid_random_generator gen(engine);
    return uuids::to_string(gen());
}

auto format_iso8601(std::chrono::system_clock::time_point tp) -> std::string {
    auto t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    auto n = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return std::string(buf, n);
}

auto now_iso8601() -> std::string {
    return format_iso8601(std::chrono::system_clock::now());
}

auto trim(std::string_view s) -> std::string {
    auto first = s.find_first_not_of(kWhitespace);
    if (first == std::string_view::npos) return {};
    auto last = s.find_last_not_of(kWhitespace);
    return std::string(s.substr(first, last - first + 1));
}

auto to_lower(std::string_view s) -> std::string {
    std::string out(s);
    std::ranges::transform(out, out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

auto split_list(std::string_view s, char delim) -> std::vector<std::string> {
    std::vector<std::string> items;
    while (!s.empty()) {
        auto cut = s.find(delim);
        auto item = trim(s.substr(0, cut));
        if (!item.empty()) items.push_back(std::move(item));
        if (cut == std::string_view::npos) break;
        s.remove_prefix(cut + 1);
    }
    return items;
}

auto truncate(std::string_view s, std::size_t max_len) -> std::string {
    if (s.size() <= max_len) return std::string(s);
    std::string out(s.substr(0, max_len));
    out += "...";
    return out;
}

} // namespace llmgate::utils
