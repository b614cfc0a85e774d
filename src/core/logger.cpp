#include "llmgate/core/logger.hpp"

#include <mutex>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace llmgate {

namespace {

std::shared_ptr<spdlog::logger> g_logger;
std::mutex g_init_mutex;

constexpr auto kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%s:%#] %v";

} // anonymous namespace

void Logger::init(std::string_view name, std::string_view level) {
    std::lock_guard lock(g_init_mutex);
    std::string logger_name(name);
    spdlog::drop(logger_name);

    auto logger = spdlog::stderr_color_mt(logger_name);
    logger->set_pattern(kPattern);
    logger->set_level(parse_level(level).value_or(spdlog::level::info));
    g_logger = std::move(logger);
}

auto Logger::get() -> std::shared_ptr<spdlog::logger>& {
    if (!g_logger) {
        init();
    }
    return g_logger;
}

auto Logger::level_names() -> const std::vector<std::string>& {
    static const std::vector<std::string> names = {
        "trace", "debug", "info", "warn", "error", "critical", "off",
    };
    return names;
}

auto Logger::parse_level(std::string_view level) -> std::optional<spdlog::level::level_enum> {
    if (level == "trace") return spdlog::level::trace;
    if (level == "debug") return spdlog::level::debug;
    if (level == "info") return spdlog::level::info;
    if (level == "warn" || level == "warning") return spdlog::level::warn;
    if (level == "error") return spdlog::level::err;
    if (level == "critical") return spdlog::level::critical;
    if (level == "off") return spdlog::level::off;
    return std::nullopt;
}

void Logger::set_level(std::string_view level) {
    auto parsed = parse_level(level);
    if (!parsed) {
        LOG_WARN("Unknown log level '{}', keeping the current one", level);
        return;
    }
    get()->set_level(*parsed);
}

void Logger::flush() {
    if (g_logger) g_logger->flush();
}

} // namespace llmgate
