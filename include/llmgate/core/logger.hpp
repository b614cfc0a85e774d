#pragma once

#include <memory>
#include <optional>
#include <string_view>
#include <vector>

#include <spdlog/spdlog.h>

namespace llmgate {

/// Process-wide spdlog logger writing to stderr, so stdout carries only
/// generated text and JSON.
class Logger {
public:
    static void init(std::string_view name = "llmgate", std::string_view level = "info");
    static auto get() -> std::shared_ptr<spdlog::logger>&;

    /// Unknown names leave the current level untouched.
    static void set_level(std::string_view level);
    static void flush();

    /// Accepted level names, most verbose first.
    static auto level_names() -> const std::vector<std::string>&;
    static auto parse_level(std::string_view level) -> std::optional<spdlog::level::level_enum>;
};

} // namespace llmgate

#define LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::llmgate::Logger::get(), __VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::llmgate::Logger::get(), __VA_ARGS__)
#define LOG_INFO(...)  SPDLOG_LOGGER_INFO(::llmgate::Logger::get(), __VA_ARGS__)
#define LOG_WARN(...)  SPDLOG_LOGGER_WARN(::llmgate::Logger::get(), __VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::llmgate::Logger::get(), __VA_ARGS__)
#define LOG_FATAL(...) SPDLOG_LOGGER_CRITICAL(::llmgate::Logger::get(), __VA_ARGS__)
