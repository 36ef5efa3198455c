#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace nekrobox {

/// Process-wide diagnostic logger. Everything is written to stderr because
/// stdout carries command results as JSON.
class Logger {
public:
    static void init(std::string_view name = "nekrobox", std::string_view level = "info");
    static auto get() -> std::shared_ptr<spdlog::logger>&;

    /// Accepts trace, debug, info, warn, error, critical and off.
    static auto parse_level(std::string_view level) -> std::optional<spdlog::level::level_enum>;
    static auto level_names() -> std::string;

    /// Returns false and keeps the current level when the name is unknown.
    static auto set_level(std::string_view level) -> bool;
    static void flush();
};

} // namespace nekrobox

#define LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::nekrobox::Logger::get(), __VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::nekrobox::Logger::get(), __VA_ARGS__)
#define LOG_INFO(...)  SPDLOG_LOGGER_INFO(::nekrobox::Logger::get(), __VA_ARGS__)
#define LOG_WARN(...)  SPDLOG_LOGGER_WARN(::nekrobox::Logger::get(), __VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::nekrobox::Logger::get(), __VA_ARGS__)
#define LOG_FATAL(...) SPDLOG_LOGGER_CRITICAL(::nekrobox::Logger::get(), __VA_ARGS__)
