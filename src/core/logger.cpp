#include "nekrobox/core/logger.hpp"

#include <array>
#include <utility>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace nekrobox {

namespace {
    std::shared_ptr<spdlog::logger> g_logger;

    constexpr std::array<std::pair<std::string_view, spdlog::level::level_enum>, 7> kLevels{{
        {"trace", spdlog::level::trace},
        {"debug", spdlog::level::debug},
        {"info", spdlog::level::info},
        {"warn", spdlog::level::warn},
        {"error", spdlog::level::err},
        {"critical", spdlog::level::critical},
        {"off", spdlog::level::off},
    }};
}

void Logger::init(std::string_view name, std::string_view level) {
    // Re-initialising with the same name must not trip spdlog's registry.
    spdlog::drop(std::string(name));
    g_logger = spdlog::stderr_color_mt(std::string(name));
    g_logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%s:%#] %v");
    g_logger->set_level(spdlog::level::info);
    if (!set_level(level)) {
        g_logger->warn("Unknown log level '{}', using info", level);
    }
}

auto Logger::get() -> std::shared_ptr<spdlog::logger>& {
    if (!g_logger) {
        init();
    }
    return g_logger;
}

auto Logger::parse_level(std::string_view level) -> std::optional<spdlog::level::level_enum> {
    for (const auto& [name, value] : kLevels) {
        if (name == level) return value;
    }
    return std::nullopt;
}

auto Logger::level_names() -> std::string {
    std::string out;
    for (const auto& [name, value] : kLevels) {
        if (!out.empty()) out += ", ";
        out += name;
    }
    return out;
}

auto Logger::set_level(std::string_view level) -> bool {
    auto parsed = parse_level(level);
    if (!parsed) return false;
    get()->set_level(*parsed);
    return true;
}

void Logger::flush() {
    if (g_logger) g_logger->flush();
}

} // namespace nekrobox
