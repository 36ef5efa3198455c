#include "nekrobox/core/config.hpp"
#include "nekrobox/core/logger.hpp"

#include <cstdlib>
#include <fstream>
#include <optional>

namespace nekrobox {

namespace {

auto env_int(const char* name) -> std::optional<int> {
    auto* val = std::getenv(name);
    if (!val) return std::nullopt;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        LOG_WARN("Ignoring non-numeric {}='{}'", name, val);
        return std::nullopt;
    }
}

} // namespace

auto load_config(const std::filesystem::path& path) -> Config {
    if (!std::filesystem::exists(path)) {
        LOG_WARN("Config file not found: {}, using defaults", path.string());
        return default_config();
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_WARN("Cannot open config file: {}, using defaults", path.string());
        return default_config();
    }

    try {
        json j = json::parse(file);
        return j.get<Config>();
    } catch (const json::exception& e) {
        LOG_ERROR("Failed to parse config: {}", e.what());
        return default_config();
    }
}

auto load_config_from_env() -> Config {
    Config config;

    if (auto* val = std::getenv("NEKROBOX_WORKDIR")) {
        config.pool.workdir = val;
    }
    if (auto val = env_int("NEKROBOX_TIMEOUT")) {
        config.executor.timeout_seconds = *val;
    }
    if (auto val = env_int("NEKROBOX_MAX_MEMORY_MB")) {
        config.executor.max_memory_mb = *val;
    }
    if (auto val = env_int("NEKROBOX_MAX_SESSIONS"); val && *val > 0) {
        config.pool.max_sessions = static_cast<size_t>(*val);
    }
    if (auto val = env_int("NEKROBOX_SESSION_TIMEOUT")) {
        config.pool.session_idle_timeout_seconds = *val;
    }
    if (auto* val = std::getenv("NEKROBOX_LOG_LEVEL")) {
        config.log_level = val;
    }

    return config;
}

auto default_config() -> Config {
    return Config{};
}

auto validate_pool_config(const PoolConfig& config) -> Result<void> {
    if (config.workdir.empty()) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
            "pool.workdir must not be empty"));
    }
    if (config.max_sessions == 0) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
            "pool.max_sessions must be at least 1"));
    }
    if (config.session_idle_timeout_seconds < 0) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
            "pool.session_idle_timeout_seconds must not be negative",
            std::to_string(config.session_idle_timeout_seconds)));
    }
    if (config.max_tasks_per_session < 0) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
            "pool.max_tasks_per_session must not be negative",
            std::to_string(config.max_tasks_per_session)));
    }
    return {};
}

auto validate_executor_config(const ExecutorConfig& config) -> Result<void> {
    if (config.timeout_seconds <= 0) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
            "executor.timeout_seconds must be positive",
            std::to_string(config.timeout_seconds)));
    }
    if (config.max_memory_mb < 0) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
            "executor.max_memory_mb must not be negative",
            std::to_string(config.max_memory_mb)));
    }
    return {};
}

auto validate_config(const Config& config) -> Result<void> {
    if (auto r = validate_pool_config(config.pool); !r) return r;
    if (auto r = validate_executor_config(config.executor); !r) return r;
    if (config.runtime.command.empty() || config.runtime.command.front().empty()) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
            "runtime.command must name an interpreter"));
    }
    if (!Logger::parse_level(config.log_level)) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
            "log_level must be one of: " + Logger::level_names(), config.log_level));
    }
    return {};
}

} // namespace nekrobox
