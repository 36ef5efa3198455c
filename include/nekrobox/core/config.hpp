#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "nekrobox/core/error.hpp"
#include "nekrobox/core/types.hpp"

namespace nekrobox {

struct PoolConfig {
    std::string workdir = "./data/sandbox_workdir";
    size_t max_sessions = 100;
    int session_idle_timeout_seconds = 3600;
    int max_tasks_per_session = 50;  // 0 = unlimited
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(PoolConfig, workdir, max_sessions,
    session_idle_timeout_seconds, max_tasks_per_session)

struct ExecutorConfig {
    int timeout_seconds = 300;
    int max_memory_mb = 512;       // advisory, forwarded to the runtime
    bool evict_on_timeout = true;  // kill-and-poison; false keeps the handle
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(ExecutorConfig, timeout_seconds,
    max_memory_mb, evict_on_timeout)

struct RuntimeConfig {
    std::vector<std::string> command = {"python3", "-c"};
    std::map<std::string, std::string> env;
    bool inherit_env = false;
    size_t max_output_bytes = 1024 * 1024;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(RuntimeConfig, command, env,
    inherit_env, max_output_bytes)

struct Config {
    PoolConfig pool;
    ExecutorConfig executor;
    RuntimeConfig runtime;
    std::string log_level = "info";
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(Config, pool, executor, runtime, log_level)

auto load_config(const std::filesystem::path& path) -> Config;
auto load_config_from_env() -> Config;
auto default_config() -> Config;

/// Checks the limits the pool and executor rely on.
/// Returns InvalidConfig naming the first offending field.
auto validate_config(const Config& config) -> Result<void>;
auto validate_pool_config(const PoolConfig& config) -> Result<void>;
auto validate_executor_config(const ExecutorConfig& config) -> Result<void>;

} // namespace nekrobox
