#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <boost/asio/awaitable.hpp>
#include <nlohmann/json.hpp>

#include "nekrobox/core/config.hpp"
#include "nekrobox/core/error.hpp"
#include "nekrobox/sandbox/context_bridge.hpp"
#include "nekrobox/sandbox/runtime.hpp"
#include "nekrobox/sandbox/session_pool.hpp"
#include "nekrobox/sandbox/task.hpp"

namespace nekrobox::sandbox {

using boost::asio::awaitable;

struct ExecutorStats {
    int64_t completed = 0;
    int64_t failed = 0;
    int64_t timed_out = 0;
    int64_t in_flight = 0;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(ExecutorStats, completed, failed, timed_out, in_flight)

/// Runs orchestrator instructions inside per-session sandboxes.
///
/// Infrastructure failures (session construction, deadline expiry, an
/// exception escaping the runtime) are returned as errors. A program that ran
/// and reported its own failure yields a TaskResult with success=false.
class SandboxExecutor {
public:
    SandboxExecutor(ExecutorConfig config, SessionPool& pool, Runtime& runtime);

    SandboxExecutor(const SandboxExecutor&) = delete;
    SandboxExecutor& operator=(const SandboxExecutor&) = delete;

    /// Runs one instruction in the caller's session under the configured
    /// timeout. Keys in `extra_context` override the derived context.
    ///
    /// Errors: SessionConstructionFailed / InvalidArgument when the session
    /// cannot be set up, SessionError when its task limit is reached,
    /// ExecutionTimeout when the deadline expires, RuntimeExecutionFailed
    /// (with classified ErrorInfo) when the runtime throws.
    auto execute_task(const AgentContext& ctx, std::string_view instruction,
                      const json& extra_context = json::object())
        -> awaitable<Result<TaskResult>>;

    /// Runs instructions in order against one session, passing each step's
    /// variables to the next as {"variables": ...}. Stops at the first step
    /// that fails or cannot run.
    auto execute_workflow(const AgentContext& ctx,
                          const std::vector<std::string>& instructions)
        -> awaitable<WorkflowResult>;

    /// JSON front-end for tool integrations. Never fails; malformed input and
    /// errors are reported in the returned document.
    auto execute_task_json(const AgentContext& ctx, std::string_view instruction,
                           std::string_view context_json) -> awaitable<json>;

    auto execute_workflow_json(const AgentContext& ctx, std::string_view instructions_json)
        -> awaitable<json>;

    /// Drops the caller's session and tears down its runtime handle.
    auto cleanup_session(const AgentContext& ctx) -> bool;

    [[nodiscard]] auto stats() const -> ExecutorStats;
    [[nodiscard]] auto config() const -> const ExecutorConfig&;

private:
    ExecutorConfig config_;
    SessionPool& pool_;
    Runtime& runtime_;

    std::atomic<int64_t> completed_{0};
    std::atomic<int64_t> failed_{0};
    std::atomic<int64_t> timed_out_{0};
    std::atomic<int64_t> in_flight_{0};
};

} // namespace nekrobox::sandbox
