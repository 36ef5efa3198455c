#include "nekrobox/sandbox/executor.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <stdexcept>

#include <boost/asio/this_coro.hpp>

#include "nekrobox/core/logger.hpp"
#include "nekrobox/core/utils.hpp"
#include "nekrobox/sandbox/artifacts.hpp"
#include "nekrobox/sandbox/watchdog.hpp"

namespace nekrobox::sandbox {

namespace net = boost::asio;
using SteadyClock = std::chrono::steady_clock;

namespace {

constexpr std::string_view kDefaultOutput = "Task completed successfully";

// Releases the pool's in-flight mark for a task on every exit path.
struct TaskLease {
    SessionPool& pool;
    std::string session_key;

    ~TaskLease() { pool.finish_task(session_key); }
};

// Keeps the executor's in-flight gauge accurate across early returns.
struct InFlight {
    std::atomic<int64_t>& gauge;

    explicit InFlight(std::atomic<int64_t>& g) : gauge(g) { ++gauge; }
    ~InFlight() { --gauge; }
};

auto join_rounds(const std::vector<std::string>& rounds) -> std::string {
    std::string output;
    for (const auto& round : rounds) {
        if (round.empty()) continue;
        if (!output.empty()) output += '\n';
        output += round;
    }
    return output;
}

void log_state(std::string_view task_id, std::string_view session_key, TaskState state) {
    LOG_DEBUG("Task {} [{}] -> {}", task_id, session_key, json(state).get<std::string>());
}

auto seconds_since(SteadyClock::time_point start) -> double {
    return std::chrono::duration<double>(SteadyClock::now() - start).count();
}

} // namespace

SandboxExecutor::SandboxExecutor(ExecutorConfig config, SessionPool& pool, Runtime& runtime)
    : config_(std::move(config)), pool_(pool), runtime_(runtime) {
    if (auto valid = validate_executor_config(config_); !valid) {
        throw std::invalid_argument(valid.error().what());
    }
    LOG_INFO("SandboxExecutor initialized (timeout={}s, max_memory_mb={}, evict_on_timeout={})",
             config_.timeout_seconds, config_.max_memory_mb, config_.evict_on_timeout);
}

auto SandboxExecutor::execute_task(const AgentContext& ctx, std::string_view instruction,
                                   const json& extra_context)
    -> awaitable<Result<TaskResult>> {
    auto exec_ctx = ContextBridge::create_context(ctx);
    const auto& key = exec_ctx.session_key;
    auto task_id = utils::generate_id(8);
    log_state(task_id, key, TaskState::Pending);

    auto record = pool_.get_session(key);
    if (!record) {
        auto created = pool_.create_session(key);
        if (!created) {
            ++failed_;
            log_state(task_id, key, TaskState::Failed);
            co_return make_fail(created.error());
        }
        record = pool_.get_session(key);
        if (!record) {
            ++failed_;
            co_return make_fail(make_error(ErrorCode::SessionError,
                "Session was evicted before the task could start", key));
        }
    }

    auto handle = co_await pool_.ensure_runtime(key);
    if (!handle) {
        ++failed_;
        log_state(task_id, key, TaskState::Failed);
        co_return make_fail(handle.error());
    }

    auto recorded = pool_.record_task(key);
    if (!recorded) {
        ++failed_;
        log_state(task_id, key, TaskState::Failed);
        co_return make_fail(recorded.error());
    }
    TaskLease lease{pool_, key};
    InFlight in_flight(in_flight_);

    auto context = merge_context(exec_ctx, extra_context);
    auto timeout = std::chrono::seconds(config_.timeout_seconds);
    auto started = SteadyClock::now();
    auto deadline = started + timeout;

    log_state(task_id, key, TaskState::Running);
    LOG_INFO("Task {} running in session {} (task #{})", task_id, key, *recorded);

    // Force-cancels the run when the deadline passes.
    auto watchdog = std::make_shared<Watchdog>(
        co_await net::this_coro::executor, runtime_, *handle);
    watchdog->arm(deadline);

    std::optional<RuntimeOutcome> outcome;
    std::optional<ErrorInfo> failure;
    try {
        outcome = co_await runtime_.run(**handle, instruction, context, deadline);
    } catch (const std::exception& e) {
        failure = ContextBridge::map_error(e);
    }
    watchdog->disarm();

    auto elapsed = seconds_since(started);

    if (watchdog->fired() || (failure && SteadyClock::now() >= deadline)) {
        ++timed_out_;
        log_state(task_id, key, TaskState::TimedOut);
        auto message = "Task execution exceeded " +
                       std::to_string(config_.timeout_seconds) + "s timeout";
        LOG_ERROR("Task {} timed out in session {} after {:.3f}s", task_id, key, elapsed);
        if (config_.evict_on_timeout) {
            pool_.evict(key, "runtime handle cancelled after timeout");
        }
        co_return make_fail(make_error(ErrorCode::ExecutionTimeout, message,
            "timeout_seconds=" + std::to_string(config_.timeout_seconds),
            ContextBridge::map_error("TimeoutError", message)));
    }

    if (failure) {
        ++failed_;
        log_state(task_id, key, TaskState::Failed);
        LOG_ERROR("Task {} failed in session {}: {}: {}", task_id, key,
                  failure->type_name, failure->message);
        auto message = failure->message;
        co_return make_fail(make_error(ErrorCode::RuntimeExecutionFailed,
            "Sandbox execution failed", std::move(message), std::move(*failure)));
    }

    auto output = join_rounds(outcome->rounds);
    if (output.empty() && outcome->success) {
        output = std::string(kDefaultOutput);
    }

    json raw = {
        {"success", outcome->success},
        {"output", std::move(output)},
        {"artifacts", collect_artifacts(record->workdir)},
        {"execution_time", elapsed},
        {"variables", sanitize_variables(outcome->variables)},
    };
    if (outcome->error) {
        raw["error"] = *outcome->error;
    }

    ++completed_;
    log_state(task_id, key, TaskState::Completed);
    LOG_INFO("Task {} completed in session {} (success={}, {:.3f}s)",
             task_id, key, outcome->success, elapsed);
    co_return ContextBridge::format_result(raw);
}

auto SandboxExecutor::execute_workflow(const AgentContext& ctx,
                                       const std::vector<std::string>& instructions)
    -> awaitable<WorkflowResult> {
    WorkflowResult workflow;
    if (instructions.empty()) {
        workflow.error = "Workflow has no instructions";
        co_return workflow;
    }

    auto extra = json::object();
    for (size_t i = 0; i < instructions.size(); ++i) {
        auto step_no = i + 1;
        auto result = co_await execute_task(ctx, instructions[i], extra);
        if (!result) {
            workflow.error = "Step " + std::to_string(step_no) + " failed: " +
                             result.error().what();
            workflow.error_info = result.error().info();
            break;
        }

        workflow.total_time += result->execution_time;
        workflow.artifacts.insert(workflow.artifacts.end(),
                                  result->artifacts.begin(), result->artifacts.end());
        bool step_ok = result->success;
        auto step_error = result->error.value_or("unknown error");
        extra = json{{"variables", result->variables}};
        workflow.steps.push_back(WorkflowStep{
            .step = step_no,
            .instruction = instructions[i],
            .result = std::move(*result),
        });

        if (!step_ok) {
            workflow.error = "Step " + std::to_string(step_no) + " failed: " + step_error;
            break;
        }
    }

    workflow.success = !workflow.error && workflow.steps.size() == instructions.size();
    if (!workflow.steps.empty()) {
        workflow.final_output = workflow.steps.back().result.output;
    }
    LOG_INFO("Workflow for session {} finished: {}/{} steps, success={}",
             ContextBridge::session_key(ctx), workflow.steps.size(),
             instructions.size(), workflow.success);
    co_return workflow;
}

auto SandboxExecutor::execute_task_json(const AgentContext& ctx, std::string_view instruction,
                                        std::string_view context_json) -> awaitable<json> {
    auto extra = json::object();
    if (!utils::trim(context_json).empty()) {
        extra = json::parse(context_json, nullptr, /*allow_exceptions=*/false);
        if (extra.is_discarded() || !extra.is_object()) {
            co_return json{
                {"success", false},
                {"error", "Invalid context JSON format"},
                {"output", ""},
            };
        }
    }

    auto result = co_await execute_task(ctx, instruction, extra);
    if (!result) {
        json doc = {
            {"success", false},
            {"error", result.error().what()},
            {"error_code", error_code_to_string(result.error().code())},
            {"output", ""},
        };
        if (result.error().info()) {
            doc["error_info"] = *result.error().info();
        }
        co_return doc;
    }
    co_return json(*result);
}

auto SandboxExecutor::execute_workflow_json(const AgentContext& ctx,
                                            std::string_view instructions_json)
    -> awaitable<json> {
    auto invalid = [](const std::string& why) {
        return json{
            {"success", false},
            {"error", "Invalid instructions format: " + why},
            {"steps", json::array()},
        };
    };

    auto parsed = json::parse(instructions_json, nullptr, /*allow_exceptions=*/false);
    if (parsed.is_discarded()) {
        co_return invalid("not valid JSON");
    }
    if (!parsed.is_array()) {
        co_return invalid("instructions must be a JSON array");
    }

    std::vector<std::string> instructions;
    for (const auto& item : parsed) {
        if (!item.is_string()) {
            co_return invalid("every instruction must be a string");
        }
        instructions.push_back(item.get<std::string>());
    }

    auto workflow = co_await execute_workflow(ctx, instructions);
    co_return json(workflow);
}

auto SandboxExecutor::cleanup_session(const AgentContext& ctx) -> bool {
    auto key = ContextBridge::session_key(ctx);
    auto removed = pool_.cleanup_session(key);
    if (removed) {
        LOG_INFO("Cleaned up sandbox session {}", key);
    }
    return removed;
}

auto SandboxExecutor::stats() const -> ExecutorStats {
    return ExecutorStats{
        .completed = completed_.load(),
        .failed = failed_.load(),
        .timed_out = timed_out_.load(),
        .in_flight = in_flight_.load(),
    };
}

auto SandboxExecutor::config() const -> const ExecutorConfig& {
    return config_;
}

} // namespace nekrobox::sandbox
