#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "nekrobox/core/error.hpp"
#include "nekrobox/core/types.hpp"

namespace nekrobox::sandbox {

using json = nlohmann::json;

/// Identity of the conversation a task runs on behalf of.
struct AgentContext {
    std::string chat_key;
    std::string user_id;
    std::string platform_type;
    std::string bot_id;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(AgentContext, chat_key, user_id,
    platform_type, bot_id)

/// Derived per call from an AgentContext; never persisted.
struct ExecutionContext {
    std::string session_key;
    std::string workdir;
    std::string chat_key;
    std::string user_id;
    std::string platform_type;
    std::string bot_id;
    std::string created_by;
    std::string orchestrator;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(ExecutionContext, session_key, workdir, chat_key,
    user_id, platform_type, bot_id, created_by, orchestrator)

enum class TaskState {
    Pending,
    Running,
    Completed,
    Failed,
    TimedOut,
};

NLOHMANN_JSON_SERIALIZE_ENUM(TaskState, {
    {TaskState::Pending, "pending"},
    {TaskState::Running, "running"},
    {TaskState::Completed, "completed"},
    {TaskState::Failed, "failed"},
    {TaskState::TimedOut, "timed_out"},
})

struct TaskResult {
    bool success = false;
    std::string output;
    std::optional<std::string> error;
    std::vector<std::string> artifacts;
    double execution_time = 0.0;  // seconds
    json variables = json::object();
};

void to_json(json& j, const TaskResult& r);

struct WorkflowStep {
    size_t step = 0;  // 1-based
    std::string instruction;
    TaskResult result;
};

void to_json(json& j, const WorkflowStep& s);

struct WorkflowResult {
    bool success = false;
    std::vector<WorkflowStep> steps;
    std::string final_output;
    std::vector<std::string> artifacts;
    double total_time = 0.0;
    std::optional<std::string> error;
    std::optional<ErrorInfo> error_info;  // set when a step failed to run at all
};

void to_json(json& j, const WorkflowResult& r);

} // namespace nekrobox::sandbox

namespace nekrobox {

NLOHMANN_JSON_SERIALIZE_ENUM(ErrorKind, {
    {ErrorKind::Unknown, "unknown"},
    {ErrorKind::Syntax, "syntax"},
    {ErrorKind::Timeout, "timeout"},
    {ErrorKind::Memory, "memory"},
    {ErrorKind::MissingDependency, "missing_dependency"},
    {ErrorKind::InvalidInput, "invalid_input"},
})

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(ErrorInfo, kind, type_name, message, recovery_suggestion)

} // namespace nekrobox
