#include "nekrobox/sandbox/task.hpp"

namespace nekrobox::sandbox {

void to_json(json& j, const TaskResult& r) {
    j = json{
        {"success", r.success},
        {"output", r.output},
        {"error", r.error ? json(*r.error) : json(nullptr)},
        {"artifacts", r.artifacts},
        {"execution_time", r.execution_time},
        {"variables", r.variables},
    };
}

void to_json(json& j, const WorkflowStep& s) {
    j = json{
        {"step", s.step},
        {"instruction", s.instruction},
        {"result", s.result},
    };
}

void to_json(json& j, const WorkflowResult& r) {
    j = json{
        {"success", r.success},
        {"steps", r.steps},
        {"final_output", r.final_output},
        {"artifacts", r.artifacts},
        {"total_time", r.total_time},
        {"error", r.error ? json(*r.error) : json(nullptr)},
    };
    if (r.error_info) {
        j["error_info"] = *r.error_info;
    }
}

} // namespace nekrobox::sandbox
