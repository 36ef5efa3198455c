#pragma once

#include <exception>
#include <string_view>

#include <nlohmann/json.hpp>

#include "nekrobox/core/error.hpp"
#include "nekrobox/sandbox/task.hpp"

namespace nekrobox::sandbox {

/// Stateless translation between the orchestrator's view of a conversation
/// and the sandbox layer: contexts in, normalised results and classified
/// errors out. None of these functions perform I/O or fail.
class ContextBridge {
public:
    static constexpr std::string_view kSessionPrefix = "nekro_";
    static constexpr std::string_view kWorkdirPrefix = "/tmp/aipyapp_";
    static constexpr std::string_view kOrchestrator = "nekro-agent";

    [[nodiscard]] static auto session_key(const AgentContext& ctx) -> std::string;

    [[nodiscard]] static auto create_context(const AgentContext& ctx) -> ExecutionContext;

    /// Builds a TaskResult from a partial JSON document. Missing or mistyped
    /// fields take their defaults; a non-object yields an all-default result.
    [[nodiscard]] static auto format_result(const json& raw) -> TaskResult;

    [[nodiscard]] static auto map_error(std::string_view type_name, std::string_view message)
        -> ErrorInfo;

    /// Classifies a caught exception. SandboxError is classified by the
    /// interpreter's type name, other exceptions by their C++ type.
    [[nodiscard]] static auto map_error(const std::exception& e) -> ErrorInfo;

    [[nodiscard]] static auto classify(std::string_view type_name) -> ErrorKind;

    [[nodiscard]] static auto recovery_suggestion(ErrorKind kind) -> std::string_view;
};

/// Keeps the entries of a runtime variable snapshot that are safe to hand
/// back: public names (no leading underscore) holding booleans, numbers,
/// strings, arrays or objects.
[[nodiscard]] auto sanitize_variables(const json& vars) -> json;

/// The merged context handed to the runtime: the ExecutionContext fields
/// overlaid with `extra` (explicit keys win).
[[nodiscard]] auto merge_context(const ExecutionContext& ctx, const json& extra) -> json;

} // namespace nekrobox::sandbox
