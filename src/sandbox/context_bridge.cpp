#include "nekrobox/sandbox/context_bridge.hpp"

#include <new>
#include <stdexcept>
#include <typeinfo>

#include <boost/asio/error.hpp>
#include <boost/core/demangle.hpp>
#include <boost/system/system_error.hpp>

#include "nekrobox/sandbox/runtime.hpp"

namespace nekrobox::sandbox {

namespace {

// Reads one field of a partial result, falling back to the default when the
// field is missing or holds the wrong JSON type.
template <typename T>
auto field_or(const json& raw, const char* key, T fallback) -> T {
    auto it = raw.find(key);
    if (it == raw.end() || it->is_null()) return fallback;
    try {
        return it->get<T>();
    } catch (const json::exception&) {
        return fallback;
    }
}

auto is_json_safe(const json& value) -> bool {
    switch (value.type()) {
        case json::value_t::boolean:
        case json::value_t::number_integer:
        case json::value_t::number_unsigned:
        case json::value_t::number_float:
        case json::value_t::string:
        case json::value_t::array:
        case json::value_t::object:
            return true;
        default:
            return false;
    }
}

} // namespace

auto ContextBridge::session_key(const AgentContext& ctx) -> std::string {
    return std::string(kSessionPrefix) + ctx.chat_key + "_" + ctx.user_id;
}

auto ContextBridge::create_context(const AgentContext& ctx) -> ExecutionContext {
    return ExecutionContext{
        .session_key = session_key(ctx),
        .workdir = std::string(kWorkdirPrefix) + ctx.chat_key,
        .chat_key = ctx.chat_key,
        .user_id = ctx.user_id,
        .platform_type = ctx.platform_type,
        .bot_id = ctx.bot_id,
        .created_by = std::string(kOrchestrator),
        .orchestrator = std::string(kOrchestrator),
    };
}

auto ContextBridge::format_result(const json& raw) -> TaskResult {
    TaskResult result;
    if (!raw.is_object()) {
        return result;
    }

    result.success = field_or(raw, "success", false);
    result.output = field_or(raw, "output", std::string{});
    if (auto it = raw.find("error"); it != raw.end() && it->is_string()) {
        result.error = it->get<std::string>();
    }
    result.artifacts = field_or(raw, "artifacts", std::vector<std::string>{});
    result.execution_time = field_or(raw, "execution_time", 0.0);
    if (auto it = raw.find("variables"); it != raw.end() && it->is_object()) {
        result.variables = *it;
    }
    return result;
}

auto ContextBridge::classify(std::string_view type_name) -> ErrorKind {
    if (type_name == "SyntaxError" || type_name == "IndentationError" ||
        type_name == "TabError") {
        return ErrorKind::Syntax;
    }
    if (type_name == "TimeoutError") return ErrorKind::Timeout;
    if (type_name == "MemoryError") return ErrorKind::Memory;
    if (type_name == "ModuleNotFoundError" || type_name == "ImportError") {
        return ErrorKind::MissingDependency;
    }
    if (type_name == "ValueError" || type_name == "TypeError") {
        return ErrorKind::InvalidInput;
    }
    return ErrorKind::Unknown;
}

auto ContextBridge::recovery_suggestion(ErrorKind kind) -> std::string_view {
    switch (kind) {
        case ErrorKind::Syntax:
            return "Check Python syntax in the generated code";
        case ErrorKind::Timeout:
            return "Task exceeded time limit, consider breaking into smaller tasks";
        case ErrorKind::Memory:
            return "Task used too much memory, optimize data processing";
        case ErrorKind::MissingDependency:
            return "Required Python module not available in sandbox";
        case ErrorKind::InvalidInput:
            return "Invalid input data, check task parameters";
        case ErrorKind::Unknown:
            break;
    }
    return "Review task requirements and try again";
}

auto ContextBridge::map_error(std::string_view type_name, std::string_view message)
    -> ErrorInfo {
    auto kind = classify(type_name);
    return ErrorInfo{
        .kind = kind,
        .type_name = std::string(type_name),
        .message = std::string(message),
        .recovery_suggestion = std::string(recovery_suggestion(kind)),
    };
}

auto ContextBridge::map_error(const std::exception& e) -> ErrorInfo {
    if (const auto* sandbox = dynamic_cast<const SandboxError*>(&e)) {
        return map_error(sandbox->type_name(), sandbox->what());
    }

    auto info = [&](ErrorKind kind) {
        return ErrorInfo{
            .kind = kind,
            .type_name = boost::core::demangle(typeid(e).name()),
            .message = e.what(),
            .recovery_suggestion = std::string(recovery_suggestion(kind)),
        };
    };

    if (dynamic_cast<const std::bad_alloc*>(&e)) {
        return info(ErrorKind::Memory);
    }
    if (dynamic_cast<const std::invalid_argument*>(&e) ||
        dynamic_cast<const std::domain_error*>(&e) ||
        dynamic_cast<const std::out_of_range*>(&e) ||
        dynamic_cast<const json::exception*>(&e)) {
        return info(ErrorKind::InvalidInput);
    }
    if (const auto* se = dynamic_cast<const boost::system::system_error*>(&e)) {
        if (se->code() == boost::asio::error::timed_out ||
            se->code() == boost::system::errc::timed_out) {
            return info(ErrorKind::Timeout);
        }
    }
    return info(ErrorKind::Unknown);
}

auto sanitize_variables(const json& vars) -> json {
    auto result = json::object();
    if (!vars.is_object()) {
        return result;
    }
    for (const auto& [name, value] : vars.items()) {
        if (name.empty() || name.front() == '_') continue;
        if (!is_json_safe(value)) continue;
        result[name] = value;
    }
    return result;
}

auto merge_context(const ExecutionContext& ctx, const json& extra) -> json {
    json merged = ctx;
    if (extra.is_object()) {
        for (const auto& [key, value] : extra.items()) {
            merged[key] = value;
        }
    }
    return merged;
}

} // namespace nekrobox::sandbox
