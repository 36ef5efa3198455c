#include "nekrobox/cli/commands.hpp"
#include "nekrobox/core/logger.hpp"

#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <nlohmann/json.hpp>

#include "nekrobox/sandbox/executor.hpp"
#include "nekrobox/sandbox/process_runtime.hpp"
#include "nekrobox/sandbox/session_pool.hpp"

#ifndef NEKROBOX_VERSION_STRING
#define NEKROBOX_VERSION_STRING "0.1.0-dev"
#endif

namespace nekrobox::cli {

using json = nlohmann::json;

namespace {

struct AgentOptions {
    std::string chat_key = "cli";
    std::string user_id;
    std::string platform_type = "cli";
    std::string bot_id;

    [[nodiscard]] auto context() const -> sandbox::AgentContext {
        return sandbox::AgentContext{
            .chat_key = chat_key,
            .user_id = user_id,
            .platform_type = platform_type,
            .bot_id = bot_id,
        };
    }
};

struct RunOptions {
    AgentOptions agent;
    std::string instruction;
    std::string context_json;
};

struct WorkflowOptions {
    AgentOptions agent;
    std::vector<std::string> instructions;
    std::string instructions_json;
};

void add_agent_options(CLI::App* sub, AgentOptions& agent) {
    sub->add_option("--chat-key", agent.chat_key, "Conversation the task belongs to")
        ->capture_default_str();
    sub->add_option("--user-id", agent.user_id, "Requesting user");
    sub->add_option("--platform", agent.platform_type, "Chat platform")
        ->capture_default_str();
    sub->add_option("--bot-id", agent.bot_id, "Bot identity");
}

/// The runtime, pool and executor wired together for one CLI invocation.
struct SandboxStack {
    explicit SandboxStack(const Config& config)
        : runtime(config.runtime, config.executor.max_memory_mb),
          pool(config.pool, runtime),
          executor(config.executor, pool, runtime) {}

    ~SandboxStack() { pool.shutdown_all(); }

    sandbox::ProcessRuntime runtime;
    sandbox::SessionPool pool;
    sandbox::SandboxExecutor executor;
};

auto make_stack(const Config& config) -> std::unique_ptr<SandboxStack> {
    if (auto valid = validate_config(config); !valid) {
        LOG_ERROR("Invalid configuration: {}", valid.error().what());
        throw CLI::RuntimeError(1);
    }
    try {
        return std::make_unique<SandboxStack>(config);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to initialise sandbox: {}", e.what());
        throw CLI::RuntimeError(1);
    }
}

/// Runs one coroutine to completion. SIGINT/SIGTERM stop the loop; the
/// stack's destructor then tears down any sandbox still running.
template <typename Make>
auto drive(Make&& make) -> json {
    boost::asio::io_context ioc;
    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&ioc](auto ec, int /*sig*/) {
        if (!ec) {
            LOG_WARN("Received shutdown signal");
            ioc.stop();
        }
    });

    json result;
    std::exception_ptr failure;
    bool finished = false;
    boost::asio::co_spawn(ioc, make(),
        [&](std::exception_ptr ep, json doc) {
            failure = ep;
            result = std::move(doc);
            finished = true;
            signals.cancel();
        });
    ioc.run();

    if (failure) std::rethrow_exception(failure);
    if (!finished) throw CLI::RuntimeError(130);
    return result;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// run command
// ---------------------------------------------------------------------------

void register_run_command(CLI::App& app, Config& config) {
    auto* sub = app.add_subcommand("run", "Execute one instruction in a sandbox session");
    auto opts = std::make_shared<RunOptions>();

    sub->add_option("instruction", opts->instruction, "Program text to execute")
        ->required();
    sub->add_option("--context", opts->context_json,
                    "Extra context as a JSON object (overrides derived keys)");
    add_agent_options(sub, opts->agent);

    sub->callback([&config, opts]() {
        auto extra = json::object();
        if (!opts->context_json.empty()) {
            extra = json::parse(opts->context_json, nullptr, /*allow_exceptions=*/false);
            if (extra.is_discarded() || !extra.is_object()) {
                throw CLI::ValidationError("--context", "must be a JSON object");
            }
        }

        auto stack = make_stack(config);
        auto ctx = opts->agent.context();
        bool infrastructure_failure = false;

        auto doc = drive([&]() -> boost::asio::awaitable<json> {
            auto result = co_await stack->executor.execute_task(ctx, opts->instruction, extra);
            if (!result) {
                infrastructure_failure = true;
                json failure = {
                    {"success", false},
                    {"error", result.error().what()},
                    {"error_code", error_code_to_string(result.error().code())},
                };
                if (result.error().info()) {
                    failure["error_info"] = *result.error().info();
                }
                co_return failure;
            }
            co_return json(*result);
        });

        std::cout << doc.dump(2) << "\n";
        if (infrastructure_failure) {
            throw CLI::RuntimeError(1);
        }
    });
}

// ---------------------------------------------------------------------------
// workflow command
// ---------------------------------------------------------------------------

void register_workflow_command(CLI::App& app, Config& config) {
    auto* sub = app.add_subcommand("workflow",
        "Execute instructions in sequence in one session, passing variables along");
    auto opts = std::make_shared<WorkflowOptions>();

    auto* positional = sub->add_option("instructions", opts->instructions,
                                       "Program text for each step, in order");
    auto* from_json = sub->add_option("--json", opts->instructions_json,
                                      "Steps as a JSON array of strings");
    positional->excludes(from_json);
    add_agent_options(sub, opts->agent);

    sub->callback([&config, opts]() {
        if (opts->instructions.empty() && opts->instructions_json.empty()) {
            throw CLI::ValidationError("instructions", "give at least one step or --json");
        }

        auto stack = make_stack(config);
        auto ctx = opts->agent.context();

        auto doc = drive([&]() -> boost::asio::awaitable<json> {
            if (!opts->instructions_json.empty()) {
                co_return co_await stack->executor.execute_workflow_json(
                    ctx, opts->instructions_json);
            }
            auto workflow = co_await stack->executor.execute_workflow(ctx, opts->instructions);
            co_return json(workflow);
        });

        std::cout << doc.dump(2) << "\n";
        if (!doc.value("success", false)) {
            throw CLI::RuntimeError(1);
        }
    });
}

// ---------------------------------------------------------------------------
// config command
// ---------------------------------------------------------------------------

void register_config_command(CLI::App& app, Config& config) {
    auto* sub = app.add_subcommand("config", "Show or validate configuration");

    auto validate_only = std::make_shared<bool>(false);
    sub->add_flag("--validate", *validate_only,
                  "Validate configuration without printing");

    sub->callback([&config, validate_only]() {
        if (*validate_only) {
            if (auto valid = validate_config(config); !valid) {
                std::cerr << "Configuration is invalid: " << valid.error().what() << "\n";
                throw CLI::RuntimeError(1);
            }
            std::cout << "Configuration is valid.\n";
            return;
        }

        json j = config;
        std::cout << j.dump(2) << "\n";
    });
}

// ---------------------------------------------------------------------------
// version command
// ---------------------------------------------------------------------------

void register_version_command(CLI::App& app) {
    auto* sub = app.add_subcommand("version", "Print version information");

    sub->callback([]() {
        std::cout << "nekrobox " << NEKROBOX_VERSION_STRING << "\n";
        std::cout << "C++ standard: " << __cplusplus << "\n";
#if defined(__clang__)
        std::cout << "Compiler: clang " << __clang_major__ << "."
                  << __clang_minor__ << "." << __clang_patchlevel__ << "\n";
#elif defined(__GNUC__)
        std::cout << "Compiler: gcc " << __GNUC__ << "."
                  << __GNUC_MINOR__ << "." << __GNUC_PATCHLEVEL__ << "\n";
#else
        std::cout << "Compiler: unknown\n";
#endif
    });
}

} // namespace nekrobox::cli
