#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <optional>
#include <stdexcept>

#include <boost/asio/error.hpp>
#include <boost/system/system_error.hpp>

#include "nekrobox/core/utils.hpp"
#include "nekrobox/sandbox/executor.hpp"
#include "nekrobox/sandbox/process_runtime.hpp"
#include "nekrobox/sandbox/session_pool.hpp"

#include "fake_runtime.hpp"

using namespace nekrobox::sandbox;
using nekrobox::testing::TmpDir;
using nekrobox::testing::run_sync;
using json = nlohmann::json;

namespace {

auto shell_config() -> nekrobox::RuntimeConfig {
    nekrobox::RuntimeConfig config;
    config.command = {"/bin/sh", "-c"};
    return config;
}

auto in(std::chrono::milliseconds ms) -> nekrobox::Deadline {
    return std::chrono::steady_clock::now() + ms;
}

// Constructs a handle and runs one instruction against it.
auto run_once(ProcessRuntime& runtime, const TmpDir& dir, std::string instruction,
              json context = json::object(),
              std::chrono::milliseconds budget = std::chrono::seconds(10))
    -> boost::asio::awaitable<RuntimeOutcome> {
    auto handle = co_await runtime.construct(dir.path, json::object());
    if (!handle) {
        throw std::runtime_error(handle.error().what());
    }
    co_return co_await runtime.run(**handle, instruction, context, in(budget));
}

} // namespace

TEST_CASE("parse_uncaught_exception reads the last stderr line", "[sandbox][process]") {
    SECTION("plain exception line") {
        auto parsed = parse_uncaught_exception(
            "Traceback (most recent call last):\n  File \"<string>\", line 1\n"
            "ZeroDivisionError: division by zero\n");
        REQUIRE(parsed.has_value());
        CHECK(parsed->first == "ZeroDivisionError");
        CHECK(parsed->second == "division by zero");
    }

    SECTION("dotted names keep the last component") {
        auto parsed = parse_uncaught_exception("requests.exceptions.ConnectionError: refused");
        REQUIRE(parsed.has_value());
        CHECK(parsed->first == "ConnectionError");
    }

    SECTION("other output is not an exception") {
        CHECK_FALSE(parse_uncaught_exception("permission denied").has_value());
        CHECK_FALSE(parse_uncaught_exception("").has_value());
    }
}

TEST_CASE("ProcessRuntime captures output and exit status", "[sandbox][process]") {
    TmpDir dir("nekrobox_test_process_basic");
    ProcessRuntime runtime(shell_config(), 0);

    SECTION("stdout becomes a round") {
        auto outcome = run_sync(run_once(runtime, dir, "echo hello"));
        CHECK(outcome.success);
        REQUIRE(outcome.rounds.size() == 1);
        CHECK(outcome.rounds[0] == "hello\n");
    }

    SECTION("runs inside the workdir") {
        auto outcome = run_sync(run_once(runtime, dir, "pwd"));
        REQUIRE(outcome.rounds.size() == 1);
        CHECK(std::filesystem::equivalent(nekrobox::utils::trim(outcome.rounds[0]), dir.path));
    }

    SECTION("non-zero exit is a program failure") {
        auto outcome = run_sync(run_once(runtime, dir, "echo oops >&2; exit 3"));
        CHECK_FALSE(outcome.success);
        REQUIRE(outcome.error.has_value());
        CHECK(*outcome.error == "oops");
    }

    SECTION("silent non-zero exit reports the status") {
        auto outcome = run_sync(run_once(runtime, dir, "exit 3"));
        CHECK_FALSE(outcome.success);
        CHECK(outcome.error == std::optional<std::string>("exit status 3"));
    }
}

TEST_CASE("ProcessRuntime passes context and reads variables", "[sandbox][process]") {
    TmpDir dir("nekrobox_test_process_vars");
    auto config = shell_config();
    config.env["GREETING"] = "hi";
    ProcessRuntime runtime(config, 0);

    SECTION("context arrives as JSON") {
        auto context = json{{"session_key", "nekro_c_u"}, {"variables", {{"x", 1}}}};
        auto outcome = run_sync(run_once(runtime, dir, "printf '%s' \"$NEKROBOX_CONTEXT\"",
                                         context));
        REQUIRE(outcome.rounds.size() == 1);
        CHECK(json::parse(outcome.rounds[0]) == context);
    }

    SECTION("variables file is read back") {
        auto outcome = run_sync(run_once(runtime, dir,
            "printf '{\"total\": 3}' > \"$NEKROBOX_VARIABLES_FILE\""));
        CHECK(outcome.success);
        CHECK(outcome.variables == json{{"total", 3}});
    }

    SECTION("configured environment is applied") {
        auto outcome = run_sync(run_once(runtime, dir, "printf '%s' \"$GREETING\""));
        REQUIRE(outcome.rounds.size() == 1);
        CHECK(outcome.rounds[0] == "hi");
    }
}

TEST_CASE("ProcessRuntime raises uncaught interpreter exceptions", "[sandbox][process]") {
    TmpDir dir("nekrobox_test_process_raise");
    ProcessRuntime runtime(shell_config(), 0);

    try {
        run_sync(run_once(runtime, dir,
            "echo 'Traceback (most recent call last):' >&2; "
            "echo 'SyntaxError: invalid syntax' >&2; exit 1"));
        FAIL("expected SandboxError");
    } catch (const SandboxError& e) {
        CHECK(e.type_name() == "SyntaxError");
        CHECK(std::string(e.what()) == "invalid syntax");
    }
}

TEST_CASE("ProcessRuntime reports signals and exec failures", "[sandbox][process]") {
    TmpDir dir("nekrobox_test_process_signal");

    SECTION("killed by a signal") {
        ProcessRuntime runtime(shell_config(), 0);
        try {
            run_sync(run_once(runtime, dir, "kill -TERM $$"));
            FAIL("expected SandboxError");
        } catch (const SandboxError& e) {
            CHECK(e.type_name() == "ProcessSignaled");
        }
    }

    SECTION("interpreter cannot be started") {
        auto config = shell_config();
        config.command = {"/nonexistent/nekrobox-interpreter"};
        ProcessRuntime runtime(config, 0);
        try {
            run_sync(run_once(runtime, dir, "print(1)"));
            FAIL("expected runtime_error");
        } catch (const SandboxError&) {
            FAIL("exec failure must not look like a program exception");
        } catch (const std::runtime_error& e) {
            CHECK(std::string(e.what()).find("Failed to start") != std::string::npos);
        }
    }
}

TEST_CASE("ProcessRuntime stops runaway processes", "[sandbox][process]") {
    TmpDir dir("nekrobox_test_process_deadline");
    ProcessRuntime runtime(shell_config(), 0);

    SECTION("deadline") {
        auto started = std::chrono::steady_clock::now();
        try {
            run_sync(run_once(runtime, dir, "sleep 30", json::object(),
                              std::chrono::milliseconds(200)));
            FAIL("expected timeout");
        } catch (const boost::system::system_error& e) {
            CHECK(e.code() == boost::asio::error::timed_out);
        }
        CHECK(std::chrono::steady_clock::now() - started < std::chrono::seconds(5));
    }

    SECTION("cancel") {
        boost::asio::io_context ioc;
        std::shared_ptr<RuntimeHandle> handle;
        std::optional<boost::system::error_code> failure;

        boost::asio::co_spawn(ioc,
            [&]() -> boost::asio::awaitable<void> {
                auto constructed = co_await runtime.construct(dir.path, json::object());
                if (!constructed) co_return;
                handle = *constructed;
                try {
                    co_await runtime.run(*handle, "sleep 30", json::object(),
                                         in(std::chrono::seconds(30)));
                } catch (const boost::system::system_error& e) {
                    failure = e.code();
                }
            },
            boost::asio::detached);

        boost::asio::steady_timer trigger(ioc, std::chrono::milliseconds(200));
        trigger.async_wait([&](const boost::system::error_code&) {
            if (handle) runtime.cancel(*handle);
        });

        auto started = std::chrono::steady_clock::now();
        ioc.run();
        CHECK(std::chrono::steady_clock::now() - started < std::chrono::seconds(5));
        REQUIRE(failure.has_value());
        CHECK(*failure == boost::asio::error::operation_aborted);
    }

    SECTION("shut down handles refuse work") {
        auto handle = run_sync(runtime.construct(dir.path, json::object()));
        REQUIRE(handle.has_value());
        runtime.shutdown(**handle);
        CHECK_THROWS_AS(run_sync(runtime.run(**handle, "echo hi", json::object(),
                                             in(std::chrono::seconds(1)))),
                        std::runtime_error);
    }
}

TEST_CASE("ProcessRuntime does not wait for background children", "[sandbox][process]") {
    TmpDir dir("nekrobox_test_process_background");
    ProcessRuntime runtime(shell_config(), 0);

    auto started = std::chrono::steady_clock::now();
    auto outcome = run_sync(run_once(runtime, dir, "sleep 30 & echo done", json::object(),
                                     std::chrono::seconds(20)));
    CHECK(std::chrono::steady_clock::now() - started < std::chrono::seconds(5));
    CHECK(outcome.success);
    REQUIRE(outcome.rounds.size() == 1);
    CHECK(nekrobox::utils::trim(outcome.rounds[0]) == "done");
}

TEST_CASE("ProcessRuntime keeps concurrent runs on one handle apart", "[sandbox][process]") {
    TmpDir dir("nekrobox_test_process_concurrent");
    ProcessRuntime runtime(shell_config(), 0);
    auto handle = run_sync(runtime.construct(dir.path, json::object()));
    REQUIRE(handle.has_value());

    boost::asio::io_context ioc;
    std::optional<RuntimeOutcome> first, second;
    boost::asio::co_spawn(ioc,
        [&]() -> boost::asio::awaitable<void> {
            first = co_await runtime.run(**handle,
                "printf '{\"who\": 1}' > \"$NEKROBOX_VARIABLES_FILE\"; sleep 0.4",
                json::object(), in(std::chrono::seconds(10)));
        },
        boost::asio::detached);
    boost::asio::co_spawn(ioc,
        [&]() -> boost::asio::awaitable<void> {
            second = co_await runtime.run(**handle,
                "sleep 0.1; printf '{\"who\": 2}' > \"$NEKROBOX_VARIABLES_FILE\"",
                json::object(), in(std::chrono::seconds(10)));
        },
        boost::asio::detached);
    ioc.run();

    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    CHECK(first->variables == json{{"who", 1}});
    CHECK(second->variables == json{{"who", 2}});
}

TEST_CASE("SandboxExecutor times out one of two concurrent tasks in a session",
          "[sandbox][process][executor]") {
    TmpDir dir("nekrobox_test_process_session_timeout");
    ProcessRuntime runtime(shell_config(), 0);

    nekrobox::PoolConfig pool_config;
    pool_config.workdir = dir.str();
    SessionPool pool(pool_config, runtime);

    nekrobox::ExecutorConfig executor_config;
    executor_config.timeout_seconds = 1;
    SandboxExecutor executor(executor_config, pool, runtime);

    const AgentContext ctx{.chat_key = "chat1", .user_id = "alice", .platform_type = "qq"};

    boost::asio::io_context ioc;
    std::optional<nekrobox::Result<TaskResult>> slow, fast;
    std::optional<std::chrono::steady_clock::duration> slow_elapsed;
    auto started = std::chrono::steady_clock::now();

    boost::asio::co_spawn(ioc,
        [&]() -> boost::asio::awaitable<void> {
            slow.emplace(co_await executor.execute_task(ctx, "sleep 30"));
            slow_elapsed = std::chrono::steady_clock::now() - started;
        },
        boost::asio::detached);
    boost::asio::co_spawn(ioc,
        [&]() -> boost::asio::awaitable<void> {
            fast.emplace(co_await executor.execute_task(ctx, "true"));
        },
        boost::asio::detached);
    ioc.run();

    REQUIRE(slow.has_value());
    REQUIRE_FALSE(slow->has_value());
    CHECK(slow->error().code() == nekrobox::ErrorCode::ExecutionTimeout);
    REQUIRE(slow_elapsed.has_value());
    CHECK(*slow_elapsed < std::chrono::seconds(5));

    REQUIRE(fast.has_value());
    REQUIRE(fast->has_value());
    CHECK((*fast)->success);
}
