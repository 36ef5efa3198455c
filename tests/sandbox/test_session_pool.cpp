#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <fstream>
#include <optional>
#include <stdexcept>

#include "nekrobox/sandbox/session_pool.hpp"

#include "fake_runtime.hpp"

using namespace nekrobox::sandbox;
using nekrobox::ErrorCode;
using nekrobox::Timestamp;
using nekrobox::testing::FakeRuntime;
using nekrobox::testing::TmpDir;
using nekrobox::testing::run_sync;

namespace {

// Deterministic clock the pool reads through its ClockFn.
struct ManualClock {
    Timestamp now = Timestamp{} + std::chrono::hours(24 * 365 * 50);

    auto fn() -> nekrobox::ClockFn {
        return [this] { return now; };
    }
    void advance(std::chrono::seconds by) { now += by; }
};

auto make_pool_config(const TmpDir& dir, size_t max_sessions = 100) -> nekrobox::PoolConfig {
    nekrobox::PoolConfig config;
    config.workdir = dir.str();
    config.max_sessions = max_sessions;
    config.session_idle_timeout_seconds = 60;
    return config;
}

} // namespace

TEST_CASE("SessionPool evicts the least recently used session at capacity",
          "[sandbox][pool]") {
    TmpDir dir("nekrobox_test_pool_capacity");
    FakeRuntime runtime;
    ManualClock clock;
    SessionPool pool(make_pool_config(dir, 5), runtime, clock.fn());

    for (int i = 0; i < 5; ++i) {
        REQUIRE(pool.create_session("s" + std::to_string(i)).has_value());
        clock.advance(std::chrono::seconds(1));
    }

    SECTION("oldest session goes first") {
        REQUIRE(pool.create_session("s5").has_value());
        CHECK(pool.session_keys() == std::vector<std::string>{"s1", "s2", "s3", "s4", "s5"});
        CHECK(pool.size() == 5);
    }

    SECTION("access refreshes recency") {
        REQUIRE(pool.get_session("s0").has_value());
        clock.advance(std::chrono::seconds(1));
        REQUIRE(pool.create_session("s5").has_value());
        CHECK(pool.contains("s0"));
        CHECK_FALSE(pool.contains("s1"));
    }

    SECTION("re-creating an existing key does not evict") {
        REQUIRE(pool.create_session("s2").has_value());
        CHECK(pool.size() == 5);
        CHECK(pool.contains("s0"));
    }
}

TEST_CASE("SessionPool breaks LRU ties by key", "[sandbox][pool]") {
    TmpDir dir("nekrobox_test_pool_ties");
    FakeRuntime runtime;
    ManualClock clock;
    SessionPool pool(make_pool_config(dir, 2), runtime, clock.fn());

    REQUIRE(pool.create_session("beta").has_value());
    REQUIRE(pool.create_session("alpha").has_value());
    REQUIRE(pool.create_session("gamma").has_value());

    CHECK_FALSE(pool.contains("alpha"));
    CHECK(pool.contains("beta"));
    CHECK(pool.contains("gamma"));
}

TEST_CASE("SessionPool reaps idle sessions", "[sandbox][pool]") {
    TmpDir dir("nekrobox_test_pool_idle");
    FakeRuntime runtime;
    ManualClock clock;
    SessionPool pool(make_pool_config(dir), runtime, clock.fn());

    REQUIRE(pool.create_session("old").has_value());
    clock.advance(std::chrono::seconds(120));
    REQUIRE(pool.create_session("fresh").has_value());

    SECTION("only stale sessions are removed") {
        CHECK(pool.cleanup_idle_sessions() == 1);
        CHECK_FALSE(pool.contains("old"));
        CHECK(pool.contains("fresh"));
        CHECK(pool.cleanup_idle_sessions() == 0);
    }

    SECTION("sessions with tasks in flight are never idle") {
        REQUIRE(pool.record_task("old").has_value());
        clock.advance(std::chrono::seconds(120));
        CHECK(pool.cleanup_idle_sessions() == 1);
        CHECK(pool.contains("old"));
        CHECK_FALSE(pool.contains("fresh"));

        pool.finish_task("old");
        clock.advance(std::chrono::seconds(120));
        CHECK(pool.cleanup_idle_sessions() == 1);
        CHECK(pool.size() == 0);
    }
}

TEST_CASE("SessionPool creates one workdir per session", "[sandbox][pool]") {
    TmpDir dir("nekrobox_test_pool_workdir");
    FakeRuntime runtime;
    SessionPool pool(make_pool_config(dir), runtime);

    REQUIRE(pool.create_session("nekro_chat_user").has_value());
    auto record = pool.get_session("nekro_chat_user");
    REQUIRE(record.has_value());
    CHECK(record->workdir == dir.path / "nekro_chat_user");
    CHECK(std::filesystem::is_directory(record->workdir));
    CHECK(record->handle_state == HandleState::Uninitialized);
    CHECK(record->task_count == 0);
}

TEST_CASE("SessionPool reports a workdir it cannot create", "[sandbox][pool]") {
    TmpDir dir("nekrobox_test_pool_workdir_blocked");
    FakeRuntime runtime;
    SessionPool pool(make_pool_config(dir), runtime);

    // A regular file where the session directory would go.
    { std::ofstream(dir.path / "nekro_chat_user") << "not a directory"; }

    auto r = pool.create_session("nekro_chat_user");
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error().code() == ErrorCode::SessionConstructionFailed);
    CHECK(pool.size() == 0);
    CHECK_FALSE(pool.get_session("nekro_chat_user").has_value());
    CHECK(std::filesystem::is_regular_file(dir.path / "nekro_chat_user"));
}

TEST_CASE("SessionPool never moves last_accessed backwards", "[sandbox][pool]") {
    TmpDir dir("nekrobox_test_pool_clock");
    FakeRuntime runtime;
    ManualClock clock;
    SessionPool pool(make_pool_config(dir), runtime, clock.fn());

    REQUIRE(pool.create_session("a").has_value());
    auto created = pool.get_session("a");
    REQUIRE(created.has_value());

    clock.now -= std::chrono::seconds(100);
    auto after_get = pool.get_session("a");
    REQUIRE(after_get.has_value());
    CHECK(after_get->last_accessed == created->last_accessed);

    REQUIRE(pool.create_session("a").has_value());
    CHECK(pool.get_session("a")->last_accessed == created->last_accessed);

    clock.advance(std::chrono::seconds(200));
    CHECK(pool.get_session("a")->last_accessed == created->last_accessed + std::chrono::seconds(100));
}

TEST_CASE("SessionPool rejects keys that cannot name a directory", "[sandbox][pool]") {
    TmpDir dir("nekrobox_test_pool_keys");
    FakeRuntime runtime;
    SessionPool pool(make_pool_config(dir), runtime);

    for (const auto* key : {"", ".", "..", "a/b", "a\\b"}) {
        INFO(key);
        auto r = pool.create_session(key);
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code() == ErrorCode::InvalidArgument);
    }
    CHECK(pool.size() == 0);
}

TEST_CASE("SessionPool constructs each runtime handle once", "[sandbox][pool]") {
    TmpDir dir("nekrobox_test_pool_construct");
    FakeRuntime runtime;
    runtime.construct_delay = std::chrono::milliseconds(20);
    SessionPool pool(make_pool_config(dir), runtime);
    REQUIRE(pool.create_session("s").has_value());

    boost::asio::io_context ioc;
    std::vector<std::shared_ptr<RuntimeHandle>> handles;
    for (int i = 0; i < 3; ++i) {
        boost::asio::co_spawn(ioc,
            [&]() -> boost::asio::awaitable<void> {
                auto handle = co_await pool.ensure_runtime("s");
                if (handle) handles.push_back(*handle);
            },
            boost::asio::detached);
    }
    ioc.run();

    REQUIRE(handles.size() == 3);
    CHECK(runtime.constructions == 1);
    CHECK(handles[0] == handles[1]);
    CHECK(handles[1] == handles[2]);
    CHECK(pool.get_session("s")->handle_state == HandleState::Ready);
}

TEST_CASE("SessionPool unregisters sessions whose runtime fails to construct",
          "[sandbox][pool]") {
    TmpDir dir("nekrobox_test_pool_construct_fail");
    FakeRuntime runtime;
    runtime.fail_construct = true;
    SessionPool pool(make_pool_config(dir), runtime);
    REQUIRE(pool.create_session("s").has_value());

    auto handle = run_sync(pool.ensure_runtime("s"));
    REQUIRE_FALSE(handle.has_value());
    CHECK(handle.error().code() == ErrorCode::SessionConstructionFailed);
    CHECK_FALSE(pool.contains("s"));

    SECTION("unknown sessions are not found") {
        auto missing = run_sync(pool.ensure_runtime("nope"));
        REQUIRE_FALSE(missing.has_value());
        CHECK(missing.error().code() == ErrorCode::NotFound);
    }
}

TEST_CASE("SessionPool shuts down handles it drops", "[sandbox][pool]") {
    TmpDir dir("nekrobox_test_pool_shutdown");
    FakeRuntime runtime;
    ManualClock clock;
    SessionPool pool(make_pool_config(dir, 1), runtime, clock.fn());

    REQUIRE(pool.create_session("a").has_value());
    REQUIRE(run_sync(pool.ensure_runtime("a")).has_value());

    SECTION("explicit cleanup") {
        CHECK(pool.cleanup_session("a"));
        CHECK(runtime.shutdowns == 1);
        CHECK_FALSE(pool.cleanup_session("a"));
    }

    SECTION("capacity eviction") {
        clock.advance(std::chrono::seconds(1));
        REQUIRE(pool.create_session("b").has_value());
        CHECK(runtime.shutdowns == 1);
        CHECK_FALSE(pool.contains("a"));
    }

    SECTION("shutdown_all") {
        pool.shutdown_all();
        CHECK(runtime.shutdowns == 1);
        CHECK(pool.size() == 0);
    }

    SECTION("sessions without a handle need no shutdown") {
        REQUIRE(pool.create_session("c").has_value());
        CHECK(pool.evict("c", "test"));
        CHECK(runtime.shutdowns == 1);
    }
}

TEST_CASE("SessionPool enforces the per-session task limit", "[sandbox][pool]") {
    TmpDir dir("nekrobox_test_pool_tasks");
    FakeRuntime runtime;
    auto config = make_pool_config(dir);
    config.max_tasks_per_session = 2;
    SessionPool pool(config, runtime);
    REQUIRE(pool.create_session("s").has_value());

    CHECK(pool.record_task("s").value() == 1);
    CHECK(pool.record_task("s").value() == 2);
    auto third = pool.record_task("s");
    REQUIRE_FALSE(third.has_value());
    CHECK(third.error().code() == ErrorCode::SessionError);

    auto stats = pool.get_stats();
    CHECK(stats.active_sessions == 1);
    CHECK(stats.max_sessions == 100);
    CHECK(stats.total_tasks == 2);
}

TEST_CASE("SessionPool rejects invalid configuration", "[sandbox][pool]") {
    TmpDir dir("nekrobox_test_pool_config");
    FakeRuntime runtime;
    auto config = make_pool_config(dir, 0);
    CHECK_THROWS_AS(SessionPool(config, runtime), std::invalid_argument);
}
