#include <catch2/catch_test_macros.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>

#include "nekrobox/core/config.hpp"

namespace {

// Sets an environment variable for the lifetime of the guard.
struct EnvGuard {
    std::string name;
    EnvGuard(std::string n, const char* value) : name(std::move(n)) {
        ::setenv(name.c_str(), value, 1);
    }
    ~EnvGuard() { ::unsetenv(name.c_str()); }
};

struct TmpFile {
    std::filesystem::path path;
    explicit TmpFile(const char* name)
        : path(std::filesystem::temp_directory_path() / name) {}
    ~TmpFile() {
        std::error_code ec;
        std::filesystem::remove(path, ec);
    }
    void write(const std::string& content) const {
        std::ofstream out(path);
        out << content;
    }
};

} // namespace

TEST_CASE("default_config returns sane defaults", "[config]") {
    auto cfg = nekrobox::default_config();

    SECTION("pool defaults") {
        CHECK(cfg.pool.workdir == "./data/sandbox_workdir");
        CHECK(cfg.pool.max_sessions == 100);
        CHECK(cfg.pool.session_idle_timeout_seconds == 3600);
        CHECK(cfg.pool.max_tasks_per_session == 50);
    }

    SECTION("executor defaults") {
        CHECK(cfg.executor.timeout_seconds == 300);
        CHECK(cfg.executor.max_memory_mb == 512);
        CHECK(cfg.executor.evict_on_timeout);
    }

    SECTION("runtime defaults") {
        REQUIRE(cfg.runtime.command.size() == 2);
        CHECK(cfg.runtime.command[0] == "python3");
        CHECK(cfg.runtime.command[1] == "-c");
        CHECK_FALSE(cfg.runtime.inherit_env);
        CHECK(cfg.runtime.max_output_bytes == 1024 * 1024);
    }

    SECTION("log level") {
        CHECK(cfg.log_level == "info");
    }

    SECTION("defaults validate") {
        CHECK(nekrobox::validate_config(cfg).has_value());
    }
}

TEST_CASE("load_config reads a partial JSON file", "[config]") {
    TmpFile file("nekrobox_test_config.json");
    file.write(R"({
        "log_level": "debug",
        "pool": {"max_sessions": 5},
        "executor": {"timeout_seconds": 10, "evict_on_timeout": false}
    })");

    auto cfg = nekrobox::load_config(file.path);
    CHECK(cfg.log_level == "debug");
    CHECK(cfg.pool.max_sessions == 5);
    CHECK(cfg.pool.session_idle_timeout_seconds == 3600);
    CHECK(cfg.executor.timeout_seconds == 10);
    CHECK_FALSE(cfg.executor.evict_on_timeout);
    CHECK(cfg.executor.max_memory_mb == 512);
}

TEST_CASE("load_config falls back to defaults", "[config]") {
    SECTION("missing file") {
        auto cfg = nekrobox::load_config("/nonexistent/nekrobox.json");
        CHECK(cfg.pool.max_sessions == 100);
    }

    SECTION("malformed file") {
        TmpFile file("nekrobox_test_bad_config.json");
        file.write("{ not json");
        auto cfg = nekrobox::load_config(file.path);
        CHECK(cfg.executor.timeout_seconds == 300);
    }
}

TEST_CASE("load_config_from_env applies overrides", "[config]") {
    EnvGuard workdir("NEKROBOX_WORKDIR", "/tmp/nekrobox-env");
    EnvGuard timeout("NEKROBOX_TIMEOUT", "42");
    EnvGuard sessions("NEKROBOX_MAX_SESSIONS", "7");
    EnvGuard idle("NEKROBOX_SESSION_TIMEOUT", "60");
    EnvGuard memory("NEKROBOX_MAX_MEMORY_MB", "not-a-number");

    auto cfg = nekrobox::load_config_from_env();
    CHECK(cfg.pool.workdir == "/tmp/nekrobox-env");
    CHECK(cfg.executor.timeout_seconds == 42);
    CHECK(cfg.pool.max_sessions == 7);
    CHECK(cfg.pool.session_idle_timeout_seconds == 60);
    CHECK(cfg.executor.max_memory_mb == 512);
}

TEST_CASE("validate_config rejects bad limits", "[config]") {
    auto cfg = nekrobox::default_config();

    SECTION("non-positive timeout") {
        cfg.executor.timeout_seconds = 0;
        auto r = nekrobox::validate_config(cfg);
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code() == nekrobox::ErrorCode::InvalidConfig);
    }

    SECTION("zero capacity") {
        cfg.pool.max_sessions = 0;
        CHECK_FALSE(nekrobox::validate_config(cfg).has_value());
    }

    SECTION("negative idle timeout") {
        cfg.pool.session_idle_timeout_seconds = -1;
        CHECK_FALSE(nekrobox::validate_pool_config(cfg.pool).has_value());
    }

    SECTION("empty interpreter command") {
        cfg.runtime.command.clear();
        CHECK_FALSE(nekrobox::validate_config(cfg).has_value());
    }

    SECTION("unknown log level") {
        cfg.log_level = "verbose";
        auto r = nekrobox::validate_config(cfg);
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code() == nekrobox::ErrorCode::InvalidConfig);
    }
}

TEST_CASE("Config round-trips through JSON", "[config]") {
    auto cfg = nekrobox::default_config();
    cfg.runtime.env["LANG"] = "C.UTF-8";
    nlohmann::json j = cfg;
    CHECK(j["pool"]["max_sessions"] == 100);
    CHECK(j["runtime"]["env"]["LANG"] == "C.UTF-8");

    auto back = j.get<nekrobox::Config>();
    CHECK(back.runtime.env.at("LANG") == "C.UTF-8");
}
