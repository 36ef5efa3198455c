#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <boost/asio/awaitable.hpp>
#include <nlohmann/json.hpp>

#include "nekrobox/core/config.hpp"
#include "nekrobox/core/error.hpp"
#include "nekrobox/core/types.hpp"
#include "nekrobox/sandbox/runtime.hpp"

namespace nekrobox::sandbox {

using boost::asio::awaitable;

enum class HandleState {
    Uninitialized,
    Constructing,
    Ready,
};

NLOHMANN_JSON_SERIALIZE_ENUM(HandleState, {
    {HandleState::Uninitialized, "uninitialized"},
    {HandleState::Constructing, "constructing"},
    {HandleState::Ready, "ready"},
})

/// Snapshot of one pooled session.
struct SessionRecord {
    std::string session_key;
    std::filesystem::path workdir;
    json config = json::object();
    HandleState handle_state = HandleState::Uninitialized;
    Timestamp created_at;
    Timestamp last_accessed;
    int64_t task_count = 0;
    int in_flight = 0;
};

struct PoolStats {
    size_t active_sessions = 0;
    size_t max_sessions = 0;
    int64_t total_tasks = 0;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(PoolStats, active_sessions, max_sessions, total_tasks)

/// Capacity-bounded registry of per-session sandbox state.
///
/// Each session owns an exclusive workdir under the pool's base directory and
/// a lazily constructed runtime handle. Inserting above `max_sessions` evicts
/// the least recently accessed session first. Registry mutations are
/// serialised by one mutex that is never held across a suspension point;
/// runtime construction is serialised per session by an asynchronous gate.
class SessionPool {
public:
    SessionPool(PoolConfig config, Runtime& runtime, ClockFn clock = &Clock::now);
    ~SessionPool();

    SessionPool(const SessionPool&) = delete;
    SessionPool& operator=(const SessionPool&) = delete;

    /// Registers a session and creates its workdir. An existing session is
    /// reused as is. Fails with InvalidArgument for keys that cannot name a
    /// directory and SessionConstructionFailed when the workdir cannot be made.
    auto create_session(std::string_view session_key, json config = json::object())
        -> Result<void>;

    /// Returns a snapshot of the session and marks it as accessed.
    auto get_session(std::string_view session_key) -> std::optional<SessionRecord>;

    /// Removes the session, shutting down its runtime handle if one is ready.
    auto cleanup_session(std::string_view session_key) -> bool;

    /// cleanup_session with a logged reason (capacity, poisoned handle, ...).
    auto evict(std::string_view session_key, std::string_view reason) -> bool;

    /// Removes every session idle for longer than the configured timeout.
    /// Sessions with tasks in flight are never idle.
    auto cleanup_idle_sessions() -> size_t;

    [[nodiscard]] auto get_stats() const -> PoolStats;

    /// Resolves the session's runtime handle, constructing it on first use.
    /// Concurrent callers for the same session wait for a single construction.
    /// A failed construction unregisters the session.
    auto ensure_runtime(std::string_view session_key)
        -> awaitable<Result<std::shared_ptr<RuntimeHandle>>>;

    /// Counts a task against the session; fails with SessionError once the
    /// per-session task limit is reached.
    auto record_task(std::string_view session_key) -> Result<int64_t>;

    /// Marks a task recorded by record_task as finished.
    void finish_task(std::string_view session_key);

    /// Tears down every session.
    void shutdown_all();

    [[nodiscard]] auto contains(std::string_view session_key) const -> bool;
    [[nodiscard]] auto size() const -> size_t;
    [[nodiscard]] auto session_keys() const -> std::vector<std::string>;
    [[nodiscard]] auto config() const -> const PoolConfig&;

    [[nodiscard]] static auto is_valid_session_key(std::string_view session_key) -> bool;

private:
    struct Entry;

    auto now() const -> Timestamp;
    void touch(Entry& entry);
    auto take_locked(std::string_view session_key) -> std::shared_ptr<Entry>;
    auto select_lru_locked() const -> std::string;
    void release(const std::shared_ptr<Entry>& entry);

    PoolConfig config_;
    Runtime& runtime_;
    ClockFn clock_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Entry>> sessions_;
};

} // namespace nekrobox::sandbox
