#include "nekrobox/sandbox/session_pool.hpp"

#include <algorithm>
#include <stdexcept>
#include <system_error>

#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "nekrobox/core/logger.hpp"

namespace nekrobox::sandbox {

namespace fs = std::filesystem;
namespace net = boost::asio;

namespace {

// Single-token channel used as an asynchronous per-session mutex.
using ConstructionGate =
    net::experimental::concurrent_channel<void(boost::system::error_code)>;

// Returns the gate's token when the holder leaves scope.
struct GateToken {
    std::shared_ptr<ConstructionGate> gate;

    ~GateToken() {
        if (gate) gate->try_send(boost::system::error_code{});
    }
};

} // namespace

struct SessionPool::Entry {
    SessionRecord record;
    std::shared_ptr<RuntimeHandle> handle;
    std::shared_ptr<ConstructionGate> gate;
};

SessionPool::SessionPool(PoolConfig config, Runtime& runtime, ClockFn clock)
    : config_(std::move(config)), runtime_(runtime), clock_(std::move(clock)) {
    if (auto valid = validate_pool_config(config_); !valid) {
        throw std::invalid_argument(valid.error().what());
    }
    if (!clock_) {
        clock_ = &Clock::now;
    }

    std::error_code ec;
    fs::create_directories(config_.workdir, ec);
    if (ec) {
        throw std::invalid_argument("Cannot create pool workdir " +
                                    config_.workdir + ": " + ec.message());
    }

    LOG_INFO("SessionPool created (workdir={}, max_sessions={}, idle_timeout={}s)",
             config_.workdir, config_.max_sessions,
             config_.session_idle_timeout_seconds);
}

SessionPool::~SessionPool() {
    shutdown_all();
}

auto SessionPool::now() const -> Timestamp {
    return clock_();
}

void SessionPool::touch(Entry& entry) {
    entry.record.last_accessed = std::max(entry.record.last_accessed, now());
}

auto SessionPool::is_valid_session_key(std::string_view session_key) -> bool {
    if (session_key.empty() || session_key == "." || session_key == "..") {
        return false;
    }
    return session_key.find_first_of(std::string_view("/\\\0", 3)) == std::string_view::npos;
}

auto SessionPool::create_session(std::string_view session_key, json config)
    -> Result<void> {
    if (!is_valid_session_key(session_key)) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
            "Session key cannot be used as a directory name",
            std::string(session_key)));
    }

    auto key = std::string(session_key);
    {
        std::lock_guard lock(mutex_);
        if (auto it = sessions_.find(key); it != sessions_.end()) {
            LOG_INFO("Session {} already exists, reusing", key);
            touch(*it->second);
            return {};
        }
    }

    // Filesystem work stays outside the registry lock.
    auto workdir = fs::path(config_.workdir) / key;
    std::error_code ec;
    fs::create_directories(workdir, ec);
    if (ec) {
        LOG_ERROR("Failed to create workdir for session {}: {}", key, ec.message());
        return std::unexpected(make_error(ErrorCode::SessionConstructionFailed,
            "Failed to create session workdir",
            workdir.string() + ": " + ec.message()));
    }

    std::shared_ptr<Entry> evicted;
    {
        std::lock_guard lock(mutex_);

        // Another caller may have registered the key while the lock was released.
        if (auto it = sessions_.find(key); it != sessions_.end()) {
            touch(*it->second);
            return {};
        }

        if (sessions_.size() >= config_.max_sessions) {
            auto victim = select_lru_locked();
            evicted = take_locked(victim);
            LOG_WARN("Session pool at capacity ({}), evicting least recently used session {}",
                     config_.max_sessions, victim);
        }

        auto entry = std::make_shared<Entry>();
        auto ts = now();
        entry->record = SessionRecord{
            .session_key = key,
            .workdir = std::move(workdir),
            .config = config.is_object() ? std::move(config) : json::object(),
            .handle_state = HandleState::Uninitialized,
            .created_at = ts,
            .last_accessed = ts,
            .task_count = 0,
        };
        sessions_.emplace(key, std::move(entry));
        LOG_INFO("Created sandbox session {}", key);
    }

    if (evicted) {
        release(evicted);
    }
    return {};
}

auto SessionPool::get_session(std::string_view session_key)
    -> std::optional<SessionRecord> {
    std::lock_guard lock(mutex_);
    auto it = sessions_.find(std::string(session_key));
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    touch(*it->second);
    return it->second->record;
}

auto SessionPool::take_locked(std::string_view session_key) -> std::shared_ptr<Entry> {
    auto it = sessions_.find(std::string(session_key));
    if (it == sessions_.end()) {
        return nullptr;
    }
    auto entry = std::move(it->second);
    sessions_.erase(it);
    return entry;
}

auto SessionPool::select_lru_locked() const -> std::string {
    auto oldest = std::min_element(sessions_.begin(), sessions_.end(),
        [](const auto& a, const auto& b) {
            const auto& ra = a.second->record;
            const auto& rb = b.second->record;
            if (ra.last_accessed != rb.last_accessed) {
                return ra.last_accessed < rb.last_accessed;
            }
            return ra.session_key < rb.session_key;
        });
    return oldest == sessions_.end() ? std::string{} : oldest->first;
}

void SessionPool::release(const std::shared_ptr<Entry>& entry) {
    auto& record = entry->record;
    if (record.handle_state == HandleState::Ready && entry->handle) {
        try {
            runtime_.shutdown(*entry->handle);
        } catch (const std::exception& e) {
            LOG_ERROR("Runtime shutdown failed for session {}: {}",
                      record.session_key, e.what());
        }
    }
    entry->handle.reset();
    LOG_INFO("Cleaned up session {} (task_count={})",
             record.session_key, record.task_count);
}

auto SessionPool::cleanup_session(std::string_view session_key) -> bool {
    std::shared_ptr<Entry> entry;
    {
        std::lock_guard lock(mutex_);
        entry = take_locked(session_key);
    }
    if (!entry) {
        return false;
    }
    release(entry);
    return true;
}

auto SessionPool::evict(std::string_view session_key, std::string_view reason) -> bool {
    LOG_WARN("Evicting session {}: {}", session_key, reason);
    return cleanup_session(session_key);
}

auto SessionPool::cleanup_idle_sessions() -> size_t {
    std::vector<std::shared_ptr<Entry>> idle;
    {
        std::lock_guard lock(mutex_);
        auto current = now();
        auto timeout = std::chrono::seconds(config_.session_idle_timeout_seconds);
        for (auto it = sessions_.begin(); it != sessions_.end();) {
            const auto& record = it->second->record;
            if (record.in_flight == 0 && current - record.last_accessed > timeout) {
                idle.push_back(std::move(it->second));
                it = sessions_.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (const auto& entry : idle) {
        release(entry);
    }
    if (!idle.empty()) {
        LOG_INFO("Cleaned up {} idle sessions", idle.size());
    }
    return idle.size();
}

auto SessionPool::get_stats() const -> PoolStats {
    std::lock_guard lock(mutex_);
    PoolStats stats;
    stats.active_sessions = sessions_.size();
    stats.max_sessions = config_.max_sessions;
    for (const auto& [_, entry] : sessions_) {
        stats.total_tasks += entry->record.task_count;
    }
    return stats;
}

auto SessionPool::ensure_runtime(std::string_view session_key)
    -> awaitable<Result<std::shared_ptr<RuntimeHandle>>> {
    auto key = std::string(session_key);
    auto executor = co_await net::this_coro::executor;
    std::shared_ptr<Entry> entry;
    std::shared_ptr<ConstructionGate> gate;
    {
        std::lock_guard lock(mutex_);
        auto it = sessions_.find(key);
        if (it == sessions_.end()) {
            co_return make_fail(make_error(ErrorCode::NotFound,
                "Session not found", key));
        }
        entry = it->second;
        touch(*entry);
        if (entry->record.handle_state == HandleState::Ready) {
            co_return entry->handle;
        }
        if (!entry->gate) {
            entry->gate = std::make_shared<ConstructionGate>(executor, 1);
            entry->gate->try_send(boost::system::error_code{});
        }
        gate = entry->gate;
    }

    co_await gate->async_receive(net::use_awaitable);
    GateToken token{gate};

    fs::path workdir;
    json config;
    {
        std::lock_guard lock(mutex_);
        auto it = sessions_.find(key);
        if (it == sessions_.end() || it->second != entry) {
            co_return make_fail(make_error(ErrorCode::SessionError,
                "Session was removed while waiting for its runtime", key));
        }
        if (entry->record.handle_state == HandleState::Ready) {
            co_return entry->handle;
        }
        entry->record.handle_state = HandleState::Constructing;
        workdir = entry->record.workdir;
        config = entry->record.config;
    }

    LOG_DEBUG("Constructing runtime for session {}", key);
    Result<std::shared_ptr<RuntimeHandle>> constructed = std::unexpected(
        make_error(ErrorCode::InternalError, "Runtime construction did not complete"));
    try {
        constructed = co_await runtime_.construct(workdir, config);
    } catch (const std::exception& e) {
        constructed = std::unexpected(make_error(ErrorCode::SessionConstructionFailed,
            "Runtime construction threw", e.what()));
    }

    if (constructed && !*constructed) {
        constructed = std::unexpected(make_error(ErrorCode::SessionConstructionFailed,
            "Runtime returned an empty handle", key));
    }

    bool registered = false;
    {
        std::lock_guard lock(mutex_);
        auto it = sessions_.find(key);
        registered = it != sessions_.end() && it->second == entry;
        if (registered && constructed) {
            entry->handle = *constructed;
            entry->record.handle_state = HandleState::Ready;
        } else if (registered) {
            entry->record.handle_state = HandleState::Uninitialized;
            sessions_.erase(it);
        }
    }

    if (!constructed) {
        LOG_ERROR("Runtime construction failed for session {}: {}",
                  key, constructed.error().what());
        if (constructed.error().code() == ErrorCode::SessionConstructionFailed) {
            co_return make_fail(constructed.error());
        }
        co_return make_fail(make_error(ErrorCode::SessionConstructionFailed,
            "Failed to construct sandbox runtime", constructed.error().what()));
    }

    if (!registered) {
        runtime_.shutdown(**constructed);
        co_return make_fail(make_error(ErrorCode::SessionError,
            "Session was removed during runtime construction", key));
    }

    LOG_INFO("Runtime ready for session {}", key);
    co_return *constructed;
}

auto SessionPool::record_task(std::string_view session_key) -> Result<int64_t> {
    std::lock_guard lock(mutex_);
    auto it = sessions_.find(std::string(session_key));
    if (it == sessions_.end()) {
        return std::unexpected(make_error(ErrorCode::NotFound,
            "Session not found", std::string(session_key)));
    }

    auto& record = it->second->record;
    if (config_.max_tasks_per_session > 0 &&
        record.task_count >= config_.max_tasks_per_session) {
        return std::unexpected(make_error(ErrorCode::SessionError,
            "Session task limit reached",
            std::string(session_key) + " (max_tasks_per_session=" +
                std::to_string(config_.max_tasks_per_session) + ")"));
    }

    touch(*it->second);
    record.task_count += 1;
    record.in_flight += 1;
    return record.task_count;
}

void SessionPool::finish_task(std::string_view session_key) {
    std::lock_guard lock(mutex_);
    auto it = sessions_.find(std::string(session_key));
    if (it == sessions_.end()) {
        return;
    }
    auto& record = it->second->record;
    record.in_flight = std::max(0, record.in_flight - 1);
    touch(*it->second);
}

void SessionPool::shutdown_all() {
    std::unordered_map<std::string, std::shared_ptr<Entry>> all;
    {
        std::lock_guard lock(mutex_);
        all.swap(sessions_);
    }
    for (const auto& [_, entry] : all) {
        release(entry);
    }
    if (!all.empty()) {
        LOG_INFO("Shut down {} sandbox sessions", all.size());
    }
}

auto SessionPool::contains(std::string_view session_key) const -> bool {
    std::lock_guard lock(mutex_);
    return sessions_.contains(std::string(session_key));
}

auto SessionPool::size() const -> size_t {
    std::lock_guard lock(mutex_);
    return sessions_.size();
}

auto SessionPool::session_keys() const -> std::vector<std::string> {
    std::lock_guard lock(mutex_);
    std::vector<std::string> keys;
    keys.reserve(sessions_.size());
    for (const auto& [key, _] : sessions_) {
        keys.push_back(key);
    }
    std::ranges::sort(keys);
    return keys;
}

auto SessionPool::config() const -> const PoolConfig& {
    return config_;
}

} // namespace nekrobox::sandbox
