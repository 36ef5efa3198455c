#include "nekrobox/sandbox/process_runtime.hpp"

#include <algorithm>
#include <array>
#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fstream>
#include <mutex>
#include <regex>
#include <set>
#include <system_error>
#include <vector>

#include <fcntl.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/experimental/awaitable_operators.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/system_error.hpp>

#include "nekrobox/core/logger.hpp"
#include "nekrobox/core/utils.hpp"
#include "nekrobox/sandbox/artifacts.hpp"

extern char** environ;

namespace nekrobox::sandbox {

namespace fs = std::filesystem;
namespace net = boost::asio;
using namespace boost::asio::experimental::awaitable_operators;

namespace {

constexpr std::string_view kExecFailedMarker = "nekrobox: exec failed\n";
constexpr int kExecFailedStatus = 127;

// State of one in-flight run. Runs on the same handle are independent.
struct ProcessRun {
    std::atomic<pid_t> pgid{0};
    std::atomic<bool> cancelled{false};
    std::atomic<bool> deadline_hit{false};
    fs::path variables_file;

    void kill_group() {
        auto group = pgid.load();
        if (group > 0) {
            ::kill(-group, SIGKILL);
        }
    }

    [[nodiscard]] auto stopping() const -> bool {
        return cancelled.load() || deadline_hit.load();
    }
};

class ProcessHandle : public RuntimeHandle {
public:
    ProcessHandle(fs::path workdir, json session_config)
        : workdir(std::move(workdir)), session_config(std::move(session_config)) {}

    fs::path workdir;
    json session_config;
    std::atomic<bool> closed{false};

    [[nodiscard]] auto private_dir() const -> fs::path { return workdir / kPrivateDirName; }

    void attach(const std::shared_ptr<ProcessRun>& run) {
        std::lock_guard lock(mutex_);
        runs_.insert(run);
    }

    void detach(const std::shared_ptr<ProcessRun>& run) {
        std::lock_guard lock(mutex_);
        runs_.erase(run);
    }

    /// Cancels every run currently active on this handle.
    void cancel_all() {
        std::lock_guard lock(mutex_);
        for (const auto& run : runs_) {
            run->cancelled.store(true);
            run->kill_group();
        }
    }

private:
    std::mutex mutex_;
    std::set<std::shared_ptr<ProcessRun>> runs_;
};

// Registers a run with its handle and removes its variables file on exit.
struct RunLease {
    ProcessHandle& handle;
    std::shared_ptr<ProcessRun> run;

    RunLease(ProcessHandle& h, std::shared_ptr<ProcessRun> r)
        : handle(h), run(std::move(r)) { handle.attach(run); }

    ~RunLease() {
        handle.detach(run);
        std::error_code ec;
        fs::remove(run->variables_file, ec);
    }
};

auto as_process_handle(RuntimeHandle& handle) -> ProcessHandle& {
    auto* process = dynamic_cast<ProcessHandle*>(&handle);
    if (!process) {
        throw std::invalid_argument("Runtime handle was not created by ProcessRuntime");
    }
    return *process;
}

// Pipe pair closed on scope exit unless ownership is handed off.
struct Pipe {
    int fds[2] = {-1, -1};

    Pipe() = default;
    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    ~Pipe() {
        close_read();
        close_write();
    }

    auto open() -> bool { return ::pipe2(fds, O_CLOEXEC) == 0; }
    auto release_read() -> int { return std::exchange(fds[0], -1); }
    void close_read() { if (fds[0] >= 0) ::close(std::exchange(fds[0], -1)); }
    void close_write() { if (fds[1] >= 0) ::close(std::exchange(fds[1], -1)); }
};

// Kills and reaps the child's process group if run() unwinds before the
// normal reaping path has finished.
struct ChildGuard {
    pid_t pid = 0;
    bool reaped = false;

    ~ChildGuard() {
        if (pid <= 0 || reaped) return;
        ::kill(-pid, SIGKILL);
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
    }
};

auto read_all(net::posix::stream_descriptor& stream, size_t max_bytes)
    -> net::awaitable<std::string> {
    std::string data;
    std::array<char, 4096> buf;
    for (;;) {
        auto [ec, n] = co_await stream.async_read_some(
            net::buffer(buf), net::as_tuple(net::use_awaitable));
        // One byte past the cap is kept so truncate() can mark the cut.
        if (n > 0 && data.size() <= max_bytes) {
            data.append(buf.data(), std::min(n, max_bytes + 1 - data.size()));
        }
        // Keep draining past the cap so the child never blocks on a full pipe.
        if (ec) break;
    }
    co_return utils::truncate(data, max_bytes);
}

// Polls the leader without blocking the executor. Once it has exited the rest
// of its group is killed, so children left holding the pipes cannot keep the
// reads open.
auto reap_leader(pid_t pid, ProcessRun& run, ChildGuard& guard) -> net::awaitable<int> {
    net::steady_timer poll_timer(co_await net::this_coro::executor);
    int status = 0;
    for (;;) {
        auto reaped = ::waitpid(pid, &status, WNOHANG);
        if (reaped == pid || (reaped < 0 && errno != EINTR)) {
            guard.reaped = true;
            break;
        }
        if (run.stopping()) {
            run.kill_group();
        }
        poll_timer.expires_after(std::chrono::milliseconds(10));
        co_await poll_timer.async_wait(net::as_tuple(net::use_awaitable));
    }
    ::kill(-pid, SIGKILL);
    co_return status;
}

auto build_environment(const RuntimeConfig& config, const ProcessHandle& handle,
                       const ProcessRun& run, const json& context)
    -> std::vector<std::string> {
    std::vector<std::string> env;
    if (config.inherit_env) {
        for (char** e = environ; e && *e; ++e) {
            env.emplace_back(*e);
        }
    } else if (auto* path = std::getenv("PATH")) {
        env.emplace_back(std::string("PATH=") + path);
    }

    for (const auto& [key, value] : config.env) {
        env.push_back(key + "=" + value);
    }
    if (auto it = handle.session_config.find("env");
        it != handle.session_config.end() && it->is_object()) {
        for (const auto& [key, value] : it->items()) {
            if (value.is_string()) {
                env.push_back(key + "=" + value.get<std::string>());
            }
        }
    }

    env.push_back("NEKROBOX_CONTEXT=" + context.dump());
    env.push_back("NEKROBOX_VARIABLES_FILE=" + run.variables_file.string());
    env.push_back("NEKROBOX_WORKDIR=" + handle.workdir.string());
    return env;
}

auto read_variables(const fs::path& file) -> json {
    std::error_code ec;
    if (!fs::exists(file, ec)) {
        return json::object();
    }
    std::ifstream in(file);
    auto vars = json::parse(in, nullptr, /*allow_exceptions=*/false);
    if (vars.is_discarded() || !vars.is_object()) {
        LOG_WARN("Ignoring malformed variables file {}", file.string());
        return json::object();
    }
    return vars;
}

auto memory_limit_mb(const ProcessHandle& handle, int fallback) -> int {
    auto it = handle.session_config.find("max_memory_mb");
    if (it != handle.session_config.end() && it->is_number_integer()) {
        return it->get<int>();
    }
    return fallback;
}

} // namespace

auto parse_uncaught_exception(std::string_view stderr_text)
    -> std::optional<std::pair<std::string, std::string>> {
    static const std::regex exception_re(
        R"(^([A-Za-z_][A-Za-z0-9_.]*(?:Error|Exception)):?\s*(.*)$)");

    auto line = utils::last_nonempty_line(stderr_text);
    std::smatch match;
    if (!std::regex_match(line, match, exception_re)) {
        return std::nullopt;
    }

    auto type_name = match[1].str();
    if (auto dot = type_name.rfind('.'); dot != std::string::npos) {
        type_name = type_name.substr(dot + 1);
    }
    return std::make_pair(std::move(type_name), match[2].str());
}

ProcessRuntime::ProcessRuntime(RuntimeConfig config, int max_memory_mb)
    : config_(std::move(config)), max_memory_mb_(max_memory_mb) {
    if (config_.command.empty() || config_.command.front().empty()) {
        throw std::invalid_argument("runtime.command must name an interpreter");
    }
    LOG_INFO("ProcessRuntime using interpreter '{}' (max_memory_mb={})",
             config_.command.front(), max_memory_mb_);
}

ProcessRuntime::~ProcessRuntime() = default;

auto ProcessRuntime::config() const -> const RuntimeConfig& {
    return config_;
}

auto ProcessRuntime::construct(const fs::path& workdir, const json& config)
    -> awaitable<Result<std::shared_ptr<RuntimeHandle>>> {
    auto handle = std::make_shared<ProcessHandle>(workdir, config);

    std::error_code ec;
    fs::create_directories(handle->private_dir(), ec);
    if (ec) {
        co_return make_fail(make_error(ErrorCode::SessionConstructionFailed,
            "Failed to prepare runtime directory",
            handle->private_dir().string() + ": " + ec.message()));
    }

    LOG_DEBUG("Process runtime handle ready in {}", workdir.string());
    co_return std::static_pointer_cast<RuntimeHandle>(handle);
}

auto ProcessRuntime::run(RuntimeHandle& handle, std::string_view instruction,
                         const json& context, Deadline deadline)
    -> awaitable<RuntimeOutcome> {
    auto& process = as_process_handle(handle);
    if (process.closed.load()) {
        throw std::runtime_error("Runtime handle has been shut down");
    }

    auto executor = co_await net::this_coro::executor;

    auto run = std::make_shared<ProcessRun>();
    run->variables_file = process.private_dir() /
                          ("variables-" + utils::generate_id(12) + ".json");
    RunLease lease(process, run);

    std::vector<std::string> args = config_.command;
    args.emplace_back(instruction);
    std::vector<char*> argv;
    for (auto& arg : args) argv.push_back(arg.data());
    argv.push_back(nullptr);

    auto env = build_environment(config_, process, *run, context);
    std::vector<char*> envp;
    for (auto& var : env) envp.push_back(var.data());
    envp.push_back(nullptr);

    auto workdir = process.workdir.string();
    auto limit_mb = memory_limit_mb(process, max_memory_mb_);

    Pipe out, err;
    if (!out.open() || !err.open()) {
        throw std::system_error(errno, std::generic_category(), "pipe2");
    }

    if (run->cancelled.load()) {
        throw boost::system::system_error(net::error::operation_aborted,
                                          "Sandbox process was cancelled");
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        throw std::system_error(errno, std::generic_category(), "fork");
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls from here on.
        ::setpgid(0, 0);
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
        ::dup2(out.fds[1], STDOUT_FILENO);
        ::dup2(err.fds[1], STDERR_FILENO);
        if (::chdir(workdir.c_str()) != 0) {
            [[maybe_unused]] auto n = ::write(STDERR_FILENO, kExecFailedMarker.data(),
                                              kExecFailedMarker.size());
            ::_exit(kExecFailedStatus);
        }
        if (limit_mb > 0) {
            struct rlimit rl;
            rl.rlim_cur = rl.rlim_max = static_cast<rlim_t>(limit_mb) * 1024 * 1024;
            ::setrlimit(RLIMIT_AS, &rl);
        }
        ::execvpe(argv[0], argv.data(), envp.data());
        [[maybe_unused]] auto n = ::write(STDERR_FILENO, kExecFailedMarker.data(),
                                          kExecFailedMarker.size());
        ::_exit(kExecFailedStatus);
    }

    ::setpgid(pid, pid);
    run->pgid.store(pid);
    ChildGuard guard{pid};
    // A cancel that raced the fork saw no group to kill.
    if (run->cancelled.load()) {
        run->kill_group();
    }
    out.close_write();
    err.close_write();

    LOG_DEBUG("Spawned sandbox process {} in {}", pid, workdir);

    net::posix::stream_descriptor out_stream(executor, out.release_read());
    net::posix::stream_descriptor err_stream(executor, err.release_read());

    net::steady_timer deadline_timer(executor, deadline);
    deadline_timer.async_wait([run](const boost::system::error_code& wait_ec) {
        if (wait_ec) return;
        run->deadline_hit.store(true);
        run->kill_group();
    });

    auto [stdout_text, stderr_text, status] = co_await (
        read_all(out_stream, config_.max_output_bytes) &&
        read_all(err_stream, config_.max_output_bytes) &&
        reap_leader(pid, *run, guard));

    deadline_timer.cancel();
    run->pgid.store(0);

    if (run->deadline_hit.load()) {
        throw boost::system::system_error(net::error::timed_out,
                                          "Sandbox process exceeded its deadline");
    }
    if (run->cancelled.load()) {
        throw boost::system::system_error(net::error::operation_aborted,
                                          "Sandbox process was cancelled");
    }

    RuntimeOutcome outcome;
    if (!stdout_text.empty()) {
        outcome.rounds.push_back(stdout_text);
    }

    if (WIFSIGNALED(status)) {
        throw SandboxError("ProcessSignaled",
                           "Sandbox process terminated by signal " +
                               std::to_string(WTERMSIG(status)));
    }

    auto exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    if (exit_code == kExecFailedStatus && stderr_text.starts_with(kExecFailedMarker)) {
        throw std::runtime_error("Failed to start interpreter '" + args.front() +
                                 "' in " + workdir);
    }

    if (exit_code != 0) {
        if (auto uncaught = parse_uncaught_exception(stderr_text)) {
            throw SandboxError(uncaught->first, uncaught->second);
        }
        outcome.success = false;
        auto message = utils::trim(stderr_text);
        outcome.error = message.empty()
            ? "exit status " + std::to_string(exit_code)
            : std::move(message);
        LOG_DEBUG("Sandbox process {} reported failure (exit {})", pid, exit_code);
        co_return outcome;
    }

    outcome.success = true;
    outcome.variables = read_variables(run->variables_file);
    co_return outcome;
}

void ProcessRuntime::cancel(RuntimeHandle& handle) {
    as_process_handle(handle).cancel_all();
}

void ProcessRuntime::shutdown(RuntimeHandle& handle) {
    auto& process = as_process_handle(handle);
    process.closed.store(true);
    cancel(handle);
    LOG_DEBUG("Process runtime handle in {} shut down", process.workdir.string());
}

} // namespace nekrobox::sandbox
