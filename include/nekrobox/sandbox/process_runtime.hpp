#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <boost/asio/awaitable.hpp>

#include "nekrobox/core/config.hpp"
#include "nekrobox/sandbox/runtime.hpp"

namespace nekrobox::sandbox {

/// Runtime that runs every instruction as a child process of a configured
/// interpreter (`command` + instruction as the final argument).
///
/// The child runs in the session workdir as the leader of its own process
/// group with stdin closed and `RLIMIT_AS` set from max_memory_mb. It
/// receives the merged context in `NEKROBOX_CONTEXT` and may publish variables
/// by writing a JSON object to the file named by `NEKROBOX_VARIABLES_FILE`.
///
/// Exit status 0 is success. A non-zero exit whose last stderr line reads
/// `SomeError: message` is an uncaught interpreter exception and is thrown as
/// SandboxError; any other non-zero exit is a failure reported by the program
/// itself. The process group is killed and reaped before run() returns, and
/// also as soon as the leader exits, so background children cannot outlive it.
///
/// Concurrent runs on one handle each get their own process group and
/// variables file. cancel() stops every run active on the handle.
class ProcessRuntime : public Runtime {
public:
    ProcessRuntime(RuntimeConfig config, int max_memory_mb);
    ~ProcessRuntime() override;

    ProcessRuntime(const ProcessRuntime&) = delete;
    ProcessRuntime& operator=(const ProcessRuntime&) = delete;

    auto construct(const std::filesystem::path& workdir, const json& config)
        -> awaitable<Result<std::shared_ptr<RuntimeHandle>>> override;

    auto run(RuntimeHandle& handle, std::string_view instruction,
             const json& context, Deadline deadline)
        -> awaitable<RuntimeOutcome> override;

    void cancel(RuntimeHandle& handle) override;

    void shutdown(RuntimeHandle& handle) override;

    [[nodiscard]] auto config() const -> const RuntimeConfig&;

private:
    RuntimeConfig config_;
    int max_memory_mb_;
};

/// Parses `TypeName: message` from the last stderr line of a crashed
/// interpreter. Dotted names keep only their last component.
[[nodiscard]] auto parse_uncaught_exception(std::string_view stderr_text)
    -> std::optional<std::pair<std::string, std::string>>;

} // namespace nekrobox::sandbox
