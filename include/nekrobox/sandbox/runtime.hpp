#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <boost/asio/awaitable.hpp>
#include <nlohmann/json.hpp>

#include "nekrobox/core/error.hpp"
#include "nekrobox/core/types.hpp"

namespace nekrobox::sandbox {

using boost::asio::awaitable;
using json = nlohmann::json;

/// Thrown by a runtime when the sandboxed program raised an exception it did
/// not handle. `type_name` is the interpreter's name for the exception type.
class SandboxError : public std::runtime_error {
public:
    SandboxError(std::string type_name, const std::string& message)
        : std::runtime_error(message), type_name_(std::move(type_name)) {}

    [[nodiscard]] auto type_name() const noexcept -> const std::string& { return type_name_; }

private:
    std::string type_name_;
};

/// Opaque per-session state owned by a runtime implementation.
class RuntimeHandle {
public:
    virtual ~RuntimeHandle() = default;
};

/// What a single run produced when it ran to completion.
struct RuntimeOutcome {
    bool success = true;               // false: the program reported its own failure
    std::vector<std::string> rounds;   // textual output per internal round
    std::optional<std::string> error;
    json variables = json::object();
};

/// Sandboxed execution backend.
///
/// Implementations are driven from coroutines on a Boost.Asio executor.
/// `run` may throw (SandboxError for program exceptions, anything else for
/// backend failures). `cancel` must make an in-flight `run` on the same
/// handle complete promptly and must not leave processes or threads behind.
class Runtime {
public:
    virtual ~Runtime() = default;

    virtual auto construct(const std::filesystem::path& workdir, const json& config)
        -> awaitable<Result<std::shared_ptr<RuntimeHandle>>> = 0;

    virtual auto run(RuntimeHandle& handle, std::string_view instruction,
                     const json& context, Deadline deadline)
        -> awaitable<RuntimeOutcome> = 0;

    virtual void cancel(RuntimeHandle& handle) = 0;

    virtual void shutdown(RuntimeHandle& handle) = 0;
};

} // namespace nekrobox::sandbox
