#pragma once

#include <atomic>
#include <memory>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>

#include "nekrobox/core/types.hpp"
#include "nekrobox/sandbox/runtime.hpp"

namespace nekrobox::sandbox {

/// Cancels a runtime handle when a task's deadline passes.
///
/// A task disarms its watchdog as soon as the run returns. An expiry that
/// was already queued at that point finds the watchdog disarmed and does
/// nothing, so it can never reach a later task on the same handle.
class Watchdog : public std::enable_shared_from_this<Watchdog> {
public:
    Watchdog(boost::asio::any_io_executor executor, Runtime& runtime,
             std::shared_ptr<RuntimeHandle> handle);

    void arm(Deadline deadline);
    void disarm();

    /// Body of the timer handler. Returns true if it cancelled the handle.
    auto expire() -> bool;

    [[nodiscard]] auto fired() const -> bool { return fired_.load(); }

private:
    boost::asio::steady_timer timer_;
    Runtime& runtime_;
    std::shared_ptr<RuntimeHandle> handle_;
    std::atomic<bool> disarmed_{false};
    std::atomic<bool> fired_{false};
};

} // namespace nekrobox::sandbox
