#include "nekrobox/sandbox/watchdog.hpp"

#include "nekrobox/core/logger.hpp"

namespace nekrobox::sandbox {

Watchdog::Watchdog(boost::asio::any_io_executor executor, Runtime& runtime,
                   std::shared_ptr<RuntimeHandle> handle)
    : timer_(std::move(executor)), runtime_(runtime), handle_(std::move(handle)) {}

void Watchdog::arm(Deadline deadline) {
    timer_.expires_at(deadline);
    timer_.async_wait([self = shared_from_this()](const boost::system::error_code& ec) {
        if (ec) return;
        self->expire();
    });
}

void Watchdog::disarm() {
    disarmed_.store(true);
    timer_.cancel();
}

auto Watchdog::expire() -> bool {
    if (disarmed_.load() || fired_.exchange(true)) {
        return false;
    }
    LOG_WARN("Task deadline passed, cancelling runtime handle");
    runtime_.cancel(*handle_);
    return true;
}

} // namespace nekrobox::sandbox
