#include "photon/devices/InterlockDropTimer.hpp"
#include "photon/exec/ExecService.hpp"
#include "photon/log/Log.hpp"

namespace photon::devices {

InterlockDropTimer::InterlockDropTimer(exec::asio::io_context& io,
                                       std::shared_ptr<safety::InterlockSignal> signal)
: io_(io)
, signal_(std::move(signal))
, timer_(io)
{}

InterlockDropTimer::~InterlockDropTimer() {
    cancel();
}

void InterlockDropTimer::schedule(exec::Clock::duration delay, std::string reason) {
    timer_.expires_after(delay);
    timer_.async_wait([this, reason = std::move(reason)](const std::error_code& ec) {
        if (ec) return;
        fired_.store(true);
        logWarning("[InterlockDropTimer] opening interlock: ", reason, "\n");
        signal_->setEnablePermitted(false, reason);
    });
}

void InterlockDropTimer::cancel() {
    if (cancelled_) {
        return;
    }
    cancelled_ = true;
    exec::asio::post(io_, [this] { timer_.cancel(); });
    exec::drain(io_);
}

} // namespace photon::devices
