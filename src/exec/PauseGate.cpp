#include "photon/exec/PauseGate.hpp"

#include <algorithm>
#include <utility>

namespace photon::exec {

void PauseGate::close() {
    open_ = false;
}

void PauseGate::open() {
    open_ = true;
    auto parked = std::move(parked_);
    parked_.clear();
    for (auto& weak : parked) {
        if (auto timer = weak.lock()) {
            timer->cancel();
        }
    }
}

void PauseGate::park(const std::shared_ptr<Timer>& timer, std::function<void()> resume) {
    // Drop waiters that already woke up through their own cancellation.
    parked_.erase(std::remove_if(parked_.begin(), parked_.end(),
                                 [](const std::weak_ptr<Timer>& w) { return w.expired(); }),
                  parked_.end());

    if (open_) {
        asio::post(timer->get_executor(), std::move(resume));
        return;
    }

    timer->expires_at(Clock::time_point::max());
    parked_.push_back(timer);
    // The handler keeps the timer alive until it runs; aborted or not, the
    // waiter decides what the wake-up means.
    timer->async_wait([timer, resume = std::move(resume)](const std::error_code&) {
        resume();
    });
}

} // namespace photon::exec
