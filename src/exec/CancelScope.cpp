#include "photon/exec/CancelScope.hpp"

#include <algorithm>
#include <utility>

namespace photon::exec {

namespace {

template <typename T>
void pruneExpired(std::vector<std::weak_ptr<T>>& items) {
    items.erase(std::remove_if(items.begin(), items.end(),
                               [](const std::weak_ptr<T>& w) { return w.expired(); }),
                items.end());
}

} // namespace

CancelScope::CancelScope(asio::io_context& io, PauseGate& gate)
: io_(io)
, gate_(gate)
{}

CancelScope::CancelScope(asio::io_context& io, PauseGate& gate, std::shared_ptr<CancelScope> parent)
: io_(io)
, gate_(gate)
, parent_(std::move(parent))
{}

std::shared_ptr<CancelScope> CancelScope::child() {
    // Private constructor, so no make_shared.
    std::shared_ptr<CancelScope> scope(new CancelScope(io_, gate_, shared_from_this()));
    pruneExpired(children_);
    children_.push_back(scope);
    return scope;
}

std::error_code CancelScope::interruption() const {
    if (reason_) {
        return reason_;
    }
    return parent_ ? parent_->interruption() : std::error_code{};
}

void CancelScope::cancel(std::error_code reason) {
    if (reason_ || !reason) {
        return;
    }
    reason_ = reason;

    auto timers = std::move(timers_);
    timers_.clear();
    for (auto& weak : timers) {
        if (auto timer = weak.lock()) {
            timer->cancel();
        }
    }

    auto children = std::move(children_);
    children_.clear();
    for (auto& weak : children) {
        if (auto scope = weak.lock()) {
            scope->cancel(reason);
        }
    }
}

std::shared_ptr<Timer> CancelScope::makeTimer() {
    pruneExpired(timers_);
    auto timer = std::make_shared<Timer>(io_);
    timers_.push_back(timer);
    return timer;
}

void CancelScope::sleep(Clock::duration duration, Resume resume) {
    if (interruption()) {
        asio::post(io_, std::move(resume));
        return;
    }
    auto timer = makeTimer();
    timer->expires_after(duration);
    timer->async_wait([timer, resume = std::move(resume)](const std::error_code&) {
        resume();
    });
}

void CancelScope::waitUntilOpen(Resume resume) {
    if (interruption()) {
        asio::post(io_, std::move(resume));
        return;
    }
    gate_.park(makeTimer(), std::move(resume));
}

} // namespace photon::exec
