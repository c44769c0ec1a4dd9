#include "photon/exec/Deadline.hpp"

#include <utility>

namespace photon::exec {

Deadline::Deadline(asio::io_context& io, Clock::duration budget, std::function<void()> onExpired)
: timer_(io)
, budget_(budget)
, remaining_(budget)
, onExpired_(std::move(onExpired))
{}

void Deadline::arm() {
    if (finished_ || running_) {
        return;
    }
    remaining_ = budget_;
    start(remaining_);
}

void Deadline::start(Clock::duration remaining) {
    running_ = true;
    armedAt_ = Clock::now();
    const unsigned generation = ++generation_;
    timer_.expires_after(remaining);
    timer_.async_wait([self = shared_from_this(), generation](const std::error_code& ec) {
        if (ec == asio::error::operation_aborted || generation != self->generation_ ||
            !self->running_ || self->finished_) {
            return;
        }
        self->running_ = false;
        self->finished_ = true;
        self->expired_ = true;
        if (self->onExpired_) {
            self->onExpired_();
        }
    });
}

void Deadline::suspend() {
    if (!running_ || finished_) {
        return;
    }
    const auto elapsed = Clock::now() - armedAt_;
    remaining_ = elapsed >= remaining_ ? Clock::duration::zero() : remaining_ - elapsed;
    running_ = false;
    ++generation_;
    timer_.cancel();
}

void Deadline::resume() {
    if (running_ || finished_) {
        return;
    }
    start(remaining_);
}

void Deadline::cancel() {
    finished_ = true;
    running_ = false;
    ++generation_;
    timer_.cancel();
}

} // namespace photon::exec
