#pragma once
#include "photon/exec/ExecConfig.hpp"

#include <functional>
#include <memory>

namespace photon::exec {

/**
 * @brief Execution budget enforced by an Asio timer, with pause support.
 *
 * Pattern:
 * - `arm()` starts a `steady_timer` for the remaining budget.
 * - If the guarded work finishes first the owner calls `cancel()`; otherwise
 *   the expiry handler runs once and the owner cancels the work.
 * - `suspend()` freezes the remaining budget (paused time is not billed) and
 *   `resume()` re-arms the timer with what was left.
 *
 * Completion handlers capture a `shared_ptr` to the deadline and a generation
 * number, so a handler left behind by `suspend()` or `cancel()` recognises
 * itself as stale and does nothing.
 *
 * Not thread-safe: use only from the owning io_context thread.
 */
class Deadline : public std::enable_shared_from_this<Deadline> {
public:
    Deadline(asio::io_context& io, Clock::duration budget, std::function<void()> onExpired);

    Deadline(const Deadline&) = delete;
    Deadline& operator=(const Deadline&) = delete;

    void arm();
    void suspend();
    void resume();
    void cancel();

    bool expired() const { return expired_; }
    Clock::duration budget() const { return budget_; }

private:
    void start(Clock::duration remaining);

    Timer timer_;
    Clock::duration budget_;
    Clock::duration remaining_;
    Clock::time_point armedAt_{};
    std::function<void()> onExpired_;
    unsigned generation_ = 0;
    bool running_ = false;
    bool finished_ = false;
    bool expired_ = false;
};

} // namespace photon::exec
