#pragma once
#include "photon/exec/ExecConfig.hpp"
#include "photon/exec/PauseGate.hpp"

#include <functional>
#include <memory>
#include <system_error>
#include <vector>

namespace photon::exec {

/**
 * @brief Cancellation domain for a group of cooperative tasks.
 *
 * Every suspension of a task (a timed sleep or a wait on the pause gate) goes
 * through a scope so that cancelling the scope wakes it immediately. Scopes
 * nest: a child observes its parent's cancellation, and cancelling a parent
 * cancels every live child with the same reason. The engine keeps one root
 * scope per run (cancelled by stop) and one child per line attempt
 * (cancelled by the line deadline or by a failing sibling).
 *
 * Resume callbacks never carry an error: after waking, a task asks
 * `interruption()` whether it must unwind. The first cancellation reason wins.
 *
 * Not thread-safe: use only from the owning io_context thread.
 */
class CancelScope : public std::enable_shared_from_this<CancelScope> {
public:
    using Resume = std::function<void()>;

    CancelScope(asio::io_context& io, PauseGate& gate);

    CancelScope(const CancelScope&) = delete;
    CancelScope& operator=(const CancelScope&) = delete;

    /// Create a scope that is cancelled together with this one.
    std::shared_ptr<CancelScope> child();

    /// Reason this scope (or an ancestor) was cancelled; empty while live.
    std::error_code interruption() const;

    void cancel(std::error_code reason);

    /// Run @p resume after @p duration, or as soon as the scope is cancelled.
    void sleep(Clock::duration duration, Resume resume);

    /// Run @p resume once the pause gate is open, or as soon as the scope is cancelled.
    void waitUntilOpen(Resume resume);

    bool paused() const { return !gate_.isOpen(); }

    asio::io_context& io() { return io_; }

private:
    CancelScope(asio::io_context& io, PauseGate& gate, std::shared_ptr<CancelScope> parent);

    std::shared_ptr<Timer> makeTimer();

    asio::io_context& io_;
    PauseGate& gate_;
    std::shared_ptr<CancelScope> parent_;
    std::error_code reason_;
    std::vector<std::weak_ptr<Timer>> timers_;
    std::vector<std::weak_ptr<CancelScope>> children_;
};

} // namespace photon::exec
