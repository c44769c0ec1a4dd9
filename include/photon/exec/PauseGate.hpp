#pragma once
#include "photon/exec/ExecConfig.hpp"

#include <functional>
#include <memory>
#include <vector>

namespace photon::exec {

/**
 * @brief Open/closed gate that suspends cooperative tasks without blocking the executor.
 *
 * A waiter that finds the gate closed parks on its own timer armed to
 * "never"; `open()` cancels every parked timer so the waiters resume in the
 * order they parked. A parked timer may also be cancelled by its owner
 * (see CancelScope), in which case the waiter resumes with the gate still
 * closed and must re-check why it woke up.
 *
 * Not thread-safe: every call must happen on the owning io_context thread.
 */
class PauseGate {
public:
    PauseGate() = default;

    PauseGate(const PauseGate&) = delete;
    PauseGate& operator=(const PauseGate&) = delete;

    bool isOpen() const { return open_; }

    void close();

    /// Open the gate and wake every parked waiter. Idempotent.
    void open();

    /// Park @p timer until the gate opens; @p resume runs on wake-up.
    void park(const std::shared_ptr<Timer>& timer, std::function<void()> resume);

private:
    bool open_ = true;
    std::vector<std::weak_ptr<Timer>> parked_;
};

} // namespace photon::exec
