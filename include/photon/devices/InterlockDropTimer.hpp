#pragma once

#include "photon/exec/ExecConfig.hpp"
#include "photon/safety/InterlockSignal.hpp"

#include <atomic>
#include <memory>
#include <string>

namespace photon::devices {

/**
 * @brief Opens a simulated interlock after a delay, on the engine's executor.
 *
 * Dry runs use it to rehearse a door opening mid-protocol. `cancel()` posts
 * the cancellation to the executor and waits for it, so it must not be called
 * from the executor thread. A pending drop never outlives the run.
 */
class InterlockDropTimer {
public:
    InterlockDropTimer(exec::asio::io_context& io, std::shared_ptr<safety::InterlockSignal> signal);
    ~InterlockDropTimer();

    InterlockDropTimer(const InterlockDropTimer&) = delete;
    InterlockDropTimer& operator=(const InterlockDropTimer&) = delete;

    void schedule(exec::Clock::duration delay, std::string reason);
    void cancel();

    bool fired() const { return fired_.load(); }

private:
    exec::asio::io_context& io_;
    std::shared_ptr<safety::InterlockSignal> signal_;
    exec::Timer timer_;
    std::atomic<bool> fired_{false};
    bool cancelled_ = false;
};

} // namespace photon::devices
