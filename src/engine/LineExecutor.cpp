#include "photon/engine/LineExecutor.hpp"
#include "photon/log/Log.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <iomanip>
#include <sstream>

namespace photon::engine {

using core::Error;
using core::ErrorCode;
using exec::Clock;

namespace {

template <class... Ts> struct Overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

std::string fixed(double value, int digits = 1) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(digits) << value;
    return oss.str();
}

Clock::duration toDuration(double seconds) {
    return std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(seconds));
}

} // namespace

Error interruptionError(const std::error_code& reason) {
    if (reason == ErrorCode::UserStopped) {
        return Error{reason, "Execution stopped by user"};
    }
    if (reason == ErrorCode::SafetyStopped) {
        return Error{reason, "Execution stopped by safety interlock"};
    }
    if (reason == ErrorCode::LineTimeout) {
        return Error{reason, "Line timed out"};
    }
    return Error{reason, "Cancelled after sibling failure"};
}

// Waits -------------------------------------------------------------------------

/// Waits @p total in @p tick slices, checking for cancellation between slices.
/// A pausable wait parks on the gate and does not count paused time.
class LineExecutor::TickedWait : public std::enable_shared_from_this<TickedWait> {
public:
    TickedWait(ScopePtr scope, Clock::duration total, Clock::duration tick, bool pausable, Done done)
    : scope_(std::move(scope))
    , remaining_(total)
    , tick_(tick)
    , pausable_(pausable)
    , done_(std::move(done))
    {}

    void start() { next(); }

private:
    void next() {
        if (auto reason = scope_->interruption()) {
            done_(interruptionError(reason));
            return;
        }
        auto self = shared_from_this();
        if (pausable_ && scope_->paused()) {
            scope_->waitUntilOpen([self] { self->next(); });
            return;
        }
        if (remaining_ <= Clock::duration::zero()) {
            done_(Error{});
            return;
        }
        const auto slice = std::min(tick_, remaining_);
        scope_->sleep(slice, [self, slice] {
            self->remaining_ -= slice;
            self->next();
        });
    }

    ScopePtr scope_;
    Clock::duration remaining_;
    Clock::duration tick_;
    bool pausable_;
    Done done_;
};

// Ramp --------------------------------------------------------------------------

/// Issues n+1 power commands at k/n of the way from start to end, n >= 1,
/// so the last command is exactly the end power.
class LineExecutor::RampTask : public std::enable_shared_from_this<RampTask> {
public:
    RampTask(LineExecutor& owner, protocol::PowerRamp ramp, ScopePtr scope, Done done)
    : owner_(owner)
    , ramp_(ramp)
    , scope_(std::move(scope))
    , done_(std::move(done))
    {
        const double updates = std::floor(ramp_.durationS * owner_.config_.rampUpdateRateHz);
        steps_ = std::max(1, static_cast<int>(updates));
        interval_ = toDuration(ramp_.durationS / steps_);
    }

    void start() {
        logInfo("[LineExecutor] ramp ", fixed(ramp_.startWatts, 2), "W -> ",
                fixed(ramp_.endWatts, 2), "W over ", fixed(ramp_.durationS), "s (",
                steps_ + 1, " commands)\n");
        next();
    }

private:
    void next() {
        if (auto reason = scope_->interruption()) {
            done_(interruptionError(reason));
            return;
        }
        auto self = shared_from_this();
        if (scope_->paused()) {
            scope_->waitUntilOpen([self] { self->next(); });
            return;
        }
        const double fraction = static_cast<double>(step_) / steps_;
        const double watts = ramp_.startWatts + (ramp_.endWatts - ramp_.startWatts) * fraction;
        const double milliamps = watts * owner_.config_.milliampsPerWatt;
        auto laser = owner_.laser_;
        owner_.invoke(scope_, "set laser power to " + fixed(watts, 3) + "W",
                      [laser, milliamps] { return laser->setCurrent(milliamps); },
                      [self](const Error& error) { self->afterCommand(error); });
    }

    void afterCommand(const Error& error) {
        if (error) {
            done_(error);
            return;
        }
        if (step_ >= steps_) {
            done_(Error{});
            return;
        }
        ++step_;
        auto self = shared_from_this();
        scope_->sleep(interval_, [self] { self->next(); });
    }

    LineExecutor& owner_;
    protocol::PowerRamp ramp_;
    ScopePtr scope_;
    Done done_;
    int steps_ = 1;
    int step_ = 0;
    Clock::duration interval_{};
};

// Join --------------------------------------------------------------------------

struct LineExecutor::Join {
    ScopePtr runScope;
    ScopePtr scope;
    std::shared_ptr<exec::Deadline> deadline;
    int lineNumber = 0;
    int pending = 0;
    Error first;
    Done done;
};

LineExecutor::LineExecutor(exec::asio::io_context& io,
                           std::shared_ptr<core::ActuatorHandle> actuator,
                           std::shared_ptr<core::LaserHandle> laser,
                           const EngineConfig& config)
: io_(io)
, actuator_(std::move(actuator))
, laser_(std::move(laser))
, config_(config)
{}

void LineExecutor::run(const protocol::ProtocolLine& line, const ScopePtr& runScope, Done done) {
    auto join = std::make_shared<Join>();
    join->runScope = runScope;
    join->scope = runScope->child();
    join->lineNumber = line.lineNumber;
    join->done = std::move(done);

    std::weak_ptr<exec::CancelScope> weakScope = join->scope;
    join->deadline = std::make_shared<exec::Deadline>(io_, config_.lineTimeout, [weakScope] {
        if (auto scope = weakScope.lock()) {
            scope->cancel(make_error_code(ErrorCode::LineTimeout));
        }
    });
    deadline_ = join->deadline;
    deadline_->arm();
    if (join->scope->paused()) {
        deadline_->suspend();
    }

    // One token for the launcher so a task finishing synchronously cannot
    // complete the line before its siblings are started.
    join->pending = 1;
    auto arriveFn = [this, join](const Error& error) { arrive(join, error); };

    if (line.movement) {
        ++join->pending;
        runMovement(*line.movement, join->scope, arriveFn);
    }
    if (line.laser) {
        ++join->pending;
        runLaser(*line.laser, join->scope, arriveFn);
    }
    if (line.dwell) {
        ++join->pending;
        runDwell(*line.dwell, join->scope, arriveFn);
    }
    arrive(join, Error{});
}

void LineExecutor::arrive(const std::shared_ptr<Join>& join, const Error& error) {
    if (error && !join->first) {
        join->first = error;
        join->scope->cancel(error.code);
    }
    if (--join->pending > 0) {
        return;
    }

    join->deadline->cancel();
    if (deadline_ == join->deadline) {
        deadline_.reset();
    }

    Error result = join->first;
    if (auto reason = join->runScope->interruption()) {
        result = interruptionError(reason);
    } else if (join->deadline->expired()) {
        const double budget = std::chrono::duration<double>(join->deadline->budget()).count();
        result = Error{ErrorCode::LineTimeout,
                       "Line " + std::to_string(join->lineNumber) + " timed out after " +
                           fixed(budget) + "s"};
    }

    auto done = std::move(join->done);
    join->done = nullptr;
    if (done) {
        done(result);
    }
}

void LineExecutor::suspendDeadline() {
    if (deadline_) {
        deadline_->suspend();
    }
}

void LineExecutor::resumeDeadline() {
    if (deadline_) {
        deadline_->resume();
    }
}

// Tasks -------------------------------------------------------------------------

void LineExecutor::runMovement(const protocol::MoveAction& move, const ScopePtr& scope, Done done) {
    const double speed = protocol::speedOf(move);
    const double start = positionMm_;
    const double target = protocol::targetOf(move, start);
    const auto travel = toDuration(std::abs(target - start) / speed);
    const auto tick = Clock::duration(config_.waitTick);
    auto actuator = actuator_;

    invoke(scope, "set actuator speed to " + fixed(speed, 2) + "mm/s",
           [actuator, speed] { return actuator->setSpeed(speed); },
           [this, scope, actuator, target, travel, tick, done](const Error& error) {
               if (error) {
                   done(error);
                   return;
               }
               invoke(scope, "move actuator to " + fixed(target, 3) + "mm",
                      [actuator, target] { return actuator->setPosition(target); },
                      [this, scope, target, travel, tick, done](const Error& moveError) {
                          if (moveError) {
                              done(moveError);
                              return;
                          }
                          positionMm_ = target;
                          // The actuator keeps travelling while the engine is paused.
                          std::make_shared<TickedWait>(scope, travel, tick, false, done)->start();
                      });
           });
}

void LineExecutor::runLaser(const protocol::LaserAction& laser, const ScopePtr& scope, Done done) {
    std::visit(Overloaded{
        [&](const protocol::SetPower& set) {
            const double milliamps = set.watts * config_.milliampsPerWatt;
            const auto settle = Clock::duration(config_.laserSettleDelay);
            auto handle = laser_;
            invoke(scope, "set laser power to " + fixed(set.watts, 3) + "W",
                   [handle, milliamps] { return handle->setCurrent(milliamps); },
                   [scope, settle, done](const Error& error) {
                       if (error) {
                           done(error);
                           return;
                       }
                       scope->sleep(settle, [scope, done] {
                           if (auto reason = scope->interruption()) {
                               done(interruptionError(reason));
                           } else {
                               done(Error{});
                           }
                       });
                   });
        },
        [&](const protocol::PowerRamp& ramp) {
            std::make_shared<RampTask>(*this, ramp, scope, std::move(done))->start();
        }
    }, laser);
}

void LineExecutor::runDwell(const protocol::Dwell& dwell, const ScopePtr& scope, Done done) {
    std::make_shared<TickedWait>(scope, toDuration(dwell.durationS),
                                 Clock::duration(config_.waitTick), true, std::move(done))
        ->start();
}

// Retry -------------------------------------------------------------------------

void LineExecutor::invoke(const ScopePtr& scope, std::string what, std::function<bool()> command,
                          Done done, int attempt) {
    if (auto reason = scope->interruption()) {
        done(interruptionError(reason));
        return;
    }

    bool ok = false;
    std::string detail;
    try {
        ok = command();
    } catch (const std::exception& e) {
        detail = e.what();
    } catch (...) {
        detail = "unknown exception";
    }
    if (ok) {
        done(Error{});
        return;
    }

    if (attempt >= config_.maxAttempts) {
        logError("[LineExecutor] failed to ", what, " after ", attempt, " attempt(s)",
                 detail.empty() ? "" : ": ", detail, "\n");
        done(Error{ErrorCode::HardwareCommandFailed,
                   "Failed to " + what + (detail.empty() ? "" : ": " + detail)});
        return;
    }

    logWarning("[LineExecutor] attempt ", attempt, "/", config_.maxAttempts, " to ", what,
               " failed", detail.empty() ? "" : ": ", detail, "; retrying in ",
               config_.retryDelay.count(), "ms\n");
    scope->sleep(config_.retryDelay,
                 [this, scope, what = std::move(what), command = std::move(command),
                  done = std::move(done), attempt]() mutable {
                     invoke(scope, std::move(what), std::move(command), std::move(done), attempt + 1);
                 });
}

} // namespace photon::engine
