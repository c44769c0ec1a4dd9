#pragma once
#include "photon/exec/ExecConfig.hpp"
#include <memory>
#include <string>
#include <thread>

namespace photon::exec {

/**
 * @brief The thread an execution engine lives on.
 *
 * An `engine::ExecutionEngine` does all of its run work as handlers on one
 * `io_context`: line and ramp timers, retry backoff, device commands, pause
 * and stop handling, and every `EngineCallbacks` observer. ExecService owns
 * that context and the single thread that runs it, so device handles see one
 * ordered command stream and observers are never called concurrently.
 *
 * Contract with the engine:
 * - Observer callbacks run on this thread. They must return promptly and must
 *   not call `execute()`, which refuses to run here.
 * - Engines post to the context until their destructor returns. Destroy every
 *   engine before the service it was constructed with.
 *
 * The destructor releases the work guard, stops the context and joins.
 */
class ExecService {
public:
    explicit ExecService(std::string name = "engine");
    ~ExecService();

    ExecService(const ExecService&) = delete;
    ExecService& operator=(const ExecService&) = delete;
    ExecService(ExecService&&) = delete;
    ExecService& operator=(ExecService&&) = delete;

    std::shared_ptr<asio::io_context> io() const { return io_; }

private:
    void run();

    std::string name_;
    std::shared_ptr<asio::io_context> io_;
    asio::executor_work_guard<asio::io_context::executor_type> workGuard_;
    std::thread thread_;
};

/// Service shared by engines constructed without an explicit io_context.
std::shared_ptr<asio::io_context> shared_io_context();

/// Blocks until every handler posted to @p io before the call has run.
/// Must not be called from the thread running @p io.
void drain(asio::io_context& io);

} // namespace photon::exec
