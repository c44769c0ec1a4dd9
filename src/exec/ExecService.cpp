#include "photon/exec/ExecService.hpp"
#include "photon/log/Log.hpp"

#include <future>

namespace photon::exec {

ExecService::ExecService(std::string name)
: name_(std::move(name))
, io_(std::make_shared<asio::io_context>())
, workGuard_(asio::make_work_guard(*io_))
, thread_([this] { run(); })
{}

ExecService::~ExecService() {
    workGuard_.reset();
    io_->stop();
    if (thread_.joinable()) thread_.join();
}

void ExecService::run() {
    logInfo("[ExecService] '", name_, "' executor running\n");
    io_->run();
    logInfo("[ExecService] '", name_, "' executor stopped\n");
}

std::shared_ptr<asio::io_context> shared_io_context() {
    static ExecService service("shared");
    return service.io();
}

void drain(asio::io_context& io) {
    std::promise<void> reached;
    auto done = reached.get_future();
    asio::post(io, [&reached] { reached.set_value(); });
    done.wait();
}

} // namespace photon::exec
