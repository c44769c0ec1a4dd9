#include "photon/devices/CommandRecorder.hpp"
#include "photon/log/Log.hpp"

namespace photon::devices {

CommandRecorder::CommandRecorder(std::string deviceName)
: deviceName_(std::move(deviceName))
{}

bool CommandRecorder::record(const char* name, double value) {
    bool accepted = true;
    {
        std::lock_guard lock(mtx_);
        auto it = failures_.find(name);
        if (it != failures_.end() && it->second != 0) {
            accepted = false;
            if (it->second > 0) {
                --it->second;
            }
        }
        commands_.push_back({name, value, exec::Clock::now(), accepted});
    }
    if (!accepted) {
        logWarning("[", deviceName_, "] ", name, "(", value, ") rejected (injected failure)\n");
    }
    return accepted;
}

std::vector<DeviceCommand> CommandRecorder::commands() const {
    std::lock_guard lock(mtx_);
    return commands_;
}

std::vector<DeviceCommand> CommandRecorder::commands(const std::string& name) const {
    std::lock_guard lock(mtx_);
    std::vector<DeviceCommand> matching;
    for (const auto& command : commands_) {
        if (command.name == name) {
            matching.push_back(command);
        }
    }
    return matching;
}

std::size_t CommandRecorder::count(const std::string& name) const {
    return commands(name).size();
}

void CommandRecorder::failCommand(const std::string& name, int times) {
    std::lock_guard lock(mtx_);
    failures_[name] = times;
}

} // namespace photon::devices
