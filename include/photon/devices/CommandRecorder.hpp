#pragma once

#include "photon/exec/ExecConfig.hpp"

#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace photon::devices {

struct DeviceCommand {
    std::string name;           ///< handle method, e.g. "setPosition"
    double value = 0.0;         ///< argument; setOutput records 1 / 0
    exec::Clock::time_point at{};
    bool accepted = true;
};

/**
 * @brief Command log and failure injection shared by the simulated devices.
 *
 * Thread-safe: commands arrive on the engine's executor while tests inspect
 * the log from their own thread.
 */
class CommandRecorder {
public:
    std::vector<DeviceCommand> commands() const;
    std::vector<DeviceCommand> commands(const std::string& name) const;
    std::size_t count(const std::string& name) const;

    /// Reject the next @p times calls of @p name; a negative count rejects every call.
    void failCommand(const std::string& name, int times = -1);

protected:
    explicit CommandRecorder(std::string deviceName);

    /// Log the call and return whether the device accepts it.
    bool record(const char* name, double value);

private:
    std::string deviceName_;
    mutable std::mutex mtx_;
    std::vector<DeviceCommand> commands_;
    std::map<std::string, int> failures_;
};

} // namespace photon::devices
