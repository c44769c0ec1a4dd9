#pragma once

#include "photon/core/DeviceHandles.hpp"
#include "photon/devices/CommandRecorder.hpp"

#include <atomic>

namespace photon::devices {

/**
 * @brief Actuator stand-in: accepts commands instantly and tracks the
 * commanded speed and position. Used by the runner's dry-run mode and tests.
 */
class SimulatedActuator : public core::ActuatorHandle, public CommandRecorder {
public:
    SimulatedActuator();

    bool setSpeed(double mmPerSecond) override;
    bool setPosition(double positionMm) override;

    double speed() const { return speed_.load(); }
    double position() const { return position_.load(); }

private:
    std::atomic<double> speed_{0.0};
    std::atomic<double> position_{0.0};
};

/**
 * @brief Laser stand-in tracking drive current and output enable.
 */
class SimulatedLaser : public core::LaserHandle, public CommandRecorder {
public:
    SimulatedLaser();

    bool setCurrent(double milliamps) override;
    bool setOutput(bool enabled) override;

    double current() const { return current_.load(); }
    bool outputEnabled() const { return output_.load(); }

private:
    std::atomic<double> current_{0.0};
    std::atomic<bool> output_{false};
};

} // namespace photon::devices
