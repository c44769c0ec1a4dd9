#include "photon/devices/SimulatedDevices.hpp"

namespace photon::devices {

SimulatedActuator::SimulatedActuator()
: CommandRecorder("SimulatedActuator")
{}

bool SimulatedActuator::setSpeed(double mmPerSecond) {
    if (!record("setSpeed", mmPerSecond)) {
        return false;
    }
    speed_.store(mmPerSecond);
    return true;
}

bool SimulatedActuator::setPosition(double positionMm) {
    if (!record("setPosition", positionMm)) {
        return false;
    }
    position_.store(positionMm);
    return true;
}

SimulatedLaser::SimulatedLaser()
: CommandRecorder("SimulatedLaser")
{}

bool SimulatedLaser::setCurrent(double milliamps) {
    if (!record("setCurrent", milliamps)) {
        return false;
    }
    current_.store(milliamps);
    return true;
}

bool SimulatedLaser::setOutput(bool enabled) {
    if (!record("setOutput", enabled ? 1.0 : 0.0)) {
        return false;
    }
    output_.store(enabled);
    return true;
}

} // namespace photon::devices
