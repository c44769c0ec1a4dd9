#pragma once

namespace photon::core {

/**
 * @brief Capability handle for the linear actuator.
 *
 * Both calls return as soon as the command has been issued; the engine
 * computes and awaits the expected travel time itself. A `false` return (or a
 * thrown std::exception) is treated as a recoverable command failure.
 */
class ActuatorHandle {
public:
    virtual ~ActuatorHandle() = default;

    /// @param mmPerSecond Travel speed for subsequent moves.
    virtual bool setSpeed(double mmPerSecond) = 0;

    /// @param positionMm Absolute target position.
    virtual bool setPosition(double positionMm) = 0;
};

/**
 * @brief Capability handle for the laser diode driver.
 */
class LaserHandle {
public:
    virtual ~LaserHandle() = default;

    virtual bool setCurrent(double milliamps) = 0;
    virtual bool setOutput(bool enabled) = 0;
};

} // namespace photon::core
