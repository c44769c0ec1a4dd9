#pragma once

#include <string>
#include <system_error>

namespace photon::core {

/**
 * @brief Failure kinds surfaced by the execution core.
 *
 * Values are stable; they appear in execution records and logs.
 */
enum class ErrorCode {
    ValidationFailed = 1,   ///< protocol or line violates its safety limits
    SafetyGateDenied,       ///< pre-flight laser-enable check refused
    HardwareCommandFailed,  ///< a device handle call failed after all retries
    LineTimeout,            ///< a line exceeded its execution budget
    UserStopped,            ///< stop() was requested by the operator
    SafetyStopped,          ///< the interlock revoked laser enable mid-run
    WireFormatInvalid,      ///< protocol document could not be decoded
    ConfigInvalid,          ///< configuration document could not be decoded
    EngineBusy              ///< execute() called while a run is active
};

const std::error_category& errorCategory() noexcept;

std::error_code make_error_code(ErrorCode code) noexcept;

/// True for the cooperative-cancellation kinds that always abort the whole run.
bool isStop(const std::error_code& code) noexcept;

/**
 * @brief An error code together with the message shown to the operator.
 */
struct Error {
    std::error_code code;
    std::string message;

    Error() = default;
    Error(std::error_code c, std::string m)
    : code(c), message(std::move(m)) {}
    Error(ErrorCode c, std::string m)
    : code(make_error_code(c)), message(std::move(m)) {}

    explicit operator bool() const { return static_cast<bool>(code); }
};

} // namespace photon::core

namespace std {
template <>
struct is_error_code_enum<photon::core::ErrorCode> : true_type {};
} // namespace std
