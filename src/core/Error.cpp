#include "photon/core/Error.hpp"

namespace photon::core {

namespace {

class PhotonErrorCategory : public std::error_category {
public:
    const char* name() const noexcept override {
        return "photon";
    }

    std::string message(int value) const override {
        switch (static_cast<ErrorCode>(value)) {
            case ErrorCode::ValidationFailed:      return "protocol validation failed";
            case ErrorCode::SafetyGateDenied:      return "laser enable not permitted";
            case ErrorCode::HardwareCommandFailed: return "hardware command failed";
            case ErrorCode::LineTimeout:           return "line timed out";
            case ErrorCode::UserStopped:           return "execution stopped by user";
            case ErrorCode::SafetyStopped:         return "execution stopped by safety interlock";
            case ErrorCode::WireFormatInvalid:     return "invalid protocol document";
            case ErrorCode::ConfigInvalid:         return "invalid configuration";
            case ErrorCode::EngineBusy:            return "a protocol is already executing";
        }
        return "unknown photon error";
    }
};

} // namespace

const std::error_category& errorCategory() noexcept {
    static const PhotonErrorCategory category;
    return category;
}

std::error_code make_error_code(ErrorCode code) noexcept {
    return {static_cast<int>(code), errorCategory()};
}

bool isStop(const std::error_code& code) noexcept {
    return code == ErrorCode::UserStopped || code == ErrorCode::SafetyStopped;
}

} // namespace photon::core
