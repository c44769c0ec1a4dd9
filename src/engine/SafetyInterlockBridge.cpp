#include "photon/engine/SafetyInterlockBridge.hpp"
#include "photon/log/Log.hpp"

namespace photon::engine {

SafetyInterlockBridge::SafetyInterlockBridge(std::shared_ptr<safety::SafetySource> source,
                                             ChangeHandler onChange)
: source_(std::move(source))
, relay_(std::make_shared<Relay>())
{
    relay_->handler = std::move(onChange);
    if (!source_) {
        logWarning("[SafetyInterlockBridge] no safety source configured; interlock monitoring disabled\n");
        return;
    }

    std::weak_ptr<Relay> weak = relay_;
    subscription_ = source_->subscribe([weak](bool enabled) {
        auto relay = weak.lock();
        if (!relay) {
            return;
        }
        std::lock_guard lock(relay->mtx);
        if (relay->handler) {
            relay->handler(enabled);
        }
    });
}

SafetyInterlockBridge::~SafetyInterlockBridge() {
    detach();
}

expected<void> SafetyInterlockBridge::preflight() const {
    if (!source_) {
        logWarning("[SafetyInterlockBridge] no safety source - skipping pre-flight check (testing mode)\n");
        return {};
    }
    if (source_->isEnablePermitted()) {
        return {};
    }
    const std::string status = source_->statusText();
    logError("[SafetyInterlockBridge] pre-flight check refused: ", status, "\n");
    return unexpected(core::Error{core::ErrorCode::SafetyGateDenied,
                                  "Safety check failed: " + status});
}

void SafetyInterlockBridge::detach() {
    {
        std::lock_guard lock(relay_->mtx);
        relay_->handler = nullptr;
    }
    subscription_.reset();
}

} // namespace photon::engine
