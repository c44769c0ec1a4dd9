#pragma once

#include "photon/core/Expected.hpp"
#include "photon/safety/SafetySource.hpp"

#include <functional>
#include <memory>
#include <mutex>

namespace photon::engine {

/**
 * @brief Connects an ExecutionEngine to its SafetySource.
 *
 * Holds the engine's single subscription and performs the pre-flight check.
 * Transitions are relayed to @p onChange from whatever thread the source
 * notifies on; after `detach()` returns no further relay happens, even if
 * the source is concurrently mid-notification.
 *
 * A null source disables both halves (bench testing without interlocks).
 */
class SafetyInterlockBridge {
public:
    using ChangeHandler = std::function<void(bool enabled)>;

    SafetyInterlockBridge(std::shared_ptr<safety::SafetySource> source, ChangeHandler onChange);
    ~SafetyInterlockBridge();

    SafetyInterlockBridge(const SafetyInterlockBridge&) = delete;
    SafetyInterlockBridge& operator=(const SafetyInterlockBridge&) = delete;

    /// SafetyGateDenied (carrying the source's status text) when enable is not permitted.
    expected<void> preflight() const;

    void detach();

private:
    struct Relay {
        std::mutex mtx;
        ChangeHandler handler;
    };

    std::shared_ptr<safety::SafetySource> source_;
    std::shared_ptr<Relay> relay_;
    safety::Subscription subscription_;
};

} // namespace photon::engine
