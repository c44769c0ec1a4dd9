#pragma once

#include "photon/safety/SafetySource.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace photon::safety {

/**
 * @class InterlockSignal
 * @brief In-process SafetySource: whoever owns the interlock inputs calls
 *        `setEnablePermitted()`, subscribers hear about transitions only.
 *
 * * Thread-safe (mutex-protected subscriber list).
 * * Callbacks run on the thread that changed the signal, outside the lock,
 *   so a callback may unsubscribe or read the signal without deadlocking.
 * * Repeating the current value is not a transition and notifies nobody.
 */
class InterlockSignal : public SafetySource {
public:
    explicit InterlockSignal(bool permitted = false, std::string reason = {});

    bool isEnablePermitted() const override;
    std::string statusText() const override;
    Subscription subscribe(EnableChangedCallback callback) override;

    /// Update the signal; @p reason is reported by statusText().
    void setEnablePermitted(bool permitted, std::string reason = {});

    std::size_t subscriberCount() const;

private:
    struct Slot {
        std::uint64_t id;
        std::shared_ptr<EnableChangedCallback> callback;
    };

    struct Shared {
        mutable std::mutex mtx;
        bool permitted = false;
        std::string reason;
        std::uint64_t nextId = 1;
        std::vector<Slot> slots;
    };

    // Subscriptions hold a weak reference so they may outlive the signal.
    std::shared_ptr<Shared> shared_;
};

} // namespace photon::safety
