#pragma once

#include <functional>
#include <string>

namespace photon::safety {

/// Receives the new "laser enable permitted" value on every transition.
using EnableChangedCallback = std::function<void(bool enabled)>;

/**
 * @brief RAII handle for one registration with a SafetySource.
 *
 * Destroying (or resetting) the handle unregisters the callback. Move-only.
 */
class Subscription {
public:
    Subscription() = default;
    explicit Subscription(std::function<void()> unsubscribe)
    : unsubscribe_(std::move(unsubscribe)) {}

    ~Subscription() { reset(); }

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    Subscription(Subscription&& other) noexcept
    : unsubscribe_(std::move(other.unsubscribe_)) {
        other.unsubscribe_ = nullptr;
    }

    Subscription& operator=(Subscription&& other) noexcept {
        if (this != &other) {
            reset();
            unsubscribe_ = std::move(other.unsubscribe_);
            other.unsubscribe_ = nullptr;
        }
        return *this;
    }

    void reset() {
        if (unsubscribe_) {
            auto fn = std::move(unsubscribe_);
            unsubscribe_ = nullptr;
            fn();
        }
    }

    bool active() const { return static_cast<bool>(unsubscribe_); }

private:
    std::function<void()> unsubscribe_;
};

/**
 * @brief External authority on whether laser output is currently permitted.
 *
 * Typically backed by the instrument's safety manager (GPIO interlocks,
 * session validity, power-limit monitor). Notifications may arrive on any
 * thread.
 */
class SafetySource {
public:
    virtual ~SafetySource() = default;

    /// Polled once before a run starts.
    virtual bool isEnablePermitted() const = 0;

    /// Human-readable reason shown when the pre-flight check refuses a run.
    virtual std::string statusText() const {
        return isEnablePermitted() ? "Laser enable permitted" : "Laser enable not permitted";
    }

    /// Register for pushed enable transitions.
    virtual Subscription subscribe(EnableChangedCallback callback) = 0;
};

} // namespace photon::safety
