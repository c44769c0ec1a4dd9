#include "photon/safety/InterlockSignal.hpp"
#include "photon/log/Log.hpp"

#include <algorithm>

namespace photon::safety {

InterlockSignal::InterlockSignal(bool permitted, std::string reason)
: shared_(std::make_shared<Shared>())
{
    shared_->permitted = permitted;
    shared_->reason = std::move(reason);
}

bool InterlockSignal::isEnablePermitted() const {
    std::lock_guard lock(shared_->mtx);
    return shared_->permitted;
}

std::string InterlockSignal::statusText() const {
    std::lock_guard lock(shared_->mtx);
    std::string text = shared_->permitted ? "Laser enable permitted" : "Laser enable not permitted";
    if (!shared_->reason.empty()) {
        text += " (" + shared_->reason + ")";
    }
    return text;
}

Subscription InterlockSignal::subscribe(EnableChangedCallback callback) {
    std::uint64_t id = 0;
    {
        std::lock_guard lock(shared_->mtx);
        id = shared_->nextId++;
        shared_->slots.push_back({id, std::make_shared<EnableChangedCallback>(std::move(callback))});
    }

    std::weak_ptr<Shared> weak = shared_;
    return Subscription([weak, id] {
        auto shared = weak.lock();
        if (!shared) {
            return;
        }
        std::lock_guard lock(shared->mtx);
        auto& slots = shared->slots;
        slots.erase(std::remove_if(slots.begin(), slots.end(),
                                   [id](const Slot& s) { return s.id == id; }),
                    slots.end());
    });
}

void InterlockSignal::setEnablePermitted(bool permitted, std::string reason) {
    std::vector<std::shared_ptr<EnableChangedCallback>> targets;
    {
        std::lock_guard lock(shared_->mtx);
        shared_->reason = std::move(reason);
        if (shared_->permitted == permitted) {
            return;
        }
        shared_->permitted = permitted;
        targets.reserve(shared_->slots.size());
        for (const auto& slot : shared_->slots) {
            targets.push_back(slot.callback);
        }
    }

    logInfo("[InterlockSignal] laser enable ", permitted ? "PERMITTED" : "DENIED",
            " (", targets.size(), " subscriber(s))\n");

    for (const auto& callback : targets) {
        if (callback && *callback) {
            (*callback)(permitted);
        }
    }
}

std::size_t InterlockSignal::subscriberCount() const {
    std::lock_guard lock(shared_->mtx);
    return shared_->slots.size();
}

} // namespace photon::safety
