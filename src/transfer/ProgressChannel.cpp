#include "transfer/ProgressChannel.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <vector>

using namespace ib::transfer;
using namespace ib::log;

ProgressChannel::SubscriptionId ProgressChannel::subscribe(ProgressListener listener) {
    std::scoped_lock lock(mutex_);
    const auto id = nextId_++;
    listeners_.emplace(id, std::move(listener));
    return id;
}

void ProgressChannel::unsubscribe(const SubscriptionId id) {
    std::scoped_lock lock(mutex_);
    listeners_.erase(id);
}

void ProgressChannel::publish(const double fraction, const std::string& status) {
    std::scoped_lock delivery(delivery_);
    std::vector<ProgressListener> targets;
    double value;
    {
        std::scoped_lock lock(mutex_);
        current_ = std::max(current_, std::clamp(fraction, 0.0, 1.0));
        value = current_;
        targets.reserve(listeners_.size());
        for (const auto& [id, l] : listeners_) targets.push_back(l);
    }

    for (const auto& listener : targets) {
        try {
            listener(value, status);
        } catch (const std::exception& e) {
            Registry::transfer()->warn("[ProgressChannel] Listener threw: {}", e.what());
        }
    }
}

void ProgressChannel::reset() {
    std::scoped_lock lock(mutex_);
    current_ = 0.0;
}

double ProgressChannel::current() const {
    std::scoped_lock lock(mutex_);
    return current_;
}
