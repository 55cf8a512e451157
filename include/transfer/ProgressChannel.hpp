#pragma once

#include <functional>
#include <map>
#include <mutex>
#include <string>

namespace ib::transfer {

using ProgressListener = std::function<void(double fraction, const std::string& status)>;

/**
 * Fan-out of progress events to any number of listeners.
 *
 * Fractions are clamped to [0, 1] and never move backwards within a run;
 * reset() starts a new run. Listeners may be called from worker threads, but
 * never concurrently, and must not publish from inside the callback.
 */
class ProgressChannel {
public:
    using SubscriptionId = size_t;

    SubscriptionId subscribe(ProgressListener listener);
    void unsubscribe(SubscriptionId id);

    void publish(double fraction, const std::string& status = "");
    void reset();

    [[nodiscard]] double current() const;

private:
    mutable std::mutex mutex_;
    std::mutex delivery_;      // keeps listeners seeing fractions in publish order
    std::map<SubscriptionId, ProgressListener> listeners_;
    SubscriptionId nextId_{1};
    double current_{0.0};
};

}
