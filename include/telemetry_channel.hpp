#ifndef TELEMETRY_CHANNEL_H
#define TELEMETRY_CHANNEL_H

#include "spin_core.hpp"
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <thread>

/**
 * @class TelemetryChannel
 * @brief Publish/subscribe fan-out of telemetry snapshots.
 *
 * Delivery is synchronous on the publishing thread and serialized across
 * publishers. A snapshot whose sequence number is not newer than the last one
 * delivered is dropped, so subscribers always see sequence numbers increase.
 * Only the most recent snapshot is retained.
 */
class TelemetryChannel {
public:
    using SubscriberId = uint64_t;
    using Callback = std::function<void(const TelemetrySnapshot&)>;

    TelemetryChannel();

    SubscriberId subscribe(Callback callback);

    /**
     * @brief Removes a subscriber.
     *
     * When called from any thread other than the one delivering, it returns
     * only after an in-flight delivery has finished, so the callback is not
     * running once this returns.
     * @return False if the id was not subscribed.
     */
    bool unsubscribe(SubscriberId id);

    /// @return False if the snapshot was stale and not delivered.
    bool publish(const TelemetrySnapshot& snapshot);

    std::optional<TelemetrySnapshot> latest() const;

    size_t subscriberCount() const;

private:
    mutable std::mutex subscribers_mutex;
    std::map<SubscriberId, Callback> subscribers;
    SubscriberId next_id;

    // Held for the whole delivery so publishers cannot interleave.
    std::mutex delivery_mutex;
    std::atomic<std::thread::id> delivering_thread;

    mutable std::mutex snapshot_mutex;
    std::optional<TelemetrySnapshot> last_snapshot;
};

#endif // TELEMETRY_CHANNEL_H
