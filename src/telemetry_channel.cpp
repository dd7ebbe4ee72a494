#include "telemetry_channel.hpp"
#include <exception>
#include <iostream>
#include <vector>

TelemetryChannel::TelemetryChannel() : next_id(1), delivering_thread(std::thread::id()) {}

TelemetryChannel::SubscriberId TelemetryChannel::subscribe(Callback callback) {
    std::lock_guard<std::mutex> lock(subscribers_mutex);
    SubscriberId id = next_id++;
    subscribers.emplace(id, std::move(callback));
    return id;
}

bool TelemetryChannel::unsubscribe(SubscriberId id) {
    bool removed = false;
    {
        std::lock_guard<std::mutex> lock(subscribers_mutex);
        removed = subscribers.erase(id) > 0;
    }

    // A subscriber unsubscribing from its own callback must not wait on itself.
    if (removed && delivering_thread.load() != std::this_thread::get_id()) {
        std::lock_guard<std::mutex> wait_for_delivery(delivery_mutex);
    }
    return removed;
}

bool TelemetryChannel::publish(const TelemetrySnapshot& snapshot) {
    std::lock_guard<std::mutex> delivery_lock(delivery_mutex);
    {
        std::lock_guard<std::mutex> lock(snapshot_mutex);
        if (last_snapshot && snapshot.sequence <= last_snapshot->sequence) {
            return false;
        }
        last_snapshot = snapshot;
    }

    // Callbacks run without the subscriber lock so they may (un)subscribe.
    std::vector<Callback> targets;
    {
        std::lock_guard<std::mutex> lock(subscribers_mutex);
        targets.reserve(subscribers.size());
        for (const auto& pair : subscribers) {
            targets.push_back(pair.second);
        }
    }

    delivering_thread = std::this_thread::get_id();
    for (const auto& callback : targets) {
        try {
            callback(snapshot);
        } catch (const std::exception& e) {
            std::cerr << "Telemetry subscriber failed on snapshot " << snapshot.sequence << ": "
                      << e.what() << std::endl;
        }
    }
    delivering_thread = std::thread::id();
    return true;
}

std::optional<TelemetrySnapshot> TelemetryChannel::latest() const {
    std::lock_guard<std::mutex> lock(snapshot_mutex);
    return last_snapshot;
}

size_t TelemetryChannel::subscriberCount() const {
    std::lock_guard<std::mutex> lock(subscribers_mutex);
    return subscribers.size();
}
