#include "network_config_store.hpp"
#include <iostream>
#include <stdexcept>

NetworkConfigStore::NetworkConfigStore(const EnergyModel& model, const NetworkConfig& initial)
    : energy_model(model), config(initial), derived{} {
    auto capacity = energy_model.networkCapacity(initial);
    if (!isValid(initial) || !capacity.ok()) {
        throw std::invalid_argument("Invalid initial conduit network configuration");
    }
    derived = *capacity.value;
}

bool NetworkConfigStore::isValid(const NetworkConfig& candidate) {
    return candidate.conduit_length_m > 0 && candidate.num_conduits > 0 &&
           candidate.active_conduits >= 1 && candidate.active_conduits <= candidate.num_conduits;
}

Outcome<NetworkCapacity> NetworkConfigStore::update(uint32_t conduit_length_m, uint32_t num_conduits,
                                                    uint32_t active_conduits) {
    NetworkConfig candidate{conduit_length_m, num_conduits, active_conduits};
    if (!isValid(candidate)) {
        std::cerr << "Warning: rejected network config length=" << conduit_length_m
                  << " num=" << num_conduits << " active=" << active_conduits << std::endl;
        return Outcome<NetworkCapacity>::failure(SimError::InvalidConfig);
    }

    // Derived values are computed before taking the lock; the pair is swapped in together.
    auto capacity = energy_model.networkCapacity(candidate);
    if (!capacity.ok()) {
        return capacity;
    }

    std::lock_guard<std::mutex> lock(config_mutex);
    config = candidate;
    derived = *capacity.value;
    return capacity;
}

NetworkConfig NetworkConfigStore::current() const {
    std::lock_guard<std::mutex> lock(config_mutex);
    return config;
}

NetworkCapacity NetworkConfigStore::capacity() const {
    std::lock_guard<std::mutex> lock(config_mutex);
    return derived;
}
