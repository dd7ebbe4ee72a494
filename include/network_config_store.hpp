#ifndef NETWORK_CONFIG_STORE_H
#define NETWORK_CONFIG_STORE_H

#include "spin_core.hpp"
#include "energy_model.hpp"
#include <cstdint>
#include <mutex>

/**
 * @class NetworkConfigStore
 * @brief Thread-safe holder of the conduit topology.
 *
 * Updates replace the whole NetworkConfig after validation; a rejected update
 * leaves the stored value untouched.
 */
class NetworkConfigStore {
public:
    /// @throw std::invalid_argument if the initial configuration is invalid.
    NetworkConfigStore(const EnergyModel& model, const NetworkConfig& initial);

    /**
     * @brief Validates and stores a new topology.
     * @return The derived capacity, or SimError::InvalidConfig.
     */
    Outcome<NetworkCapacity> update(uint32_t conduit_length_m, uint32_t num_conduits,
                                    uint32_t active_conduits);

    NetworkConfig current() const;
    NetworkCapacity capacity() const;

    static bool isValid(const NetworkConfig& config);

private:
    EnergyModel energy_model;
    mutable std::mutex config_mutex;
    NetworkConfig config;
    NetworkCapacity derived;
};

#endif // NETWORK_CONFIG_STORE_H
