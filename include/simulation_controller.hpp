#ifndef SIMULATION_CONTROLLER_H
#define SIMULATION_CONTROLLER_H

#include "spin_core.hpp"
#include "core_state_machine.hpp"
#include "energy_model.hpp"
#include "network_config_store.hpp"
#include "scenario_catalog.hpp"
#include "telemetry_channel.hpp"
#include "tick_scheduler.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

/// @brief Snapshot of everything a dashboard polls for.
struct SystemStatus {
    SimulationState state;
    std::optional<TelemetrySnapshot> telemetry;
    NetworkConfig network;
    NetworkCapacity capacity;
};

/**
 * @class SimulationController
 * @brief Command and query surface consumed by the presentation layer.
 *
 * Every command returns a structured result; nothing here throws. Accepted
 * commands wake the tick scheduler so their effect is published promptly.
 */
class SimulationController {
public:
    /**
     * @param scheduler May be null, e.g. when a test drives ticks by hand.
     */
    SimulationController(std::shared_ptr<CoreStateMachine> core,
                         std::shared_ptr<NetworkConfigStore> network,
                         std::shared_ptr<const ScenarioCatalog> catalog,
                         std::shared_ptr<TelemetryChannel> channel,
                         std::shared_ptr<TickScheduler> scheduler,
                         const EnergyModel& model);

    /// @return status "started", or UnknownScenario / AlreadyRunning.
    CommandResult start(const std::string& scenario_name, double duration_minutes);

    /// @return status "stopped", or NotRunning.
    CommandResult stop();

    /// @return status "emergency_stopped"; never fails.
    CommandResult emergencyStop();

    /// @return status "idle", or AlreadyRunning while a run is in progress.
    CommandResult reset();

    Outcome<NetworkCapacity> updateNetworkConfig(uint32_t conduit_length_m, uint32_t num_conduits,
                                                 uint32_t active_conduits);

    /// @brief Energy balance of every catalog entry, in catalog order.
    std::vector<std::pair<std::string, ScenarioEnergy>> getScenarios() const;

    SystemStatus getStatus() const;
    NetworkCapacity networkCapacity() const;

    TelemetryChannel::SubscriberId subscribe(TelemetryChannel::Callback callback);
    bool unsubscribe(TelemetryChannel::SubscriberId id);

    const ScenarioCatalog& scenarios() const { return *catalog; }

private:
    CommandResult finish(SimError error, const char* status);

    std::shared_ptr<CoreStateMachine> core;
    std::shared_ptr<NetworkConfigStore> network;
    std::shared_ptr<const ScenarioCatalog> catalog;
    std::shared_ptr<TelemetryChannel> channel;
    std::shared_ptr<TickScheduler> scheduler;
    EnergyModel energy_model;
};

#endif // SIMULATION_CONTROLLER_H
