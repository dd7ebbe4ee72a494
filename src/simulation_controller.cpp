#include "simulation_controller.hpp"
#include <iostream>

SimulationController::SimulationController(std::shared_ptr<CoreStateMachine> core_machine,
                                           std::shared_ptr<NetworkConfigStore> network_store,
                                           std::shared_ptr<const ScenarioCatalog> scenario_catalog,
                                           std::shared_ptr<TelemetryChannel> telemetry,
                                           std::shared_ptr<TickScheduler> tick_scheduler,
                                           const EnergyModel& model)
    : core(std::move(core_machine)), network(std::move(network_store)),
      catalog(std::move(scenario_catalog)), channel(std::move(telemetry)),
      scheduler(std::move(tick_scheduler)), energy_model(model) {}

CommandResult SimulationController::finish(SimError error, const char* status) {
    if (error != SimError::None) {
        std::cerr << "Command rejected: " << toString(error) << std::endl;
        return CommandResult{error, ""};
    }
    if (scheduler) {
        scheduler->wake();
    }
    return CommandResult{SimError::None, status};
}

CommandResult SimulationController::start(const std::string& scenario_name, double duration_minutes) {
    return finish(core->start(scenario_name, duration_minutes), "started");
}

CommandResult SimulationController::stop() {
    return finish(core->stop(), "stopped");
}

CommandResult SimulationController::emergencyStop() {
    core->emergencyStop();
    return finish(SimError::None, "emergency_stopped");
}

CommandResult SimulationController::reset() {
    return finish(core->reset(), "idle");
}

Outcome<NetworkCapacity> SimulationController::updateNetworkConfig(uint32_t conduit_length_m,
                                                                   uint32_t num_conduits,
                                                                   uint32_t active_conduits) {
    auto result = network->update(conduit_length_m, num_conduits, active_conduits);
    if (result.ok()) {
        std::cout << "Network config: " << num_conduits << " conduits (" << active_conduits
                  << " active) x " << conduit_length_m << " m, capacity "
                  << result.value->total_capacity_gwh << " GWh" << std::endl;
    }
    return result;
}

std::vector<std::pair<std::string, ScenarioEnergy>> SimulationController::getScenarios() const {
    std::vector<std::pair<std::string, ScenarioEnergy>> result;
    result.reserve(catalog->size());
    for (const auto& scenario : catalog->entries()) {
        result.emplace_back(scenario.name, energy_model.scenarioEnergy(scenario));
    }
    return result;
}

SystemStatus SimulationController::getStatus() const {
    return SystemStatus{core->state(), channel->latest(), network->current(), network->capacity()};
}

NetworkCapacity SimulationController::networkCapacity() const {
    return network->capacity();
}

TelemetryChannel::SubscriberId SimulationController::subscribe(TelemetryChannel::Callback callback) {
    return channel->subscribe(std::move(callback));
}

bool SimulationController::unsubscribe(TelemetryChannel::SubscriberId id) {
    return channel->unsubscribe(id);
}
