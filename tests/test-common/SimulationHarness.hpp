#pragma once

#include "core_state_machine.hpp"
#include "energy_model.hpp"
#include "network_config_store.hpp"
#include "scenario_catalog.hpp"
#include "simulation_controller.hpp"
#include "spin_core.hpp"
#include "telemetry_channel.hpp"

#include <memory>
#include <vector>

//-------------------------------------------------------------------------

// Wires the simulation the way main() does, minus the scheduler and the
// Modbus transport. Ticks are driven by hand through core->tick().
struct SimulationHarness
{
    explicit SimulationHarness(
        CoreParams coreParams = CoreParams{},
        std::vector<ScenarioDefinition> scenarios = ScenarioCatalog::defaultScenarios())
        : params{coreParams},
          model{params, ConduitParams{}},
          catalog{std::make_shared<const ScenarioCatalog>(std::move(scenarios))},
          core{std::make_shared<CoreStateMachine>(catalog, model)},
          network{std::make_shared<NetworkConfigStore>(model, ConduitParams{}.default_network)},
          channel{std::make_shared<TelemetryChannel>()},
          controller{std::make_shared<SimulationController>(
              core, network, catalog, channel, nullptr, model)}
    {}

    // Ticks with a fixed dt until the status matches or maxTicks is reached.
    TelemetrySnapshot tickUntil(CoreStatus status, double dt, int maxTicks = 10000)
    {
        TelemetrySnapshot snapshot = core->tick(dt);
        for (int i = 1; i < maxTicks && snapshot.status != status; ++i) {
            snapshot = core->tick(dt);
        }
        return snapshot;
    }

    CoreParams params;
    EnergyModel model;
    std::shared_ptr<const ScenarioCatalog> catalog;
    std::shared_ptr<CoreStateMachine> core;
    std::shared_ptr<NetworkConfigStore> network;
    std::shared_ptr<TelemetryChannel> channel;
    std::shared_ptr<SimulationController> controller;
};

//-------------------------------------------------------------------------
