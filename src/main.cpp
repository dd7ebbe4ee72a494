#include "spin_core.hpp"
#include "config_loader.hpp"
#include "core_state_machine.hpp"
#include "energy_model.hpp"
#include "modbus_server.hpp"
#include "network_config_store.hpp"
#include "register_bridge.hpp"
#include "safe_data_model.hpp"
#include "scenario_catalog.hpp"
#include "simulation_controller.hpp"
#include "telemetry_channel.hpp"
#include "tick_scheduler.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>

namespace {
std::atomic<bool> g_shutdown_requested{false};
}

/**
 * @brief Signal handler for graceful shutdown (e.g., on Ctrl+C).
 * @param signum The signal number received.
 */
void signal_handler(int signum) {
    (void)signum;
    g_shutdown_requested = true;
}

int main(int argc, char* argv[]) {
    // --- 1. Load Configuration ---
    std::string config_file = "spin_core_profile.yaml";
    if (argc > 1) {
        config_file = argv[1];
    }
    std::cout << "Loading configuration from: " << config_file << std::endl;

    Config config;
    try {
        config = ConfigLoader::loadConfig(config_file);
    } catch (const std::exception& e) {
        std::cerr << "Error loading configuration: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "Configuration loaded successfully." << std::endl;
    std::cout << "Core: " << config.core.peak_power_gw << " GW @ " << config.core.max_rpm << " RPM, "
              << config.scenarios.size() << " scenarios" << std::endl;

    // --- 2. Build the simulation state ---
    EnergyModel energy_model(config.core, config.conduits);
    auto catalog = std::make_shared<const ScenarioCatalog>(config.scenarios);
    auto core = std::make_shared<CoreStateMachine>(catalog, energy_model);
    auto network = std::make_shared<NetworkConfigStore>(energy_model, config.conduits.default_network);
    auto channel = std::make_shared<TelemetryChannel>();
    auto scheduler = std::make_shared<TickScheduler>(core, channel, config.tick_interval_ms);
    auto controller =
        std::make_shared<SimulationController>(core, network, catalog, channel, scheduler, energy_model);

    for (const auto& entry : controller->getScenarios()) {
        std::cout << "  " << entry.first << ": " << entry.second.daily_energy_gwh << " GWh/day, net "
                  << entry.second.net_energy_gwh << " GWh, efficiency " << entry.second.efficiency_ratio
                  << std::endl;
    }

    // --- 3. Initialize Register Model ---
    auto shared_data_model = std::make_shared<SafeDataModel>();
    shared_data_model->initialize(plantRegisters());
    auto bridge = std::make_shared<RegisterBridge>(shared_data_model, controller);
    bridge->attach();
    std::cout << "Register model initialized." << std::endl;

    // --- 4. Start Tick Scheduler ---
    scheduler->start();
    scheduler->wake();
    std::cout << "Tick scheduler started (" << config.tick_interval_ms << " ms)." << std::endl;

    // --- 5. Initialize and Start Modbus Server ---
    ModbusServer modbus_server(shared_data_model, bridge, config.server.unit_id);
    if (!modbus_server.start(config.server.port)) {
        std::cerr << "Failed to start Modbus server." << std::endl;
        scheduler->stop();
        return 1;
    }
    std::cout << "Modbus TCP server started on port " << config.server.port << "." << std::endl;

    // --- 6. Set up Signal Handler and Wait ---
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::cout << "\nSpin-core simulator is running. Press Ctrl+C to exit." << std::endl;

    while (!g_shutdown_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cout << "\nShutting down gracefully..." << std::endl;
    modbus_server.stop();
    scheduler->stop();
    bridge->detach();
    return 0;
}
