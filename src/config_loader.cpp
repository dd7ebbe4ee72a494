#include "config_loader.hpp"
#include "scenario_catalog.hpp"
#include <yaml-cpp/yaml.h>
#include <stdexcept>

namespace {

// Overwrites target only when the key is present.
template <typename T>
void readOptional(const YAML::Node& parent, const char* key, T& target) {
    if (parent && parent[key]) {
        target = parent[key].as<T>();
    }
}

void requirePositive(double value, const std::string& name) {
    if (!(value > 0.0)) {
        throw std::runtime_error("Configuration value must be positive: " + name);
    }
}

Config fromNode(const YAML::Node& root) {
    Config config;
    config.scenarios = ScenarioCatalog::defaultScenarios();

    // Server endpoint
    const auto& server_node = root["server"];
    readOptional(server_node, "unit_id", config.server.unit_id);
    readOptional(server_node, "port", config.server.port);

    // Core constants
    const auto& core_node = root["core"];
    readOptional(core_node, "max_rpm", config.core.max_rpm);
    readOptional(core_node, "peak_power_gw", config.core.peak_power_gw);
    readOptional(core_node, "core_mass_kg", config.core.core_mass_kg);
    readOptional(core_node, "core_radius_m", config.core.core_radius_m);
    readOptional(core_node, "startup_energy_gj", config.core.startup_energy_gj);
    readOptional(core_node, "acceleration_rpm_per_s", config.core.acceleration_rpm_per_s);
    readOptional(core_node, "deceleration_rpm_per_s", config.core.deceleration_rpm_per_s);
    readOptional(core_node, "rpm_tolerance", config.core.rpm_tolerance);
    readOptional(core_node, "power_exponent", config.core.power_exponent);
    readOptional(core_node, "stress_exponent", config.core.stress_exponent);

    readOptional(root["scheduler"], "tick_interval_ms", config.tick_interval_ms);

    // Conduit network
    const auto& network_node = root["conduit_network"];
    readOptional(network_node, "conduit_length_m", config.conduits.default_network.conduit_length_m);
    readOptional(network_node, "num_conduits", config.conduits.default_network.num_conduits);
    readOptional(network_node, "active_conduits", config.conduits.default_network.active_conduits);
    readOptional(network_node, "diameter_in", config.conduits.diameter_in);
    readOptional(network_node, "storage_density_gwh_per_m3", config.conduits.storage_density_gwh_per_m3);

    const auto& scenario_nodes = root["scenarios"];
    if (scenario_nodes) {
        if (!scenario_nodes.IsSequence()) {
            throw std::runtime_error("'scenarios' must be a list");
        }
        config.scenarios.clear();
        for (const auto& node : scenario_nodes) {
            ScenarioDefinition scenario;
            scenario.name = node["name"].as<std::string>();
            scenario.spin_minutes = node["spin_minutes"].as<double>();
            if (node["spins_per_week"]) {
                scenario.spins_per_day = node["spins_per_week"].as<double>() / 7.0;
            } else {
                scenario.spins_per_day = node["spins_per_day"].as<double>();
            }
            scenario.intensity = node["intensity"] ? node["intensity"].as<double>() : 1.0;
            config.scenarios.push_back(scenario);
        }
    }

    ConfigLoader::validate(config);
    return config;
}

} // namespace

void ConfigLoader::validate(const Config& config) {
    const CoreParams& core = config.core;
    requirePositive(core.max_rpm, "core.max_rpm");
    requirePositive(core.peak_power_gw, "core.peak_power_gw");
    requirePositive(core.core_mass_kg, "core.core_mass_kg");
    requirePositive(core.core_radius_m, "core.core_radius_m");
    requirePositive(core.acceleration_rpm_per_s, "core.acceleration_rpm_per_s");
    requirePositive(core.deceleration_rpm_per_s, "core.deceleration_rpm_per_s");
    requirePositive(core.rpm_tolerance, "core.rpm_tolerance");
    if (core.startup_energy_gj < 0.0) {
        throw std::runtime_error("core.startup_energy_gj must not be negative");
    }
    if (core.power_exponent < 1.0 || core.stress_exponent < 1.0) {
        throw std::runtime_error("core.power_exponent and core.stress_exponent must be >= 1");
    }
    if (config.tick_interval_ms <= 0) {
        throw std::runtime_error("scheduler.tick_interval_ms must be positive");
    }

    const NetworkConfig& network = config.conduits.default_network;
    if (network.conduit_length_m == 0 || network.num_conduits == 0 || network.active_conduits == 0 ||
        network.active_conduits > network.num_conduits) {
        throw std::runtime_error("conduit_network requires length > 0 and 1 <= active <= num");
    }
    requirePositive(config.conduits.diameter_in, "conduit_network.diameter_in");
    requirePositive(config.conduits.storage_density_gwh_per_m3,
                    "conduit_network.storage_density_gwh_per_m3");

    if (config.scenarios.empty()) {
        throw std::runtime_error("At least one scenario is required");
    }
    try {
        ScenarioCatalog check(config.scenarios);
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(e.what());
    }
}

Config ConfigLoader::loadConfig(const std::string& filename) {
    try {
        return fromNode(YAML::LoadFile(filename));
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to read profile " + filename + ": " + e.what());
    }
}

Config ConfigLoader::parseConfig(const std::string& yaml_text) {
    try {
        return fromNode(YAML::Load(yaml_text));
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(std::string("Failed to parse profile: ") + e.what());
    }
}
