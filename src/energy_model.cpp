#include "energy_model.hpp"
#include <algorithm>
#include <cmath>

namespace {
constexpr double kMetresPerInch = 0.0254;
constexpr double kGjPerGwh = 3600.0;
}

EnergyModel::EnergyModel(const CoreParams& core_params, const ConduitParams& conduit_params)
    : core(core_params), conduits(conduit_params) {}

double EnergyModel::storageCapacity(double conduit_length_m, double diameter_in,
                                    double storage_density_gwh_per_m3) {
    double radius_m = diameter_in * kMetresPerInch / 2.0;
    double volume_m3 = M_PI * radius_m * radius_m * conduit_length_m;
    return volume_m3 * storage_density_gwh_per_m3;
}

ScenarioEnergy EnergyModel::scenarioEnergy(const ScenarioDefinition& scenario,
                                           double peak_power_gw, double startup_energy_gj) {
    ScenarioEnergy result{};
    double startup_energy_gwh = startup_energy_gj / kGjPerGwh;

    result.daily_energy_gwh = peak_power_gw * (scenario.spin_minutes / 60.0) * scenario.spins_per_day;
    result.startup_cost_gwh = startup_energy_gwh * scenario.spins_per_day;
    result.net_energy_gwh = result.daily_energy_gwh - result.startup_cost_gwh;

    if (result.daily_energy_gwh > 0.0) {
        result.efficiency_ratio = std::max(0.0, result.net_energy_gwh / result.daily_energy_gwh);
    } else {
        result.efficiency_ratio = 0.0;
    }

    result.break_even_minutes = peak_power_gw > 0.0 ? startup_energy_gwh / peak_power_gw * 60.0 : 0.0;
    return result;
}

Outcome<NetworkCapacity> EnergyModel::networkCapacity(const NetworkConfig& config) const {
    if (config.active_conduits == 0 || config.active_conduits > config.num_conduits) {
        return Outcome<NetworkCapacity>::failure(SimError::InvalidConfig);
    }

    NetworkCapacity capacity{};
    capacity.standby_conduits = config.num_conduits - config.active_conduits;
    capacity.redundancy_factor =
        static_cast<double>(config.num_conduits) / static_cast<double>(config.active_conduits);
    capacity.single_conduit_capacity_gwh = storageCapacity(
        config.conduit_length_m, conduits.diameter_in, conduits.storage_density_gwh_per_m3);
    capacity.total_capacity_gwh = config.active_conduits * capacity.single_conduit_capacity_gwh;
    capacity.reserve_capacity_gwh = capacity.standby_conduits * capacity.single_conduit_capacity_gwh;
    capacity.storage_duration_hours =
        core.peak_power_gw > 0.0 ? capacity.total_capacity_gwh / core.peak_power_gw : 0.0;
    return Outcome<NetworkCapacity>::success(capacity);
}

ScenarioEnergy EnergyModel::scenarioEnergy(const ScenarioDefinition& scenario) const {
    return scenarioEnergy(scenario, core.peak_power_gw, core.startup_energy_gj);
}

double EnergyModel::kineticEnergyGj(double rpm) const {
    // Solid disk: I = 1/2 m r^2
    double moment_of_inertia = 0.5 * core.core_mass_kg * core.core_radius_m * core.core_radius_m;
    double omega = rpm * 2.0 * M_PI / 60.0;
    return 0.5 * moment_of_inertia * omega * omega / 1e9;
}

double EnergyModel::powerOutputGw(double rpm) const {
    if (rpm <= 0.0 || core.max_rpm <= 0.0) {
        return 0.0;
    }
    double ratio = std::min(rpm / core.max_rpm, 1.0);
    return core.peak_power_gw * std::pow(ratio, core.power_exponent);
}
