#ifndef ENERGY_MODEL_H
#define ENERGY_MODEL_H

#include "spin_core.hpp"

/**
 * @class EnergyModel
 * @brief Closed-form capacity, efficiency and core-physics calculations.
 *
 * All functions are pure: the same inputs always produce bit-identical
 * results. Instances only carry the constants of the loaded profile.
 */
class EnergyModel {
public:
    EnergyModel(const CoreParams& core, const ConduitParams& conduits);

    /**
     * @brief Storage capacity of a single cylindrical conduit.
     * @param conduit_length_m Length of the conduit in metres.
     * @param diameter_in Inner diameter in inches.
     * @param storage_density_gwh_per_m3 Energy density of the storage medium.
     * @return Capacity in GWh.
     */
    static double storageCapacity(double conduit_length_m, double diameter_in,
                                  double storage_density_gwh_per_m3);

    /**
     * @brief Daily energy balance of a scenario.
     *
     * The efficiency ratio is net / daily, reported as 0 when no energy is
     * generated and clamped at 0 when start-up costs exceed generation.
     */
    static ScenarioEnergy scenarioEnergy(const ScenarioDefinition& scenario,
                                         double peak_power_gw, double startup_energy_gj);

    /// @brief Redundancy and capacity of a network; InvalidConfig when active is 0 or above num.
    Outcome<NetworkCapacity> networkCapacity(const NetworkConfig& config) const;

    ScenarioEnergy scenarioEnergy(const ScenarioDefinition& scenario) const;

    /// @brief Rotational energy of the core, solid disk, in GJ.
    double kineticEnergyGj(double rpm) const;

    /// @brief Generated power in GW, peak * (rpm / max_rpm)^power_exponent.
    double powerOutputGw(double rpm) const;

    const CoreParams& coreParams() const { return core; }

private:
    CoreParams core;
    ConduitParams conduits;
};

#endif // ENERGY_MODEL_H
