#ifndef CORE_STATE_MACHINE_H
#define CORE_STATE_MACHINE_H

#include "spin_core.hpp"
#include "energy_model.hpp"
#include "safety_classifier.hpp"
#include "scenario_catalog.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>

/**
 * @class CoreStateMachine
 * @brief Owns the SimulationState and applies every transition to it.
 *
 * Commands and ticks serialize on a single mutex, so no caller can observe a
 * state half-updated by a tick. Commands never wait for a tick: they either
 * apply immediately or return a SimError.
 */
class CoreStateMachine {
public:
    CoreStateMachine(std::shared_ptr<const ScenarioCatalog> catalog, const EnergyModel& model,
                     SafetyClassifier classifier = SafetyClassifier());

    /**
     * @brief Begins a run: IDLE -> ACCELERATING.
     * @param scenario_name Catalog entry that sets the target rpm.
     * @param duration_minutes Time to hold target rpm; <= 0 uses the scenario's spin time.
     * @return UnknownScenario, AlreadyRunning if not IDLE, or None.
     */
    SimError start(const std::string& scenario_name, double duration_minutes);

    /**
     * @brief Requests a normal spin-down.
     * @return NotRunning from IDLE or EMERGENCY_STOPPED, None otherwise.
     */
    SimError stop();

    /// @brief Halts the core instantly from any state.
    void emergencyStop();

    /**
     * @brief Clears an emergency stop: EMERGENCY_STOPPED -> IDLE.
     * @return AlreadyRunning while a run is in progress, None otherwise.
     */
    SimError reset();

    /**
     * @brief Advances the simulation by dt seconds and returns the new telemetry.
     * @param dt_seconds Elapsed wall time; negative or non-finite values count as 0.
     */
    TelemetrySnapshot tick(double dt_seconds);

    /// @brief Copy of the current state.
    SimulationState state() const;

    /// @brief True while a run is in progress (ACCELERATING, RUNNING or DECELERATING).
    bool isActive() const;

private:
    TelemetrySnapshot makeSnapshot();
    void advance(double dt_seconds);

    std::shared_ptr<const ScenarioCatalog> catalog;
    EnergyModel energy_model;
    SafetyClassifier safety_classifier;

    mutable std::mutex state_mutex;
    SimulationState sim_state;
    uint64_t next_sequence;
    std::optional<double> pending_stress_spike;
};

#endif // CORE_STATE_MACHINE_H
