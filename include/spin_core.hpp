#ifndef SPIN_CORE_H
#define SPIN_CORE_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

/// @brief Lifecycle of the spinning core.
enum class CoreStatus {
    IDLE,             ///< At rest, rpm is zero
    ACCELERATING,     ///< Ramping up towards the run's target rpm
    RUNNING,          ///< Holding target rpm for the configured duration
    DECELERATING,     ///< Ramping down to rest
    EMERGENCY_STOPPED ///< Halted abruptly, needs an explicit reset
};

/// @brief Discrete risk level derived from material stress.
enum class SafetyLevel {
    GREEN,
    YELLOW,
    ORANGE,
    RED
};

/// @brief Failure codes of the command surface. Values are stable, they are
/// exposed on the Modbus result register.
enum class SimError : uint16_t {
    None = 0,
    UnknownScenario = 1,
    AlreadyRunning = 2,
    NotRunning = 3,
    InvalidConfig = 4
};

const char* toString(CoreStatus status);
const char* toString(SafetyLevel level);
const char* toString(SimError error);

/**
 * @struct ScenarioDefinition
 * @brief A named operating profile.
 */
struct ScenarioDefinition {
    std::string name;
    double spin_minutes;
    double spins_per_day;
    double intensity; // fraction of max rpm held while running, (0, 1]
};

/**
 * @struct NetworkConfig
 * @brief Topology of the SuperConduit storage network.
 *
 * Always replaced as a whole; valid when 1 <= active_conduits <= num_conduits
 * and conduit_length_m > 0.
 */
struct NetworkConfig {
    uint32_t conduit_length_m;
    uint32_t num_conduits;
    uint32_t active_conduits;
};

/// @brief Capacity figures derived from a NetworkConfig.
struct NetworkCapacity {
    uint32_t standby_conduits;
    double redundancy_factor;
    double total_capacity_gwh;
    double single_conduit_capacity_gwh;
    double reserve_capacity_gwh;
    double storage_duration_hours;
};

/// @brief Daily energy balance of one scenario.
struct ScenarioEnergy {
    double daily_energy_gwh;
    double startup_cost_gwh;
    double net_energy_gwh;
    double efficiency_ratio;
    double break_even_minutes;
};

/// @brief Result of a safety classification.
struct SafetyAssessment {
    SafetyLevel level;
    std::string status_label;
    std::string message;
};

/**
 * @struct SimulationState
 * @brief Mutable state of the core, owned by CoreStateMachine.
 */
struct SimulationState {
    CoreStatus status = CoreStatus::IDLE;
    double rpm = 0.0;
    double target_rpm = 0.0;
    double elapsed_seconds = 0.0;
    double cumulative_energy_gj = 0.0;
    std::string scenario_id;
    double run_duration_seconds = 0.0;
    uint64_t cycle_count = 0;
    uint64_t emergency_stop_count = 0;
};

/**
 * @struct TelemetrySnapshot
 * @brief Point-in-time view of the core, produced fresh on every tick.
 */
struct TelemetrySnapshot {
    uint64_t sequence = 0;
    CoreStatus status = CoreStatus::IDLE;
    double rpm = 0.0;
    double power_gw = 0.0;
    double kinetic_energy_gj = 0.0;
    double material_stress_pct = 0.0;
    SafetyLevel safety_level = SafetyLevel::GREEN;
    std::string safety_label;
    std::string safety_message;
    double elapsed_seconds = 0.0;
    double cumulative_energy_gj = 0.0;
    uint64_t cycle_count = 0;
    double stress_spike_pct = 0.0;
};

/// @brief Outcome of a state-changing command.
struct CommandResult {
    SimError error = SimError::None;
    std::string status;

    bool ok() const { return error == SimError::None; }
};

/// @brief Value-or-error return used by queries that can fail.
template <typename T>
struct Outcome {
    std::optional<T> value;
    SimError error = SimError::None;

    bool ok() const { return error == SimError::None; }

    static Outcome success(T v) { return Outcome{std::move(v), SimError::None}; }
    static Outcome failure(SimError e) { return Outcome{std::nullopt, e}; }
};

/**
 * @struct ServerParams
 * @brief Modbus endpoint of the simulated plant.
 */
struct ServerParams {
    int unit_id = 1;
    int port = 1502;
};

/**
 * @struct CoreParams
 * @brief Physical and control constants of the spinning core.
 */
struct CoreParams {
    double max_rpm = 200000.0;
    double peak_power_gw = 200.0;
    double core_mass_kg = 199.0;
    double core_radius_m = 1.5;
    double startup_energy_gj = 2217.3;
    double acceleration_rpm_per_s = 250.0;
    double deceleration_rpm_per_s = 1000.0;
    double rpm_tolerance = 1.0;
    double power_exponent = 1.0;
    double stress_exponent = 2.0;
};

/// @brief Fixed physical properties of every conduit plus the start-up topology.
struct ConduitParams {
    NetworkConfig default_network{6437, 3, 2};
    double diameter_in = 48.0;
    double storage_density_gwh_per_m3 = 2.5;
};

/**
 * @struct Config
 * @brief Top-level structure to hold the entire parsed profile.
 */
struct Config {
    ServerParams server;
    CoreParams core;
    int tick_interval_ms = 1000;
    ConduitParams conduits;
    std::vector<ScenarioDefinition> scenarios;
};

#endif // SPIN_CORE_H
