#include "core_state_machine.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>

CoreStateMachine::CoreStateMachine(std::shared_ptr<const ScenarioCatalog> scenario_catalog,
                                   const EnergyModel& model, SafetyClassifier classifier)
    : catalog(std::move(scenario_catalog)), energy_model(model),
      safety_classifier(std::move(classifier)), next_sequence(0) {}

SimError CoreStateMachine::start(const std::string& scenario_name, double duration_minutes) {
    auto scenario = catalog->find(scenario_name);
    if (!scenario.ok()) {
        return scenario.error;
    }

    std::lock_guard<std::mutex> lock(state_mutex);
    if (sim_state.status != CoreStatus::IDLE) {
        return SimError::AlreadyRunning;
    }

    const CoreParams& params = energy_model.coreParams();
    double minutes = duration_minutes > 0.0 ? duration_minutes : scenario.value->spin_minutes;

    sim_state.status = CoreStatus::ACCELERATING;
    sim_state.target_rpm = std::clamp(scenario.value->intensity, 0.0, 1.0) * params.max_rpm;
    sim_state.run_duration_seconds = minutes * 60.0;
    sim_state.scenario_id = scenario.value->name;
    sim_state.elapsed_seconds = 0.0;
    sim_state.cumulative_energy_gj = -params.startup_energy_gj;

    std::cout << "Spin-up started: " << sim_state.scenario_id << ", target " << sim_state.target_rpm
              << " RPM for " << minutes << " min" << std::endl;
    return SimError::None;
}

SimError CoreStateMachine::stop() {
    std::lock_guard<std::mutex> lock(state_mutex);
    switch (sim_state.status) {
        case CoreStatus::IDLE:
        case CoreStatus::EMERGENCY_STOPPED:
            return SimError::NotRunning;
        case CoreStatus::DECELERATING:
            return SimError::None;
        case CoreStatus::ACCELERATING:
        case CoreStatus::RUNNING:
            sim_state.status = CoreStatus::DECELERATING;
            sim_state.elapsed_seconds = 0.0;
            std::cout << "Stop requested at " << sim_state.rpm << " RPM, spinning down" << std::endl;
            return SimError::None;
    }
    return SimError::None;
}

void CoreStateMachine::emergencyStop() {
    std::lock_guard<std::mutex> lock(state_mutex);
    const CoreParams& params = energy_model.coreParams();
    double spike = materialStressPct(sim_state.rpm, params.max_rpm, params.stress_exponent);

    std::cerr << "Warning: emergency stop at " << sim_state.rpm << " RPM (stress " << spike << "%)"
              << std::endl;

    sim_state.status = CoreStatus::EMERGENCY_STOPPED;
    sim_state.rpm = 0.0;
    sim_state.target_rpm = 0.0;
    sim_state.elapsed_seconds = 0.0;
    sim_state.emergency_stop_count++;
    pending_stress_spike = spike;
}

SimError CoreStateMachine::reset() {
    std::lock_guard<std::mutex> lock(state_mutex);
    switch (sim_state.status) {
        case CoreStatus::IDLE:
            return SimError::None;
        case CoreStatus::EMERGENCY_STOPPED:
            sim_state.status = CoreStatus::IDLE;
            sim_state.elapsed_seconds = 0.0;
            std::cout << "Emergency stop cleared, core idle" << std::endl;
            return SimError::None;
        default:
            return SimError::AlreadyRunning;
    }
}

TelemetrySnapshot CoreStateMachine::tick(double dt_seconds) {
    if (!std::isfinite(dt_seconds) || dt_seconds < 0.0) {
        dt_seconds = 0.0;
    }

    std::lock_guard<std::mutex> lock(state_mutex);
    advance(dt_seconds);
    sim_state.cumulative_energy_gj += energy_model.powerOutputGw(sim_state.rpm) * dt_seconds;
    return makeSnapshot();
}

void CoreStateMachine::advance(double dt) {
    const CoreParams& params = energy_model.coreParams();
    sim_state.elapsed_seconds += dt;

    switch (sim_state.status) {
        case CoreStatus::ACCELERATING: {
            double gap = sim_state.target_rpm - sim_state.rpm;
            sim_state.rpm += std::min(params.acceleration_rpm_per_s * dt, std::max(gap, 0.0));
            if (sim_state.target_rpm - sim_state.rpm <= params.rpm_tolerance) {
                sim_state.rpm = sim_state.target_rpm;
                sim_state.status = CoreStatus::RUNNING;
                sim_state.elapsed_seconds = 0.0;
                std::cout << "Target speed reached: " << sim_state.rpm << " RPM" << std::endl;
            }
            break;
        }
        case CoreStatus::RUNNING:
            if (sim_state.elapsed_seconds >= sim_state.run_duration_seconds) {
                sim_state.status = CoreStatus::DECELERATING;
                sim_state.elapsed_seconds = 0.0;
                std::cout << "Run duration elapsed, spinning down" << std::endl;
            }
            break;
        case CoreStatus::DECELERATING:
            sim_state.rpm -= std::min(params.deceleration_rpm_per_s * dt, sim_state.rpm);
            if (sim_state.rpm <= 0.0) {
                sim_state.rpm = 0.0;
                sim_state.target_rpm = 0.0;
                sim_state.status = CoreStatus::IDLE;
                sim_state.elapsed_seconds = 0.0;
                sim_state.cycle_count++;
                std::cout << "Core at rest, cycle " << sim_state.cycle_count << " complete" << std::endl;
            }
            break;
        case CoreStatus::IDLE:
        case CoreStatus::EMERGENCY_STOPPED:
            sim_state.rpm = 0.0;
            break;
    }

    sim_state.rpm = std::clamp(sim_state.rpm, 0.0, params.max_rpm);
}

TelemetrySnapshot CoreStateMachine::makeSnapshot() {
    const CoreParams& params = energy_model.coreParams();

    TelemetrySnapshot snapshot;
    snapshot.sequence = ++next_sequence;
    snapshot.status = sim_state.status;
    snapshot.rpm = sim_state.rpm;
    snapshot.power_gw = energy_model.powerOutputGw(sim_state.rpm);
    snapshot.kinetic_energy_gj = energy_model.kineticEnergyGj(sim_state.rpm);
    snapshot.material_stress_pct = materialStressPct(sim_state.rpm, params.max_rpm, params.stress_exponent);

    SafetyAssessment safety = safety_classifier.classify(snapshot.material_stress_pct);
    snapshot.safety_level = safety.level;
    snapshot.safety_label = safety.status_label;
    snapshot.safety_message = safety.message;

    snapshot.elapsed_seconds = sim_state.elapsed_seconds;
    snapshot.cumulative_energy_gj = sim_state.cumulative_energy_gj;
    snapshot.cycle_count = sim_state.cycle_count;

    if (pending_stress_spike) {
        snapshot.stress_spike_pct = *pending_stress_spike;
        pending_stress_spike.reset();
    }
    return snapshot;
}

SimulationState CoreStateMachine::state() const {
    std::lock_guard<std::mutex> lock(state_mutex);
    return sim_state;
}

bool CoreStateMachine::isActive() const {
    std::lock_guard<std::mutex> lock(state_mutex);
    return sim_state.status == CoreStatus::ACCELERATING || sim_state.status == CoreStatus::RUNNING ||
           sim_state.status == CoreStatus::DECELERATING;
}
