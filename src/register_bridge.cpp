#include "register_bridge.hpp"
#include <cmath>
#include <iostream>
#include <limits>

namespace {

uint32_t scaleU32(double value, double factor) {
    double scaled = std::round(value * factor);
    if (!(scaled > 0.0)) return 0;
    if (scaled >= static_cast<double>(std::numeric_limits<uint32_t>::max())) {
        return std::numeric_limits<uint32_t>::max();
    }
    return static_cast<uint32_t>(scaled);
}

uint16_t scaleU16(double value, double factor) {
    uint32_t scaled = scaleU32(value, factor);
    return scaled > 0xFFFF ? 0xFFFF : static_cast<uint16_t>(scaled);
}

int32_t clampS32(double value) {
    double rounded = std::round(value);
    if (rounded <= static_cast<double>(std::numeric_limits<int32_t>::min())) {
        return std::numeric_limits<int32_t>::min();
    }
    if (rounded >= static_cast<double>(std::numeric_limits<int32_t>::max())) {
        return std::numeric_limits<int32_t>::max();
    }
    return static_cast<int32_t>(rounded);
}

} // namespace

RegisterBridge::RegisterBridge(std::shared_ptr<SafeDataModel> model,
                               std::shared_ptr<SimulationController> sim_controller)
    : data_model(std::move(model)), controller(std::move(sim_controller)) {}

RegisterBridge::~RegisterBridge() {
    detach();
}

void RegisterBridge::attach() {
    if (subscription) return;
    subscription = controller->subscribe(
        [this](const TelemetrySnapshot& snapshot) { writeTelemetry(snapshot); });
}

void RegisterBridge::detach() {
    if (!subscription) return;
    controller->unsubscribe(*subscription);
    subscription.reset();
}

void RegisterBridge::writeTelemetry(const TelemetrySnapshot& snapshot) {
    bool ok = true;
    ok &= data_model->setLogicalValue(reg::STATUS, static_cast<uint16_t>(snapshot.status));
    ok &= data_model->setLogicalValue(reg::RPM, scaleU32(snapshot.rpm, 1.0));
    ok &= data_model->setLogicalValue(reg::POWER_GW, scaleU32(snapshot.power_gw, 100.0));          // FIX2
    ok &= data_model->setLogicalValue(reg::KINETIC_ENERGY_GJ, scaleU32(snapshot.kinetic_energy_gj, 10.0)); // FIX1
    ok &= data_model->setLogicalValue(reg::STRESS_PCT, scaleU16(snapshot.material_stress_pct, 10.0)); // FIX1
    ok &= data_model->setLogicalValue(reg::SAFETY_LEVEL, static_cast<uint16_t>(snapshot.safety_level));
    ok &= data_model->setLogicalValue(reg::CYCLE_COUNT, static_cast<uint32_t>(snapshot.cycle_count));
    ok &= data_model->setLogicalValue(reg::CUMULATIVE_ENERGY_GJ, clampS32(snapshot.cumulative_energy_gj));
    ok &= data_model->setLogicalValue(reg::SEQUENCE, static_cast<uint32_t>(snapshot.sequence));
    ok &= data_model->setLogicalValue(reg::STRESS_SPIKE_PCT, scaleU16(snapshot.stress_spike_pct, 10.0));
    if (!ok) {
        std::cerr << "Warning: telemetry " << snapshot.sequence << " only partially mapped to registers"
                  << std::endl;
    }
}

uint16_t RegisterBridge::readU16(uint16_t address) {
    auto value = data_model->getLogicalValue(address);
    return value && std::holds_alternative<uint16_t>(*value) ? std::get<uint16_t>(*value) : 0;
}

uint32_t RegisterBridge::readU32(uint16_t address) {
    auto value = data_model->getLogicalValue(address);
    return value && std::holds_alternative<uint32_t>(*value) ? std::get<uint32_t>(*value) : 0;
}

std::optional<SimError> RegisterBridge::onHoldingWrite(uint16_t address, int count) {
    if (count <= 0 || reg::COMMAND < address || reg::COMMAND >= address + count) {
        return std::nullopt;
    }

    auto command = static_cast<RegisterCommand>(readU16(reg::COMMAND));
    if (command == RegisterCommand::NONE) {
        return std::nullopt;
    }

    SimError result = executeCommand(command);
    data_model->setLogicalValue(reg::LAST_RESULT, static_cast<uint16_t>(result));
    data_model->setLogicalValue(reg::COMMAND, static_cast<uint16_t>(RegisterCommand::NONE));
    return result;
}

SimError RegisterBridge::executeCommand(RegisterCommand command) {
    switch (command) {
        case RegisterCommand::START: {
            auto scenario = controller->scenarios().at(readU16(reg::SCENARIO_INDEX));
            if (!scenario.ok()) {
                return scenario.error;
            }
            return controller->start(scenario.value->name, readU16(reg::DURATION_MIN)).error;
        }
        case RegisterCommand::STOP:
            return controller->stop().error;
        case RegisterCommand::EMERGENCY_STOP:
            return controller->emergencyStop().error;
        case RegisterCommand::RESET:
            return controller->reset().error;
        case RegisterCommand::APPLY_NETWORK_CONFIG: {
            auto capacity = controller->updateNetworkConfig(
                readU32(reg::CONDUIT_LENGTH_M), readU16(reg::NUM_CONDUITS), readU16(reg::ACTIVE_CONDUITS));
            if (!capacity.ok()) {
                return capacity.error;
            }
            data_model->setLogicalValue(reg::STANDBY_CONDUITS,
                                        static_cast<uint16_t>(capacity.value->standby_conduits));
            data_model->setLogicalValue(reg::REDUNDANCY_X1000,
                                        scaleU32(capacity.value->redundancy_factor, 1000.0)); // FIX3
            data_model->setLogicalValue(reg::TOTAL_CAPACITY_GWH,
                                        scaleU32(capacity.value->total_capacity_gwh, 1.0));
            return SimError::None;
        }
        case RegisterCommand::NONE:
            return SimError::None;
    }
    std::cerr << "Warning: unknown register command " << static_cast<uint16_t>(command) << std::endl;
    return SimError::InvalidConfig;
}
