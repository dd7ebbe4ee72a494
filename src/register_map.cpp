#include "register_map.hpp"

namespace {

Register makeRegister(uint16_t address, RegisterType type, RegisterAccess access) {
    switch (type) {
        case RegisterType::U16: return {address, type, access, uint16_t{0}, 1};
        case RegisterType::S16: return {address, type, access, int16_t{0}, 1};
        case RegisterType::U32: return {address, type, access, uint32_t{0}, 2};
        case RegisterType::S32: return {address, type, access, int32_t{0}, 2};
    }
    return {address, type, access, uint16_t{0}, 1};
}

} // namespace

std::vector<Register> plantRegisters() {
    using T = RegisterType;
    using A = RegisterAccess;
    return {
        // Telemetry
        makeRegister(reg::STATUS, T::U16, A::RO),
        makeRegister(reg::RPM, T::U32, A::RO),
        makeRegister(reg::POWER_GW, T::U32, A::RO),
        makeRegister(reg::KINETIC_ENERGY_GJ, T::U32, A::RO),
        makeRegister(reg::STRESS_PCT, T::U16, A::RO),
        makeRegister(reg::SAFETY_LEVEL, T::U16, A::RO),
        makeRegister(reg::CYCLE_COUNT, T::U32, A::RO),
        makeRegister(reg::CUMULATIVE_ENERGY_GJ, T::S32, A::RO),
        makeRegister(reg::SEQUENCE, T::U32, A::RO),
        makeRegister(reg::STRESS_SPIKE_PCT, T::U16, A::RO),

        // Commands
        makeRegister(reg::COMMAND, T::U16, A::RW),
        makeRegister(reg::SCENARIO_INDEX, T::U16, A::RW),
        makeRegister(reg::DURATION_MIN, T::U16, A::RW),
        makeRegister(reg::CONDUIT_LENGTH_M, T::U32, A::RW),
        makeRegister(reg::NUM_CONDUITS, T::U16, A::RW),
        makeRegister(reg::ACTIVE_CONDUITS, T::U16, A::RW),

        // Command results
        makeRegister(reg::LAST_RESULT, T::U16, A::RO),
        makeRegister(reg::STANDBY_CONDUITS, T::U16, A::RO),
        makeRegister(reg::REDUNDANCY_X1000, T::U32, A::RO),
        makeRegister(reg::TOTAL_CAPACITY_GWH, T::U32, A::RO),
    };
}
