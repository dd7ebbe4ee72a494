#ifndef REGISTER_MAP_H
#define REGISTER_MAP_H

#include <cstddef>
#include <cstdint>
#include <variant>
#include <vector>

/// @brief Defines the access type for a Modbus register.
enum class RegisterAccess {
    RO, ///< Read Only
    RW  ///< Read Write
};

/// @brief Defines the data type for a Modbus register.
enum class RegisterType {
    U16,
    S16,
    U32,
    S32
};

using RegisterValue = std::variant<uint16_t, int16_t, uint32_t, int32_t>;

/**
 * @struct Register
 * @brief Holds all properties of a single logical register.
 *
 * 32-bit values occupy two consecutive 16-bit Modbus registers, high word first.
 */
struct Register {
    uint16_t address;
    RegisterType type;
    RegisterAccess access;
    RegisterValue value;
    size_t num_regs;
};

/// @brief Commands accepted on the command holding register.
enum class RegisterCommand : uint16_t {
    NONE = 0,
    START = 1,
    STOP = 2,
    EMERGENCY_STOP = 3,
    RESET = 4,
    APPLY_NETWORK_CONFIG = 5
};

// Register addresses. 3xxxx are input registers (telemetry),
// 4xxxx are holding registers (commands and their results).
namespace reg {
constexpr uint16_t INPUT_BASE = 30001;
constexpr uint16_t STATUS = 30001;             // U16, CoreStatus
constexpr uint16_t RPM = 30002;                // U32
constexpr uint16_t POWER_GW = 30004;           // U32, FIX2
constexpr uint16_t KINETIC_ENERGY_GJ = 30006;  // U32, FIX1
constexpr uint16_t STRESS_PCT = 30008;         // U16, FIX1
constexpr uint16_t SAFETY_LEVEL = 30009;       // U16, SafetyLevel
constexpr uint16_t CYCLE_COUNT = 30010;        // U32
constexpr uint16_t CUMULATIVE_ENERGY_GJ = 30012; // S32
constexpr uint16_t SEQUENCE = 30014;           // U32
constexpr uint16_t STRESS_SPIKE_PCT = 30016;   // U16, FIX1
constexpr uint16_t INPUT_COUNT = 16;

constexpr uint16_t HOLDING_BASE = 40001;
constexpr uint16_t COMMAND = 40001;            // U16, RegisterCommand
constexpr uint16_t SCENARIO_INDEX = 40002;     // U16
constexpr uint16_t DURATION_MIN = 40003;       // U16
constexpr uint16_t CONDUIT_LENGTH_M = 40004;   // U32
constexpr uint16_t NUM_CONDUITS = 40006;       // U16
constexpr uint16_t ACTIVE_CONDUITS = 40007;    // U16
// U16, SimError of the last command. A code outside RegisterCommand is refused
// with ILLEGAL_DATA_VALUE before it is stored; executeCommand reports one that
// reaches it anyway as InvalidConfig.
constexpr uint16_t LAST_RESULT = 40008;
constexpr uint16_t STANDBY_CONDUITS = 40009;   // U16
constexpr uint16_t REDUNDANCY_X1000 = 40010;   // U32, FIX3
constexpr uint16_t TOTAL_CAPACITY_GWH = 40012; // U32
constexpr uint16_t HOLDING_COUNT = 13;
} // namespace reg

/// @brief The full register layout of the simulated plant, all values zeroed.
std::vector<Register> plantRegisters();

#endif // REGISTER_MAP_H
