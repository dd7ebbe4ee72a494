#ifndef SAFE_DATA_MODEL_H
#define SAFE_DATA_MODEL_H

#include "register_map.hpp"
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

/**
 * @class SafeDataModel
 * @brief Manages the shared state of all Modbus registers with thread-safe access.
 *
 * This class acts as the central repository for the plant's register data.
 * It uses a mutex to protect the data from concurrent access by the Modbus
 * server thread and the tick scheduler thread publishing telemetry.
 */
class SafeDataModel {
public:
    /**
     * @brief Initializes the data model from a register layout.
     * @param initial_registers Logical registers with their initial values.
     */
    void initialize(const std::vector<Register>& initial_registers);

    /**
     * @brief Gets the value of a single 16-bit Modbus register.
     * @param address The Modbus address of the register.
     * @param value A reference to be filled with the register's value.
     * @return True if the address is valid and the value was retrieved, false otherwise.
     */
    bool getRegisterValue(uint16_t address, uint16_t& value);

    /**
     * @brief Sets a single 16-bit Modbus register on behalf of a client.
     * @param address The Modbus address of the register.
     * @param value The new value to set.
     * @return True if the address is mapped and writable, false otherwise.
     */
    bool setRegisterValue(uint16_t address, uint16_t value);

    /**
     * @brief Reads count consecutive 16-bit registers under one lock.
     * @return False, leaving values empty, if any address is unmapped.
     */
    bool getRegisterValues(uint16_t address, size_t count, std::vector<uint16_t>& values);

    /**
     * @brief Writes consecutive 16-bit registers on behalf of a client, all or nothing.
     *
     * Every target is checked to be mapped and writable before the first one is
     * changed, so a rejected request leaves the model untouched.
     * @return False if any address is unmapped or read-only.
     */
    bool setRegisterValues(uint16_t address, const std::vector<uint16_t>& values);

    /**
     * @brief Gets the value of a register by its logical address.
     * @param address The logical start address of the register.
     * @return An std::optional containing the register's value if found.
     */
    std::optional<RegisterValue> getLogicalValue(uint16_t address);

    /**
     * @brief Sets the value of a register by its logical address, ignoring access rights.
     * @return False if the address is unknown or the value type does not match.
     */
    bool setLogicalValue(uint16_t address, const RegisterValue& value);

private:
    void storeWords(const Register& reg);
    Register* findOwner(uint16_t address);
    bool checkWritable(uint16_t address);
    void applyWord(uint16_t address, uint16_t value);

    std::mutex data_mutex;
    std::unordered_map<uint16_t, Register> logical_register_map;
    std::unordered_map<uint16_t, uint16_t> modbus_register_map;
};

#endif // SAFE_DATA_MODEL_H
