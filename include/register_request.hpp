#ifndef REGISTER_REQUEST_H
#define REGISTER_REQUEST_H

#include "register_bridge.hpp"
#include "safe_data_model.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

/// @brief Modbus function codes served by the plant.
enum class FunctionCode : uint8_t {
    READ_HOLDING_REGISTERS = 0x03,
    READ_INPUT_REGISTERS = 0x04,
    WRITE_SINGLE_REGISTER = 0x06,
    WRITE_MULTIPLE_REGISTERS = 0x10
};

/// @brief Modbus exception codes; values match the protocol (and libmodbus).
enum class ModbusException : uint8_t {
    NONE = 0x00,
    ILLEGAL_FUNCTION = 0x01,
    ILLEGAL_DATA_ADDRESS = 0x02,
    ILLEGAL_DATA_VALUE = 0x03
};

// Protocol limits on the quantity of one request.
constexpr uint16_t MAX_READ_REGISTERS = 125;
constexpr uint16_t MAX_WRITE_REGISTERS = 123;

/**
 * @struct RegisterRequest
 * @brief A decoded register request. Address is the 0-based protocol offset
 * into the table the function code selects.
 */
struct RegisterRequest {
    FunctionCode function;
    uint16_t address;
    uint16_t quantity;
    std::vector<uint16_t> values; ///< Write payload, empty for reads.
};

/**
 * @brief Decodes and bounds-checks a request PDU (function code onwards).
 *
 * Nothing past pdu_length bytes is read. The quantity and byte count of a
 * write must agree with each other and with the frame length, and the whole
 * range must lie inside the plant's input or holding table.
 * @return ModbusException::NONE and a filled request, or the exception to reply with.
 */
ModbusException decodeRequest(const uint8_t* pdu, size_t pdu_length, RegisterRequest& request);

/**
 * @class RegisterRequestHandler
 * @brief Serves decoded requests against the register bank.
 *
 * Writes are validated in full and applied in one step; a write that
 * touches the command register is executed through the RegisterBridge
 * before the request completes.
 */
class RegisterRequestHandler {
public:
    RegisterRequestHandler(std::shared_ptr<SafeDataModel> data_model, std::shared_ptr<RegisterBridge> bridge);

    /**
     * @param request A request accepted by decodeRequest.
     * @param read_values Filled with the registers read, for FC3/FC4.
     */
    ModbusException handle(const RegisterRequest& request, std::vector<uint16_t>& read_values);

private:
    ModbusException write(const RegisterRequest& request);

    std::shared_ptr<SafeDataModel> data_model;
    std::shared_ptr<RegisterBridge> bridge;
};

#endif // REGISTER_REQUEST_H
