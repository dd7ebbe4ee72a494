#include "register_request.hpp"
#include "register_map.hpp"
#include <iostream>

namespace {

uint16_t readWord(const uint8_t* bytes) {
    return static_cast<uint16_t>((bytes[0] << 8) | bytes[1]);
}

bool inRange(uint16_t address, uint16_t quantity, uint16_t table_size) {
    return static_cast<uint32_t>(address) + quantity <= table_size;
}

bool isKnownCommand(uint16_t value) {
    return value <= static_cast<uint16_t>(RegisterCommand::APPLY_NETWORK_CONFIG);
}

} // namespace

ModbusException decodeRequest(const uint8_t* pdu, size_t pdu_length, RegisterRequest& request) {
    if (pdu_length < 1) {
        return ModbusException::ILLEGAL_FUNCTION;
    }

    request.values.clear();
    switch (static_cast<FunctionCode>(pdu[0])) {
        case FunctionCode::READ_HOLDING_REGISTERS:
        case FunctionCode::READ_INPUT_REGISTERS: {
            if (pdu_length < 5) {
                return ModbusException::ILLEGAL_DATA_VALUE;
            }
            request.function = static_cast<FunctionCode>(pdu[0]);
            request.address = readWord(pdu + 1);
            request.quantity = readWord(pdu + 3);
            if (request.quantity < 1 || request.quantity > MAX_READ_REGISTERS) {
                return ModbusException::ILLEGAL_DATA_VALUE;
            }
            uint16_t table_size = request.function == FunctionCode::READ_INPUT_REGISTERS ? reg::INPUT_COUNT
                                                                                       : reg::HOLDING_COUNT;
            if (!inRange(request.address, request.quantity, table_size)) {
                return ModbusException::ILLEGAL_DATA_ADDRESS;
            }
            return ModbusException::NONE;
        }

        case FunctionCode::WRITE_SINGLE_REGISTER: {
            if (pdu_length < 5) {
                return ModbusException::ILLEGAL_DATA_VALUE;
            }
            request.function = FunctionCode::WRITE_SINGLE_REGISTER;
            request.address = readWord(pdu + 1);
            request.quantity = 1;
            if (!inRange(request.address, 1, reg::HOLDING_COUNT)) {
                return ModbusException::ILLEGAL_DATA_ADDRESS;
            }
            request.values.push_back(readWord(pdu + 3));
            return ModbusException::NONE;
        }

        case FunctionCode::WRITE_MULTIPLE_REGISTERS: {
            if (pdu_length < 6) {
                return ModbusException::ILLEGAL_DATA_VALUE;
            }
            request.function = FunctionCode::WRITE_MULTIPLE_REGISTERS;
            request.address = readWord(pdu + 1);
            request.quantity = readWord(pdu + 3);
            size_t byte_count = pdu[5];
            if (request.quantity < 1 || request.quantity > MAX_WRITE_REGISTERS ||
                byte_count != 2u * request.quantity || pdu_length < 6 + byte_count) {
                return ModbusException::ILLEGAL_DATA_VALUE;
            }
            if (!inRange(request.address, request.quantity, reg::HOLDING_COUNT)) {
                return ModbusException::ILLEGAL_DATA_ADDRESS;
            }
            request.values.reserve(request.quantity);
            for (uint16_t i = 0; i < request.quantity; ++i) {
                request.values.push_back(readWord(pdu + 6 + 2 * i));
            }
            return ModbusException::NONE;
        }
    }
    return ModbusException::ILLEGAL_FUNCTION;
}

RegisterRequestHandler::RegisterRequestHandler(std::shared_ptr<SafeDataModel> model,
                                               std::shared_ptr<RegisterBridge> register_bridge)
    : data_model(std::move(model)), bridge(std::move(register_bridge)) {}

ModbusException RegisterRequestHandler::handle(const RegisterRequest& request, std::vector<uint16_t>& read_values) {
    read_values.clear();
    switch (request.function) {
        case FunctionCode::READ_INPUT_REGISTERS:
            if (!data_model->getRegisterValues(static_cast<uint16_t>(reg::INPUT_BASE + request.address),
                                               request.quantity, read_values)) {
                return ModbusException::ILLEGAL_DATA_ADDRESS;
            }
            return ModbusException::NONE;
        case FunctionCode::READ_HOLDING_REGISTERS:
            if (!data_model->getRegisterValues(static_cast<uint16_t>(reg::HOLDING_BASE + request.address),
                                               request.quantity, read_values)) {
                return ModbusException::ILLEGAL_DATA_ADDRESS;
            }
            return ModbusException::NONE;
        case FunctionCode::WRITE_SINGLE_REGISTER:
        case FunctionCode::WRITE_MULTIPLE_REGISTERS:
            return write(request);
    }
    return ModbusException::ILLEGAL_FUNCTION;
}

ModbusException RegisterRequestHandler::write(const RegisterRequest& request) {
    if (request.values.size() != request.quantity) {
        return ModbusException::ILLEGAL_DATA_VALUE;
    }

    uint16_t first = static_cast<uint16_t>(reg::HOLDING_BASE + request.address);
    if (reg::COMMAND >= first && reg::COMMAND < first + request.quantity &&
        !isKnownCommand(request.values[reg::COMMAND - first])) {
        std::cerr << "Warning: unknown register command " << request.values[reg::COMMAND - first] << std::endl;
        return ModbusException::ILLEGAL_DATA_VALUE;
    }

    if (!data_model->setRegisterValues(first, request.values)) {
        std::cerr << "Warning: rejected write of " << request.quantity << " register(s) at protocol addr "
                  << request.address << std::endl;
        return ModbusException::ILLEGAL_DATA_ADDRESS;
    }

    auto result = bridge->onHoldingWrite(first, request.quantity);
    if (result) {
        std::cout << "Register command executed: " << toString(*result) << std::endl;
    }
    return ModbusException::NONE;
}
