#include "safe_data_model.hpp"
#include <iostream>

namespace {

uint32_t toWords(const RegisterValue& value) {
    switch (value.index()) {
        case 0: return std::get<uint16_t>(value);
        case 1: return static_cast<uint16_t>(std::get<int16_t>(value));
        case 2: return std::get<uint32_t>(value);
        default: return static_cast<uint32_t>(std::get<int32_t>(value));
    }
}

RegisterValue fromWords(RegisterType type, uint32_t raw) {
    switch (type) {
        case RegisterType::U16: return static_cast<uint16_t>(raw);
        case RegisterType::S16: return static_cast<int16_t>(static_cast<uint16_t>(raw));
        case RegisterType::U32: return raw;
        case RegisterType::S32: return static_cast<int32_t>(raw);
    }
    return static_cast<uint16_t>(raw);
}

} // namespace

void SafeDataModel::initialize(const std::vector<Register>& initial_registers) {
    std::lock_guard<std::mutex> lock(data_mutex);
    logical_register_map.clear();
    modbus_register_map.clear();

    for (const auto& reg_template : initial_registers) {
        logical_register_map[reg_template.address] = reg_template;
        storeWords(reg_template);
    }
}

// Deconstruct the logical value into 16-bit Modbus registers, high word first.
void SafeDataModel::storeWords(const Register& reg) {
    uint32_t raw = toWords(reg.value);
    if (reg.num_regs == 1) {
        modbus_register_map[reg.address] = static_cast<uint16_t>(raw & 0xFFFF);
    } else {
        modbus_register_map[reg.address] = static_cast<uint16_t>((raw >> 16) & 0xFFFF);
        modbus_register_map[reg.address + 1] = static_cast<uint16_t>(raw & 0xFFFF);
    }
}

bool SafeDataModel::getRegisterValue(uint16_t address, uint16_t& value) {
    std::lock_guard<std::mutex> lock(data_mutex);
    auto it = modbus_register_map.find(address);
    if (it != modbus_register_map.end()) {
        value = it->second;
        return true;
    }
    return false;
}

// Finds the logical register a 16-bit Modbus address belongs to.
Register* SafeDataModel::findOwner(uint16_t address) {
    for (auto& pair : logical_register_map) {
        if (address >= pair.first && address < pair.first + pair.second.num_regs) {
            return &pair.second;
        }
    }
    return nullptr;
}

bool SafeDataModel::checkWritable(uint16_t address) {
    Register* logical_reg = findOwner(address);
    if (!logical_reg) {
        std::cerr << "Warning: Write to unmapped modbus address " << address << std::endl;
        return false;
    }
    if (logical_reg->access == RegisterAccess::RO) {
        std::cerr << "Warning: Denied write to RO logical register " << logical_reg->address << std::endl;
        return false;
    }
    return true;
}

// Stores one word and rebuilds the logical value it is part of. The address
// must already have passed checkWritable.
void SafeDataModel::applyWord(uint16_t address, uint16_t value) {
    Register* logical_reg = findOwner(address);
    modbus_register_map[address] = value;

    uint32_t raw = modbus_register_map[logical_reg->address];
    if (logical_reg->num_regs == 2) {
        raw = (raw << 16) | modbus_register_map[logical_reg->address + 1];
    }
    logical_reg->value = fromWords(logical_reg->type, raw);
}

bool SafeDataModel::setRegisterValue(uint16_t address, uint16_t value) {
    std::lock_guard<std::mutex> lock(data_mutex);
    if (!checkWritable(address)) {
        return false;
    }
    applyWord(address, value);
    return true;
}

bool SafeDataModel::getRegisterValues(uint16_t address, size_t count, std::vector<uint16_t>& values) {
    std::lock_guard<std::mutex> lock(data_mutex);
    std::vector<uint16_t> result;
    result.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        auto it = modbus_register_map.find(static_cast<uint16_t>(address + i));
        if (it == modbus_register_map.end()) {
            values.clear();
            return false;
        }
        result.push_back(it->second);
    }
    values = std::move(result);
    return true;
}

bool SafeDataModel::setRegisterValues(uint16_t address, const std::vector<uint16_t>& values) {
    std::lock_guard<std::mutex> lock(data_mutex);
    if (values.empty() || address + values.size() - 1 > 0xFFFF) {
        return false;
    }
    for (size_t i = 0; i < values.size(); ++i) {
        if (!checkWritable(static_cast<uint16_t>(address + i))) {
            return false;
        }
    }
    for (size_t i = 0; i < values.size(); ++i) {
        applyWord(static_cast<uint16_t>(address + i), values[i]);
    }
    return true;
}

std::optional<RegisterValue> SafeDataModel::getLogicalValue(uint16_t address) {
    std::lock_guard<std::mutex> lock(data_mutex);
    auto it = logical_register_map.find(address);
    if (it != logical_register_map.end()) {
        return it->second.value;
    }
    return std::nullopt;
}

bool SafeDataModel::setLogicalValue(uint16_t address, const RegisterValue& value) {
    std::lock_guard<std::mutex> lock(data_mutex);
    auto it = logical_register_map.find(address);
    if (it == logical_register_map.end()) {
        return false;
    }
    if (value.index() != static_cast<size_t>(it->second.type)) {
        std::cerr << "Warning: Type mismatch writing logical register " << address << std::endl;
        return false;
    }
    it->second.value = value;
    storeWords(it->second);
    return true;
}
