#ifndef REGISTER_BRIDGE_H
#define REGISTER_BRIDGE_H

#include "safe_data_model.hpp"
#include "simulation_controller.hpp"
#include "telemetry_channel.hpp"
#include <cstdint>
#include <memory>
#include <optional>

/**
 * @class RegisterBridge
 * @brief Maps the simulation onto the plant's register layout.
 *
 * Telemetry snapshots are written to the input registers as they are
 * published. A client write that touches the command register executes the
 * command through the controller and reports the SimError on LAST_RESULT.
 */
class RegisterBridge {
public:
    RegisterBridge(std::shared_ptr<SafeDataModel> data_model,
                   std::shared_ptr<SimulationController> controller);
    ~RegisterBridge();

    /// @brief Subscribes to telemetry. Idempotent.
    void attach();

    /// @brief Unsubscribes; once it returns no snapshot is being written by this bridge.
    void detach();

    /// @brief Writes one snapshot into the input registers.
    void writeTelemetry(const TelemetrySnapshot& snapshot);

    /**
     * @brief Called after a client wrote count registers starting at address.
     * @return The command result if the range covered the command register.
     */
    std::optional<SimError> onHoldingWrite(uint16_t address, int count);

    /// @return The controller's result; InvalidConfig for a code outside RegisterCommand.
    SimError executeCommand(RegisterCommand command);

private:
    uint32_t readU32(uint16_t address);
    uint16_t readU16(uint16_t address);

    std::shared_ptr<SafeDataModel> data_model;
    std::shared_ptr<SimulationController> controller;
    std::optional<TelemetryChannel::SubscriberId> subscription;
};

#endif // REGISTER_BRIDGE_H
