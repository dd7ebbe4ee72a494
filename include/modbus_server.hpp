#ifndef MODBUS_SERVER_H
#define MODBUS_SERVER_H

#include "safe_data_model.hpp"
#include "register_bridge.hpp"
#include "register_request.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <thread>
#include <modbus/modbus.h>

/**
 * @class ModbusServer
 * @brief Handles Modbus TCP communication in a dedicated thread.
 *
 * This class uses libmodbus to create a Modbus TCP server. Each request is
 * decoded and bounds-checked by decodeRequest and served by a
 * RegisterRequestHandler before libmodbus builds the reply, so a malformed
 * or rejected request never reaches the register bank.
 */
class ModbusServer {
public:
    /// @param unit_id Slave id answered on; requests for other ids are still served.
    ModbusServer(std::shared_ptr<SafeDataModel> data_model, std::shared_ptr<RegisterBridge> bridge,
                 int unit_id);
    ~ModbusServer();

    /**
     * @brief Binds the listening socket and spawns the accept loop.
     * @return False if the context, mapping or socket could not be created.
     */
    bool start(int port);

    /// @brief Closes the socket and joins the server thread. Safe to call twice.
    void stop();

private:
    void run();

    // Handles requests on the accepted connection until the client disconnects.
    void serveClient(uint8_t* query);

    RegisterRequestHandler handler;
    int unit_id;
    int port;
    modbus_t* ctx;
    modbus_mapping_t* mb_mapping;
    std::thread server_thread;
    std::atomic<bool> running;
    int server_socket;
};

#endif // MODBUS_SERVER_H
