#include "modbus_server.hpp"
#include <algorithm>
#include <cerrno>
#include <iostream>
#include <unistd.h>
#include <sys/socket.h>

ModbusServer::ModbusServer(std::shared_ptr<SafeDataModel> model, std::shared_ptr<RegisterBridge> register_bridge,
                           int id)
    : handler(std::move(model), std::move(register_bridge)), unit_id(id), port(0), ctx(nullptr),
      mb_mapping(nullptr), running(false), server_socket(-1) {}

ModbusServer::~ModbusServer() {
    stop();
}

bool ModbusServer::start(int p) {
    if (running) return true;
    port = p;

    ctx = modbus_new_tcp("0.0.0.0", port);
    if (ctx == nullptr) {
        std::cerr << "Failed to create modbus context: " << modbus_strerror(errno) << std::endl;
        return false;
    }

    mb_mapping = modbus_mapping_new(0, 0, reg::HOLDING_COUNT, reg::INPUT_COUNT);
    if (mb_mapping == nullptr) {
        std::cerr << "Failed to allocate modbus mapping: " << modbus_strerror(errno) << std::endl;
        modbus_free(ctx);
        ctx = nullptr;
        return false;
    }

    modbus_set_slave(ctx, unit_id);

    server_socket = modbus_tcp_listen(ctx, 1);
    if (server_socket == -1) {
        std::cerr << "Unable to listen on TCP port " << port << ": " << modbus_strerror(errno) << std::endl;
        modbus_free(ctx);
        ctx = nullptr;
        modbus_mapping_free(mb_mapping);
        mb_mapping = nullptr;
        return false;
    }

    running = true;
    server_thread = std::thread(&ModbusServer::run, this);
    return true;
}

void ModbusServer::stop() {
    if (!running.exchange(false)) return;

    if (server_socket != -1) {
        shutdown(server_socket, SHUT_RDWR);
        close(server_socket);
        server_socket = -1;
    }

    if (server_thread.joinable()) {
        server_thread.join();
    }

    if (ctx) {
        modbus_close(ctx);
        modbus_free(ctx);
        ctx = nullptr;
    }
    if (mb_mapping) {
        modbus_mapping_free(mb_mapping);
        mb_mapping = nullptr;
    }
}

void ModbusServer::serveClient(uint8_t* query) {
    const int header_length = modbus_get_header_length(ctx);
    RegisterRequest request;
    std::vector<uint16_t> read_values;

    while (running) {
        int rc = modbus_receive(ctx, query);
        if (rc == -1) {
            std::cout << "Client disconnected" << std::endl;
            return;
        }
        if (rc == 0) {
            continue; // request for another unit id
        }
        if (rc <= header_length) {
            continue;
        }

        ModbusException status =
            decodeRequest(query + header_length, static_cast<size_t>(rc - header_length), request);
        if (status == ModbusException::NONE) {
            status = handler.handle(request, read_values);
        }
        if (status != ModbusException::NONE) {
            modbus_reply_exception(ctx, query, static_cast<unsigned int>(status));
            continue;
        }

        // Stage read results where modbus_reply picks them up.
        if (request.function == FunctionCode::READ_INPUT_REGISTERS) {
            std::copy(read_values.begin(), read_values.end(), mb_mapping->tab_input_registers + request.address);
        } else if (request.function == FunctionCode::READ_HOLDING_REGISTERS) {
            std::copy(read_values.begin(), read_values.end(), mb_mapping->tab_registers + request.address);
        }

        if (modbus_reply(ctx, query, rc, mb_mapping) == -1) {
            std::cerr << "Modbus reply failed: " << modbus_strerror(errno) << std::endl;
        }
    }
}

void ModbusServer::run() {
    std::cout << "Modbus server thread started." << std::endl;
    uint8_t query[MODBUS_TCP_MAX_ADU_LENGTH];

    while (running) {
        int rc = modbus_tcp_accept(ctx, &server_socket);
        if (rc == -1) {
            if (running) {
                std::cerr << "Modbus accept failed: " << modbus_strerror(errno) << std::endl;
            }
            continue;
        }

        std::cout << "Client connected" << std::endl;
        serveClient(query);
        modbus_close(ctx);
    }
    std::cout << "Modbus server thread stopped." << std::endl;
}
