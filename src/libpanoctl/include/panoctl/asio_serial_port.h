#pragma once

#include "serial_port.h"
#include <asio.hpp>
#include <string>

/**
 * Serial port transport over asio::serial_port.
 * Read timeout is applied through termios VMIN/VTIME on the native handle.
 */
class AsioSerialPort : public ISerialPort {
private:
    asio::io_context io_context;
    asio::serial_port port;
    std::string address;

public:
    AsioSerialPort();
    ~AsioSerialPort() override;

    /**
     * Open and configure the device (8N1, no flow control)
     * @param settings Device path, baud rate and read timeout
     * @return failure with the asio/termios message
     */
    StepResult open(const SerialSettings& settings);

    StepResult write_all(const void* data, size_t size) override;
    StepResult flush() override;
    StepResult clear_buffers() override;
    void close() override;

    std::string get_name() const override { return address; }
    bool is_open() const override { return port.is_open(); }

private:
    StepResult apply_read_timeout(std::chrono::milliseconds timeout);
};
