#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include "step_result.h"

#define DEFAULT_SERIAL_PORT "/dev/ttyACM0"
#define DEFAULT_BAUD_RATE 115200
#define DEFAULT_READ_TIMEOUT_MS 2000

/**
 * Abstract base class for the byte-stream link to the panel.
 * The session treats it as a write-only command channel.
 */
class ISerialPort {
public:
    virtual ~ISerialPort() = default;

    /**
     * Write the whole buffer or fail
     * @param data Data buffer to send
     * @param size Size of data
     * @return failure with the OS/driver message if any byte could not be written
     */
    virtual StepResult write_all(const void* data, size_t size) = 0;

    /**
     * Block until queued output has been transmitted
     */
    virtual StepResult flush() = 0;

    /**
     * Discard pending input and output.
     * Best effort; callers ignore the result.
     */
    virtual StepResult clear_buffers() = 0;

    /**
     * Close the port
     */
    virtual void close() = 0;

    /**
     * Device path or other identifier, for log lines
     */
    virtual std::string get_name() const = 0;

    virtual bool is_open() const = 0;
};

struct SerialSettings {
    std::string address = DEFAULT_SERIAL_PORT;
    unsigned int baud_rate = DEFAULT_BAUD_RATE;
    std::chrono::milliseconds read_timeout{DEFAULT_READ_TIMEOUT_MS};
};

// Opens a port or returns nullptr with `error` filled in.
using PortOpener = std::function<std::unique_ptr<ISerialPort>(const SerialSettings& settings,
                                                              std::string& error)>;

std::unique_ptr<ISerialPort> open_serial_port(const SerialSettings& settings, std::string& error);
