#include <panoctl/asio_serial_port.h>
#include <termios.h>
#include <cstring>
#include <cerrno>
#include <algorithm>

AsioSerialPort::AsioSerialPort()
    : port(io_context) {
}

AsioSerialPort::~AsioSerialPort() {
    close();
}

StepResult AsioSerialPort::open(const SerialSettings& settings) {
    address = settings.address;

    asio::error_code ec;
    port.open(settings.address, ec);
    if (ec) {
        return StepResult::fail("open(" + settings.address + ") failed: " + ec.message());
    }

    port.set_option(asio::serial_port_base::baud_rate(settings.baud_rate), ec);
    if (!ec) port.set_option(asio::serial_port_base::character_size(8), ec);
    if (!ec) port.set_option(asio::serial_port_base::parity(asio::serial_port_base::parity::none), ec);
    if (!ec) port.set_option(asio::serial_port_base::stop_bits(asio::serial_port_base::stop_bits::one), ec);
    if (!ec) port.set_option(asio::serial_port_base::flow_control(asio::serial_port_base::flow_control::none), ec);
    if (ec) {
        close();
        return StepResult::fail("configure " + settings.address + " at " +
                                std::to_string(settings.baud_rate) + " baud failed: " + ec.message());
    }

    StepResult timeout = apply_read_timeout(settings.read_timeout);
    if (!timeout) {
        close();
        return timeout;
    }

    return StepResult::ok();
}

StepResult AsioSerialPort::apply_read_timeout(std::chrono::milliseconds timeout) {
    int fd = port.native_handle();

    struct termios tio;
    if (tcgetattr(fd, &tio) != 0) {
        return StepResult::fail(std::string("tcgetattr() failed: ") + strerror(errno));
    }

    // VTIME is in tenths of a second and capped at 255.
    long deciseconds = std::min<long>(255, (timeout.count() + 99) / 100);
    tio.c_cc[VMIN] = 0;
    tio.c_cc[VTIME] = static_cast<cc_t>(deciseconds);

    if (tcsetattr(fd, TCSANOW, &tio) != 0) {
        return StepResult::fail(std::string("tcsetattr() failed: ") + strerror(errno));
    }
    return StepResult::ok();
}

StepResult AsioSerialPort::write_all(const void* data, size_t size) {
    if (!port.is_open()) {
        return StepResult::fail("port is not open");
    }

    asio::error_code ec;
    size_t written = asio::write(port, asio::buffer(data, size), ec);
    if (ec) {
        return StepResult::fail("write to " + address + " failed after " +
                                std::to_string(written) + "/" + std::to_string(size) +
                                " bytes: " + ec.message());
    }
    return StepResult::ok();
}

StepResult AsioSerialPort::flush() {
    if (!port.is_open()) {
        return StepResult::fail("port is not open");
    }

    while (tcdrain(port.native_handle()) != 0) {
        if (errno == EINTR) continue;
        return StepResult::fail("flush " + address + " failed: " + strerror(errno));
    }
    return StepResult::ok();
}

StepResult AsioSerialPort::clear_buffers() {
    if (!port.is_open()) {
        return StepResult::fail("port is not open");
    }

    if (tcflush(port.native_handle(), TCIOFLUSH) != 0) {
        return StepResult::fail(std::string("tcflush() failed: ") + strerror(errno));
    }
    return StepResult::ok();
}

void AsioSerialPort::close() {
    if (port.is_open()) {
        asio::error_code ec;
        port.close(ec);
    }
}

std::unique_ptr<ISerialPort> open_serial_port(const SerialSettings& settings, std::string& error) {
    std::unique_ptr<AsioSerialPort> port(new AsioSerialPort());

    StepResult opened = port->open(settings);
    if (!opened) {
        error = opened.error;
        return nullptr;
    }
    return port;
}
