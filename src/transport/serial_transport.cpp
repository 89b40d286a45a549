#include "riglink/transport/serial_transport.hpp"

#include "riglink/common/errors.hpp"

#include <asio/buffer.hpp>
#include <asio/read_until.hpp>
#include <asio/steady_timer.hpp>
#include <asio/write.hpp>

#include <termios.h>

#include <optional>

namespace riglink::transport {

SerialTransport::SerialTransport() = default;

SerialTransport::~SerialTransport() {
    if (port_ && port_->is_open()) {
        std::error_code ec;
        port_->close(ec);
    }
}

void SerialTransport::open(const std::string& port, int baud) {
    if (is_open()) {
        throw common::TransportError("Serial port already open: " + name_);
    }

    auto serial = std::make_unique<asio::serial_port>(io_);
    std::error_code ec;
    serial->open(port, ec);
    if (ec) {
        throw common::TransportError("Cannot open " + port + ": " + ec.message());
    }

    using asio::serial_port_base;
    serial->set_option(serial_port_base::baud_rate(static_cast<unsigned int>(baud)), ec);
    if (!ec) serial->set_option(serial_port_base::character_size(8), ec);
    if (!ec) serial->set_option(serial_port_base::parity(serial_port_base::parity::none), ec);
    if (!ec) serial->set_option(serial_port_base::stop_bits(serial_port_base::stop_bits::one), ec);
    if (!ec) serial->set_option(serial_port_base::flow_control(serial_port_base::flow_control::none), ec);
    if (ec) {
        std::error_code ignored;
        serial->close(ignored);
        throw common::TransportError("Cannot configure " + port + " at " + std::to_string(baud) + " baud: " +
                                     ec.message());
    }

    port_ = std::move(serial);
    name_ = port;
    pending_.consume(pending_.size());
}

void SerialTransport::write(const common::Bytes& bytes) {
    if (!is_open()) {
        throw common::TransportError("Write on closed serial port");
    }
    std::error_code ec;
    asio::write(*port_, asio::buffer(bytes), ec);
    if (ec) {
        throw common::TransportError("Write to " + name_ + " failed: " + ec.message());
    }
}

common::Bytes SerialTransport::read_until(std::uint8_t terminator, std::chrono::milliseconds timeout) {
    if (!is_open()) {
        throw common::TransportError("Read on closed serial port");
    }

    std::optional<std::error_code> read_error;
    std::size_t length = 0;
    bool timed_out = false;

    asio::async_read_until(*port_, pending_, static_cast<char>(terminator),
                           [&](const std::error_code& ec, std::size_t n) {
                               read_error = ec;
                               length = n;
                           });

    asio::steady_timer timer(io_, timeout);
    timer.async_wait([&](const std::error_code& ec) {
        if (!ec) {
            timed_out = true;
            std::error_code ignored;
            port_->cancel(ignored);
        }
    });

    io_.restart();
    while (!read_error) {
        io_.run_one();
    }
    timer.cancel();
    io_.run();

    if (!*read_error) {
        return take_pending(length);
    }
    if (timed_out) {
        throw common::TimeoutError("No answer from " + name_ + " within " + std::to_string(timeout.count()) + " ms",
                                   take_pending(pending_.size()));
    }
    throw common::TransportError("Read from " + name_ + " failed: " + read_error->message());
}

void SerialTransport::discard_input() {
    pending_.consume(pending_.size());
    if (is_open() && ::tcflush(port_->native_handle(), TCIFLUSH) != 0) {
        throw common::TransportError("Cannot flush input of " + name_);
    }
}

void SerialTransport::close() {
    if (!port_) {
        return;
    }
    std::error_code ec;
    if (port_->is_open()) {
        port_->close(ec);
    }
    port_.reset();
    pending_.consume(pending_.size());
    if (ec) {
        throw common::TransportError("Closing " + name_ + " failed: " + ec.message());
    }
}

bool SerialTransport::is_open() const {
    return port_ && port_->is_open();
}

common::Bytes SerialTransport::take_pending(std::size_t count) {
    const auto* begin = static_cast<const std::uint8_t*>(pending_.data().data());
    common::Bytes out(begin, begin + count);
    pending_.consume(count);
    return out;
}

}  // namespace riglink::transport
