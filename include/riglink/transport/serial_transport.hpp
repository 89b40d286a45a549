#pragma once

#include "riglink/transport/transport.hpp"

#include <asio/io_context.hpp>
#include <asio/serial_port.hpp>
#include <asio/streambuf.hpp>

#include <memory>
#include <string>

namespace riglink::transport {

// asio serial port with its own io_context so reads can be bounded by a
// steady_timer without touching the service's main loop.
class SerialTransport : public ITransport {
public:
    SerialTransport();
    ~SerialTransport() override;

    SerialTransport(const SerialTransport&) = delete;
    SerialTransport& operator=(const SerialTransport&) = delete;

    void open(const std::string& port, int baud) override;
    void write(const common::Bytes& bytes) override;
    common::Bytes read_until(std::uint8_t terminator, std::chrono::milliseconds timeout) override;
    void discard_input() override;
    void close() override;
    bool is_open() const override;

private:
    asio::io_context io_;
    std::unique_ptr<asio::serial_port> port_;
    asio::streambuf pending_;
    std::string name_;

    common::Bytes take_pending(std::size_t count);
};

}  // namespace riglink::transport
