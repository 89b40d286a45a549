#pragma once

#include "riglink/common/types.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace riglink::transport {

// Byte-stream link to one radio. Implementations throw TransportError on I/O
// failure and TimeoutError (with any partial bytes) when a read misses its
// deadline.
class ITransport {
public:
    virtual ~ITransport() = default;

    virtual void open(const std::string& port, int baud) = 0;
    virtual void write(const common::Bytes& bytes) = 0;
    virtual common::Bytes read_until(std::uint8_t terminator, std::chrono::milliseconds timeout) = 0;
    virtual void discard_input() = 0;
    virtual void close() = 0;
    virtual bool is_open() const = 0;
};

using TransportPtr = std::unique_ptr<ITransport>;

}  // namespace riglink::transport
