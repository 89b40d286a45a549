#pragma once

#include "riglink/common/types.hpp"

#include <stdexcept>
#include <string>

namespace riglink::common {

class RigError : public std::runtime_error {
public:
    RigError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const noexcept { return code_; }

    CommandResult to_result() const { return {code_, what()}; }

private:
    ErrorCode code_;
};

class CapabilityError : public RigError {
public:
    explicit CapabilityError(const std::string& message)
        : RigError(ErrorCode::Capability, message) {}
};

class FramingError : public RigError {
public:
    explicit FramingError(const std::string& message)
        : RigError(ErrorCode::Framing, message) {}
};

// Carries whatever arrived before the deadline so the caller can tell a
// silent device from a truncated frame.
class TimeoutError : public RigError {
public:
    TimeoutError(const std::string& message, Bytes partial = {})
        : RigError(ErrorCode::Timeout, message), partial_(std::move(partial)) {}

    const Bytes& partial() const noexcept { return partial_; }

private:
    Bytes partial_;
};

class ProtocolNakError : public RigError {
public:
    explicit ProtocolNakError(const std::string& message)
        : RigError(ErrorCode::ProtocolNak, message) {}
};

class TransportError : public RigError {
public:
    explicit TransportError(const std::string& message)
        : RigError(ErrorCode::Transport, message) {}
};

}  // namespace riglink::common
