#include "riglink/net/rigctld_response.hpp"

#include <utility>

namespace riglink::net {

ReturnCode return_code(common::ErrorCode code) noexcept {
    switch (code) {
        case common::ErrorCode::Ok: return ReturnCode::Ok;
        case common::ErrorCode::Capability: return ReturnCode::InvalidParameter;
        case common::ErrorCode::NotConnected: return ReturnCode::CommunicationError;
        case common::ErrorCode::Timeout: return ReturnCode::Timeout;
        case common::ErrorCode::Transport: return ReturnCode::IoError;
        case common::ErrorCode::Internal: return ReturnCode::Internal;
        case common::ErrorCode::Framing: return ReturnCode::Protocol;
        case common::ErrorCode::ProtocolNak: return ReturnCode::Rejected;
        case common::ErrorCode::InvalidArgument: return ReturnCode::Argument;
    }
    return ReturnCode::Internal;
}

RigctldResponse RigctldResponse::data(RigctldVerb verb, std::vector<std::string> lines) {
    return {verb, std::move(lines), ReturnCode::Ok};
}

RigctldResponse RigctldResponse::status(RigctldVerb verb, ReturnCode code) {
    return {verb, {}, code};
}

std::string RigctldResponse::format(bool extended) const {
    const std::string rprt = "RPRT " + std::to_string(static_cast<int>(code)) + "\n";
    if (!extended) {
        if (code != ReturnCode::Ok || lines.empty()) {
            return rprt;
        }
        std::string out;
        for (const auto& line : lines) {
            out += line + "\n";
        }
        return out;
    }

    std::string out = long_name(verb) + ":";
    if (lines.size() == 1) {
        out += " " + lines.front() + "\n";
    } else {
        out += "\n";
        for (const auto& line : lines) {
            out += line + "\n";
        }
    }
    return out + rprt;
}

}  // namespace riglink::net
