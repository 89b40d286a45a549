#pragma once

#include "riglink/common/types.hpp"
#include "riglink/net/rigctld_command.hpp"

#include <string>
#include <vector>

namespace riglink::net {

// Hamlib RIG_E* codes as sent in `RPRT n`.
enum class ReturnCode : int {
    Ok = 0,
    InvalidParameter = -1,
    NotImplemented = -4,
    CommunicationError = -5,
    Timeout = -6,
    IoError = -7,
    Internal = -8,
    Protocol = -9,
    Rejected = -10,
    Argument = -11,
    NotSupported = -12
};

ReturnCode return_code(common::ErrorCode code) noexcept;

struct RigctldResponse {
    RigctldVerb verb{RigctldVerb::GetFreq};
    std::vector<std::string> lines;
    ReturnCode code{ReturnCode::Ok};

    static RigctldResponse data(RigctldVerb verb, std::vector<std::string> lines);
    static RigctldResponse status(RigctldVerb verb, ReturnCode code);

    // Default format: data lines for successful queries, otherwise `RPRT n`.
    // Extended format: `long_name: value` (or `long_name:` followed by the
    // lines) and always a trailing `RPRT n`.
    std::string format(bool extended) const;
};

}  // namespace riglink::net
