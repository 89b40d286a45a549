#pragma once

#include "riglink/capability/capabilities.hpp"
#include "riglink/common/commands.hpp"
#include "riglink/common/types.hpp"

namespace riglink::capability {

inline constexpr int kMaxRitOffsetHz = 9999;

// Checks a command against a model's declared capabilities. Pure: never
// touches the transport, never throws.
class Validator {
public:
    static common::CommandResult validate(const RadioCapabilities& caps, const common::Command& command);
};

}  // namespace riglink::capability
