#pragma once

#include "riglink/common/types.hpp"

#include <optional>
#include <vector>

namespace riglink::protocol {

enum class ReplyKind {
    None,  // write only
    Ack,   // device answers OK/NAK, checked before the next exchange
    Data   // device answers with a payload, handed to the decoder
};

struct Exchange {
    common::Bytes request;
    ReplyKind reply{ReplyKind::Data};
};

// Ordered wire exchanges that realise one semantic command.
struct Plan {
    std::vector<Exchange> exchanges;
    // Set when the plan switches the radio's active VFO as a side effect.
    std::optional<common::Vfo> selects_vfo;
};

}  // namespace riglink::protocol
