#pragma once

#include "riglink/capability/capabilities.hpp"
#include "riglink/common/commands.hpp"
#include "riglink/protocol/cat_codec.hpp"
#include "riglink/protocol/civ_codec.hpp"
#include "riglink/protocol/plan.hpp"

#include <variant>
#include <vector>

namespace riglink::protocol {

// The codec bound to a session. The alternative is chosen once from the
// model's protocol family and never changes afterwards.
class ProtocolCodec {
public:
    using Variant = std::variant<CivCodec, YaesuCodec, KenwoodCodec, ElecraftCodec>;

    static ProtocolCodec for_model(capability::CapabilitiesPtr caps);

    Plan encode(const common::Command& command) const;
    void expect_ack(const common::Bytes& reply) const;
    common::Reply decode(const common::Command& command, const std::vector<common::Bytes>& replies) const;
    bool is_unsolicited(const common::Bytes& reply) const;
    std::uint8_t terminator() const;
    Plan handshake() const;

    capability::ProtocolFamily family() const noexcept { return family_; }

private:
    ProtocolCodec(capability::ProtocolFamily family, Variant codec);

    capability::ProtocolFamily family_;
    Variant codec_;
};

}  // namespace riglink::protocol
