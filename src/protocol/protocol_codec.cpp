#include "riglink/protocol/protocol_codec.hpp"

#include "riglink/common/errors.hpp"

namespace riglink::protocol {

ProtocolCodec::ProtocolCodec(capability::ProtocolFamily family, Variant codec)
    : family_(family), codec_(std::move(codec)) {}

ProtocolCodec ProtocolCodec::for_model(capability::CapabilitiesPtr caps) {
    if (!caps) {
        throw common::CapabilityError("No capabilities bound to codec");
    }
    const auto family = caps->family;
    switch (family) {
        case capability::ProtocolFamily::Civ:
            return {family, CivCodec{std::move(caps)}};
        case capability::ProtocolFamily::YaesuCat:
            return {family, YaesuCodec{std::move(caps)}};
        case capability::ProtocolFamily::KenwoodCat:
            return {family, KenwoodCodec{std::move(caps)}};
        case capability::ProtocolFamily::ElecraftCat:
            return {family, ElecraftCodec{std::move(caps)}};
    }
    throw common::CapabilityError("Unsupported protocol family");
}

Plan ProtocolCodec::encode(const common::Command& command) const {
    return std::visit([&](const auto& codec) { return codec.encode(command); }, codec_);
}

void ProtocolCodec::expect_ack(const common::Bytes& reply) const {
    std::visit([&](const auto& codec) { codec.expect_ack(reply); }, codec_);
}

common::Reply ProtocolCodec::decode(const common::Command& command, const std::vector<common::Bytes>& replies) const {
    return std::visit([&](const auto& codec) { return codec.decode(command, replies); }, codec_);
}

bool ProtocolCodec::is_unsolicited(const common::Bytes& reply) const {
    return std::visit([&](const auto& codec) { return codec.is_unsolicited(reply); }, codec_);
}

std::uint8_t ProtocolCodec::terminator() const {
    return std::visit([](const auto& codec) { return codec.terminator(); }, codec_);
}

Plan ProtocolCodec::handshake() const {
    return std::visit([](const auto& codec) { return codec.handshake(); }, codec_);
}

}  // namespace riglink::protocol
