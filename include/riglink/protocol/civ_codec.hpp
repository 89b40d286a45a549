#pragma once

#include "riglink/capability/capabilities.hpp"
#include "riglink/common/commands.hpp"
#include "riglink/protocol/civ_frame.hpp"
#include "riglink/protocol/plan.hpp"

#include <optional>
#include <vector>

namespace riglink::protocol {

// Icom / Xiegu CI-V codec. Addresses, frequency width, VFO addressing and
// mode filter handling come from the model's CI-V profile.
class CivCodec {
public:
    explicit CivCodec(capability::CapabilitiesPtr caps);

    Plan encode(const common::Command& command) const;
    void expect_ack(const common::Bytes& reply) const;
    common::Reply decode(const common::Command& command, const std::vector<common::Bytes>& replies) const;

    // Bus echo of our own frame, transceive broadcasts and traffic for other
    // controllers.
    bool is_unsolicited(const common::Bytes& reply) const;

    std::uint8_t terminator() const noexcept { return civ::kTerminator; }
    Plan handshake() const { return {}; }

    static std::optional<std::uint8_t> mode_code(common::Mode mode);
    static std::optional<common::Mode> mode_from_code(std::uint8_t code, std::optional<std::uint8_t> filter);

private:
    capability::CapabilitiesPtr caps_;

    const capability::CivProfile& profile() const noexcept { return caps_->civ; }

    civ::Frame frame(std::uint8_t command,
                     std::optional<std::uint8_t> subcommand = std::nullopt,
                     common::Bytes data = {}) const;
    Exchange ack(const civ::Frame& frame) const;
    Exchange data(const civ::Frame& frame) const;

    std::optional<std::uint8_t> vfo_code(common::Vfo vfo) const;
    void add_vfo_select(Plan& plan, common::Vfo vfo) const;

    civ::Frame reply_frame(const common::Bytes& raw, std::uint8_t command,
                           std::optional<std::uint8_t> subcommand) const;
    common::MemoryContents decode_memory(const civ::Frame& frame, int channel) const;
};

}  // namespace riglink::protocol
