#pragma once

#include "riglink/common/commands.hpp"
#include "riglink/common/types.hpp"
#include "riglink/net/rigctld_command.hpp"
#include "riglink/net/rigctld_response.hpp"

#include <optional>
#include <string>

namespace riglink::command {
class Orchestrator;
}  // namespace riglink::command

namespace riglink::net {

// Hamlib mode tokens (PKTUSB, CWR, ...).
std::string hamlib_mode(common::Mode mode);
std::optional<common::Mode> parse_hamlib_mode(const std::string& text);
int default_passband(common::Mode mode) noexcept;

std::optional<common::Vfo> parse_hamlib_vfo(const std::string& text);
std::string hamlib_vfo(common::Vfo vfo);

// Hamlib AGC level values: 0 off, 1 superfast, 2 fast, 3 slow, 5 medium,
// 6 auto. Superfast maps onto fast; 4 (user) has no equivalent.
int hamlib_agc(common::AgcSpeed speed) noexcept;
std::optional<common::AgcSpeed> parse_hamlib_agc(long value);

// Maps parsed rigctld commands onto orchestrator calls against the active
// radio. Session-level verbs (set_ext_response, quit) answer RPRT 0 here and
// are acted on by the connection.
class RigctldHandler {
public:
    RigctldHandler(command::Orchestrator& orchestrator, std::string actor);

    RigctldResponse handle(const RigctldCommand& command);

private:
    command::Orchestrator& orchestrator_;
    std::string actor_;

    RigctldResponse run(RigctldVerb verb, const common::Command& command);
    RigctldResponse set_level(const RigctldCommand& command);
    RigctldResponse get_level(const RigctldCommand& command);
    RigctldResponse set_func(const RigctldCommand& command);
    RigctldResponse get_func(const RigctldCommand& command);
    RigctldResponse split_mode(const RigctldCommand& command, const common::Command& operation);
    RigctldResponse dump_caps(const RigctldCommand& command);
    RigctldResponse dump_state(const RigctldCommand& command);
};

}  // namespace riglink::net
