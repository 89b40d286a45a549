#include "riglink/net/rigctld_handler.hpp"

#include "riglink/command/orchestrator.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <limits>
#include <utility>

namespace riglink::net {

namespace {

using common::Mode;

struct ModeName {
    Mode mode;
    const char* name;
};

constexpr std::array<ModeName, 13> kModeNames{{
    {Mode::LSB, "LSB"},
    {Mode::USB, "USB"},
    {Mode::CW, "CW"},
    {Mode::CWR, "CWR"},
    {Mode::AM, "AM"},
    {Mode::FM, "FM"},
    {Mode::FMN, "FMN"},
    {Mode::WFM, "WFM"},
    {Mode::RTTY, "RTTY"},
    {Mode::RTTYR, "RTTYR"},
    {Mode::DataLSB, "PKTLSB"},
    {Mode::DataUSB, "PKTUSB"},
    {Mode::DataFM, "PKTFM"},
}};

std::string upper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

std::string fixed6(double value) {
    std::array<char, 32> buffer{};
    std::snprintf(buffer.data(), buffer.size(), "%.6f", value);
    return buffer.data();
}

RigctldResponse failure(RigctldVerb verb, const common::CommandResult& status) {
    return RigctldResponse::status(verb, return_code(status.code));
}

template <typename T>
const T* reply_as(const common::Result<common::Reply>& result) {
    return result.value ? std::get_if<T>(&*result.value) : nullptr;
}

std::optional<int> narrow(long value) {
    if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
        return std::nullopt;
    }
    return static_cast<int>(value);
}

std::optional<common::RitXitState> offset_state(const RigctldCommand& command) {
    const auto hz = narrow(RigctldParser::parse_integer(command.args[0], "offset"));
    if (!hz) {
        return std::nullopt;
    }
    return common::RitXitState{*hz != 0, *hz};
}

bool couples_tx_to_selection(capability::ProtocolFamily family) {
    return family == capability::ProtocolFamily::KenwoodCat || family == capability::ProtocolFamily::ElecraftCat;
}

}  // namespace

std::string hamlib_mode(Mode mode) {
    for (const auto& entry : kModeNames) {
        if (entry.mode == mode) {
            return entry.name;
        }
    }
    return "USB";
}

std::optional<Mode> parse_hamlib_mode(const std::string& text) {
    const auto name = upper(text);
    for (const auto& entry : kModeNames) {
        if (name == entry.name) {
            return entry.mode;
        }
    }
    return std::nullopt;
}

int default_passband(Mode mode) noexcept {
    switch (mode) {
        case Mode::LSB:
        case Mode::USB:
        case Mode::DataLSB:
        case Mode::DataUSB:
            return 2400;
        case Mode::CW:
        case Mode::CWR:
        case Mode::RTTY:
        case Mode::RTTYR:
            return 500;
        case Mode::AM: return 6000;
        case Mode::FM:
        case Mode::DataFM:
            return 15000;
        case Mode::FMN: return 10000;
        case Mode::WFM: return 150000;
    }
    return 2400;
}

std::optional<common::Vfo> parse_hamlib_vfo(const std::string& text) {
    const auto name = upper(text);
    if (name == "VFOA" || name == "A" || name == "CURRVFO") return common::Vfo::A;
    if (name == "VFOB" || name == "B") return common::Vfo::B;
    if (name == "MAIN") return common::Vfo::Main;
    if (name == "SUB") return common::Vfo::Sub;
    return std::nullopt;
}

int hamlib_agc(common::AgcSpeed speed) noexcept {
    switch (speed) {
        case common::AgcSpeed::Off: return 0;
        case common::AgcSpeed::Fast: return 2;
        case common::AgcSpeed::Slow: return 3;
        case common::AgcSpeed::Medium: return 5;
        case common::AgcSpeed::Auto: return 6;
    }
    return 6;
}

std::optional<common::AgcSpeed> parse_hamlib_agc(long value) {
    switch (value) {
        case 0: return common::AgcSpeed::Off;
        case 1:
        case 2: return common::AgcSpeed::Fast;
        case 3: return common::AgcSpeed::Slow;
        case 5: return common::AgcSpeed::Medium;
        case 6: return common::AgcSpeed::Auto;
        default: return std::nullopt;
    }
}

std::string hamlib_vfo(common::Vfo vfo) {
    switch (vfo) {
        case common::Vfo::A: return "VFOA";
        case common::Vfo::B: return "VFOB";
        case common::Vfo::Main: return "Main";
        case common::Vfo::Sub: return "Sub";
    }
    return "VFOA";
}

RigctldHandler::RigctldHandler(command::Orchestrator& orchestrator, std::string actor)
    : orchestrator_{orchestrator},
      actor_{std::move(actor)} {}

RigctldResponse RigctldHandler::handle(const RigctldCommand& command) {
    const auto verb = command.verb;
    const auto& args = command.args;

    switch (verb) {
        case RigctldVerb::SetFreq:
            return run(verb, common::SetFrequency{common::Vfo::A, RigctldParser::parse_frequency(args[0])});

        case RigctldVerb::GetFreq: {
            const auto result = orchestrator_.execute(actor_, common::ReadFrequency{common::Vfo::A});
            const auto* hz = reply_as<std::uint64_t>(result);
            if (!result.status.ok() || !hz) {
                return failure(verb, result.status);
            }
            return RigctldResponse::data(verb, {std::to_string(*hz)});
        }

        case RigctldVerb::SetMode: {
            const auto mode = parse_hamlib_mode(args[0]);
            if (!mode) {
                return RigctldResponse::status(verb, ReturnCode::InvalidParameter);
            }
            return run(verb, common::SetMode{*mode});
        }

        case RigctldVerb::GetMode: {
            const auto result = orchestrator_.execute(actor_, common::ReadMode{});
            const auto* mode = reply_as<Mode>(result);
            if (!result.status.ok() || !mode) {
                return failure(verb, result.status);
            }
            return RigctldResponse::data(verb, {hamlib_mode(*mode), std::to_string(default_passband(*mode))});
        }

        case RigctldVerb::SetVfo: {
            const auto vfo = parse_hamlib_vfo(args[0]);
            if (!vfo) {
                return RigctldResponse::status(verb, ReturnCode::InvalidParameter);
            }
            return run(verb, common::SelectVfo{*vfo});
        }

        case RigctldVerb::GetVfo: {
            const auto result = orchestrator_.active_vfo();
            if (!result.ok()) {
                return failure(verb, result.status);
            }
            return RigctldResponse::data(verb, {hamlib_vfo(*result.value)});
        }

        case RigctldVerb::SetPtt:
            return run(verb, common::SetPtt{RigctldParser::parse_integer(args[0], "ptt") != 0});

        case RigctldVerb::GetPtt: {
            const auto result = orchestrator_.execute(actor_, common::ReadPtt{});
            const auto* on = reply_as<bool>(result);
            if (!result.status.ok() || !on) {
                return failure(verb, result.status);
            }
            return RigctldResponse::data(verb, {*on ? "1" : "0"});
        }

        case RigctldVerb::SetSplitVfo: {
            const auto caps = orchestrator_.capabilities();
            if (caps && !caps->features.split) {
                return RigctldResponse::status(verb, ReturnCode::NotSupported);
            }
            return run(verb, common::SetSplit{RigctldParser::parse_integer(args[0], "split") != 0});
        }

        case RigctldVerb::GetSplitVfo: {
            const auto caps = orchestrator_.capabilities();
            if (caps && !caps->features.split) {
                return RigctldResponse::status(verb, ReturnCode::NotSupported);
            }
            const auto result = orchestrator_.execute(actor_, common::ReadSplit{});
            const auto* on = reply_as<bool>(result);
            if (!result.status.ok() || !on) {
                return failure(verb, result.status);
            }
            return RigctldResponse::data(verb, {*on ? "1" : "0", "VFOB"});
        }

        case RigctldVerb::SetSplitFreq: {
            const auto caps = orchestrator_.capabilities();
            if (caps && !caps->features.split) {
                return RigctldResponse::status(verb, ReturnCode::NotSupported);
            }
            return run(verb, common::SetFrequency{common::Vfo::B, RigctldParser::parse_frequency(args[0])});
        }

        case RigctldVerb::GetSplitFreq: {
            const auto caps = orchestrator_.capabilities();
            if (caps && !caps->features.split) {
                return RigctldResponse::status(verb, ReturnCode::NotSupported);
            }
            const auto result = orchestrator_.execute(actor_, common::ReadFrequency{common::Vfo::B});
            const auto* hz = reply_as<std::uint64_t>(result);
            if (!result.status.ok() || !hz) {
                return failure(verb, result.status);
            }
            return RigctldResponse::data(verb, {std::to_string(*hz)});
        }

        case RigctldVerb::SetSplitMode: {
            const auto mode = parse_hamlib_mode(args[0]);
            if (!mode) {
                return RigctldResponse::status(verb, ReturnCode::InvalidParameter);
            }
            return split_mode(command, common::SetMode{*mode});
        }

        case RigctldVerb::GetSplitMode:
            return split_mode(command, common::ReadMode{});

        case RigctldVerb::SetLevel:
            return set_level(command);

        case RigctldVerb::GetLevel:
            return get_level(command);

        case RigctldVerb::SetFunc:
            return set_func(command);

        case RigctldVerb::GetFunc:
            return get_func(command);

        case RigctldVerb::SetRit: {
            const auto state = offset_state(command);
            if (!state) {
                return RigctldResponse::status(verb, ReturnCode::InvalidParameter);
            }
            return run(verb, common::SetRit{*state});
        }

        case RigctldVerb::GetRit:
        case RigctldVerb::GetXit: {
            const common::Command read = verb == RigctldVerb::GetRit ? common::Command{common::ReadRit{}}
                                                                     : common::Command{common::ReadXit{}};
            const auto result = orchestrator_.execute(actor_, read);
            const auto* state = reply_as<common::RitXitState>(result);
            if (!result.status.ok() || !state) {
                return failure(verb, result.status);
            }
            return RigctldResponse::data(verb, {std::to_string(state->enabled ? state->offset_hz : 0)});
        }

        case RigctldVerb::SetXit: {
            const auto state = offset_state(command);
            if (!state) {
                return RigctldResponse::status(verb, ReturnCode::InvalidParameter);
            }
            return run(verb, common::SetXit{*state});
        }

        case RigctldVerb::SetMem: {
            const auto channel = narrow(RigctldParser::parse_integer(args[0], "channel"));
            if (!channel) {
                return RigctldResponse::status(verb, ReturnCode::InvalidParameter);
            }
            return run(verb, common::SelectMemory{*channel});
        }

        case RigctldVerb::GetMem: {
            const auto result = orchestrator_.memory_channel();
            if (!result.ok()) {
                return failure(verb, result.status);
            }
            return RigctldResponse::data(verb, {std::to_string(*result.value)});
        }

        case RigctldVerb::Power2mW: {
            const auto caps = orchestrator_.capabilities();
            if (!caps) {
                return RigctldResponse::status(verb, ReturnCode::CommunicationError);
            }
            const double power = RigctldParser::parse_real(args[0], "power");
            if (power < 0.0 || power > 1.0) {
                return RigctldResponse::status(verb, ReturnCode::InvalidParameter);
            }
            const auto milliwatts = std::llround(power * caps->power.max_watts * 1000.0);
            return RigctldResponse::data(verb, {std::to_string(milliwatts)});
        }

        case RigctldVerb::MW2Power: {
            const auto caps = orchestrator_.capabilities();
            if (!caps || caps->power.max_watts <= 0) {
                return RigctldResponse::status(verb, caps ? ReturnCode::NotSupported : ReturnCode::CommunicationError);
            }
            const double watts = static_cast<double>(RigctldParser::parse_integer(args[0], "power")) / 1000.0;
            const double normalized = std::clamp(watts / caps->power.max_watts, 0.0, 1.0);
            return RigctldResponse::data(verb, {fixed6(normalized)});
        }

        case RigctldVerb::DumpCaps:
            return dump_caps(command);

        case RigctldVerb::DumpState:
            return dump_state(command);

        case RigctldVerb::ChkVfo:
            return RigctldResponse::data(verb, {"0"});

        case RigctldVerb::SetExtResponse:
        case RigctldVerb::Quit:
            return RigctldResponse::status(verb, ReturnCode::Ok);
    }
    return RigctldResponse::status(verb, ReturnCode::NotImplemented);
}

RigctldResponse RigctldHandler::run(RigctldVerb verb, const common::Command& command) {
    const auto result = orchestrator_.execute(actor_, command);
    return RigctldResponse::status(verb, return_code(result.status.code));
}

RigctldResponse RigctldHandler::set_level(const RigctldCommand& command) {
    const auto name = upper(command.args[0]);
    const double value = RigctldParser::parse_real(command.args[1], "level value");

    if (name == "RFPOWER") {
        const auto caps = orchestrator_.capabilities();
        if (!caps) {
            return RigctldResponse::status(command.verb, ReturnCode::CommunicationError);
        }
        if (value < 0.0 || value > 1.0) {
            return RigctldResponse::status(command.verb, ReturnCode::InvalidParameter);
        }
        const auto watts = static_cast<int>(std::lround(value * caps->power.max_watts));
        return run(command.verb, common::SetPower{watts});
    }
    if (name == "STRENGTH") {
        // Read-only meter.
        return RigctldResponse::status(command.verb, ReturnCode::InvalidParameter);
    }
    if (name == "AGC") {
        if (!std::isfinite(value) || value < 0.0 || value > 6.0 || value != std::floor(value)) {
            return RigctldResponse::status(command.verb, ReturnCode::InvalidParameter);
        }
        const auto speed = parse_hamlib_agc(static_cast<long>(value));
        if (!speed) {
            return RigctldResponse::status(command.verb, ReturnCode::InvalidParameter);
        }
        return run(command.verb, common::SetAgc{*speed});
    }
    return RigctldResponse::status(command.verb, ReturnCode::NotImplemented);
}

RigctldResponse RigctldHandler::get_level(const RigctldCommand& command) {
    const auto name = upper(command.args[0]);

    if (name == "RFPOWER") {
        const auto caps = orchestrator_.capabilities();
        if (!caps) {
            return RigctldResponse::status(command.verb, ReturnCode::CommunicationError);
        }
        const auto result = orchestrator_.execute(actor_, common::ReadPower{});
        const auto* watts = reply_as<int>(result);
        if (!result.status.ok() || !watts) {
            return failure(command.verb, result.status);
        }
        const double normalized = caps->power.max_watts > 0
                                      ? static_cast<double>(*watts) / caps->power.max_watts
                                      : 0.0;
        return RigctldResponse::data(command.verb, {fixed6(normalized)});
    }
    if (name == "STRENGTH") {
        const auto result = orchestrator_.execute(actor_, common::ReadSignalStrength{});
        const auto* strength = reply_as<common::SignalStrength>(result);
        if (!result.status.ok() || !strength) {
            return failure(command.verb, result.status);
        }
        return RigctldResponse::data(command.verb, {std::to_string(strength->db_relative_s9())});
    }
    if (name == "AGC") {
        const auto result = orchestrator_.execute(actor_, common::ReadAgc{});
        const auto* speed = reply_as<common::AgcSpeed>(result);
        if (!result.status.ok() || !speed) {
            return failure(command.verb, result.status);
        }
        return RigctldResponse::data(command.verb, {std::to_string(hamlib_agc(*speed))});
    }
    return RigctldResponse::status(command.verb, ReturnCode::NotImplemented);
}

RigctldResponse RigctldHandler::set_func(const RigctldCommand& command) {
    const auto name = upper(command.args[0]);
    const bool enabled = RigctldParser::parse_integer(command.args[1], "func value") != 0;
    if (name == "NB") {
        return run(command.verb, common::SetNoiseBlanker{enabled});
    }
    if (name == "NR") {
        return run(command.verb, common::SetNoiseReduction{enabled});
    }
    return RigctldResponse::status(command.verb, ReturnCode::NotImplemented);
}

RigctldResponse RigctldHandler::get_func(const RigctldCommand& command) {
    const auto name = upper(command.args[0]);
    if (name != "NB" && name != "NR") {
        return RigctldResponse::status(command.verb, ReturnCode::NotImplemented);
    }
    const common::Command read = name == "NB" ? common::Command{common::ReadNoiseBlanker{}}
                                              : common::Command{common::ReadNoiseReduction{}};
    const auto result = orchestrator_.execute(actor_, read);
    const auto* on = reply_as<bool>(result);
    if (!result.status.ok() || !on) {
        return failure(command.verb, result.status);
    }
    return RigctldResponse::data(command.verb, {*on ? "1" : "0"});
}

RigctldResponse RigctldHandler::split_mode(const RigctldCommand& command, const common::Command& operation) {
    const auto caps = orchestrator_.capabilities();
    if (!caps) {
        return RigctldResponse::status(command.verb, ReturnCode::CommunicationError);
    }
    if (!caps->features.split) {
        return RigctldResponse::status(command.verb, ReturnCode::NotSupported);
    }
    // FR also moves the transmit VFO on these radios, so selecting B would
    // cancel split.
    if (couples_tx_to_selection(caps->family)) {
        return RigctldResponse::status(command.verb, ReturnCode::NotImplemented);
    }

    const auto previous = orchestrator_.active_vfo();
    const auto restore_to = previous.ok() ? *previous.value : common::Vfo::A;

    const auto select = orchestrator_.execute(actor_, common::SelectVfo{common::Vfo::B});
    if (!select.status.ok()) {
        return failure(command.verb, select.status);
    }
    const auto result = orchestrator_.execute(actor_, operation);
    const auto restore = orchestrator_.execute(actor_, common::SelectVfo{restore_to});

    if (!result.status.ok()) {
        return failure(command.verb, result.status);
    }
    if (!restore.status.ok()) {
        return failure(command.verb, restore.status);
    }
    if (const auto* mode = reply_as<Mode>(result); mode && command.verb == RigctldVerb::GetSplitMode) {
        return RigctldResponse::data(command.verb, {hamlib_mode(*mode), std::to_string(default_passband(*mode))});
    }
    return RigctldResponse::status(command.verb, ReturnCode::Ok);
}

RigctldResponse RigctldHandler::dump_caps(const RigctldCommand& command) {
    const auto caps = orchestrator_.capabilities();
    if (!caps) {
        return RigctldResponse::status(command.verb, ReturnCode::CommunicationError);
    }

    std::vector<std::string> lines{
        "Caps dump for model: " + caps->model,
        "Model name: " + caps->model,
        "Mfg name: " + caps->manufacturer,
        "Backend: riglink",
        "Rig type: Transceiver",
        "PTT type: RIG",
        "Freq range:",
    };
    for (const auto& range : caps->ranges) {
        std::string line = "  " + std::to_string(range.min_hz) + "-" + std::to_string(range.max_hz) + " Hz";
        if (!range.band.empty()) {
            line += " (" + range.band + ")";
        }
        lines.push_back(line);
    }
    lines.emplace_back("Modes:");
    for (const auto mode : caps->modes) {
        lines.push_back("  " + hamlib_mode(mode));
    }
    if (caps->features.split) {
        lines.emplace_back("Split: Yes");
    }
    if (caps->features.power_control) {
        lines.push_back("Max power: " + std::to_string(caps->power.max_watts) + " W");
    }
    return RigctldResponse::data(command.verb, std::move(lines));
}

RigctldResponse RigctldHandler::dump_state(const RigctldCommand& command) {
    const auto caps = orchestrator_.capabilities();
    if (!caps) {
        return RigctldResponse::status(command.verb, ReturnCode::CommunicationError);
    }

    std::vector<std::string> lines{"0", "2", "1"};
    if (!caps->ranges.empty()) {
        std::uint64_t low = caps->ranges.front().min_hz;
        std::uint64_t high = caps->ranges.front().max_hz;
        for (const auto& range : caps->ranges) {
            low = std::min(low, range.min_hz);
            high = std::max(high, range.max_hz);
        }
        lines.push_back(std::to_string(low) + " " + std::to_string(high) + " 0x1ff -1 -1 0x3 0x3");
    }
    lines.emplace_back("0 0 0 0 0 0 0");
    lines.emplace_back(caps->features.vfo_b ? "VFOA VFOB" : "VFOA");
    return RigctldResponse::data(command.verb, std::move(lines));
}

}  // namespace riglink::net
