#include "riglink/capability/validator.hpp"

#include "riglink/common/overloaded.hpp"

#include <algorithm>
#include <string>

namespace riglink::capability {

namespace {

using common::CommandResult;
using common::ErrorCode;

CommandResult ok() { return {}; }

CommandResult reject(const RadioCapabilities& caps, const std::string& reason) {
    return {ErrorCode::Capability, caps.model + ": " + reason};
}

CommandResult check_vfo(const RadioCapabilities& caps, common::Vfo vfo) {
    switch (vfo) {
        case common::Vfo::A:
            return ok();
        case common::Vfo::B:
            return caps.features.vfo_b ? ok() : reject(caps, "VFO B not available");
        case common::Vfo::Main:
        case common::Vfo::Sub:
            return caps.features.dual_receiver ? ok() : reject(caps, "no main/sub receivers");
    }
    return reject(caps, "unknown VFO");
}

CommandResult check_feature(const RadioCapabilities& caps, bool present, const char* name) {
    return present ? ok() : reject(caps, std::string{name} + " not supported");
}

CommandResult check_offset(const RadioCapabilities& caps, const common::RitXitState& state) {
    if (state.offset_hz < -kMaxRitOffsetHz || state.offset_hz > kMaxRitOffsetHz) {
        return reject(caps, "offset " + std::to_string(state.offset_hz) + " Hz exceeds +/-" +
                                std::to_string(kMaxRitOffsetHz) + " Hz");
    }
    return ok();
}

CommandResult check_memory(const RadioCapabilities& caps, int channel) {
    if (caps.memory.count == 0) {
        return reject(caps, "memory channels not supported");
    }
    if (!caps.memory.contains(channel)) {
        return reject(caps, "memory channel " + std::to_string(channel) + " out of range");
    }
    return ok();
}

CommandResult check_agc(const RadioCapabilities& caps, common::AgcSpeed speed) {
    if (caps.agc_speeds.empty()) {
        return reject(caps, "AGC control not supported");
    }
    if (!caps.supports_agc(speed)) {
        return reject(caps, "AGC " + common::to_string(speed) + " not supported");
    }
    return ok();
}

CommandResult check_memory_contents(const RadioCapabilities& caps, int channel) {
    if (!caps.features.memory_contents) {
        return reject(caps, "memory contents not supported");
    }
    return check_memory(caps, channel);
}

CommandResult check_write_memory(const RadioCapabilities& caps, const common::MemoryContents& contents) {
    if (auto result = check_memory_contents(caps, contents.channel); !result.ok()) {
        return result;
    }
    if (contents.blank) {
        return ok();
    }
    if (!caps.supports_frequency(contents.frequency_hz)) {
        return reject(caps, "frequency " + std::to_string(contents.frequency_hz) + " Hz outside supported ranges");
    }
    if (!caps.supports_mode(contents.mode)) {
        return reject(caps, "mode " + common::to_string(contents.mode) + " not supported");
    }
    if (contents.name.size() > common::kMemoryNameLength) {
        return reject(caps, "memory name longer than " + std::to_string(common::kMemoryNameLength) + " characters");
    }
    const auto printable = std::all_of(contents.name.begin(), contents.name.end(),
                                       [](char c) { return c >= 0x20 && c <= 0x7E; });
    if (!printable) {
        return reject(caps, "memory name must be printable ASCII");
    }
    return ok();
}

}  // namespace

CommandResult Validator::validate(const RadioCapabilities& caps, const common::Command& command) {
    return std::visit(
        common::overloaded{
            [&](const common::ReadFrequency& c) { return check_vfo(caps, c.vfo); },
            [&](const common::SetFrequency& c) {
                if (auto result = check_vfo(caps, c.vfo); !result.ok()) {
                    return result;
                }
                if (!caps.supports_frequency(c.hz)) {
                    return reject(caps, "frequency " + std::to_string(c.hz) + " Hz outside supported ranges");
                }
                return ok();
            },
            [&](const common::ReadMode&) { return ok(); },
            [&](const common::SetMode& c) {
                return caps.supports_mode(c.mode) ? ok() : reject(caps, "mode " + common::to_string(c.mode) + " not supported");
            },
            [&](const common::SelectVfo& c) { return check_vfo(caps, c.vfo); },
            [&](const common::ReadSplit&) { return check_feature(caps, caps.features.split, "split"); },
            [&](const common::SetSplit&) { return check_feature(caps, caps.features.split, "split"); },
            [&](const common::ReadPower&) {
                return check_feature(caps, caps.features.power_control, "power control");
            },
            [&](const common::SetPower& c) {
                if (!caps.features.power_control) {
                    return reject(caps, "power control not supported");
                }
                if (c.watts < caps.power.min_watts || c.watts > caps.power.max_watts) {
                    return reject(caps, "power " + std::to_string(c.watts) + " W outside " +
                                            std::to_string(caps.power.min_watts) + "-" +
                                            std::to_string(caps.power.max_watts) + " W");
                }
                return ok();
            },
            [&](const common::ReadPtt&) { return check_feature(caps, caps.features.ptt, "transmit"); },
            [&](const common::SetPtt&) { return check_feature(caps, caps.features.ptt, "transmit"); },
            [&](const common::ReadSignalStrength&) {
                return check_feature(caps, caps.features.signal_strength, "signal strength");
            },
            [&](const common::ReadRit&) { return check_feature(caps, caps.features.rit, "RIT"); },
            [&](const common::SetRit& c) {
                if (!caps.features.rit) {
                    return reject(caps, "RIT not supported");
                }
                return check_offset(caps, c.state);
            },
            [&](const common::ReadXit&) { return check_feature(caps, caps.features.xit, "XIT"); },
            [&](const common::SetXit& c) {
                if (!caps.features.xit) {
                    return reject(caps, "XIT not supported");
                }
                return check_offset(caps, c.state);
            },
            [&](const common::SelectMemory& c) { return check_memory(caps, c.channel); },
            [&](const common::StoreMemory& c) { return check_memory(caps, c.channel); },
            [&](const common::ClearMemory& c) { return check_memory(caps, c.channel); },
            [&](const common::SetSatelliteMode&) {
                return check_feature(caps, caps.features.satellite, "satellite mode");
            },
            [&](const common::ReadAgc&) {
                return caps.agc_speeds.empty() ? reject(caps, "AGC control not supported") : ok();
            },
            [&](const common::SetAgc& c) { return check_agc(caps, c.speed); },
            [&](const common::ReadNoiseBlanker&) {
                return check_feature(caps, caps.features.noise_blanker, "noise blanker");
            },
            [&](const common::SetNoiseBlanker&) {
                return check_feature(caps, caps.features.noise_blanker, "noise blanker");
            },
            [&](const common::ReadNoiseReduction&) {
                return check_feature(caps, caps.features.noise_reduction, "noise reduction");
            },
            [&](const common::SetNoiseReduction&) {
                return check_feature(caps, caps.features.noise_reduction, "noise reduction");
            },
            [&](const common::ReadFilter&) { return check_feature(caps, caps.features.if_filter, "IF filter"); },
            [&](const common::SetFilter& c) {
                if (!caps.features.if_filter) {
                    return reject(caps, "IF filter not supported");
                }
                return caps.supports_mode(c.mode) ? ok() : reject(caps, "mode " + common::to_string(c.mode) + " not supported");
            },
            [&](const common::ReadMemory& c) { return check_memory_contents(caps, c.channel); },
            [&](const common::WriteMemory& c) { return check_write_memory(caps, c.contents); },
        },
        command);
}

}  // namespace riglink::capability
