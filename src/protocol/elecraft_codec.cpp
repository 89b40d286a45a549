#include "riglink/protocol/cat_codec.hpp"

#include "riglink/common/errors.hpp"
#include "riglink/common/overloaded.hpp"

#include <algorithm>
#include <string_view>

namespace riglink::protocol {

namespace {

using common::Reply;

constexpr int kFrequencyDigits = 11;
constexpr int kPowerDigits = 3;
constexpr int kOffsetDigits = 4;
constexpr int kMemoryDigits = 3;
// SM; reads 0000-0021 on the K3 family; S9 at 15, 10 dB per step above.
constexpr int kMeterS9 = 15;

std::string frequency_verb(common::Vfo vfo) {
    return (vfo == common::Vfo::B || vfo == common::Vfo::Sub) ? "FB" : "FA";
}

// GT carries the AGC time constant: 002 fast, 004 slow. No off or auto.
constexpr std::string_view kAgcFast = "002";
constexpr std::string_view kAgcSlow = "004";

std::string absolute_offset(int offset_hz) {
    const char sign = offset_hz < 0 ? '-' : '+';
    const auto magnitude = static_cast<std::uint64_t>(offset_hz < 0 ? -offset_hz : offset_hz);
    return std::string{"RO"} + sign + cat::field(magnitude, kOffsetDigits) + ";";
}

}  // namespace

ElecraftCodec::ElecraftCodec(capability::CapabilitiesPtr caps)
    : CatCodecBase(std::move(caps), {"?"}) {}

std::optional<char> ElecraftCodec::mode_code(common::Mode mode) {
    switch (mode) {
        case common::Mode::LSB: return '1';
        case common::Mode::USB: return '2';
        case common::Mode::CW: return '3';
        case common::Mode::FM: return '4';
        case common::Mode::AM: return '5';
        case common::Mode::DataUSB: return '6';
        case common::Mode::CWR: return '7';
        case common::Mode::DataLSB: return '9';
        default: return std::nullopt;
    }
}

std::optional<common::Mode> ElecraftCodec::mode_from_code(char code) {
    switch (code) {
        case '1': return common::Mode::LSB;
        case '2': return common::Mode::USB;
        case '3': return common::Mode::CW;
        case '4': return common::Mode::FM;
        case '5': return common::Mode::AM;
        case '6': return common::Mode::DataUSB;
        case '7': return common::Mode::CWR;
        case '9': return common::Mode::DataLSB;
        default: return std::nullopt;
    }
}

Plan ElecraftCodec::encode(const common::Command& command) const {
    Plan plan;
    auto& out = plan.exchanges;
    std::visit(
        common::overloaded{
            [&](const common::ReadFrequency& c) { out.push_back(query(frequency_verb(c.vfo) + ";")); },
            [&](const common::SetFrequency& c) {
                const auto verb = frequency_verb(c.vfo);
                out.push_back(send(verb + cat::field(c.hz, kFrequencyDigits) + ";"));
                out.push_back(query(verb + ";"));
            },
            [&](const common::ReadMode&) { out.push_back(query("MD;")); },
            [&](const common::SetMode& c) {
                const auto code = mode_code(c.mode);
                if (!code) {
                    unsupported(command);
                }
                out.push_back(send(std::string{"MD"} + *code + ";"));
                out.push_back(query("MD;"));
            },
            [&](const common::SelectVfo& c) {
                if (c.vfo != common::Vfo::A && c.vfo != common::Vfo::B) {
                    unsupported(command);
                }
                out.push_back(send(c.vfo == common::Vfo::A ? "FR0;" : "FR1;"));
                out.push_back(query("FR;"));
                plan.selects_vfo = c.vfo;
            },
            [&](const common::ReadSplit&) { out.push_back(query("FT;")); },
            [&](const common::SetSplit& c) {
                out.push_back(send(c.enabled ? "FR0;FT1;" : "FR0;FT0;"));
                out.push_back(query("FT;"));
                plan.selects_vfo = common::Vfo::A;
            },
            [&](const common::ReadPower&) { out.push_back(query("PC;")); },
            [&](const common::SetPower& c) {
                out.push_back(send("PC" + cat::field(static_cast<std::uint64_t>(c.watts), kPowerDigits) + ";"));
                out.push_back(query("PC;"));
            },
            [&](const common::ReadPtt&) { out.push_back(query("IF;")); },
            [&](const common::SetPtt& c) {
                out.push_back(send(c.enabled ? "TX;" : "RX;"));
                out.push_back(query("IF;"));
            },
            [&](const common::ReadSignalStrength&) { out.push_back(query("SM;")); },
            [&](const common::ReadRit&) { out.push_back(query("IF;")); },
            [&](const common::SetRit& c) {
                out.push_back(send(absolute_offset(c.state.offset_hz) + (c.state.enabled ? "RT1;" : "RT0;")));
                out.push_back(query("IF;"));
            },
            [&](const common::ReadXit&) { out.push_back(query("IF;")); },
            [&](const common::SetXit& c) {
                out.push_back(send(absolute_offset(c.state.offset_hz) + (c.state.enabled ? "XT1;" : "XT0;")));
                out.push_back(query("IF;"));
            },
            [&](const common::SelectMemory& c) {
                out.push_back(send("MC" + cat::field(static_cast<std::uint64_t>(c.channel), kMemoryDigits) + ";"));
                out.push_back(query("MC;"));
            },
            [&](const common::StoreMemory&) { unsupported(command); },
            [&](const common::ClearMemory&) { unsupported(command); },
            [&](const common::SetSatelliteMode&) { unsupported(command); },
            [&](const common::ReadAgc&) { out.push_back(query("GT;")); },
            [&](const common::SetAgc& c) {
                if (c.speed != common::AgcSpeed::Fast && c.speed != common::AgcSpeed::Slow) {
                    unsupported(command);
                }
                const auto value = c.speed == common::AgcSpeed::Fast ? kAgcFast : kAgcSlow;
                out.push_back(send("GT" + std::string{value} + ";"));
                out.push_back(query("GT;"));
            },
            [&](const common::ReadNoiseBlanker&) { out.push_back(query("NB;")); },
            [&](const common::SetNoiseBlanker& c) {
                out.push_back(send(c.enabled ? "NB1;" : "NB0;"));
                out.push_back(query("NB;"));
            },
            [&](const common::ReadNoiseReduction&) { out.push_back(query("NR;")); },
            [&](const common::SetNoiseReduction& c) {
                out.push_back(send(c.enabled ? "NR1;" : "NR0;"));
                out.push_back(query("NR;"));
            },
            [&](const common::ReadFilter&) { unsupported(command); },
            [&](const common::SetFilter&) { unsupported(command); },
            [&](const common::ReadMemory&) { unsupported(command); },
            [&](const common::WriteMemory&) { unsupported(command); },
        },
        command);
    return plan;
}

Reply ElecraftCodec::decode(const common::Command& command, const std::vector<common::Bytes>& replies) const {
    const auto status = [&]() {
        auto text = payload_at(replies, 0, "IF");
        if (text.size() < cat::if_answer::kLength) {
            throw common::FramingError("Short IF answer (" + std::to_string(text.size()) + " chars)");
        }
        return text;
    };
    const auto frequency = [&](common::Vfo vfo) -> Reply {
        const auto text = payload_at(replies, 0, frequency_verb(vfo));
        if (text.size() != static_cast<std::size_t>(kFrequencyDigits)) {
            throw common::FramingError("Frequency field is not " + std::to_string(kFrequencyDigits) + " digits");
        }
        return number(text, "frequency");
    };
    const auto mode = [&]() -> Reply {
        const auto text = payload_at(replies, 0, "MD");
        const auto decoded = mode_from_code(flag_at(text, 0, "mode"));
        if (!decoded) {
            throw common::FramingError("Unknown Elecraft mode code '" + text + "'");
        }
        return *decoded;
    };
    const auto split = [&]() -> Reply { return flag_at(payload_at(replies, 0, "FT"), 0, "split") == '1'; };
    const auto power = [&]() -> Reply {
        return static_cast<int>(number(payload_at(replies, 0, "PC").substr(0, kPowerDigits), "power"));
    };
    const auto transmit = [&]() -> Reply { return flag_at(status(), cat::if_answer::kTransmit, "transmit") == '1'; };
    const auto offset_state = [&](std::size_t flag_index) -> Reply {
        const auto text = status();
        return common::RitXitState{flag_at(text, flag_index, "offset switch") == '1',
                                   signed_number(text.substr(cat::if_answer::kOffset, 5), "offset")};
    };
    const auto agc = [&]() -> Reply {
        const auto text = payload_at(replies, 0, "GT");
        if (text == kAgcFast) {
            return common::AgcSpeed::Fast;
        }
        if (text == kAgcSlow) {
            return common::AgcSpeed::Slow;
        }
        throw common::FramingError("Unknown Elecraft AGC answer '" + text + "'");
    };
    const auto switch_state = [&](std::string_view verb) -> Reply {
        return flag_at(payload_at(replies, 0, verb), 0, verb) != '0';
    };

    return std::visit(
        common::overloaded{
            [&](const common::ReadFrequency& c) { return frequency(c.vfo); },
            [&](const common::SetFrequency& c) { return frequency(c.vfo); },
            [&](const common::ReadMode&) { return mode(); },
            [&](const common::SetMode&) { return mode(); },
            [&](const common::SelectVfo&) -> Reply {
                return flag_at(payload_at(replies, 0, "FR"), 0, "VFO") == '1' ? common::Vfo::B : common::Vfo::A;
            },
            [&](const common::ReadSplit&) { return split(); },
            [&](const common::SetSplit&) { return split(); },
            [&](const common::ReadPower&) { return power(); },
            [&](const common::SetPower&) { return power(); },
            [&](const common::ReadPtt&) { return transmit(); },
            [&](const common::SetPtt&) { return transmit(); },
            [&](const common::ReadSignalStrength&) -> Reply {
                const auto raw = static_cast<int>(number(payload_at(replies, 0, "SM"), "meter"));
                common::SignalStrength signal;
                signal.raw = raw;
                signal.s_units = std::min(9, raw * 9 / kMeterS9);
                signal.over_s9_db = raw > kMeterS9 ? std::min(60, (raw - kMeterS9) * 10) : 0;
                return signal;
            },
            [&](const common::ReadRit&) { return offset_state(cat::if_answer::kRit); },
            [&](const common::SetRit&) { return offset_state(cat::if_answer::kRit); },
            [&](const common::ReadXit&) { return offset_state(cat::if_answer::kXit); },
            [&](const common::SetXit&) { return offset_state(cat::if_answer::kXit); },
            [&](const common::SelectMemory&) -> Reply {
                return static_cast<int>(number(payload_at(replies, 0, "MC"), "memory channel"));
            },
            [&](const common::ReadAgc&) { return agc(); },
            [&](const common::SetAgc&) { return agc(); },
            [&](const common::ReadNoiseBlanker&) { return switch_state("NB"); },
            [&](const common::SetNoiseBlanker&) { return switch_state("NB"); },
            [&](const common::ReadNoiseReduction&) { return switch_state("NR"); },
            [&](const common::SetNoiseReduction&) { return switch_state("NR"); },
            [&](const auto&) -> Reply { return common::Ack{}; },
        },
        command);
}

}  // namespace riglink::protocol
