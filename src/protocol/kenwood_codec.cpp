#include "riglink/protocol/cat_codec.hpp"

#include "riglink/common/errors.hpp"
#include "riglink/common/overloaded.hpp"

#include <algorithm>

namespace riglink::protocol {

namespace {

using common::Reply;

constexpr int kFrequencyDigits = 11;
constexpr int kPowerDigits = 3;
constexpr int kOffsetDigits = 5;
constexpr int kMemoryDigits = 3;
// SM0 reads 0000-0030; S9 sits at 15, each step above adds 4 dB.
constexpr int kMeterS9 = 15;

std::string frequency_verb(common::Vfo vfo) {
    return (vfo == common::Vfo::B || vfo == common::Vfo::Sub) ? "FB" : "FA";
}

std::optional<char> agc_digit(common::AgcSpeed speed) {
    switch (speed) {
        case common::AgcSpeed::Off: return '0';
        case common::AgcSpeed::Slow: return '1';
        case common::AgcSpeed::Fast: return '2';
        case common::AgcSpeed::Medium: return '3';
        case common::AgcSpeed::Auto: return std::nullopt;
    }
    return std::nullopt;
}

std::optional<common::AgcSpeed> agc_from_digit(char digit) {
    switch (digit) {
        case '0': return common::AgcSpeed::Off;
        case '1': return common::AgcSpeed::Slow;
        case '2': return common::AgcSpeed::Fast;
        case '3': return common::AgcSpeed::Medium;
        default: return std::nullopt;
    }
}

std::string offset_commands(int offset_hz) {
    std::string text = "RC;";
    if (offset_hz > 0) {
        text += "RU" + cat::field(static_cast<std::uint64_t>(offset_hz), kOffsetDigits) + ";";
    } else if (offset_hz < 0) {
        text += "RD" + cat::field(static_cast<std::uint64_t>(-offset_hz), kOffsetDigits) + ";";
    }
    return text;
}

}  // namespace

KenwoodCodec::KenwoodCodec(capability::CapabilitiesPtr caps)
    : CatCodecBase(std::move(caps), {"?", "E", "O"}) {}

std::optional<char> KenwoodCodec::mode_code(common::Mode mode) {
    switch (mode) {
        case common::Mode::LSB: return '1';
        case common::Mode::USB: return '2';
        case common::Mode::CW: return '3';
        case common::Mode::FM: return '4';
        case common::Mode::AM: return '5';
        case common::Mode::RTTY: return '6';
        case common::Mode::CWR: return '7';
        case common::Mode::RTTYR: return '9';
        default: return std::nullopt;
    }
}

std::optional<common::Mode> KenwoodCodec::mode_from_code(char code) {
    switch (code) {
        case '1': return common::Mode::LSB;
        case '2': return common::Mode::USB;
        case '3': return common::Mode::CW;
        case '4': return common::Mode::FM;
        case '5': return common::Mode::AM;
        case '6': return common::Mode::RTTY;
        case '7': return common::Mode::CWR;
        case '9': return common::Mode::RTTYR;
        default: return std::nullopt;
    }
}

Plan KenwoodCodec::encode(const common::Command& command) const {
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
                if (c.vfo == common::Vfo::A) {
                    out.push_back(send("FR0;FT0;"));
                } else if (c.vfo == common::Vfo::B) {
                    out.push_back(send("FR1;FT1;"));
                } else {
                    unsupported(command);
                }
                out.push_back(query("FR;"));
                plan.selects_vfo = c.vfo;
            },
            [&](const common::ReadSplit&) { out.push_back(query("IF;")); },
            [&](const common::SetSplit& c) {
                out.push_back(send(c.enabled ? "FR0;FT1;" : "FR0;FT0;"));
                out.push_back(query("IF;"));
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
            [&](const common::ReadSignalStrength&) { out.push_back(query("SM0;")); },
            [&](const common::ReadRit&) { out.push_back(query("IF;")); },
            [&](const common::SetRit& c) {
                out.push_back(send(offset_commands(c.state.offset_hz) + (c.state.enabled ? "RT1;" : "RT0;")));
                out.push_back(query("IF;"));
            },
            [&](const common::ReadXit&) { out.push_back(query("IF;")); },
            [&](const common::SetXit& c) {
                out.push_back(send(offset_commands(c.state.offset_hz) + (c.state.enabled ? "XT1;" : "XT0;")));
                out.push_back(query("IF;"));
            },
            [&](const common::SelectMemory& c) {
                out.push_back(send("MC" + cat::field(static_cast<std::uint64_t>(c.channel), kMemoryDigits) + ";"));
                out.push_back(query("MC;"));
            },
            [&](const common::StoreMemory&) { unsupported(command); },
            [&](const common::ClearMemory&) { unsupported(command); },
            [&](const common::SetSatelliteMode&) { unsupported(command); },
            [&](const common::ReadAgc&) { out.push_back(query("GC;")); },
            [&](const common::SetAgc& c) {
                const auto digit = agc_digit(c.speed);
                if (!digit) {
                    unsupported(command);
                }
                out.push_back(send(std::string{"GC"} + *digit + ";"));
                out.push_back(query("GC;"));
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

Reply KenwoodCodec::decode(const common::Command& command, const std::vector<common::Bytes>& replies) const {
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
            throw common::FramingError("Unknown Kenwood mode code '" + text + "'");
        }
        return *decoded;
    };
    const auto offset_state = [&](std::size_t flag_index) -> Reply {
        const auto text = status();
        return common::RitXitState{flag_at(text, flag_index, "offset switch") == '1',
                                   signed_number(text.substr(cat::if_answer::kOffset, 5), "offset")};
    };
    const auto agc = [&]() -> Reply {
        const auto text = payload_at(replies, 0, "GC");
        const auto speed = agc_from_digit(flag_at(text, 0, "AGC"));
        if (!speed) {
            throw common::FramingError("Unknown Kenwood AGC answer '" + text + "'");
        }
        return *speed;
    };
    // NB2 and NR2 are the radio's second algorithms; both count as on.
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
                const auto text = payload_at(replies, 0, "FR");
                return flag_at(text, 0, "VFO") == '1' ? common::Vfo::B : common::Vfo::A;
            },
            [&](const common::ReadSplit&) -> Reply {
                return flag_at(status(), cat::if_answer::kSplit, "split") == '1';
            },
            [&](const common::SetSplit&) -> Reply {
                return flag_at(status(), cat::if_answer::kSplit, "split") == '1';
            },
            [&](const common::ReadPower&) -> Reply {
                return static_cast<int>(number(payload_at(replies, 0, "PC").substr(0, kPowerDigits), "power"));
            },
            [&](const common::SetPower&) -> Reply {
                return static_cast<int>(number(payload_at(replies, 0, "PC").substr(0, kPowerDigits), "power"));
            },
            [&](const common::ReadPtt&) -> Reply {
                return flag_at(status(), cat::if_answer::kTransmit, "transmit") == '1';
            },
            [&](const common::SetPtt&) -> Reply {
                return flag_at(status(), cat::if_answer::kTransmit, "transmit") == '1';
            },
            [&](const common::ReadSignalStrength&) -> Reply {
                const auto raw = static_cast<int>(number(payload_at(replies, 0, "SM0"), "meter"));
                common::SignalStrength signal;
                signal.raw = raw;
                signal.s_units = std::min(9, raw * 9 / kMeterS9);
                signal.over_s9_db = raw > kMeterS9 ? std::min(60, (raw - kMeterS9) * 4) : 0;
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
