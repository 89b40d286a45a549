#include "riglink/protocol/cat_codec.hpp"

#include "riglink/common/errors.hpp"
#include "riglink/common/overloaded.hpp"

#include <algorithm>

namespace riglink::protocol {

namespace {

using common::Reply;

constexpr int kFrequencyDigits = 9;
constexpr int kPowerDigits = 3;
constexpr int kOffsetDigits = 4;
constexpr int kMemoryDigits = 3;

// SM0 reads 000-255; roughly 13 counts per S-unit, S9 at 117, 2 counts per dB above.
constexpr int kMeterPerSUnit = 13;
constexpr int kMeterS9 = 117;

// Offsets in the Yaesu IF; answer after the verb.
namespace status_field {
constexpr std::size_t kLength = 25;
constexpr std::size_t kOffset = 12;
constexpr std::size_t kRxClarifier = 17;
constexpr std::size_t kTxClarifier = 18;
}  // namespace status_field

std::string frequency_verb(common::Vfo vfo) {
    return (vfo == common::Vfo::B || vfo == common::Vfo::Sub) ? "FB" : "FA";
}

// GT0 answers 4-6 for the three AUTO variants; sets use 4.
char agc_digit(common::AgcSpeed speed) {
    switch (speed) {
        case common::AgcSpeed::Off: return '0';
        case common::AgcSpeed::Fast: return '1';
        case common::AgcSpeed::Medium: return '2';
        case common::AgcSpeed::Slow: return '3';
        case common::AgcSpeed::Auto: return '4';
    }
    return '4';
}

std::optional<common::AgcSpeed> agc_from_digit(char digit) {
    switch (digit) {
        case '0': return common::AgcSpeed::Off;
        case '1': return common::AgcSpeed::Fast;
        case '2': return common::AgcSpeed::Medium;
        case '3': return common::AgcSpeed::Slow;
        case '4':
        case '5':
        case '6': return common::AgcSpeed::Auto;
        default: return std::nullopt;
    }
}

std::string clarifier_commands(int offset_hz) {
    std::string text = "RC;";
    if (offset_hz > 0) {
        text += "RU" + cat::field(static_cast<std::uint64_t>(offset_hz), kOffsetDigits) + ";";
    } else if (offset_hz < 0) {
        text += "RD" + cat::field(static_cast<std::uint64_t>(-offset_hz), kOffsetDigits) + ";";
    }
    return text;
}

}  // namespace

YaesuCodec::YaesuCodec(capability::CapabilitiesPtr caps)
    : CatCodecBase(std::move(caps), {"?"}) {}

std::optional<char> YaesuCodec::mode_code(common::Mode mode) {
    switch (mode) {
        case common::Mode::LSB: return '1';
        case common::Mode::USB: return '2';
        case common::Mode::CW: return '3';
        case common::Mode::FM: return '4';
        case common::Mode::AM: return '5';
        case common::Mode::RTTY: return '6';
        case common::Mode::CWR: return '7';
        case common::Mode::DataLSB: return '8';
        case common::Mode::RTTYR: return '9';
        case common::Mode::DataFM: return 'A';
        case common::Mode::FMN: return 'B';
        case common::Mode::DataUSB: return 'C';
        default: return std::nullopt;
    }
}

std::optional<common::Mode> YaesuCodec::mode_from_code(char code) {
    switch (code) {
        case '1': return common::Mode::LSB;
        case '2': return common::Mode::USB;
        case '3': return common::Mode::CW;
        case '4': return common::Mode::FM;
        case '5': return common::Mode::AM;
        case '6': return common::Mode::RTTY;
        case '7': return common::Mode::CWR;
        case '8': return common::Mode::DataLSB;
        case '9': return common::Mode::RTTYR;
        case 'A': return common::Mode::DataFM;
        case 'B': return common::Mode::FMN;
        case 'C': return common::Mode::DataUSB;
        default: return std::nullopt;
    }
}

Plan YaesuCodec::encode(const common::Command& command) const {
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
            [&](const common::ReadMode&) { out.push_back(query("MD0;")); },
            [&](const common::SetMode& c) {
                const auto code = mode_code(c.mode);
                if (!code) {
                    unsupported(command);
                }
                out.push_back(send(std::string{"MD0"} + *code + ";"));
                out.push_back(query("MD0;"));
            },
            [&](const common::SelectVfo& c) {
                if (c.vfo != common::Vfo::A && c.vfo != common::Vfo::B) {
                    unsupported(command);
                }
                out.push_back(send(c.vfo == common::Vfo::A ? "VS0;" : "VS1;"));
                out.push_back(query("VS;"));
                plan.selects_vfo = c.vfo;
            },
            [&](const common::ReadSplit&) { out.push_back(query("ST;")); },
            [&](const common::SetSplit& c) {
                out.push_back(send(c.enabled ? "ST1;" : "ST0;"));
                out.push_back(query("ST;"));
            },
            [&](const common::ReadPower&) { out.push_back(query("PC;")); },
            [&](const common::SetPower& c) {
                out.push_back(send("PC" + cat::field(static_cast<std::uint64_t>(c.watts), kPowerDigits) + ";"));
                out.push_back(query("PC;"));
            },
            [&](const common::ReadPtt&) { out.push_back(query("TX;")); },
            [&](const common::SetPtt& c) {
                out.push_back(send(c.enabled ? "TX1;" : "TX0;"));
                out.push_back(query("TX;"));
            },
            [&](const common::ReadSignalStrength&) { out.push_back(query("SM0;")); },
            [&](const common::ReadRit&) { out.push_back(query("IF;")); },
            [&](const common::SetRit& c) {
                out.push_back(send(clarifier_commands(c.state.offset_hz) + (c.state.enabled ? "RT1;" : "RT0;")));
                out.push_back(query("IF;"));
            },
            [&](const common::ReadXit&) { out.push_back(query("IF;")); },
            [&](const common::SetXit& c) {
                out.push_back(send(clarifier_commands(c.state.offset_hz) + (c.state.enabled ? "XT1;" : "XT0;")));
                out.push_back(query("IF;"));
            },
            [&](const common::SelectMemory& c) {
                out.push_back(send("MC" + cat::field(static_cast<std::uint64_t>(c.channel), kMemoryDigits) + ";"));
                out.push_back(query("MC;"));
            },
            [&](const common::StoreMemory&) { unsupported(command); },
            [&](const common::ClearMemory&) { unsupported(command); },
            [&](const common::SetSatelliteMode&) { unsupported(command); },
            [&](const common::ReadAgc&) { out.push_back(query("GT0;")); },
            [&](const common::SetAgc& c) {
                out.push_back(send(std::string{"GT0"} + agc_digit(c.speed) + ";"));
                out.push_back(query("GT0;"));
            },
            [&](const common::ReadNoiseBlanker&) { out.push_back(query("NB0;")); },
            [&](const common::SetNoiseBlanker& c) {
                out.push_back(send(c.enabled ? "NB01;" : "NB00;"));
                out.push_back(query("NB0;"));
            },
            [&](const common::ReadNoiseReduction&) { out.push_back(query("NR0;")); },
            [&](const common::SetNoiseReduction& c) {
                out.push_back(send(c.enabled ? "NR01;" : "NR00;"));
                out.push_back(query("NR0;"));
            },
            [&](const common::ReadFilter&) { unsupported(command); },
            [&](const common::SetFilter&) { unsupported(command); },
            [&](const common::ReadMemory&) { unsupported(command); },
            [&](const common::WriteMemory&) { unsupported(command); },
        },
        command);
    return plan;
}

Reply YaesuCodec::decode(const common::Command& command, const std::vector<common::Bytes>& replies) const {
    const auto frequency = [&](common::Vfo vfo) -> Reply {
        const auto text = payload_at(replies, 0, frequency_verb(vfo));
        if (text.size() != static_cast<std::size_t>(kFrequencyDigits)) {
            throw common::FramingError("Frequency field is not " + std::to_string(kFrequencyDigits) + " digits");
        }
        return number(text, "frequency");
    };
    const auto mode = [&]() -> Reply {
        const auto text = payload_at(replies, 0, "MD0");
        const auto decoded = mode_from_code(flag_at(text, 0, "mode"));
        if (!decoded) {
            throw common::FramingError("Unknown Yaesu mode code '" + text + "'");
        }
        return *decoded;
    };
    const auto split = [&]() -> Reply { return flag_at(payload_at(replies, 0, "ST"), 0, "split") != '0'; };
    const auto power = [&]() -> Reply {
        return static_cast<int>(number(payload_at(replies, 0, "PC").substr(0, kPowerDigits), "power"));
    };
    // TX2 means transmitting from the microphone PTT.
    const auto transmit = [&]() -> Reply { return flag_at(payload_at(replies, 0, "TX"), 0, "transmit") != '0'; };
    const auto clarifier = [&](std::size_t flag_index) -> Reply {
        const auto text = payload_at(replies, 0, "IF");
        if (text.size() < status_field::kLength) {
            throw common::FramingError("Short IF answer (" + std::to_string(text.size()) + " chars)");
        }
        return common::RitXitState{flag_at(text, flag_index, "clarifier switch") == '1',
                                   signed_number(text.substr(status_field::kOffset, 5), "clarifier")};
    };
    const auto agc = [&]() -> Reply {
        const auto text = payload_at(replies, 0, "GT0");
        const auto speed = agc_from_digit(flag_at(text, 0, "AGC"));
        if (!speed) {
            throw common::FramingError("Unknown Yaesu AGC answer '" + text + "'");
        }
        return *speed;
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
                return flag_at(payload_at(replies, 0, "VS"), 0, "VFO") == '1' ? common::Vfo::B : common::Vfo::A;
            },
            [&](const common::ReadSplit&) { return split(); },
            [&](const common::SetSplit&) { return split(); },
            [&](const common::ReadPower&) { return power(); },
            [&](const common::SetPower&) { return power(); },
            [&](const common::ReadPtt&) { return transmit(); },
            [&](const common::SetPtt&) { return transmit(); },
            [&](const common::ReadSignalStrength&) -> Reply {
                const auto raw = static_cast<int>(number(payload_at(replies, 0, "SM0"), "meter"));
                common::SignalStrength signal;
                signal.raw = raw;
                signal.s_units = std::min(9, raw / kMeterPerSUnit);
                signal.over_s9_db = raw > kMeterS9 ? std::min(60, (raw - kMeterS9) / 2) : 0;
                return signal;
            },
            [&](const common::ReadRit&) { return clarifier(status_field::kRxClarifier); },
            [&](const common::SetRit&) { return clarifier(status_field::kRxClarifier); },
            [&](const common::ReadXit&) { return clarifier(status_field::kTxClarifier); },
            [&](const common::SetXit&) { return clarifier(status_field::kTxClarifier); },
            [&](const common::SelectMemory&) -> Reply {
                return static_cast<int>(number(payload_at(replies, 0, "MC"), "memory channel"));
            },
            [&](const common::ReadAgc&) { return agc(); },
            [&](const common::SetAgc&) { return agc(); },
            [&](const common::ReadNoiseBlanker&) { return switch_state("NB0"); },
            [&](const common::SetNoiseBlanker&) { return switch_state("NB0"); },
            [&](const common::ReadNoiseReduction&) { return switch_state("NR0"); },
            [&](const common::SetNoiseReduction&) { return switch_state("NR0"); },
            [&](const auto&) -> Reply { return common::Ack{}; },
        },
        command);
}

}  // namespace riglink::protocol
