#include "riglink/protocol/civ_codec.hpp"

#include "riglink/common/errors.hpp"
#include "riglink/common/overloaded.hpp"
#include "riglink/protocol/bcd.hpp"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <string>

namespace riglink::protocol {

namespace {

using common::Bytes;
using common::Reply;

// Icom meter/level scales.
constexpr int kLevelMax = 255;
constexpr int kSMeterS9 = 120;
constexpr int kSMeterS9Plus60 = 241;

std::string hex(std::uint8_t byte) {
    char buf[5];
    std::snprintf(buf, sizeof(buf), "0x%02X", byte);
    return buf;
}

const Bytes& reply_at(const std::vector<Bytes>& replies, std::size_t index) {
    if (index >= replies.size()) {
        throw common::FramingError("Missing CI-V reply");
    }
    return replies[index];
}

std::uint8_t single_byte(const civ::Frame& frame) {
    if (frame.data.size() != 1) {
        throw common::FramingError("Expected one data byte, got " + std::to_string(frame.data.size()));
    }
    return frame.data[0];
}

int level_value(const civ::Frame& frame) {
    if (frame.data.size() != 2) {
        throw common::FramingError("Expected two BCD level bytes, got " + std::to_string(frame.data.size()));
    }
    return static_cast<int>(bcd::decode_be(frame.data.data(), 2));
}

common::SignalStrength signal_from_raw(int raw) {
    common::SignalStrength signal;
    signal.raw = raw;
    if (raw <= kSMeterS9) {
        signal.s_units = raw * 9 / kSMeterS9;
    } else {
        signal.s_units = 9;
        signal.over_s9_db = std::min(60, (raw - kSMeterS9) * 60 / (kSMeterS9Plus60 - kSMeterS9));
    }
    return signal;
}

Bytes offset_payload(int offset_hz) {
    auto data = bcd::encode_le(static_cast<std::uint64_t>(std::abs(offset_hz)), 2);
    data.push_back(offset_hz < 0 ? 0x01 : 0x00);
    return data;
}

int offset_from_frame(const civ::Frame& frame) {
    if (frame.data.size() != 3) {
        throw common::FramingError("Expected three offset bytes, got " + std::to_string(frame.data.size()));
    }
    const auto magnitude = static_cast<int>(bcd::decode_le(frame.data.data(), 2));
    return frame.data[2] == 0x01 ? -magnitude : magnitude;
}

std::uint8_t switch_byte(bool enabled) {
    return static_cast<std::uint8_t>(enabled ? 0x01 : 0x00);
}

std::optional<std::uint8_t> agc_code(common::AgcSpeed speed) {
    switch (speed) {
        case common::AgcSpeed::Off: return 0x00;
        case common::AgcSpeed::Fast: return 0x01;
        case common::AgcSpeed::Medium: return 0x02;
        case common::AgcSpeed::Slow: return 0x03;
        case common::AgcSpeed::Auto: return std::nullopt;
    }
    return std::nullopt;
}

common::AgcSpeed agc_from_code(std::uint8_t code) {
    switch (code) {
        case 0x00: return common::AgcSpeed::Off;
        case 0x01: return common::AgcSpeed::Fast;
        case 0x02: return common::AgcSpeed::Medium;
        case 0x03: return common::AgcSpeed::Slow;
        default: throw common::FramingError("Unknown CI-V AGC code " + hex(code));
    }
}

common::IfFilter filter_from_code(std::uint8_t code) {
    if (code < 0x01 || code > 0x03) {
        throw common::FramingError("Unknown CI-V filter code " + hex(code));
    }
    return static_cast<common::IfFilter>(code);
}

Bytes channel_bytes(int channel) {
    return bcd::encode_be(static_cast<std::uint64_t>(channel), 2);
}

}  // namespace

CivCodec::CivCodec(capability::CapabilitiesPtr caps)
    : caps_(std::move(caps)) {}

std::optional<std::uint8_t> CivCodec::mode_code(common::Mode mode) {
    switch (mode) {
        case common::Mode::LSB: return 0x00;
        case common::Mode::USB: return 0x01;
        case common::Mode::AM: return 0x02;
        case common::Mode::CW: return 0x03;
        case common::Mode::RTTY: return 0x04;
        case common::Mode::FM: return 0x05;
        case common::Mode::FMN: return 0x05;
        case common::Mode::WFM: return 0x06;
        case common::Mode::CWR: return 0x07;
        case common::Mode::RTTYR: return 0x08;
        default: return std::nullopt;
    }
}

std::optional<common::Mode> CivCodec::mode_from_code(std::uint8_t code, std::optional<std::uint8_t> filter) {
    switch (code) {
        case 0x00: return common::Mode::LSB;
        case 0x01: return common::Mode::USB;
        case 0x02: return common::Mode::AM;
        case 0x03: return common::Mode::CW;
        case 0x04: return common::Mode::RTTY;
        case 0x05: return (filter && *filter >= 0x02) ? common::Mode::FMN : common::Mode::FM;
        case 0x06: return common::Mode::WFM;
        case 0x07: return common::Mode::CWR;
        case 0x08: return common::Mode::RTTYR;
        default: return std::nullopt;
    }
}

civ::Frame CivCodec::frame(std::uint8_t command, std::optional<std::uint8_t> subcommand, Bytes data) const {
    civ::Frame f;
    f.to = profile().radio_address;
    f.from = profile().controller_address;
    f.command = command;
    f.subcommand = subcommand;
    f.data = std::move(data);
    return f;
}

Exchange CivCodec::ack(const civ::Frame& f) const {
    return {f.encode(), ReplyKind::Ack};
}

Exchange CivCodec::data(const civ::Frame& f) const {
    return {f.encode(), ReplyKind::Data};
}

std::optional<std::uint8_t> CivCodec::vfo_code(common::Vfo vfo) const {
    switch (profile().vfo_model) {
        case capability::VfoModel::Targetable:
            if (vfo == common::Vfo::A) return 0x00;
            if (vfo == common::Vfo::B) return 0x01;
            return std::nullopt;
        case capability::VfoModel::MainSub:
            if (vfo == common::Vfo::A || vfo == common::Vfo::Main) return 0xD0;
            return 0xD1;
        case capability::VfoModel::CurrentOnly:
            if (vfo == common::Vfo::A) return 0x00;
            if (vfo == common::Vfo::B) return 0x01;
            return std::nullopt;
    }
    return std::nullopt;
}

void CivCodec::add_vfo_select(Plan& plan, common::Vfo vfo) const {
    const auto code = vfo_code(vfo);
    if (!code) {
        throw common::CapabilityError(caps_->model + " cannot address VFO " + common::to_string(vfo));
    }
    plan.exchanges.push_back(ack(frame(civ::cmd::kSelectVfo, std::nullopt, {*code})));
    plan.selects_vfo = vfo;
}

Plan CivCodec::encode(const common::Command& command) const {
    Plan plan;
    std::visit(
        common::overloaded{
            [&](const common::ReadFrequency& c) {
                add_vfo_select(plan, c.vfo);
                plan.exchanges.push_back(data(frame(civ::cmd::kReadFrequency)));
            },
            [&](const common::SetFrequency& c) {
                auto digits = bcd::encode_le(c.hz, static_cast<std::size_t>(profile().frequency_bytes));
                add_vfo_select(plan, c.vfo);
                plan.exchanges.push_back(ack(frame(civ::cmd::kSetFrequency, std::nullopt, std::move(digits))));
            },
            [&](const common::ReadMode&) { plan.exchanges.push_back(data(frame(civ::cmd::kReadMode))); },
            [&](const common::SetMode& c) {
                const auto code = mode_code(c.mode);
                if (!code) {
                    throw common::CapabilityError("CI-V has no mode code for " + common::to_string(c.mode));
                }
                Bytes payload{*code};
                if (profile().mode_filter) {
                    payload.push_back(c.mode == common::Mode::FMN ? 0x02 : 0x01);
                } else if (c.mode == common::Mode::FMN) {
                    throw common::CapabilityError(caps_->model + " cannot select FM-N without a filter byte");
                }
                plan.exchanges.push_back(ack(frame(civ::cmd::kSetMode, std::nullopt, std::move(payload))));
            },
            [&](const common::SelectVfo& c) {
                const auto code = vfo_code(c.vfo);
                if (!code) {
                    throw common::CapabilityError(caps_->model + " cannot select VFO " + common::to_string(c.vfo));
                }
                plan.exchanges.push_back(ack(frame(civ::cmd::kSelectVfo, std::nullopt, {*code})));
                plan.selects_vfo = c.vfo;
            },
            [&](const common::ReadSplit&) { plan.exchanges.push_back(data(frame(civ::cmd::kSplit))); },
            [&](const common::SetSplit& c) {
                plan.exchanges.push_back(
                    ack(frame(civ::cmd::kSplit, std::nullopt, {static_cast<std::uint8_t>(c.enabled ? 0x01 : 0x00)})));
            },
            [&](const common::ReadPower&) {
                plan.exchanges.push_back(data(frame(civ::cmd::kLevel, civ::sub::kRfPower)));
            },
            [&](const common::SetPower& c) {
                const int max = std::max(1, caps_->power.max_watts);
                const int scaled = std::clamp((c.watts * kLevelMax + max / 2) / max, 0, kLevelMax);
                plan.exchanges.push_back(ack(frame(civ::cmd::kLevel, civ::sub::kRfPower,
                                                   bcd::encode_be(static_cast<std::uint64_t>(scaled), 2))));
            },
            [&](const common::ReadPtt&) {
                plan.exchanges.push_back(data(frame(civ::cmd::kTransmit, civ::sub::kPtt)));
            },
            [&](const common::SetPtt& c) {
                plan.exchanges.push_back(ack(frame(civ::cmd::kTransmit, civ::sub::kPtt,
                                                   {static_cast<std::uint8_t>(c.enabled ? 0x01 : 0x00)})));
            },
            [&](const common::ReadSignalStrength&) {
                plan.exchanges.push_back(data(frame(civ::cmd::kMeter, civ::sub::kSMeter)));
            },
            [&](const common::ReadRit&) {
                plan.exchanges.push_back(data(frame(civ::cmd::kOffset, civ::sub::kRitOffset)));
                plan.exchanges.push_back(data(frame(civ::cmd::kOffset, civ::sub::kRitSwitch)));
            },
            [&](const common::SetRit& c) {
                plan.exchanges.push_back(
                    ack(frame(civ::cmd::kOffset, civ::sub::kRitOffset, offset_payload(c.state.offset_hz))));
                plan.exchanges.push_back(ack(frame(civ::cmd::kOffset, civ::sub::kRitSwitch,
                                                   {static_cast<std::uint8_t>(c.state.enabled ? 0x01 : 0x00)})));
            },
            [&](const common::ReadXit&) {
                plan.exchanges.push_back(data(frame(civ::cmd::kOffset, civ::sub::kRitOffset)));
                plan.exchanges.push_back(data(frame(civ::cmd::kOffset, civ::sub::kXitSwitch)));
            },
            [&](const common::SetXit& c) {
                plan.exchanges.push_back(
                    ack(frame(civ::cmd::kOffset, civ::sub::kRitOffset, offset_payload(c.state.offset_hz))));
                plan.exchanges.push_back(ack(frame(civ::cmd::kOffset, civ::sub::kXitSwitch,
                                                   {static_cast<std::uint8_t>(c.state.enabled ? 0x01 : 0x00)})));
            },
            [&](const common::SelectMemory& c) {
                plan.exchanges.push_back(ack(frame(civ::cmd::kSelectMemory, std::nullopt,
                                                   bcd::encode_be(static_cast<std::uint64_t>(c.channel), 2))));
            },
            [&](const common::StoreMemory& c) {
                plan.exchanges.push_back(ack(frame(civ::cmd::kSelectMemory, std::nullopt,
                                                   bcd::encode_be(static_cast<std::uint64_t>(c.channel), 2))));
                plan.exchanges.push_back(ack(frame(civ::cmd::kStoreMemory)));
            },
            [&](const common::ClearMemory& c) {
                plan.exchanges.push_back(ack(frame(civ::cmd::kSelectMemory, std::nullopt,
                                                   bcd::encode_be(static_cast<std::uint64_t>(c.channel), 2))));
                plan.exchanges.push_back(ack(frame(civ::cmd::kClearMemory)));
            },
            [&](const common::SetSatelliteMode& c) {
                plan.exchanges.push_back(ack(frame(civ::cmd::kFunction, civ::sub::kSatellite,
                                                   {static_cast<std::uint8_t>(c.enabled ? 0x01 : 0x00)})));
            },
            [&](const common::ReadAgc&) {
                plan.exchanges.push_back(data(frame(civ::cmd::kFunction, civ::sub::kAgc)));
            },
            [&](const common::SetAgc& c) {
                const auto code = agc_code(c.speed);
                if (!code) {
                    throw common::CapabilityError("CI-V has no AGC code for " + common::to_string(c.speed));
                }
                plan.exchanges.push_back(ack(frame(civ::cmd::kFunction, civ::sub::kAgc, {*code})));
            },
            [&](const common::ReadNoiseBlanker&) {
                plan.exchanges.push_back(data(frame(civ::cmd::kFunction, civ::sub::kNoiseBlanker)));
            },
            [&](const common::SetNoiseBlanker& c) {
                plan.exchanges.push_back(
                    ack(frame(civ::cmd::kFunction, civ::sub::kNoiseBlanker, {switch_byte(c.enabled)})));
            },
            [&](const common::ReadNoiseReduction&) {
                plan.exchanges.push_back(data(frame(civ::cmd::kFunction, civ::sub::kNoiseReduction)));
            },
            [&](const common::SetNoiseReduction& c) {
                plan.exchanges.push_back(
                    ack(frame(civ::cmd::kFunction, civ::sub::kNoiseReduction, {switch_byte(c.enabled)})));
            },
            [&](const common::ReadFilter&) {
                if (!profile().mode_filter) {
                    throw common::CapabilityError(caps_->model + " does not report the IF filter");
                }
                plan.exchanges.push_back(data(frame(civ::cmd::kReadMode)));
            },
            [&](const common::SetFilter& c) {
                if (!profile().mode_filter) {
                    throw common::CapabilityError(caps_->model + " cannot select an IF filter");
                }
                const auto code = mode_code(c.mode);
                if (!code) {
                    throw common::CapabilityError("CI-V has no mode code for " + common::to_string(c.mode));
                }
                plan.exchanges.push_back(ack(frame(civ::cmd::kSetMode, std::nullopt,
                                                   {*code, static_cast<std::uint8_t>(c.filter)})));
            },
            [&](const common::ReadMemory& c) {
                plan.exchanges.push_back(
                    data(frame(civ::cmd::kExtended, civ::sub::kMemoryContents, channel_bytes(c.channel))));
            },
            [&](const common::WriteMemory& c) {
                const auto& contents = c.contents;
                auto payload = channel_bytes(contents.channel);
                if (contents.blank) {
                    payload.push_back(civ::kBlankChannel);
                } else {
                    const auto code = mode_code(contents.mode);
                    if (!code) {
                        throw common::CapabilityError("CI-V has no mode code for " +
                                                      common::to_string(contents.mode));
                    }
                    payload.push_back(0x00);
                    const auto digits =
                        bcd::encode_le(contents.frequency_hz, static_cast<std::size_t>(profile().frequency_bytes));
                    payload.insert(payload.end(), digits.begin(), digits.end());
                    payload.push_back(*code);
                    payload.push_back(contents.mode == common::Mode::FMN ? 0x02 : 0x01);
                    auto name = contents.name;
                    name.resize(common::kMemoryNameLength, ' ');
                    payload.insert(payload.end(), name.begin(), name.end());
                }
                plan.exchanges.push_back(
                    ack(frame(civ::cmd::kExtended, civ::sub::kMemoryContents, std::move(payload))));
            },
        },
        command);
    return plan;
}

void CivCodec::expect_ack(const Bytes& reply) const {
    const auto f = civ::Frame::parse(reply);
    if (f.is_nak()) {
        throw common::ProtocolNakError(caps_->model + " rejected command (NAK)");
    }
    if (!f.is_ack()) {
        throw common::FramingError("Expected CI-V ACK, got command " + hex(f.command));
    }
}

bool CivCodec::is_unsolicited(const Bytes& reply) const {
    try {
        const auto f = civ::Frame::parse(reply);
        return f.from == profile().controller_address || f.to != profile().controller_address;
    } catch (const common::FramingError&) {
        return false;
    }
}

// Layout: channel (2 BCD), select byte, frequency, mode, filter, name. A
// blank channel answers with the channel followed by 0xFF.
common::MemoryContents CivCodec::decode_memory(const civ::Frame& f, int channel) const {
    const auto width = static_cast<std::size_t>(profile().frequency_bytes);
    if (f.data.size() < 3) {
        throw common::FramingError("Memory reply too short: " + std::to_string(f.data.size()) + " bytes");
    }
    common::MemoryContents contents;
    contents.channel = static_cast<int>(bcd::decode_be(f.data.data(), 2));
    if (contents.channel != channel) {
        throw common::FramingError("Memory reply for channel " + std::to_string(contents.channel) +
                                   ", asked for " + std::to_string(channel));
    }
    if (f.data[2] == civ::kBlankChannel) {
        contents.blank = true;
        return contents;
    }
    const auto fixed = 3 + width + 2;
    if (f.data.size() < fixed) {
        throw common::FramingError("Memory reply too short: " + std::to_string(f.data.size()) + " bytes");
    }
    contents.frequency_hz = bcd::decode_le(f.data.data() + 3, width);
    const auto mode = mode_from_code(f.data[3 + width], f.data[3 + width + 1]);
    if (!mode) {
        throw common::FramingError("Unknown CI-V mode code " + hex(f.data[3 + width]));
    }
    contents.mode = *mode;
    contents.name.assign(f.data.begin() + static_cast<std::ptrdiff_t>(fixed), f.data.end());
    contents.name.erase(contents.name.find_last_not_of(' ') + 1);
    return contents;
}

civ::Frame CivCodec::reply_frame(const Bytes& raw, std::uint8_t command,
                                 std::optional<std::uint8_t> subcommand) const {
    auto f = civ::Frame::parse(raw);
    if (f.is_nak()) {
        throw common::ProtocolNakError(caps_->model + " rejected query " + hex(command) + " (NAK)");
    }
    if (f.command != command || f.subcommand != subcommand) {
        throw common::FramingError("Unexpected CI-V reply " + hex(f.command) + " to query " + hex(command));
    }
    return f;
}

Reply CivCodec::decode(const common::Command& command, const std::vector<Bytes>& replies) const {
    return std::visit(
        common::overloaded{
            [&](const common::ReadFrequency&) -> Reply {
                const auto f = reply_frame(reply_at(replies, 0), civ::cmd::kReadFrequency, std::nullopt);
                if (f.data.size() != 4 && f.data.size() != 5) {
                    throw common::FramingError("Unexpected frequency width " + std::to_string(f.data.size()));
                }
                return bcd::decode_le(f.data.data(), f.data.size());
            },
            [&](const common::ReadMode&) -> Reply {
                const auto f = reply_frame(reply_at(replies, 0), civ::cmd::kReadMode, std::nullopt);
                if (f.data.empty()) {
                    throw common::FramingError("Mode reply without data");
                }
                std::optional<std::uint8_t> filter;
                if (f.data.size() > 1) {
                    filter = f.data[1];
                }
                const auto mode = mode_from_code(f.data[0], filter);
                if (!mode) {
                    throw common::FramingError("Unknown CI-V mode code " + hex(f.data[0]));
                }
                return *mode;
            },
            [&](const common::ReadSplit&) -> Reply {
                const auto f = reply_frame(reply_at(replies, 0), civ::cmd::kSplit, std::nullopt);
                return single_byte(f) == 0x01;
            },
            [&](const common::ReadPower&) -> Reply {
                const auto f = reply_frame(reply_at(replies, 0), civ::cmd::kLevel, civ::sub::kRfPower);
                const int max = caps_->power.max_watts;
                return (level_value(f) * max + kLevelMax / 2) / kLevelMax;
            },
            [&](const common::ReadPtt&) -> Reply {
                const auto f = reply_frame(reply_at(replies, 0), civ::cmd::kTransmit, civ::sub::kPtt);
                return single_byte(f) == 0x01;
            },
            [&](const common::ReadSignalStrength&) -> Reply {
                const auto f = reply_frame(reply_at(replies, 0), civ::cmd::kMeter, civ::sub::kSMeter);
                return signal_from_raw(level_value(f));
            },
            [&](const common::ReadRit&) -> Reply {
                const auto offset = reply_frame(reply_at(replies, 0), civ::cmd::kOffset, civ::sub::kRitOffset);
                const auto on = reply_frame(reply_at(replies, 1), civ::cmd::kOffset, civ::sub::kRitSwitch);
                return common::RitXitState{single_byte(on) == 0x01, offset_from_frame(offset)};
            },
            [&](const common::ReadXit&) -> Reply {
                const auto offset = reply_frame(reply_at(replies, 0), civ::cmd::kOffset, civ::sub::kRitOffset);
                const auto on = reply_frame(reply_at(replies, 1), civ::cmd::kOffset, civ::sub::kXitSwitch);
                return common::RitXitState{single_byte(on) == 0x01, offset_from_frame(offset)};
            },
            [&](const common::ReadAgc&) -> Reply {
                const auto f = reply_frame(reply_at(replies, 0), civ::cmd::kFunction, civ::sub::kAgc);
                return agc_from_code(single_byte(f));
            },
            [&](const common::ReadNoiseBlanker&) -> Reply {
                const auto f = reply_frame(reply_at(replies, 0), civ::cmd::kFunction, civ::sub::kNoiseBlanker);
                return single_byte(f) == 0x01;
            },
            [&](const common::ReadNoiseReduction&) -> Reply {
                const auto f = reply_frame(reply_at(replies, 0), civ::cmd::kFunction, civ::sub::kNoiseReduction);
                return single_byte(f) == 0x01;
            },
            [&](const common::ReadFilter&) -> Reply {
                const auto f = reply_frame(reply_at(replies, 0), civ::cmd::kReadMode, std::nullopt);
                if (f.data.size() < 2) {
                    throw common::FramingError("Mode reply carries no filter byte");
                }
                return filter_from_code(f.data[1]);
            },
            [&](const common::ReadMemory& c) -> Reply {
                return decode_memory(
                    reply_frame(reply_at(replies, 0), civ::cmd::kExtended, civ::sub::kMemoryContents), c.channel);
            },
            // Writes are confirmed by the ACK already checked per exchange.
            [&](const auto&) -> Reply { return common::Ack{}; },
        },
        command);
}

}  // namespace riglink::protocol
