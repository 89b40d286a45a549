#pragma once

#include "riglink/common/types.hpp"

#include <cstdint>
#include <optional>

namespace riglink::protocol::civ {

inline constexpr std::uint8_t kPreamble = 0xFE;
inline constexpr std::uint8_t kTerminator = 0xFD;
inline constexpr std::uint8_t kAck = 0xFB;
inline constexpr std::uint8_t kNak = 0xFA;
inline constexpr std::uint8_t kBroadcast = 0x00;
inline constexpr std::uint8_t kBlankChannel = 0xFF;

namespace cmd {
inline constexpr std::uint8_t kReadFrequency = 0x03;
inline constexpr std::uint8_t kReadMode = 0x04;
inline constexpr std::uint8_t kSetFrequency = 0x05;
inline constexpr std::uint8_t kSetMode = 0x06;
inline constexpr std::uint8_t kSelectVfo = 0x07;
inline constexpr std::uint8_t kSelectMemory = 0x08;
inline constexpr std::uint8_t kStoreMemory = 0x09;
inline constexpr std::uint8_t kClearMemory = 0x0B;
inline constexpr std::uint8_t kSplit = 0x0F;
inline constexpr std::uint8_t kLevel = 0x14;
inline constexpr std::uint8_t kMeter = 0x15;
inline constexpr std::uint8_t kFunction = 0x16;
inline constexpr std::uint8_t kExtended = 0x1A;
inline constexpr std::uint8_t kTransmit = 0x1C;
inline constexpr std::uint8_t kOffset = 0x21;
}  // namespace cmd

namespace sub {
inline constexpr std::uint8_t kRfPower = 0x0A;
inline constexpr std::uint8_t kSMeter = 0x02;
inline constexpr std::uint8_t kSatellite = 0x5A;
inline constexpr std::uint8_t kPtt = 0x00;
inline constexpr std::uint8_t kRitOffset = 0x00;
inline constexpr std::uint8_t kRitSwitch = 0x01;
inline constexpr std::uint8_t kXitSwitch = 0x02;
inline constexpr std::uint8_t kAgc = 0x12;
inline constexpr std::uint8_t kNoiseBlanker = 0x22;
inline constexpr std::uint8_t kNoiseReduction = 0x40;
inline constexpr std::uint8_t kMemoryContents = 0x00;
}  // namespace sub

// Command bytes that carry a sub-command byte ahead of their payload.
bool has_subcommand(std::uint8_t command) noexcept;

struct Frame {
    std::uint8_t to{0};
    std::uint8_t from{0};
    std::uint8_t command{0};
    std::optional<std::uint8_t> subcommand;
    common::Bytes data;

    bool is_ack() const noexcept { return command == kAck && !subcommand && data.empty(); }
    bool is_nak() const noexcept { return command == kNak && !subcommand && data.empty(); }

    common::Bytes encode() const;

    // Parses one frame ending at the terminator. Leading noise before the
    // preamble is skipped. Throws FramingError on malformed input.
    static Frame parse(const common::Bytes& raw);
};

}  // namespace riglink::protocol::civ
