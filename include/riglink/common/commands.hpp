#pragma once

#include "riglink/common/types.hpp"

#include <cstdint>
#include <string>
#include <variant>

namespace riglink::common {

// Semantic operations understood by every protocol family.

struct ReadFrequency { Vfo vfo{Vfo::A}; };
struct SetFrequency { Vfo vfo{Vfo::A}; std::uint64_t hz{0}; };
struct ReadMode {};
struct SetMode { Mode mode{Mode::USB}; };
struct SelectVfo { Vfo vfo{Vfo::A}; };
struct ReadSplit {};
struct SetSplit { bool enabled{false}; };
struct ReadPower {};
struct SetPower { int watts{0}; };
struct ReadPtt {};
struct SetPtt { bool enabled{false}; };
struct ReadSignalStrength {};
struct ReadRit {};
struct SetRit { RitXitState state; };
struct ReadXit {};
struct SetXit { RitXitState state; };
struct SelectMemory { int channel{1}; };
struct StoreMemory { int channel{1}; };
struct ClearMemory { int channel{1}; };
struct SetSatelliteMode { bool enabled{false}; };
struct ReadAgc {};
struct SetAgc { AgcSpeed speed{AgcSpeed::Fast}; };
struct ReadNoiseBlanker {};
struct SetNoiseBlanker { bool enabled{false}; };
struct ReadNoiseReduction {};
struct SetNoiseReduction { bool enabled{false}; };
struct ReadFilter {};
// The filter byte travels with the mode code, so the mode is resent.
struct SetFilter { IfFilter filter{IfFilter::Wide}; Mode mode{Mode::USB}; };
struct ReadMemory { int channel{1}; };
struct WriteMemory { MemoryContents contents; };

using Command = std::variant<ReadFrequency,
                             SetFrequency,
                             ReadMode,
                             SetMode,
                             SelectVfo,
                             ReadSplit,
                             SetSplit,
                             ReadPower,
                             SetPower,
                             ReadPtt,
                             SetPtt,
                             ReadSignalStrength,
                             ReadRit,
                             SetRit,
                             ReadXit,
                             SetXit,
                             SelectMemory,
                             StoreMemory,
                             ClearMemory,
                             SetSatelliteMode,
                             ReadAgc,
                             SetAgc,
                             ReadNoiseBlanker,
                             SetNoiseBlanker,
                             ReadNoiseReduction,
                             SetNoiseReduction,
                             ReadFilter,
                             SetFilter,
                             ReadMemory,
                             WriteMemory>;

std::string describe(const Command& command);

// True for commands that only read radio state.
bool is_query(const Command& command);

// Decoded reply payload. Ack carries no value.
struct Ack {
    bool operator==(const Ack&) const = default;
};

using Reply = std::variant<Ack,
                           std::uint64_t,
                           Mode,
                           Vfo,
                           bool,
                           int,
                           SignalStrength,
                           RitXitState,
                           AgcSpeed,
                           IfFilter,
                           MemoryContents>;

}  // namespace riglink::common
