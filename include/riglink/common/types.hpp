#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace riglink::common {

using Bytes = std::vector<std::uint8_t>;

enum class ErrorCode {
    Ok,
    Capability,
    Framing,
    Timeout,
    ProtocolNak,
    Transport,
    NotConnected,
    InvalidArgument,
    Internal
};

inline std::string to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok: return "ok";
        case ErrorCode::Capability: return "capability";
        case ErrorCode::Framing: return "framing";
        case ErrorCode::Timeout: return "timeout";
        case ErrorCode::ProtocolNak: return "protocol_nak";
        case ErrorCode::Transport: return "transport";
        case ErrorCode::NotConnected: return "not_connected";
        case ErrorCode::InvalidArgument: return "invalid_argument";
        case ErrorCode::Internal: return "internal";
    }
    return "internal";
}

struct CommandResult {
    ErrorCode code{ErrorCode::Ok};
    std::string message;

    bool ok() const noexcept { return code == ErrorCode::Ok; }
};

template <typename T>
struct Result {
    CommandResult status;
    std::optional<T> value;

    bool ok() const noexcept { return status.ok() && value.has_value(); }
};

enum class Mode {
    LSB,
    USB,
    CW,
    CWR,
    AM,
    FM,
    FMN,
    WFM,
    RTTY,
    RTTYR,
    DataLSB,
    DataUSB,
    DataFM
};

inline std::string to_string(Mode mode) {
    switch (mode) {
        case Mode::LSB: return "LSB";
        case Mode::USB: return "USB";
        case Mode::CW: return "CW";
        case Mode::CWR: return "CW-R";
        case Mode::AM: return "AM";
        case Mode::FM: return "FM";
        case Mode::FMN: return "FM-N";
        case Mode::WFM: return "WFM";
        case Mode::RTTY: return "RTTY";
        case Mode::RTTYR: return "RTTY-R";
        case Mode::DataLSB: return "DATA-LSB";
        case Mode::DataUSB: return "DATA-USB";
        case Mode::DataFM: return "DATA-FM";
    }
    return "USB";
}

std::optional<Mode> mode_from_string(const std::string& text);

enum class Vfo {
    A,
    B,
    Main,
    Sub
};

inline std::string to_string(Vfo vfo) {
    switch (vfo) {
        case Vfo::A: return "A";
        case Vfo::B: return "B";
        case Vfo::Main: return "Main";
        case Vfo::Sub: return "Sub";
    }
    return "A";
}

struct SignalStrength {
    int s_units{0};
    int over_s9_db{0};
    int raw{0};

    // Approximate dB relative to S9 (6 dB per S-unit below S9).
    int db_relative_s9() const noexcept {
        return s_units < 9 ? (s_units - 9) * 6 : over_s9_db;
    }

    std::string description() const {
        if (over_s9_db > 0) {
            return "S9+" + std::to_string(over_s9_db);
        }
        return "S" + std::to_string(s_units);
    }

    bool operator==(const SignalStrength&) const = default;
};

struct RitXitState {
    bool enabled{false};
    int offset_hz{0};

    bool operator==(const RitXitState&) const = default;
};

enum class AgcSpeed {
    Off,
    Fast,
    Medium,
    Slow,
    Auto
};

inline std::string to_string(AgcSpeed speed) {
    switch (speed) {
        case AgcSpeed::Off: return "off";
        case AgcSpeed::Fast: return "fast";
        case AgcSpeed::Medium: return "medium";
        case AgcSpeed::Slow: return "slow";
        case AgcSpeed::Auto: return "auto";
    }
    return "off";
}

std::optional<AgcSpeed> agc_from_string(const std::string& text);

// Icom FIL1-FIL3 preset; the value is the CI-V filter byte.
enum class IfFilter : std::uint8_t {
    Wide = 0x01,
    Medium = 0x02,
    Narrow = 0x03
};

inline std::string to_string(IfFilter filter) {
    switch (filter) {
        case IfFilter::Wide: return "FIL1";
        case IfFilter::Medium: return "FIL2";
        case IfFilter::Narrow: return "FIL3";
    }
    return "FIL1";
}

inline constexpr std::size_t kMemoryNameLength = 10;

struct MemoryContents {
    int channel{1};
    std::uint64_t frequency_hz{0};
    Mode mode{Mode::USB};
    std::string name;
    // Channel holds nothing; frequency, mode and name are meaningless.
    bool blank{false};

    bool operator==(const MemoryContents&) const = default;
};

enum class SessionState {
    Disconnected,
    Connecting,
    Connected,
    Transacting,
    Faulted
};

inline std::string to_string(SessionState state) {
    switch (state) {
        case SessionState::Disconnected: return "disconnected";
        case SessionState::Connecting: return "connecting";
        case SessionState::Connected: return "connected";
        case SessionState::Transacting: return "transacting";
        case SessionState::Faulted: return "faulted";
    }
    return "disconnected";
}

}  // namespace riglink::common
