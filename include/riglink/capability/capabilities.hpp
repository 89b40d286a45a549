#pragma once

#include "riglink/common/types.hpp"

#include <cstdint>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace riglink::capability {

enum class ProtocolFamily {
    Civ,
    YaesuCat,
    KenwoodCat,
    ElecraftCat
};

inline std::string to_string(ProtocolFamily family) {
    switch (family) {
        case ProtocolFamily::Civ: return "civ";
        case ProtocolFamily::YaesuCat: return "yaesu-cat";
        case ProtocolFamily::KenwoodCat: return "kenwood-cat";
        case ProtocolFamily::ElecraftCat: return "elecraft-cat";
    }
    return "civ";
}

struct FrequencyRange {
    std::uint64_t min_hz{0};
    std::uint64_t max_hz{0};
    std::string band;
    bool transmit{true};

    bool contains(std::uint64_t hz) const noexcept { return hz >= min_hz && hz <= max_hz; }
};

struct PowerRange {
    int min_watts{0};
    int max_watts{100};
};

struct FeatureFlags {
    bool vfo_b{true};
    bool dual_receiver{false};
    bool split{true};
    bool satellite{false};
    bool dstar{false};
    bool rit{false};
    bool xit{false};
    bool power_control{true};
    bool ptt{true};
    bool signal_strength{true};
    bool noise_blanker{true};
    bool noise_reduction{true};
    // Defaults follow the CI-V profile: filter selection rides on the mode
    // filter byte and memory contents need a memory bank.
    bool if_filter{false};
    bool memory_contents{false};
};

enum class VfoModel {
    Targetable,   // 0x07 00 / 01 selects VFO A or B
    CurrentOnly,  // commands act on the displayed VFO
    MainSub       // 0x07 D0 / D1 selects main or sub receiver
};

struct CivProfile {
    std::uint8_t radio_address{0x94};
    std::uint8_t controller_address{0xE0};
    int frequency_bytes{5};
    VfoModel vfo_model{VfoModel::Targetable};
    bool mode_filter{true};
};

struct MemoryLayout {
    int first_channel{1};
    int count{0};

    bool contains(int channel) const noexcept {
        return count > 0 && channel >= first_channel && channel < first_channel + count;
    }
};

struct RadioCapabilities {
    std::string model;
    std::string manufacturer;
    ProtocolFamily family{ProtocolFamily::Civ};
    int default_baud{19200};
    std::vector<FrequencyRange> ranges;
    std::set<common::Mode> modes;
    PowerRange power;
    FeatureFlags features;
    MemoryLayout memory;
    CivProfile civ;
    // Empty when the radio's AGC cannot be set remotely.
    std::set<common::AgcSpeed> agc_speeds;

    bool supports_frequency(std::uint64_t hz) const noexcept {
        for (const auto& range : ranges) {
            if (range.contains(hz)) {
                return true;
            }
        }
        return false;
    }

    // Only ranges declared as transmit ranges allow keying the transmitter.
    bool can_transmit(std::uint64_t hz) const noexcept {
        for (const auto& range : ranges) {
            if (range.transmit && range.contains(hz)) {
                return true;
            }
        }
        return false;
    }

    bool supports_mode(common::Mode mode) const { return modes.count(mode) != 0; }
    bool supports_agc(common::AgcSpeed speed) const { return agc_speeds.count(speed) != 0; }
};

using CapabilitiesPtr = std::shared_ptr<const RadioCapabilities>;

}  // namespace riglink::capability
