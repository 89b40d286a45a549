#pragma once

#include "riglink/capability/capabilities.hpp"

#include <memory>
#include <string>
#include <utility>

namespace riglink::test {

// HF transceiver with the 20 m and 40 m bands, enough for codec and
// controller tests that do not need the full catalog.
inline capability::RadioCapabilities hf_radio(const std::string& model, capability::ProtocolFamily family) {
    using common::Mode;
    capability::RadioCapabilities caps;
    caps.model = model;
    caps.manufacturer = "Test";
    caps.family = family;
    caps.ranges = {{7000000, 7300000, "40m", true}, {14000000, 14350000, "20m", true}};
    caps.modes = {Mode::LSB, Mode::USB, Mode::CW, Mode::CWR, Mode::AM, Mode::FM, Mode::FMN, Mode::RTTY};
    caps.power = {5, 100};
    caps.features.rit = true;
    caps.features.xit = true;
    caps.memory = {1, 99};
    return caps;
}

inline capability::CapabilitiesPtr shared(capability::RadioCapabilities caps) {
    return std::make_shared<const capability::RadioCapabilities>(std::move(caps));
}

}  // namespace riglink::test
