#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace riglink::capability {

// IARU regions: 1 Europe/Africa, 2 Americas, 3 Asia-Pacific.
enum class Region {
    One = 1,
    Two = 2,
    Three = 3
};

std::optional<Region> region_from_number(int number);
std::string to_string(Region region);

struct AmateurBand {
    std::string name;
    std::uint64_t min_hz{0};
    std::uint64_t max_hz{0};

    bool contains(std::uint64_t hz) const noexcept { return hz >= min_hz && hz <= max_hz; }
};

// Amateur allocations from 2200m to 23cm, ordered by frequency.
const std::vector<AmateurBand>& amateur_bands(Region region);

// The band holding `hz` in `region`, if any.
std::optional<AmateurBand> find_band(Region region, std::uint64_t hz);

}  // namespace riglink::capability
