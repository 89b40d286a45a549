#include "riglink/capability/band_plan.hpp"

namespace riglink::capability {

namespace {

std::vector<AmateurBand> common_hf() {
    return {
        {"2200m", 135'700, 137'800},
        {"630m", 472'000, 479'000},
    };
}

std::vector<AmateurBand> build_region_one() {
    auto bands = common_hf();
    bands.insert(bands.end(), {
        {"160m", 1'810'000, 2'000'000},
        {"80m", 3'500'000, 3'800'000},
        {"60m", 5'351'500, 5'366'500},
        {"40m", 7'000'000, 7'200'000},
        {"30m", 10'100'000, 10'150'000},
        {"20m", 14'000'000, 14'350'000},
        {"17m", 18'068'000, 18'168'000},
        {"15m", 21'000'000, 21'450'000},
        {"12m", 24'890'000, 24'990'000},
        {"10m", 28'000'000, 29'700'000},
        {"6m", 50'000'000, 52'000'000},
        {"2m", 144'000'000, 146'000'000},
        {"70cm", 430'000'000, 440'000'000},
        {"23cm", 1'240'000'000, 1'300'000'000},
    });
    return bands;
}

std::vector<AmateurBand> build_region_two() {
    auto bands = common_hf();
    bands.insert(bands.end(), {
        {"160m", 1'800'000, 2'000'000},
        {"80m", 3'500'000, 4'000'000},
        {"60m", 5'330'500, 5'405'000},
        {"40m", 7'000'000, 7'300'000},
        {"30m", 10'100'000, 10'150'000},
        {"20m", 14'000'000, 14'350'000},
        {"17m", 18'068'000, 18'168'000},
        {"15m", 21'000'000, 21'450'000},
        {"12m", 24'890'000, 24'990'000},
        {"10m", 28'000'000, 29'700'000},
        {"6m", 50'000'000, 54'000'000},
        {"2m", 144'000'000, 148'000'000},
        {"1.25m", 222'000'000, 225'000'000},
        {"70cm", 420'000'000, 450'000'000},
        {"33cm", 902'000'000, 928'000'000},
        {"23cm", 1'240'000'000, 1'300'000'000},
    });
    return bands;
}

std::vector<AmateurBand> build_region_three() {
    auto bands = common_hf();
    bands.insert(bands.end(), {
        {"160m", 1'800'000, 2'000'000},
        {"80m", 3'500'000, 3'900'000},
        {"60m", 5'351'500, 5'366'500},
        {"40m", 7'000'000, 7'300'000},
        {"30m", 10'100'000, 10'150'000},
        {"20m", 14'000'000, 14'350'000},
        {"17m", 18'068'000, 18'168'000},
        {"15m", 21'000'000, 21'450'000},
        {"12m", 24'890'000, 24'990'000},
        {"10m", 28'000'000, 29'700'000},
        {"6m", 50'000'000, 54'000'000},
        {"2m", 144'000'000, 148'000'000},
        {"70cm", 430'000'000, 450'000'000},
        {"23cm", 1'240'000'000, 1'300'000'000},
    });
    return bands;
}

}  // namespace

std::optional<Region> region_from_number(int number) {
    switch (number) {
        case 1: return Region::One;
        case 2: return Region::Two;
        case 3: return Region::Three;
        default: return std::nullopt;
    }
}

std::string to_string(Region region) {
    return "IARU region " + std::to_string(static_cast<int>(region));
}

const std::vector<AmateurBand>& amateur_bands(Region region) {
    static const auto one = build_region_one();
    static const auto two = build_region_two();
    static const auto three = build_region_three();
    switch (region) {
        case Region::One: return one;
        case Region::Two: return two;
        case Region::Three: return three;
    }
    return one;
}

std::optional<AmateurBand> find_band(Region region, std::uint64_t hz) {
    for (const auto& band : amateur_bands(region)) {
        if (band.contains(hz)) {
            return band;
        }
    }
    return std::nullopt;
}

}  // namespace riglink::capability
