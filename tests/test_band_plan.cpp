#include <doctest/doctest.h>

#include "riglink/capability/band_plan.hpp"

using namespace riglink;
using capability::Region;

TEST_CASE("Band plan: region numbers") {
    CHECK(capability::region_from_number(1) == Region::One);
    CHECK(capability::region_from_number(3) == Region::Three);
    CHECK_FALSE(capability::region_from_number(0).has_value());
    CHECK_FALSE(capability::region_from_number(4).has_value());
    CHECK(capability::to_string(Region::Two) == "IARU region 2");
}

TEST_CASE("Band plan: 40m and 80m differ by region") {
    REQUIRE(capability::find_band(Region::One, 7200000).has_value());
    CHECK(capability::find_band(Region::One, 7200000)->name == "40m");
    CHECK_FALSE(capability::find_band(Region::One, 7250000).has_value());
    CHECK(capability::find_band(Region::Two, 7250000)->name == "40m");
    CHECK(capability::find_band(Region::Three, 7250000)->name == "40m");

    CHECK_FALSE(capability::find_band(Region::One, 3900000).has_value());
    CHECK(capability::find_band(Region::Two, 3900000)->name == "80m");
    CHECK(capability::find_band(Region::Three, 3850000)->name == "80m");
}

TEST_CASE("Band plan: VHF and UHF allocations") {
    CHECK(capability::find_band(Region::Two, 223500000)->name == "1.25m");
    CHECK_FALSE(capability::find_band(Region::One, 223500000).has_value());
    CHECK_FALSE(capability::find_band(Region::Three, 223500000).has_value());

    CHECK(capability::find_band(Region::Two, 915000000)->name == "33cm");
    CHECK_FALSE(capability::find_band(Region::One, 915000000).has_value());

    CHECK(capability::find_band(Region::One, 145500000)->name == "2m");
    CHECK_FALSE(capability::find_band(Region::One, 147000000).has_value());
    CHECK(capability::find_band(Region::Two, 147000000)->name == "2m");
}

TEST_CASE("Band plan: edges are inclusive and gaps are empty") {
    CHECK(capability::find_band(Region::Two, 14000000)->name == "20m");
    CHECK(capability::find_band(Region::Two, 14350000)->name == "20m");
    CHECK_FALSE(capability::find_band(Region::Two, 14350001).has_value());
    // Broadcast and aviation frequencies.
    CHECK_FALSE(capability::find_band(Region::Two, 9500000).has_value());
    CHECK_FALSE(capability::find_band(Region::Two, 121500000).has_value());
}

TEST_CASE("Band plan: bands are ordered by frequency") {
    for (const auto region : {Region::One, Region::Two, Region::Three}) {
        const auto& bands = capability::amateur_bands(region);
        REQUIRE_FALSE(bands.empty());
        CHECK(bands.front().name == "2200m");
        CHECK(bands.back().name == "23cm");
        for (std::size_t i = 1; i < bands.size(); ++i) {
            CHECK(bands[i - 1].max_hz < bands[i].min_hz);
        }
    }
}
