#include <doctest/doctest.h>

#include "riglink/capability/catalog.hpp"

#include <set>
#include <stdexcept>

using namespace riglink;

TEST_CASE("Catalog: shipped model file loads") {
    const auto catalog = capability::CapabilityCatalog::load_file(RIGLINK_SOURCE_DIR "/config/models.yaml");
    CHECK(catalog.size() >= 30);

    const auto ic7300 = catalog.lookup("IC-7300");
    REQUIRE(ic7300);
    CHECK(ic7300->family == capability::ProtocolFamily::Civ);
    CHECK(ic7300->civ.radio_address == 0x94);
    CHECK(ic7300->civ.controller_address == 0xE0);
    CHECK(ic7300->supports_frequency(14074000));
    CHECK_FALSE(ic7300->supports_frequency(144000000));
    CHECK(ic7300->supports_mode(common::Mode::USB));

    const auto ts590 = catalog.lookup("TS-590SG");
    REQUIRE(ts590);
    CHECK(ts590->family == capability::ProtocolFamily::KenwoodCat);

    CHECK(catalog.lookup("FT-991A"));
    CHECK(catalog.lookup("K3"));
    CHECK_FALSE(catalog.lookup("IC-9999"));
}

TEST_CASE("Catalog: every family is represented") {
    const auto catalog = capability::CapabilityCatalog::load_file(RIGLINK_SOURCE_DIR "/config/models.yaml");
    int civ = 0;
    int yaesu = 0;
    int kenwood = 0;
    int elecraft = 0;
    for (const auto& name : catalog.models()) {
        const auto caps = catalog.lookup(name);
        REQUIRE(caps);
        CHECK_FALSE(caps->ranges.empty());
        CHECK_FALSE(caps->modes.empty());
        switch (caps->family) {
            case capability::ProtocolFamily::Civ: ++civ; break;
            case capability::ProtocolFamily::YaesuCat: ++yaesu; break;
            case capability::ProtocolFamily::KenwoodCat: ++kenwood; break;
            case capability::ProtocolFamily::ElecraftCat: ++elecraft; break;
        }
    }
    CHECK(civ > 0);
    CHECK(yaesu > 0);
    CHECK(kenwood > 0);
    CHECK(elecraft > 0);
}

TEST_CASE("Catalog: inline document with defaults") {
    const auto catalog = capability::CapabilityCatalog::load_string(R"(
models:
  - id: IC-7300
    manufacturer: Icom
    family: civ
    modes: [USB, LSB]
    ranges:
      - {min: 14000000, max: 14350000, band: 20m}
    civ: {address: "0x94"}
)");
    const auto caps = catalog.lookup("IC-7300");
    REQUIRE(caps);
    CHECK(caps->default_baud == 19200);
    CHECK(caps->civ.frequency_bytes == 5);
    CHECK(caps->civ.vfo_model == capability::VfoModel::Targetable);
    CHECK(caps->memory.count == 0);
    CHECK(caps->features.split);
    CHECK_FALSE(caps->features.rit);
}

TEST_CASE("Catalog: malformed documents are rejected") {
    CHECK_THROWS_AS(capability::CapabilityCatalog::load_string("radios: []"), std::runtime_error);
    CHECK_THROWS_AS(capability::CapabilityCatalog::load_string(R"(
models:
  - id: X
    family: morse
    ranges: [{min: 1, max: 2}]
)"),
                    std::runtime_error);
    CHECK_THROWS_AS(capability::CapabilityCatalog::load_string(R"(
models:
  - id: IC-0
    family: civ
    ranges: [{min: 1, max: 2}]
)"),
                    std::runtime_error);
    CHECK_THROWS_AS(capability::CapabilityCatalog::load_string(R"(
models:
  - id: TS-0
    family: kenwood-cat
    ranges: [{min: 3, max: 2}]
)"),
                    std::runtime_error);
    CHECK_THROWS_AS(capability::CapabilityCatalog::load_string(R"(
models:
  - id: TS-0
    family: kenwood-cat
    modes: [USB, PSK]
    ranges: [{min: 1, max: 2}]
)"),
                    std::runtime_error);
    CHECK_THROWS_AS(capability::CapabilityCatalog::load_file("/nonexistent/models.yaml"), std::runtime_error);
}

TEST_CASE("Catalog: AGC speeds and DSP features of shipped models") {
    const auto catalog = capability::CapabilityCatalog::load_file(RIGLINK_SOURCE_DIR "/config/models.yaml");
    using common::AgcSpeed;

    const auto ic7300 = catalog.lookup("IC-7300");
    REQUIRE(ic7300);
    CHECK(ic7300->agc_speeds == std::set<AgcSpeed>{AgcSpeed::Fast, AgcSpeed::Medium, AgcSpeed::Slow});
    CHECK(ic7300->features.if_filter);
    CHECK(ic7300->features.memory_contents);
    CHECK(ic7300->features.noise_blanker);
    CHECK(ic7300->can_transmit(14074000));
    CHECK_FALSE(ic7300->can_transmit(9500000));

    // No filter byte and no memory channels on the G90.
    const auto g90 = catalog.lookup("G90");
    REQUIRE(g90);
    CHECK(g90->agc_speeds.empty());
    CHECK_FALSE(g90->features.if_filter);
    CHECK_FALSE(g90->features.memory_contents);

    const auto k3 = catalog.lookup("K3");
    REQUIRE(k3);
    CHECK(k3->agc_speeds == std::set<AgcSpeed>{AgcSpeed::Fast, AgcSpeed::Slow});
    CHECK_FALSE(k3->features.if_filter);
    CHECK_FALSE(k3->features.memory_contents);

    CHECK(catalog.lookup("FT-991A")->supports_agc(AgcSpeed::Auto));
}

TEST_CASE("Catalog: feature defaults follow the CI-V profile") {
    const auto catalog = capability::CapabilityCatalog::load_string(R"(
models:
  - id: IC-A
    family: civ
    ranges: [{min: 14000000, max: 14350000}]
    memory: {first: 1, count: 99}
    civ: {address: "0x94"}
    agc: [fast, slow]
  - id: IC-B
    family: civ
    ranges: [{min: 14000000, max: 14350000}]
    memory: {first: 1, count: 99}
    features: {memory_contents: false, noise_reduction: false}
    civ: {address: "0xA4", mode_filter: false}
)");
    const auto a = catalog.lookup("IC-A");
    REQUIRE(a);
    CHECK(a->features.if_filter);
    CHECK(a->features.memory_contents);
    CHECK(a->supports_agc(common::AgcSpeed::Slow));
    CHECK_FALSE(a->supports_agc(common::AgcSpeed::Medium));

    const auto b = catalog.lookup("IC-B");
    REQUIRE(b);
    CHECK_FALSE(b->features.if_filter);
    CHECK_FALSE(b->features.memory_contents);
    CHECK_FALSE(b->features.noise_reduction);
    CHECK(b->features.noise_blanker);

    CHECK_THROWS_WITH_AS(capability::CapabilityCatalog::load_string(R"(
models:
  - id: TS-0
    family: kenwood-cat
    ranges: [{min: 1, max: 2}]
    agc: [fast, turbo]
)"),
                         "Unknown AGC speed 'turbo' for model TS-0", std::runtime_error);
}

TEST_CASE("Catalog: duplicate models are rejected") {
    capability::CapabilityCatalog catalog;
    capability::RadioCapabilities caps;
    caps.model = "TS-2000";
    catalog.add(caps);
    CHECK_THROWS_AS(catalog.add(caps), std::runtime_error);
    CHECK(catalog.size() == 1);
}
