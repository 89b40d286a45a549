#include <doctest/doctest.h>

#include "riglink/config/config_manager.hpp"

#include <stdexcept>

using namespace riglink;
using namespace std::chrono_literals;
using config::ConfigManager;

TEST_CASE("Config: shipped default file") {
    ConfigManager manager(RIGLINK_SOURCE_DIR "/config/default.yaml");
    const auto& cfg = manager.current();
    CHECK(cfg.service.id == "riglink-station");
    CHECK(cfg.network.rigctld_port == 4532);
    CHECK(cfg.catalog.path == std::filesystem::path(RIGLINK_SOURCE_DIR "/config") / "models.yaml");
    REQUIRE(cfg.radios.size() == 2);
    CHECK(cfg.radios[0].model == "IC-7300");
    CHECK(cfg.radios[0].baud == 115200);
    CHECK_FALSE(cfg.radios[0].civ_address.has_value());
    CHECK(cfg.radios[1].civ_address == std::uint8_t{0xA2});
    CHECK_FALSE(cfg.radios[1].baud.has_value());
    CHECK(cfg.station.region == capability::Region::Two);
    CHECK(cfg.cache.dsp == 2000ms);
}

TEST_CASE("Config: defaults for omitted sections") {
    const auto cfg = ConfigManager::load_string("service: {id: bench}\n");
    CHECK(cfg.network.bind_address == "127.0.0.1");
    CHECK(cfg.network.rigctld_port == 4532);
    CHECK(cfg.session.response_timeout == 1000ms);
    CHECK(cfg.session.max_framing_errors == 3);
    CHECK(cfg.cache.ptt == 100ms);
    CHECK(cfg.telemetry.event_buffer_size == 512);
    CHECK_FALSE(cfg.station.region.has_value());
    CHECK(cfg.radios.empty());
}

TEST_CASE("Config: session and cache tuning") {
    const auto cfg = ConfigManager::load_string(R"(
service: {id: bench}
network: {bind_address: 0.0.0.0, rigctld_port: 4533}
session: {response_timeout_ms: 250, max_framing_errors: 5}
station: {region: 3}
cache: {frequency_ttl_ms: 300, signal_ttl_ms: 50, dsp_ttl_ms: 700}
)");
    CHECK(cfg.network.bind_address == "0.0.0.0");
    CHECK(cfg.network.rigctld_port == 4533);
    CHECK(cfg.session.response_timeout == 250ms);
    CHECK(cfg.session.max_framing_errors == 5);
    CHECK(cfg.cache.frequency == 300ms);
    CHECK(cfg.cache.signal == 50ms);
    CHECK(cfg.cache.mode == 1000ms);
    CHECK(cfg.cache.dsp == 700ms);
    CHECK(cfg.station.region == capability::Region::Three);
}

TEST_CASE("Config: relative catalog paths follow the config directory") {
    const auto relative = ConfigManager::load_string("service: {id: a}\ncatalog: {path: rigs.yaml}\n", "/etc/riglink");
    CHECK(relative.catalog.path == std::filesystem::path("/etc/riglink/rigs.yaml"));

    const auto absolute = ConfigManager::load_string("service: {id: a}\ncatalog: {path: /opt/rigs.yaml}\n", "/etc/riglink");
    CHECK(absolute.catalog.path == std::filesystem::path("/opt/rigs.yaml"));
}

TEST_CASE("Config: invalid documents") {
    CHECK_THROWS_AS(ConfigManager::load_string("- a\n- b\n"), std::runtime_error);
    CHECK_THROWS_AS(ConfigManager::load_string("network: {rigctld_port: 1}\n"), std::runtime_error);
    CHECK_THROWS_AS(ConfigManager::load_string("service: {id: a}\nsession: {response_timeout_ms: 0}\n"),
                    std::runtime_error);
    CHECK_THROWS_AS(ConfigManager::load_string("service: {id: a}\nsession: {max_framing_errors: 0}\n"),
                    std::runtime_error);
    CHECK_THROWS_AS(ConfigManager::load_string(R"(
service: {id: a}
radios:
  - {id: hf, model: IC-7300}
)"),
                    std::runtime_error);
    CHECK_THROWS_AS(ConfigManager::load_string(R"(
service: {id: a}
radios:
  - {id: hf, model: IC-7300, port: /dev/ttyUSB0}
  - {id: hf, model: IC-705, port: /dev/ttyUSB1}
)"),
                    std::runtime_error);
    CHECK_THROWS_AS(ConfigManager::load_string(R"(
service: {id: a}
radios:
  - {id: hf, model: IC-7300, port: /dev/ttyUSB0, civ_address: "0x1FF"}
)"),
                    std::runtime_error);
    CHECK_THROWS_AS(ConfigManager::load_string("service: {id: a}\nstation: {region: 4}\n"), std::runtime_error);
    CHECK_THROWS_AS(ConfigManager("/nonexistent/riglink.yaml"), std::runtime_error);
}
