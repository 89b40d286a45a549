#pragma once

#include "riglink/capability/band_plan.hpp"
#include "riglink/rig/state_cache.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace riglink::config {

struct ServiceConfig {
    std::string id;
};

struct NetworkConfig {
    std::string bind_address{"127.0.0.1"};
    std::uint16_t rigctld_port{4532};
};

struct CatalogConfig {
    std::filesystem::path path{"models.yaml"};
};

struct TelemetryConfig {
    std::size_t event_buffer_size{512};
    std::chrono::hours event_retention{std::chrono::hours{24}};
};

struct SessionConfig {
    std::chrono::milliseconds response_timeout{std::chrono::milliseconds{1000}};
    int max_framing_errors{3};
};

// Unset region: transmit is limited by the model's ranges only.
struct StationConfig {
    std::optional<capability::Region> region;
};

struct RadioEntry {
    std::string id;
    std::string model;
    std::string port;
    std::optional<int> baud;
    std::optional<std::uint8_t> civ_address;
};

struct Config {
    ServiceConfig service;
    NetworkConfig network;
    CatalogConfig catalog;
    TelemetryConfig telemetry;
    SessionConfig session;
    StationConfig station;
    rig::CacheTtl cache;
    std::vector<RadioEntry> radios;
};

}  // namespace riglink::config
