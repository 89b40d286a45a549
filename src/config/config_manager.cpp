#include "riglink/config/config_manager.hpp"

#include <yaml-cpp/yaml.h>

#include <stdexcept>

namespace riglink::config {

namespace {

template <typename Duration>
Duration parseDuration(const YAML::Node& node, const std::string& key, Duration fallback) {
    if (!node[key]) {
        return fallback;
    }
    const auto count = node[key].as<int64_t>();
    if (count <= 0) {
        throw std::runtime_error("Duration for '" + key + "' must be positive");
    }
    return Duration{count};
}

std::uint8_t parseCivAddress(const YAML::Node& node) {
    const auto text = node.as<std::string>();
    unsigned long value = 0;
    try {
        value = std::stoul(text, nullptr, 0);
    } catch (const std::logic_error&) {
        throw std::runtime_error("Invalid civ_address '" + text + "'");
    }
    if (value > 0xFF) {
        throw std::runtime_error("civ_address '" + text + "' does not fit in one byte");
    }
    return static_cast<std::uint8_t>(value);
}

Config parseConfig(const YAML::Node& root, const std::filesystem::path& base_dir) {
    Config cfg;

    if (const auto service = root["service"]) {
        cfg.service.id = service["id"].as<std::string>("");
    }
    if (cfg.service.id.empty()) {
        throw std::runtime_error("Missing 'service.id'");
    }

    if (const auto network = root["network"]) {
        cfg.network.bind_address = network["bind_address"].as<std::string>(cfg.network.bind_address);
        cfg.network.rigctld_port = static_cast<std::uint16_t>(network["rigctld_port"].as<int>(4532));
    }

    if (const auto catalog = root["catalog"]) {
        cfg.catalog.path = catalog["path"].as<std::string>(cfg.catalog.path.string());
    }
    if (cfg.catalog.path.is_relative() && !base_dir.empty()) {
        cfg.catalog.path = base_dir / cfg.catalog.path;
    }

    if (const auto telemetry = root["telemetry"]) {
        cfg.telemetry.event_buffer_size = telemetry["event_buffer_size"].as<std::size_t>(512);
        cfg.telemetry.event_retention = parseDuration<std::chrono::hours>(
            telemetry, "event_retention_hours", std::chrono::hours{24});
    }

    if (const auto session = root["session"]) {
        cfg.session.response_timeout = parseDuration<std::chrono::milliseconds>(
            session, "response_timeout_ms", cfg.session.response_timeout);
        cfg.session.max_framing_errors = session["max_framing_errors"].as<int>(3);
        if (cfg.session.max_framing_errors < 1) {
            throw std::runtime_error("'session.max_framing_errors' must be at least 1");
        }
    }

    if (const auto station = root["station"]) {
        if (station["region"]) {
            const auto number = station["region"].as<int>();
            cfg.station.region = capability::region_from_number(number);
            if (!cfg.station.region) {
                throw std::runtime_error("'station.region' must be 1, 2 or 3");
            }
        }
    }

    if (const auto cache = root["cache"]) {
        using std::chrono::milliseconds;
        auto& ttl = cfg.cache;
        ttl.frequency = parseDuration<milliseconds>(cache, "frequency_ttl_ms", ttl.frequency);
        ttl.mode = parseDuration<milliseconds>(cache, "mode_ttl_ms", ttl.mode);
        ttl.vfo = parseDuration<milliseconds>(cache, "vfo_ttl_ms", ttl.vfo);
        ttl.split = parseDuration<milliseconds>(cache, "split_ttl_ms", ttl.split);
        ttl.power = parseDuration<milliseconds>(cache, "power_ttl_ms", ttl.power);
        ttl.ptt = parseDuration<milliseconds>(cache, "ptt_ttl_ms", ttl.ptt);
        ttl.signal = parseDuration<milliseconds>(cache, "signal_ttl_ms", ttl.signal);
        ttl.offset = parseDuration<milliseconds>(cache, "offset_ttl_ms", ttl.offset);
        ttl.memory = parseDuration<milliseconds>(cache, "memory_ttl_ms", ttl.memory);
        ttl.dsp = parseDuration<milliseconds>(cache, "dsp_ttl_ms", ttl.dsp);
    }

    if (const auto radios = root["radios"]) {
        for (const auto& node : radios) {
            RadioEntry radio;
            radio.id = node["id"].as<std::string>("");
            radio.model = node["model"].as<std::string>("");
            radio.port = node["port"].as<std::string>("");
            if (node["baud"]) {
                radio.baud = node["baud"].as<int>();
            }
            if (node["civ_address"]) {
                radio.civ_address = parseCivAddress(node["civ_address"]);
            }

            if (radio.id.empty() || radio.model.empty() || radio.port.empty()) {
                throw std::runtime_error("Radio entries require 'id', 'model', and 'port'");
            }
            for (const auto& existing : cfg.radios) {
                if (existing.id == radio.id) {
                    throw std::runtime_error("Duplicate radio id '" + radio.id + "'");
                }
            }

            cfg.radios.emplace_back(std::move(radio));
        }
    }

    return cfg;
}

}  // namespace

ConfigManager::ConfigManager(std::filesystem::path path)
    : path_(std::move(path)),
      config_(loadFromFile(path_)) {}

const Config& ConfigManager::current() const {
    std::scoped_lock lock(mutex_);
    return config_;
}

void ConfigManager::reload() {
    Config updated = loadFromFile(path_);
    std::scoped_lock lock(mutex_);
    config_ = std::move(updated);
}

Config ConfigManager::load_string(const std::string& yaml, const std::filesystem::path& base_dir) {
    const YAML::Node root = YAML::Load(yaml);
    if (!root || !root.IsMap()) {
        throw std::runtime_error("Configuration must be a YAML mapping");
    }
    return parseConfig(root, base_dir);
}

Config ConfigManager::loadFromFile(const std::filesystem::path& path) const {
    if (!std::filesystem::exists(path)) {
        throw std::runtime_error("Configuration file not found: " + path.string());
    }

    YAML::Node root = YAML::LoadFile(path.string());
    if (!root || !root.IsMap()) {
        throw std::runtime_error("Failed to parse configuration file: " + path.string());
    }

    return parseConfig(root, path.parent_path());
}

}  // namespace riglink::config
