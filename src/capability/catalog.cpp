#include "riglink/capability/catalog.hpp"

#include <yaml-cpp/yaml.h>

#include <stdexcept>

namespace riglink::capability {

namespace {

ProtocolFamily parse_family(const std::string& text, const std::string& model) {
    if (text == "civ") return ProtocolFamily::Civ;
    if (text == "yaesu-cat") return ProtocolFamily::YaesuCat;
    if (text == "kenwood-cat") return ProtocolFamily::KenwoodCat;
    if (text == "elecraft-cat") return ProtocolFamily::ElecraftCat;
    throw std::runtime_error("Unknown protocol family '" + text + "' for model " + model);
}

VfoModel parse_vfo_model(const std::string& text, const std::string& model) {
    if (text == "targetable") return VfoModel::Targetable;
    if (text == "current-only") return VfoModel::CurrentOnly;
    if (text == "main-sub") return VfoModel::MainSub;
    throw std::runtime_error("Unknown VFO model '" + text + "' for model " + model);
}

// Addresses are written as hex strings ("0x94") in the catalog.
std::uint8_t parse_address(const YAML::Node& node, std::uint8_t fallback) {
    if (!node) {
        return fallback;
    }
    const auto value = std::stoul(node.as<std::string>(), nullptr, 0);
    if (value > 0xFF) {
        throw std::runtime_error("CI-V address out of range: " + node.as<std::string>());
    }
    return static_cast<std::uint8_t>(value);
}

FeatureFlags parse_features(const YAML::Node& node, FeatureFlags features) {
    if (!node) {
        return features;
    }
    features.vfo_b = node["vfo_b"].as<bool>(features.vfo_b);
    features.dual_receiver = node["dual_receiver"].as<bool>(features.dual_receiver);
    features.split = node["split"].as<bool>(features.split);
    features.satellite = node["satellite"].as<bool>(features.satellite);
    features.dstar = node["dstar"].as<bool>(features.dstar);
    features.rit = node["rit"].as<bool>(features.rit);
    features.xit = node["xit"].as<bool>(features.xit);
    features.power_control = node["power_control"].as<bool>(features.power_control);
    features.ptt = node["ptt"].as<bool>(features.ptt);
    features.signal_strength = node["signal_strength"].as<bool>(features.signal_strength);
    features.noise_blanker = node["noise_blanker"].as<bool>(features.noise_blanker);
    features.noise_reduction = node["noise_reduction"].as<bool>(features.noise_reduction);
    features.if_filter = node["if_filter"].as<bool>(features.if_filter);
    features.memory_contents = node["memory_contents"].as<bool>(features.memory_contents);
    return features;
}

CivProfile parse_civ(const YAML::Node& node, const std::string& model) {
    CivProfile civ;
    if (!node) {
        throw std::runtime_error("CI-V model " + model + " requires a 'civ' section");
    }
    if (!node["address"]) {
        throw std::runtime_error("CI-V model " + model + " requires 'civ.address'");
    }
    civ.radio_address = parse_address(node["address"], civ.radio_address);
    civ.controller_address = parse_address(node["controller"], civ.controller_address);
    civ.frequency_bytes = node["frequency_bytes"].as<int>(civ.frequency_bytes);
    if (civ.frequency_bytes != 4 && civ.frequency_bytes != 5) {
        throw std::runtime_error("CI-V model " + model + " frequency_bytes must be 4 or 5");
    }
    civ.vfo_model = parse_vfo_model(node["vfo_model"].as<std::string>("targetable"), model);
    civ.mode_filter = node["mode_filter"].as<bool>(civ.mode_filter);
    return civ;
}

RadioCapabilities parse_model(const YAML::Node& node) {
    RadioCapabilities caps;
    caps.model = node["id"].as<std::string>("");
    if (caps.model.empty()) {
        throw std::runtime_error("Catalog entries require 'id'");
    }
    caps.manufacturer = node["manufacturer"].as<std::string>("");
    caps.family = parse_family(node["family"].as<std::string>(""), caps.model);
    caps.default_baud = node["baud"].as<int>(caps.default_baud);

    if (const auto power = node["power"]) {
        caps.power.min_watts = power["min"].as<int>(caps.power.min_watts);
        caps.power.max_watts = power["max"].as<int>(caps.power.max_watts);
    }

    for (const auto& entry : node["modes"]) {
        const auto name = entry.as<std::string>();
        const auto mode = common::mode_from_string(name);
        if (!mode) {
            throw std::runtime_error("Unknown mode '" + name + "' for model " + caps.model);
        }
        caps.modes.insert(*mode);
    }

    for (const auto& entry : node["ranges"]) {
        FrequencyRange range;
        range.min_hz = entry["min"].as<std::uint64_t>();
        range.max_hz = entry["max"].as<std::uint64_t>();
        range.band = entry["band"].as<std::string>("");
        range.transmit = entry["transmit"].as<bool>(true);
        if (range.min_hz > range.max_hz) {
            throw std::runtime_error("Inverted frequency range for model " + caps.model);
        }
        caps.ranges.push_back(std::move(range));
    }
    if (caps.ranges.empty()) {
        throw std::runtime_error("Model " + caps.model + " declares no frequency ranges");
    }

    if (const auto memory = node["memory"]) {
        caps.memory.first_channel = memory["first"].as<int>(caps.memory.first_channel);
        caps.memory.count = memory["count"].as<int>(0);
    }

    if (caps.family == ProtocolFamily::Civ) {
        caps.civ = parse_civ(node["civ"], caps.model);
    }

    FeatureFlags defaults;
    defaults.if_filter = caps.family == ProtocolFamily::Civ && caps.civ.mode_filter;
    defaults.memory_contents = caps.family == ProtocolFamily::Civ && caps.memory.count > 0;
    caps.features = parse_features(node["features"], defaults);

    for (const auto& entry : node["agc"]) {
        const auto name = entry.as<std::string>();
        const auto speed = common::agc_from_string(name);
        if (!speed) {
            throw std::runtime_error("Unknown AGC speed '" + name + "' for model " + caps.model);
        }
        caps.agc_speeds.insert(*speed);
    }
    return caps;
}

CapabilityCatalog parse_catalog(const YAML::Node& root) {
    CapabilityCatalog catalog;
    const auto models = root["models"];
    if (!models || !models.IsSequence()) {
        throw std::runtime_error("Model catalog requires a 'models' sequence");
    }
    for (const auto& node : models) {
        catalog.add(parse_model(node));
    }
    return catalog;
}

}  // namespace

CapabilityCatalog CapabilityCatalog::load_file(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        throw std::runtime_error("Model catalog not found: " + path.string());
    }
    return parse_catalog(YAML::LoadFile(path.string()));
}

CapabilityCatalog CapabilityCatalog::load_string(const std::string& yaml) {
    return parse_catalog(YAML::Load(yaml));
}

CapabilitiesPtr CapabilityCatalog::lookup(const std::string& model) const {
    auto it = models_.find(model);
    if (it == models_.end()) {
        return nullptr;
    }
    return it->second;
}

std::vector<std::string> CapabilityCatalog::models() const {
    std::vector<std::string> names;
    names.reserve(models_.size());
    for (const auto& [name, caps] : models_) {
        names.push_back(name);
    }
    return names;
}

void CapabilityCatalog::add(RadioCapabilities caps) {
    auto name = caps.model;
    if (models_.count(name) != 0) {
        throw std::runtime_error("Duplicate model in catalog: " + name);
    }
    models_.emplace(std::move(name), std::make_shared<const RadioCapabilities>(std::move(caps)));
}

}  // namespace riglink::capability
