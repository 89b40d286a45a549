#include "riglink/radio/radio_manager.hpp"

#include "riglink/transport/serial_transport.hpp"

#include <dts/common/core/logging.hpp>

#include <stdexcept>
#include <utility>

namespace riglink::radio {

namespace {

transport::TransportPtr make_serial(const config::RadioEntry&) {
    return std::make_unique<transport::SerialTransport>();
}

rig::PortConfig port_config(const config::RadioEntry& entry) {
    rig::PortConfig port;
    port.port = entry.port;
    port.baud = entry.baud.value_or(0);
    port.civ_address = entry.civ_address;
    return port;
}

}  // namespace

RadioManager::RadioManager(const config::Config& config,
                           const capability::CapabilityCatalog& catalog,
                           TransportFactory factory) {
    load_from_config(config, catalog, factory ? factory : TransportFactory{make_serial});
}

RadioManager::~RadioManager() = default;

void RadioManager::set_state_observer(StateObserver observer) {
    std::lock_guard<std::mutex> lock(observer_mutex_);
    observer_ = std::move(observer);
}

void RadioManager::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& id : order_) {
        auto& descriptor = radios_.at(id);
        descriptor.controller->set_state_listener(
            [this, id](common::SessionState state, const std::string& detail) {
                dts::common::core::getLogger().info("[RadioManager] " + id + " " + common::to_string(state) +
                                                    (detail.empty() ? "" : ": " + detail));
                StateObserver observer;
                {
                    std::lock_guard<std::mutex> observer_lock(observer_mutex_);
                    observer = observer_;
                }
                if (observer) {
                    observer(id, state, detail);
                }
            });

        const auto result = descriptor.controller->connect(descriptor.model, port_config(entries_.at(id)));
        if (!result.ok()) {
            dts::common::core::getLogger().info("[RadioManager] " + id + " (" + descriptor.model +
                                                ") failed to connect: " + result.message);
        }
    }
}

void RadioManager::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& id : order_) {
        const auto result = radios_.at(id).controller->disconnect();
        if (!result.ok()) {
            dts::common::core::getLogger().info("[RadioManager] " + id + " disconnect: " + result.message);
        }
    }
}

std::vector<RadioSummary> RadioManager::list_radios() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<RadioSummary> result;
    result.reserve(order_.size());
    for (const auto& id : order_) {
        const auto& descriptor = radios_.at(id);
        result.push_back({descriptor.id, descriptor.model, descriptor.port, descriptor.controller->state()});
    }
    return result;
}

std::optional<std::string> RadioManager::active_radio() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_radio_;
}

bool RadioManager::set_active_radio(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (radios_.find(id) == radios_.end()) {
        return false;
    }
    active_radio_ = id;
    dts::common::core::getLogger().info("[RadioManager] Active radio set to " + id);
    return true;
}

ControllerPtr RadioManager::get_controller(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = radios_.find(id);
    if (it == radios_.end()) {
        return nullptr;
    }
    return it->second.controller;
}

ControllerPtr RadioManager::active_controller() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!active_radio_) {
        return nullptr;
    }
    return radios_.at(*active_radio_).controller;
}

void RadioManager::load_from_config(const config::Config& config,
                                    const capability::CapabilityCatalog& catalog,
                                    const TransportFactory& factory) {
    rig::SessionOptions options;
    options.response_timeout = config.session.response_timeout;
    options.max_framing_errors = config.session.max_framing_errors;
    options.cache_ttl = config.cache;
    options.region = config.station.region;

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& radio : config.radios) {
        if (!catalog.lookup(radio.model)) {
            throw std::runtime_error("Radio '" + radio.id + "' uses unknown model '" + radio.model + "'");
        }

        RadioDescriptor descriptor{
            .id = radio.id,
            .model = radio.model,
            .port = radio.port,
            .controller = std::make_shared<rig::RigController>(factory(radio), catalog, options)
        };
        radios_.emplace(radio.id, std::move(descriptor));
        entries_.emplace(radio.id, radio);
        order_.push_back(radio.id);
    }
    if (!order_.empty()) {
        active_radio_ = order_.front();
    }
}

}  // namespace riglink::radio
