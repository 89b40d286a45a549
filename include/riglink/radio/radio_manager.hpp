#pragma once

#include "riglink/capability/catalog.hpp"
#include "riglink/common/types.hpp"
#include "riglink/config/types.hpp"
#include "riglink/rig/rig_controller.hpp"
#include "riglink/transport/transport.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace riglink::radio {

using ControllerPtr = std::shared_ptr<rig::RigController>;

struct RadioDescriptor {
    std::string id;
    std::string model;
    std::string port;
    ControllerPtr controller;
};

struct RadioSummary {
    std::string id;
    std::string model;
    std::string port;
    common::SessionState state{common::SessionState::Disconnected};
};

class RadioManager {
public:
    using TransportFactory = std::function<transport::TransportPtr(const config::RadioEntry&)>;
    using StateObserver =
        std::function<void(const std::string& radio_id, common::SessionState state, const std::string& detail)>;

    // Without a factory every radio gets a serial transport.
    RadioManager(const config::Config& config,
                 const capability::CapabilityCatalog& catalog,
                 TransportFactory factory = {});
    ~RadioManager();

    RadioManager(const RadioManager&) = delete;
    RadioManager& operator=(const RadioManager&) = delete;

    // May be replaced at any time; sessions pick up the new observer on their
    // next state change.
    void set_state_observer(StateObserver observer);

    void start();
    void stop();

    std::vector<RadioSummary> list_radios() const;
    std::optional<std::string> active_radio() const;
    bool set_active_radio(const std::string& id);
    ControllerPtr get_controller(const std::string& id) const;
    ControllerPtr active_controller() const;

private:
    mutable std::mutex mutex_;
    std::vector<std::string> order_;
    std::unordered_map<std::string, RadioDescriptor> radios_;
    std::unordered_map<std::string, config::RadioEntry> entries_;
    std::optional<std::string> active_radio_;

    // Separate from mutex_: listeners fire during connect() inside start(),
    // which already holds mutex_.
    mutable std::mutex observer_mutex_;
    StateObserver observer_;

    void load_from_config(const config::Config& config,
                          const capability::CapabilityCatalog& catalog,
                          const TransportFactory& factory);
};

}  // namespace riglink::radio
