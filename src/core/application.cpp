#include "riglink/application.hpp"

#include "riglink/audit/audit_logger.hpp"
#include "riglink/command/orchestrator.hpp"
#include "riglink/net/rigctld_server.hpp"
#include "riglink/radio/radio_manager.hpp"
#include "riglink/telemetry/telemetry_hub.hpp"

#include <dts/common/core/logging.hpp>

#include <utility>

namespace riglink {

Application::Application(asio::io_context& io, std::filesystem::path configPath)
    : io_(io),
      configManager_(std::move(configPath)),
      catalog_(capability::CapabilityCatalog::load_file(configManager_.current().catalog.path)) {}

Application::~Application() {
    stop();
}

void Application::start() {
    const auto& cfg = configManager_.current();
    dts::common::core::getLogger().info("[Application] " + cfg.service.id + ": " + std::to_string(catalog_.size()) +
                                        " models from " + cfg.catalog.path.string());

    initializeTelemetry();
    initializeRadios();

    rigctldServer_ = std::make_unique<net::RigctldServer>(io_, cfg.network, *orchestrator_);
    rigctldServer_->start();
    running_ = true;

    telemetryHub_->publish_ready(cfg.service.id, cfg.radios.size());
}

void Application::stop() {
    if (!running_) {
        return;
    }
    running_ = false;
    if (rigctldServer_) {
        rigctldServer_->stop();
    }
    if (radioManager_) {
        radioManager_->stop();
    }
    if (telemetryHub_) {
        telemetryHub_->stop();
    }
    io_.stop();
}

void Application::initializeTelemetry() {
    telemetryHub_ = std::make_unique<telemetry::TelemetryHub>(io_, configManager_.current().telemetry);
    telemetryHub_->set_listener([](const std::string& tag, const nlohmann::json& payload) {
        if (tag == telemetry::tags::FAULT) {
            dts::common::core::getLogger().info("[Telemetry] fault " + payload.dump());
        }
    });
    auditLogger_ = std::make_unique<audit::AuditLogger>();
}

void Application::initializeRadios() {
    radioManager_ = std::make_unique<radio::RadioManager>(configManager_.current(), catalog_);
    radioManager_->set_state_observer(
        [hub = telemetryHub_.get()](const std::string& id, common::SessionState state, const std::string& detail) {
            hub->publish_radio_state(id, state, detail);
        });
    radioManager_->start();

    orchestrator_ = std::make_unique<command::Orchestrator>(*radioManager_, *telemetryHub_, *auditLogger_);
}

}  // namespace riglink
