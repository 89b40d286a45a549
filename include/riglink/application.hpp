#pragma once

#include "riglink/capability/catalog.hpp"
#include "riglink/config/config_manager.hpp"

#include <asio/io_context.hpp>
#include <filesystem>
#include <memory>

namespace riglink::telemetry {
class TelemetryHub;
}

namespace riglink::audit {
class AuditLogger;
}

namespace riglink::radio {
class RadioManager;
}

namespace riglink::command {
class Orchestrator;
}

namespace riglink::net {
class RigctldServer;
}

namespace riglink {

class Application {
public:
    Application(asio::io_context& io, std::filesystem::path configPath);
    ~Application();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    void start();
    void stop();

private:
    void initializeTelemetry();
    void initializeRadios();

    asio::io_context& io_;
    config::ConfigManager configManager_;
    capability::CapabilityCatalog catalog_;

    std::unique_ptr<telemetry::TelemetryHub> telemetryHub_;
    std::unique_ptr<audit::AuditLogger> auditLogger_;
    std::unique_ptr<radio::RadioManager> radioManager_;
    std::unique_ptr<command::Orchestrator> orchestrator_;
    std::unique_ptr<net::RigctldServer> rigctldServer_;
    bool running_{false};
};

}  // namespace riglink
