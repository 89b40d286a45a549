#pragma once

#include "riglink/capability/capabilities.hpp"
#include "riglink/common/commands.hpp"
#include "riglink/common/types.hpp"
#include "riglink/rig/batch_optimizer.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace riglink::radio {
class RadioManager;
}  // namespace riglink::radio

namespace riglink::telemetry {
class TelemetryHub;
}  // namespace riglink::telemetry

namespace riglink::audit {
class AuditLogger;
}  // namespace riglink::audit

namespace riglink::command {

// Routes client requests to the active radio. Writes are audited; frequency,
// PTT and fault outcomes are published as telemetry.
class Orchestrator {
public:
    Orchestrator(radio::RadioManager& radioManager,
                 telemetry::TelemetryHub& telemetry,
                 audit::AuditLogger& auditLogger);
    ~Orchestrator();

    common::CommandResult select_radio(const std::string& actor, std::string_view radioId);
    std::optional<std::string> active_radio() const;
    capability::CapabilitiesPtr capabilities() const;

    common::Result<common::Reply> execute(const std::string& actor, const common::Command& command);
    rig::BatchOutcome configure(const std::string& actor, const rig::BatchRequest& request);

    common::Result<common::Vfo> active_vfo() const;
    common::Result<int> memory_channel() const;

private:
    radio::RadioManager& radioManager_;
    telemetry::TelemetryHub& telemetry_;
    audit::AuditLogger& auditLogger_;

    void publish_outcome(const std::string& radioId,
                         const common::Command& command,
                         const common::Result<common::Reply>& result);
};

}  // namespace riglink::command
