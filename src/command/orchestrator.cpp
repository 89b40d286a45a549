#include "riglink/command/orchestrator.hpp"

#include "riglink/audit/audit_logger.hpp"
#include "riglink/common/overloaded.hpp"
#include "riglink/radio/radio_manager.hpp"
#include "riglink/telemetry/telemetry_hub.hpp"

#include <nlohmann/json.hpp>

namespace riglink::command {

namespace {

using common::ErrorCode;

nlohmann::json offset_json(const common::RitXitState& state) {
    return {{"enabled", state.enabled}, {"offsetHz", state.offset_hz}};
}

nlohmann::json parameters(const common::Command& command) {
    return std::visit(
        common::overloaded{
            [](const common::SetFrequency& c) -> nlohmann::json {
                return {{"vfo", common::to_string(c.vfo)}, {"frequencyHz", c.hz}};
            },
            [](const common::SetMode& c) -> nlohmann::json { return {{"mode", common::to_string(c.mode)}}; },
            [](const common::SelectVfo& c) -> nlohmann::json { return {{"vfo", common::to_string(c.vfo)}}; },
            [](const common::SetSplit& c) -> nlohmann::json { return {{"enabled", c.enabled}}; },
            [](const common::SetPower& c) -> nlohmann::json { return {{"watts", c.watts}}; },
            [](const common::SetPtt& c) -> nlohmann::json { return {{"transmit", c.enabled}}; },
            [](const common::SetRit& c) -> nlohmann::json { return offset_json(c.state); },
            [](const common::SetXit& c) -> nlohmann::json { return offset_json(c.state); },
            [](const common::SelectMemory& c) -> nlohmann::json { return {{"channel", c.channel}}; },
            [](const common::StoreMemory& c) -> nlohmann::json { return {{"channel", c.channel}}; },
            [](const common::ClearMemory& c) -> nlohmann::json { return {{"channel", c.channel}}; },
            [](const common::SetSatelliteMode& c) -> nlohmann::json { return {{"enabled", c.enabled}}; },
            [](const common::SetAgc& c) -> nlohmann::json { return {{"agc", common::to_string(c.speed)}}; },
            [](const common::SetNoiseBlanker& c) -> nlohmann::json { return {{"enabled", c.enabled}}; },
            [](const common::SetNoiseReduction& c) -> nlohmann::json { return {{"enabled", c.enabled}}; },
            [](const common::SetFilter& c) -> nlohmann::json {
                return {{"filter", common::to_string(c.filter)}, {"mode", common::to_string(c.mode)}};
            },
            [](const common::WriteMemory& c) -> nlohmann::json {
                if (c.contents.blank) {
                    return {{"channel", c.contents.channel}, {"blank", true}};
                }
                return {{"channel", c.contents.channel},
                        {"frequencyHz", c.contents.frequency_hz},
                        {"mode", common::to_string(c.contents.mode)},
                        {"name", c.contents.name}};
            },
            [](const auto&) { return nlohmann::json::object(); },
        },
        command);
}

bool is_fault(ErrorCode code) {
    return code == ErrorCode::Timeout || code == ErrorCode::Transport || code == ErrorCode::Framing;
}

}  // namespace

Orchestrator::Orchestrator(radio::RadioManager& radioManager,
                           telemetry::TelemetryHub& telemetry,
                           audit::AuditLogger& auditLogger)
    : radioManager_{radioManager},
      telemetry_{telemetry},
      auditLogger_{auditLogger} {}

Orchestrator::~Orchestrator() = default;

common::CommandResult Orchestrator::select_radio(const std::string& actor, std::string_view radioId) {
    const std::string id{radioId};
    common::CommandResult result;
    if (!radioManager_.set_active_radio(id)) {
        result = {ErrorCode::InvalidArgument, "Unknown radio '" + id + "'"};
    }
    auditLogger_.record({actor, "select_radio", id, nlohmann::json::object(), result.code, result.message});
    return result;
}

std::optional<std::string> Orchestrator::active_radio() const {
    return radioManager_.active_radio();
}

capability::CapabilitiesPtr Orchestrator::capabilities() const {
    const auto controller = radioManager_.active_controller();
    return controller ? controller->capabilities() : nullptr;
}

common::Result<common::Reply> Orchestrator::execute(const std::string& actor, const common::Command& command) {
    const auto radioId = radioManager_.active_radio().value_or("");
    const auto controller = radioManager_.active_controller();
    if (!controller) {
        return {{ErrorCode::NotConnected, "No active radio"}, std::nullopt};
    }

    const bool query = common::is_query(command);
    auto result = controller->execute(command, query);
    if (!query) {
        auditLogger_.record({actor, common::describe(command), radioId, parameters(command), result.status.code,
                             result.status.message});
    }
    publish_outcome(radioId, command, result);
    return result;
}

rig::BatchOutcome Orchestrator::configure(const std::string& actor, const rig::BatchRequest& request) {
    const auto radioId = radioManager_.active_radio().value_or("");
    const auto controller = radioManager_.active_controller();
    rig::BatchOutcome outcome;
    if (!controller) {
        auto steps = rig::BatchOptimizer::plan(request, common::Vfo::A);
        if (!steps.empty()) {
            outcome.failed = steps.front();
            outcome.skipped.assign(steps.begin() + 1, steps.end());
        }
        outcome.failure = {ErrorCode::NotConnected, "No active radio"};
        return outcome;
    }

    outcome = controller->configure(request);

    nlohmann::json committed = nlohmann::json::array();
    for (const auto& step : outcome.committed) {
        committed.push_back(common::describe(step.command));
    }
    nlohmann::json skipped = nlohmann::json::array();
    for (const auto& step : outcome.skipped) {
        skipped.push_back(common::describe(step.command));
    }
    nlohmann::json params = {
        {"committed", committed},
        {"unchanged", outcome.unchanged.size()},
        {"skipped", skipped}
    };
    if (outcome.failed) {
        params["failed"] = common::describe(outcome.failed->command);
    }
    auditLogger_.record({actor, "configure", radioId, std::move(params), outcome.failure.code,
                         outcome.failure.message});

    for (const auto& step : outcome.committed) {
        if (const auto* tune = std::get_if<common::SetFrequency>(&step.command)) {
            telemetry_.publish_frequency(radioId, tune->vfo, tune->hz);
        }
    }
    if (outcome.failed && is_fault(outcome.failure.code)) {
        telemetry_.publish_fault(radioId, outcome.failure);
    }
    return outcome;
}

common::Result<common::Vfo> Orchestrator::active_vfo() const {
    const auto controller = radioManager_.active_controller();
    if (!controller) {
        return {{ErrorCode::NotConnected, "No active radio"}, std::nullopt};
    }
    return controller->get_vfo();
}

common::Result<int> Orchestrator::memory_channel() const {
    const auto controller = radioManager_.active_controller();
    if (!controller) {
        return {{ErrorCode::NotConnected, "No active radio"}, std::nullopt};
    }
    return controller->get_memory_channel();
}

void Orchestrator::publish_outcome(const std::string& radioId,
                                   const common::Command& command,
                                   const common::Result<common::Reply>& result) {
    if (!result.status.ok()) {
        if (is_fault(result.status.code)) {
            telemetry_.publish_fault(radioId, result.status);
        }
        return;
    }

    const auto& reply = *result.value;
    std::visit(
        common::overloaded{
            [&](const common::ReadFrequency& c) {
                if (const auto* hz = std::get_if<std::uint64_t>(&reply)) {
                    telemetry_.publish_frequency(radioId, c.vfo, *hz);
                }
            },
            [&](const common::SetFrequency& c) {
                const auto* hz = std::get_if<std::uint64_t>(&reply);
                telemetry_.publish_frequency(radioId, c.vfo, hz ? *hz : c.hz);
            },
            [&](const common::ReadPtt&) {
                if (const auto* on = std::get_if<bool>(&reply)) {
                    telemetry_.publish_ptt(radioId, *on);
                }
            },
            [&](const common::SetPtt& c) {
                const auto* on = std::get_if<bool>(&reply);
                telemetry_.publish_ptt(radioId, on ? *on : c.enabled);
            },
            [](const auto&) {},
        },
        command);
}

}  // namespace riglink::command
