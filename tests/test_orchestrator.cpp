#include <doctest/doctest.h>

#include "riglink/audit/audit_logger.hpp"
#include "riglink/command/orchestrator.hpp"
#include "riglink/config/config_manager.hpp"
#include "riglink/radio/radio_manager.hpp"
#include "riglink/telemetry/telemetry_hub.hpp"
#include "support/fake_icom.hpp"
#include "support/mock_transport.hpp"

#include <asio/io_context.hpp>

#include <memory>
#include <string>
#include <utility>
#include <vector>

using namespace riglink;
using common::ErrorCode;

namespace {

constexpr auto kStation = R"(
service: {id: bench}
radios:
  - {id: hf, model: IC-7300, port: /dev/ttyUSB0}
)";

struct Event {
    std::string tag;
    nlohmann::json payload;
};

// Orchestrator over an IC-7300 fake, with every audit record and telemetry
// event collected for inspection.
struct Station {
    asio::io_context io;
    capability::CapabilityCatalog catalog =
        capability::CapabilityCatalog::load_file(RIGLINK_SOURCE_DIR "/config/models.yaml");
    config::Config config;
    test::FakeIcom icom;
    std::shared_ptr<test::MockTransport::Wire> wire = std::make_shared<test::MockTransport::Wire>();
    std::vector<audit::AuditRecord> records;
    std::vector<Event> events;
    std::unique_ptr<radio::RadioManager> manager;
    std::unique_ptr<telemetry::TelemetryHub> telemetry;
    audit::AuditLogger audit{[this](const audit::AuditRecord& record) { records.push_back(record); }};
    std::unique_ptr<command::Orchestrator> orchestrator;

    explicit Station(const std::string& yaml = kStation)
        : config(config::ConfigManager::load_string(yaml)) {
        wire->responder = [this](const common::Bytes& request) { return icom(request); };
        manager = std::make_unique<radio::RadioManager>(
            config, catalog, [this](const config::RadioEntry&) -> transport::TransportPtr {
                return std::make_unique<test::MockTransport>(wire);
            });
        manager->start();
        telemetry = std::make_unique<telemetry::TelemetryHub>(io, config.telemetry);
        telemetry->set_listener([this](const std::string& tag, const nlohmann::json& payload) {
            events.push_back({tag, payload});
        });
        orchestrator = std::make_unique<command::Orchestrator>(*manager, *telemetry, audit);
    }

    ~Station() {
        manager->stop();
        telemetry->stop();
    }

    Station(const Station&) = delete;
    Station& operator=(const Station&) = delete;

    std::vector<Event> tagged(const std::string& tag) const {
        std::vector<Event> out;
        for (const auto& event : events) {
            if (event.tag == tag) {
                out.push_back(event);
            }
        }
        return out;
    }
};

}  // namespace

TEST_CASE("Orchestrator: configure without a radio fails the first step") {
    Station station("service: {id: empty}\n");
    rig::BatchRequest request;
    request.mode = common::Mode::CW;
    request.frequency_hz = 7030000;
    request.power_watts = 10;

    const auto outcome = station.orchestrator->configure("test", request);
    CHECK_FALSE(outcome.ok());
    CHECK(outcome.failure.code == ErrorCode::NotConnected);
    CHECK(outcome.committed.empty());
    REQUIRE(outcome.failed.has_value());
    CHECK(std::holds_alternative<common::SetMode>(outcome.failed->command));
    REQUIRE(outcome.skipped.size() == 2);
    const auto* tune = std::get_if<common::SetFrequency>(&outcome.skipped[0].command);
    REQUIRE(tune != nullptr);
    CHECK(tune->vfo == common::Vfo::A);
    CHECK(tune->hz == 7030000);
    CHECK(std::holds_alternative<common::SetPower>(outcome.skipped[1].command));

    // Nothing reached a radio, so nothing is audited or published.
    CHECK(station.records.empty());
    CHECK(station.events.empty());
}

TEST_CASE("Orchestrator: execute without a radio") {
    Station station("service: {id: empty}\n");
    const auto result = station.orchestrator->execute("test", common::SetFrequency{common::Vfo::A, 14074000});
    CHECK(result.status.code == ErrorCode::NotConnected);
    CHECK_FALSE(station.orchestrator->active_radio().has_value());
    CHECK(station.orchestrator->capabilities() == nullptr);
    CHECK(station.orchestrator->active_vfo().status.code == ErrorCode::NotConnected);
}

TEST_CASE("Orchestrator: writes are audited, queries are not") {
    Station station;
    REQUIRE(station.orchestrator->execute("client-1", common::SetFrequency{common::Vfo::A, 14250000}).status.ok());
    REQUIRE(station.records.size() == 1);
    const auto& tune = station.records[0];
    CHECK(tune.actor == "client-1");
    CHECK(tune.action == "set frequency VFO A 14250000 Hz");
    CHECK(tune.radio_id == "hf");
    CHECK(tune.parameters["frequencyHz"] == 14250000);
    CHECK(tune.result == ErrorCode::Ok);

    REQUIRE(station.orchestrator->execute("client-1", common::ReadFrequency{common::Vfo::A}).status.ok());
    CHECK(station.records.size() == 1);

    // Refusals are audited with their error.
    const auto refused = station.orchestrator->execute("client-1", common::SetFrequency{common::Vfo::A, 1000});
    CHECK(refused.status.code == ErrorCode::Capability);
    REQUIRE(station.records.size() == 2);
    CHECK(station.records[1].result == ErrorCode::Capability);
    CHECK_FALSE(station.records[1].message.empty());

    REQUIRE(station.orchestrator->execute("client-1", common::SetAgc{common::AgcSpeed::Slow}).status.ok());
    REQUIRE(station.records.size() == 3);
    CHECK(station.records[2].parameters["agc"] == common::to_string(common::AgcSpeed::Slow));

    CHECK_FALSE(station.orchestrator->select_radio("client-1", "uhf").ok());
    REQUIRE(station.records.size() == 4);
    CHECK(station.records[3].action == "select_radio");
    CHECK(station.records[3].result == ErrorCode::InvalidArgument);
}

TEST_CASE("Orchestrator: frequency, PTT and faults are published") {
    Station station;
    REQUIRE(station.orchestrator->execute("test", common::ReadFrequency{common::Vfo::A}).status.ok());
    REQUIRE(station.orchestrator->execute("test", common::SetFrequency{common::Vfo::A, 14200000}).status.ok());
    const auto tunes = station.tagged(telemetry::tags::FREQUENCY);
    REQUIRE(tunes.size() == 2);
    CHECK(tunes[0].payload["frequencyHz"] == 14074000);
    CHECK(tunes[1].payload["frequencyHz"] == 14200000);
    CHECK(tunes[1].payload["radioId"] == "hf");

    REQUIRE(station.orchestrator->execute("test", common::SetPtt{true}).status.ok());
    REQUIRE(station.orchestrator->execute("test", common::SetPtt{false}).status.ok());
    const auto ptt = station.tagged(telemetry::tags::PTT);
    REQUIRE(ptt.size() == 2);
    CHECK(ptt[0].payload["transmitting"] == true);
    CHECK(ptt[1].payload["transmitting"] == false);

    // Refusals are not faults.
    station.orchestrator->execute("test", common::SetPower{500});
    CHECK(station.tagged(telemetry::tags::FAULT).empty());

    station.icom.silent = true;
    CHECK(station.orchestrator->execute("test", common::ReadSignalStrength{}).status.code == ErrorCode::Timeout);
    const auto faults = station.tagged(telemetry::tags::FAULT);
    REQUIRE(faults.size() == 1);
    CHECK(faults[0].payload["code"] == "timeout");
}

TEST_CASE("Orchestrator: configure is audited as one record") {
    Station station;
    rig::BatchRequest request;
    request.mode = common::Mode::CW;
    request.frequency_hz = 14030000;

    const auto outcome = station.orchestrator->configure("logger", request);
    REQUIRE(outcome.ok());
    CHECK(station.icom.mode == 0x03);
    CHECK(station.icom.frequency[0] == 14030000);

    REQUIRE(station.records.size() == 1);
    const auto& record = station.records[0];
    CHECK(record.action == "configure");
    CHECK(record.result == ErrorCode::Ok);
    const auto& committed = record.parameters["committed"];
    REQUIRE(committed.is_array());
    CHECK(committed.back() == "set frequency VFO A 14030000 Hz");
    CHECK(record.parameters["skipped"].empty());

    const auto tunes = station.tagged(telemetry::tags::FREQUENCY);
    REQUIRE(tunes.size() == 1);
    CHECK(tunes[0].payload["frequencyHz"] == 14030000);
}
