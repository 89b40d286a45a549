#include <doctest/doctest.h>

#include "riglink/audit/audit_logger.hpp"
#include "riglink/command/orchestrator.hpp"
#include "riglink/config/config_manager.hpp"
#include "riglink/net/rigctld_handler.hpp"
#include "riglink/radio/radio_manager.hpp"
#include "riglink/telemetry/telemetry_hub.hpp"
#include "support/fake_icom.hpp"
#include "support/mock_transport.hpp"

#include <asio/io_context.hpp>

#include <memory>
#include <string>

using namespace riglink;

namespace {

constexpr auto kStation = R"(
service: {id: bench}
radios:
  - {id: hf, model: IC-7300, port: /dev/ttyUSB0}
  - {id: ts, model: TS-590SG, port: /dev/ttyUSB1}
)";

// rigctld front end wired to an IC-7300 fake and an unanswered TS-590SG.
struct Rigctld {
    asio::io_context io;
    capability::CapabilityCatalog catalog =
        capability::CapabilityCatalog::load_file(RIGLINK_SOURCE_DIR "/config/models.yaml");
    config::Config config;
    test::FakeIcom icom;
    std::shared_ptr<test::MockTransport::Wire> icom_wire = std::make_shared<test::MockTransport::Wire>();
    std::shared_ptr<test::MockTransport::Wire> kenwood_wire = std::make_shared<test::MockTransport::Wire>();
    std::unique_ptr<radio::RadioManager> manager;
    std::unique_ptr<telemetry::TelemetryHub> telemetry;
    audit::AuditLogger audit;
    std::unique_ptr<command::Orchestrator> orchestrator;
    std::unique_ptr<net::RigctldHandler> handler;

    explicit Rigctld(const std::string& yaml = kStation)
        : config(config::ConfigManager::load_string(yaml)) {
        icom_wire->responder = [this](const common::Bytes& request) { return icom(request); };
        manager = std::make_unique<radio::RadioManager>(
            config, catalog, [this](const config::RadioEntry& entry) -> transport::TransportPtr {
                return std::make_unique<test::MockTransport>(entry.id == "hf" ? icom_wire : kenwood_wire);
            });
        manager->start();
        telemetry = std::make_unique<telemetry::TelemetryHub>(io, config.telemetry);
        orchestrator = std::make_unique<command::Orchestrator>(*manager, *telemetry, audit);
        handler = std::make_unique<net::RigctldHandler>(*orchestrator, "rigctld:test");
    }

    ~Rigctld() {
        manager->stop();
        telemetry->stop();
    }

    Rigctld(const Rigctld&) = delete;
    Rigctld& operator=(const Rigctld&) = delete;

    std::string send(const std::string& line) {
        const auto command = net::RigctldParser::parse(line);
        return handler->handle(command).format(command.extended);
    }
};

}  // namespace

TEST_CASE("rigctld: frequency set and read back") {
    Rigctld rig;
    CHECK(rig.send("F 14074000") == "RPRT 0\n");
    CHECK(rig.send("f") == "14074000\n");
    CHECK(rig.send("F 14250000.000000") == "RPRT 0\n");
    CHECK(rig.icom.frequency[0] == 14250000);
    CHECK(rig.send("+f") == "get_freq: 14250000\nRPRT 0\n");
}

TEST_CASE("rigctld: out of band frequency is an invalid parameter") {
    Rigctld rig;
    CHECK(rig.send("F 144000000") == "RPRT -1\n");
    CHECK(rig.icom.frequency[0] == 14074000);
}

TEST_CASE("rigctld: mode with passband") {
    Rigctld rig;
    CHECK(rig.send("M CW 500") == "RPRT 0\n");
    CHECK(rig.icom.mode == 0x03);
    CHECK(rig.send("m") == "CW\n500\n");
    CHECK(rig.send("M usb 0") == "RPRT 0\n");
    CHECK(rig.send("m") == "USB\n2400\n");
    CHECK(rig.send("M PSK31 0") == "RPRT -1\n");
    CHECK(rig.send("+m") == "get_mode:\nUSB\n2400\nRPRT 0\n");
}

TEST_CASE("rigctld: VFO selection") {
    Rigctld rig;
    CHECK(rig.send("v") == "VFOA\n");
    CHECK(rig.send("V VFOB") == "RPRT 0\n");
    CHECK(rig.icom.vfo == 1);
    CHECK(rig.send("v") == "VFOB\n");
    CHECK(rig.send("V VFOC") == "RPRT -1\n");
    CHECK(rig.send("\\chk_vfo") == "0\n");
}

TEST_CASE("rigctld: PTT") {
    Rigctld rig;
    CHECK(rig.send("T 1") == "RPRT 0\n");
    CHECK(rig.icom.transmitting);
    CHECK(rig.send("t") == "1\n");
    CHECK(rig.send("T 0") == "RPRT 0\n");
    CHECK_FALSE(rig.icom.transmitting);
}

TEST_CASE("rigctld: split operation") {
    Rigctld rig;
    CHECK(rig.send("S 1 VFOB") == "RPRT 0\n");
    CHECK(rig.icom.split);
    CHECK(rig.send("s") == "1\nVFOB\n");

    CHECK(rig.send("I 14080000") == "RPRT 0\n");
    CHECK(rig.icom.frequency[1] == 14080000);
    CHECK(rig.send("i") == "14080000\n");
}

TEST_CASE("rigctld: split mode goes through VFO B and returns") {
    Rigctld rig;
    CHECK(rig.send("X CW 500") == "RPRT 0\n");
    CHECK(rig.icom.mode == 0x03);
    CHECK(rig.icom.vfo == 0);
    CHECK(rig.send("v") == "VFOA\n");

    CHECK(rig.send("x") == "CW\n500\n");
    CHECK(rig.icom.vfo == 0);
}

TEST_CASE("rigctld: levels") {
    Rigctld rig;
    rig.icom.power_level = 0;
    CHECK(rig.send("L RFPOWER 0.5") == "RPRT 0\n");
    CHECK(rig.icom.power_level == 128);
    CHECK(rig.send("l RFPOWER") == "0.500000\n");
    CHECK(rig.send("L RFPOWER 1.5") == "RPRT -1\n");

    CHECK(rig.send("l STRENGTH") == "0\n");
    CHECK(rig.send("L STRENGTH 1") == "RPRT -1\n");
    CHECK(rig.send("l AF") == "RPRT -4\n");
}

TEST_CASE("rigctld: AGC level uses the Hamlib values") {
    Rigctld rig;
    CHECK(rig.send("l AGC") == "2\n");
    CHECK(rig.send("L AGC 3") == "RPRT 0\n");
    CHECK(rig.icom.agc == 0x03);
    CHECK(rig.send("l AGC") == "3\n");
    CHECK(rig.send("L AGC 1") == "RPRT 0\n");
    CHECK(rig.icom.agc == 0x01);
    // The IC-7300 always runs some AGC.
    CHECK(rig.send("L AGC 0") == "RPRT -1\n");
    CHECK(rig.send("L AGC 4") == "RPRT -1\n");
    CHECK(rig.send("L AGC 2.5") == "RPRT -1\n");
    CHECK(rig.icom.agc == 0x01);
}

TEST_CASE("rigctld: noise blanker and noise reduction functions") {
    Rigctld rig;
    CHECK(rig.send("u NB") == "0\n");
    CHECK(rig.send("U NB 1") == "RPRT 0\n");
    CHECK(rig.icom.noise_blanker);
    CHECK(rig.send("u NB") == "1\n");
    CHECK(rig.send("U NR 1") == "RPRT 0\n");
    CHECK(rig.icom.noise_reduction);
    CHECK(rig.send("+\\get_func NR") == "get_func: 1\nRPRT 0\n");
    CHECK(rig.send("U NR 0") == "RPRT 0\n");
    CHECK_FALSE(rig.icom.noise_reduction);
    CHECK(rig.send("u ANF") == "RPRT -4\n");
    CHECK(rig.send("U TONE 1") == "RPRT -4\n");
}

TEST_CASE("rigctld: offsets and channels beyond int range are invalid") {
    Rigctld rig;
    CHECK(rig.send("J 4294967346") == "RPRT -1\n");
    CHECK(rig.send("Z -4294967296") == "RPRT -1\n");
    CHECK(rig.send("E 4294967297") == "RPRT -1\n");
    CHECK(rig.icom.memory_channel == 0);
}

TEST_CASE("rigctld: power conversions use the model's maximum") {
    Rigctld rig;
    CHECK(rig.send("\\power2mW 0.5 14074000 USB") == "50000\n");
    CHECK(rig.send("\\mW2power 25000 14074000 USB") == "0.250000\n");
    CHECK(rig.send("2 1.5 14074000 USB") == "RPRT -1\n");
}

TEST_CASE("rigctld: memory channels") {
    Rigctld rig;
    CHECK(rig.send("e") == "RPRT -1\n");
    CHECK(rig.send("E 12") == "RPRT 0\n");
    CHECK(rig.icom.memory_channel == 12);
    CHECK(rig.send("e") == "12\n");
    CHECK(rig.send("E 500") == "RPRT -1\n");
}

TEST_CASE("rigctld: radio refusal maps to rejected") {
    Rigctld rig;
    // The fake does not implement the RIT offset command.
    CHECK(rig.send("J 150") == "RPRT -10\n");
}

TEST_CASE("rigctld: silent radio times out, then the session is down") {
    Rigctld rig;
    rig.icom.silent = true;
    CHECK(rig.send("l STRENGTH") == "RPRT -6\n");
    CHECK(rig.send("f") == "RPRT -5\n");
}

TEST_CASE("rigctld: dump_state and dump_caps describe the active model") {
    Rigctld rig;
    const auto state = rig.send("\\dump_state");
    CHECK(state.rfind("0\n2\n1\n30000 60000000 0x1ff -1 -1 0x3 0x3\n", 0) == 0);
    CHECK(state.find("VFOA VFOB\n") != std::string::npos);

    const auto caps = rig.send("\\dump_caps");
    CHECK(caps.find("Model name: IC-7300\n") != std::string::npos);
    CHECK(caps.find("Mfg name: Icom\n") != std::string::npos);
    CHECK(caps.find("  14000000-14350000 Hz (20m)\n") != std::string::npos);
    CHECK(caps.find("  PKTUSB\n") != std::string::npos);
    CHECK(caps.find("Max power: 100 W\n") != std::string::npos);
}

TEST_CASE("rigctld: Kenwood radios refuse split mode") {
    Rigctld rig;
    REQUIRE(rig.orchestrator->select_radio("test", "ts").ok());
    CHECK(rig.send("X USB 2400") == "RPRT -4\n");
    // Never answered during start-up.
    CHECK(rig.send("f") == "RPRT -5\n");
    CHECK_FALSE(rig.orchestrator->select_radio("test", "uhf").ok());
}

TEST_CASE("rigctld: no configured radio") {
    Rigctld rig("service: {id: empty}\n");
    CHECK(rig.send("f") == "RPRT -5\n");
    CHECK(rig.send("\\dump_caps") == "RPRT -5\n");
    CHECK(rig.send("v") == "RPRT -5\n");
    CHECK(rig.send("q") == "RPRT 0\n");
}
