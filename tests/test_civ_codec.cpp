#include <doctest/doctest.h>

#include "riglink/common/errors.hpp"
#include "riglink/protocol/civ_codec.hpp"
#include "support/test_caps.hpp"

using namespace riglink;
using riglink::common::Bytes;
using riglink::protocol::ReplyKind;

namespace {

protocol::CivCodec ic7300() {
    auto caps = test::hf_radio("IC-7300", capability::ProtocolFamily::Civ);
    caps.civ.radio_address = 0x94;
    return protocol::CivCodec{test::shared(std::move(caps))};
}

}  // namespace

TEST_CASE("CI-V codec: set frequency selects the VFO first") {
    const auto plan = ic7300().encode(common::SetFrequency{common::Vfo::B, 14074000});
    REQUIRE(plan.exchanges.size() == 2);
    CHECK(plan.exchanges[0].request == Bytes{0xFE, 0xFE, 0x94, 0xE0, 0x07, 0x01, 0xFD});
    CHECK(plan.exchanges[0].reply == ReplyKind::Ack);
    CHECK(plan.exchanges[1].request == Bytes{0xFE, 0xFE, 0x94, 0xE0, 0x05, 0x00, 0x40, 0x07, 0x14, 0x00, 0xFD});
    CHECK(plan.exchanges[1].reply == ReplyKind::Ack);
    REQUIRE(plan.selects_vfo.has_value());
    CHECK(*plan.selects_vfo == common::Vfo::B);
}

TEST_CASE("CI-V codec: frequency reply is decoded from BCD") {
    const auto codec = ic7300();
    const Bytes reply{0xFE, 0xFE, 0xE0, 0x94, 0x03, 0x00, 0x50, 0x20, 0x14, 0x00, 0xFD};
    const auto value = codec.decode(common::ReadFrequency{}, {reply});
    REQUIRE(std::holds_alternative<std::uint64_t>(value));
    CHECK(std::get<std::uint64_t>(value) == 14205000);
}

TEST_CASE("CI-V codec: mode carries the filter byte") {
    const auto codec = ic7300();
    const auto plan = codec.encode(common::SetMode{common::Mode::FMN});
    REQUIRE(plan.exchanges.size() == 1);
    CHECK(plan.exchanges[0].request == Bytes{0xFE, 0xFE, 0x94, 0xE0, 0x06, 0x05, 0x02, 0xFD});

    const auto narrow = codec.decode(common::ReadMode{}, {{0xFE, 0xFE, 0xE0, 0x94, 0x04, 0x05, 0x02, 0xFD}});
    CHECK(std::get<common::Mode>(narrow) == common::Mode::FMN);
    const auto cwr = codec.decode(common::ReadMode{}, {{0xFE, 0xFE, 0xE0, 0x94, 0x04, 0x07, 0x01, 0xFD}});
    CHECK(std::get<common::Mode>(cwr) == common::Mode::CWR);
}

TEST_CASE("CI-V codec: radios without filter bytes cannot select FM-N") {
    auto caps = test::hf_radio("G90", capability::ProtocolFamily::Civ);
    caps.civ.radio_address = 0xA4;
    caps.civ.mode_filter = false;
    caps.civ.vfo_model = capability::VfoModel::CurrentOnly;
    const protocol::CivCodec codec{test::shared(std::move(caps))};

    CHECK(codec.encode(common::SetMode{common::Mode::USB}).exchanges[0].request ==
          Bytes{0xFE, 0xFE, 0xA4, 0xE0, 0x06, 0x01, 0xFD});
    CHECK_THROWS_AS(codec.encode(common::SetMode{common::Mode::FMN}), common::CapabilityError);
}

TEST_CASE("CI-V codec: current-only radios still get the VFO select") {
    auto caps = test::hf_radio("G90", capability::ProtocolFamily::Civ);
    caps.civ.radio_address = 0xA4;
    caps.civ.mode_filter = false;
    caps.civ.vfo_model = capability::VfoModel::CurrentOnly;
    const protocol::CivCodec codec{test::shared(std::move(caps))};

    const auto b = codec.encode(common::ReadFrequency{common::Vfo::B});
    REQUIRE(b.exchanges.size() == 2);
    CHECK(b.exchanges[0].request == Bytes{0xFE, 0xFE, 0xA4, 0xE0, 0x07, 0x01, 0xFD});
    CHECK(b.exchanges[0].reply == ReplyKind::Ack);
    CHECK(b.exchanges[1].request == Bytes{0xFE, 0xFE, 0xA4, 0xE0, 0x03, 0xFD});
    REQUIRE(b.selects_vfo.has_value());
    CHECK(*b.selects_vfo == common::Vfo::B);

    const auto a = codec.encode(common::SetFrequency{common::Vfo::A, 7074000});
    REQUIRE(a.exchanges.size() == 2);
    CHECK(a.exchanges[0].request == Bytes{0xFE, 0xFE, 0xA4, 0xE0, 0x07, 0x00, 0xFD});
    CHECK(*a.selects_vfo == common::Vfo::A);

    CHECK_THROWS_AS(codec.encode(common::ReadFrequency{common::Vfo::Main}), common::CapabilityError);
    CHECK_THROWS_AS(codec.encode(common::ReadFilter{}), common::CapabilityError);
}

TEST_CASE("CI-V codec: main/sub radios map VFO A to main") {
    auto caps = test::hf_radio("IC-7610", capability::ProtocolFamily::Civ);
    caps.civ.radio_address = 0x98;
    caps.civ.vfo_model = capability::VfoModel::MainSub;
    const protocol::CivCodec codec{test::shared(std::move(caps))};

    const auto plan = codec.encode(common::SelectVfo{common::Vfo::A});
    CHECK(plan.exchanges[0].request == Bytes{0xFE, 0xFE, 0x98, 0xE0, 0x07, 0xD0, 0xFD});
    CHECK(codec.encode(common::SelectVfo{common::Vfo::Sub}).exchanges[0].request ==
          Bytes{0xFE, 0xFE, 0x98, 0xE0, 0x07, 0xD1, 0xFD});
}

TEST_CASE("CI-V codec: RF power is scaled to 0-255") {
    const auto codec = ic7300();
    const auto plan = codec.encode(common::SetPower{50});
    CHECK(plan.exchanges[0].request == Bytes{0xFE, 0xFE, 0x94, 0xE0, 0x14, 0x0A, 0x01, 0x28, 0xFD});

    const auto watts = codec.decode(common::ReadPower{}, {{0xFE, 0xFE, 0xE0, 0x94, 0x14, 0x0A, 0x02, 0x55, 0xFD}});
    CHECK(std::get<int>(watts) == 100);
}

TEST_CASE("CI-V codec: S-meter scale") {
    const auto codec = ic7300();
    const auto s9 = codec.decode(common::ReadSignalStrength{}, {{0xFE, 0xFE, 0xE0, 0x94, 0x15, 0x02, 0x01, 0x20, 0xFD}});
    CHECK(std::get<common::SignalStrength>(s9).s_units == 9);
    CHECK(std::get<common::SignalStrength>(s9).over_s9_db == 0);

    const auto strong = codec.decode(common::ReadSignalStrength{}, {{0xFE, 0xFE, 0xE0, 0x94, 0x15, 0x02, 0x02, 0x41, 0xFD}});
    CHECK(std::get<common::SignalStrength>(strong).description() == "S9+60");
}

TEST_CASE("CI-V codec: RIT offset and switch") {
    const auto codec = ic7300();
    const auto plan = codec.encode(common::SetRit{{true, -150}});
    REQUIRE(plan.exchanges.size() == 2);
    CHECK(plan.exchanges[0].request == Bytes{0xFE, 0xFE, 0x94, 0xE0, 0x21, 0x00, 0x50, 0x01, 0x01, 0xFD});
    CHECK(plan.exchanges[1].request == Bytes{0xFE, 0xFE, 0x94, 0xE0, 0x21, 0x01, 0x01, 0xFD});

    const auto state = codec.decode(common::ReadRit{}, {{0xFE, 0xFE, 0xE0, 0x94, 0x21, 0x00, 0x50, 0x01, 0x01, 0xFD},
                                                         {0xFE, 0xFE, 0xE0, 0x94, 0x21, 0x01, 0x01, 0xFD}});
    CHECK(std::get<common::RitXitState>(state) == common::RitXitState{true, -150});
}

TEST_CASE("CI-V codec: NAK and mismatched replies") {
    const auto codec = ic7300();
    CHECK_NOTHROW(codec.expect_ack({0xFE, 0xFE, 0xE0, 0x94, 0xFB, 0xFD}));
    CHECK_THROWS_AS(codec.expect_ack({0xFE, 0xFE, 0xE0, 0x94, 0xFA, 0xFD}), common::ProtocolNakError);
    CHECK_THROWS_AS(codec.decode(common::ReadFrequency{}, {{0xFE, 0xFE, 0xE0, 0x94, 0x04, 0x01, 0x01, 0xFD}}),
                    common::FramingError);
    CHECK_THROWS_AS(codec.decode(common::ReadMode{}, {{0xFE, 0xFE, 0xE0, 0x94, 0xFA, 0xFD}}),
                    common::ProtocolNakError);
}

TEST_CASE("CI-V codec: echoes and transceive broadcasts are unsolicited") {
    const auto codec = ic7300();
    CHECK(codec.is_unsolicited({0xFE, 0xFE, 0x94, 0xE0, 0x03, 0xFD}));
    CHECK(codec.is_unsolicited({0xFE, 0xFE, 0x00, 0x94, 0x00, 0x00, 0x40, 0x07, 0x14, 0x00, 0xFD}));
    CHECK_FALSE(codec.is_unsolicited({0xFE, 0xFE, 0xE0, 0x94, 0xFB, 0xFD}));
}

TEST_CASE("CI-V codec: memory store selects the channel first") {
    const auto plan = ic7300().encode(common::StoreMemory{12});
    REQUIRE(plan.exchanges.size() == 2);
    CHECK(plan.exchanges[0].request == Bytes{0xFE, 0xFE, 0x94, 0xE0, 0x08, 0x00, 0x12, 0xFD});
    CHECK(plan.exchanges[1].request == Bytes{0xFE, 0xFE, 0x94, 0xE0, 0x09, 0xFD});
}

TEST_CASE("CI-V codec: AGC speeds and the noise switches") {
    const auto codec = ic7300();
    CHECK(codec.encode(common::SetAgc{common::AgcSpeed::Slow}).exchanges[0].request ==
          Bytes{0xFE, 0xFE, 0x94, 0xE0, 0x16, 0x12, 0x03, 0xFD});
    CHECK_THROWS_AS(codec.encode(common::SetAgc{common::AgcSpeed::Auto}), common::CapabilityError);

    const auto medium = codec.decode(common::ReadAgc{}, {{0xFE, 0xFE, 0xE0, 0x94, 0x16, 0x12, 0x02, 0xFD}});
    CHECK(std::get<common::AgcSpeed>(medium) == common::AgcSpeed::Medium);
    CHECK_THROWS_AS(codec.decode(common::ReadAgc{}, {{0xFE, 0xFE, 0xE0, 0x94, 0x16, 0x12, 0x07, 0xFD}}),
                    common::FramingError);

    CHECK(codec.encode(common::SetNoiseBlanker{true}).exchanges[0].request ==
          Bytes{0xFE, 0xFE, 0x94, 0xE0, 0x16, 0x22, 0x01, 0xFD});
    CHECK(codec.encode(common::SetNoiseReduction{false}).exchanges[0].request ==
          Bytes{0xFE, 0xFE, 0x94, 0xE0, 0x16, 0x40, 0x00, 0xFD});
    const auto nr = codec.decode(common::ReadNoiseReduction{}, {{0xFE, 0xFE, 0xE0, 0x94, 0x16, 0x40, 0x01, 0xFD}});
    CHECK(std::get<bool>(nr));
}

TEST_CASE("CI-V codec: IF filter rides on the mode command") {
    const auto codec = ic7300();
    const auto plan = codec.encode(common::SetFilter{common::IfFilter::Narrow, common::Mode::CW});
    REQUIRE(plan.exchanges.size() == 1);
    CHECK(plan.exchanges[0].request == Bytes{0xFE, 0xFE, 0x94, 0xE0, 0x06, 0x03, 0x03, 0xFD});

    const auto filter = codec.decode(common::ReadFilter{}, {{0xFE, 0xFE, 0xE0, 0x94, 0x04, 0x03, 0x02, 0xFD}});
    CHECK(std::get<common::IfFilter>(filter) == common::IfFilter::Medium);
    CHECK_THROWS_AS(codec.decode(common::ReadFilter{}, {{0xFE, 0xFE, 0xE0, 0x94, 0x04, 0x03, 0xFD}}),
                    common::FramingError);
}

TEST_CASE("CI-V codec: memory contents") {
    const auto codec = ic7300();
    const common::MemoryContents ft8{12, 14074000, common::Mode::USB, "FT8", false};
    const auto write = codec.encode(common::WriteMemory{ft8});
    REQUIRE(write.exchanges.size() == 1);
    CHECK(write.exchanges[0].reply == ReplyKind::Ack);
    const Bytes expected{0xFE, 0xFE, 0x94, 0xE0, 0x1A, 0x00, 0x00, 0x12, 0x00,
                         0x00, 0x40, 0x07, 0x14, 0x00, 0x01, 0x01,
                         'F', 'T', '8', ' ', ' ', ' ', ' ', ' ', ' ', ' ', 0xFD};
    CHECK(write.exchanges[0].request == expected);

    CHECK(codec.encode(common::WriteMemory{{12, 0, common::Mode::USB, "", true}}).exchanges[0].request ==
          Bytes{0xFE, 0xFE, 0x94, 0xE0, 0x1A, 0x00, 0x00, 0x12, 0xFF, 0xFD});
    CHECK(codec.encode(common::ReadMemory{12}).exchanges[0].request ==
          Bytes{0xFE, 0xFE, 0x94, 0xE0, 0x1A, 0x00, 0x00, 0x12, 0xFD});

    Bytes answer = expected;
    std::swap(answer[2], answer[3]);
    const auto read = codec.decode(common::ReadMemory{12}, {answer});
    CHECK(std::get<common::MemoryContents>(read) == ft8);

    const auto blank = codec.decode(common::ReadMemory{12}, {{0xFE, 0xFE, 0xE0, 0x94, 0x1A, 0x00, 0x00, 0x12, 0xFF, 0xFD}});
    CHECK(std::get<common::MemoryContents>(blank).blank);
    CHECK_THROWS_AS(codec.decode(common::ReadMemory{13}, {answer}), common::FramingError);
}
