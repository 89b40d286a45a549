#include <doctest/doctest.h>

#include "riglink/common/errors.hpp"
#include "riglink/protocol/cat_codec.hpp"
#include "riglink/protocol/protocol_codec.hpp"
#include "support/mock_transport.hpp"
#include "support/test_caps.hpp"

#include <array>
#include <vector>

using namespace riglink;
using riglink::protocol::ReplyKind;
using riglink::test::bytes_text;
using riglink::test::text_bytes;

namespace {

// IF; answer: 14.074 MHz, RIT on at -150 Hz, USB, receiving, split on.
const std::string kKenwoodStatus = "IF00014074000     -015010000020010000;";

template <typename Codec>
Codec make(const std::string& model, capability::ProtocolFamily family) {
    return Codec{test::shared(test::hf_radio(model, family))};
}

constexpr std::array kAllModes{common::Mode::LSB,   common::Mode::USB,     common::Mode::CW,
                               common::Mode::CWR,   common::Mode::AM,      common::Mode::FM,
                               common::Mode::FMN,   common::Mode::WFM,     common::Mode::RTTY,
                               common::Mode::RTTYR, common::Mode::DataLSB, common::Mode::DataUSB,
                               common::Mode::DataFM};

// Every mode with a code is sent as MD and read back unchanged from the
// radio's echo of the same text; modes without one are refused up front.
// Returns the number of modes the dialect carries.
template <typename Codec>
int check_mode_table(const Codec& codec) {
    int mapped = 0;
    for (const auto mode : kAllModes) {
        const auto name = common::to_string(mode);
        CAPTURE(name);
        if (!Codec::mode_code(mode)) {
            CHECK_THROWS_AS(codec.encode(common::SetMode{mode}), common::CapabilityError);
            continue;
        }
        ++mapped;
        CHECK(Codec::mode_from_code(*Codec::mode_code(mode)) == mode);
        const auto plan = codec.encode(common::SetMode{mode});
        REQUIRE(plan.exchanges.size() == 2);
        CHECK(plan.exchanges[0].reply == ReplyKind::None);
        CHECK(plan.exchanges[1].reply == ReplyKind::Data);
        const std::vector<common::Bytes> answer{plan.exchanges[0].request};
        CHECK(std::get<common::Mode>(codec.decode(common::ReadMode{}, answer)) == mode);
        CHECK(std::get<common::Mode>(codec.decode(common::SetMode{mode}, answer)) == mode);
    }
    return mapped;
}

}  // namespace

TEST_CASE("CAT field: zero padded and width checked") {
    CHECK(protocol::cat::field(14074000, 11) == "00014074000");
    CHECK(protocol::cat::field(5, 3) == "005");
    CHECK_THROWS_AS(protocol::cat::field(1000, 3), common::CapabilityError);
}

TEST_CASE("Kenwood: frequency set is verified by read-back") {
    const auto codec = make<protocol::KenwoodCodec>("TS-590SG", capability::ProtocolFamily::KenwoodCat);
    const auto plan = codec.encode(common::SetFrequency{common::Vfo::A, 14074000});
    REQUIRE(plan.exchanges.size() == 2);
    CHECK(bytes_text(plan.exchanges[0].request) == "FA00014074000;");
    CHECK(plan.exchanges[0].reply == ReplyKind::None);
    CHECK(bytes_text(plan.exchanges[1].request) == "FA;");
    CHECK(plan.exchanges[1].reply == ReplyKind::Data);

    const auto value = codec.decode(common::SetFrequency{common::Vfo::A, 14074000}, {text_bytes("FA00014074000;")});
    CHECK(std::get<std::uint64_t>(value) == 14074000);
}

TEST_CASE("Kenwood: IF status answer carries split, PTT and RIT") {
    const auto codec = make<protocol::KenwoodCodec>("TS-590SG", capability::ProtocolFamily::KenwoodCat);
    const std::vector<common::Bytes> replies{text_bytes(kKenwoodStatus)};

    CHECK(std::get<bool>(codec.decode(common::ReadSplit{}, replies)));
    CHECK_FALSE(std::get<bool>(codec.decode(common::ReadPtt{}, replies)));
    CHECK(std::get<common::RitXitState>(codec.decode(common::ReadRit{}, replies)) == common::RitXitState{true, -150});
    CHECK(std::get<common::RitXitState>(codec.decode(common::ReadXit{}, replies)).enabled == false);

    CHECK_THROWS_AS(codec.decode(common::ReadSplit{}, {text_bytes("IF00014074000;")}), common::FramingError);
}

TEST_CASE("Kenwood: split off returns both sides to VFO A") {
    const auto codec = make<protocol::KenwoodCodec>("TS-590SG", capability::ProtocolFamily::KenwoodCat);
    const auto plan = codec.encode(common::SetSplit{false});
    CHECK(bytes_text(plan.exchanges[0].request) == "FR0;FT0;");
    REQUIRE(plan.selects_vfo.has_value());
    CHECK(*plan.selects_vfo == common::Vfo::A);
}

TEST_CASE("Kenwood: error markers are NAKs") {
    const auto codec = make<protocol::KenwoodCodec>("TS-590SG", capability::ProtocolFamily::KenwoodCat);
    CHECK_THROWS_AS(codec.decode(common::ReadMode{}, {text_bytes("?;")}), common::ProtocolNakError);
    CHECK_THROWS_AS(codec.decode(common::ReadMode{}, {text_bytes("E;")}), common::ProtocolNakError);
    CHECK_THROWS_AS(codec.decode(common::ReadMode{}, {text_bytes("O;")}), common::ProtocolNakError);
    CHECK_THROWS_AS(codec.decode(common::ReadMode{}, {text_bytes("MD2")}), common::FramingError);
    CHECK_THROWS_AS(codec.decode(common::ReadMode{}, {text_bytes("FA00014074000;")}), common::FramingError);
}

TEST_CASE("Kenwood: mode codes") {
    CHECK(protocol::KenwoodCodec::mode_code(common::Mode::USB) == '2');
    CHECK(protocol::KenwoodCodec::mode_from_code('7') == common::Mode::CWR);
    CHECK_FALSE(protocol::KenwoodCodec::mode_code(common::Mode::DataUSB).has_value());
    CHECK_FALSE(protocol::KenwoodCodec::mode_from_code('8').has_value());
}

TEST_CASE("Kenwood: full mode table") {
    const auto codec = make<protocol::KenwoodCodec>("TS-590SG", capability::ProtocolFamily::KenwoodCat);
    CHECK(check_mode_table(codec) == 8);
}

TEST_CASE("Kenwood: GC AGC, NB and NR") {
    const auto codec = make<protocol::KenwoodCodec>("TS-590SG", capability::ProtocolFamily::KenwoodCat);
    const auto plan = codec.encode(common::SetAgc{common::AgcSpeed::Slow});
    REQUIRE(plan.exchanges.size() == 2);
    CHECK(bytes_text(plan.exchanges[0].request) == "GC1;");
    CHECK(bytes_text(plan.exchanges[1].request) == "GC;");
    CHECK(bytes_text(codec.encode(common::SetAgc{common::AgcSpeed::Medium}).exchanges[0].request) == "GC3;");
    CHECK_THROWS_AS(codec.encode(common::SetAgc{common::AgcSpeed::Auto}), common::CapabilityError);
    CHECK(std::get<common::AgcSpeed>(codec.decode(common::ReadAgc{}, {text_bytes("GC2;")})) == common::AgcSpeed::Fast);
    CHECK_THROWS_AS(codec.decode(common::ReadAgc{}, {text_bytes("GC7;")}), common::FramingError);

    CHECK(bytes_text(codec.encode(common::SetNoiseBlanker{true}).exchanges[0].request) == "NB1;");
    CHECK(std::get<bool>(codec.decode(common::ReadNoiseBlanker{}, {text_bytes("NB2;")})));
    CHECK_FALSE(std::get<bool>(codec.decode(common::ReadNoiseReduction{}, {text_bytes("NR0;")})));
    CHECK_THROWS_AS(codec.encode(common::ReadFilter{}), common::CapabilityError);
    CHECK_THROWS_AS(codec.encode(common::ReadMemory{1}), common::CapabilityError);
}

TEST_CASE("Kenwood: memory writes have no CAT command") {
    const auto codec = make<protocol::KenwoodCodec>("TS-590SG", capability::ProtocolFamily::KenwoodCat);
    CHECK_THROWS_AS(codec.encode(common::StoreMemory{5}), common::CapabilityError);
    CHECK(bytes_text(codec.encode(common::SelectMemory{5}).exchanges[0].request) == "MC005;");
}

TEST_CASE("Yaesu: nine digit frequencies and letter mode codes") {
    const auto codec = make<protocol::YaesuCodec>("FT-991A", capability::ProtocolFamily::YaesuCat);
    CHECK(bytes_text(codec.encode(common::SetFrequency{common::Vfo::B, 7074000}).exchanges[0].request) ==
          "FB007074000;");

    const auto plan = codec.encode(common::SetMode{common::Mode::DataUSB});
    CHECK(bytes_text(plan.exchanges[0].request) == "MD0C;");
    CHECK(bytes_text(plan.exchanges[1].request) == "MD0;");
    CHECK(std::get<common::Mode>(codec.decode(common::ReadMode{}, {text_bytes("MD0B;")})) == common::Mode::FMN);
}

TEST_CASE("Yaesu: full mode table") {
    const auto codec = make<protocol::YaesuCodec>("FT-991A", capability::ProtocolFamily::YaesuCat);
    CHECK(check_mode_table(codec) == 12);
}

TEST_CASE("Yaesu: GT0 AGC, NB and NR") {
    const auto codec = make<protocol::YaesuCodec>("FT-991A", capability::ProtocolFamily::YaesuCat);
    CHECK(bytes_text(codec.encode(common::SetAgc{common::AgcSpeed::Auto}).exchanges[0].request) == "GT04;");
    CHECK(bytes_text(codec.encode(common::ReadAgc{}).exchanges[0].request) == "GT0;");
    CHECK(std::get<common::AgcSpeed>(codec.decode(common::ReadAgc{}, {text_bytes("GT03;")})) == common::AgcSpeed::Slow);
    CHECK(std::get<common::AgcSpeed>(codec.decode(common::ReadAgc{}, {text_bytes("GT05;")})) == common::AgcSpeed::Auto);

    CHECK(bytes_text(codec.encode(common::SetNoiseReduction{true}).exchanges[0].request) == "NR01;");
    CHECK(std::get<bool>(codec.decode(common::ReadNoiseBlanker{}, {text_bytes("NB01;")})));
}

TEST_CASE("Yaesu: split, PTT and NAK") {
    const auto codec = make<protocol::YaesuCodec>("FT-991A", capability::ProtocolFamily::YaesuCat);
    CHECK(std::get<bool>(codec.decode(common::ReadSplit{}, {text_bytes("ST1;")})));
    CHECK(std::get<bool>(codec.decode(common::ReadPtt{}, {text_bytes("TX2;")})));
    CHECK_FALSE(std::get<bool>(codec.decode(common::ReadPtt{}, {text_bytes("TX0;")})));
    CHECK_THROWS_AS(codec.decode(common::ReadPower{}, {text_bytes("?;")}), common::ProtocolNakError);
}

TEST_CASE("Yaesu: power read takes the first three digits") {
    const auto codec = make<protocol::YaesuCodec>("FT-991A", capability::ProtocolFamily::YaesuCat);
    CHECK(std::get<int>(codec.decode(common::ReadPower{}, {text_bytes("PC050;")})) == 50);
    CHECK_THROWS_AS(codec.decode(common::ReadPower{}, {text_bytes("PC5x0;")}), common::FramingError);
}

TEST_CASE("Elecraft: absolute RIT offsets and data modes") {
    const auto codec = make<protocol::ElecraftCodec>("K3", capability::ProtocolFamily::ElecraftCat);
    const auto plan = codec.encode(common::SetRit{{true, 250}});
    CHECK(bytes_text(plan.exchanges[0].request) == "RO+0250;RT1;");
    CHECK(bytes_text(plan.exchanges[1].request) == "IF;");

    CHECK(protocol::ElecraftCodec::mode_code(common::Mode::DataUSB) == '6');
    CHECK(std::get<common::Mode>(codec.decode(common::ReadMode{}, {text_bytes("MD9;")})) == common::Mode::DataLSB);
}

TEST_CASE("Elecraft: full mode table") {
    const auto codec = make<protocol::ElecraftCodec>("K3", capability::ProtocolFamily::ElecraftCat);
    CHECK(check_mode_table(codec) == 8);
}

TEST_CASE("Elecraft: AGC has only fast and slow") {
    const auto codec = make<protocol::ElecraftCodec>("K3", capability::ProtocolFamily::ElecraftCat);
    CHECK(bytes_text(codec.encode(common::SetAgc{common::AgcSpeed::Fast}).exchanges[0].request) == "GT002;");
    CHECK(bytes_text(codec.encode(common::SetAgc{common::AgcSpeed::Slow}).exchanges[0].request) == "GT004;");
    CHECK_THROWS_AS(codec.encode(common::SetAgc{common::AgcSpeed::Off}), common::CapabilityError);
    CHECK(std::get<common::AgcSpeed>(codec.decode(common::ReadAgc{}, {text_bytes("GT004;")})) == common::AgcSpeed::Slow);
    CHECK_THROWS_AS(codec.decode(common::ReadAgc{}, {text_bytes("GT001;")}), common::FramingError);
}

TEST_CASE("Elecraft: meter above S9") {
    const auto codec = make<protocol::ElecraftCodec>("K3", capability::ProtocolFamily::ElecraftCat);
    const auto signal = std::get<common::SignalStrength>(codec.decode(common::ReadSignalStrength{}, {text_bytes("SM0017;")}));
    CHECK(signal.s_units == 9);
    CHECK(signal.over_s9_db == 20);
}

TEST_CASE("CAT: stray line noise ahead of an answer is ignored") {
    const auto codec = make<protocol::KenwoodCodec>("TS-590SG", capability::ProtocolFamily::KenwoodCat);
    CHECK(std::get<common::Mode>(codec.decode(common::ReadMode{}, {text_bytes("\r\nMD3;")})) == common::Mode::CW);
}

TEST_CASE("Protocol codec: family selects the dialect") {
    const auto kenwood = protocol::ProtocolCodec::for_model(
        test::shared(test::hf_radio("TS-590SG", capability::ProtocolFamily::KenwoodCat)));
    CHECK(kenwood.family() == capability::ProtocolFamily::KenwoodCat);
    CHECK(kenwood.terminator() == ';');
    REQUIRE(kenwood.handshake().exchanges.size() == 1);
    CHECK(bytes_text(kenwood.handshake().exchanges[0].request) == "AI0;");

    const auto civ = protocol::ProtocolCodec::for_model(
        test::shared(test::hf_radio("IC-7300", capability::ProtocolFamily::Civ)));
    CHECK(civ.terminator() == 0xFD);
    CHECK(civ.handshake().exchanges.empty());

    CHECK_THROWS_AS(protocol::ProtocolCodec::for_model(nullptr), common::CapabilityError);
}
