#pragma once

#include "riglink/capability/capabilities.hpp"
#include "riglink/common/commands.hpp"
#include "riglink/protocol/plan.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace riglink::protocol {

namespace cat {

inline constexpr char kTerminator = ';';

// Zero-padded decimal field. Throws CapabilityError when `value` needs more
// than `width` digits.
std::string field(std::uint64_t value, int width);

common::Bytes to_bytes(std::string_view text);
std::string to_text(const common::Bytes& bytes);

// Field offsets in the Kenwood/Elecraft IF; answer, counted after the verb.
namespace if_answer {
inline constexpr std::size_t kLength = 35;
inline constexpr std::size_t kFrequency = 0;
inline constexpr std::size_t kOffset = 16;
inline constexpr std::size_t kRit = 21;
inline constexpr std::size_t kXit = 22;
inline constexpr std::size_t kTransmit = 26;
inline constexpr std::size_t kMode = 27;
inline constexpr std::size_t kSplit = 30;
}  // namespace if_answer

}  // namespace cat

// Shared machinery for the ASCII dialects: every verb is terminated by ';',
// sets are followed by a read-back whose answer confirms the value, and an
// error marker answer means the radio refused the command.
class CatCodecBase {
public:
    std::uint8_t terminator() const noexcept { return static_cast<std::uint8_t>(cat::kTerminator); }
    bool is_unsolicited(const common::Bytes&) const noexcept { return false; }
    void expect_ack(const common::Bytes& reply) const;
    Plan handshake() const;

protected:
    CatCodecBase(capability::CapabilitiesPtr caps, std::vector<std::string> error_markers);

    static Exchange send(const std::string& text);
    static Exchange query(const std::string& text);

    // Checks for error markers and the expected verb, returns the text after
    // the verb without the terminator.
    std::string payload(const common::Bytes& reply, std::string_view verb) const;
    std::string payload_at(const std::vector<common::Bytes>& replies, std::size_t index, std::string_view verb) const;

    static std::uint64_t number(std::string_view digits, std::string_view what);
    static int signed_number(std::string_view text, std::string_view what);
    static char flag_at(const std::string& text, std::size_t index, std::string_view what);

    [[noreturn]] void unsupported(const common::Command& command) const;

    capability::CapabilitiesPtr caps_;

private:
    std::vector<std::string> error_markers_;
};

// Kenwood TS-series grammar: FA/FB with 11 digits, IF; status answers.
class KenwoodCodec : public CatCodecBase {
public:
    explicit KenwoodCodec(capability::CapabilitiesPtr caps);

    Plan encode(const common::Command& command) const;
    common::Reply decode(const common::Command& command, const std::vector<common::Bytes>& replies) const;

    static std::optional<char> mode_code(common::Mode mode);
    static std::optional<common::Mode> mode_from_code(char code);
};

// Elecraft K-series grammar: Kenwood-compatible core with its own mode table,
// absolute RIT offsets (RO) and SM; meter reads.
class ElecraftCodec : public CatCodecBase {
public:
    explicit ElecraftCodec(capability::CapabilitiesPtr caps);

    Plan encode(const common::Command& command) const;
    common::Reply decode(const common::Command& command, const std::vector<common::Bytes>& replies) const;

    static std::optional<char> mode_code(common::Mode mode);
    static std::optional<common::Mode> mode_from_code(char code);
};

// Yaesu FT/FTDX grammar: 9 digit frequency fields, MD0 mode codes with letter
// values, VS/ST/TX verbs and a Yaesu IF; layout.
class YaesuCodec : public CatCodecBase {
public:
    explicit YaesuCodec(capability::CapabilitiesPtr caps);

    Plan encode(const common::Command& command) const;
    common::Reply decode(const common::Command& command, const std::vector<common::Bytes>& replies) const;

    static std::optional<char> mode_code(common::Mode mode);
    static std::optional<common::Mode> mode_from_code(char code);
};

}  // namespace riglink::protocol
