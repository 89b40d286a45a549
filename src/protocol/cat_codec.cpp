#include "riglink/protocol/cat_codec.hpp"

#include "riglink/common/errors.hpp"

#include <algorithm>
#include <cctype>

namespace riglink::protocol {

namespace cat {

std::string field(std::uint64_t value, int width) {
    auto digits = std::to_string(value);
    if (static_cast<int>(digits.size()) > width) {
        throw common::CapabilityError("Value " + digits + " exceeds " + std::to_string(width) + " digit field");
    }
    return std::string(static_cast<std::size_t>(width) - digits.size(), '0') + digits;
}

common::Bytes to_bytes(std::string_view text) {
    return common::Bytes(text.begin(), text.end());
}

std::string to_text(const common::Bytes& bytes) {
    return std::string(bytes.begin(), bytes.end());
}

}  // namespace cat

CatCodecBase::CatCodecBase(capability::CapabilitiesPtr caps, std::vector<std::string> error_markers)
    : caps_(std::move(caps)), error_markers_(std::move(error_markers)) {}

Exchange CatCodecBase::send(const std::string& text) {
    return {cat::to_bytes(text), ReplyKind::None};
}

Exchange CatCodecBase::query(const std::string& text) {
    return {cat::to_bytes(text), ReplyKind::Data};
}

Plan CatCodecBase::handshake() const {
    Plan plan;
    // Auto-information would interleave unsolicited status with our answers.
    plan.exchanges.push_back(send("AI0;"));
    return plan;
}

void CatCodecBase::expect_ack(const common::Bytes& reply) const {
    payload(reply, "");
}

std::string CatCodecBase::payload(const common::Bytes& reply, std::string_view verb) const {
    auto text = cat::to_text(reply);
    // Line noise and stray CR/LF ahead of the answer.
    const auto first = std::find_if(text.begin(), text.end(), [](unsigned char c) { return std::isgraph(c) != 0; });
    text.erase(text.begin(), first);

    if (text.empty() || text.back() != cat::kTerminator) {
        throw common::FramingError("CAT answer without terminator: '" + text + "'");
    }
    text.pop_back();

    for (const auto& marker : error_markers_) {
        if (text == marker) {
            throw common::ProtocolNakError(caps_->model + " rejected command ('" + marker + ";')");
        }
    }
    if (text.compare(0, verb.size(), verb) != 0) {
        throw common::FramingError("Unexpected CAT answer '" + text + ";' to " + std::string{verb});
    }
    return text.substr(verb.size());
}

std::string CatCodecBase::payload_at(const std::vector<common::Bytes>& replies, std::size_t index,
                                     std::string_view verb) const {
    if (index >= replies.size()) {
        throw common::FramingError("Missing CAT answer to " + std::string{verb});
    }
    return payload(replies[index], verb);
}

std::uint64_t CatCodecBase::number(std::string_view digits, std::string_view what) {
    if (digits.empty() || !std::all_of(digits.begin(), digits.end(), [](unsigned char c) { return std::isdigit(c); })) {
        throw common::FramingError("Malformed " + std::string{what} + " field '" + std::string{digits} + "'");
    }
    std::uint64_t value = 0;
    for (char c : digits) {
        value = value * 10 + static_cast<std::uint64_t>(c - '0');
    }
    return value;
}

int CatCodecBase::signed_number(std::string_view text, std::string_view what) {
    if (text.empty() || (text[0] != '+' && text[0] != '-')) {
        throw common::FramingError("Malformed signed " + std::string{what} + " field '" + std::string{text} + "'");
    }
    const auto magnitude = static_cast<int>(number(text.substr(1), what));
    return text[0] == '-' ? -magnitude : magnitude;
}

char CatCodecBase::flag_at(const std::string& text, std::size_t index, std::string_view what) {
    if (index >= text.size()) {
        throw common::FramingError("Status answer too short for " + std::string{what});
    }
    return text[index];
}

void CatCodecBase::unsupported(const common::Command& command) const {
    throw common::CapabilityError(caps_->model + ": " + common::describe(command) + " has no " +
                                  capability::to_string(caps_->family) + " command");
}

}  // namespace riglink::protocol
