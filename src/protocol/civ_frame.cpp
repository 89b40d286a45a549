#include "riglink/protocol/civ_frame.hpp"

#include "riglink/common/errors.hpp"

#include <string>

namespace riglink::protocol::civ {

bool has_subcommand(std::uint8_t command) noexcept {
    switch (command) {
        case cmd::kLevel:
        case cmd::kMeter:
        case cmd::kFunction:
        case cmd::kExtended:
        case cmd::kTransmit:
        case cmd::kOffset:
            return true;
        default:
            return false;
    }
}

common::Bytes Frame::encode() const {
    common::Bytes out;
    out.reserve(6 + data.size() + (subcommand ? 1 : 0));
    out.push_back(kPreamble);
    out.push_back(kPreamble);
    out.push_back(to);
    out.push_back(from);
    out.push_back(command);
    if (subcommand) {
        out.push_back(*subcommand);
    }
    out.insert(out.end(), data.begin(), data.end());
    out.push_back(kTerminator);
    return out;
}

Frame Frame::parse(const common::Bytes& raw) {
    std::size_t start = 0;
    while (start + 1 < raw.size() && !(raw[start] == kPreamble && raw[start + 1] == kPreamble)) {
        ++start;
    }
    // Some radios pad with extra preamble bytes.
    while (start + 2 < raw.size() && raw[start + 2] == kPreamble) {
        ++start;
    }

    if (start + 1 >= raw.size()) {
        throw common::FramingError("CI-V frame without preamble");
    }
    if (raw.back() != kTerminator) {
        throw common::FramingError("CI-V frame without terminator");
    }

    const std::size_t end = raw.size() - 1;
    const std::size_t body = start + 2;
    if (end < body + 3) {
        throw common::FramingError("CI-V frame too short (" + std::to_string(raw.size()) + " bytes)");
    }

    Frame frame;
    frame.to = raw[body];
    frame.from = raw[body + 1];
    frame.command = raw[body + 2];

    std::size_t payload = body + 3;
    if (has_subcommand(frame.command) && payload < end) {
        frame.subcommand = raw[payload];
        ++payload;
    }
    frame.data.assign(raw.begin() + static_cast<std::ptrdiff_t>(payload),
                      raw.begin() + static_cast<std::ptrdiff_t>(end));

    for (auto byte : frame.data) {
        if (byte == kPreamble || byte == kTerminator) {
            throw common::FramingError("CI-V frame with embedded marker byte");
        }
    }
    return frame;
}

}  // namespace riglink::protocol::civ
