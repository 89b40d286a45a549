#include "riglink/protocol/bcd.hpp"

#include "riglink/common/errors.hpp"

#include <algorithm>
#include <string>

namespace riglink::protocol::bcd {

namespace {

std::uint8_t digit_pair(std::uint8_t byte) {
    const int high = byte >> 4;
    const int low = byte & 0x0F;
    if (high > 9 || low > 9) {
        throw common::FramingError("Invalid BCD byte " + std::to_string(byte));
    }
    return static_cast<std::uint8_t>(high * 10 + low);
}

}  // namespace

std::uint64_t max_value(std::size_t width) {
    std::uint64_t max = 0;
    for (std::size_t i = 0; i < width * 2; ++i) {
        max = max * 10 + 9;
    }
    return max;
}

common::Bytes encode_le(std::uint64_t value, std::size_t width) {
    if (value > max_value(width)) {
        throw common::CapabilityError("Value " + std::to_string(value) + " does not fit in " +
                                      std::to_string(width) + " BCD bytes");
    }
    common::Bytes out(width, 0);
    for (std::size_t i = 0; i < width; ++i) {
        const auto low = static_cast<std::uint8_t>(value % 10);
        value /= 10;
        const auto high = static_cast<std::uint8_t>(value % 10);
        value /= 10;
        out[i] = static_cast<std::uint8_t>((high << 4) | low);
    }
    return out;
}

std::uint64_t decode_le(const std::uint8_t* data, std::size_t width) {
    std::uint64_t value = 0;
    for (std::size_t i = width; i > 0; --i) {
        value = value * 100 + digit_pair(data[i - 1]);
    }
    return value;
}

common::Bytes encode_be(std::uint64_t value, std::size_t width) {
    auto out = encode_le(value, width);
    std::reverse(out.begin(), out.end());
    return out;
}

std::uint64_t decode_be(const std::uint8_t* data, std::size_t width) {
    std::uint64_t value = 0;
    for (std::size_t i = 0; i < width; ++i) {
        value = value * 100 + digit_pair(data[i]);
    }
    return value;
}

}  // namespace riglink::protocol::bcd
