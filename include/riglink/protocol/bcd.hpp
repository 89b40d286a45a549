#pragma once

#include "riglink/common/types.hpp"

#include <cstddef>
#include <cstdint>

namespace riglink::protocol::bcd {

// Largest value that fits in `width` bytes of packed BCD.
std::uint64_t max_value(std::size_t width);

// Little-endian packed BCD (least significant pair first), as CI-V uses for
// frequencies. Throws CapabilityError when the value does not fit.
common::Bytes encode_le(std::uint64_t value, std::size_t width);
std::uint64_t decode_le(const std::uint8_t* data, std::size_t width);

// Big-endian packed BCD (most significant pair first), as CI-V uses for
// levels and memory channel numbers.
common::Bytes encode_be(std::uint64_t value, std::size_t width);
std::uint64_t decode_be(const std::uint8_t* data, std::size_t width);

}  // namespace riglink::protocol::bcd
