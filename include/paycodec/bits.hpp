#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace paycodec {

// ============================================================================
// Bit Helpers
// ============================================================================
//
// Bit index 0 is the most significant bit of byte 0. ISO 8583 bitmap bit N
// is index N - 1. None of these functions mutate their input.

bool get_bit(const std::vector<uint8_t>& bytes, size_t index);

// Returns a copy with the bit set to value, nullopt if index is out of range
std::optional<std::vector<uint8_t>> set_bit(const std::vector<uint8_t>& bytes,
                                            size_t index, bool value);

std::optional<std::vector<uint8_t>> toggle_bit(const std::vector<uint8_t>& bytes,
                                               size_t index);

// Ascending indices of all set bits
std::vector<size_t> set_bit_positions(const std::vector<uint8_t>& bytes);

} // namespace paycodec
