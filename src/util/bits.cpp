#include "paycodec/bits.hpp"

namespace paycodec {

namespace {

uint8_t bit_mask(size_t index) {
    return static_cast<uint8_t>(0x80u >> (index % 8));
}

} // namespace

bool get_bit(const std::vector<uint8_t>& bytes, size_t index) {
    if (index / 8 >= bytes.size()) return false;
    return (bytes[index / 8] & bit_mask(index)) != 0;
}

std::optional<std::vector<uint8_t>> set_bit(const std::vector<uint8_t>& bytes,
                                            size_t index, bool value) {
    if (index / 8 >= bytes.size()) return std::nullopt;

    std::vector<uint8_t> out = bytes;
    if (value) {
        out[index / 8] |= bit_mask(index);
    } else {
        out[index / 8] &= static_cast<uint8_t>(~bit_mask(index));
    }
    return out;
}

std::optional<std::vector<uint8_t>> toggle_bit(const std::vector<uint8_t>& bytes,
                                               size_t index) {
    return set_bit(bytes, index, !get_bit(bytes, index));
}

std::vector<size_t> set_bit_positions(const std::vector<uint8_t>& bytes) {
    std::vector<size_t> positions;
    for (size_t i = 0; i < bytes.size() * 8; ++i) {
        if (get_bit(bytes, i)) positions.push_back(i);
    }
    return positions;
}

} // namespace paycodec
