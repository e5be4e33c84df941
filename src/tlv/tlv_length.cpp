#include "paycodec/hex.hpp"
#include "paycodec/tlv.hpp"

#include <string>

namespace paycodec {

namespace detail {

LengthDecodeResult decode_length_bounded(const std::vector<uint8_t>& data, size_t offset, size_t end) {
    LengthDecodeResult result;

    if (offset >= end) {
        result.error_code = ErrorCode::TRUNCATED;
        result.error = "Unexpected end of data during length parsing";
        return result;
    }

    uint8_t first = data[offset];
    if ((first & 0x80) == 0) {
        result.ok = true;
        result.length = first;
        result.length_bytes = 1;
        return result;
    }

    size_t count = first & 0x7F;
    if (count == 0) {
        result.error_code = ErrorCode::UNSUPPORTED_OPERATION;
        result.error = "Indefinite length encoding not supported";
        return result;
    }
    if (count > TLV_MAX_LENGTH_BYTES) {
        result.error_code = ErrorCode::LIMIT_EXCEEDED;
        result.error = "Length field too long: " + std::to_string(count) + " bytes";
        return result;
    }
    if (offset + 1 + count > end) {
        result.error_code = ErrorCode::TRUNCATED;
        result.error = "Unexpected end of data during length parsing";
        return result;
    }

    size_t length = 0;
    for (size_t i = 0; i < count; ++i) {
        length = (length << 8) | data[offset + 1 + i];
    }

    result.ok = true;
    result.length = length;
    result.length_bytes = 1 + count;
    return result;
}

} // namespace detail

LengthDecodeResult decode_length(const std::vector<uint8_t>& data, size_t offset) {
    return detail::decode_length_bounded(data, offset, data.size());
}

Result<std::string> encode_length(int64_t length) {
    if (length < 0) {
        return Result<std::string>::err(
            Error(ErrorCode::MALFORMED_INPUT, "Length cannot be negative: " + std::to_string(length)));
    }

    if (length < 0x80) {
        uint8_t b = static_cast<uint8_t>(length);
        return Result<std::string>::ok(bytes_to_hex(&b, 1));
    }

    std::vector<uint8_t> digits;
    for (uint64_t n = static_cast<uint64_t>(length); n > 0; n >>= 8) {
        digits.insert(digits.begin(), static_cast<uint8_t>(n & 0xFF));
    }

    std::vector<uint8_t> out;
    out.push_back(static_cast<uint8_t>(0x80 | digits.size()));
    out.insert(out.end(), digits.begin(), digits.end());
    return Result<std::string>::ok(bytes_to_hex(out));
}

} // namespace paycodec
