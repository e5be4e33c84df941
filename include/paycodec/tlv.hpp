#pragma once

#include "paycodec/tag_registry.hpp"
#include "paycodec/types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace paycodec {

// ============================================================================
// BER-TLV Limits
// ============================================================================

constexpr size_t TLV_MAX_TAG_BYTES = 10;
constexpr size_t TLV_MAX_LENGTH_BYTES = 4;
constexpr size_t TLV_DEFAULT_MAX_DEPTH = 32;

// ============================================================================
// BER-TLV Data Model
// ============================================================================

struct TlvElement {
    std::string tag;      // uppercase hex of the full tag bytes
    size_t length = 0;    // value length in bytes
    std::string value;    // uppercase hex, 2 * length chars
    std::string raw_hex;  // tag + length + value exactly as encoded
    std::vector<TlvElement> children;
    std::optional<TagInfo> tag_info;
    size_t offset = 0;    // byte offset of the tag, relative to its container
    bool is_unknown = false;
    bool constructed = false;  // value was decoded as nested TLV
};

struct TlvParsingError {
    ErrorCode code = ErrorCode::MALFORMED_INPUT;
    std::string message;
    std::optional<size_t> offset;  // byte offset in the outermost input
    std::optional<std::string> tag_id;
};

struct TlvParsingResult {
    std::vector<TlvElement> elements;
    std::vector<TlvParsingError> errors;
    std::string raw_hex;  // normalized input

    bool ok() const { return errors.empty(); }
};

struct TlvParseOptions {
    bool ignore_unknown_tags = false;
    bool validate_length = true;  // accepted, currently has no effect
    bool stop_on_error = false;
    bool parse_constructed = true;
    size_t max_depth = TLV_DEFAULT_MAX_DEPTH;
};

// ============================================================================
// Decoder
// ============================================================================

/**
 * @brief Decode a hex string of concatenated BER-TLV objects.
 *
 * Never throws. Errors are collected; after each error the scan resumes one
 * byte further on unless options.stop_on_error is set. Constructed elements
 * known to the registry are decoded recursively and their errors are
 * reported in the returned result at outer offsets.
 */
TlvParsingResult parse_tlv(const std::string& hex,
                           const TagRegistry& registry,
                           const TlvParseOptions& options = {});

// ============================================================================
// Length Codec
// ============================================================================

// Short form below 0x80, otherwise 0x80|k followed by k big-endian bytes
Result<std::string> encode_length(int64_t length);

struct LengthDecodeResult {
    bool ok = false;
    ErrorCode error_code = ErrorCode::MALFORMED_INPUT;
    std::string error;
    size_t length = 0;
    size_t length_bytes = 0;  // bytes consumed including the first
};

LengthDecodeResult decode_length(const std::vector<uint8_t>& data, size_t offset);

namespace detail {
// Length bytes must lie before end
LengthDecodeResult decode_length_bounded(const std::vector<uint8_t>& data, size_t offset, size_t end);
} // namespace detail

// ============================================================================
// Tree Helpers
// ============================================================================

// Depth-first search for the first element with the tag
const TlvElement* find_tlv_element(const std::vector<TlvElement>& elements,
                                   const std::string& tag);

// Number of elements in the tree including nested children
size_t count_tlv_elements(const std::vector<TlvElement>& elements);

} // namespace paycodec
