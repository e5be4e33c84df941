#pragma once

#include "paycodec/field_registry.hpp"
#include "paycodec/types.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace paycodec {

// ============================================================================
// ISO 8583 Layout Constants
// ============================================================================

constexpr size_t ISO_MTI_LENGTH = 4;
constexpr size_t ISO_BITMAP_HEX_LENGTH = 16;
constexpr size_t ISO_BITMAP_BINARY_LENGTH = 8;
constexpr size_t ISO_MIN_MESSAGE_LENGTH = 20;  // MTI + primary bitmap in hex

// Fields 102-125 carry an LLLVAR indicator when no definition is known
constexpr int ISO_LLLVAR_FALLBACK_FIRST = 102;
constexpr int ISO_LLLVAR_FALLBACK_LAST = 125;

// ============================================================================
// ISO 8583 Data Model
// ============================================================================

struct MessageTypeIndicator {
    std::string raw;  // four decimal digits
    IsoVersion version = IsoVersion::V1987;
    char mti_class = '0';
    char function = '0';
    char origin = '0';
};

struct Bitmap {
    std::string primary;  // 16 uppercase hex chars
    std::optional<std::string> secondary;
    std::optional<std::string> tertiary;
    std::vector<int> present_fields;  // ascending, excludes 1, 65, 129
};

struct IsoField {
    int id = 0;
    std::string value;
    std::string raw;  // indicator + value for variable fields
    std::optional<size_t> length_indicator;
    std::optional<FieldDefinition> definition;
};

struct Iso8583ParseError {
    ErrorCode code = ErrorCode::MALFORMED_INPUT;
    std::string message;
    std::optional<int> field_id;
    std::optional<size_t> position;  // character offset in the message
};

struct Iso8583ParseResult {
    MessageTypeIndicator mti;
    Bitmap bitmap;
    std::map<int, IsoField> fields;
    std::vector<Iso8583ParseError> errors;
    std::string raw_message;

    bool ok() const { return errors.empty(); }
};

struct Iso8583ParseOptions {
    IsoVersion version = IsoVersion::V1987;
    bool binary_bitmap = false;
    bool include_secondary_bitmap = true;
    bool include_tertiary_bitmap = false;
    bool validate_fields = true;
};

// ============================================================================
// MTI
// ============================================================================

struct MtiParseResult {
    bool ok = false;
    std::string error;
    MessageTypeIndicator mti;
};

// raw must be exactly four decimal digits. The version digit selects
// 1987/1993/2003; any other digit falls back to default_version.
MtiParseResult parse_mti(const std::string& raw, IsoVersion default_version);

// ============================================================================
// Bitmap Codec
// ============================================================================

// Field ids whose bits are set in a 16-hex-char segment. Bit i (1-based,
// MSB first) maps to field offset + i.
std::vector<int> bitmap_fields(const std::string& bitmap_hex, int offset);

// Inverse of bitmap_fields. Ids outside (offset, offset + 64] are ignored.
std::string encode_bitmap_segment(const std::vector<int>& fields, int offset);

struct BitmapParseResult {
    bool ok = false;
    ErrorCode error_code = ErrorCode::TRUNCATED;
    std::string error;
    Bitmap bitmap;
    size_t next_position = 0;
};

// Reads primary, then secondary/tertiary segments as the indicator bits and
// options allow, starting at position.
BitmapParseResult parse_bitmap(const std::string& message, size_t position,
                               const Iso8583ParseOptions& options);

// ============================================================================
// Message Decoder
// ============================================================================

/**
 * @brief Decode an ISO 8583 message held as a character string.
 *
 * Positions are character offsets. Recoverable problems are collected;
 * decoding stops at the first overrun because later field boundaries can no
 * longer be trusted.
 */
Iso8583ParseResult parse_iso8583(const std::string& message,
                                 const FieldRegistry& registry,
                                 const Iso8583ParseOptions& options = {});

} // namespace paycodec
