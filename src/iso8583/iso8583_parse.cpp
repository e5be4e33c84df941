#include "paycodec/iso8583.hpp"

#include "paycodec/bits.hpp"
#include "paycodec/hex.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace paycodec {

namespace {

bool all_digits(const std::string& s) {
    if (s.empty()) return false;
    return std::all_of(s.begin(), s.end(),
                       [](unsigned char c) { return std::isdigit(c) != 0; });
}

Iso8583ParseError make_error(ErrorCode code, std::string message,
                             std::optional<int> field_id = std::nullopt,
                             std::optional<size_t> position = std::nullopt) {
    Iso8583ParseError err;
    err.code = code;
    err.message = std::move(message);
    err.field_id = field_id;
    err.position = position;
    return err;
}

struct FieldReadResult {
    bool ok = false;
    Iso8583ParseError error;
    IsoField field;
    size_t next_position = 0;
};

// Reads a decimal length indicator of the given width at position
FieldReadResult read_length_indicator(const std::string& message, size_t position, int field_id,
                                      size_t digits, size_t& length) {
    FieldReadResult result;
    if (position + digits > message.size()) {
        result.error = make_error(ErrorCode::TRUNCATED,
                                  "Message too short for field " + std::to_string(field_id) +
                                      " length indicator",
                                  field_id, position);
        return result;
    }

    std::string indicator = message.substr(position, digits);
    if (!all_digits(indicator)) {
        result.error = make_error(ErrorCode::MALFORMED_INPUT,
                                  "Invalid length indicator for field " + std::to_string(field_id) +
                                      ": " + indicator,
                                  field_id, position);
        return result;
    }

    // Anything past the end of the message overruns, so stop counting there
    length = 0;
    for (char c : indicator) {
        length = length * 10 + static_cast<size_t>(c - '0');
        if (length > message.size()) break;
    }
    result.ok = true;
    result.field.length_indicator = length;
    result.field.raw = indicator;
    result.next_position = position + digits;
    return result;
}

FieldReadResult read_field(const std::string& message, size_t position, int field_id,
                           const std::optional<FieldDefinition>& definition) {
    FieldReadResult result;
    result.field.id = field_id;

    size_t length = 1;
    size_t value_position = position;
    std::string indicator;

    bool lllvar_fallback = !definition && field_id >= ISO_LLLVAR_FALLBACK_FIRST &&
                           field_id <= ISO_LLLVAR_FALLBACK_LAST;

    if ((definition && definition->is_variable()) || lllvar_fallback) {
        size_t digits = definition ? definition->length_digits() : 3;
        auto ind = read_length_indicator(message, position, field_id, digits, length);
        if (!ind.ok) return ind;
        indicator = ind.field.raw;
        result.field.length_indicator = ind.field.length_indicator;
        value_position = ind.next_position;
    } else if (definition) {
        length = definition->length;
    }

    if (value_position + length > message.size()) {
        result.error = make_error(ErrorCode::TRUNCATED,
                                  "Message too short for field " + std::to_string(field_id) + " value",
                                  field_id, value_position);
        return result;
    }

    result.ok = true;
    result.field.value = message.substr(value_position, length);
    result.field.raw = indicator + result.field.value;
    result.field.definition = definition;
    result.next_position = value_position + length;
    return result;
}

} // namespace

// ============================================================================
// MTI
// ============================================================================

MtiParseResult parse_mti(const std::string& raw, IsoVersion default_version) {
    MtiParseResult result;
    result.mti.raw = raw;
    result.mti.version = default_version;

    if (raw.size() != ISO_MTI_LENGTH || !all_digits(raw)) {
        result.error = "Invalid MTI format";
        return result;
    }

    switch (raw[0]) {
        case '0': result.mti.version = IsoVersion::V1987; break;
        case '1': result.mti.version = IsoVersion::V1993; break;
        case '2': result.mti.version = IsoVersion::V2003; break;
        default: break;
    }
    result.mti.mti_class = raw[1];
    result.mti.function = raw[2];
    result.mti.origin = raw[3];
    result.ok = true;
    return result;
}

// ============================================================================
// Bitmap
// ============================================================================

std::vector<int> bitmap_fields(const std::string& bitmap_hex, int offset) {
    std::vector<int> fields;
    auto bytes = hex_to_bytes(bitmap_hex);
    if (!bytes) return fields;

    for (size_t index : set_bit_positions(*bytes)) {
        fields.push_back(offset + static_cast<int>(index) + 1);
    }
    return fields;
}

std::string encode_bitmap_segment(const std::vector<int>& fields, int offset) {
    std::vector<uint8_t> bytes(ISO_BITMAP_BINARY_LENGTH, 0);
    for (int field : fields) {
        if (field <= offset || field > offset + 64) continue;
        auto updated = set_bit(bytes, static_cast<size_t>(field - offset - 1), true);
        if (updated) bytes = std::move(*updated);
    }
    return bytes_to_hex(bytes);
}

BitmapParseResult parse_bitmap(const std::string& message, size_t position,
                               const Iso8583ParseOptions& options) {
    BitmapParseResult result;
    const size_t width = options.binary_bitmap ? ISO_BITMAP_BINARY_LENGTH : ISO_BITMAP_HEX_LENGTH;

    // Reads one segment at position; false when it is missing or malformed
    auto read_segment = [&](const char* which, int offset, std::string& raw_out,
                            std::vector<int>& fields_out) -> bool {
        if (position + width > message.size()) {
            result.error_code = ErrorCode::TRUNCATED;
            result.error = std::string("Message too short for ") + which + " bitmap";
            return false;
        }
        raw_out = message.substr(position, width);
        std::string hex = options.binary_bitmap ? latin1_to_hex(raw_out) : normalize_hex(raw_out);
        if (!is_valid_hex(hex) || hex.size() != ISO_BITMAP_HEX_LENGTH) {
            result.error_code = ErrorCode::MALFORMED_INPUT;
            result.error = std::string("Invalid ") + which + " bitmap: " + raw_out;
            return false;
        }
        fields_out = bitmap_fields(hex, offset);
        position += width;
        return true;
    };

    std::vector<int> present;
    std::vector<int> segment;

    if (!read_segment("primary", 0, result.bitmap.primary, segment)) {
        result.next_position = position;
        return result;
    }
    present = segment;

    bool has_secondary = std::find(segment.begin(), segment.end(), 1) != segment.end();
    if (has_secondary && options.include_secondary_bitmap) {
        std::string raw;
        if (!read_segment("secondary", 64, raw, segment)) {
            result.next_position = position;
            return result;
        }
        result.bitmap.secondary = raw;
        present.insert(present.end(), segment.begin(), segment.end());

        bool has_tertiary = std::find(segment.begin(), segment.end(), 65) != segment.end();
        if (has_tertiary && options.include_tertiary_bitmap) {
            if (!read_segment("tertiary", 128, raw, segment)) {
                result.next_position = position;
                return result;
            }
            result.bitmap.tertiary = raw;
            present.insert(present.end(), segment.begin(), segment.end());
        }
    }

    present.erase(std::remove_if(present.begin(), present.end(),
                                 [](int f) { return f == 1 || f == 65 || f == 129; }),
                  present.end());
    std::sort(present.begin(), present.end());

    result.bitmap.present_fields = std::move(present);
    result.next_position = position;
    result.ok = true;
    return result;
}

// ============================================================================
// Message
// ============================================================================

Iso8583ParseResult parse_iso8583(const std::string& message, const FieldRegistry& registry,
                                 const Iso8583ParseOptions& options) {
    Iso8583ParseResult result;
    result.raw_message = message;
    result.mti.version = options.version;

    if (message.size() < ISO_MIN_MESSAGE_LENGTH) {
        result.errors.push_back(make_error(ErrorCode::MALFORMED_INPUT, "Message too short or invalid"));
        return result;
    }

    auto mti = parse_mti(message.substr(0, ISO_MTI_LENGTH), options.version);
    if (!mti.ok) {
        result.errors.push_back(make_error(ErrorCode::MALFORMED_INPUT, mti.error, std::nullopt, 0));
        return result;
    }
    result.mti = mti.mti;

    auto bitmap = parse_bitmap(message, ISO_MTI_LENGTH, options);
    result.bitmap = bitmap.bitmap;
    if (!bitmap.ok) {
        result.errors.push_back(make_error(bitmap.error_code, bitmap.error, std::nullopt,
                                           bitmap.next_position));
        return result;
    }

    size_t position = bitmap.next_position;
    for (int field_id : result.bitmap.present_fields) {
        auto definition = registry.get_field_definition(field_id, result.mti.version);
        if (!definition && options.validate_fields) {
            result.errors.push_back(make_error(ErrorCode::UNKNOWN_IDENTIFIER,
                                               "Unknown field definition for field " +
                                                   std::to_string(field_id),
                                               field_id));
            continue;
        }

        auto read = read_field(message, position, field_id, definition);
        if (!read.ok) {
            result.errors.push_back(read.error);
            break;
        }

        if (options.validate_fields && definition && definition->is_variable() &&
            read.field.value.size() > definition->effective_max_length()) {
            result.errors.push_back(make_error(ErrorCode::LIMIT_EXCEEDED,
                                               "Field " + std::to_string(field_id) + " length " +
                                                   std::to_string(read.field.value.size()) +
                                                   " exceeds maximum " +
                                                   std::to_string(definition->effective_max_length()),
                                               field_id, position));
        }

        position = read.next_position;
        result.fields[field_id] = std::move(read.field);
    }

    spdlog::debug("parse_iso8583: mti {}, {} fields present, {} decoded, {} errors", result.mti.raw,
                  result.bitmap.present_fields.size(), result.fields.size(), result.errors.size());
    if (position < message.size() && result.errors.empty()) {
        spdlog::debug("parse_iso8583: {} trailing characters after last field", message.size() - position);
    }
    return result;
}

} // namespace paycodec
