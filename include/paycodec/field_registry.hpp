#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace paycodec {

// ============================================================================
// ISO 8583 Versions
// ============================================================================

enum class IsoVersion {
    V1987,
    V1993,
    V2003
};

inline const char* iso_version_to_string(IsoVersion v) {
    switch (v) {
        case IsoVersion::V1987: return "1987";
        case IsoVersion::V1993: return "1993";
        case IsoVersion::V2003: return "2003";
        default: return "1987";
    }
}

// Accepts "1987", "1993", "2003"
std::optional<IsoVersion> parse_iso_version(const std::string& s);

// ============================================================================
// Field Formats
// ============================================================================

enum class FieldFormat {
    Alpha,                // a
    Numeric,              // n
    Binary,               // b
    Special,              // s
    AlphaNumeric,         // an
    AlphaNumericSpecial,  // ans
    AlphaSpecial,         // as
    NumericSpecial,       // ns
    TrackData,            // z
    BinaryNumeric,        // xn
};

inline const char* field_format_to_string(FieldFormat f) {
    switch (f) {
        case FieldFormat::Alpha: return "a";
        case FieldFormat::Numeric: return "n";
        case FieldFormat::Binary: return "b";
        case FieldFormat::Special: return "s";
        case FieldFormat::AlphaNumeric: return "an";
        case FieldFormat::AlphaNumericSpecial: return "ans";
        case FieldFormat::AlphaSpecial: return "as";
        case FieldFormat::NumericSpecial: return "ns";
        case FieldFormat::TrackData: return "z";
        case FieldFormat::BinaryNumeric: return "xn";
        default: return "ans";
    }
}

std::optional<FieldFormat> parse_field_format(const std::string& s);

enum class LengthType {
    Fixed,
    Variable
};

inline const char* length_type_to_string(LengthType t) {
    return t == LengthType::Fixed ? "fixed" : "variable";
}

std::optional<LengthType> parse_length_type(const std::string& s);

struct FieldDefinition {
    int id = 0;
    std::string name;
    FieldFormat format = FieldFormat::AlphaNumericSpecial;
    size_t length = 0;  // exact length if fixed, maximum if variable
    LengthType length_type = LengthType::Fixed;
    std::string description;
    std::optional<size_t> max_length;
    std::optional<size_t> min_length;
    std::optional<std::string> content_format;  // e.g. "MMDDhhmmss"

    bool is_variable() const { return length_type == LengthType::Variable; }

    // Width of the length indicator of a variable field: LLVAR 2, LLLVAR 3
    size_t length_digits() const;

    // Upper bound a variable value may reach
    size_t effective_max_length() const { return max_length ? *max_length : length; }
};

// ============================================================================
// Field Registry
// ============================================================================

/**
 * @brief Read-only lookup of ISO 8583 field definitions for a version.
 */
class FieldRegistry {
public:
    virtual ~FieldRegistry() = default;

    virtual std::optional<FieldDefinition> get_field_definition(int field_id,
                                                                IsoVersion version) const = 0;
};

/**
 * Map-backed registry. One definition set is shared by every version; the
 * version argument is accepted so that version-specific registries can be
 * dropped in behind the same interface.
 */
class StaticFieldRegistry : public FieldRegistry {
public:
    std::optional<FieldDefinition> get_field_definition(int field_id,
                                                        IsoVersion version) const override;

    // Returns false if the id already exists
    bool register_field(FieldDefinition def);

    // Insert or replace. Returns true if an existing entry was replaced.
    bool upsert_field(FieldDefinition def);

    std::vector<FieldDefinition> all_fields() const;

    size_t size() const { return fields_.size(); }

private:
    std::map<int, FieldDefinition> fields_;
};

// ISO 8583:1987 definitions for the commonly used data elements
StaticFieldRegistry builtin_iso8583_fields();

} // namespace paycodec
