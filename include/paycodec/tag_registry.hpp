#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace paycodec {

// ============================================================================
// Tag Metadata
// ============================================================================

enum class TagFormat {
    Primitive,
    Constructed
};

inline const char* tag_format_to_string(TagFormat f) {
    switch (f) {
        case TagFormat::Primitive: return "primitive";
        case TagFormat::Constructed: return "constructed";
        default: return "primitive";
    }
}

std::optional<TagFormat> parse_tag_format(const std::string& s);

enum class TagClass {
    Universal,
    Application,
    ContextSpecific,
    Private
};

inline const char* tag_class_to_string(TagClass c) {
    switch (c) {
        case TagClass::Universal: return "universal";
        case TagClass::Application: return "application";
        case TagClass::ContextSpecific: return "context-specific";
        case TagClass::Private: return "private";
        default: return "universal";
    }
}

std::optional<TagClass> parse_tag_class(const std::string& s);

enum class TagValueType {
    Binary,
    Numeric,
    Text,
    Mixed
};

inline const char* tag_value_type_to_string(TagValueType t) {
    switch (t) {
        case TagValueType::Binary: return "binary";
        case TagValueType::Numeric: return "numeric";
        case TagValueType::Text: return "text";
        case TagValueType::Mixed: return "mixed";
        default: return "binary";
    }
}

std::optional<TagValueType> parse_tag_value_type(const std::string& s);

struct TagInfo {
    std::string id;  // uppercase hex, e.g. "9F02"
    std::string name;
    std::string description;
    TagFormat format = TagFormat::Primitive;
    TagClass tag_class = TagClass::ContextSpecific;
    std::optional<size_t> min_length;
    std::optional<size_t> max_length;
    std::optional<size_t> fixed_length;
    bool is_proprietary = false;
    std::optional<TagValueType> value_type;

    bool is_constructed() const { return format == TagFormat::Constructed; }
};

// ============================================================================
// Tag Registry
// ============================================================================

/**
 * @brief Read-only lookup of tag metadata.
 *
 * Decoders receive a registry by const reference and never modify it, so one
 * instance can be shared by concurrent decodes.
 */
class TagRegistry {
public:
    virtual ~TagRegistry() = default;

    // Lookup is case-insensitive on the hex id
    virtual std::optional<TagInfo> get_tag_info(const std::string& tag_id) const = 0;
};

class StaticTagRegistry : public TagRegistry {
public:
    std::optional<TagInfo> get_tag_info(const std::string& tag_id) const override;

    // Returns false if a tag with this id is already registered
    bool register_tag(TagInfo info);

    // Insert or replace. Returns true if an existing entry was replaced.
    bool upsert_tag(TagInfo info);

    bool is_registered(const std::string& tag_id) const;

    // Sorted by id
    std::vector<TagInfo> all_tags() const;

    size_t size() const { return tags_.size(); }

private:
    std::map<std::string, TagInfo> tags_;
};

// Standard EMV tags and templates
StaticTagRegistry builtin_emv_tags();

} // namespace paycodec
