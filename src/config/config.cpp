#include "paycodec/config.hpp"

#include "paycodec/hex.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

namespace paycodec {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

// Helper to safely get a string from JSON
std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

// Helper to safely get a bool from JSON
std::optional<bool> get_bool(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_boolean()) {
        return j[key].get<bool>();
    }
    return std::nullopt;
}

// Non-negative integer, nullopt when absent or of the wrong type
std::optional<size_t> get_size(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_number_unsigned()) {
        return j[key].get<size_t>();
    }
    return std::nullopt;
}

void read_flag(const nlohmann::json& section, const std::string& key, bool& target,
               const std::string& prefix, std::vector<std::string>& warnings) {
    if (!section.contains(key)) return;
    if (auto v = get_bool(section, key)) {
        target = *v;
    } else {
        warnings.push_back("invalid_configuration:" + prefix + "." + key);
    }
}

bool is_log_level(const std::string& level) {
    static const char* LEVELS[] = {"trace", "debug", "info", "warn", "error", "critical", "off"};
    return std::find(std::begin(LEVELS), std::end(LEVELS), level) != std::end(LEVELS);
}

std::optional<TagInfo> parse_custom_tag(const nlohmann::json& j, size_t index,
                                        std::vector<std::string>& warnings) {
    std::string where = "custom_tags[" + std::to_string(index) + "]";
    if (!j.is_object()) {
        warnings.push_back("invalid_configuration:" + where);
        return std::nullopt;
    }

    TagInfo info;
    auto id = get_string(j, "id");
    auto name = get_string(j, "name");
    if (!id || !name) {
        warnings.push_back("invalid_configuration:" + where + ":missing_id_or_name");
        return std::nullopt;
    }

    info.id = normalize_hex(*id);
    if (info.id.empty() || !is_valid_hex(info.id)) {
        warnings.push_back("invalid_configuration:" + where + ":invalid_id");
        return std::nullopt;
    }
    info.name = *name;
    info.description = get_string(j, "description").value_or("");
    info.tag_class = TagClass::Private;
    info.is_proprietary = true;

    if (auto format = get_string(j, "format")) {
        if (auto parsed = parse_tag_format(*format)) {
            info.format = *parsed;
        } else {
            warnings.push_back("invalid_configuration:" + where + ":format");
        }
    }
    if (auto cls = get_string(j, "class")) {
        if (auto parsed = parse_tag_class(*cls)) {
            info.tag_class = *parsed;
        } else {
            warnings.push_back("invalid_configuration:" + where + ":class");
        }
    }
    if (auto vt = get_string(j, "value_type")) {
        if (auto parsed = parse_tag_value_type(*vt)) {
            info.value_type = *parsed;
        } else {
            warnings.push_back("invalid_configuration:" + where + ":value_type");
        }
    }
    info.min_length = get_size(j, "min_length");
    info.max_length = get_size(j, "max_length");
    info.fixed_length = get_size(j, "fixed_length");
    if (auto prop = get_bool(j, "proprietary")) info.is_proprietary = *prop;

    return info;
}

std::optional<FieldDefinition> parse_custom_field(const nlohmann::json& j, size_t index,
                                                  std::vector<std::string>& warnings) {
    std::string where = "custom_fields[" + std::to_string(index) + "]";
    if (!j.is_object()) {
        warnings.push_back("invalid_configuration:" + where);
        return std::nullopt;
    }

    if (!j.contains("id") || !j["id"].is_number_integer()) {
        warnings.push_back("invalid_configuration:" + where + ":missing_id");
        return std::nullopt;
    }
    int id = j["id"].get<int>();
    // 1, 65 and 129 are bitmap indicators
    if (id < 2 || id > 192 || id == 65 || id == 129) {
        warnings.push_back("invalid_configuration:" + where + ":invalid_id");
        return std::nullopt;
    }

    auto name = get_string(j, "name");
    auto length = get_size(j, "length");
    if (!name || !length) {
        warnings.push_back("invalid_configuration:" + where + ":missing_name_or_length");
        return std::nullopt;
    }

    FieldDefinition def;
    def.id = id;
    def.name = *name;
    def.length = *length;
    def.description = get_string(j, "description").value_or("");

    if (auto format = get_string(j, "format")) {
        if (auto parsed = parse_field_format(*format)) {
            def.format = *parsed;
        } else {
            warnings.push_back("invalid_configuration:" + where + ":format");
        }
    }
    if (auto lt = get_string(j, "length_type")) {
        if (auto parsed = parse_length_type(*lt)) {
            def.length_type = *parsed;
        } else {
            warnings.push_back("invalid_configuration:" + where + ":length_type");
        }
    }
    def.max_length = get_size(j, "max_length");
    def.min_length = get_size(j, "min_length");
    def.content_format = get_string(j, "content_format");
    return def;
}

} // namespace

Config get_builtin_config() {
    Config config;
    config.schema = CONFIG_SCHEMA;
    config.log_level = "warn";
    return config;
}

ConfigParseResult parse_config(const std::string& json_str, const std::string& source_path) {
    ConfigParseResult result;
    result.config = get_builtin_config();
    result.config.source_path = source_path;

    try {
        auto j = nlohmann::json::parse(json_str);

        if (!j.is_object()) {
            result.error = "JSON must be an object";
            return result;
        }

        // $schema (REQUIRED)
        if (auto schema = get_string(j, "$schema")) {
            result.config.schema = trim(*schema);
        } else {
            result.error = "$schema missing";
            return result;
        }

        if (result.config.schema != CONFIG_SCHEMA) {
            result.error = std::string("$schema mismatch: expected ") + CONFIG_SCHEMA;
            return result;
        }

        if (auto level = get_string(j, "log_level")) {
            std::string lower = to_lower(trim(*level));
            if (is_log_level(lower)) {
                result.config.log_level = lower;
            } else {
                result.warnings.push_back("invalid_configuration:log_level");
            }
        }

        // "tlv" section
        if (j.contains("tlv") && j["tlv"].is_object()) {
            const auto& tlv = j["tlv"];
            auto& opts = result.config.tlv;
            read_flag(tlv, "ignore_unknown_tags", opts.ignore_unknown_tags, "tlv", result.warnings);
            read_flag(tlv, "validate_length", opts.validate_length, "tlv", result.warnings);
            read_flag(tlv, "stop_on_error", opts.stop_on_error, "tlv", result.warnings);
            read_flag(tlv, "parse_constructed", opts.parse_constructed, "tlv", result.warnings);
            if (tlv.contains("max_depth")) {
                auto depth = get_size(tlv, "max_depth");
                if (depth && *depth > 0) {
                    opts.max_depth = *depth;
                } else {
                    result.warnings.push_back("invalid_configuration:tlv.max_depth");
                }
            }
        }

        // "iso8583" section
        if (j.contains("iso8583") && j["iso8583"].is_object()) {
            const auto& iso = j["iso8583"];
            auto& opts = result.config.iso8583;
            if (auto version = get_string(iso, "version")) {
                if (auto parsed = parse_iso_version(trim(*version))) {
                    opts.version = *parsed;
                } else {
                    result.warnings.push_back("invalid_configuration:iso8583.version");
                }
            }
            read_flag(iso, "binary_bitmap", opts.binary_bitmap, "iso8583", result.warnings);
            read_flag(iso, "include_secondary_bitmap", opts.include_secondary_bitmap, "iso8583",
                      result.warnings);
            read_flag(iso, "include_tertiary_bitmap", opts.include_tertiary_bitmap, "iso8583",
                      result.warnings);
            read_flag(iso, "validate_fields", opts.validate_fields, "iso8583", result.warnings);
        }

        // "custom_tags" section
        if (j.contains("custom_tags") && j["custom_tags"].is_array()) {
            size_t index = 0;
            for (const auto& entry : j["custom_tags"]) {
                if (auto tag = parse_custom_tag(entry, index, result.warnings)) {
                    result.config.custom_tags.push_back(std::move(*tag));
                }
                ++index;
            }
        }

        // "custom_fields" section
        if (j.contains("custom_fields") && j["custom_fields"].is_array()) {
            size_t index = 0;
            for (const auto& entry : j["custom_fields"]) {
                if (auto field = parse_custom_field(entry, index, result.warnings)) {
                    result.config.custom_fields.push_back(std::move(*field));
                }
                ++index;
            }
        }

        result.ok = true;
    } catch (const nlohmann::json::parse_error& e) {
        result.error = std::string("JSON parse error: ") + e.what();
    }

    return result;
}

ConfigParseResult load_config_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        ConfigParseResult result;
        result.config = get_builtin_config();
        result.error = "cannot open config file: " + path;
        return result;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse_config(buffer.str(), path);
}

std::vector<std::string> apply_custom_tags(StaticTagRegistry& registry, const Config& config) {
    std::vector<std::string> warnings;
    for (const auto& tag : config.custom_tags) {
        if (registry.upsert_tag(tag)) {
            warnings.push_back("custom_tag_overrides_builtin:" + tag.id);
        }
    }
    return warnings;
}

std::vector<std::string> apply_custom_fields(StaticFieldRegistry& registry, const Config& config) {
    std::vector<std::string> warnings;
    for (const auto& field : config.custom_fields) {
        if (registry.upsert_field(field)) {
            warnings.push_back("custom_field_overrides_builtin:" + std::to_string(field.id));
        }
    }
    return warnings;
}

} // namespace paycodec
