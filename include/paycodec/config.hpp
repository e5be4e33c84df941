#pragma once

#include "paycodec/field_registry.hpp"
#include "paycodec/iso8583.hpp"
#include "paycodec/tag_registry.hpp"
#include "paycodec/tlv.hpp"

#include <string>
#include <vector>

namespace paycodec {

constexpr const char* CONFIG_SCHEMA = "paycodec.config.v1";

// ============================================================================
// Configuration
// ============================================================================

struct Config {
    std::string schema;  // MUST be "paycodec.config.v1"
    std::string log_level = "warn";

    TlvParseOptions tlv;
    Iso8583ParseOptions iso8583;

    // User dictionary extensions
    std::vector<TagInfo> custom_tags;
    std::vector<FieldDefinition> custom_fields;

    // Source path for diagnostics
    std::string source_path;
};

Config get_builtin_config();

struct ConfigParseResult {
    bool ok = false;
    std::string error;
    Config config;
    std::vector<std::string> warnings;
};

ConfigParseResult parse_config(const std::string& json_str, const std::string& source_path = "");

// Reads and parses a configuration file
ConfigParseResult load_config_file(const std::string& path);

// Upsert the user tags. Returns a warning per overridden entry.
std::vector<std::string> apply_custom_tags(StaticTagRegistry& registry, const Config& config);
std::vector<std::string> apply_custom_fields(StaticFieldRegistry& registry, const Config& config);

} // namespace paycodec
