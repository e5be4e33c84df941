/**
 * paycodec CLI - registry command
 *
 * List the tag and field dictionaries in effect.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

#include <iomanip>

namespace paycodec::cli::commands {

namespace {

std::string describe_length(const TagInfo& tag) {
    if (tag.fixed_length) return std::to_string(*tag.fixed_length);
    if (tag.min_length || tag.max_length) {
        return std::to_string(tag.min_length.value_or(0)) + ".." +
               (tag.max_length ? std::to_string(*tag.max_length) : std::string("*"));
    }
    return "var";
}

int cmd_tags(const GlobalOptions& opts) {
    auto ctx = load_context(opts);
    if (!ctx) return 1;

    auto tags = ctx->tags.all_tags();

    if (opts.json) {
        nlohmann::json list = nlohmann::json::array();
        for (const auto& tag : tags) {
            nlohmann::json t;
            t["id"] = tag.id;
            t["name"] = tag.name;
            t["format"] = tag_format_to_string(tag.format);
            t["class"] = tag_class_to_string(tag.tag_class);
            if (tag.fixed_length) t["fixed_length"] = *tag.fixed_length;
            if (tag.min_length) t["min_length"] = *tag.min_length;
            if (tag.max_length) t["max_length"] = *tag.max_length;
            t["proprietary"] = tag.is_proprietary;
            list.push_back(t);
        }
        nlohmann::json j;
        j["ok"] = true;
        j["tags"] = list;
        output_json(j);
        return 0;
    }

    for (const auto& tag : tags) {
        std::cout << std::left << std::setw(6) << tag.id << " "
                  << std::setw(12) << tag_format_to_string(tag.format) << " "
                  << std::setw(8) << describe_length(tag) << " " << tag.name << std::endl;
    }
    return 0;
}

int cmd_fields(const GlobalOptions& opts) {
    auto ctx = load_context(opts);
    if (!ctx) return 1;

    auto fields = ctx->fields.all_fields();

    if (opts.json) {
        nlohmann::json list = nlohmann::json::array();
        for (const auto& def : fields) {
            nlohmann::json f;
            f["id"] = def.id;
            f["name"] = def.name;
            f["format"] = field_format_to_string(def.format);
            f["length"] = def.length;
            f["length_type"] = length_type_to_string(def.length_type);
            list.push_back(f);
        }
        nlohmann::json j;
        j["ok"] = true;
        j["fields"] = list;
        output_json(j);
        return 0;
    }

    for (const auto& def : fields) {
        std::string rule = def.is_variable()
                               ? std::string(def.length_digits(), 'L') + "VAR.." + std::to_string(def.length)
                               : std::to_string(def.length);
        std::cout << std::right << std::setw(3) << def.id << "  " << std::left << std::setw(4)
                  << field_format_to_string(def.format) << std::setw(12) << rule << def.name << std::endl;
    }
    return 0;
}

} // anonymous namespace

void setup_registry(CLI::App* app, GlobalOptions& opts) {
    app->require_subcommand(1);

    auto tags_cmd = app->add_subcommand("tags", "List known BER-TLV tags");
    tags_cmd->callback([&opts]() {
        std::exit(cmd_tags(opts));
    });

    auto fields_cmd = app->add_subcommand("fields", "List known ISO 8583 fields");
    fields_cmd->callback([&opts]() {
        std::exit(cmd_fields(opts));
    });
}

} // namespace paycodec::cli::commands
