/**
 * paycodec CLI - iso command
 *
 * Decode ISO 8583 messages and bitmaps.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

#include <sstream>

namespace paycodec::cli::commands {

namespace {

struct IsoParseOptions {
    std::string message;
    std::string version;
    bool binary_bitmap = false;
    bool no_secondary = false;
    bool tertiary = false;
    bool lenient = false;
    bool show_raw = false;
};

struct BitmapOptions {
    std::string bitmap;
    std::vector<int> fields;
};

int cmd_parse(const GlobalOptions& opts, const IsoParseOptions& iso_opts) {
    auto ctx = load_context(opts);
    if (!ctx) return 1;

    Iso8583ParseOptions options = ctx->config.iso8583;
    if (!iso_opts.version.empty()) {
        auto version = parse_iso_version(iso_opts.version);
        if (!version) {
            print_error("Unknown ISO 8583 version: " + iso_opts.version, opts.json);
            return 1;
        }
        options.version = *version;
    }
    if (iso_opts.binary_bitmap) options.binary_bitmap = true;
    if (iso_opts.no_secondary) options.include_secondary_bitmap = false;
    if (iso_opts.tertiary) options.include_tertiary_bitmap = true;
    if (iso_opts.lenient) options.validate_fields = false;

    auto result = parse_iso8583(read_argument(iso_opts.message), ctx->fields, options);

    if (opts.json) {
        auto j = iso8583_to_json(result);
        j["ok"] = result.ok();
        output_json(j);
    } else {
        IsoFormatOptions fmt;
        fmt.show_raw_data = iso_opts.show_raw;
        std::cout << format_iso8583_text(result, fmt);
    }
    return result.ok() ? 0 : 1;
}

int cmd_bitmap(const GlobalOptions& opts, const BitmapOptions& bm_opts) {
    init_warning_collector(opts.json, opts.quiet);

    if (!bm_opts.fields.empty()) {
        // Build primary (and secondary when needed) from field numbers
        std::vector<int> fields = bm_opts.fields;
        bool needs_secondary = false;
        for (int f : fields) {
            if (f < 2 || f > 128 || f == 65) {
                print_error("Field number out of range: " + std::to_string(f), opts.json);
                return 1;
            }
            if (f > 64) needs_secondary = true;
        }
        if (needs_secondary) fields.push_back(1);

        std::string bitmap = encode_bitmap_segment(fields, 0);
        if (needs_secondary) bitmap += encode_bitmap_segment(fields, 64);

        if (opts.json) {
            nlohmann::json j;
            j["ok"] = true;
            j["bitmap"] = bitmap;
            output_json(j);
        } else {
            std::cout << bitmap << std::endl;
        }
        return 0;
    }

    std::string hex = normalize_hex(bm_opts.bitmap);
    if (!is_valid_hex(hex) || (hex.size() != 16 && hex.size() != 32 && hex.size() != 48)) {
        print_error("Bitmap must be 16, 32 or 48 hex characters", opts.json);
        return 1;
    }

    std::vector<int> present;
    for (size_t seg = 0; seg * 16 < hex.size(); ++seg) {
        auto fields = bitmap_fields(hex.substr(seg * 16, 16), static_cast<int>(seg * 64));
        present.insert(present.end(), fields.begin(), fields.end());
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["bitmap"] = hex;
        j["fields"] = present;
        output_json(j);
    } else {
        std::ostringstream line;
        for (size_t i = 0; i < present.size(); ++i) {
            if (i > 0) line << ", ";
            line << present[i];
        }
        std::cout << "Fields: " << line.str() << std::endl;
    }
    return 0;
}

} // anonymous namespace

void setup_iso(CLI::App* app, GlobalOptions& opts) {
    app->require_subcommand(1);

    static IsoParseOptions iso_opts;
    auto parse_cmd = app->add_subcommand("parse", "Decode an ISO 8583 message");
    parse_cmd->add_option("message", iso_opts.message, "Message text (or - for stdin)")->required();
    parse_cmd->add_option("--iso-version", iso_opts.version, "Default version: 1987, 1993 or 2003");
    parse_cmd->add_flag("--binary-bitmap", iso_opts.binary_bitmap, "Bitmaps are 8 raw bytes instead of hex");
    parse_cmd->add_flag("--no-secondary", iso_opts.no_secondary, "Ignore the secondary bitmap indicator");
    parse_cmd->add_flag("--tertiary", iso_opts.tertiary, "Read a tertiary bitmap when indicated");
    parse_cmd->add_flag("--lenient", iso_opts.lenient, "Decode fields missing from the dictionary");
    parse_cmd->add_flag("--raw", iso_opts.show_raw, "Show raw bitmap and field data");
    parse_cmd->callback([&opts]() {
        std::exit(cmd_parse(opts, iso_opts));
    });

    static BitmapOptions bm_opts;
    auto bitmap_cmd = app->add_subcommand("bitmap", "List the fields of a bitmap, or build one");
    auto bitmap_arg = bitmap_cmd->add_option("bitmap", bm_opts.bitmap, "Bitmap as hex");
    auto fields_opt = bitmap_cmd->add_option("--fields", bm_opts.fields, "Field numbers to set")->delimiter(',');
    bitmap_arg->excludes(fields_opt);
    bitmap_cmd->callback([&opts]() {
        std::exit(cmd_bitmap(opts, bm_opts));
    });
}

} // namespace paycodec::cli::commands
