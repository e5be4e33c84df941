/**
 * paycodec CLI - tlv command
 *
 * Decode, edit and compare BER-TLV data.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace paycodec::cli::commands {

namespace {

struct ParseOptions {
    std::string input;
    bool ignore_unknown = false;
    bool stop_on_error = false;
    bool no_constructed = false;
    bool show_raw = false;
};

struct EditOptions {
    std::string input;
    std::string path;
    std::string value;
};

struct CompareCmdOptions {
    std::string left;
    std::string right;
    bool hide_unknown = false;
};

struct LengthOptions {
    int64_t length = 0;
};

// Accepts hex or Base64
std::optional<std::string> input_to_hex(const std::string& arg, bool json_mode) {
    std::string raw = read_argument(arg);
    auto format = detect_input_format(raw);
    auto hex = to_hex_input(raw);
    if (!hex) {
        print_error("Input is neither hex nor Base64", json_mode);
        return std::nullopt;
    }
    spdlog::debug("tlv input detected as {}", input_format_to_string(format));
    return hex;
}

int cmd_parse(const GlobalOptions& opts, const ParseOptions& parse_opts) {
    auto ctx = load_context(opts);
    if (!ctx) return 1;

    auto hex = input_to_hex(parse_opts.input, opts.json);
    if (!hex) return 1;

    TlvParseOptions options = ctx->config.tlv;
    if (parse_opts.ignore_unknown) options.ignore_unknown_tags = true;
    if (parse_opts.stop_on_error) options.stop_on_error = true;
    if (parse_opts.no_constructed) options.parse_constructed = false;

    auto result = parse_tlv(*hex, ctx->tags, options);

    if (opts.json) {
        auto j = tlv_to_json(result);
        j["ok"] = result.ok();
        output_json(j);
    } else {
        TlvFormatOptions fmt;
        fmt.show_raw_hex = parse_opts.show_raw;
        std::cout << format_tlv_text(result, fmt);
    }
    return result.ok() ? 0 : 1;
}

int cmd_edit(const GlobalOptions& opts, const EditOptions& edit_opts) {
    auto ctx = load_context(opts);
    if (!ctx) return 1;

    auto hex = input_to_hex(edit_opts.input, opts.json);
    if (!hex) return 1;

    auto result = edit_tlv_value(*hex, split_tag_path(edit_opts.path), edit_opts.value, ctx->tags);
    if (result.isErr()) {
        print_error(std::string(error_code_to_string(result.error().code())) + ": " +
                        result.error().message(),
                    opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["path"] = edit_opts.path;
        j["raw_hex"] = result.value();
        output_json(j);
    } else {
        std::cout << result.value() << std::endl;
    }
    return 0;
}

int cmd_compare(const GlobalOptions& opts, const CompareCmdOptions& cmp_opts) {
    auto ctx = load_context(opts);
    if (!ctx) return 1;

    auto left_hex = input_to_hex(cmp_opts.left, opts.json);
    if (!left_hex) return 1;
    auto right_hex = input_to_hex(cmp_opts.right, opts.json);
    if (!right_hex) return 1;

    TlvParseOptions options = ctx->config.tlv;
    options.ignore_unknown_tags = true;
    auto left = parse_tlv(*left_hex, ctx->tags, options);
    auto right = parse_tlv(*right_hex, ctx->tags, options);
    for (const auto& err : left.errors) print_warning("left: " + err.message);
    for (const auto& err : right.errors) print_warning("right: " + err.message);

    CompareOptions compare_options;
    compare_options.include_unknown_tags = !cmp_opts.hide_unknown;
    auto cmp = compare_tlv(left.elements, right.elements, compare_options);

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["identical"] = cmp.identical();
        j["summary"] = {
            {"differences", cmp.differences_count()},
            {"added", cmp.added},
            {"removed", cmp.removed},
            {"modified", cmp.modified},
            {"unchanged", cmp.unchanged},
        };
        nlohmann::json entries = nlohmann::json::array();
        for (const auto& entry : cmp.entries) {
            if (entry.status == DiffStatus::Unchanged) continue;
            nlohmann::json e;
            e["path"] = entry.path;
            e["status"] = diff_status_to_string(entry.status);
            if (entry.left) e["left"] = entry.left->value;
            if (entry.right) e["right"] = entry.right->value;
            entries.push_back(e);
        }
        j["differences"] = entries;
        output_json(j);
    } else {
        std::cout << format_comparison_report(cmp, cmp_opts.left, cmp_opts.right);
    }
    return cmp.identical() ? 0 : 2;
}

int cmd_length(const GlobalOptions& opts, const LengthOptions& len_opts) {
    init_warning_collector(opts.json, opts.quiet);

    auto encoded = encode_length(len_opts.length);
    if (encoded.isErr()) {
        print_error(encoded.error().message(), opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["length"] = len_opts.length;
        j["encoded"] = encoded.value();
        output_json(j);
    } else {
        std::cout << encoded.value() << std::endl;
    }
    return 0;
}

} // anonymous namespace

void setup_tlv(CLI::App* app, GlobalOptions& opts) {
    app->require_subcommand(1);

    static ParseOptions parse_opts;
    auto parse_cmd = app->add_subcommand("parse", "Decode hex or Base64 BER-TLV data");
    parse_cmd->add_option("input", parse_opts.input, "TLV data (or - for stdin)")->required();
    parse_cmd->add_flag("--ignore-unknown", parse_opts.ignore_unknown, "Accept tags missing from the dictionary");
    parse_cmd->add_flag("--stop-on-error", parse_opts.stop_on_error, "Stop at the first error");
    parse_cmd->add_flag("--no-constructed", parse_opts.no_constructed, "Do not decode template contents");
    parse_cmd->add_flag("--raw", parse_opts.show_raw, "Print the normalized input");
    parse_cmd->callback([&opts]() {
        std::exit(cmd_parse(opts, parse_opts));
    });

    static EditOptions edit_opts;
    auto edit_cmd = app->add_subcommand("edit", "Replace a primitive value and re-encode");
    edit_cmd->add_option("input", edit_opts.input, "TLV data (or - for stdin)")->required();
    edit_cmd->add_option("path", edit_opts.path, "Colon-separated tag path, e.g. E0:9F33")->required();
    edit_cmd->add_option("value", edit_opts.value, "New value as hex")->required();
    edit_cmd->callback([&opts]() {
        std::exit(cmd_edit(opts, edit_opts));
    });

    static CompareCmdOptions cmp_opts;
    auto compare_cmd = app->add_subcommand("compare", "Compare two TLV streams tag by tag");
    compare_cmd->add_option("left", cmp_opts.left, "Left TLV data")->required();
    compare_cmd->add_option("right", cmp_opts.right, "Right TLV data")->required();
    compare_cmd->add_flag("--hide-unknown", cmp_opts.hide_unknown, "Leave tags missing from the dictionary out");
    compare_cmd->callback([&opts]() {
        std::exit(cmd_compare(opts, cmp_opts));
    });

    static LengthOptions len_opts;
    auto length_cmd = app->add_subcommand("length", "Encode a value length as a BER length field");
    length_cmd->add_option("length", len_opts.length, "Length in bytes")->required();
    length_cmd->callback([&opts]() {
        std::exit(cmd_length(opts, len_opts));
    });
}

} // namespace paycodec::cli::commands
