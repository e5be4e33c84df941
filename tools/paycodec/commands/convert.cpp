/**
 * paycodec CLI - convert command
 *
 * Convert between hex and Base64.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace paycodec::cli::commands {

namespace {

struct ConvertOptions {
    std::string value;
    std::string to = "hex";
};

int cmd_convert(const GlobalOptions& opts, const ConvertOptions& conv_opts) {
    init_warning_collector(opts.json, opts.quiet);

    std::string input = read_argument(conv_opts.value);
    std::optional<std::string> output;

    if (conv_opts.to == "hex") {
        output = base64_to_hex(input);
        if (!output) {
            print_error("Input is not valid Base64", opts.json);
            return 1;
        }
    } else {
        std::string hex = normalize_hex(input);
        if (!is_valid_hex(hex)) {
            print_error("Input is not valid hex", opts.json);
            return 1;
        }
        output = hex_to_base64(hex);
        if (!output) {
            print_error("Input is not valid hex", opts.json);
            return 1;
        }
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["format"] = conv_opts.to;
        j["value"] = *output;
        output_json(j);
    } else {
        std::cout << *output << std::endl;
    }
    return 0;
}

} // anonymous namespace

void setup_convert(CLI::App* app, GlobalOptions& opts) {
    static ConvertOptions conv_opts;
    app->add_option("value", conv_opts.value, "Value to convert (or - for stdin)")->required();
    app->add_option("--to", conv_opts.to, "Target encoding")
        ->check(CLI::IsMember({"hex", "base64"}));
    app->callback([&opts]() {
        std::exit(cmd_convert(opts, conv_opts));
    });
}

} // namespace paycodec::cli::commands
