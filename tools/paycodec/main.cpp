/**
 * paycodec CLI - Entry Point
 *
 * EMV BER-TLV and ISO 8583 command-line toolkit.
 */

#include <CLI/CLI.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include "common.hpp"

// Forward declarations for commands
namespace paycodec::cli::commands {
    void setup_tlv(CLI::App* app, GlobalOptions& opts);
    void setup_iso(CLI::App* app, GlobalOptions& opts);
    void setup_registry(CLI::App* app, GlobalOptions& opts);
    void setup_convert(CLI::App* app, GlobalOptions& opts);
    void setup_bits(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace paycodec::cli;

    // Diagnostics go to stderr so --json output stays parseable
    spdlog::set_default_logger(spdlog::stderr_color_mt("paycodec"));
    spdlog::set_level(spdlog::level::warn);

    CLI::App app{"paycodec - EMV TLV and ISO 8583 toolkit"};
    app.set_version_flag("-V,--version", PAYCODEC_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_option("--config", opts.config, "Configuration file (JSON)");
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Debug logging");
    app.add_flag("-q,--quiet", opts.quiet, "Minimal output");

    // Commands
    auto* tlv_cmd = app.add_subcommand("tlv", "Decode, edit and compare BER-TLV data");
    commands::setup_tlv(tlv_cmd, opts);

    auto* iso_cmd = app.add_subcommand("iso", "Decode ISO 8583 messages");
    commands::setup_iso(iso_cmd, opts);

    auto* registry_cmd = app.add_subcommand("registry", "List tag and field dictionaries");
    commands::setup_registry(registry_cmd, opts);

    auto* convert_cmd = app.add_subcommand("convert", "Convert between hex and Base64");
    commands::setup_convert(convert_cmd, opts);

    auto* bits_cmd = app.add_subcommand("bits", "Inspect and flip bits of a hex value");
    commands::setup_bits(bits_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
