/**
 * paycodec CLI - bits command
 *
 * Inspect and flip individual bits of a hex value, e.g. 9F33 terminal
 * capabilities or 95 TVR.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

#include <sstream>

namespace paycodec::cli::commands {

namespace {

struct BitsOptions {
    std::string value;
    std::vector<size_t> set;
    std::vector<size_t> clear;
    std::vector<size_t> toggle;
};

// Bit numbers on the command line are 1-based
bool apply_bits(std::vector<uint8_t>& bytes, const std::vector<size_t>& bits, int mode,
                bool json_mode) {
    for (size_t bit : bits) {
        if (bit == 0) {
            print_error("Bit numbers start at 1", json_mode);
            return false;
        }
        std::optional<std::vector<uint8_t>> updated;
        switch (mode) {
            case 0: updated = set_bit(bytes, bit - 1, true); break;
            case 1: updated = set_bit(bytes, bit - 1, false); break;
            default: updated = toggle_bit(bytes, bit - 1); break;
        }
        if (!updated) {
            print_error("Bit " + std::to_string(bit) + " is beyond the value", json_mode);
            return false;
        }
        bytes = std::move(*updated);
    }
    return true;
}

int cmd_bits(const GlobalOptions& opts, const BitsOptions& bits_opts) {
    init_warning_collector(opts.json, opts.quiet);

    auto bytes = hex_to_bytes(normalize_hex(bits_opts.value));
    if (!bytes) {
        print_error("Value is not valid hex", opts.json);
        return 1;
    }

    if (!apply_bits(*bytes, bits_opts.set, 0, opts.json)) return 1;
    if (!apply_bits(*bytes, bits_opts.clear, 1, opts.json)) return 1;
    if (!apply_bits(*bytes, bits_opts.toggle, 2, opts.json)) return 1;

    std::vector<size_t> numbers;
    for (size_t index : set_bit_positions(*bytes)) {
        numbers.push_back(index + 1);
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["value"] = bytes_to_hex(*bytes);
        j["set_bits"] = numbers;
        output_json(j);
        return 0;
    }

    std::cout << "Value: " << bytes_to_hex(*bytes) << std::endl;
    for (size_t i = 0; i < bytes->size(); ++i) {
        std::ostringstream line;
        line << "  Byte " << (i + 1) << ": ";
        for (size_t b = 0; b < 8; ++b) {
            line << (get_bit(*bytes, i * 8 + b) ? '1' : '0');
        }
        std::cout << line.str() << std::endl;
    }
    return 0;
}

} // anonymous namespace

void setup_bits(CLI::App* app, GlobalOptions& opts) {
    static BitsOptions bits_opts;
    app->add_option("value", bits_opts.value, "Value as hex")->required();
    app->add_option("--set", bits_opts.set, "Bit numbers to set (1 = MSB of first byte)")->delimiter(',');
    app->add_option("--clear", bits_opts.clear, "Bit numbers to clear")->delimiter(',');
    app->add_option("--toggle", bits_opts.toggle, "Bit numbers to flip")->delimiter(',');
    app->callback([&opts]() {
        std::exit(cmd_bits(opts, bits_opts));
    });
}

} // namespace paycodec::cli::commands
