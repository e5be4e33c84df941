/**
 * paycodec CLI - Common utilities and types
 */

#pragma once

#include <paycodec/paycodec.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace paycodec::cli {

// Portable getenv that avoids MSVC warnings
inline std::string safe_getenv(const char* name) {
#ifdef _WIN32
    char* buf = nullptr;
    size_t sz = 0;
    if (_dupenv_s(&buf, &sz, name) == 0 && buf != nullptr) {
        std::string result(buf);
        free(buf);
        return result;
    }
    return "";
#else
    const char* val = std::getenv(name);
    return val ? val : "";
#endif
}

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    std::string config;            // --config
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
};

/**
 * Resolve the configuration file.
 * Priority: --config flag > PAYCODEC_CONFIG env > none (built-in defaults)
 */
inline std::optional<std::string> resolve_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return override_path;
    }

    std::string env_path = safe_getenv("PAYCODEC_CONFIG");
    if (!env_path.empty()) {
        return env_path;
    }

    return std::nullopt;
}

/**
 * Warning collector for accumulating warnings during command execution.
 * In JSON mode, warnings are collected and output at the end.
 * In text mode, warnings are printed immediately to stderr.
 */
struct WarningCollector {
    std::vector<std::string> warnings;
    bool json_mode = false;
    bool quiet = false;

    void add(const std::string& msg) {
        if (json_mode) {
            warnings.push_back(msg);
        } else if (!quiet) {
            std::cerr << "Warning: " << msg << std::endl;
        }
    }

    void clear() { warnings.clear(); }
    bool empty() const { return warnings.empty(); }

    nlohmann::json to_json() const {
        return nlohmann::json(warnings);
    }
};

inline WarningCollector& get_warning_collector() {
    static thread_local WarningCollector collector;
    return collector;
}

/**
 * Output utilities.
 */
inline void print_error(const std::string& msg, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        auto& collector = get_warning_collector();
        if (!collector.empty()) {
            j["warnings"] = collector.to_json();
        }
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

inline void print_warning(const std::string& msg) {
    get_warning_collector().add(msg);
}

inline void output_json(const nlohmann::json& j) {
    // Include any collected warnings in the output
    auto& collector = get_warning_collector();
    if (!collector.empty() && !j.contains("warnings")) {
        nlohmann::json output = j;
        output["warnings"] = collector.to_json();
        std::cout << output.dump(2) << std::endl;
    } else {
        std::cout << j.dump(2) << std::endl;
    }
}

inline void init_warning_collector(bool json_mode, bool quiet) {
    auto& collector = get_warning_collector();
    collector.clear();
    collector.json_mode = json_mode;
    collector.quiet = quiet;
}

/**
 * Everything a command needs: the effective configuration and the
 * registries extended with the user's definitions.
 */
struct Context {
    Config config;
    StaticTagRegistry tags;
    StaticFieldRegistry fields;
};

// Apply -v/-q over the configured log level
inline void configure_logging(const GlobalOptions& opts, const Config& config) {
    if (opts.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else if (opts.quiet) {
        spdlog::set_level(spdlog::level::err);
    } else {
        spdlog::set_level(spdlog::level::from_str(config.log_level));
    }
}

/**
 * Load configuration and registries. Prints the error and returns nullopt
 * when a named configuration file cannot be used.
 */
inline std::optional<Context> load_context(const GlobalOptions& opts) {
    init_warning_collector(opts.json, opts.quiet);

    Context ctx;
    ctx.config = get_builtin_config();

    if (auto path = resolve_config_path(opts.config)) {
        auto parsed = load_config_file(*path);
        if (!parsed.ok) {
            print_error("Invalid configuration " + *path + ": " + parsed.error, opts.json);
            return std::nullopt;
        }
        for (const auto& w : parsed.warnings) {
            print_warning(w);
        }
        ctx.config = parsed.config;
    }

    configure_logging(opts, ctx.config);

    ctx.tags = builtin_emv_tags();
    ctx.fields = builtin_iso8583_fields();
    for (const auto& w : apply_custom_tags(ctx.tags, ctx.config)) {
        print_warning(w);
    }
    for (const auto& w : apply_custom_fields(ctx.fields, ctx.config)) {
        print_warning(w);
    }

    spdlog::debug("loaded {} tags, {} fields", ctx.tags.size(), ctx.fields.size());
    return ctx;
}

/**
 * Read a positional argument, "-" meaning stdin.
 */
inline std::string read_argument(const std::string& value) {
    if (value != "-") return value;

    std::string content;
    std::string line;
    while (std::getline(std::cin, line)) {
        if (!content.empty()) content += "\n";
        content += line;
    }
    while (!content.empty() && (content.back() == '\r' || content.back() == '\n')) {
        content.pop_back();
    }
    return content;
}

} // namespace paycodec::cli
