/**
 * argenv CLI - Common utilities
 */

#pragma once

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include <argenv/bindings.hpp>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace argenv::cli {

inline std::string safe_getenv(const char* name) {
    const char* val = std::getenv(name);
    return val ? val : "";
}

/**
 * argenv's own options (everything before the first "--").
 */
struct CliOptions {
    std::string json;              // --json
    std::string json_file;         // --json-file
    bool add_self_to_env = false;  // --add-self-to-env
    bool print_env = false;        // --print-env
    bool verbose = false;          // -v, --verbose
};

/**
 * Logging level from --verbose and ARGENV_LOG_LEVEL.
 * Precedence: ARGENV_LOG_LEVEL > --verbose (debug) > warn. An unrecognised
 * level name is ignored rather than treated as "off".
 */
inline spdlog::level::level_enum resolve_log_level(bool verbose, const std::string& env_level) {
    auto level = verbose ? spdlog::level::debug : spdlog::level::warn;
    if (env_level.empty()) {
        return level;
    }
    auto parsed = spdlog::level::from_str(env_level);
    if (parsed == spdlog::level::off && env_level != "off") {
        return level;
    }
    return parsed;
}

// Install the stderr logger
inline void setup_logging(bool verbose) {
    auto logger = spdlog::stderr_color_mt("argenv");
    logger->set_pattern("[%n] %^%l%$: %v");
    spdlog::set_default_logger(logger);

    std::string env_level = safe_getenv("ARGENV_LOG_LEVEL");
    spdlog::set_level(resolve_log_level(verbose, env_level));
    if (!env_level.empty() && env_level != "off" &&
        spdlog::level::from_str(env_level) == spdlog::level::off) {
        spdlog::warn("ignoring unknown ARGENV_LOG_LEVEL '{}'", env_level);
    }
}

/**
 * argv split at the first literal "--". own_argc counts argv[0] and every
 * argument before the separator; trailing holds everything after it.
 */
struct SplitArgs {
    int own_argc = 0;
    std::vector<std::string> trailing;
};

inline SplitArgs split_at_separator(int argc, const char* const* argv) {
    SplitArgs split;
    split.own_argc = argc;
    for (int i = 1; i < argc; ++i) {
        if (std::string(argv[i]) == "--") {
            split.own_argc = i;
            split.trailing.assign(argv + i + 1, argv + argc);
            break;
        }
    }
    return split;
}

// --print-env output: one NAME=value line per binding, sorted by name
inline void write_env_lines(std::ostream& out, const Bindings& bindings) {
    for (const auto& [name, value] : bindings.entries()) {
        out << name << "=" << value << "\n";
    }
}

inline std::optional<std::string> read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

/**
 * Output utilities.
 */
inline void print_error(const std::string& msg) {
    std::cerr << "Error: " << msg << std::endl;
}

// Usage errors get the failing command's usage line and a help hint
inline void print_usage_error(const std::string& msg, const std::string& usage) {
    std::cerr << "Error: " << msg << "\n\n"
              << usage << "\n\n"
              << "For more information, try '--help'." << std::endl;
}

} // namespace argenv::cli
