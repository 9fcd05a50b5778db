/**
 * @file nowcast_runner.cpp
 * @brief Command-line entry point for file-based reflectivity nowcasts.
 *
 * Reads timestamp-named .npy frames from an input directory, runs the
 * configured forecast, and writes forecast frames plus a JSON report.
 */

#include "logging.hpp"
#include "nowcast_runtime.hpp"
#include "runtime_config.hpp"
#include "string_utils.hpp"

#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

namespace {

/**
 * @brief Parsed command-line options for the runner.
 */
struct Options {
    nowcast::NowcastRunOptions run;
    bool quiet = false;
    bool debug = false;
};

/**
 * @brief Parse outcomes for command-line argument processing.
 */
enum class ParseArgsResult {
    Ok,
    Help,
    Error,
};

void print_usage() {
    std::cout << "Radar Nowcast Runner\n"
              << "Usage:\n"
              << "  bin/nowcast_runner [--config <yaml>] [--input <dir>] [--output <dir>]\n"
              << "      [--lead <seconds>[,<seconds>...]]... [--strategy basic|advanced]\n"
              << "      [--json <path>] [--quiet|--debug]\n";
}

bool append_lead_times(const std::string& value, std::vector<double>& out) {
    for (const std::string& item : nowcast::parse_string_list(value)) {
        double lead = 0.0;
        if (!nowcast::try_parse_double_value(item, lead) || lead <= 0.0) {
            std::cerr << "Invalid lead time: " << item << "\n";
            return false;
        }
        out.push_back(lead);
    }
    return true;
}

ParseArgsResult parse_args(int argc, char** argv, Options& out) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto require_value = [&](const std::string& option) -> const char* {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << option << "\n";
                return nullptr;
            }
            return argv[++i];
        };

        if (arg == "--help" || arg == "-h") {
            print_usage();
            return ParseArgsResult::Help;
        }
        if (arg == "--quiet") {
            out.quiet = true;
            continue;
        }
        if (arg == "--debug") {
            out.debug = true;
            continue;
        }
        if (arg == "--config" || arg == "--input" || arg == "--output" ||
            arg == "--strategy" || arg == "--json" || arg == "--lead") {
            const char* value = require_value(arg);
            if (value == nullptr) {
                return ParseArgsResult::Error;
            }
            if (arg == "--config") {
                out.run.config_path = value;
            } else if (arg == "--input") {
                out.run.input_dir = value;
            } else if (arg == "--output") {
                out.run.output_dir = value;
            } else if (arg == "--strategy") {
                out.run.strategy = value;
            } else if (arg == "--json") {
                out.run.json_path = value;
            } else if (!append_lead_times(value, out.run.lead_times_s)) {
                return ParseArgsResult::Error;
            }
            continue;
        }

        std::cerr << "Unknown argument: " << arg << "\n";
        return ParseArgsResult::Error;
    }

    if (out.quiet && out.debug) {
        std::cerr << "--quiet and --debug are mutually exclusive\n";
        return ParseArgsResult::Error;
    }
    return ParseArgsResult::Ok;
}

}

int main(int argc, char** argv) {
    Options options;
    const ParseArgsResult parse_result = parse_args(argc, argv, options);
    if (parse_result == ParseArgsResult::Help) {
        return 0;
    }
    if (parse_result == ParseArgsResult::Error) {
        return 1;
    }

    const char* debug_env = std::getenv("NOWCAST_DEBUG");
    if (debug_env != nullptr && nowcast::strutil::parse_bool(debug_env)) {
        options.debug = true;
        options.quiet = false;
    }
    if (options.debug) {
        options.run.log_profile = "debug";
    } else if (options.quiet) {
        options.run.log_profile = "quiet";
    }
    if (!options.run.log_profile.empty()) {
        nowcast::global_log_profile = nowcast::parse_log_profile(options.run.log_profile);
    }

    try {
        return nowcast::run_nowcast(options.run);
    } catch (const std::exception& e) {
        std::cerr << "nowcast_runner: " << e.what() << "\n";
        return 1;
    }
}
