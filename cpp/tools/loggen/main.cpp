#include "../common/arg_parser.h"
#include <logmine/generator.hpp>
#include <logmine/utils.hpp>
#include <iostream>
#include <string>

using namespace logtools;

struct ProgramOptions {
    uint64_t count = 500;
    std::string out_path = "./firewall_sample.log";
    uint64_t seed = 0;
    std::string start;
    double burstiness = 0.2;
};

int main(int argc, char** argv) {
    ProgramOptions opts;

    ArgParser parser("loggen - Generate firewall-style syslog logs");

    parser.add_option("n", "count", opts.count,
                     "Number of log lines to generate", static_cast<uint64_t>(500));

    parser.add_option("o", "out", opts.out_path,
                     "Output file path", false, "./firewall_sample.log");

    parser.add_option("s", "seed", opts.seed,
                     "Random seed for reproducible output (default: clock)");

    parser.add_option("", "start", opts.start,
                     "Start timestamp, YYYY-MM-DD[ HH:MM:SS] UTC (default: now)");

    parser.add_option("", "burstiness", opts.burstiness,
                     "Burstiness factor 0.0 - 1.0 (accepted, currently no effect)", 0.2);

    if (!parser.parse(argc, argv)) {
        if (parser.should_show_help()) {
            parser.print_help();
            return 0;
        }
        std::cerr << "Error: " << parser.error() << "\n\n";
        parser.print_help(std::cerr);
        return 1;
    }

    logmine::GeneratorConfig config;
    config.count = opts.count;
    config.burstiness = opts.burstiness;

    if (parser.was_set("seed")) {
        config.seed = opts.seed;
    }

    if (!opts.start.empty()) {
        auto start_seconds = logmine::utils::parse_iso_datetime(opts.start);
        if (!start_seconds || *start_seconds <= 0) {
            std::cerr << "Error: Invalid start timestamp: " << opts.start << "\n";
            return 1;
        }
        auto start_ns = logmine::utils::seconds_to_ns(*start_seconds);
        if (!start_ns) {
            std::cerr << "Error: Start timestamp is past "
                      << logmine::utils::format_iso_datetime(
                             static_cast<int64_t>(logmine::utils::MAX_TIMESTAMP_SECONDS))
                      << ": " << opts.start << "\n";
            return 1;
        }
        config.start_timestamp_ns = *start_ns;
    }

    if (parser.was_set("burstiness")) {
        std::cerr << "Warning: --burstiness is accepted but does not change the timing model\n";
    }

    try {
        uint64_t written = logmine::generate_log_file(config, opts.out_path);
        std::cout << "Wrote " << written << " log lines to: " << opts.out_path << "\n";
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
