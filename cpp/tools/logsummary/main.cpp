#include "../common/arg_parser.h"
#include <logmine/report.hpp>
#include <logmine/summarizer.hpp>
#include <logmine/utils.hpp>
#include <iostream>
#include <optional>
#include <string>

using namespace logtools;

struct ProgramOptions {
    std::string logfile;
    std::string keyword;
    std::string start;
    std::string end;
    std::string output;
    uint64_t top_n = 5;
};

// Parse an optional date bound; empty text means unbounded
static bool parse_bound(const std::string& name, const std::string& text,
                        std::optional<int64_t>& bound) {
    if (text.empty()) {
        return true;
    }

    bound = logmine::utils::parse_iso_datetime(text);
    if (!bound) {
        std::cerr << "Error: Invalid --" << name << " date: " << text
                  << " (expected YYYY-MM-DD or YYYY-MM-DD HH:MM:SS)\n";
        return false;
    }
    return true;
}

int main(int argc, char** argv) {
    ProgramOptions opts;

    ArgParser parser("logsummary - Summarize and extract key info from log files");

    parser.add_positional("logfile", opts.logfile,
                         "Path to the log file to analyze");

    parser.add_option("k", "keyword", opts.keyword,
                     "Only aggregate error lines containing this keyword");

    parser.add_option("", "start", opts.start,
                     "Start date (YYYY-MM-DD HH:MM:SS)");

    parser.add_option("", "end", opts.end,
                     "End date (YYYY-MM-DD HH:MM:SS)");

    parser.add_option("o", "output", opts.output,
                     "Path to save the summary (default: stdout)");

    parser.add_option("", "top", opts.top_n,
                     "Number of repeated error messages to list", static_cast<uint64_t>(5));

    if (!parser.parse(argc, argv)) {
        if (parser.should_show_help()) {
            parser.print_help();
            return 0;
        }
        std::cerr << "Error: " << parser.error() << "\n\n";
        parser.print_help(std::cerr);
        return 1;
    }

    logmine::SummaryFilter filter;
    filter.keyword = opts.keyword;
    if (!parse_bound("start", opts.start, filter.start) ||
        !parse_bound("end", opts.end, filter.end)) {
        return 1;
    }

    try {
        std::string report = logmine::summarize(opts.logfile, filter,
                                                static_cast<size_t>(opts.top_n));

        if (!opts.output.empty()) {
            logmine::write_report(report, opts.output);
            std::cout << "Summary written to " << opts.output << "\n";
        } else {
            std::cout << report;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
