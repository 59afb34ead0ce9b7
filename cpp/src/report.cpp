#include "logmine/report.hpp"
#include "logmine/utils.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace logmine {

std::string render_report(const RunningAggregate& aggregate, const std::string& source,
                          size_t top_n) {
    std::ostringstream out;

    out << "===== LOG SUMMARY =====\n";
    out << "File: " << source << "\n";

    if (aggregate.first_timestamp && aggregate.last_timestamp) {
        out << "Time span: " << utils::format_iso_datetime(*aggregate.first_timestamp)
            << " → " << utils::format_iso_datetime(*aggregate.last_timestamp) << "\n";
    } else {
        out << "Time span: N/A\n";
    }

    out << "Total lines processed: " << aggregate.total_lines << "\n";
    out << "\n";

    out << "Log Level Counts:\n";
    for (const auto& entry : aggregate.level_counts.entries()) {
        out << "  " << entry.first << ": " << entry.second << "\n";
    }

    out << "\n";
    out << "Top " << top_n << " Repeated Error Messages:\n";
    for (const auto& entry : aggregate.error_signatures.most_common(top_n)) {
        out << "  (" << entry.second << "x) " << entry.first << "\n";
    }

    return out.str();
}

void write_report(const std::string& text, const std::string& path) {
    std::ofstream out(path, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!out.is_open()) {
        throw std::runtime_error("Cannot open report file for writing: " + path);
    }

    out << text;
    out.close();
    if (out.fail()) {
        throw std::runtime_error("Failed writing report file: " + path);
    }
}

} // namespace logmine
