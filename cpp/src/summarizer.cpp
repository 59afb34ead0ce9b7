#include "logmine/summarizer.hpp"
#include "logmine/report.hpp"
#include "logmine/utils.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <utility>

namespace logmine {

bool SummaryFilter::accepts(const ParsedLine& line) const {
    if (line.timestamp) {
        if (start && *line.timestamp < *start) {
            return false;
        }
        if (end && *line.timestamp > *end) {
            return false;
        }
    }

    if (!keyword.empty()) {
        std::string message_lower = utils::to_lower(line.message);
        if (message_lower.find(utils::to_lower(keyword)) == std::string::npos) {
            return false;
        }
    }

    return true;
}

std::string error_signature(const std::string& message) {
    std::vector<std::string> tokens = utils::split_whitespace(message);
    return utils::join(tokens, " ", 1, 8);
}

LogSummarizer::LogSummarizer(SummaryFilter filter, std::unique_ptr<FieldExtractor> extractor)
    : filter_(std::move(filter)),
      extractor_(std::move(extractor)) {
    if (!extractor_) {
        extractor_ = create_field_extractor("regex");
    }
}

void LogSummarizer::consume(const std::string& raw_line) {
    std::string line = utils::sanitize_utf8(raw_line);
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }

    ParsedLine parsed = extractor_->parse(line);

    // Totals, level counts and the time span ignore the filters
    aggregate_.total_lines++;
    aggregate_.level_counts.add(parsed.level);

    if (parsed.timestamp) {
        int64_t ts = *parsed.timestamp;
        if (!aggregate_.first_timestamp || ts < *aggregate_.first_timestamp) {
            aggregate_.first_timestamp = ts;
        }
        if (!aggregate_.last_timestamp || ts > *aggregate_.last_timestamp) {
            aggregate_.last_timestamp = ts;
        }
    }

    if (!filter_.accepts(parsed)) {
        return;
    }

    if (parsed.level == "ERROR" || parsed.level == "CRITICAL") {
        aggregate_.error_signatures.add(error_signature(parsed.message));
    }
}

namespace {

// Reads one line ended by "\n", "\r\n" or a lone "\r"
bool read_text_line(std::istream& in, std::string& line) {
    line.clear();
    bool got_any = false;
    char c;
    while (in.get(c)) {
        got_any = true;
        if (c == '\n') {
            return true;
        }
        if (c == '\r') {
            if (in.peek() == '\n') {
                in.get(c);
            }
            return true;
        }
        line.push_back(c);
    }
    return got_any;
}

} // namespace

uint64_t LogSummarizer::consume_stream(std::istream& in) {
    uint64_t consumed = 0;
    std::string line;
    while (read_text_line(in, line)) {
        consume(line);
        consumed++;
    }

    if (in.bad()) {
        throw std::runtime_error("Failed reading log input");
    }
    return consumed;
}

void LogSummarizer::reset() {
    aggregate_ = RunningAggregate();
}

RunningAggregate summarize_file(const std::string& path, const SummaryFilter& filter) {
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) {
        throw std::runtime_error("Log path is a directory: " + path);
    }

    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in.is_open()) {
        throw std::runtime_error("Cannot open log file for reading: " + path);
    }

    LogSummarizer summarizer(filter);
    try {
        summarizer.consume_stream(in);
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string(e.what()) + ": " + path);
    }

    return summarizer.aggregate();
}

std::string summarize(const std::string& path, const SummaryFilter& filter, size_t top_n) {
    return render_report(summarize_file(path, filter), path, top_n);
}

} // namespace logmine
