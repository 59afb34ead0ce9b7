#ifndef LOGMINE_SUMMARIZER_HPP
#define LOGMINE_SUMMARIZER_HPP

#include "extractor.hpp"
#include "frequency_table.hpp"
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <cstdint>

namespace logmine {

/**
 * Filters applied to error-signature aggregation only
 *
 * Bounds are inclusive; lines without a timestamp pass the date window.
 */
struct SummaryFilter {
    std::string keyword;            // case-insensitive substring, empty = any
    std::optional<int64_t> start;   // seconds since Unix epoch
    std::optional<int64_t> end;

    bool accepts(const ParsedLine& line) const;
};

/**
 * State accumulated over one summarization pass
 */
struct RunningAggregate {
    FrequencyTable level_counts;       // every line, unfiltered
    FrequencyTable error_signatures;   // filtered ERROR/CRITICAL lines
    std::optional<int64_t> first_timestamp;
    std::optional<int64_t> last_timestamp;
    uint64_t total_lines = 0;
};

/**
 * Short grouping key for an error message
 *
 * Drops the first whitespace-separated token and joins up to the next
 * seven with single spaces.
 */
std::string error_signature(const std::string& message);

/**
 * Single-pass streaming log summarizer
 */
class LogSummarizer {
public:
    explicit LogSummarizer(SummaryFilter filter = SummaryFilter(),
                           std::unique_ptr<FieldExtractor> extractor = nullptr);

    LogSummarizer(const LogSummarizer&) = delete;
    LogSummarizer& operator=(const LogSummarizer&) = delete;

    /**
     * Fold one raw input line into the aggregate
     */
    void consume(const std::string& raw_line);

    /**
     * Consume every line of a stream
     *
     * Lines end at "\n", "\r\n" or a lone "\r".
     *
     * @return Number of lines consumed
     */
    uint64_t consume_stream(std::istream& in);

    const RunningAggregate& aggregate() const { return aggregate_; }
    const SummaryFilter& filter() const { return filter_; }

    void reset();

private:
    SummaryFilter filter_;
    std::unique_ptr<FieldExtractor> extractor_;
    RunningAggregate aggregate_;
};

/**
 * Summarize a log file
 *
 * @throws std::runtime_error if the file cannot be opened or read
 */
RunningAggregate summarize_file(const std::string& path,
                                const SummaryFilter& filter = SummaryFilter());

/**
 * Summarize a log file and render the report text
 */
std::string summarize(const std::string& path,
                      const SummaryFilter& filter = SummaryFilter(),
                      size_t top_n = 5);

} // namespace logmine

#endif // LOGMINE_SUMMARIZER_HPP
