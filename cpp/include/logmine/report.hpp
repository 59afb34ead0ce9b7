#ifndef LOGMINE_REPORT_HPP
#define LOGMINE_REPORT_HPP

#include "summarizer.hpp"
#include <string>

namespace logmine {

/**
 * Render the summary report
 *
 * Pure function of its inputs: rendering the same aggregate twice gives
 * byte-identical text. Lines are "\n" separated and the text ends with "\n".
 *
 * @param aggregate Aggregated state of one pass
 * @param source Input path shown in the header
 * @param top_n Maximum number of error signatures listed
 */
std::string render_report(const RunningAggregate& aggregate, const std::string& source,
                          size_t top_n = 5);

/**
 * Write rendered report text to a file
 *
 * @throws std::runtime_error if the file cannot be opened or written
 */
void write_report(const std::string& text, const std::string& path);

} // namespace logmine

#endif // LOGMINE_REPORT_HPP
