#ifndef LOGMINE_EXTRACTOR_HPP
#define LOGMINE_EXTRACTOR_HPP

#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <cstdint>

namespace logmine {

/**
 * Fields pulled out of a single input line
 */
struct ParsedLine {
    std::optional<int64_t> timestamp;  // seconds since Unix epoch
    std::string level;                 // UNKNOWN when no level token matched
    std::string message;               // line with surrounding whitespace trimmed
};

/**
 * Base class for line field extractors
 */
class FieldExtractor {
public:
    virtual ~FieldExtractor() = default;

    /**
     * Extract timestamp, level and message from a line
     */
    virtual ParsedLine parse(const std::string& line) const = 0;

    /**
     * Get extractor type name
     */
    virtual std::string type() const = 0;
};

/**
 * Pattern-matching extractor
 *
 * Timestamp: first "YYYY-MM-DD HH:MM:SS" (or with 'T') on a word boundary.
 * Level: first whole-word INFO, WARN, WARNING, ERROR, DEBUG or CRITICAL.
 */
class RegexFieldExtractor : public FieldExtractor {
public:
    RegexFieldExtractor();

    ParsedLine parse(const std::string& line) const override;

    std::string type() const override { return "regex"; }

private:
    std::regex timestamp_pattern_;
    std::regex level_pattern_;
};

/**
 * Factory function to create field extractors
 */
std::unique_ptr<FieldExtractor> create_field_extractor(const std::string& extractor_type);

} // namespace logmine

#endif // LOGMINE_EXTRACTOR_HPP
