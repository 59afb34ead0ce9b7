#include "logmine/extractor.hpp"
#include "logmine/utils.hpp"
#include <stdexcept>

namespace logmine {

RegexFieldExtractor::RegexFieldExtractor()
    : timestamp_pattern_(R"(\b(\d{4}-\d{2}-\d{2}[ T]\d{2}:\d{2}:\d{2})\b)"),
      level_pattern_(R"(\b(INFO|WARN|WARNING|ERROR|DEBUG|CRITICAL)\b)") {
}

ParsedLine RegexFieldExtractor::parse(const std::string& line) const {
    ParsedLine parsed;

    std::smatch match;
    if (std::regex_search(line, match, timestamp_pattern_)) {
        // Out-of-range dates such as 2024-13-40 count as no timestamp
        parsed.timestamp = utils::parse_iso_datetime(match[1].str());
    }

    if (std::regex_search(line, match, level_pattern_)) {
        parsed.level = match[1].str();
    } else {
        parsed.level = "UNKNOWN";
    }

    parsed.message = utils::trim(line);
    return parsed;
}

std::unique_ptr<FieldExtractor> create_field_extractor(const std::string& extractor_type) {
    std::string type_lower = utils::to_lower(extractor_type);

    if (type_lower == "regex") {
        return std::make_unique<RegexFieldExtractor>();
    }

    throw std::runtime_error("Unknown extractor type: " + extractor_type);
}

} // namespace logmine
