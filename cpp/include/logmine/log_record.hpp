#ifndef LOGMINE_LOG_RECORD_HPP
#define LOGMINE_LOG_RECORD_HPP

#include <string>
#include <cstdint>

namespace logmine {

/**
 * Synthetic firewall log record
 *
 * Built per draw, serialized to one line and discarded.
 */
struct LogRecord {
    uint64_t timestamp;         // Unix epoch timestamp in nanoseconds
    std::string host;
    std::string daemon;
    uint32_t process_id = 0;

    std::string facility;
    std::string severity;
    uint32_t rule_id = 0;
    std::string reason;

    std::string protocol;
    uint32_t source_ip = 0;       // IPv4 address in host byte order
    uint32_t destination_ip = 0;  // IPv4 address in host byte order
    uint16_t source_port = 0;
    uint16_t destination_port = 0;
    std::string in_interface;
    std::string out_interface;

    std::string action;
    uint32_t bytes = 0;
    uint32_t packets = 0;
    std::string correlation_id;  // 8 lowercase hex digits

    LogRecord() : timestamp(0) {}

    std::string source_ip_str() const;
    std::string destination_ip_str() const;

    /**
     * Structured message body with control characters stripped
     */
    std::string message() const;

    /**
     * Full syslog line, without a line terminator
     */
    std::string to_line() const;
};

} // namespace logmine

#endif // LOGMINE_LOG_RECORD_HPP
