#include "logmine/log_record.hpp"
#include "logmine/utils.hpp"
#include <sstream>

namespace logmine {

std::string LogRecord::source_ip_str() const {
    return utils::uint32_to_ip_str(source_ip);
}

std::string LogRecord::destination_ip_str() const {
    return utils::uint32_to_ip_str(destination_ip);
}

std::string LogRecord::message() const {
    std::ostringstream oss;
    oss << "%" << facility << "-" << severity << "-*." << rule_id << ": "
        << reason << "; "
        << "src=" << source_ip_str() << " "
        << "dst=" << destination_ip_str() << " "
        << "proto=" << protocol << " "
        << "spt=" << source_port << " "
        << "dpt=" << destination_port << " "
        << "action=" << action << " "
        << "bytes=" << bytes << " "
        << "pkts=" << packets << " "
        << "rule=" << rule_id << " "
        << "in=" << in_interface << " "
        << "out=" << out_interface << " "
        << "uid=" << correlation_id;
    return utils::strip_control_chars(oss.str());
}

std::string LogRecord::to_line() const {
    std::ostringstream oss;
    oss << utils::format_syslog_timestamp(timestamp) << " "
        << host << " "
        << daemon << "[" << process_id << "]: "
        << message();
    return utils::rtrim(oss.str());
}

} // namespace logmine
