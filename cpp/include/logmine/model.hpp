#ifndef LOGMINE_MODEL_HPP
#define LOGMINE_MODEL_HPP

#include "utils.hpp"
#include <string>
#include <vector>
#include <cstdint>

namespace logmine {

/**
 * Reason phrases shared by a group of severities
 */
struct ReasonPool {
    std::vector<std::string> severities;
    std::vector<std::string> reasons;
};

/**
 * Statistical model of a synthetic security-appliance log stream
 *
 * Immutable once handed to a generator. Swap in alternate tables to
 * produce a different stream shape.
 */
struct LogModel {
    utils::WeightTable severities;
    utils::WeightTable actions;

    std::vector<std::string> protocols;
    std::vector<std::string> port_protocols;  // protocols that carry ports
    std::vector<uint16_t> service_ports;
    std::vector<std::string> interfaces;
    std::vector<ReasonPool> reason_pools;

    // Syslog header and message tag
    std::string host;
    std::string daemon;
    std::string facility;

    int min_process_id = 1000;
    int max_process_id = 9999;

    int min_rule_id = 100;
    int max_rule_id = 3999;
    int max_bytes = 15000;

    /**
     * Firewall appliance defaults
     */
    static LogModel firewall();

    /**
     * Validate model tables
     */
    bool validate(std::string* error = nullptr) const;

    /**
     * Reason pool for a severity; the last pool when none lists it
     */
    const std::vector<std::string>& reasons_for(const std::string& severity) const;

    bool carries_ports(const std::string& protocol) const;
};

} // namespace logmine

#endif // LOGMINE_MODEL_HPP
