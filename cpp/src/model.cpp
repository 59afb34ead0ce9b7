#include "logmine/model.hpp"
#include <algorithm>
#include <cmath>

namespace logmine {

namespace {

bool check_weights(const utils::WeightTable& table, const std::string& name,
                   std::string* error) {
    if (table.empty()) {
        if (error) *error = name + " table cannot be empty";
        return false;
    }

    double total = 0.0;
    for (const auto& entry : table) {
        if (entry.second < 0.0) {
            if (error) *error = name + " weight for " + entry.first + " is negative";
            return false;
        }
        total += entry.second;
    }

    if (std::abs(total - 1.0) > 1e-6) {
        if (error) {
            *error = name + " weights must sum to 1.0, got " + std::to_string(total);
        }
        return false;
    }

    return true;
}

} // namespace

LogModel LogModel::firewall() {
    LogModel model;

    model.severities = {
        {"INFO", 0.70},
        {"NOTICE", 0.10},
        {"WARNING", 0.12},
        {"ERROR", 0.06},
        {"CRITICAL", 0.02}
    };

    model.actions = {
        {"ACCEPT", 0.6},
        {"DROP", 0.3},
        {"REJECT", 0.1}
    };

    model.protocols = {"TCP", "UDP", "ICMP", "GRE", "ESP"};
    model.port_protocols = {"TCP", "UDP"};
    model.service_ports = {22, 80, 443, 53, 8080, 3389, 5000, 514, 3306, 1433};
    model.interfaces = {"eth0", "eth1", "wan0", "lan0", "dmz0"};

    model.reason_pools = {
        {{"INFO", "NOTICE"},
         {"Connection established", "Connection closed", "NAT translation success",
          "Policy matched", "Session aged out", "Health check passed"}},
        {{"WARNING"},
         {"Suspicious connection rate", "Unexpected packet", "Possible policy mismatch",
          "Malformed packet", "IP spoofing suspected"}},
        {{"ERROR", "CRITICAL"},
         {"Policy violation", "Intrusion detected", "Configuration error",
          "Resource exhausted", "Authentication failure", "Firewall rule conflict"}}
    };

    model.host = "fw01.corp.example.com";
    model.daemon = "firewall";
    model.facility = "FW";

    return model;
}

bool LogModel::validate(std::string* error) const {
    if (!check_weights(severities, "severity", error)) {
        return false;
    }

    if (!check_weights(actions, "action", error)) {
        return false;
    }

    if (protocols.empty()) {
        if (error) *error = "protocols cannot be empty";
        return false;
    }

    if (service_ports.empty()) {
        if (error) *error = "service_ports cannot be empty";
        return false;
    }

    if (interfaces.empty()) {
        if (error) *error = "interfaces cannot be empty";
        return false;
    }

    if (reason_pools.empty()) {
        if (error) *error = "reason_pools cannot be empty";
        return false;
    }

    for (const auto& pool : reason_pools) {
        if (pool.reasons.empty()) {
            if (error) *error = "reason pool cannot be empty";
            return false;
        }
    }

    if (host.empty() || daemon.empty()) {
        if (error) *error = "host and daemon cannot be empty";
        return false;
    }

    // Header fields are written verbatim and must not break the line
    if (utils::contains_control_chars(host) || utils::contains_control_chars(daemon) ||
        utils::contains_control_chars(facility)) {
        if (error) *error = "host, daemon and facility cannot contain control characters";
        return false;
    }

    if (min_process_id > max_process_id || min_rule_id > max_rule_id || max_bytes < 0) {
        if (error) *error = "invalid numeric range";
        return false;
    }

    return true;
}

const std::vector<std::string>& LogModel::reasons_for(const std::string& severity) const {
    for (const auto& pool : reason_pools) {
        if (std::find(pool.severities.begin(), pool.severities.end(), severity) !=
            pool.severities.end()) {
            return pool.reasons;
        }
    }
    return reason_pools.back().reasons;
}

bool LogModel::carries_ports(const std::string& protocol) const {
    return std::find(port_protocols.begin(), port_protocols.end(), protocol) !=
           port_protocols.end();
}

} // namespace logmine
