#include "logmine/generator.hpp"
#include "logmine/address_space.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace logmine {

// GeneratorConfig validation
bool GeneratorConfig::validate(std::string* error) const {
    if (!(mean_interval_seconds > 0.0) || !std::isfinite(mean_interval_seconds)) {
        if (error) *error = "mean_interval_seconds must be a positive number";
        return false;
    }

    if (source_private_bias < 0.0 || source_private_bias > 1.0) {
        if (error) *error = "source_private_bias must be between 0.0 and 1.0";
        return false;
    }

    if (destination_private_bias < 0.0 || destination_private_bias > 1.0) {
        if (error) *error = "destination_private_bias must be between 0.0 and 1.0";
        return false;
    }

    if (burstiness < 0.0 || burstiness > 1.0) {
        if (error) *error = "burstiness must be between 0.0 and 1.0";
        return false;
    }

    if (start_timestamp_ns > utils::MAX_TIMESTAMP_SECONDS * 1000000000ULL) {
        if (error) *error = "start_timestamp_ns is past the last representable second";
        return false;
    }

    return true;
}

// LogGenerator implementation
LogGenerator::LogGenerator(LogModel model)
    : initialized_(false),
      model_(std::move(model)),
      rng_(0),
      effective_seed_(0),
      start_timestamp_ns_(0),
      current_timestamp_ns_(0),
      process_id_(0) {
}

LogGenerator::~LogGenerator() = default;

bool LogGenerator::initialize(const GeneratorConfig& config, std::string* error) {
    if (!config.validate(error)) {
        return false;
    }

    if (!model_.validate(error)) {
        return false;
    }

    config_ = config;

    // Remember the seed so an unseeded run can still be replayed
    effective_seed_ = config_.seed ? *config_.seed : utils::clock_seed();

    if (config_.start_timestamp_ns > 0) {
        start_timestamp_ns_ = config_.start_timestamp_ns;
    } else {
        start_timestamp_ns_ = utils::now_ns();
    }

    start_run();
    initialized_ = true;
    return true;
}

void LogGenerator::start_run() {
    rng_.seed(effective_seed_);
    current_timestamp_ns_ = start_timestamp_ns_;

    // One process id for the whole run
    process_id_ = static_cast<uint32_t>(
        rng_.randint(model_.min_process_id, model_.max_process_id));
}

void LogGenerator::reset() {
    if (initialized_) {
        start_run();
    }
}

void LogGenerator::advance_clock() {
    double interval_sec = rng_.exponential(1.0 / config_.mean_interval_seconds);
    double interval_ns = std::round(interval_sec * 1e9);

    uint64_t headroom = UINT64_MAX - current_timestamp_ns_;
    if (interval_ns >= static_cast<double>(headroom)) {
        throw std::overflow_error("Log clock overflowed the 64-bit nanosecond timestamp");
    }

    // Strictly increasing even when the draw rounds to zero
    uint64_t step = interval_ns < 1.0 ? 1 : static_cast<uint64_t>(interval_ns);
    if (step > headroom) {
        throw std::overflow_error("Log clock overflowed the 64-bit nanosecond timestamp");
    }
    current_timestamp_ns_ += step;
}

uint32_t LogGenerator::draw_packets(uint32_t bytes) {
    if (bytes == 0) {
        return static_cast<uint32_t>(rng_.randint(0, 4));
    }
    uint32_t divisor = static_cast<uint32_t>(rng_.randint(60, 120));
    return std::max<uint32_t>(1, bytes / divisor);
}

std::string LogGenerator::draw_correlation_id() {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0') << std::setw(8) << rng_.rand32();
    return oss.str();
}

void LogGenerator::next(LogRecord& record) {
    if (!initialized_) {
        throw std::runtime_error("LogGenerator::next called before initialize");
    }

    advance_clock();

    record.timestamp = current_timestamp_ns_;
    record.host = model_.host;
    record.daemon = model_.daemon;
    record.facility = model_.facility;
    record.process_id = process_id_;

    record.severity = utils::weighted_choice(rng_, model_.severities);
    record.protocol = utils::choice(rng_, model_.protocols);
    record.source_ip = random_ipv4(rng_, config_.source_private_bias);
    record.destination_ip = random_ipv4(rng_, config_.destination_private_bias);

    bool ported = model_.carries_ports(record.protocol);
    record.source_port = ported ? static_cast<uint16_t>(rng_.randint(1, 65535)) : 0;
    record.destination_port = ported ? utils::choice(rng_, model_.service_ports) : 0;

    record.in_interface = utils::choice(rng_, model_.interfaces);
    record.out_interface = utils::choice(rng_, model_.interfaces);
    record.action = utils::weighted_choice(rng_, model_.actions);

    record.bytes = static_cast<uint32_t>(rng_.randint(0, model_.max_bytes));
    record.packets = draw_packets(record.bytes);
    record.rule_id = static_cast<uint32_t>(rng_.randint(model_.min_rule_id, model_.max_rule_id));
    record.correlation_id = draw_correlation_id();

    record.reason = utils::choice(rng_, model_.reasons_for(record.severity));
}

std::string LogGenerator::next_line() {
    LogRecord record;
    next(record);
    return record.to_line();
}

uint64_t write_logs(LogGenerator& generator, std::ostream& out, uint64_t count) {
    uint64_t written = 0;
    for (; written < count; ++written) {
        out << generator.next_line() << '\n';
        if (!out) {
            throw std::runtime_error("Failed writing log line " + std::to_string(written + 1));
        }
    }
    out.flush();
    if (!out) {
        throw std::runtime_error("Failed flushing log output");
    }
    return written;
}

uint64_t generate_log_file(const GeneratorConfig& config, const std::string& path,
                           const LogModel& model) {
    LogGenerator generator(model);

    std::string error;
    if (!generator.initialize(config, &error)) {
        throw std::runtime_error("Invalid generator configuration: " + error);
    }

    std::ofstream out(path, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!out.is_open()) {
        throw std::runtime_error("Cannot open output file for writing: " + path);
    }

    try {
        uint64_t written = write_logs(generator, out, config.count);
        out.close();
        if (out.fail()) {
            throw std::runtime_error("Failed closing output file");
        }
        return written;
    } catch (const std::exception& e) {
        out.close();
        std::error_code ec;
        std::filesystem::remove(path, ec);
        throw std::runtime_error(std::string(e.what()) + ": " + path);
    }
}

} // namespace logmine
