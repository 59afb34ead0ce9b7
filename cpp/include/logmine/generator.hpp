#ifndef LOGMINE_GENERATOR_HPP
#define LOGMINE_GENERATOR_HPP

#include "log_record.hpp"
#include "model.hpp"
#include "utils.hpp"
#include <optional>
#include <ostream>
#include <string>

namespace logmine {

/**
 * Configuration for log generation
 */
struct GeneratorConfig {
    uint64_t count = 500;

    // Timestamp (nanoseconds since Unix epoch), 0 means now
    uint64_t start_timestamp_ns = 0;

    // Same seed, count and start timestamp give byte-identical output
    std::optional<uint64_t> seed;

    // Mean of the exponential inter-arrival time
    double mean_interval_seconds = 1.2;

    // Probability of drawing from the reserved address blocks
    double source_private_bias = 0.6;
    double destination_private_bias = 0.3;

    // Accepted for compatibility; does not affect the timing model
    double burstiness = 0.2;

    /**
     * Validate configuration
     */
    bool validate(std::string* error = nullptr) const;
};

/**
 * Synthetic firewall log generator
 *
 * Produces records on demand from a LogModel. Each generator owns its
 * random stream, so independent generators never interfere.
 */
class LogGenerator {
public:
    explicit LogGenerator(LogModel model = LogModel::firewall());
    ~LogGenerator();

    LogGenerator(const LogGenerator&) = delete;
    LogGenerator& operator=(const LogGenerator&) = delete;

    /**
     * Initialize generator with configuration
     *
     * Seeds the random stream and draws the per-run process id.
     */
    bool initialize(const GeneratorConfig& config, std::string* error = nullptr);

    /**
     * Advance the clock and draw the next record
     */
    void next(LogRecord& record);

    /**
     * Draw the next record and serialize it
     */
    std::string next_line();

    /**
     * Rewind to the start timestamp and replay the same random stream
     */
    void reset();

    bool initialized() const { return initialized_; }
    const GeneratorConfig& config() const { return config_; }
    const LogModel& model() const { return model_; }

    uint64_t current_timestamp_ns() const { return current_timestamp_ns_; }
    uint32_t process_id() const { return process_id_; }
    uint64_t effective_seed() const { return effective_seed_; }

private:
    bool initialized_;
    GeneratorConfig config_;
    LogModel model_;
    utils::Random rng_;

    uint64_t effective_seed_;
    uint64_t start_timestamp_ns_;
    uint64_t current_timestamp_ns_;
    uint32_t process_id_;

    void start_run();
    void advance_clock();
    uint32_t draw_packets(uint32_t bytes);
    std::string draw_correlation_id();
};

/**
 * Write count lines ("\n" terminated) to the stream
 *
 * @return Number of lines written
 * @throws std::runtime_error if the stream fails
 */
uint64_t write_logs(LogGenerator& generator, std::ostream& out, uint64_t count);

/**
 * Generate config.count lines into a file
 *
 * A partially written file is removed before the error propagates.
 *
 * @return Number of lines written
 * @throws std::runtime_error on invalid configuration or I/O failure
 */
uint64_t generate_log_file(const GeneratorConfig& config, const std::string& path,
                           const LogModel& model = LogModel::firewall());

} // namespace logmine

#endif // LOGMINE_GENERATOR_HPP
