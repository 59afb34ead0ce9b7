/**
 * logmine C++ Example
 *
 * Demonstrates:
 * - Configuring a seeded generator with a fixed start time
 * - Drawing records one at a time and inspecting their fields
 * - Feeding generated lines straight into a summarizer
 * - Rendering the summary report
 */

#include <logmine/generator.hpp>
#include <logmine/report.hpp>
#include <logmine/summarizer.hpp>
#include <logmine/utils.hpp>
#include <iostream>
#include <sstream>
#include <string>

int main(int argc, char* argv[]) {
    uint64_t count = 20;
    if (argc > 1) {
        try {
            count = std::stoull(argv[1]);
        } catch (const std::exception&) {
            std::cerr << "Usage: " << argv[0] << " [count]\n";
            return 1;
        }
    }

    logmine::GeneratorConfig config;
    config.count = count;
    config.seed = 42;
    config.start_timestamp_ns = 1704067200000000000ULL;  // 2024-01-01 00:00:00

    logmine::LogGenerator generator;
    std::string error;
    if (!generator.initialize(config, &error)) {
        std::cerr << "Error: " << error << "\n";
        return 1;
    }

    // Peek at a few structured records
    std::cout << "First records (pid " << generator.process_id() << "):\n";
    logmine::LogRecord record;
    for (int i = 0; i < 3; ++i) {
        generator.next(record);
        std::cout << "  " << record.severity << " " << record.source_ip_str()
                  << " -> " << record.destination_ip_str() << ":" << record.destination_port
                  << " " << record.action << "\n";
    }

    // Replay the same stream into memory
    generator.reset();
    std::stringstream buffer;
    logmine::write_logs(generator, buffer, count);

    std::cout << "\nGenerated log:\n" << buffer.str() << "\n";

    // Syslog headers carry no year, so only levels and signatures show up
    logmine::LogSummarizer summarizer;
    summarizer.consume_stream(buffer);

    std::cout << logmine::render_report(summarizer.aggregate(), "<memory>");
    return 0;
}
