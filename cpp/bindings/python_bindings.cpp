#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <memory>
#include "logmine/address_space.hpp"
#include "logmine/generator.hpp"
#include "logmine/log_record.hpp"
#include "logmine/model.hpp"
#include "logmine/report.hpp"
#include "logmine/summarizer.hpp"
#include "logmine/utils.hpp"

namespace py = pybind11;

PYBIND11_MODULE(_logmine_core, m) {
    m.doc() = "logmine C++ core library - synthetic log generation and streaming summaries";

    // Random binding
    py::class_<logmine::utils::Random>(m, "Random")
        .def(py::init<>())
        .def(py::init<uint64_t>(), py::arg("seed"))
        .def("seed", &logmine::utils::Random::seed, py::arg("seed"))
        .def("randint", &logmine::utils::Random::randint, py::arg("min"), py::arg("max"))
        .def("uniform", &logmine::utils::Random::uniform,
             py::arg("min") = 0.0, py::arg("max") = 1.0)
        .def("exponential", &logmine::utils::Random::exponential, py::arg("rate"));

    // ReasonPool / LogModel bindings
    py::class_<logmine::ReasonPool>(m, "ReasonPool")
        .def(py::init<>())
        .def_readwrite("severities", &logmine::ReasonPool::severities)
        .def_readwrite("reasons", &logmine::ReasonPool::reasons);

    py::class_<logmine::LogModel>(m, "LogModel")
        .def(py::init(&logmine::LogModel::firewall))
        .def_static("firewall", &logmine::LogModel::firewall)
        .def_readwrite("severities", &logmine::LogModel::severities)
        .def_readwrite("actions", &logmine::LogModel::actions)
        .def_readwrite("protocols", &logmine::LogModel::protocols)
        .def_readwrite("port_protocols", &logmine::LogModel::port_protocols)
        .def_readwrite("service_ports", &logmine::LogModel::service_ports)
        .def_readwrite("interfaces", &logmine::LogModel::interfaces)
        .def_readwrite("reason_pools", &logmine::LogModel::reason_pools)
        .def_readwrite("host", &logmine::LogModel::host)
        .def_readwrite("daemon", &logmine::LogModel::daemon)
        .def_readwrite("facility", &logmine::LogModel::facility)
        .def("validate", [](const logmine::LogModel& model) {
            std::string error;
            if (!model.validate(&error)) {
                throw std::runtime_error("Model validation failed: " + error);
            }
            return true;
        });

    // LogRecord binding
    py::class_<logmine::LogRecord>(m, "LogRecord")
        .def(py::init<>())
        .def_readwrite("timestamp", &logmine::LogRecord::timestamp)
        .def_readwrite("host", &logmine::LogRecord::host)
        .def_readwrite("process_id", &logmine::LogRecord::process_id)
        .def_readwrite("severity", &logmine::LogRecord::severity)
        .def_readwrite("rule_id", &logmine::LogRecord::rule_id)
        .def_readwrite("reason", &logmine::LogRecord::reason)
        .def_readwrite("protocol", &logmine::LogRecord::protocol)
        .def_readwrite("source_ip", &logmine::LogRecord::source_ip)
        .def_readwrite("destination_ip", &logmine::LogRecord::destination_ip)
        .def_property_readonly("source_ip_str", &logmine::LogRecord::source_ip_str)
        .def_property_readonly("destination_ip_str", &logmine::LogRecord::destination_ip_str)
        .def_readwrite("source_port", &logmine::LogRecord::source_port)
        .def_readwrite("destination_port", &logmine::LogRecord::destination_port)
        .def_readwrite("action", &logmine::LogRecord::action)
        .def_readwrite("bytes", &logmine::LogRecord::bytes)
        .def_readwrite("packets", &logmine::LogRecord::packets)
        .def_readwrite("correlation_id", &logmine::LogRecord::correlation_id)
        .def("message", &logmine::LogRecord::message)
        .def("to_line", &logmine::LogRecord::to_line)
        .def("__repr__", [](const logmine::LogRecord& r) {
            return "LogRecord(" + r.severity + " " + r.source_ip_str() + ":" +
                   std::to_string(r.source_port) + " -> " + r.destination_ip_str() + ":" +
                   std::to_string(r.destination_port) + ", proto=" + r.protocol +
                   ", action=" + r.action + ", uid=" + r.correlation_id + ")";
        });

    // GeneratorConfig binding
    py::class_<logmine::GeneratorConfig>(m, "GeneratorConfig")
        .def(py::init<>())
        .def_readwrite("count", &logmine::GeneratorConfig::count)
        .def_readwrite("start_timestamp_ns", &logmine::GeneratorConfig::start_timestamp_ns)
        .def_readwrite("seed", &logmine::GeneratorConfig::seed)
        .def_readwrite("mean_interval_seconds", &logmine::GeneratorConfig::mean_interval_seconds)
        .def_readwrite("source_private_bias", &logmine::GeneratorConfig::source_private_bias)
        .def_readwrite("destination_private_bias",
                       &logmine::GeneratorConfig::destination_private_bias)
        .def_readwrite("burstiness", &logmine::GeneratorConfig::burstiness)
        .def("validate", [](const logmine::GeneratorConfig& cfg) {
            std::string error;
            if (!cfg.validate(&error)) {
                throw std::runtime_error("Config validation failed: " + error);
            }
            return true;
        });

    // LogGenerator binding (non-copyable, use std::unique_ptr holder)
    py::class_<logmine::LogGenerator, std::unique_ptr<logmine::LogGenerator>>(m, "LogGenerator")
        .def(py::init<>())
        .def(py::init<logmine::LogModel>(), py::arg("model"))
        .def("initialize", [](logmine::LogGenerator& gen, const logmine::GeneratorConfig& cfg) {
            std::string error;
            if (!gen.initialize(cfg, &error)) {
                throw std::runtime_error("Generator initialization failed: " + error);
            }
        }, "Initialize generator with configuration")
        .def("next", [](logmine::LogGenerator& gen) {
            logmine::LogRecord record;
            gen.next(record);
            return record;
        }, "Generate next log record")
        .def("next_line", &logmine::LogGenerator::next_line,
             "Generate next serialized log line")
        .def("reset", &logmine::LogGenerator::reset,
             "Replay the stream from the start")
        .def("current_timestamp_ns", &logmine::LogGenerator::current_timestamp_ns)
        .def("process_id", &logmine::LogGenerator::process_id)
        .def("effective_seed", &logmine::LogGenerator::effective_seed);

    m.def("generate_log_file", &logmine::generate_log_file,
          "Generate config.count log lines into a file",
          py::arg("config"), py::arg("path"), py::arg("model") = logmine::LogModel::firewall());

    // Summarizer bindings
    py::class_<logmine::SummaryFilter>(m, "SummaryFilter")
        .def(py::init<>())
        .def_readwrite("keyword", &logmine::SummaryFilter::keyword)
        .def_readwrite("start", &logmine::SummaryFilter::start)
        .def_readwrite("end", &logmine::SummaryFilter::end);

    py::class_<logmine::RunningAggregate>(m, "RunningAggregate")
        .def_readonly("total_lines", &logmine::RunningAggregate::total_lines)
        .def_readonly("first_timestamp", &logmine::RunningAggregate::first_timestamp)
        .def_readonly("last_timestamp", &logmine::RunningAggregate::last_timestamp)
        .def_property_readonly("level_counts", [](const logmine::RunningAggregate& a) {
            return a.level_counts.entries();
        })
        .def_property_readonly("error_signatures", [](const logmine::RunningAggregate& a) {
            return a.error_signatures.entries();
        });

    py::class_<logmine::LogSummarizer, std::unique_ptr<logmine::LogSummarizer>>(m, "LogSummarizer")
        .def(py::init([](const logmine::SummaryFilter& filter) {
            return std::make_unique<logmine::LogSummarizer>(filter);
        }), py::arg("filter") = logmine::SummaryFilter())
        .def("consume", &logmine::LogSummarizer::consume, py::arg("line"))
        .def("aggregate", &logmine::LogSummarizer::aggregate,
             py::return_value_policy::reference_internal)
        .def("reset", &logmine::LogSummarizer::reset);

    m.def("summarize", &logmine::summarize,
          "Summarize a log file and render the report",
          py::arg("path"), py::arg("filter") = logmine::SummaryFilter(), py::arg("top_n") = 5);

    m.def("render_report", &logmine::render_report,
          "Render a report from an aggregate",
          py::arg("aggregate"), py::arg("source"), py::arg("top_n") = 5);

    // Utility functions
    m.def("error_signature", &logmine::error_signature, py::arg("message"));

    m.def("is_reserved", [](const std::string& ip) {
        return logmine::is_reserved(logmine::utils::ip_str_to_uint32(ip));
    }, "True if the IPv4 address lies in 10/8, 172.16/12 or 192.168/16", py::arg("ip"));

    m.def("random_ipv4", &logmine::random_ipv4_str,
          "Generate random IPv4 address string",
          py::arg("rng"), py::arg("private_bias") = 0.6);

    m.def("parse_iso_datetime", &logmine::utils::parse_iso_datetime, py::arg("text"));
    m.def("format_iso_datetime", &logmine::utils::format_iso_datetime, py::arg("seconds"));
}
