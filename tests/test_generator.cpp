#include "logmine/generator.hpp"
#include "logmine/model.hpp"
#include "logmine/utils.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <regex>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using namespace logmine;

constexpr uint64_t kStart = 1704067200000000000ULL;  // 2024-01-01 00:00:00

void check(bool cond, const std::string &msg) {
  if (!cond) {
    std::cerr << "FAIL: " << msg << '\n';
    std::exit(1);
  }
}

std::string temp_path(const std::string &name) {
  return (std::filesystem::temp_directory_path() / ("logmine_test_" + name)).string();
}

std::string read_file(const std::string &path) {
  std::ifstream in(path, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

GeneratorConfig seeded_config(uint64_t count, uint64_t seed) {
  GeneratorConfig config;
  config.count = count;
  config.seed = seed;
  config.start_timestamp_ns = kStart;
  return config;
}

std::string generate_to_string(const GeneratorConfig &config, const LogModel &model = LogModel::firewall()) {
  LogGenerator generator(model);
  std::string error;
  check(generator.initialize(config, &error), "initialize failed: " + error);
  std::ostringstream out;
  write_logs(generator, out, config.count);
  return out.str();
}

void test_zero_count_writes_empty_file() {
  const std::string path = temp_path("empty.log");
  uint64_t written = generate_log_file(seeded_config(0, 1), path);
  check(written == 0U, "no lines should be reported");
  check(std::filesystem::exists(path), "output file should still be created");
  check(std::filesystem::file_size(path) == 0U, "output file should be empty");
  std::filesystem::remove(path);
}

void test_same_seed_gives_identical_files() {
  const std::string a = temp_path("seed42_a.log");
  const std::string b = temp_path("seed42_b.log");
  check(generate_log_file(seeded_config(100, 42), a) == 100U, "first run line count");
  check(generate_log_file(seeded_config(100, 42), b) == 100U, "second run line count");

  const std::string first = read_file(a);
  check(!first.empty(), "generated file should not be empty");
  check(first == read_file(b), "same seed, count and start must be byte-identical");

  std::filesystem::remove(a);
  std::filesystem::remove(b);
}

void test_different_seed_changes_output() {
  check(generate_to_string(seeded_config(50, 1)) != generate_to_string(seeded_config(50, 2)),
        "different seeds should produce different streams");
}

void test_line_integrity() {
  const std::string text = generate_to_string(seeded_config(2000, 9));

  check(std::count(text.begin(), text.end(), '\n') == 2000, "exactly count newline terminators");
  check(!text.empty() && text.back() == '\n', "last line is terminated");
  for (char c : {'\r', '\t', '\v', '\f'}) {
    check(text.find(c) == std::string::npos, "control character leaked into output");
  }
  check(text.find("\n\n") == std::string::npos, "no empty lines");
}

void test_control_characters_stripped_from_fields() {
  LogModel model = LogModel::firewall();
  model.interfaces = {"eth\t0\r", "wan\n0\v\f"};
  for (auto &pool : model.reason_pools) {
    pool.reasons = {"Denied\t\r\n\v\fby policy"};
  }

  const uint64_t count = 300;
  const std::string text = generate_to_string(seeded_config(count, 21), model);

  check(static_cast<uint64_t>(std::count(text.begin(), text.end(), '\n')) == count,
        "embedded line feeds must not add lines");
  for (char c : {'\r', '\t', '\v', '\f'}) {
    check(text.find(c) == std::string::npos, "control character from a model field leaked");
  }

  std::istringstream in(text);
  std::string line;
  uint64_t lines = 0;
  while (std::getline(in, line)) {
    check(line.find("Deniedby policy; ") != std::string::npos, "reason written without control bytes");
    check(line.find(" in=eth0 ") != std::string::npos || line.find(" in=wan0 ") != std::string::npos,
          "interface written without control bytes");
    ++lines;
  }
  check(lines == count, "exactly count lines");
}

void test_line_format() {
  const std::regex line_pattern(
      R"(^[A-Z][a-z]{2} \d{2} \d{2}:\d{2}:\d{2} fw01\.corp\.example\.com firewall\[\d{4}\]: )"
      R"(%FW-(INFO|NOTICE|WARNING|ERROR|CRITICAL)-\*\.(\d+): [A-Za-z ]+; )"
      R"(src=\d+\.\d+\.\d+\.\d+ dst=\d+\.\d+\.\d+\.\d+ proto=(TCP|UDP|ICMP|GRE|ESP) )"
      R"(spt=\d+ dpt=\d+ action=(ACCEPT|DROP|REJECT) bytes=\d+ pkts=\d+ rule=(\d+) )"
      R"(in=(eth0|eth1|wan0|lan0|dmz0) out=(eth0|eth1|wan0|lan0|dmz0) uid=[0-9a-f]{8}$)");

  std::istringstream in(generate_to_string(seeded_config(500, 3)));
  std::string line;
  int lines = 0;
  while (std::getline(in, line)) {
    std::smatch match;
    check(std::regex_match(line, match, line_pattern), "unexpected line format: " + line);
    check(match[2].str() == match[5].str(), "tag rule id must match rule= field");
    ++lines;
  }
  check(lines == 500, "all lines parsed");

  std::string first = generate_to_string(seeded_config(1, 3));
  check(first.rfind("Jan 01 00:0", 0) == 0, "first record starts shortly after the start time");
}

void test_record_fields_follow_model() {
  const LogModel model = LogModel::firewall();
  LogGenerator generator;
  check(generator.initialize(seeded_config(0, 11)), "initialize");

  const uint32_t pid = generator.process_id();
  check(pid >= 1000U && pid <= 9999U, "process id in [1000,9999]");

  const std::set<uint16_t> services(model.service_ports.begin(), model.service_ports.end());
  uint64_t previous = kStart;
  std::set<std::string> correlation_ids;

  LogRecord record;
  for (int i = 0; i < 5000; ++i) {
    generator.next(record);

    check(record.timestamp > previous, "timestamps must strictly increase");
    previous = record.timestamp;
    check(record.process_id == pid, "process id fixed for the run");

    if (record.protocol == "TCP" || record.protocol == "UDP") {
      check(record.source_port >= 1U, "ported protocol has a source port");
      check(services.count(record.destination_port) == 1U, "destination port from service set");
    } else {
      check(record.source_port == 0U && record.destination_port == 0U, "portless protocol uses 0");
    }

    check(record.bytes <= 15000U, "byte counter in [0,15000]");
    if (record.bytes > 0U) {
      uint32_t low = std::max<uint32_t>(1U, record.bytes / 120U);
      uint32_t high = std::max<uint32_t>(1U, record.bytes / 60U);
      check(record.packets >= low && record.packets <= high, "packets derived from bytes");
    } else {
      check(record.packets <= 4U, "small packet count for empty flows");
    }

    check(record.rule_id >= 100U && record.rule_id <= 3999U, "rule id in [100,3999]");
    check(record.correlation_id.size() == 8U, "correlation id has 8 characters");
    correlation_ids.insert(record.correlation_id);

    const auto &reasons = model.reasons_for(record.severity);
    check(std::find(reasons.begin(), reasons.end(), record.reason) != reasons.end(),
          "reason drawn from the severity's pool");
  }

  check(correlation_ids.size() > 4900U, "correlation ids are drawn independently");
}

void test_reason_pools_by_severity() {
  const LogModel model = LogModel::firewall();
  check(model.reasons_for("INFO") == model.reasons_for("NOTICE"), "INFO and NOTICE share a pool");
  check(model.reasons_for("ERROR") == model.reasons_for("CRITICAL"), "ERROR and CRITICAL share a pool");
  check(model.reasons_for("WARNING") != model.reasons_for("INFO"), "WARNING has its own pool");
  check(model.reasons_for("SOMETHING") == model.reasons_for("ERROR"), "unlisted severity uses last pool");
}

void test_mean_interval() {
  LogGenerator generator;
  check(generator.initialize(seeded_config(0, 21)), "initialize");

  const int n = 20000;
  LogRecord record;
  for (int i = 0; i < n; ++i) {
    generator.next(record);
  }

  double mean = static_cast<double>(generator.current_timestamp_ns() - kStart) / 1e9 / n;
  check(mean > 1.2 * 0.97 && mean < 1.2 * 1.03, "mean inter-arrival should be about 1.2s");
}

void test_reset_replays_stream() {
  LogGenerator generator;
  check(generator.initialize(seeded_config(0, 5)), "initialize");

  std::vector<std::string> first;
  for (int i = 0; i < 20; ++i) {
    first.push_back(generator.next_line());
  }

  generator.reset();
  check(generator.current_timestamp_ns() == kStart, "reset rewinds the clock");
  for (int i = 0; i < 20; ++i) {
    check(generator.next_line() == first[i], "reset must replay identical lines");
  }
}

void test_unseeded_run_records_effective_seed() {
  GeneratorConfig config;
  config.start_timestamp_ns = kStart;

  LogGenerator unseeded;
  check(unseeded.initialize(config), "initialize unseeded");
  std::string line = unseeded.next_line();

  LogGenerator replay;
  check(replay.initialize(seeded_config(0, unseeded.effective_seed())), "initialize replay");
  check(replay.next_line() == line, "effective seed reproduces an unseeded run");
}

void test_burstiness_has_no_effect() {
  GeneratorConfig calm = seeded_config(200, 8);
  GeneratorConfig bursty = seeded_config(200, 8);
  calm.burstiness = 0.0;
  bursty.burstiness = 1.0;
  check(generate_to_string(calm) == generate_to_string(bursty), "burstiness must not alter output");
}

void test_alternate_model() {
  LogModel model = LogModel::firewall();
  model.severities = {{"ERROR", 1.0}};
  model.host = "edge02.example.net";

  std::istringstream in(generate_to_string(seeded_config(100, 4), model));
  std::string line;
  while (std::getline(in, line)) {
    check(line.find(" edge02.example.net firewall[") != std::string::npos, "custom host used");
    check(line.find("%FW-ERROR-") != std::string::npos, "custom severity table used");
  }
}

void test_invalid_configuration() {
  GeneratorConfig config = seeded_config(10, 1);
  config.source_private_bias = 1.5;

  LogGenerator generator;
  std::string error;
  check(!generator.initialize(config, &error), "out-of-range bias rejected");
  check(error.find("source_private_bias") != std::string::npos, "error names the field");

  config.source_private_bias = 0.6;
  config.mean_interval_seconds = 0.0;
  check(!config.validate(), "zero mean interval rejected");

  LogModel model = LogModel::firewall();
  model.host = "bad\nhost";
  LogGenerator bad_model(model);
  check(!bad_model.initialize(seeded_config(1, 1), &error), "control characters in host rejected");

  model = LogModel::firewall();
  model.severities = {{"INFO", 0.5}, {"ERROR", 0.4}};
  check(!model.validate(&error), "weights must sum to one");

  bool threw = false;
  try {
    LogRecord record;
    LogGenerator idle;
    idle.next(record);
  } catch (const std::runtime_error &) {
    threw = true;
  }
  check(threw, "next before initialize should throw");
}

void test_start_timestamp_range() {
  const uint64_t last_second_ns = utils::MAX_TIMESTAMP_SECONDS * 1000000000ULL;

  GeneratorConfig config = seeded_config(10, 1);
  config.start_timestamp_ns = last_second_ns + 1;
  std::string error;
  check(!config.validate(&error), "start past the last representable second rejected");
  check(error.find("start_timestamp_ns") != std::string::npos, "error names the field");

  // Less than a second of headroom: the clock must refuse to wrap
  config.start_timestamp_ns = last_second_ns;
  LogGenerator generator;
  check(generator.initialize(config, &error), "last representable second accepted: " + error);

  bool overflowed = false;
  uint64_t previous = generator.current_timestamp_ns();
  try {
    LogRecord record;
    for (int i = 0; i < 1000; ++i) {
      generator.next(record);
      check(record.timestamp > previous, "timestamps never wrap backwards");
      previous = record.timestamp;
    }
  } catch (const std::overflow_error &) {
    overflowed = true;
  }
  check(overflowed, "clock overflow reported instead of wrapping");
}

void test_unwritable_path_is_fatal() {
  const std::string path = "/nonexistent_logmine_dir/out.log";
  bool threw = false;
  try {
    generate_log_file(seeded_config(10, 1), path);
  } catch (const std::runtime_error &e) {
    threw = true;
    check(std::string(e.what()).find(path) != std::string::npos, "error must name the path");
  }
  check(threw, "unwritable output path should throw");
}

} // namespace

int main() {
  test_zero_count_writes_empty_file();
  test_same_seed_gives_identical_files();
  test_different_seed_changes_output();
  test_line_integrity();
  test_control_characters_stripped_from_fields();
  test_line_format();
  test_record_fields_follow_model();
  test_reason_pools_by_severity();
  test_mean_interval();
  test_reset_replays_stream();
  test_unseeded_run_records_effective_seed();
  test_burstiness_has_no_effect();
  test_alternate_model();
  test_invalid_configuration();
  test_start_timestamp_range();
  test_unwritable_path_is_fatal();
  std::cout << "logmine generator tests passed\n";
  return 0;
}
