#ifndef LOGMINE_UTILS_HPP
#define LOGMINE_UTILS_HPP

#include <string>
#include <vector>
#include <random>
#include <optional>
#include <utility>
#include <cstdint>
#include <stdexcept>

namespace logmine {
namespace utils {

/**
 * Pseudo-random source
 *
 * One instance per generation run. Sampling helpers take it by reference
 * so callers control the stream (and its seed) explicitly.
 */
class Random {
public:
    Random();
    explicit Random(uint64_t seed_value);

    void seed(uint64_t seed_value);

    int randint(int min, int max);
    double uniform(double min = 0.0, double max = 1.0);
    double exponential(double rate);
    uint32_t rand32();

private:
    std::mt19937_64 gen_;
};

/**
 * Seed derived from the high resolution clock
 */
uint64_t clock_seed();

/**
 * Ordered (label, probability) table used for categorical sampling
 */
using WeightTable = std::vector<std::pair<std::string, double>>;

/**
 * Weighted random selection
 *
 * Draws r in [0,1) and walks the table accumulating probability mass.
 * Returns the first label whose cumulative mass is >= r, or the last
 * label when rounding leaves r above the final cumulative sum.
 */
const std::string& weighted_choice(Random& rng, const WeightTable& table);

/**
 * Uniform random selection
 */
template<typename T>
const T& choice(Random& rng, const std::vector<T>& items) {
    if (items.empty()) {
        throw std::runtime_error("Cannot choose from empty items");
    }
    int idx = rng.randint(0, static_cast<int>(items.size()) - 1);
    return items[idx];
}

/**
 * Convert IPv4 string to uint32_t (host byte order)
 *
 * @param ip_str IPv4 address string (e.g., "192.168.1.1")
 * @return IPv4 address as uint32_t
 */
uint32_t ip_str_to_uint32(const std::string& ip_str);

/**
 * Convert uint32_t to IPv4 string (host byte order)
 *
 * @param ip IPv4 address as uint32_t
 * @return IPv4 address string
 */
std::string uint32_to_ip_str(uint32_t ip);

/**
 * Parse subnet and return network address and address count
 *
 * @param subnet CIDR subnet (e.g., "192.168.1.0/24")
 * @return Pair of (network_ip, address_count)
 */
std::pair<uint32_t, uint32_t> parse_subnet(const std::string& subnet);

/**
 * Current wall clock time in nanoseconds since the Unix epoch
 */
uint64_t now_ns();

/**
 * Format a timestamp as a syslog header time ("Mar 07 14:03:59", UTC)
 */
std::string format_syslog_timestamp(uint64_t timestamp_ns);

/**
 * Parse "YYYY-MM-DD", "YYYY-MM-DD HH:MM:SS" or "YYYY-MM-DDTHH:MM:SS"
 *
 * @return Seconds since the Unix epoch (UTC), empty if the text is not
 *         a valid calendar date and time
 */
std::optional<int64_t> parse_iso_datetime(const std::string& text);

/**
 * Format seconds since the Unix epoch as "YYYY-MM-DD HH:MM:SS"
 */
std::string format_iso_datetime(int64_t seconds);

// Latest whole second whose nanosecond count fits in a uint64_t (2554-07-21)
constexpr uint64_t MAX_TIMESTAMP_SECONDS = UINT64_MAX / 1000000000ULL;

/**
 * Convert epoch seconds to epoch nanoseconds
 *
 * @return Empty for negative seconds or seconds past MAX_TIMESTAMP_SECONDS
 */
std::optional<uint64_t> seconds_to_ns(int64_t seconds);

// Text helpers
std::string strip_control_chars(const std::string& text);
std::string trim(const std::string& text);
std::string rtrim(const std::string& text);
std::string to_lower(const std::string& text);
std::vector<std::string> split_whitespace(const std::string& text);
std::string join(const std::vector<std::string>& parts, const std::string& sep,
                 size_t begin = 0, size_t end = std::string::npos);
bool contains_control_chars(const std::string& text);

/**
 * Drop byte sequences that are not well-formed UTF-8
 */
std::string sanitize_utf8(const std::string& text);

} // namespace utils
} // namespace logmine

#endif // LOGMINE_UTILS_HPP
