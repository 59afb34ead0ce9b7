#include "logmine/utils.hpp"
#include <chrono>
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <cctype>

namespace logmine {
namespace utils {

// Random implementation
Random::Random() : gen_(clock_seed()) {
}

Random::Random(uint64_t seed_value) : gen_(seed_value) {
}

void Random::seed(uint64_t seed_value) {
    gen_.seed(seed_value);
}

int Random::randint(int min, int max) {
    std::uniform_int_distribution<int> dist(min, max);
    return dist(gen_);
}

double Random::uniform(double min, double max) {
    std::uniform_real_distribution<double> dist(min, max);
    return dist(gen_);
}

double Random::exponential(double rate) {
    std::exponential_distribution<double> dist(rate);
    return dist(gen_);
}

uint32_t Random::rand32() {
    return static_cast<uint32_t>(gen_());
}

uint64_t clock_seed() {
    return static_cast<uint64_t>(
        std::chrono::high_resolution_clock::now().time_since_epoch().count());
}

const std::string& weighted_choice(Random& rng, const WeightTable& table) {
    if (table.empty()) {
        throw std::runtime_error("Cannot choose from empty weight table");
    }

    double r = rng.uniform(0.0, 1.0);
    double cumsum = 0.0;

    for (const auto& entry : table) {
        cumsum += entry.second;
        if (cumsum >= r) {
            return entry.first;
        }
    }

    return table.back().first;
}

// Convert IPv4 string to uint32_t (host byte order)
uint32_t ip_str_to_uint32(const std::string& ip_str) {
    std::istringstream iss(ip_str);
    std::string token;
    std::vector<int> octets;

    while (std::getline(iss, token, '.')) {
        if (token.empty() || token.size() > 3 ||
            !std::all_of(token.begin(), token.end(), ::isdigit)) {
            throw std::runtime_error("Invalid IPv4 address: " + ip_str);
        }
        int value = std::stoi(token);
        if (value > 255) {
            throw std::runtime_error("Invalid IPv4 address: " + ip_str);
        }
        octets.push_back(value);
    }

    if (octets.size() != 4) {
        throw std::runtime_error("Invalid IPv4 address: " + ip_str);
    }

    return (static_cast<uint32_t>(octets[0]) << 24) |
           (static_cast<uint32_t>(octets[1]) << 16) |
           (static_cast<uint32_t>(octets[2]) << 8) |
           static_cast<uint32_t>(octets[3]);
}

// Convert uint32_t to IPv4 string (host byte order)
std::string uint32_to_ip_str(uint32_t ip) {
    std::ostringstream oss;
    oss << ((ip >> 24) & 0xFF) << "."
        << ((ip >> 16) & 0xFF) << "."
        << ((ip >> 8) & 0xFF) << "."
        << (ip & 0xFF);
    return oss.str();
}

std::pair<uint32_t, uint32_t> parse_subnet(const std::string& subnet) {
    size_t slash_pos = subnet.find('/');
    if (slash_pos == std::string::npos) {
        // No prefix length, treat as single host
        return {ip_str_to_uint32(subnet), 1};
    }

    std::string ip_part = subnet.substr(0, slash_pos);
    std::string prefix_part = subnet.substr(slash_pos + 1);
    if (prefix_part.empty() ||
        !std::all_of(prefix_part.begin(), prefix_part.end(), ::isdigit)) {
        throw std::runtime_error("Invalid subnet: " + subnet);
    }

    int prefix_len = std::stoi(prefix_part);
    if (prefix_len < 0 || prefix_len > 32) {
        throw std::runtime_error("Invalid prefix length: " + std::to_string(prefix_len));
    }

    uint32_t base_ip = ip_str_to_uint32(ip_part);
    uint32_t host_bits = 32 - prefix_len;
    uint32_t host_count = (host_bits >= 32) ? 0xFFFFFFFF : (1u << host_bits);

    // Mask off host bits to get network address
    uint32_t mask = (prefix_len == 0) ? 0 : (0xFFFFFFFF << host_bits);
    base_ip &= mask;

    return {base_ip, host_count};
}

uint64_t now_ns() {
    auto now = std::chrono::system_clock::now();
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(now.time_since_epoch()).count());
}

namespace {

const char* const MONTH_NAMES[] = {
    "Jan", "Feb", "Mar", "Apr", "May", "Jun",
    "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"
};

struct CivilTime {
    int64_t year;
    int month;
    int day;
    int hour;
    int minute;
    int second;
};

// Days since 1970-01-01 for a proleptic Gregorian date
int64_t days_from_civil(int64_t y, int m, int d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const int64_t yoe = y - era * 400;
    const int64_t doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

CivilTime civil_from_seconds(int64_t seconds) {
    int64_t days = seconds / 86400;
    int64_t rem = seconds % 86400;
    if (rem < 0) {
        rem += 86400;
        --days;
    }

    int64_t z = days + 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const int64_t doe = z - era * 146097;
    const int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const int64_t mp = (5 * doy + 2) / 153;

    CivilTime t;
    t.day = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    t.month = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    t.year = yoe + era * 400 + (t.month <= 2 ? 1 : 0);
    t.hour = static_cast<int>(rem / 3600);
    t.minute = static_cast<int>((rem % 3600) / 60);
    t.second = static_cast<int>(rem % 60);
    return t;
}

bool is_leap_year(int64_t y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

int days_in_month(int64_t y, int m) {
    static const int DAYS[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2 && is_leap_year(y)) {
        return 29;
    }
    return DAYS[m - 1];
}

// Reads a fixed-width run of digits; false if any character is not a digit
bool read_digits(const std::string& text, size_t pos, size_t len, int& out) {
    out = 0;
    for (size_t i = pos; i < pos + len; ++i) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        if (!std::isdigit(c)) {
            return false;
        }
        out = out * 10 + (c - '0');
    }
    return true;
}

} // namespace

std::string format_syslog_timestamp(uint64_t timestamp_ns) {
    CivilTime t = civil_from_seconds(static_cast<int64_t>(timestamp_ns / 1000000000ULL));

    std::ostringstream oss;
    oss << MONTH_NAMES[t.month - 1] << " "
        << std::setfill('0') << std::setw(2) << t.day << " "
        << std::setw(2) << t.hour << ":"
        << std::setw(2) << t.minute << ":"
        << std::setw(2) << t.second;
    return oss.str();
}

std::optional<int64_t> parse_iso_datetime(const std::string& text) {
    if (text.size() != 10 && text.size() != 19) {
        return std::nullopt;
    }

    int year, month, day;
    if (!read_digits(text, 0, 4, year) || text[4] != '-' ||
        !read_digits(text, 5, 2, month) || text[7] != '-' ||
        !read_digits(text, 8, 2, day)) {
        return std::nullopt;
    }

    int hour = 0, minute = 0, second = 0;
    if (text.size() == 19) {
        if ((text[10] != ' ' && text[10] != 'T') ||
            !read_digits(text, 11, 2, hour) || text[13] != ':' ||
            !read_digits(text, 14, 2, minute) || text[16] != ':' ||
            !read_digits(text, 17, 2, second)) {
            return std::nullopt;
        }
    }

    if (year < 1 || month < 1 || month > 12 || day < 1 ||
        day > days_in_month(year, month) ||
        hour > 23 || minute > 59 || second > 59) {
        return std::nullopt;
    }

    return days_from_civil(year, month, day) * 86400 +
           hour * 3600 + minute * 60 + second;
}

std::optional<uint64_t> seconds_to_ns(int64_t seconds) {
    if (seconds < 0 || static_cast<uint64_t>(seconds) > MAX_TIMESTAMP_SECONDS) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(seconds) * 1000000000ULL;
}

std::string format_iso_datetime(int64_t seconds) {
    CivilTime t = civil_from_seconds(seconds);

    std::ostringstream oss;
    oss << std::setfill('0')
        << std::setw(4) << t.year << "-"
        << std::setw(2) << t.month << "-"
        << std::setw(2) << t.day << " "
        << std::setw(2) << t.hour << ":"
        << std::setw(2) << t.minute << ":"
        << std::setw(2) << t.second;
    return oss.str();
}

namespace {

bool is_stripped_control(char c) {
    return c == '\r' || c == '\n' || c == '\t' || c == '\v' || c == '\f';
}

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

} // namespace

std::string strip_control_chars(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (!is_stripped_control(c)) {
            out.push_back(c);
        }
    }
    return out;
}

bool contains_control_chars(const std::string& text) {
    return std::any_of(text.begin(), text.end(), is_stripped_control);
}

std::string trim(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && is_space(text[begin])) {
        ++begin;
    }
    while (end > begin && is_space(text[end - 1])) {
        --end;
    }
    return text.substr(begin, end - begin);
}

std::string rtrim(const std::string& text) {
    size_t end = text.size();
    while (end > 0 && is_space(text[end - 1])) {
        --end;
    }
    return text.substr(0, end);
}

std::string to_lower(const std::string& text) {
    std::string out = text;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::vector<std::string> split_whitespace(const std::string& text) {
    std::vector<std::string> tokens;
    size_t i = 0;
    while (i < text.size()) {
        while (i < text.size() && is_space(text[i])) {
            ++i;
        }
        size_t start = i;
        while (i < text.size() && !is_space(text[i])) {
            ++i;
        }
        if (i > start) {
            tokens.push_back(text.substr(start, i - start));
        }
    }
    return tokens;
}

std::string join(const std::vector<std::string>& parts, const std::string& sep,
                 size_t begin, size_t end) {
    end = std::min(end, parts.size());
    std::string out;
    for (size_t i = begin; i < end; ++i) {
        if (i > begin) {
            out += sep;
        }
        out += parts[i];
    }
    return out;
}

std::string sanitize_utf8(const std::string& text) {
    std::string out;
    out.reserve(text.size());

    const size_t n = text.size();
    size_t i = 0;
    while (i < n) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        if (c < 0x80) {
            out.push_back(static_cast<char>(c));
            ++i;
            continue;
        }

        size_t len = 0;
        unsigned char lo = 0x80, hi = 0xBF;  // bounds for the second byte
        if (c >= 0xC2 && c <= 0xDF) {
            len = 2;
        } else if (c >= 0xE0 && c <= 0xEF) {
            len = 3;
            if (c == 0xE0) lo = 0xA0;
            if (c == 0xED) hi = 0x9F;
        } else if (c >= 0xF0 && c <= 0xF4) {
            len = 4;
            if (c == 0xF0) lo = 0x90;
            if (c == 0xF4) hi = 0x8F;
        }

        bool valid = len > 0 && i + len <= n;
        for (size_t k = 1; valid && k < len; ++k) {
            unsigned char cc = static_cast<unsigned char>(text[i + k]);
            unsigned char min = (k == 1) ? lo : 0x80;
            unsigned char max = (k == 1) ? hi : 0xBF;
            valid = cc >= min && cc <= max;
        }

        if (valid) {
            out.append(text, i, len);
            i += len;
        } else {
            ++i;
        }
    }

    return out;
}

} // namespace utils
} // namespace logmine
