#pragma once

#include <cstdint>
#include <exception>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace logtools {

/**
 * Simple argument parser for the logmine tools
 * Supports string, unsigned integer, floating point and positional
 * options
 */
class ArgParser {
public:
    explicit ArgParser(const std::string& description)
        : m_description(description)
        , m_show_help(false)
    {}

    // Add string option
    void add_option(const std::string& short_name,
                   const std::string& long_name,
                   std::string& target,
                   const std::string& description,
                   bool required = false,
                   const std::string& default_value = "") {
        Option opt = make_option(short_name, long_name, description, Kind::STRING);
        opt.required = required;
        opt.string_target = &target;
        opt.default_text = default_value;
        m_options.push_back(opt);

        if (!default_value.empty()) {
            target = default_value;
        }
    }

    // Add unsigned integer option
    void add_option(const std::string& short_name,
                   const std::string& long_name,
                   uint64_t& target,
                   const std::string& description,
                   uint64_t default_value = 0) {
        Option opt = make_option(short_name, long_name, description, Kind::UINT);
        opt.uint64_target = &target;
        opt.default_text = std::to_string(default_value);
        m_options.push_back(opt);

        target = default_value;
    }

    // Add floating point option
    void add_option(const std::string& short_name,
                   const std::string& long_name,
                   double& target,
                   const std::string& description,
                   double default_value) {
        Option opt = make_option(short_name, long_name, description, Kind::DOUBLE);
        opt.double_target = &target;
        std::ostringstream oss;
        oss << default_value;
        opt.default_text = oss.str();
        m_options.push_back(opt);

        target = default_value;
    }

    // Add positional argument (consumed in declaration order)
    void add_positional(const std::string& name,
                       std::string& target,
                       const std::string& description,
                       bool required = true) {
        Option opt = make_option("", name, description, Kind::POSITIONAL);
        opt.required = required;
        opt.string_target = &target;
        m_options.push_back(opt);
    }

    // Parse arguments
    bool parse(int argc, char** argv) {
        size_t next_positional = 0;

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "-h" || arg == "--help") {
                m_show_help = true;
                return false;
            }

            if (arg.size() > 1 && arg[0] == '-') {
                Option* opt = find_option(arg);
                if (!opt) {
                    return fail("Unknown option: " + arg);
                }

                // Next argument is the value
                if (i + 1 >= argc) {
                    return fail("Missing value for option: " + arg);
                }

                if (!assign(*opt, argv[++i])) {
                    return fail("Invalid value for " + arg + ": " + argv[i]);
                }
                continue;
            }

            Option* positional = find_positional(next_positional++);
            if (!positional) {
                return fail("Unexpected argument: " + arg);
            }
            *positional->string_target = arg;
            positional->was_set = true;
        }

        // Check required options
        for (const auto& opt : m_options) {
            if (opt.required && !opt.was_set) {
                if (opt.kind == Kind::POSITIONAL) {
                    return fail("Required argument <" + opt.long_name + "> not provided");
                }
                return fail("Required option --" + opt.long_name + " not provided");
            }
        }

        return true;
    }

    // Print help message
    void print_help(std::ostream& out = std::cout) const {
        out << m_description << "\n\n";

        bool has_positional = false;
        for (const auto& opt : m_options) {
            if (opt.kind == Kind::POSITIONAL) {
                if (!has_positional) {
                    out << "Arguments:\n";
                    has_positional = true;
                }
                out << "  <" << opt.long_name << ">\n      " << opt.description << "\n\n";
            }
        }

        out << "Options:\n";
        for (const auto& opt : m_options) {
            if (opt.kind == Kind::POSITIONAL) {
                continue;
            }

            out << "  ";
            if (!opt.short_name.empty()) {
                out << "-" << opt.short_name << ", ";
            }
            out << "--" << opt.long_name << " <value>";

            out << "\n      " << opt.description;
            if (opt.required) {
                out << " [REQUIRED]";
            } else if (!opt.default_text.empty()) {
                out << " (default: " << opt.default_text << ")";
            }
            out << "\n\n";
        }
    }

    // True if the option (by long name) appeared on the command line
    bool was_set(const std::string& long_name) const {
        for (const auto& opt : m_options) {
            if (opt.long_name == long_name) {
                return opt.was_set;
            }
        }
        return false;
    }

    bool should_show_help() const { return m_show_help; }
    const std::string& error() const { return m_error; }

private:
    enum class Kind {
        STRING,
        UINT,
        DOUBLE,
        POSITIONAL
    };

    struct Option {
        std::string short_name;
        std::string long_name;
        std::string description;
        Kind kind = Kind::STRING;
        bool required = false;
        bool was_set = false;

        // Targets for different types
        std::string* string_target = nullptr;
        uint64_t* uint64_target = nullptr;
        double* double_target = nullptr;

        std::string default_text;
    };

    static Option make_option(const std::string& short_name,
                              const std::string& long_name,
                              const std::string& description,
                              Kind kind) {
        Option opt;
        opt.short_name = short_name;
        opt.long_name = long_name;
        opt.description = description;
        opt.kind = kind;
        return opt;
    }

    static bool assign(Option& opt, const std::string& value) {
        try {
            size_t used = 0;
            switch (opt.kind) {
            case Kind::UINT:
                if (value.empty() || value[0] == '-') {
                    return false;
                }
                *opt.uint64_target = std::stoull(value, &used);
                break;
            case Kind::DOUBLE:
                *opt.double_target = std::stod(value, &used);
                break;
            default:
                *opt.string_target = value;
                used = value.size();
                break;
            }
            if (used != value.size()) {
                return false;
            }
        } catch (const std::exception&) {
            return false;
        }

        opt.was_set = true;
        return true;
    }

    bool fail(const std::string& message) {
        m_error = message;
        return false;
    }

    Option* find_option(const std::string& arg) {
        for (auto& opt : m_options) {
            if (opt.kind == Kind::POSITIONAL) {
                continue;
            }
            if ((!opt.short_name.empty() && arg == "-" + opt.short_name) ||
                arg == "--" + opt.long_name) {
                return &opt;
            }
        }
        return nullptr;
    }

    Option* find_positional(size_t index) {
        size_t seen = 0;
        for (auto& opt : m_options) {
            if (opt.kind == Kind::POSITIONAL) {
                if (seen == index) {
                    return &opt;
                }
                ++seen;
            }
        }
        return nullptr;
    }

    std::string m_description;
    std::vector<Option> m_options;
    bool m_show_help;
    std::string m_error;
};

} // namespace logtools
