#include "partvault/core/cli.hpp"
#include <iomanip>

#ifndef PARTVAULT_VERSION
#define PARTVAULT_VERSION "0.1.0"
#endif

namespace partvault::core {

CommandLineParser::CommandLineParser(std::string program_name)
    : program_name_(std::move(program_name)) {
    add_option({'h', "help", "Show this help message"});
    add_option({'v', "version", "Show version information"});
    add_option({'c', "config", "Configuration file path", true, false, "~/.partvault.conf"});
    add_option({'s', "set", "Override a configuration key (key=value, repeatable)", true, true});
    add_option({'l', "log-level", "trace, debug, info, warn, error or critical", true});
    add_option({'\0', "verbose", "Same as --log-level debug"});
}

void CommandLineParser::add_option(OptionSpec spec) {
    specs_.push_back(std::move(spec));
}

bool CommandLineParser::parse(int argc, char* argv[]) {
    values_.clear();
    overrides_.clear();
    positional_args_.clear();
    error_.clear();

    int i = 1;
    for (; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--") {
            ++i;
            break;
        }

        if (arg.size() < 2 || arg[0] != '-') {
            break;
        }

        const OptionSpec* spec = nullptr;
        std::string inline_value;
        bool has_inline_value = false;

        if (arg.starts_with("--")) {
            auto eq_pos = arg.find('=');
            auto name = arg.substr(2, eq_pos == std::string::npos ? std::string::npos : eq_pos - 2);
            spec = find_long(name);
            if (!spec) {
                error_ = "Unknown option: --" + name;
                return false;
            }
            if (eq_pos != std::string::npos) {
                inline_value = arg.substr(eq_pos + 1);
                has_inline_value = true;
            }
        } else {
            spec = find_short(arg[1]);
            if (!spec) {
                error_ = std::string("Unknown option: -") + arg[1];
                return false;
            }
            if (arg.size() > 2) {
                inline_value = arg.substr(2);
                has_inline_value = true;
            }
        }

        if (!spec->takes_value) {
            if (has_inline_value) {
                error_ = "Option --" + spec->long_name + " does not take a value";
                return false;
            }
            values_[spec->long_name].push_back("true");
            continue;
        }

        if (!has_inline_value) {
            if (i + 1 >= argc) {
                error_ = "Option --" + spec->long_name + " requires a value";
                return false;
            }
            inline_value = argv[++i];
        }

        if (!store(*spec, inline_value)) {
            return false;
        }
    }

    for (; i < argc; ++i) {
        positional_args_.emplace_back(argv[i]);
    }

    return true;
}

bool CommandLineParser::store(const OptionSpec& spec, const std::string& value) {
    auto& values = values_[spec.long_name];
    if (!spec.repeatable) {
        values.clear();
    }
    values.push_back(value);

    if (spec.long_name == "set") {
        auto eq_pos = value.find('=');
        if (eq_pos == std::string::npos || eq_pos == 0) {
            error_ = "Expected key=value for --set, got '" + value + "'";
            return false;
        }
        overrides_.emplace_back(value.substr(0, eq_pos), value.substr(eq_pos + 1));
    }

    return true;
}

bool CommandLineParser::has_option(const std::string& long_name) const {
    return values_.find(long_name) != values_.end();
}

std::string CommandLineParser::get_option(const std::string& long_name, const std::string& default_value) const {
    auto it = values_.find(long_name);
    if (it != values_.end() && !it->second.empty()) {
        return it->second.back();
    }

    auto spec = find_long(long_name);
    if (spec && !spec->default_value.empty()) {
        return spec->default_value;
    }

    return default_value;
}

std::vector<std::string> CommandLineParser::get_values(const std::string& long_name) const {
    auto it = values_.find(long_name);
    return it != values_.end() ? it->second : std::vector<std::string>{};
}

void CommandLineParser::print_help(std::ostream& out) const {
    out << "Usage: " << program_name_ << " [options] <command> [args...]\n\n";
    out << "Options:\n";

    for (const auto& spec : specs_) {
        std::string flags = spec.short_name ? std::string("-") + spec.short_name + ", " : "    ";
        flags += "--" + spec.long_name;
        if (spec.takes_value) {
            flags += " <value>";
        }

        out << "  " << std::left << std::setw(26) << flags << spec.description;
        if (!spec.default_value.empty()) {
            out << " (default: " << spec.default_value << ")";
        }
        out << "\n";
    }
}

void CommandLineParser::print_version(std::ostream& out) const {
    out << program_name_ << " version " << PARTVAULT_VERSION << "\n";
}

const OptionSpec* CommandLineParser::find_long(const std::string& long_name) const {
    for (const auto& spec : specs_) {
        if (spec.long_name == long_name) {
            return &spec;
        }
    }
    return nullptr;
}

const OptionSpec* CommandLineParser::find_short(char short_name) const {
    if (short_name == '\0') {
        return nullptr;
    }
    for (const auto& spec : specs_) {
        if (spec.short_name == short_name) {
            return &spec;
        }
    }
    return nullptr;
}

} // namespace partvault::core
