#pragma once

#include <iostream>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace partvault::core {

struct OptionSpec {
    char short_name = '\0';
    std::string long_name;
    std::string description;
    bool takes_value = false;
    bool repeatable = false;
    std::string default_value;
};

// Global options come before the command; everything from the command on is
// positional, so command arguments such as "-100123" are never read as flags.
class CommandLineParser {
public:
    explicit CommandLineParser(std::string program_name);

    void add_option(OptionSpec spec);

    bool parse(int argc, char* argv[]);

    bool has_option(const std::string& long_name) const;

    // Last value given, else the option's default, else default_value
    std::string get_option(const std::string& long_name, const std::string& default_value = "") const;

    // Every value of a repeatable option, in command-line order
    std::vector<std::string> get_values(const std::string& long_name) const;

    // "--set key=value" pairs, validated during parse
    const std::vector<std::pair<std::string, std::string>>& get_overrides() const { return overrides_; }

    const std::vector<std::string>& get_positional_args() const { return positional_args_; }
    const std::string& get_error() const { return error_; }

    void print_help(std::ostream& out = std::cout) const;
    void print_version(std::ostream& out = std::cout) const;

private:
    std::string program_name_;
    std::vector<OptionSpec> specs_;
    std::map<std::string, std::vector<std::string>> values_;
    std::vector<std::pair<std::string, std::string>> overrides_;
    std::vector<std::string> positional_args_;
    std::string error_;

    const OptionSpec* find_long(const std::string& long_name) const;
    const OptionSpec* find_short(char short_name) const;
    bool store(const OptionSpec& spec, const std::string& value);
};

} // namespace partvault::core
