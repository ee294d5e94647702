#pragma once

#include <map>
#include <string>
#include <vector>

namespace mediaharvest::core {

class Config;

enum class OptionKind {
    FLAG,
    TEXT,
    COUNT,  // positive integer
    RATE    // non-negative number, 0 = unlimited
};

struct OptionSpec {
    std::string short_name;
    std::string long_name;
    std::string description;
    OptionKind kind = OptionKind::FLAG;
    // Config key the option overrides, empty for driver-only options.
    std::string config_key;
    // Value written to config_key when a FLAG is present.
    std::string flag_value = "true";
};

class CommandLineParser {
public:
    explicit CommandLineParser(const std::string& program_name);

    void add_option(OptionSpec spec);

    bool parse(int argc, char* argv[]);

    bool has_option(const std::string& name) const;
    std::string get_option(const std::string& name, const std::string& default_value = "") const;

    // Writes every parsed option that maps to a config key. Returns the number applied.
    size_t apply_to(Config& config) const;

    const std::vector<std::string>& get_positional_args() const { return positional_args_; }
    const std::string& get_error() const { return error_; }

    void print_help() const;
    void print_version() const;

private:
    const OptionSpec* find_long(const std::string& name) const;
    const OptionSpec* find_short(char name) const;
    bool store(const OptionSpec& spec, const std::string& value);

    std::string program_name_;
    std::vector<OptionSpec> specs_;
    std::map<std::string, std::string> parsed_options_;
    std::vector<std::string> positional_args_;
    std::string error_;
};

} // namespace mediaharvest::core
