#include "mediaharvest/core/cli.hpp"
#include "mediaharvest/core/config.hpp"
#include <filesystem>
#include <iomanip>
#include <iostream>

namespace mediaharvest::core {

namespace {

bool parse_count(const std::string& text) {
    try {
        size_t used = 0;
        long value = std::stol(text, &used);
        return used == text.size() && value > 0;
    } catch (const std::exception&) {
        return false;
    }
}

bool parse_rate(const std::string& text) {
    try {
        size_t used = 0;
        double value = std::stod(text, &used);
        return used == text.size() && value >= 0.0;
    } catch (const std::exception&) {
        return false;
    }
}

}

CommandLineParser::CommandLineParser(const std::string& program_name)
    : program_name_(program_name) {

    add_option({"h", "help", "Show this help message"});
    add_option({"v", "version", "Show version information"});
    add_option({"c", "config", "Configuration file (default: mediaharvest.conf)", OptionKind::TEXT});
    add_option({"", "verbose", "Enable debug logging", OptionKind::FLAG, "log.level", "debug"});
    add_option({"i", "index", "Dedup index location", OptionKind::TEXT, "index.path"});
    add_option({"o", "output", "Default download folder", OptionKind::TEXT, "harvest.output_dir"});
    add_option({"w", "workers", "Number of concurrent workers", OptionKind::COUNT, "harvest.workers"});
    add_option({"r", "rate", "Requests per second across all workers (0 = unlimited)",
                OptionKind::RATE, "harvest.rate"});
    add_option({"", "no-probe", "Skip HEAD probes (ETag and size tiers)", OptionKind::FLAG,
                "harvest.probe", "false"});
    add_option({"", "fingerprint", "Compare partial fingerprints before downloading", OptionKind::FLAG,
                "harvest.fingerprint"});
    add_option({"", "force", "Download even when the content is already indexed", OptionKind::FLAG,
                "harvest.force"});
    add_option({"f", "format", "Export format: json or csv (default: json)", OptionKind::TEXT,
                "export.format"});
}

void CommandLineParser::add_option(OptionSpec spec) {
    specs_.push_back(std::move(spec));
}

const OptionSpec* CommandLineParser::find_long(const std::string& name) const {
    for (const auto& spec : specs_) {
        if (spec.long_name == name) {
            return &spec;
        }
    }
    return nullptr;
}

const OptionSpec* CommandLineParser::find_short(char name) const {
    for (const auto& spec : specs_) {
        if (spec.short_name.size() == 1 && spec.short_name[0] == name) {
            return &spec;
        }
    }
    return nullptr;
}

bool CommandLineParser::store(const OptionSpec& spec, const std::string& value) {
    if (spec.kind == OptionKind::COUNT && !parse_count(value)) {
        error_ = "--" + spec.long_name + " expects a positive integer, got '" + value + "'";
        return false;
    }
    if (spec.kind == OptionKind::RATE && !parse_rate(value)) {
        error_ = "--" + spec.long_name + " expects a non-negative number, got '" + value + "'";
        return false;
    }
    parsed_options_[spec.long_name] = value;
    return true;
}

bool CommandLineParser::parse(int argc, char* argv[]) {
    positional_args_.clear();
    parsed_options_.clear();
    error_.clear();

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        // Everything after "--" is positional, so task files may start with a dash.
        if (arg == "--") {
            for (++i; i < argc; ++i) {
                positional_args_.emplace_back(argv[i]);
            }
            break;
        }

        if (arg.size() < 2 || arg[0] != '-') {
            positional_args_.push_back(arg);
            continue;
        }

        const OptionSpec* spec = nullptr;
        std::string inline_value;
        bool has_inline = false;

        if (arg[1] == '-') {
            auto eq = arg.find('=');
            spec = find_long(arg.substr(2, eq == std::string::npos ? std::string::npos : eq - 2));
            if (eq != std::string::npos) {
                inline_value = arg.substr(eq + 1);
                has_inline = true;
            }
        } else {
            spec = find_short(arg[1]);
            if (arg.size() > 2) {
                inline_value = arg.substr(2);
                has_inline = true;
            }
        }

        if (!spec) {
            error_ = "Unknown option: " + arg;
            return false;
        }

        if (spec->kind == OptionKind::FLAG) {
            if (has_inline) {
                error_ = "Option --" + spec->long_name + " takes no value";
                return false;
            }
            parsed_options_[spec->long_name] = spec->flag_value;
            continue;
        }

        if (!has_inline) {
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

    return true;
}

bool CommandLineParser::has_option(const std::string& name) const {
    return parsed_options_.count(name) > 0;
}

std::string CommandLineParser::get_option(const std::string& name, const std::string& default_value) const {
    auto it = parsed_options_.find(name);
    return it != parsed_options_.end() ? it->second : default_value;
}

size_t CommandLineParser::apply_to(Config& config) const {
    size_t applied = 0;
    for (const auto& spec : specs_) {
        auto it = parsed_options_.find(spec.long_name);
        if (spec.config_key.empty() || it == parsed_options_.end()) {
            continue;
        }
        config.set(spec.config_key, it->second);
        ++applied;
    }

    // A relocated output folder takes its index along unless one was given explicitly.
    if (has_option("output") && !has_option("index")) {
        auto index = std::filesystem::path(get_option("output")) / ".media_index.sqlite";
        config.set("index.path", index.string());
    }
    return applied;
}

void CommandLineParser::print_help() const {
    std::cout << "Usage: " << program_name_ << " [options] <command> [args...]\n\n";
    std::cout << "Options:\n";

    for (const auto& spec : specs_) {
        std::string flags = spec.short_name.empty() ? "    " : "-" + spec.short_name + ", ";
        flags += "--" + spec.long_name;
        if (spec.kind != OptionKind::FLAG) {
            flags += " <value>";
        }
        std::cout << "  " << std::left << std::setw(28) << flags << spec.description << "\n";
    }
}

void CommandLineParser::print_version() const {
    std::cout << program_name_ << " version 1.0.0\n";
    std::cout << "Built with C++20, libcurl, SQLite and libsodium\n";
}

} // namespace mediaharvest::core
