#include "mediaharvest/core/config.hpp"
#include "mediaharvest/core/utils.hpp"
#include <cstdlib>
#include <fstream>

namespace mediaharvest::core {

using utils::StringUtils;

namespace {

// Splits `harvest.workers` into `harvest` and `workers`; keys without a dot have no section.
std::pair<std::string, std::string> split_key(const std::string& key) {
    auto dot = key.find('.');
    if (dot == std::string::npos) {
        return {"", key};
    }
    return {key.substr(0, dot), key.substr(dot + 1)};
}

}

Config& Config::instance() {
    static Config instance;
    return instance;
}

Result Config::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return Result(ErrorCode::FILE_NOT_FOUND, "Cannot open config file: " + filename);
    }

    std::string section;
    std::vector<std::string> bad_lines;
    std::string line;
    size_t line_number = 0;

    while (std::getline(file, line)) {
        ++line_number;
        line = StringUtils::trim(line);

        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        if (line.front() == '[') {
            if (line.back() != ']') {
                bad_lines.push_back(std::to_string(line_number));
                continue;
            }
            section = StringUtils::trim(line.substr(1, line.size() - 2));
            continue;
        }

        auto eq_pos = line.find('=');
        std::string key = eq_pos == std::string::npos ? "" : StringUtils::trim(line.substr(0, eq_pos));
        if (key.empty()) {
            bad_lines.push_back(std::to_string(line_number));
            continue;
        }

        if (!section.empty()) {
            key = section + "." + key;
        }
        values_[key] = StringUtils::trim(line.substr(eq_pos + 1));
    }

    if (!bad_lines.empty()) {
        std::string joined;
        for (const auto& number : bad_lines) {
            joined += (joined.empty() ? "" : ", ") + number;
        }
        return Result(ErrorCode::INVALID_ARGUMENT, filename + ": ignored malformed line(s) " + joined);
    }
    return Result();
}

Result Config::save_to_file(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        return Result(ErrorCode::FILE_WRITE_ERROR, "Cannot write config file: " + filename);
    }

    file << "# mediaharvest configuration\n";

    // Keys are ordered, so each section's keys are contiguous.
    std::string current = "\x01";
    for (const auto& [key, value] : values_) {
        auto [section, name] = split_key(key);
        if (section != current) {
            file << "\n";
            if (!section.empty()) {
                file << "[" << section << "]\n";
            }
            current = section;
        }
        file << name << " = " << value << "\n";
    }

    if (!file) {
        return Result(ErrorCode::FILE_WRITE_ERROR, "Write failed for config file: " + filename);
    }
    return Result();
}

void Config::apply_environment() {
    if (const char* workers = std::getenv("MEDIAHARVEST_CONCURRENCY"); workers && *workers) {
        values_["harvest.workers"] = StringUtils::trim(workers);
    }
    if (const char* rate = std::getenv("MEDIAHARVEST_RATE"); rate && *rate) {
        values_["harvest.rate"] = StringUtils::trim(rate);
    }
}

void Config::set(const std::string& key, const std::string& value) {
    values_[key] = value;
}

std::optional<std::string> Config::get(const std::string& key) const {
    auto it = values_.find(key);
    if (it != values_.end()) {
        return it->second;
    }
    return std::nullopt;
}

bool Config::get_bool(const std::string& key, bool default_value) const {
    auto value = get(key);
    if (!value) return default_value;

    auto lower = StringUtils::to_lower(*value);
    if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") return true;
    if (lower == "false" || lower == "0" || lower == "no" || lower == "off") return false;
    return default_value;
}

int Config::get_int(const std::string& key, int default_value) const {
    auto value = get(key);
    if (!value || value->empty()) return default_value;

    try {
        size_t used = 0;
        int result = std::stoi(*value, &used);
        return used == value->size() ? result : default_value;
    } catch (const std::exception&) {
        return default_value;
    }
}

double Config::get_double(const std::string& key, double default_value) const {
    auto value = get(key);
    if (!value || value->empty()) return default_value;

    try {
        size_t used = 0;
        double result = std::stod(*value, &used);
        return used == value->size() ? result : default_value;
    } catch (const std::exception&) {
        return default_value;
    }
}

std::string Config::get_string(const std::string& key, const std::string& default_value) const {
    auto value = get(key);
    return value ? *value : default_value;
}

std::vector<std::string> Config::keys() const {
    std::vector<std::string> result;
    result.reserve(values_.size());
    for (const auto& [key, value] : values_) {
        result.push_back(key);
    }
    return result;
}

void Config::set_defaults() {
    values_["harvest.workers"] = "4";
    values_["harvest.rate"] = "4.0";
    values_["harvest.probe"] = "true";
    values_["harvest.fingerprint"] = "false";
    values_["harvest.fingerprint_bytes"] = "65536";
    values_["harvest.retry_attempts"] = "3";
    values_["harvest.backoff_ms"] = "1000";
    values_["harvest.force"] = "false";
    values_["harvest.output_dir"] = "downloads";
    values_["export.format"] = "json";
    values_["index.path"] = "downloads/.media_index.sqlite";
    values_["http.user_agent"] = "mediaharvest/1.0";
    values_["http.connect_timeout"] = "25";
    values_["http.read_timeout"] = "25";
    values_["http.probe_timeout"] = "10";
    values_["log.level"] = "info";
    values_["log.file"] = "mediaharvest.log";
}

} // namespace mediaharvest::core
