#pragma once

#include "mediaharvest/core/error.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace mediaharvest::core {

// Process-wide settings store. Files hold `key = value` lines; a `[section]` header prefixes the
// keys after it, so `[harvest]` followed by `workers = 8` sets `harvest.workers`.
class Config {
public:
    static Config& instance();

    // Malformed lines are skipped and reported in the returned message.
    Result load_from_file(const std::string& filename);
    Result save_to_file(const std::string& filename) const;

    // MEDIAHARVEST_CONCURRENCY and MEDIAHARVEST_RATE override the file values.
    void apply_environment();

    void set(const std::string& key, const std::string& value);
    std::optional<std::string> get(const std::string& key) const;

    // Typed getters return the default when the key is missing or does not parse as a whole.
    bool get_bool(const std::string& key, bool default_value = false) const;
    int get_int(const std::string& key, int default_value = 0) const;
    double get_double(const std::string& key, double default_value = 0.0) const;
    std::string get_string(const std::string& key, const std::string& default_value = "") const;

    std::vector<std::string> keys() const;

    void set_defaults();
    void clear() { values_.clear(); }

private:
    Config() = default;

    std::map<std::string, std::string> values_;
};

} // namespace mediaharvest::core
