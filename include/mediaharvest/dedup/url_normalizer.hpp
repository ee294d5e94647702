#pragma once

#include <optional>
#include <set>
#include <string>
#include <vector>

namespace mediaharvest::dedup {

struct NormalizerRules {
    // Hosts (exact or dot-suffix) whose URLs carry signed, short-lived query strings.
    std::vector<std::string> strip_query_hosts;
    std::set<std::string> ephemeral_params;
    std::vector<std::string> tracking_prefixes;
    
    static NormalizerRules defaults();
};

struct UrlParts {
    std::string scheme;
    std::string authority;
    std::string host;
    std::string path;
    std::string query;
    std::string fragment;
};

// Splits scheme://authority/path?query#fragment. nullopt when there is no scheme or host.
std::optional<UrlParts> split_url(const std::string& url);

std::string join_url(const UrlParts& parts);

// Lower-cased host, empty when the URL does not parse.
std::string host_of(const std::string& url);

// Short label for log lines, e.g. "Redgifs", "Redd.it", "Imgur".
std::string host_label(const std::string& url);

bool host_matches(const std::string& host, const std::string& rule);

class UrlNormalizer {
public:
    UrlNormalizer();
    explicit UrlNormalizer(NormalizerRules rules);
    
    // Pure and idempotent. Returns the input unchanged when it cannot be parsed.
    std::string normalize(const std::string& url) const;
    
    const NormalizerRules& rules() const { return rules_; }

private:
    bool strips_query(const std::string& host) const;
    bool drops_param(const std::string& key) const;
    
    NormalizerRules rules_;
};

} // namespace mediaharvest::dedup
