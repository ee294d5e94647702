#include "mediaharvest/dedup/url_normalizer.hpp"
#include "mediaharvest/core/utils.hpp"
#include <algorithm>
#include <cctype>

namespace mediaharvest::dedup {

using core::utils::StringUtils;

NormalizerRules NormalizerRules::defaults() {
    NormalizerRules rules;
    rules.strip_query_hosts = {"i.redd.it", "preview.redd.it", "redgifs.com"};
    rules.ephemeral_params = {"s", "sig", "signature", "token", "expires", "ttl", "key", "st", "se"};
    rules.tracking_prefixes = {"utm_"};
    return rules;
}

namespace {

bool valid_scheme(const std::string& scheme) {
    if (scheme.empty() || !std::isalpha(static_cast<unsigned char>(scheme[0]))) {
        return false;
    }
    return std::all_of(scheme.begin(), scheme.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.';
    });
}

std::string host_from_authority(const std::string& authority) {
    std::string host = authority;
    
    auto at = host.rfind('@');
    if (at != std::string::npos) {
        host = host.substr(at + 1);
    }
    
    if (!host.empty() && host[0] == '[') {
        auto close = host.find(']');
        return close == std::string::npos ? "" : StringUtils::to_lower(host.substr(0, close + 1));
    }
    
    auto colon = host.find(':');
    if (colon != std::string::npos) {
        host = host.substr(0, colon);
    }
    
    return StringUtils::to_lower(host);
}

}

std::optional<UrlParts> split_url(const std::string& url) {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        return std::nullopt;
    }
    
    UrlParts parts;
    parts.scheme = url.substr(0, scheme_end);
    if (!valid_scheme(parts.scheme)) {
        return std::nullopt;
    }
    
    std::string rest = url.substr(scheme_end + 3);
    
    auto fragment_pos = rest.find('#');
    if (fragment_pos != std::string::npos) {
        parts.fragment = rest.substr(fragment_pos + 1);
        rest.resize(fragment_pos);
    }
    
    auto query_pos = rest.find('?');
    if (query_pos != std::string::npos) {
        parts.query = rest.substr(query_pos + 1);
        rest.resize(query_pos);
    }
    
    auto path_pos = rest.find('/');
    if (path_pos != std::string::npos) {
        parts.authority = rest.substr(0, path_pos);
        parts.path = rest.substr(path_pos);
    } else {
        parts.authority = rest;
    }
    
    parts.host = host_from_authority(parts.authority);
    if (parts.host.empty()) {
        return std::nullopt;
    }
    
    return parts;
}

std::string join_url(const UrlParts& parts) {
    std::string url = parts.scheme + "://" + parts.authority + parts.path;
    if (!parts.query.empty()) {
        url += "?" + parts.query;
    }
    if (!parts.fragment.empty()) {
        url += "#" + parts.fragment;
    }
    return url;
}

std::string host_of(const std::string& url) {
    auto parts = split_url(url);
    return parts ? parts->host : "";
}

std::string host_label(const std::string& url) {
    std::string host = host_of(url);
    
    if (host.find("redgifs") != std::string::npos) {
        return "Redgifs";
    }
    if (host.find("reddit") != std::string::npos || host.find("redd.it") != std::string::npos) {
        return "Redd.it";
    }
    
    auto labels = StringUtils::split(host, '.');
    if (labels.size() >= 2) {
        std::string sld = labels[labels.size() - 2];
        const std::string& tld = labels.back();
        if (!sld.empty()) {
            sld[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(sld[0])));
        }
        return tld == "it" ? sld + "." + tld : sld;
    }
    
    if (host.empty()) {
        return "Unknown";
    }
    host[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(host[0])));
    return host;
}

bool host_matches(const std::string& host, const std::string& rule) {
    if (host == rule) {
        return true;
    }
    return StringUtils::ends_with(host, "." + rule);
}

UrlNormalizer::UrlNormalizer() : rules_(NormalizerRules::defaults()) {
}

UrlNormalizer::UrlNormalizer(NormalizerRules rules) : rules_(std::move(rules)) {
}

std::string UrlNormalizer::normalize(const std::string& url) const {
    auto parsed = split_url(url);
    if (!parsed) {
        return url;
    }
    
    UrlParts parts = *parsed;
    
    if (strips_query(parts.host)) {
        parts.query.clear();
        parts.fragment.clear();
        return join_url(parts);
    }
    
    std::vector<std::string> kept;
    for (const auto& segment : StringUtils::split(parts.query, '&')) {
        if (segment.empty()) {
            continue;
        }
        
        auto eq = segment.find('=');
        std::string key = segment.substr(0, eq);
        key = StringUtils::to_lower(StringUtils::percent_decode(StringUtils::replace_all(key, "+", " ")));
        
        if (drops_param(key)) {
            continue;
        }
        kept.push_back(segment);
    }
    
    parts.query.clear();
    for (size_t i = 0; i < kept.size(); ++i) {
        if (i > 0) parts.query += '&';
        parts.query += kept[i];
    }
    
    return join_url(parts);
}

bool UrlNormalizer::strips_query(const std::string& host) const {
    return std::any_of(rules_.strip_query_hosts.begin(), rules_.strip_query_hosts.end(),
                       [&host](const std::string& rule) { return host_matches(host, rule); });
}

bool UrlNormalizer::drops_param(const std::string& key) const {
    if (rules_.ephemeral_params.count(key) > 0) {
        return true;
    }
    return std::any_of(rules_.tracking_prefixes.begin(), rules_.tracking_prefixes.end(),
                       [&key](const std::string& prefix) { return StringUtils::starts_with(key, prefix); });
}

} // namespace mediaharvest::dedup
