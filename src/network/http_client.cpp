#include "mediaharvest/network/http_client.hpp"
#include "mediaharvest/core/utils.hpp"
#include "mediaharvest/dedup/url_normalizer.hpp"
#include <charconv>

namespace mediaharvest::network {

std::optional<std::string> HttpResponseHead::header(const std::string& name) const {
    auto it = headers.find(core::utils::StringUtils::to_lower(name));
    if (it == headers.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<uint64_t> HttpResponseHead::content_length() const {
    auto value = header("content-length");
    if (!value || value->empty()) {
        return std::nullopt;
    }
    
    uint64_t length = 0;
    auto [ptr, ec] = std::from_chars(value->data(), value->data() + value->size(), length);
    if (ec != std::errc() || ptr != value->data() + value->size()) {
        return std::nullopt;
    }
    return length;
}

std::string unescape_url(const std::string& url) {
    return core::utils::StringUtils::replace_all(url, "&amp;", "&");
}

std::vector<std::pair<std::string, std::string>> default_headers_for(const std::string& url) {
    std::vector<std::pair<std::string, std::string>> headers;
    
    auto host = dedup::host_of(url);
    if (dedup::host_matches(host, "i.redd.it") || dedup::host_matches(host, "preview.redd.it")) {
        headers.emplace_back("Referer", "https://www.reddit.com/");
    }
    return headers;
}

} // namespace mediaharvest::network
