#include "mediaharvest/network/fetcher.hpp"
#include "mediaharvest/core/logger.hpp"
#include "mediaharvest/core/utils.hpp"
#include "mediaharvest/dedup/url_normalizer.hpp"
#include "mediaharvest/storage/sidecar.hpp"
#include <fstream>
#include <thread>

namespace mediaharvest::network {

using core::ErrorCode;
using core::Result;
using core::utils::FileUtils;
using core::utils::StringUtils;

namespace {

std::string strip_quotes(std::string value) {
    value = StringUtils::trim(value);
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        value = value.substr(1, value.size() - 2);
    }
    return value;
}

std::string parameter_value(const std::string& disposition, size_t value_start) {
    auto end = disposition.find(';', value_start);
    return disposition.substr(value_start, end == std::string::npos ? std::string::npos : end - value_start);
}

void remove_quietly(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
}

}

std::optional<std::string> filename_from_disposition(const std::string& disposition) {
    std::string lower = StringUtils::to_lower(disposition);
    
    const std::string extended = "filename*=utf-8''";
    auto pos = lower.find(extended);
    if (pos != std::string::npos) {
        auto value = StringUtils::trim(parameter_value(disposition, pos + extended.size()));
        value = StringUtils::percent_decode(value);
        if (!value.empty()) {
            return value;
        }
    }
    
    const std::string plain = "filename=";
    pos = lower.find(plain);
    if (pos != std::string::npos) {
        auto value = strip_quotes(parameter_value(disposition, pos + plain.size()));
        value = StringUtils::percent_decode(value);
        if (!value.empty()) {
            return value;
        }
    }
    
    return std::nullopt;
}

std::string url_basename(const std::string& url) {
    auto parts = dedup::split_url(url);
    if (!parts) {
        return "";
    }
    
    auto slash = parts->path.find_last_of('/');
    std::string name = slash == std::string::npos ? parts->path : parts->path.substr(slash + 1);
    return StringUtils::percent_decode(name);
}

std::string url_extension(const std::string& url) {
    auto name = url_basename(url);
    if (name.empty()) {
        return "";
    }
    return std::filesystem::path(name).extension().string();
}

std::optional<std::string> mirror_url_for(const std::string& url) {
    auto parts = dedup::split_url(url);
    if (!parts || !dedup::host_matches(parts->host, "media.redgifs.com")) {
        return std::nullopt;
    }
    
    const std::string suffix = ".mp4";
    const std::string mobile_suffix = "-mobile.mp4";
    if (!StringUtils::ends_with(parts->path, suffix) || StringUtils::ends_with(parts->path, mobile_suffix)) {
        return std::nullopt;
    }
    
    parts->path = parts->path.substr(0, parts->path.size() - suffix.size()) + mobile_suffix;
    parts->query.clear();
    parts->fragment.clear();
    return dedup::join_url(*parts);
}

bool is_html_content_type(const std::string& content_type) {
    auto lower = StringUtils::to_lower(content_type);
    return lower.find("text/html") != std::string::npos ||
           lower.find("application/xhtml+xml") != std::string::npos;
}

Fetcher::Fetcher(std::shared_ptr<HttpClient> client, FetchSettings settings,
                 std::shared_ptr<storage::NameReservations> reservations)
    : client_(std::move(client))
    , settings_(settings)
    , reservations_(std::move(reservations)) {
    if (settings_.max_attempts < 1) {
        settings_.max_attempts = 1;
    }
    if (!reservations_) {
        reservations_ = std::make_shared<storage::NameReservations>();
    }
}

std::filesystem::path Fetcher::initial_destination(const FetchRequest& request, const std::string& url) {
    if (request.target_path) {
        return *request.target_path;
    }
    
    if (request.suggested_name) {
        auto name = FileUtils::sanitize_filename(*request.suggested_name);
        if (!name.empty()) {
            return request.folder / (name + FileUtils::sanitize_filename(url_extension(url)));
        }
    }
    
    auto name = FileUtils::sanitize_filename(url_basename(url));
    if (name.empty()) {
        name = "file";
    }
    return request.folder / name;
}

FetchResult Fetcher::fetch(const FetchRequest& request) {
    FetchResult fetch;
    
    std::string url = unescape_url(request.url);
    auto intended = initial_destination(request, url);
    
    auto parent = intended.parent_path();
    if (!parent.empty() && !FileUtils::create_directories(parent)) {
        fetch.error = Result(ErrorCode::FILE_WRITE_ERROR, "Cannot create folder " + parent.string());
        LOG_WARN("{}", fetch.error.message);
        return fetch;
    }
    
    auto backoff = settings_.backoff_base;
    Attempt last;
    
    for (int attempt = 1; attempt <= settings_.max_attempts; ++attempt) {
        fetch.attempts = attempt;
        last = attempt_once(url, request, intended);
        
        if (!last.result.success() && attempt == settings_.max_attempts && settings_.use_mirrors) {
            if (auto mirror = mirror_url_for(url)) {
                LOG_DEBUG("Trying mirror {} for {}", *mirror, url);
                auto mirrored = attempt_once(*mirror, request, intended);
                if (mirrored.result.success()) {
                    last = std::move(mirrored);
                }
            }
        }
        
        if (last.result.success()) {
            break;
        }
        
        LOG_DEBUG("Attempt {}/{} for {} failed: {}", attempt, settings_.max_attempts, url, last.result.describe());
        
        if (attempt < settings_.max_attempts) {
            std::this_thread::sleep_for(backoff);
            backoff *= 2;
        }
    }
    
    if (last.result.success()) {
        fetch.outcome = FetchOutcome::DOWNLOADED;
        fetch.path = last.path;
        fetch.bytes_written = last.bytes_written;
        fetch.etag = last.etag;
        fetch.content_type = last.content_type;
        
        auto stale = storage::sidecar_path_for(intended);
        std::error_code ec;
        if (std::filesystem::exists(stale, ec)) {
            storage::remove_sidecar(stale);
        }
        return fetch;
    }
    
    fetch.error = last.result;
    fetch.content_type = last.content_type;
    
    std::vector<std::string> details = {"attempts: " + std::to_string(fetch.attempts)};
    if (last.status != 0) {
        details.push_back("HTTP " + std::to_string(last.status));
    }
    if (!last.content_type.empty()) {
        details.push_back("content-type: " + last.content_type);
    }
    
    auto written = storage::write_sidecar(intended, url, last.result.describe(), details);
    if (written) {
        fetch.sidecar_path = storage::sidecar_path_for(intended);
    } else {
        LOG_ERROR("{}", written.describe());
    }
    return fetch;
}

Fetcher::Attempt Fetcher::attempt_once(const std::string& url, const FetchRequest& request,
                                       const std::filesystem::path& intended) {
    Attempt attempt;
    
    HttpRequest http;
    http.url = url;
    http.headers = default_headers_for(url);
    http.connect_timeout = settings_.connect_timeout;
    http.read_timeout = settings_.read_timeout;
    
    std::ofstream out;
    std::filesystem::path requested;
    std::filesystem::path destination;
    std::filesystem::path part_path;
    bool reserved = false;
    
    auto on_headers = [&](const HttpResponseHead& head) {
        attempt.status = head.status;
        attempt.content_type = head.header("content-type").value_or("");
        
        if (!head.is_success()) {
            attempt.result = Result(ErrorCode::HTTP_ERROR, "HTTP " + std::to_string(head.status));
            return false;
        }
        if (is_html_content_type(attempt.content_type)) {
            attempt.result = Result(ErrorCode::HTML_RESPONSE,
                                    "HTML response detected (content-type: " + attempt.content_type + ")");
            return false;
        }
        
        attempt.etag = head.header("etag");
        
        destination = intended;
        if (!request.target_path) {
            if (auto disposition = head.header("content-disposition")) {
                if (auto name = filename_from_disposition(*disposition)) {
                    auto sanitized = FileUtils::sanitize_filename(*name);
                    if (!sanitized.empty()) {
                        destination = intended.parent_path() / sanitized;
                    }
                }
            }
        }
        
        requested = destination;
        destination = reservations_->reserve_unique(requested);
        reserved = true;
        
        part_path = destination;
        part_path += ".part";
        out.open(part_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            attempt.result = Result(ErrorCode::FILE_WRITE_ERROR, "Cannot open " + part_path.string());
            return false;
        }
        return true;
    };
    
    auto on_chunk = [&](std::span<const uint8_t> chunk) {
        out.write(reinterpret_cast<const char*>(chunk.data()), static_cast<std::streamsize>(chunk.size()));
        if (!out.good()) {
            attempt.result = Result(ErrorCode::FILE_WRITE_ERROR, "Write failed for " + part_path.string());
            return false;
        }
        attempt.bytes_written += chunk.size();
        return true;
    };
    
    auto outcome = client_->get(http, on_headers, on_chunk);
    
    if (out.is_open()) {
        out.close();
        if (out.fail() && attempt.result.success()) {
            attempt.result = Result(ErrorCode::FILE_WRITE_ERROR, "Close failed for " + part_path.string());
        }
    }
    
    if (attempt.result.success()) {
        if (!outcome.result.success()) {
            attempt.result = outcome.result;
        } else if (part_path.empty()) {
            attempt.result = Result(ErrorCode::NETWORK_ERROR, "No response received");
        }
    }
    
    if (attempt.result.success()) {
        attempt.result = publish(part_path, requested, destination);
        if (attempt.result.success()) {
            attempt.path = destination;
        }
    }
    
    if (!attempt.result.success() && !part_path.empty()) {
        remove_quietly(part_path);
    }
    if (reserved) {
        reservations_->release(destination);
    }
    return attempt;
}

Result Fetcher::publish(const std::filesystem::path& part_path, const std::filesystem::path& requested,
                        std::filesystem::path& destination) {
    const int max_renames = 100;
    std::error_code ec;
    
    for (int i = 0; i < max_renames; ++i) {
        ec.clear();
        std::filesystem::create_hard_link(part_path, destination, ec);
        if (!ec) {
            remove_quietly(part_path);
            return Result();
        }
        if (ec != std::errc::file_exists) {
            break;
        }
        
        // Something else put a file at our reserved name; leave it alone.
        auto next = reservations_->reserve_unique(requested);
        LOG_DEBUG("{} appeared during download, using {}", destination.string(), next.string());
        reservations_->release(destination);
        destination = next;
    }
    
    if (ec == std::errc::file_exists) {
        return Result(ErrorCode::FILE_WRITE_ERROR, "No free name for " + requested.string());
    }
    
    // No hard links on this filesystem; rename, which only replaces a file
    // created in the instant after the existence check.
    LOG_DEBUG("Hard link to {} failed ({}), renaming", destination.string(), ec.message());
    std::error_code exists_ec;
    while (std::filesystem::exists(destination, exists_ec)) {
        auto next = reservations_->reserve_unique(requested);
        reservations_->release(destination);
        destination = next;
    }
    
    ec.clear();
    std::filesystem::rename(part_path, destination, ec);
    if (ec) {
        return Result(ErrorCode::FILE_WRITE_ERROR,
                      "Cannot move " + part_path.string() + " into place: " + ec.message());
    }
    return Result();
}

} // namespace mediaharvest::network
