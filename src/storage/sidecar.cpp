#include "mediaharvest/storage/sidecar.hpp"
#include "mediaharvest/core/logger.hpp"
#include "mediaharvest/core/utils.hpp"
#include "mediaharvest/crypto/hash.hpp"
#include "mediaharvest/storage/dedup_index.hpp"
#include <algorithm>
#include <fstream>

namespace mediaharvest::storage {

using core::ErrorCode;
using core::Result;
using core::utils::StringUtils;

namespace {

bool is_partial_download(const std::filesystem::path& path) {
    return path.extension() == ".part";
}

// Printable single-line excerpt of a payload for the sidecar's diagnostics.
std::string excerpt(const std::string& sample) {
    std::string text;
    for (char c : sample) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (c == '\n' || c == '\r' || c == '\t') {
            text += ' ';
        } else if (uc >= 0x20 && uc < 0x7f) {
            text += c;
        }
        if (text.size() >= 200) break;
    }
    return text;
}

}

std::filesystem::path sidecar_path_for(const std::filesystem::path& destination) {
    auto path = destination;
    path += SIDECAR_EXTENSION;
    return path;
}

std::filesystem::path target_for_sidecar(const std::filesystem::path& sidecar_path) {
    auto text = sidecar_path.string();
    if (StringUtils::ends_with(text, SIDECAR_EXTENSION)) {
        text.resize(text.size() - std::string(SIDECAR_EXTENSION).size());
    }
    return text;
}

bool is_sidecar(const std::filesystem::path& path) {
    return path.extension() == SIDECAR_EXTENSION;
}

Result write_sidecar(const std::filesystem::path& destination,
                     const std::string& url,
                     const std::string& error,
                     const std::vector<std::string>& details) {
    auto path = sidecar_path_for(destination);
    
    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) {
        return Result(ErrorCode::FILE_WRITE_ERROR, "Cannot write sidecar: " + path.string());
    }
    
    file << url << "\n" << error << "\n";
    for (const auto& line : details) {
        file << line << "\n";
    }
    
    file.flush();
    if (!file.good()) {
        return Result(ErrorCode::FILE_WRITE_ERROR, "Cannot write sidecar: " + path.string());
    }
    return Result();
}

std::optional<Sidecar> read_sidecar(const std::filesystem::path& sidecar_path) {
    std::ifstream file(sidecar_path);
    if (!file.is_open()) {
        return std::nullopt;
    }
    
    Sidecar sidecar;
    sidecar.sidecar_path = sidecar_path;
    sidecar.target_path = target_for_sidecar(sidecar_path);
    
    std::string line;
    if (!std::getline(file, line)) {
        return std::nullopt;
    }
    sidecar.url = StringUtils::trim(line);
    if (sidecar.url.empty()) {
        return std::nullopt;
    }
    
    if (std::getline(file, line)) {
        sidecar.error = StringUtils::trim(line);
    }
    while (std::getline(file, line)) {
        sidecar.details.push_back(line);
    }
    return sidecar;
}

bool remove_sidecar(const std::filesystem::path& sidecar_path) {
    std::error_code ec;
    std::filesystem::remove(sidecar_path, ec);
    if (ec) {
        LOG_WARN("Cannot remove sidecar {}: {}", sidecar_path.string(), ec.message());
        return false;
    }
    return true;
}

std::vector<std::filesystem::path> find_sidecars(const std::filesystem::path& root) {
    std::vector<std::filesystem::path> sidecars;
    
    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec)) {
        return sidecars;
    }
    
    for (auto it = std::filesystem::recursive_directory_iterator(root, ec);
         !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        std::error_code entry_ec;
        if (it->is_regular_file(entry_ec) && is_sidecar(it->path())) {
            sidecars.push_back(it->path());
        }
    }
    if (ec) {
        LOG_WARN("Sidecar scan of {} stopped early: {}", root.string(), ec.message());
    }
    
    std::sort(sidecars.begin(), sidecars.end());
    return sidecars;
}

std::vector<transfer::DownloadTask> tasks_from_sidecars(const std::filesystem::path& root) {
    std::vector<transfer::DownloadTask> tasks;
    
    for (const auto& path : find_sidecars(root)) {
        auto sidecar = read_sidecar(path);
        if (!sidecar) {
            LOG_WARN("Ignoring unreadable sidecar {}", path.string());
            continue;
        }
        
        transfer::DownloadTask task;
        task.url = sidecar->url;
        task.folder = sidecar->target_path.parent_path();
        task.target_path = sidecar->target_path;
        task.sidecar = path;
        tasks.push_back(std::move(task));
    }
    return tasks;
}

bool looks_like_html(const std::filesystem::path& file) {
    auto sample = StringUtils::to_lower(core::utils::FileUtils::read_prefix(file, HTML_SNIFF_BYTES));
    return sample.find("<!doctype html") != std::string::npos ||
           sample.find("<html") != std::string::npos ||
           sample.find("<script") != std::string::npos;
}

std::vector<std::filesystem::path> find_html_payloads(const std::filesystem::path& root) {
    std::vector<std::filesystem::path> payloads;
    
    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec)) {
        return payloads;
    }
    
    for (auto it = std::filesystem::recursive_directory_iterator(root, ec);
         !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        const auto& path = it->path();
        std::error_code entry_ec;
        if (!it->is_regular_file(entry_ec) || is_sidecar(path) || is_partial_download(path)) {
            continue;
        }
        if (looks_like_html(path)) {
            payloads.push_back(path);
        }
    }
    
    std::sort(payloads.begin(), payloads.end());
    return payloads;
}

HtmlScanReport mark_html_payloads(const std::filesystem::path& root, DedupIndex& index) {
    HtmlScanReport report;
    
    auto payloads = find_html_payloads(root);
    report.scanned = payloads.size();
    
    for (const auto& payload : payloads) {
        auto hash = crypto::hash_utils::content_hash_hex(payload);
        std::vector<std::string> urls;
        if (hash) {
            urls = index.urls_for(*hash);
        }
        
        if (urls.empty()) {
            LOG_WARN("HTML payload {} has no known source URL", payload.string());
            report.unresolved.push_back(payload);
            continue;
        }
        
        std::vector<std::string> details = {
            "file: " + payload.string(),
            "sample: " + excerpt(core::utils::FileUtils::read_prefix(payload, HTML_SNIFF_BYTES))
        };
        auto written = write_sidecar(payload, urls.front(), "HTML content detected", details);
        if (!written) {
            LOG_WARN("{}", written.describe());
            continue;
        }
        
        auto forgotten = index.forget(*hash);
        if (!forgotten) {
            LOG_WARN("Cannot drop {} from index: {}", *hash, forgotten.describe());
        }
        
        std::error_code ec;
        std::filesystem::remove(payload, ec);
        if (ec) {
            LOG_WARN("Cannot remove HTML payload {}: {}", payload.string(), ec.message());
        }
        
        LOG_INFO("Marked HTML payload as failed: {}", payload.string());
        report.marked++;
    }
    
    return report;
}

} // namespace mediaharvest::storage
