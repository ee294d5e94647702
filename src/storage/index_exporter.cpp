#include "mediaharvest/storage/index_exporter.hpp"
#include "mediaharvest/core/logger.hpp"
#include "mediaharvest/core/utils.hpp"
#include "mediaharvest/storage/dedup_index.hpp"
#include <nlohmann/json.hpp>
#include <fstream>

namespace mediaharvest::storage {

using core::ErrorCode;
using core::Result;
using json = nlohmann::ordered_json;

namespace {

std::vector<std::vector<std::string>> to_rows(const KeyHashPairs& pairs) {
    std::vector<std::vector<std::string>> rows;
    rows.reserve(pairs.size());
    for (const auto& [key, hash] : pairs) {
        rows.push_back({key, hash});
    }
    return rows;
}

json to_object(const KeyHashPairs& pairs) {
    json object = json::object();
    for (const auto& [key, hash] : pairs) {
        object[key] = hash;
    }
    return object;
}

}

std::optional<ExportFormat> export_format_from_string(const std::string& name) {
    auto lower = core::utils::StringUtils::to_lower(name);
    if (lower == "json") return ExportFormat::JSON;
    if (lower == "csv") return ExportFormat::CSV;
    return std::nullopt;
}

IndexExporter::IndexExporter(DedupIndex& index) : index_(index) {
}

std::string IndexExporter::escape_field(const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) {
        return field;
    }
    return "\"" + core::utils::StringUtils::replace_all(field, "\"", "\"\"") + "\"";
}

Result IndexExporter::export_to(const std::filesystem::path& output_dir, ExportFormat format) {
    written_files_.clear();
    
    if (!index_.is_open()) {
        return Result(ErrorCode::INDEX_UNAVAILABLE, "Index is not open");
    }
    if (!core::utils::FileUtils::create_directories(output_dir)) {
        return Result(ErrorCode::FILE_WRITE_ERROR, "Cannot create " + output_dir.string());
    }
    
    auto result = format == ExportFormat::JSON ? write_json(output_dir) : write_csv(output_dir);
    if (!result) {
        return result;
    }
    
    LOG_INFO("Exported index to {} ({})", output_dir.string(), format == ExportFormat::JSON ? "json" : "csv");
    return Result();
}

Result IndexExporter::write_csv(const std::filesystem::path& output_dir) {
    std::vector<std::vector<std::string>> path_rows;
    for (const auto& row : index_.snapshot_paths()) {
        path_rows.push_back({row.content_hash, row.path.string()});
    }
    
    std::vector<std::vector<std::string>> failed_rows;
    for (const auto& entry : index_.failed_urls()) {
        failed_rows.push_back({entry.url, entry.reason, std::to_string(entry.attempts),
                               core::utils::TimeUtils::to_iso_string(entry.last_seen)});
    }
    
    Result result;
    if (!(result = write_table(output_dir / "url_records.csv", {"url", "content_hash"}, to_rows(index_.url_records())))) {
        return result;
    }
    if (!(result = write_table(output_dir / "path_records.csv", {"content_hash", "path"}, path_rows))) {
        return result;
    }
    if (!(result = write_table(output_dir / "etag_records.csv", {"etag", "content_hash"}, to_rows(index_.etag_records())))) {
        return result;
    }
    if (!(result = write_table(output_dir / "fingerprint_records.csv", {"fingerprint", "content_hash"},
                               to_rows(index_.fingerprint_records())))) {
        return result;
    }
    return write_table(output_dir / "failed_urls.csv", {"url", "reason", "attempts", "last_seen"}, failed_rows);
}

Result IndexExporter::write_json(const std::filesystem::path& output_dir) {
    json paths = json::object();
    for (const auto& row : index_.snapshot_paths()) {
        paths[row.content_hash].push_back(row.path.string());
    }
    
    json failed = json::array();
    for (const auto& entry : index_.failed_urls()) {
        failed.push_back({
            {"url", entry.url},
            {"reason", entry.reason},
            {"attempts", entry.attempts},
            {"last_seen", core::utils::TimeUtils::to_iso_string(entry.last_seen)}
        });
    }
    
    // Paths and URLs are not guaranteed to be valid UTF-8.
    auto dump = [](const json& document) {
        return document.dump(2, ' ', false, json::error_handler_t::replace) + "\n";
    };
    
    Result result;
    if (!(result = write_document(output_dir / "url_records.json", dump(to_object(index_.url_records()))))) {
        return result;
    }
    if (!(result = write_document(output_dir / "path_records.json", dump(paths)))) {
        return result;
    }
    if (!(result = write_document(output_dir / "etag_records.json", dump(to_object(index_.etag_records()))))) {
        return result;
    }
    if (!(result = write_document(output_dir / "fingerprint_records.json",
                                  dump(to_object(index_.fingerprint_records()))))) {
        return result;
    }
    return write_document(output_dir / "failed_urls.json", dump(failed));
}

Result IndexExporter::write_table(const std::filesystem::path& file,
                                  const std::vector<std::string>& header,
                                  const std::vector<std::vector<std::string>>& rows) {
    std::ofstream out(file, std::ios::trunc);
    if (!out.is_open()) {
        return Result(ErrorCode::FILE_WRITE_ERROR, "Cannot write " + file.string());
    }
    
    auto write_row = [&out](const std::vector<std::string>& fields) {
        for (size_t i = 0; i < fields.size(); ++i) {
            if (i > 0) out << ',';
            out << escape_field(fields[i]);
        }
        out << "\r\n";
    };
    
    write_row(header);
    for (const auto& row : rows) {
        write_row(row);
    }
    
    out.flush();
    if (!out.good()) {
        return Result(ErrorCode::FILE_WRITE_ERROR, "Write failed for " + file.string());
    }
    
    written_files_.push_back(file);
    LOG_DEBUG("Wrote {} row(s) to {}", rows.size(), file.string());
    return Result();
}

Result IndexExporter::write_document(const std::filesystem::path& file, const std::string& text) {
    std::ofstream out(file, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return Result(ErrorCode::FILE_WRITE_ERROR, "Cannot write " + file.string());
    }
    
    out << text;
    out.flush();
    if (!out.good()) {
        return Result(ErrorCode::FILE_WRITE_ERROR, "Write failed for " + file.string());
    }
    
    written_files_.push_back(file);
    LOG_DEBUG("Wrote {}", file.string());
    return Result();
}

} // namespace mediaharvest::storage
