#pragma once

#include "mediaharvest/core/error.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace mediaharvest::storage {

class DedupIndex;

enum class ExportFormat {
    JSON,
    CSV
};

std::optional<ExportFormat> export_format_from_string(const std::string& name);

/**
 * Dumps every index table into one file per table.
 *
 * CSV files carry a header row and RFC 4180 quoting. JSON files map keys to
 * content hashes (`url_records.json`, `etag_records.json`,
 * `fingerprint_records.json`), each hash to its array of paths
 * (`path_records.json`), and list failures as objects (`failed_urls.json`).
 */
class IndexExporter {
public:
    explicit IndexExporter(DedupIndex& index);
    
    core::Result export_to(const std::filesystem::path& output_dir, ExportFormat format = ExportFormat::CSV);
    
    const std::vector<std::filesystem::path>& written_files() const { return written_files_; }
    
    static std::string escape_field(const std::string& field);

private:
    core::Result write_csv(const std::filesystem::path& output_dir);
    core::Result write_json(const std::filesystem::path& output_dir);
    
    core::Result write_table(const std::filesystem::path& file,
                             const std::vector<std::string>& header,
                             const std::vector<std::vector<std::string>>& rows);
    core::Result write_document(const std::filesystem::path& file, const std::string& text);
    
    DedupIndex& index_;
    std::vector<std::filesystem::path> written_files_;
};

} // namespace mediaharvest::storage
