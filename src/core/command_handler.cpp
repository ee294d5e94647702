#include "mediaharvest/core/command_handler.hpp"
#include "mediaharvest/core/config.hpp"
#include "mediaharvest/core/harvester.hpp"
#include "mediaharvest/core/logger.hpp"
#include "mediaharvest/core/utils.hpp"
#include "mediaharvest/storage/dedup_index.hpp"
#include "mediaharvest/storage/index_exporter.hpp"
#include "mediaharvest/storage/sidecar.hpp"
#include <iostream>

namespace mediaharvest::core {

namespace {

void print_stats(const transfer::StatsSnapshot& stats) {
    std::cout << "Attempted:  " << stats.attempted << "\n";
    std::cout << "Downloaded: " << stats.downloaded << "\n";
    std::cout << "Skipped:    " << stats.skipped << "\n";
    std::cout << "Failed:     " << stats.failed << "\n";
    std::cout << "Recovered:  " << stats.recovered << "\n";
    std::cout << "Bytes:      " << utils::StringUtils::format_bytes(stats.bytes_downloaded) << "\n";
}

CommandResult finish_run(const Harvester& harvester) {
    harvester.log_summary();
    auto stats = harvester.stats();
    print_stats(stats);
    
    if (stats.failed > 0) {
        return CommandResult::error(std::to_string(stats.failed) + " download(s) failed; run 'mediaharvest retry' later", 2);
    }
    return CommandResult::ok();
}

}

storage::HarvestSettings CommandHandler::current_settings() {
    return storage::HarvestSettings::from_config(Config::instance());
}

CommandResult FetchCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage());
    }
    
    auto settings = current_settings();
    
    std::vector<transfer::DownloadTask> tasks;
    auto loaded = load_task_file(args[1], settings.output_dir, tasks);
    if (!loaded) {
        return CommandResult::error(loaded.describe());
    }
    if (tasks.empty()) {
        return CommandResult::ok("No tasks in " + args[1]);
    }
    
    Harvester harvester(settings);
    auto ready = harvester.initialize();
    if (!ready) {
        return CommandResult::error(ready.describe());
    }
    
    std::cout << "Harvesting " << tasks.size() << " task(s) with " << settings.workers << " worker(s)\n";
    harvester.run(tasks);
    auto result = finish_run(harvester);
    harvester.shutdown();
    return result;
}

CommandResult RetryCommandHandler::execute(const std::vector<std::string>& args) {
    auto settings = current_settings();
    std::filesystem::path root = args.size() > 1 ? std::filesystem::path(args[1]) : settings.output_dir;
    
    Harvester harvester(settings);
    auto ready = harvester.initialize();
    if (!ready) {
        return CommandResult::error(ready.describe());
    }
    
    auto report = harvester.retry_failed(root);
    std::cout << "Sidecars found: " << report.sidecars
              << " (already present: " << report.already_present << ")\n";
    
    auto result = finish_run(harvester);
    harvester.shutdown();
    return result;
}

CommandResult ExportCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage());
    }
    
    auto format_name = Config::instance().get_string("export.format", "json");
    auto format = storage::export_format_from_string(format_name);
    if (!format) {
        return CommandResult::error("Unknown export format '" + format_name + "' (expected json or csv)");
    }
    
    auto settings = current_settings();
    storage::DedupIndex index(settings.index_path);
    auto opened = index.initialize();
    if (!opened) {
        return CommandResult::error(opened.describe());
    }
    
    storage::IndexExporter exporter(index);
    auto exported = exporter.export_to(args[1], *format);
    if (!exported) {
        return CommandResult::error(exported.describe());
    }
    
    for (const auto& file : exporter.written_files()) {
        std::cout << "Wrote " << file.string() << "\n";
    }
    return CommandResult::ok();
}

CommandResult MarkHtmlCommandHandler::execute(const std::vector<std::string>& args) {
    auto settings = current_settings();
    std::filesystem::path root = args.size() > 1 ? std::filesystem::path(args[1]) : settings.output_dir;
    
    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec)) {
        return CommandResult::error("Output dir not found: " + root.string());
    }
    
    storage::DedupIndex index(settings.index_path);
    auto opened = index.initialize();
    if (!opened) {
        return CommandResult::error(opened.describe());
    }
    
    auto report = storage::mark_html_payloads(root, index);
    std::cout << "HTML payloads found: " << report.scanned << "\n";
    std::cout << "Marked for retry:    " << report.marked << "\n";
    for (const auto& path : report.unresolved) {
        std::cout << "  no source URL: " << path.string() << "\n";
    }
    return CommandResult::ok();
}

CommandResult StatusCommandHandler::execute(const std::vector<std::string>& args) {
    (void)args;
    auto settings = current_settings();
    
    storage::DedupIndex index(settings.index_path);
    auto opened = index.initialize();
    if (!opened) {
        return CommandResult::error(opened.describe());
    }
    
    auto counts = index.counts();
    auto sidecars = storage::find_sidecars(settings.output_dir);
    
    std::cout << "mediaharvest status\n";
    std::cout << "Index:            " << settings.index_path.string() << "\n";
    std::cout << "Output directory: " << settings.output_dir.string() << "\n";
    std::cout << "URL records:      " << counts.urls << "\n";
    std::cout << "ETag records:     " << counts.etags << "\n";
    std::cout << "Fingerprints:     " << counts.fingerprints << "\n";
    std::cout << "Distinct files:   " << counts.hashes << " (" << counts.paths << " paths)\n";
    std::cout << "Failed URLs:      " << counts.failed << "\n";
    std::cout << "Pending sidecars: " << sidecars.size() << "\n";
    
    auto failed = index.failed_urls();
    if (!failed.empty()) {
        std::cout << "\nRecent failures:\n";
        size_t shown = 0;
        for (const auto& entry : failed) {
            if (shown++ == 10) break;
            std::cout << "  " << entry.url << " (" << entry.attempts << "x): " << entry.reason << "\n";
        }
    }
    return CommandResult::ok();
}

} // namespace mediaharvest::core
