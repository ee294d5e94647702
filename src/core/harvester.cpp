#include "mediaharvest/core/harvester.hpp"
#include "mediaharvest/core/logger.hpp"
#include "mediaharvest/core/utils.hpp"
#include "mediaharvest/dedup/decision_engine.hpp"
#include "mediaharvest/dedup/fingerprint_cache.hpp"
#include "mediaharvest/network/curl_http_client.hpp"
#include "mediaharvest/network/fetcher.hpp"
#include "mediaharvest/network/prober.hpp"
#include "mediaharvest/network/throttled_http_client.hpp"
#include "mediaharvest/storage/dedup_index.hpp"
#include "mediaharvest/storage/sidecar.hpp"
#include "mediaharvest/transfer/rate_limiter.hpp"
#include <chrono>
#include <fstream>

namespace mediaharvest::core {

using utils::StringUtils;

std::optional<transfer::DownloadTask> parse_task_line(const std::string& line,
                                                      const std::filesystem::path& default_folder) {
    auto trimmed = StringUtils::trim(line);
    if (trimmed.empty() || trimmed[0] == '#') {
        return std::nullopt;
    }
    
    auto fields = StringUtils::split(trimmed, '\t');
    transfer::DownloadTask task;
    task.url = StringUtils::trim(fields[0]);
    if (task.url.empty()) {
        return std::nullopt;
    }
    
    std::string folder = fields.size() > 1 ? StringUtils::trim(fields[1]) : "";
    task.folder = folder.empty() ? default_folder : std::filesystem::path(folder);
    
    if (fields.size() > 2) {
        auto name = StringUtils::trim(fields[2]);
        if (!name.empty()) {
            task.name = name;
        }
    }
    return task;
}

Result load_task_file(const std::filesystem::path& file,
                      const std::filesystem::path& default_folder,
                      std::vector<transfer::DownloadTask>& tasks) {
    std::ifstream in(file);
    if (!in.is_open()) {
        return Result(ErrorCode::FILE_NOT_FOUND, "Cannot open task file: " + file.string());
    }
    
    std::string line;
    while (std::getline(in, line)) {
        if (auto task = parse_task_line(line, default_folder)) {
            tasks.push_back(std::move(*task));
        }
    }
    return Result();
}

Harvester::Harvester(storage::HarvestSettings settings, std::shared_ptr<network::HttpClient> transport)
    : settings_(std::move(settings))
    , transport_(std::move(transport))
    , stats_(std::make_shared<transfer::RunStats>()) {
}

Harvester::~Harvester() {
    shutdown();
}

Result Harvester::initialize() {
    if (engine_) {
        return Result();
    }
    
    auto valid = settings_.validate();
    if (!valid) {
        return valid;
    }
    
    index_ = std::make_shared<storage::DedupIndex>(settings_.index_path);
    auto opened = index_->initialize();
    if (!opened) {
        // Keep going: every index call answers "unknown" and the run still downloads.
        LOG_WARN("Running without dedup index: {}", opened.describe());
    }
    
    if (!transport_) {
        transport_ = std::make_shared<network::CurlHttpClient>(settings_.user_agent);
    }
    limiter_ = std::make_shared<transfer::RateLimiter>(settings_.rate);
    auto client = std::make_shared<network::ThrottledHttpClient>(transport_, limiter_);
    
    network::ProbeSettings probe_settings;
    probe_settings.probe_timeout = settings_.probe_timeout;
    auto prober = std::make_shared<network::Prober>(client, probe_settings);
    
    network::FetchSettings fetch_settings;
    fetch_settings.max_attempts = settings_.retry_attempts;
    fetch_settings.backoff_base = settings_.backoff_base;
    fetch_settings.connect_timeout = settings_.connect_timeout;
    fetch_settings.read_timeout = settings_.read_timeout;
    auto fetcher = std::make_shared<network::Fetcher>(client, fetch_settings);
    
    fingerprints_ = std::make_shared<dedup::PartialFingerprintCache>(settings_.fingerprint_bytes);
    
    dedup::EngineSettings engine_settings;
    engine_settings.probe = settings_.probe;
    engine_settings.fingerprint = settings_.fingerprint;
    engine_settings.fingerprint_bytes = settings_.fingerprint_bytes;
    engine_settings.force = settings_.force;
    engine_ = std::make_shared<dedup::DecisionEngine>(index_, prober, fetcher, fingerprints_, stats_, engine_settings);
    
    auto engine = engine_;
    pool_ = std::make_unique<transfer::WorkerPool>(settings_.workers, [engine](const transfer::DownloadTask& task) {
        return engine->process(task);
    });
    
    LOG_INFO("Harvester ready: {} worker(s), {} req/s, probe={}, fingerprint={}, force={}",
             settings_.workers, settings_.rate, settings_.probe, settings_.fingerprint, settings_.force);
    return Result();
}

std::vector<transfer::TaskResult> Harvester::run(const std::vector<transfer::DownloadTask>& tasks,
                                                 const transfer::ResultCallback& on_result) {
    if (!engine_) {
        LOG_ERROR("Harvester used before initialize()");
        return {};
    }
    
    auto start = std::chrono::steady_clock::now();
    auto results = pool_->run(tasks, on_result);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    
    LOG_INFO("Processed {} task(s) in {}", results.size(), StringUtils::format_duration(elapsed));
    
    auto saved = checkpoint();
    if (!saved) {
        LOG_WARN("Index checkpoint failed: {}", saved.describe());
    }
    return results;
}

RetryReport Harvester::retry_failed(const std::filesystem::path& root) {
    RetryReport report;
    if (!engine_) {
        LOG_ERROR("Harvester used before initialize()");
        return report;
    }
    
    std::vector<transfer::DownloadTask> pending;
    for (auto& task : storage::tasks_from_sidecars(root)) {
        report.sidecars++;
        
        std::error_code ec;
        if (task.target_path && std::filesystem::exists(*task.target_path, ec)) {
            storage::remove_sidecar(*task.sidecar);
            stats_->on_recovered();
            report.already_present++;
            LOG_INFO("Already present, dropped sidecar: {}", task.target_path->string());
            continue;
        }
        pending.push_back(std::move(task));
    }
    
    LOG_INFO("Retrying {} failed download(s) under {}", pending.size(), root.string());
    report.results = run(pending);
    return report;
}

Result Harvester::checkpoint() {
    if (!index_) {
        return Result(ErrorCode::INDEX_UNAVAILABLE, "Index is not open");
    }
    return index_->checkpoint();
}

void Harvester::shutdown() {
    if (!index_) {
        return;
    }
    
    pool_.reset();
    engine_.reset();
    index_->close();
    index_.reset();
}

void Harvester::log_summary() const {
    LOG_INFO("Run summary: {}", stats_->summary());
}

} // namespace mediaharvest::core
