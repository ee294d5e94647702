#include <gtest/gtest.h>
#include "mediaharvest/core/harvester.hpp"
#include "mediaharvest/storage/dedup_index.hpp"
#include "mediaharvest/storage/sidecar.hpp"
#include "mediaharvest/transfer/rate_limiter.hpp"
#include "support/fake_http_client.hpp"
#include "support/temp_dir.hpp"

using namespace mediaharvest;
using core::ErrorCode;
using core::Harvester;
using test_support::FakeHttpClient;
using test_support::FakeResponse;
using test_support::TempDir;
using test_support::read_file;
using test_support::write_file;
using transfer::TaskOutcome;

class HarvesterTest : public ::testing::Test {
protected:
    HarvesterTest() {
        settings.workers = 3;
        settings.rate = 0.0;
        settings.retry_attempts = 2;
        settings.backoff_base = std::chrono::milliseconds(1);
        settings.output_dir = dir / "downloads";
        settings.index_path = dir / "downloads" / ".media_index.sqlite";
    }
    
    transfer::DownloadTask task_for(const std::string& url, const std::string& name = "") {
        transfer::DownloadTask task;
        task.url = url;
        task.folder = settings.output_dir / "posts";
        if (!name.empty()) {
            task.name = name;
        }
        return task;
    }
    
    TempDir dir;
    storage::HarvestSettings settings;
    std::shared_ptr<FakeHttpClient> client = std::make_shared<FakeHttpClient>();
};

TEST(TaskLineTest, ParsesFields) {
    auto task = core::parse_task_line("https://a/x.jpg\tpics\tp1", "default");
    ASSERT_TRUE(task.has_value());
    EXPECT_EQ(task->url, "https://a/x.jpg");
    EXPECT_EQ(task->folder, std::filesystem::path("pics"));
    EXPECT_EQ(task->name, "p1");
    
    auto bare = core::parse_task_line("  https://a/y.jpg  ", "default");
    ASSERT_TRUE(bare.has_value());
    EXPECT_EQ(bare->folder, std::filesystem::path("default"));
    EXPECT_FALSE(bare->name.has_value());
    
    auto empty_folder = core::parse_task_line("https://a/z.jpg\t\tname", "default");
    ASSERT_TRUE(empty_folder.has_value());
    EXPECT_EQ(empty_folder->folder, std::filesystem::path("default"));
    EXPECT_EQ(empty_folder->name, "name");
    
    EXPECT_FALSE(core::parse_task_line("", "default").has_value());
    EXPECT_FALSE(core::parse_task_line("   ", "default").has_value());
    EXPECT_FALSE(core::parse_task_line("# comment", "default").has_value());
}

TEST(TaskLineTest, LoadTaskFile) {
    TempDir dir;
    write_file(dir / "tasks.tsv", "# header\nhttps://a/1.jpg\tx\n\nhttps://a/2.jpg\n");
    
    std::vector<transfer::DownloadTask> tasks;
    ASSERT_TRUE(core::load_task_file(dir / "tasks.tsv", "out", tasks).success());
    ASSERT_EQ(tasks.size(), 2u);
    EXPECT_EQ(tasks[1].url, "https://a/2.jpg");
    EXPECT_EQ(tasks[1].folder, std::filesystem::path("out"));
    
    EXPECT_EQ(core::load_task_file(dir / "missing.tsv", "out", tasks).error, ErrorCode::FILE_NOT_FOUND);
}

TEST_F(HarvesterTest, InvalidSettingsAreRejected) {
    settings.workers = 0;
    Harvester harvester(settings, client);
    EXPECT_EQ(harvester.initialize().error, ErrorCode::INVALID_ARGUMENT);
    EXPECT_FALSE(harvester.is_initialized());
    EXPECT_TRUE(harvester.run({task_for("https://a/x.jpg")}).empty());
}

TEST_F(HarvesterTest, RunsBatchAndDeduplicates) {
    client->on_get("https://cdn.example/a.jpg", FakeResponse::ok("AAAA"));
    client->on_get("https://cdn.example/b.jpg", FakeResponse::ok("BBBB-different"));
    client->on_get("https://cdn.example/broken.jpg", FakeResponse::status_only(404));
    
    Harvester harvester(settings, client);
    ASSERT_TRUE(harvester.initialize().success());
    ASSERT_TRUE(harvester.index()->is_open());
    EXPECT_TRUE(harvester.rate_limiter()->unlimited());
    
    size_t callbacks = 0;
    auto results = harvester.run({task_for("https://cdn.example/a.jpg", "first"),
                                  task_for("https://cdn.example/b.jpg"),
                                  task_for("https://cdn.example/broken.jpg")},
                                 [&callbacks](const transfer::TaskResult&) { callbacks++; });
    
    EXPECT_EQ(results.size(), 3u);
    EXPECT_EQ(callbacks, 3u);
    
    auto stats = harvester.stats();
    EXPECT_EQ(stats.attempted, 3u);
    EXPECT_EQ(stats.downloaded, 2u);
    EXPECT_EQ(stats.failed, 1u);
    EXPECT_EQ(read_file(settings.output_dir / "posts" / "first.jpg"), "AAAA");
    EXPECT_TRUE(std::filesystem::exists(settings.output_dir / "posts" / "broken.jpg.failed"));
    
    // second run is served entirely from the index
    auto gets_before = client->get_count("https://cdn.example/a.jpg");
    auto again = harvester.run({task_for("https://cdn.example/a.jpg", "first")});
    ASSERT_EQ(again.size(), 1u);
    EXPECT_EQ(again[0].outcome, TaskOutcome::SKIPPED);
    EXPECT_EQ(client->get_count("https://cdn.example/a.jpg"), gets_before);
    
    harvester.log_summary();
}

TEST_F(HarvesterTest, RetryFailedRecoversAndDropsPresentTargets) {
    auto posts = settings.output_dir / "posts";
    std::filesystem::create_directories(posts);
    ASSERT_TRUE(storage::write_sidecar(posts / "late.jpg", "https://cdn.example/late.jpg", "timeout").success());
    ASSERT_TRUE(storage::write_sidecar(posts / "here.jpg", "https://cdn.example/here.jpg", "timeout").success());
    write_file(posts / "here.jpg", "ALREADY");
    client->on_get("https://cdn.example/late.jpg", FakeResponse::ok("LATE"));
    
    Harvester harvester(settings, client);
    ASSERT_TRUE(harvester.initialize().success());
    
    auto report = harvester.retry_failed(settings.output_dir);
    EXPECT_EQ(report.sidecars, 2u);
    EXPECT_EQ(report.already_present, 1u);
    ASSERT_EQ(report.results.size(), 1u);
    EXPECT_EQ(report.results[0].outcome, TaskOutcome::DOWNLOADED);
    
    EXPECT_EQ(read_file(posts / "late.jpg"), "LATE");
    EXPECT_FALSE(std::filesystem::exists(posts / "late.jpg.failed"));
    EXPECT_FALSE(std::filesystem::exists(posts / "here.jpg.failed"));
    EXPECT_EQ(client->get_count("https://cdn.example/here.jpg"), 0u);
    EXPECT_EQ(harvester.stats().recovered, 2u);
    
    EXPECT_TRUE(storage::find_sidecars(settings.output_dir).empty());
}

TEST_F(HarvesterTest, UnopenableIndexStillDownloads) {
    // a directory where the database file should be
    std::filesystem::create_directories(settings.index_path);
    client->on_get("https://cdn.example/a.jpg", FakeResponse::ok("AAAA"));
    
    Harvester harvester(settings, client);
    ASSERT_TRUE(harvester.initialize().success());
    EXPECT_FALSE(harvester.index()->is_open());
    
    auto results = harvester.run({task_for("https://cdn.example/a.jpg")});
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].outcome, TaskOutcome::DOWNLOADED);
    EXPECT_EQ(harvester.checkpoint().error, ErrorCode::INDEX_UNAVAILABLE);
}

TEST_F(HarvesterTest, ShutdownClosesIndex) {
    Harvester harvester(settings, client);
    ASSERT_TRUE(harvester.initialize().success());
    auto index = harvester.index();
    
    harvester.shutdown();
    EXPECT_FALSE(harvester.is_initialized());
    EXPECT_FALSE(index->is_open());
    EXPECT_EQ(harvester.index(), nullptr);
}

TEST_F(HarvesterTest, RateLimitSpacesRequests) {
    settings.rate = 5.0;
    settings.workers = 4;
    settings.probe = false;
    for (int i = 0; i < 8; ++i) {
        client->on_get("https://cdn.example/" + std::to_string(i) + ".jpg",
                       FakeResponse::ok("BODY" + std::to_string(i)));
    }
    
    Harvester harvester(settings, client);
    ASSERT_TRUE(harvester.initialize().success());
    
    std::vector<transfer::DownloadTask> tasks;
    for (int i = 0; i < 8; ++i) {
        tasks.push_back(task_for("https://cdn.example/" + std::to_string(i) + ".jpg"));
    }
    
    auto start = std::chrono::steady_clock::now();
    auto results = harvester.run(tasks);
    auto elapsed = std::chrono::steady_clock::now() - start;
    
    EXPECT_EQ(results.size(), 8u);
    // 5 tokens up front, the other 3 arrive at 5/s
    EXPECT_GE(elapsed, std::chrono::milliseconds(500));
}
