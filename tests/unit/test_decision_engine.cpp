#include <gtest/gtest.h>
#include "mediaharvest/crypto/hash.hpp"
#include "mediaharvest/dedup/decision_engine.hpp"
#include "mediaharvest/storage/sidecar.hpp"
#include "support/fake_http_client.hpp"
#include "support/temp_dir.hpp"

using namespace mediaharvest;
using namespace mediaharvest::dedup;
using core::ErrorCode;
using test_support::FakeHttpClient;
using test_support::FakeResponse;
using test_support::TempDir;
using test_support::read_file;
using test_support::write_file;
using transfer::DownloadTask;
using transfer::MatchTier;
using transfer::TaskOutcome;

class DecisionEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        index = std::make_shared<storage::DedupIndex>(dir / "index.sqlite");
        ASSERT_TRUE(index->initialize().success());
        folder = dir.path() / "F";
    }
    
    std::unique_ptr<DecisionEngine> make_engine(EngineSettings settings = {}) {
        network::FetchSettings fetch_settings;
        fetch_settings.backoff_base = std::chrono::milliseconds(1);
        fetch_settings.max_attempts = 2;
        
        auto prober = std::make_shared<network::Prober>(client);
        fetcher = std::make_shared<network::Fetcher>(client, fetch_settings);
        auto fingerprints = std::make_shared<PartialFingerprintCache>(settings.fingerprint_bytes);
        return std::make_unique<DecisionEngine>(index, prober, fetcher, fingerprints, stats, settings);
    }
    
    DownloadTask task_for(const std::string& url, const std::string& name = "") {
        DownloadTask task;
        task.url = url;
        task.folder = folder;
        if (!name.empty()) {
            task.name = name;
        }
        return task;
    }
    
    static std::string hash_of(const std::filesystem::path& file) {
        return crypto::hash_utils::content_hash_hex(file).value_or("");
    }
    
    TempDir dir;
    std::filesystem::path folder;
    std::shared_ptr<FakeHttpClient> client = std::make_shared<FakeHttpClient>();
    std::shared_ptr<network::Fetcher> fetcher;
    std::shared_ptr<storage::DedupIndex> index;
    std::shared_ptr<transfer::RunStats> stats = std::make_shared<transfer::RunStats>();
};

TEST_F(DecisionEngineTest, FreshDownloadIsIndexed) {
    client->on_get("https://cdn.example/x.jpg?sig=abc123", FakeResponse::ok("PIXELS"));
    
    auto engine = make_engine();
    auto result = engine->process(task_for("https://cdn.example/x.jpg?sig=abc123", "p1"));
    
    ASSERT_EQ(result.outcome, TaskOutcome::DOWNLOADED) << result.error.describe();
    ASSERT_TRUE(result.final_path.has_value());
    EXPECT_EQ(*result.final_path, folder / "p1.jpg");
    EXPECT_EQ(result.bytes_downloaded, 6u);
    
    auto hash = index->lookup_by_url("https://cdn.example/x.jpg");
    ASSERT_TRUE(hash.has_value());
    EXPECT_EQ(*hash, hash_of(folder / "p1.jpg"));
    
    auto paths = index->paths_for(*hash);
    ASSERT_EQ(paths.size(), 1u);
    EXPECT_EQ(paths[0].filename(), "p1.jpg");
    
    auto snapshot = stats->snapshot();
    EXPECT_EQ(snapshot.attempted, 1u);
    EXPECT_EQ(snapshot.downloaded, 1u);
    EXPECT_EQ(snapshot.bytes_downloaded, 6u);
}

TEST_F(DecisionEngineTest, ResignedUrlIsSkippedWithoutTransfer) {
    client->on_get("https://cdn.example/x.jpg?sig=abc123", FakeResponse::ok("PIXELS"));
    
    auto engine = make_engine();
    ASSERT_EQ(engine->process(task_for("https://cdn.example/x.jpg?sig=abc123", "p1")).outcome,
              TaskOutcome::DOWNLOADED);
    auto before = client->total_requests();
    
    auto result = engine->process(task_for("https://cdn.example/x.jpg?sig=zzz999", "p1"));
    
    EXPECT_EQ(result.outcome, TaskOutcome::SKIPPED);
    EXPECT_EQ(result.tier, MatchTier::URL);
    EXPECT_EQ(client->total_requests(), before);
    EXPECT_EQ(client->get_count("https://cdn.example/x.jpg?sig=zzz999"), 0u);
    EXPECT_EQ(stats->snapshot().skipped, 1u);
}

TEST_F(DecisionEngineTest, KnownUrlLinksIntoNewFolder) {
    client->on_get("https://cdn.example/a.png", FakeResponse::ok("AAA"));
    
    auto engine = make_engine();
    ASSERT_EQ(engine->process(task_for("https://cdn.example/a.png", "first")).outcome, TaskOutcome::DOWNLOADED);
    
    auto other = task_for("https://cdn.example/a.png", "second");
    other.folder = dir.path() / "G";
    auto result = engine->process(other);
    
    EXPECT_EQ(result.outcome, TaskOutcome::SKIPPED);
    EXPECT_EQ(result.tier, MatchTier::URL);
    ASSERT_TRUE(result.final_path.has_value());
    EXPECT_EQ(*result.final_path, dir.path() / "G" / "second.png");
    EXPECT_EQ(read_file(dir.path() / "G" / "second.png"), "AAA");
    EXPECT_EQ(index->paths_for(*index->lookup_by_url("https://cdn.example/a.png")).size(), 2u);
}

TEST_F(DecisionEngineTest, LinkAvoidsNameOfDownloadInFlight) {
    client->on_get("https://cdn.example/a.png", FakeResponse::ok("AAA"));
    
    auto engine = make_engine();
    ASSERT_EQ(engine->process(task_for("https://cdn.example/a.png", "first")).outcome, TaskOutcome::DOWNLOADED);
    
    // Another worker is streaming into G/second.png and has nothing on disk yet.
    auto in_flight = fetcher->reservations()->reserve_unique(dir.path() / "G" / "second.png");
    
    auto other = task_for("https://cdn.example/a.png", "second");
    other.folder = dir.path() / "G";
    auto result = engine->process(other);
    
    EXPECT_EQ(result.outcome, TaskOutcome::SKIPPED);
    ASSERT_TRUE(result.final_path.has_value());
    EXPECT_EQ(*result.final_path, dir.path() / "G" / "second_1.png");
    EXPECT_FALSE(std::filesystem::exists(in_flight));
    EXPECT_TRUE(fetcher->reservations()->is_reserved(in_flight));
    EXPECT_EQ(fetcher->reservations()->size(), 1u);
    
    auto paths = index->paths_for(*index->lookup_by_url("https://cdn.example/a.png"));
    ASSERT_EQ(paths.size(), 2u);
    EXPECT_EQ(paths[1].filename(), "second_1.png");
}

TEST_F(DecisionEngineTest, ExistingFileAtLinkTargetIsKept) {
    client->on_get("https://cdn.example/a.png", FakeResponse::ok("AAA"));
    write_file(dir.path() / "G" / "second.png", "OTHER");
    
    auto engine = make_engine();
    ASSERT_EQ(engine->process(task_for("https://cdn.example/a.png", "first")).outcome, TaskOutcome::DOWNLOADED);
    
    auto other = task_for("https://cdn.example/a.png", "second");
    other.folder = dir.path() / "G";
    auto result = engine->process(other);
    
    EXPECT_EQ(result.outcome, TaskOutcome::SKIPPED);
    ASSERT_TRUE(result.final_path.has_value());
    EXPECT_EQ(*result.final_path, dir.path() / "G" / "second.png");
    EXPECT_EQ(read_file(dir.path() / "G" / "second.png"), "OTHER");
    EXPECT_EQ(index->paths_for(*index->lookup_by_url("https://cdn.example/a.png")).size(), 1u);
}

TEST_F(DecisionEngineTest, KnownUrlWithoutSurvivingFileIsSkipped) {
    client->on_get("https://cdn.example/a.png", FakeResponse::ok("AAA"));
    
    auto engine = make_engine();
    auto first = engine->process(task_for("https://cdn.example/a.png"));
    ASSERT_EQ(first.outcome, TaskOutcome::DOWNLOADED);
    std::filesystem::remove(*first.final_path);
    
    auto result = engine->process(task_for("https://cdn.example/a.png"));
    EXPECT_EQ(result.outcome, TaskOutcome::SKIPPED);
    EXPECT_EQ(result.tier, MatchTier::URL_NO_FILE);
    EXPECT_FALSE(result.final_path.has_value());
    EXPECT_EQ(client->get_count("https://cdn.example/a.png"), 1u);
}

TEST_F(DecisionEngineTest, IdenticalContentKeepsOneFile) {
    client->on_get("https://one.example/a.jpg", FakeResponse::ok("SAMEBYTES"));
    client->on_get("https://two.example/b.jpg", FakeResponse::ok("SAMEBYTES"));
    
    EngineSettings settings;
    settings.probe = false;
    auto engine = make_engine(settings);
    
    auto first = engine->process(task_for("https://one.example/a.jpg"));
    auto second = engine->process(task_for("https://two.example/b.jpg"));
    
    ASSERT_EQ(first.outcome, TaskOutcome::DOWNLOADED);
    EXPECT_EQ(second.outcome, TaskOutcome::SKIPPED);
    EXPECT_EQ(second.tier, MatchTier::CONTENT_HASH);
    EXPECT_EQ(*second.final_path, *first.final_path);
    
    EXPECT_TRUE(std::filesystem::exists(folder / "a.jpg"));
    EXPECT_FALSE(std::filesystem::exists(folder / "b.jpg"));
    
    auto hash_one = index->lookup_by_url("https://one.example/a.jpg");
    auto hash_two = index->lookup_by_url("https://two.example/b.jpg");
    ASSERT_TRUE(hash_one.has_value());
    EXPECT_EQ(hash_one, hash_two);
    EXPECT_EQ(client->head_count("https://two.example/b.jpg"), 0u);
}

TEST_F(DecisionEngineTest, EtagMatchLinksExistingCopy) {
    auto response = FakeResponse::ok("ETAGGED");
    response.headers["etag"] = "\"v7\"";
    client->on_get("https://cdn.example/orig.jpg", response);
    
    FakeResponse head;
    head.headers["etag"] = "\"v7\"";
    client->on_head("https://mirror.example/copy.jpg", head);
    
    auto engine = make_engine();
    ASSERT_EQ(engine->process(task_for("https://cdn.example/orig.jpg")).outcome, TaskOutcome::DOWNLOADED);
    
    auto result = engine->process(task_for("https://mirror.example/copy.jpg", "copy"));
    EXPECT_EQ(result.outcome, TaskOutcome::SKIPPED);
    EXPECT_EQ(result.tier, MatchTier::ETAG);
    EXPECT_EQ(client->get_count("https://mirror.example/copy.jpg"), 0u);
    EXPECT_EQ(read_file(folder / "copy.jpg"), "ETAGGED");
    EXPECT_TRUE(index->lookup_by_url("https://mirror.example/copy.jpg").has_value());
}

TEST_F(DecisionEngineTest, SizeMatchIsHeuristic) {
    client->on_get("https://cdn.example/orig.bin", FakeResponse::ok("0123456789"));
    
    FakeResponse head;
    head.headers["content-length"] = "10";
    head.headers["etag"] = "\"other\"";
    client->on_head("https://cdn.example/different.bin", head);
    
    auto engine = make_engine();
    ASSERT_EQ(engine->process(task_for("https://cdn.example/orig.bin")).outcome, TaskOutcome::DOWNLOADED);
    
    auto result = engine->process(task_for("https://cdn.example/different.bin"));
    EXPECT_EQ(result.outcome, TaskOutcome::SKIPPED);
    EXPECT_EQ(result.tier, MatchTier::SIZE);
    EXPECT_EQ(index->lookup_by_etag("\"other\""), index->lookup_by_url("https://cdn.example/orig.bin"));
}

TEST_F(DecisionEngineTest, FingerprintMatchAvoidsFullDownload) {
    std::string body(5000, 'z');
    body.replace(0, 4, "RIFF");
    client->on_get("https://a.example/clip.webm", FakeResponse::ok(body, "video/webm"));
    client->on_get("https://b.example/clip.webm", FakeResponse::ok(body, "video/webm"));
    
    EngineSettings settings;
    settings.probe = false;
    settings.fingerprint = true;
    settings.fingerprint_bytes = 1024;
    auto engine = make_engine(settings);
    
    ASSERT_EQ(engine->process(task_for("https://a.example/clip.webm")).outcome, TaskOutcome::DOWNLOADED);
    
    auto result = engine->process(task_for("https://b.example/clip.webm", "b"));
    EXPECT_EQ(result.outcome, TaskOutcome::SKIPPED);
    EXPECT_EQ(result.tier, MatchTier::FINGERPRINT);
    EXPECT_EQ(read_file(folder / "b.webm"), body);
    
    // the one GET for b was the ranged prefix request
    auto requests = client->requests();
    ASSERT_FALSE(requests.empty());
    EXPECT_EQ(requests.back().url, "https://b.example/clip.webm");
    ASSERT_TRUE(requests.back().byte_range.has_value());
    EXPECT_EQ(requests.back().byte_range->second, 1023u);
    EXPECT_EQ(index->fingerprint_records().size(), 1u);
}

TEST_F(DecisionEngineTest, ForceAlwaysFetches) {
    client->on_get("https://cdn.example/a.jpg", FakeResponse::ok("AAA"));
    
    EngineSettings settings;
    settings.force = true;
    auto engine = make_engine(settings);
    
    ASSERT_EQ(engine->process(task_for("https://cdn.example/a.jpg")).outcome, TaskOutcome::DOWNLOADED);
    auto again = engine->process(task_for("https://cdn.example/a.jpg"));
    
    EXPECT_EQ(client->get_count("https://cdn.example/a.jpg"), 2u);
    EXPECT_EQ(client->head_count("https://cdn.example/a.jpg"), 0u);
    // the second copy is still collapsed by content hash
    EXPECT_EQ(again.outcome, TaskOutcome::SKIPPED);
    EXPECT_EQ(again.tier, MatchTier::CONTENT_HASH);
}

TEST_F(DecisionEngineTest, FailureIsRecordedThenCleared) {
    const std::string url = "https://cdn.example/flaky.jpg?token=1";
    client->on_get(url, FakeResponse::status_only(500));
    client->on_get(url, FakeResponse::status_only(500));
    client->on_get(url, FakeResponse::ok("BACK"));
    
    auto engine = make_engine();
    auto failed = engine->process(task_for(url));
    EXPECT_EQ(failed.outcome, TaskOutcome::FAILED);
    EXPECT_EQ(failed.error.error, ErrorCode::HTTP_ERROR);
    ASSERT_TRUE(failed.sidecar_path.has_value());
    EXPECT_TRUE(index->is_failed("https://cdn.example/flaky.jpg"));
    
    auto recovered = engine->process(task_for(url));
    EXPECT_EQ(recovered.outcome, TaskOutcome::DOWNLOADED);
    EXPECT_FALSE(index->is_failed("https://cdn.example/flaky.jpg"));
    EXPECT_FALSE(std::filesystem::exists(*failed.sidecar_path));
}

TEST_F(DecisionEngineTest, SidecarRetryRecovers) {
    const std::string url = "https://cdn.example/late.jpg";
    client->on_get(url, FakeResponse::failure(ErrorCode::TIMEOUT, "no data"));
    client->on_get(url, FakeResponse::failure(ErrorCode::TIMEOUT, "no data"));
    client->on_get(url, FakeResponse::ok("LATE"));
    
    auto engine = make_engine();
    auto failed = engine->process(task_for(url, "late"));
    ASSERT_EQ(failed.outcome, TaskOutcome::FAILED);
    
    auto sidecar = folder / "late.jpg.failed";
    ASSERT_TRUE(std::filesystem::exists(sidecar));
    EXPECT_EQ(storage::read_sidecar(sidecar)->url, url);
    
    auto tasks = storage::tasks_from_sidecars(dir.path());
    ASSERT_EQ(tasks.size(), 1u);
    
    auto retried = engine->process(tasks[0]);
    EXPECT_EQ(retried.outcome, TaskOutcome::DOWNLOADED);
    EXPECT_EQ(*retried.final_path, folder / "late.jpg");
    EXPECT_FALSE(std::filesystem::exists(sidecar));
    
    auto snapshot = stats->snapshot();
    EXPECT_EQ(snapshot.failed, 1u);
    EXPECT_EQ(snapshot.recovered, 1u);
}

TEST_F(DecisionEngineTest, WorksWithoutIndex) {
    index->close();
    client->on_get("https://cdn.example/a.jpg", FakeResponse::ok("AAA"));
    
    auto engine = make_engine();
    auto result = engine->process(task_for("https://cdn.example/a.jpg"));
    EXPECT_EQ(result.outcome, TaskOutcome::DOWNLOADED);
    EXPECT_TRUE(std::filesystem::exists(folder / "a.jpg"));
}

TEST(LinkOrCopyTest, RefusesExistingTarget) {
    TempDir dir;
    write_file(dir / "src.bin", "data");
    write_file(dir / "dst.bin", "old");
    
    EXPECT_FALSE(link_or_copy(dir / "src.bin", dir / "dst.bin").success());
    ASSERT_TRUE(link_or_copy(dir / "src.bin", dir / "sub" / "new.bin").success());
    EXPECT_EQ(read_file(dir / "sub" / "new.bin"), "data");
}
