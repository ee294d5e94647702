#include <gtest/gtest.h>
#include "mediaharvest/crypto/hash.hpp"
#include "mediaharvest/storage/dedup_index.hpp"
#include "mediaharvest/storage/sidecar.hpp"
#include "support/temp_dir.hpp"

using namespace mediaharvest::storage;
using mediaharvest::test_support::TempDir;
using mediaharvest::test_support::read_file;
using mediaharvest::test_support::write_file;

class SidecarTest : public ::testing::Test {
protected:
    TempDir dir;
};

TEST_F(SidecarTest, PathMapping) {
    EXPECT_EQ(sidecar_path_for("out/a.jpg"), std::filesystem::path("out/a.jpg.failed"));
    EXPECT_EQ(target_for_sidecar("out/a.jpg.failed"), std::filesystem::path("out/a.jpg"));
    EXPECT_TRUE(is_sidecar("out/a.jpg.failed"));
    EXPECT_FALSE(is_sidecar("out/a.jpg"));
}

TEST_F(SidecarTest, WriteAndRead) {
    auto target = dir / "a.jpg";
    ASSERT_TRUE(write_sidecar(target, "https://example.com/a.jpg", "timeout: no data",
                              {"attempts: 3", "HTTP 0"}).success());
    
    auto text = read_file(dir / "a.jpg.failed");
    EXPECT_EQ(text, "https://example.com/a.jpg\ntimeout: no data\nattempts: 3\nHTTP 0\n");
    
    auto sidecar = read_sidecar(dir / "a.jpg.failed");
    ASSERT_TRUE(sidecar.has_value());
    EXPECT_EQ(sidecar->url, "https://example.com/a.jpg");
    EXPECT_EQ(sidecar->error, "timeout: no data");
    EXPECT_EQ(sidecar->target_path, target);
    ASSERT_EQ(sidecar->details.size(), 2u);
    EXPECT_EQ(sidecar->details[0], "attempts: 3");
}

TEST_F(SidecarTest, UnreadableSidecars) {
    write_file(dir / "empty.jpg.failed", "");
    write_file(dir / "blank.jpg.failed", "   \nerror\n");
    
    EXPECT_FALSE(read_sidecar(dir / "empty.jpg.failed").has_value());
    EXPECT_FALSE(read_sidecar(dir / "blank.jpg.failed").has_value());
    EXPECT_FALSE(read_sidecar(dir / "missing.failed").has_value());
}

TEST_F(SidecarTest, RemoveIsIdempotent) {
    ASSERT_TRUE(write_sidecar(dir / "a.jpg", "https://a", "x").success());
    EXPECT_TRUE(remove_sidecar(dir / "a.jpg.failed"));
    EXPECT_FALSE(std::filesystem::exists(dir / "a.jpg.failed"));
    EXPECT_TRUE(remove_sidecar(dir / "a.jpg.failed"));
}

TEST_F(SidecarTest, TasksFromSidecarsRecursive) {
    ASSERT_TRUE(write_sidecar(dir / "sub" / "b.png", "https://example.com/b.png", "x").success());
    ASSERT_TRUE(write_sidecar(dir / "a.jpg", "https://example.com/a.jpg", "y").success());
    write_file(dir / "broken.gif.failed", "");
    write_file(dir / "c.jpg", "not a sidecar");
    
    EXPECT_EQ(find_sidecars(dir.path()).size(), 3u);
    
    auto tasks = tasks_from_sidecars(dir.path());
    ASSERT_EQ(tasks.size(), 2u);
    EXPECT_EQ(tasks[0].url, "https://example.com/a.jpg");
    EXPECT_EQ(tasks[0].target_path, dir / "a.jpg");
    EXPECT_EQ(tasks[0].folder, dir.path());
    EXPECT_EQ(tasks[0].sidecar, dir / "a.jpg.failed");
    EXPECT_EQ(tasks[1].url, "https://example.com/b.png");
    EXPECT_EQ(tasks[1].folder, dir / "sub");
    
    EXPECT_TRUE(tasks_from_sidecars(dir / "nowhere").empty());
}

TEST_F(SidecarTest, LooksLikeHtml) {
    write_file(dir / "page.jpg", "\n\n  <!DOCTYPE HTML>\n<html><body>login</body></html>");
    write_file(dir / "script.mp4", "<script>window.location='x'</script>");
    write_file(dir / "real.jpg", std::string("\xFF\xD8\xFF\xE0", 4) + std::string(100, '\0'));
    write_file(dir / "late.txt", std::string(3000, 'a') + "<html>");
    
    EXPECT_TRUE(looks_like_html(dir / "page.jpg"));
    EXPECT_TRUE(looks_like_html(dir / "script.mp4"));
    EXPECT_FALSE(looks_like_html(dir / "real.jpg"));
    EXPECT_FALSE(looks_like_html(dir / "late.txt"));
    EXPECT_FALSE(looks_like_html(dir / "missing"));
}

TEST_F(SidecarTest, FindHtmlPayloadsSkipsSidecarsAndParts) {
    write_file(dir / "a.jpg", "<html>");
    write_file(dir / "b.jpg.failed", "<html>");
    write_file(dir / "c.jpg.part", "<html>");
    write_file(dir / "d.jpg", "binary");
    
    auto payloads = find_html_payloads(dir.path());
    ASSERT_EQ(payloads.size(), 1u);
    EXPECT_EQ(payloads[0].filename(), "a.jpg");
}

TEST_F(SidecarTest, MarkHtmlPayloads) {
    DedupIndex index(dir / "db" / "index.sqlite");
    ASSERT_TRUE(index.initialize().success());
    
    auto media = dir / "media";
    write_file(media / "fake.jpg", "<!doctype html><p>rate limited</p>");
    write_file(media / "orphan.jpg", "<html>nobody knows me</html>");
    write_file(media / "good.jpg", "JPEG");
    
    auto hash = mediaharvest::crypto::hash_utils::content_hash_hex(media / "fake.jpg");
    ASSERT_TRUE(hash.has_value());
    IndexRecord record;
    record.content_hash = *hash;
    record.path = media / "fake.jpg";
    record.url = "https://example.com/fake.jpg";
    ASSERT_TRUE(index.record(record).success());
    
    auto report = mark_html_payloads(media, index);
    
    EXPECT_EQ(report.scanned, 2u);
    EXPECT_EQ(report.marked, 1u);
    ASSERT_EQ(report.unresolved.size(), 1u);
    EXPECT_EQ(report.unresolved[0].filename(), "orphan.jpg");
    
    EXPECT_FALSE(std::filesystem::exists(media / "fake.jpg"));
    EXPECT_TRUE(std::filesystem::exists(media / "orphan.jpg"));
    EXPECT_TRUE(std::filesystem::exists(media / "good.jpg"));
    
    auto sidecar = read_sidecar(media / "fake.jpg.failed");
    ASSERT_TRUE(sidecar.has_value());
    EXPECT_EQ(sidecar->url, "https://example.com/fake.jpg");
    EXPECT_EQ(sidecar->error, "HTML content detected");
    EXPECT_FALSE(index.lookup_by_url("https://example.com/fake.jpg").has_value());
}
