#include <gtest/gtest.h>
#include "mediaharvest/storage/dedup_index.hpp"
#include "mediaharvest/storage/index_exporter.hpp"
#include "support/temp_dir.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <string>
#include <vector>

using namespace mediaharvest::storage;
using mediaharvest::core::ErrorCode;
using mediaharvest::test_support::TempDir;
using mediaharvest::test_support::read_file;
using mediaharvest::test_support::write_file;

class IndexExporterTest : public ::testing::Test {
protected:
    void SetUp() override {
        index = std::make_unique<DedupIndex>(dir / "index.sqlite");
        ASSERT_TRUE(index->initialize().success());
    }
    
    TempDir dir;
    std::unique_ptr<DedupIndex> index;
};

TEST(CsvEscapeTest, QuotesOnlyWhenNeeded) {
    EXPECT_EQ(IndexExporter::escape_field("plain"), "plain");
    EXPECT_EQ(IndexExporter::escape_field("a,b"), "\"a,b\"");
    EXPECT_EQ(IndexExporter::escape_field("say \"hi\""), "\"say \"\"hi\"\"\"");
    EXPECT_EQ(IndexExporter::escape_field("two\nlines"), "\"two\nlines\"");
    EXPECT_EQ(IndexExporter::escape_field(""), "");
}

TEST_F(IndexExporterTest, WritesEveryTable) {
    write_file(dir / "a.jpg", "A");
    IndexRecord record;
    record.content_hash = "h1";
    record.path = dir / "a.jpg";
    record.url = "https://example.com/a.jpg?id=1,2";
    record.etag = "\"e1\"";
    ASSERT_TRUE(index->record(record).success());
    ASSERT_TRUE(index->mark_failed("https://example.com/bad", "http error: HTTP 404").success());
    
    IndexExporter exporter(*index);
    ASSERT_TRUE(exporter.export_to(dir / "export", ExportFormat::CSV).success());
    EXPECT_EQ(exporter.written_files().size(), 5u);
    
    EXPECT_EQ(read_file(dir / "export" / "url_records.csv"),
              "url,content_hash\r\n\"https://example.com/a.jpg?id=1,2\",h1\r\n");
    EXPECT_EQ(read_file(dir / "export" / "etag_records.csv"),
              "etag,content_hash\r\n\"\"\"e1\"\"\",h1\r\n");
    EXPECT_EQ(read_file(dir / "export" / "fingerprint_records.csv"), "fingerprint,content_hash\r\n");
    
    auto paths = read_file(dir / "export" / "path_records.csv");
    EXPECT_NE(paths.find("h1," + (dir / "a.jpg").string()), std::string::npos);
    
    auto failed = read_file(dir / "export" / "failed_urls.csv");
    EXPECT_EQ(failed.rfind("url,reason,attempts,last_seen\r\n", 0), 0u);
    EXPECT_NE(failed.find("https://example.com/bad,http error: HTTP 404,1,"), std::string::npos);
}

TEST_F(IndexExporterTest, ClosedIndexFails) {
    index->close();
    IndexExporter exporter(*index);
    EXPECT_EQ(exporter.export_to(dir / "export").error, ErrorCode::INDEX_UNAVAILABLE);
    EXPECT_TRUE(exporter.written_files().empty());
}

TEST_F(IndexExporterTest, JsonGroupsPathsByHash) {
    write_file(dir / "a.jpg", "A");
    write_file(dir / "copy" / "a.jpg", "A");
    write_file(dir / "b.png", "B");
    
    IndexRecord first;
    first.content_hash = "h1";
    first.path = dir / "a.jpg";
    first.url = "https://example.com/a.jpg?id=1,2";
    first.etag = "\"e1\"";
    ASSERT_TRUE(index->record(first).success());
    
    IndexRecord copy;
    copy.content_hash = "h1";
    copy.path = dir / "copy" / "a.jpg";
    ASSERT_TRUE(index->record(copy).success());
    
    IndexRecord other;
    other.content_hash = "h2";
    other.path = dir / "b.png";
    other.url = "https://example.com/b.png";
    ASSERT_TRUE(index->record(other).success());
    ASSERT_TRUE(index->mark_failed("https://example.com/bad", "timeout").success());
    
    IndexExporter exporter(*index);
    ASSERT_TRUE(exporter.export_to(dir / "export", ExportFormat::JSON).success());
    ASSERT_EQ(exporter.written_files().size(), 5u);
    EXPECT_EQ(exporter.written_files()[0].filename(), "url_records.json");
    
    auto urls = nlohmann::json::parse(read_file(dir / "export" / "url_records.json"));
    ASSERT_TRUE(urls.is_object());
    EXPECT_EQ(urls.size(), 2u);
    EXPECT_EQ(urls["https://example.com/a.jpg?id=1,2"], "h1");
    EXPECT_EQ(urls["https://example.com/b.png"], "h2");
    
    auto paths = nlohmann::json::parse(read_file(dir / "export" / "path_records.json"));
    ASSERT_TRUE(paths.contains("h1"));
    ASSERT_TRUE(paths["h1"].is_array());
    auto h1_paths = paths["h1"].get<std::vector<std::string>>();
    std::sort(h1_paths.begin(), h1_paths.end());
    std::vector<std::string> expected{(dir / "a.jpg").string(), (dir / "copy" / "a.jpg").string()};
    std::sort(expected.begin(), expected.end());
    EXPECT_EQ(h1_paths, expected);
    ASSERT_EQ(paths["h2"].size(), 1u);
    EXPECT_EQ(paths["h2"][0], (dir / "b.png").string());
    
    auto etags = nlohmann::json::parse(read_file(dir / "export" / "etag_records.json"));
    EXPECT_EQ(etags["\"e1\""], "h1");
    
    auto fingerprints = nlohmann::json::parse(read_file(dir / "export" / "fingerprint_records.json"));
    EXPECT_TRUE(fingerprints.is_object());
    EXPECT_TRUE(fingerprints.empty());
    
    auto failed = nlohmann::json::parse(read_file(dir / "export" / "failed_urls.json"));
    ASSERT_TRUE(failed.is_array());
    ASSERT_EQ(failed.size(), 1u);
    EXPECT_EQ(failed[0]["url"], "https://example.com/bad");
    EXPECT_EQ(failed[0]["reason"], "timeout");
    EXPECT_EQ(failed[0]["attempts"], 1);
    EXPECT_FALSE(failed[0]["last_seen"].get<std::string>().empty());
}

TEST_F(IndexExporterTest, EmptyIndexWritesEmptyDocuments) {
    IndexExporter exporter(*index);
    ASSERT_TRUE(exporter.export_to(dir / "export", ExportFormat::JSON).success());
    
    EXPECT_EQ(read_file(dir / "export" / "url_records.json"), "{}\n");
    EXPECT_EQ(read_file(dir / "export" / "path_records.json"), "{}\n");
    EXPECT_EQ(read_file(dir / "export" / "failed_urls.json"), "[]\n");
}

TEST(ExportFormatTest, ParsesKnownNames) {
    EXPECT_EQ(export_format_from_string("json"), ExportFormat::JSON);
    EXPECT_EQ(export_format_from_string("CSV"), ExportFormat::CSV);
    EXPECT_FALSE(export_format_from_string("xml").has_value());
    EXPECT_FALSE(export_format_from_string("").has_value());
}
