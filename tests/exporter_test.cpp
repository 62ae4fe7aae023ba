#include <gtest/gtest.h>

#include "fslogger/report/exporter.hpp"
#include "test_utils.hpp"

#include <fstream>

namespace fslogger {
namespace report {
namespace {

common::FileRecord makeRecord(const std::string& name, int64_t size, bool blocked) {
    common::FileRecord record;
    record.path = "/data/" + name;
    record.name = name;
    record.size = size;
    record.is_blocked = blocked;
    if (blocked) {
        record.block_reason = "File size exceeds limit";
    }
    return record;
}

common::ScanResult sampleResult() {
    common::ScanResult result;
    result.files = {
        makeRecord("a.txt", 10, false),
        makeRecord("b.bin", 2048, true),
        makeRecord("c.iso", 4096, true),
    };
    result.progress.total_files = 3;
    result.progress.total_size = 10 + 2048 + 4096;
    result.duration = std::chrono::milliseconds(1234);
    result.success = true;
    return result;
}

}

TEST(BlockedFilesExporter, ManifestListsOnlyBlockedFiles) {
    auto exported_at = std::chrono::system_clock::from_time_t(1700000000);
    auto manifest = BlockedFilesExporter::buildManifest(sampleResult(), exported_at);

    EXPECT_EQ(manifest["timestamp"].get<std::string>(), "2023-11-14T22:13:20Z");
    EXPECT_EQ(manifest["total_files"].get<int64_t>(), 3);
    EXPECT_EQ(manifest["blocked_count"].get<size_t>(), 2u);
    EXPECT_EQ(manifest["scan_duration_ms"].get<int64_t>(), 1234);
    EXPECT_EQ(manifest["total_size"].get<int64_t>(), 10 + 2048 + 4096);
    EXPECT_EQ(manifest["blocked_size"].get<int64_t>(), 2048 + 4096);

    ASSERT_EQ(manifest["blocked_files"].size(), 2u);
    EXPECT_EQ(manifest["blocked_files"][0]["name"].get<std::string>(), "b.bin");
    EXPECT_EQ(manifest["blocked_files"][1]["name"].get<std::string>(), "c.iso");
    EXPECT_EQ(manifest["blocked_files"][0]["block_reason"].get<std::string>(), "File size exceeds limit");
}

TEST(BlockedFilesExporter, EmptyResultExportsEmptyList) {
    common::ScanResult result;
    auto manifest = BlockedFilesExporter::buildManifest(result, std::chrono::system_clock::now());

    EXPECT_TRUE(manifest["blocked_files"].is_array());
    EXPECT_TRUE(manifest["blocked_files"].empty());
    EXPECT_EQ(manifest["blocked_count"].get<size_t>(), 0u);
    EXPECT_EQ(manifest["blocked_size"].get<int64_t>(), 0);
}

TEST(BlockedFilesExporter, CreatesParentDirectories) {
    tests::TempDir dir;
    auto output = dir / "reports/2024/blocked.json";

    BlockedFilesExporter exporter;
    auto error = exporter.exportBlockedFiles(sampleResult(), output);
    EXPECT_FALSE(error.has_value()) << error.value_or("");
    ASSERT_TRUE(std::filesystem::exists(output));

    std::ifstream in(output);
    auto manifest = nlohmann::json::parse(in);
    EXPECT_EQ(manifest["blocked_count"].get<size_t>(), 2u);
}

TEST(BlockedFilesExporter, ReportsFailureAsMessage) {
    tests::TempDir dir;
    tests::writeFile(dir / "occupied", "regular file");

    BlockedFilesExporter exporter;
    auto error = exporter.exportBlockedFiles(sampleResult(), dir / "occupied" / "blocked.json");

    ASSERT_TRUE(error.has_value());
    EXPECT_FALSE(error->empty());
}

TEST(BlockedFilesExporter, InvalidUtf8NamesAreReplaced) {
    tests::TempDir dir;
    auto result = sampleResult();
    result.files.push_back(makeRecord("raw\xfe\xff.bin", 1, true));

    BlockedFilesExporter exporter;
    auto output = dir / "blocked.json";
    auto error = exporter.exportBlockedFiles(result, output);
    ASSERT_FALSE(error.has_value()) << *error;

    std::ifstream in(output);
    auto manifest = nlohmann::json::parse(in);
    ASSERT_EQ(manifest["blocked_files"].size(), 3u);
    EXPECT_EQ(manifest["blocked_files"][2]["name"].get<std::string>(), "raw\xEF\xBF\xBD\xEF\xBF\xBD.bin");
}

}}
