#include <gtest/gtest.h>
#include <chrono>
#include <regex>
#include "sheetdrop/server/HistoryIndex.hpp"
#include "test_support.hpp"

using sheetdrop::FileStorage;
using sheetdrop::HistoryIndex;
using sheetdrop::HistoryItem;
using namespace sheetdrop::test;

namespace {
    void age(const std::filesystem::path& file, std::chrono::minutes by) {
        std::filesystem::last_write_time(file, std::filesystem::last_write_time(file) - by);
    }
}

TEST(HistoryIndexTest, EntryNameUsesStemAndTimestamp) {
    EXPECT_EQ(HistoryIndex::entryName("sales.xlsx", "20240131-235959"), "sales_20240131-235959.json");
    EXPECT_EQ(HistoryIndex::entryName("archive.tar.gz", "20240101-000000"), "archive.tar_20240101-000000.json");
    EXPECT_EQ(HistoryIndex::entryName("noext", "20240101-000000"), "noext_20240101-000000.json");
    EXPECT_EQ(HistoryIndex::urlFor("sales_20240131-235959.json"), "/history/sales_20240131-235959.json");
}

TEST(HistoryIndexTest, TimestampFormats) {
    std::time_t now = std::time(nullptr);
    EXPECT_TRUE(std::regex_match(HistoryIndex::compactTimestamp(now), std::regex(R"(\d{8}-\d{6})")));
    EXPECT_TRUE(std::regex_match(HistoryIndex::displayTimestamp(now),
                                 std::regex(R"(\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2})")));
}

TEST(HistoryIndexTest, ListIsEmptyWithoutDirectory) {
    TempDir dir;
    FileStorage storage(dir.path().string());
    HistoryIndex history(storage);
    EXPECT_TRUE(history.list().empty());
}

TEST(HistoryIndexTest, ListsJsonNewestFirst) {
    TempDir dir;
    FileStorage storage(dir.path().string());
    HistoryIndex history(storage);
    ASSERT_TRUE(history.ensureDirectory().ok);

    auto hist = dir / "history";
    writeFile(hist / "old_20240101-000000.json", "{}");
    writeFile(hist / "mid_20240102-000000.json", "{}");
    writeFile(hist / "new_20240103-000000.json", "{}");
    writeFile(hist / "notes.txt", "ignored");
    std::filesystem::create_directory(hist / "nested.json");
    writeFile(hist / "nested.json" / "deep.json", "{}");
    age(hist / "old_20240101-000000.json", std::chrono::minutes(30));
    age(hist / "mid_20240102-000000.json", std::chrono::minutes(20));
    age(hist / "new_20240103-000000.json", std::chrono::minutes(10));

    std::vector<HistoryItem> items = history.list();
    ASSERT_EQ(items.size(), 3u);
    EXPECT_EQ(items[0].name, "new_20240103-000000.json");
    EXPECT_EQ(items[1].name, "mid_20240102-000000.json");
    EXPECT_EQ(items[2].name, "old_20240101-000000.json");

    nlohmann::json first = items[0].to_json();
    EXPECT_EQ(first["url"], "/history/new_20240103-000000.json");
    EXPECT_TRUE(std::regex_match(first["timestamp"].get<std::string>(),
                                 std::regex(R"(\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2})")));
    EXPECT_EQ(first.size(), 3u);
}

TEST(HistoryIndexTest, RecordCopiesResultBytes) {
    TempDir dir;
    FileStorage storage(dir.path().string());
    HistoryIndex history(storage);
    ASSERT_TRUE(history.ensureDirectory().ok);
    ASSERT_TRUE(history.ensureDirectory().ok);

    std::string document = "{\"data_summary\": {\"rows\": 5},\n \"extra\": [1, 2]}\n";
    writeFile(dir / "analysis_results.json", document);

    auto outcome = history.record("analysis_results.json", "book_20240101-120000.json");
    EXPECT_TRUE(outcome.ok) << outcome.reason;
    EXPECT_EQ(readFile(dir / "history" / "book_20240101-120000.json"), document);
}

TEST(HistoryIndexTest, RecordReportsMissingResult) {
    TempDir dir;
    FileStorage storage(dir.path().string());
    HistoryIndex history(storage);
    ASSERT_TRUE(history.ensureDirectory().ok);

    auto outcome = history.record("analysis_results.json", "book_20240101-120000.json");
    EXPECT_FALSE(outcome.ok);
    EXPECT_FALSE(outcome.reason.empty());
    EXPECT_TRUE(history.list().empty());
}

TEST(HistoryIndexTest, EnsureDirectoryFailsWhenBlockedByFile) {
    TempDir dir;
    FileStorage storage(dir.path().string());
    HistoryIndex history(storage);
    writeFile(dir / "history", "not a directory");

    auto outcome = history.ensureDirectory();
    EXPECT_FALSE(outcome.ok);
    EXPECT_TRUE(history.list().empty());
}
