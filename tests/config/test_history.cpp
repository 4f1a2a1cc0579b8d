#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include <nlohmann/json.hpp>

#include "offload/config/history.hpp"

using namespace offload::config;
namespace fs = std::filesystem;

class HistoryStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        testDir = fs::temp_directory_path() / "offload_history_test";
        fs::remove_all(testDir);
        fs::create_directories(testDir);
        file = testDir / "history.json";
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(testDir, ec);
    }

    static auto makeEntry(const std::string& title) -> HistoryEntry {
        HistoryEntry entry;
        entry.title = title;
        entry.date = "Jun 06";
        entry.time = "04:12 PM";
        entry.duration = "3m 7s";
        entry.totalSize = "1.0 GB";
        entry.avgSpeed = "5.5 MB/s";
        entry.totalFiles = 3;
        entry.errors = 1;
        entry.timestamp = 1717690320.0;
        entry.fileNames = {"DCIM/A001.MP4", "DCIM/A002.MP4", "DCIM/A003.MP4"};
        return entry;
    }

    fs::path testDir;
    fs::path file;
};

TEST_F(HistoryStoreTest, EmptyWhenMissing) {
    HistoryStore store(file);
    EXPECT_TRUE(store.load().empty());
}

TEST_F(HistoryStoreTest, AppendPersists) {
    HistoryStore store(file);
    const auto retained = store.append(makeEntry("wedding"));
    ASSERT_EQ(retained.size(), 1U);

    const auto loaded = HistoryStore(file).load();
    ASSERT_EQ(loaded.size(), 1U);
    EXPECT_EQ(loaded[0].title, "wedding");
    EXPECT_EQ(loaded[0].totalFiles, 3U);
    EXPECT_EQ(loaded[0].errors, 1U);
    EXPECT_EQ(loaded[0].fileNames.size(), 3U);
    EXPECT_DOUBLE_EQ(loaded[0].timestamp, 1717690320.0);
}

TEST_F(HistoryStoreTest, CapDropsOldest) {
    HistoryStore store(file, 3);
    for (int i = 0; i < 5; ++i) {
        store.append(makeEntry("job" + std::to_string(i)));
    }
    const auto loaded = store.load();
    ASSERT_EQ(loaded.size(), 3U);
    EXPECT_EQ(loaded.front().title, "job2");
    EXPECT_EQ(loaded.back().title, "job4");
}

TEST_F(HistoryStoreTest, DefaultCapIsFifty) {
    HistoryStore store(file);
    std::vector<HistoryEntry> last;
    for (int i = 0; i < 55; ++i) {
        last = store.append(makeEntry("job" + std::to_string(i)));
    }
    EXPECT_EQ(last.size(), HistoryStore::K_DEFAULT_CAP);
    EXPECT_EQ(last.front().title, "job5");
}

TEST_F(HistoryStoreTest, CorruptFileIsTreatedAsEmpty) {
    {
        std::ofstream out(file);
        out << "[{\"title\": ";
    }
    HistoryStore store(file);
    EXPECT_TRUE(store.load().empty());
    EXPECT_EQ(store.append(makeEntry("fresh")).size(), 1U);
}

TEST(HistoryEntryTest, JsonKeys) {
    HistoryEntry entry;
    entry.title = "untitled";
    entry.totalSize = "2.0 MB";
    const nlohmann::json j = entry;
    EXPECT_EQ(j["title"], "untitled");
    EXPECT_EQ(j["total_size"], "2.0 MB");
    EXPECT_TRUE(j.contains("avg_speed"));
    EXPECT_TRUE(j.contains("file_names"));
}
