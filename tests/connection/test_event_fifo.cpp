#include <gtest/gtest.h>

#include <algorithm>
#include <array>
#include <chrono>
#include <filesystem>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <nlohmann/json.hpp>

#include "offload/connection/event_fifo.hpp"

using namespace offload::connection;
namespace fs = std::filesystem;
using json = nlohmann::json;
using namespace std::chrono_literals;

TEST(EncodeEventTest, OneLinePerEvent) {
    const std::string line =
        encodeEvent("file_progress", {{"overall_percent", 12.5}});
    ASSERT_FALSE(line.empty());
    EXPECT_EQ(line.back(), '\n');
    EXPECT_EQ(line.find('\n'), line.size() - 1);

    const json decoded = json::parse(line);
    EXPECT_EQ(decoded["event"], "file_progress");
    EXPECT_DOUBLE_EQ(decoded["data"]["overall_percent"].get<double>(), 12.5);
}

TEST(EncodeEventTest, EmbeddedNewlinesAreEscaped) {
    const std::string line =
        encodeEvent("file_error", {{"error", "first\nsecond"}});
    EXPECT_EQ(line.find('\n'), line.size() - 1);
}

TEST(EncodeEventTest, InvalidUtf8IsReplaced) {
    const std::string line =
        encodeEvent("file_started", {{"name", std::string("clip\xff.mp4")}});
    EXPECT_NO_THROW((void)json::parse(line));
}

class EventFifoWriterTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = fs::temp_directory_path() / "offload_event_fifo_test";
        fs::remove_all(dir);
        fifo = dir / "events.fifo";
    }

    void TearDown() override {
        if (reader >= 0) {
            ::close(reader);
        }
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    auto drain() -> std::string {
        std::string data;
        std::array<char, 4096> buffer{};
        for (;;) {
            const ssize_t count = ::read(reader, buffer.data(), buffer.size());
            if (count <= 0) {
                break;
            }
            data.append(buffer.data(), static_cast<std::size_t>(count));
        }
        return data;
    }

    // Reads until @p lines newlines have arrived or a few seconds pass.
    auto readLines(std::size_t lines) -> std::string {
        std::string data;
        std::array<char, 4096> buffer{};
        const auto deadline = std::chrono::steady_clock::now() + 5s;
        while (static_cast<std::size_t>(
                   std::count(data.begin(), data.end(), '\n')) < lines &&
               std::chrono::steady_clock::now() < deadline) {
            pollfd pfd{reader, POLLIN, 0};
            if (::poll(&pfd, 1, 100) <= 0) {
                continue;
            }
            const ssize_t count = ::read(reader, buffer.data(), buffer.size());
            if (count > 0) {
                data.append(buffer.data(), static_cast<std::size_t>(count));
            }
        }
        return data;
    }

    static auto splitLines(const std::string& data) -> std::vector<json> {
        std::vector<json> decoded;
        std::istringstream in(data);
        for (std::string line; std::getline(in, line);) {
            decoded.push_back(json::parse(line));
        }
        return decoded;
    }

    static auto bigStatus() -> json {
        json files = json::array();
        for (int i = 0; i < 2000; ++i) {
            files.push_back({{"name", "DCIM/100MEDIA/CLIP" + std::to_string(i) +
                                          ".MP4"},
                             {"size", 1000000 + i},
                             {"size_human", "976.6 KB"}});
        }
        return {{"drive_mounted", true}, {"files", files}};
    }

    fs::path dir;
    fs::path fifo;
    int reader{-1};
};

TEST_F(EventFifoWriterTest, DropsWithoutReader) {
    EventFifoWriter writer(fifo);
    writer.create();
    EXPECT_TRUE(fs::is_fifo(fifo));

    EXPECT_FALSE(writer.write("status", json::object()));
    EXPECT_FALSE(writer.write("status", json::object()));
    EXPECT_EQ(writer.dropped(), 2U);
}

TEST_F(EventFifoWriterTest, DeliversToReader) {
    EventFifoWriter writer(fifo);
    writer.create();
    reader = ::open(fifo.c_str(), O_RDONLY | O_NONBLOCK);
    ASSERT_GE(reader, 0);

    EXPECT_TRUE(writer.write("nas_connected", json::object()));
    EXPECT_TRUE(writer.write("file_started", {{"index", 0}}));
    EXPECT_EQ(writer.dropped(), 0U);

    EXPECT_EQ(drain(), encodeEvent("nas_connected", json::object()) +
                           encodeEvent("file_started", {{"index", 0}}));
}

TEST_F(EventFifoWriterTest, CreateKeepsExistingFifo) {
    EventFifoWriter first(fifo);
    first.create();
    EventFifoWriter second(fifo);
    EXPECT_NO_THROW(second.create());
}

TEST_F(EventFifoWriterTest, LineLargerThanPipeArrivesWhole) {
    EventFifoWriter writer(fifo, {}, 3000ms);
    writer.create();
    reader = ::open(fifo.c_str(), O_RDONLY | O_NONBLOCK);
    ASSERT_GE(reader, 0);

    const json status = bigStatus();
    ASSERT_GT(encodeEvent("status", status).size(), 64U * 1024);

    std::string received;
    std::thread slowReader([&] {
        std::this_thread::sleep_for(100ms);
        received = readLines(2);
    });
    EXPECT_TRUE(writer.write("status", status));
    EXPECT_TRUE(writer.write("file_progress", json::object()));
    slowReader.join();

    const auto lines = splitLines(received);
    ASSERT_EQ(lines.size(), 2U);
    EXPECT_EQ(lines[0]["event"], "status");
    EXPECT_EQ(lines[0]["data"]["files"].size(), 2000U);
    EXPECT_EQ(lines[1]["event"], "file_progress");
    EXPECT_EQ(writer.dropped(), 0U);
}

TEST_F(EventFifoWriterTest, StalledReaderSeesEndOfFileNotSplicedLines) {
    EventFifoWriter writer(fifo, {}, 50ms);
    writer.create();
    reader = ::open(fifo.c_str(), O_RDONLY | O_NONBLOCK);
    ASSERT_GE(reader, 0);

    EXPECT_FALSE(writer.write("status", bigStatus()));
    EXPECT_EQ(writer.dropped(), 1U);

    // The writer has closed: the reader gets the unterminated tail, then EOF.
    const std::string tail = drain();
    EXPECT_FALSE(tail.empty());
    EXPECT_EQ(tail.find('\n'), std::string::npos);

    EXPECT_TRUE(writer.write("nas_connected", json::object()));
    const auto lines = splitLines(readLines(1));
    ASSERT_EQ(lines.size(), 1U);
    EXPECT_EQ(lines[0]["event"], "nas_connected");
}

TEST_F(EventFifoWriterTest, EveryOpenStartsWithSnapshot) {
    int snapshots = 0;
    EventFifoWriter writer(fifo, [&snapshots] {
        ++snapshots;
        return json{{"drive_mounted", false}};
    });
    writer.create();

    EXPECT_FALSE(writer.write("file_progress", {{"overall_percent", 10.0}}));
    EXPECT_EQ(snapshots, 0);

    reader = ::open(fifo.c_str(), O_RDONLY | O_NONBLOCK);
    ASSERT_GE(reader, 0);
    EXPECT_TRUE(writer.write("file_progress", {{"overall_percent", 20.0}}));
    EXPECT_TRUE(writer.write("file_progress", {{"overall_percent", 30.0}}));

    const auto lines = splitLines(readLines(3));
    ASSERT_EQ(lines.size(), 3U);
    EXPECT_EQ(lines[0]["event"], "status");
    EXPECT_FALSE(lines[0]["data"]["drive_mounted"].get<bool>());
    EXPECT_DOUBLE_EQ(lines[1]["data"]["overall_percent"].get<double>(), 20.0);
    EXPECT_DOUBLE_EQ(lines[2]["data"]["overall_percent"].get<double>(), 30.0);
    EXPECT_EQ(snapshots, 1);
}
