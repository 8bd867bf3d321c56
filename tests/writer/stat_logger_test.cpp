// =============================================================================
// statlog - Stat Logger Tests
// =============================================================================
// Tests for the plain and deduplicating writers: rotation, retention,
// dedup baselines and failure handling.
// =============================================================================

#include <gtest/gtest.h>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <random>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "statlog/format/line_codec.h"
#include "statlog/io/compressed_stream.h"
#include "statlog/io/segment_store.h"
#include "statlog/stats/snapshot_codec.h"
#include "statlog/writer/stat_writer.h"

namespace statlog::writer::test {

// =============================================================================
// Test Fixtures
// =============================================================================

class StatLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        static std::atomic<int> counter{0};
        dir_ = std::filesystem::temp_directory_path() /
               ("statlog_writer_test_" + std::to_string(counter++) + "_" +
                std::to_string(std::random_device{}()));
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    [[nodiscard]] StatLoggerConfig makeConfig(std::uint64_t sizeLimit, SegmentIndex numFiles,
                                              bool dedup = false) const {
        StatLoggerConfig config;
        config.path = dir_ / "stats";
        config.sizeLimit = sizeLimit;
        config.numFiles = numFiles;
        config.dedup = dedup;
        config.clock = [] {
            return TimePoint{} + std::chrono::milliseconds(1'700'000'000'123);
        };
        return config;
    }

    /// @brief All lines of all segments, oldest segment first.
    [[nodiscard]] std::vector<std::string> readAllLines() const {
        auto segments = io::listSegments(dir_ / "stats.log");
        std::reverse(segments.begin(), segments.end());

        std::vector<std::string> lines;
        for (const auto& segment : segments) {
            auto in = io::openInputFile(segment.path);
            std::string line;
            while (std::getline(*in, line)) {
                lines.push_back(line);
            }
        }
        return lines;
    }

    /// @brief Payload of a written line.
    [[nodiscard]] static std::string payloadOf(const std::string& line) {
        auto decoded = format::LineCodec::decode(line);
        EXPECT_TRUE(decoded.has_value() && decoded->has_value()) << line;
        if (!decoded || !decoded->has_value()) {
            return {};
        }
        return line.substr((*decoded)->payloadStart);
    }

    [[nodiscard]] std::size_t segmentCount() const {
        return io::listSegments(dir_ / "stats.log").size();
    }

    std::filesystem::path dir_;
};

/// @brief Snapshot of roughly 40 bytes, distinct per index.
[[nodiscard]] stats::Snapshot smallSnapshot(int index) {
    return stats::Snapshot{{"i", index}, {"pad", "xxxxxxxxxxxxxxxxxxxx"}};
}

// =============================================================================
// Configuration
// =============================================================================

TEST_F(StatLoggerTest, InvalidConfigurationIsRejected) {
    auto badCount = makeConfig(128, 0);
    EXPECT_THROW((void)createStatLogger(badCount), ValidationError);

    auto badTimestamp = makeConfig(128, 4);
    badTimestamp.timestampFormat = "ts=%Y";
    EXPECT_THROW((void)createStatLogger(badTimestamp), ValidationError);

    auto badPath = makeConfig(128, 4);
    badPath.path.clear();
    EXPECT_THROW((void)createStatLogger(badPath), ValidationError);

    auto noClock = makeConfig(128, 4);
    noClock.clock = nullptr;
    EXPECT_FALSE(noClock.validate().has_value());
}

// =============================================================================
// Plain Writer
// =============================================================================

TEST_F(StatLoggerTest, WritesTimestampTypeAndPayload) {
    auto config = makeConfig(1024, 4);
    config.timestampFormat = "%L";
    auto writer = createStatLogger(config);

    ASSERT_TRUE(writer->write("kStats", stats::Snapshot{{"k1", 10}}).has_value());

    auto lines = readAllLines();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], R"(123 kStats {"k1":10})");
    EXPECT_EQ(writer->activePath(), dir_ / "stats.00.log");
}

TEST_F(StatLoggerTest, RotationKeepsEveryRecordWithinRetention) {
    auto writer = createStatLogger(makeConfig(128, 4));

    std::vector<stats::Snapshot> written;
    for (int i = 0; i < 5; ++i) {
        written.push_back(smallSnapshot(i));
        ASSERT_TRUE(writer->write("kStats", written.back()).has_value());
    }

    EXPECT_LE(segmentCount(), 4u);
    auto lines = readAllLines();
    ASSERT_EQ(lines.size(), written.size());
    for (std::size_t i = 0; i < lines.size(); ++i) {
        EXPECT_EQ(stats::decodeSnapshot(payloadOf(lines[i])), written[i]) << lines[i];
    }
    EXPECT_GE(writer->stats().rotations, 1u);
}

TEST_F(StatLoggerTest, RetentionDropsOldestSegments) {
    auto writer = createStatLogger(makeConfig(1, 4));

    for (int i = 0; i < 6; ++i) {
        ASSERT_TRUE(writer->write("kStats", smallSnapshot(i)).has_value());
    }

    EXPECT_EQ(segmentCount(), 4u);
    auto lines = readAllLines();
    ASSERT_EQ(lines.size(), 4u);
    for (std::size_t i = 0; i < lines.size(); ++i) {
        EXPECT_EQ(stats::decodeSnapshot(payloadOf(lines[i])),
                  smallSnapshot(static_cast<int>(i) + 2));
    }

    auto counters = writer->stats();
    EXPECT_EQ(counters.recordsWritten, 6u);
    EXPECT_EQ(counters.rotations, 5u);
    EXPECT_EQ(counters.failedWrites, 0u);
}

TEST_F(StatLoggerTest, EncodingFailureIsReportedAndWriterStaysUsable) {
    auto writer = createStatLogger(makeConfig(1024, 4));

    auto result = writer->write("kStats", stats::Snapshot{{"bad", stats::OpaqueValue{"[1,"}}});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kEncodingError);

    EXPECT_TRUE(writer->write("kStats", smallSnapshot(1)).has_value());
    EXPECT_EQ(readAllLines().size(), 1u);
    EXPECT_EQ(writer->stats().failedWrites, 1u);
}

TEST_F(StatLoggerTest, DurableModeStillWrites) {
    auto config = makeConfig(1024, 4);
    config.durable = true;
    auto writer = createStatLogger(config);

    EXPECT_TRUE(writer->write("kStats", smallSnapshot(1)).has_value());
    writer->setDurable(false);
    EXPECT_TRUE(writer->write("kStats", smallSnapshot(2)).has_value());
    EXPECT_EQ(readAllLines().size(), 2u);
}

TEST_F(StatLoggerTest, ReopenAppendsToExistingSegment) {
    {
        auto writer = createStatLogger(makeConfig(1024, 4));
        ASSERT_TRUE(writer->write("kStats", smallSnapshot(1)).has_value());
    }
    auto writer = createStatLogger(makeConfig(1024, 4));
    ASSERT_TRUE(writer->write("kStats", smallSnapshot(2)).has_value());

    EXPECT_EQ(readAllLines().size(), 2u);
}

TEST_F(StatLoggerTest, ConcurrentWritesProduceWholeLines) {
    auto writer = createStatLogger(makeConfig(512, 50));
    constexpr int kThreads = 4;
    constexpr int kPerThread = 50;

    {
        std::vector<std::jthread> threads;
        for (int t = 0; t < kThreads; ++t) {
            threads.emplace_back([&writer, t] {
                for (int i = 0; i < kPerThread; ++i) {
                    EXPECT_TRUE(
                        writer->write("kThread" + std::to_string(t), smallSnapshot(i)).has_value());
                }
            });
        }
    }

    auto lines = readAllLines();
    ASSERT_EQ(lines.size(), static_cast<std::size_t>(kThreads * kPerThread));
    for (const auto& line : lines) {
        EXPECT_EQ(stats::decodeSnapshot(payloadOf(line)).size(), 2u);
    }
}

// =============================================================================
// Deduplicating Writer
// =============================================================================

TEST_F(StatLoggerTest, DedupWritesOnlyChangedKeys) {
    auto writer = createStatLogger(makeConfig(4096, 4, true));
    auto baseline =
        stats::decodeSnapshot(R"({"k1":10,"k2":"Value2","k3":{"k31":310,"k32":"Value32"}})");

    ASSERT_TRUE(writer->write("kStats", baseline).has_value());
    auto changed = baseline;
    changed.set("k1", 9876);
    ASSERT_TRUE(writer->write("kStats", changed).has_value());
    ASSERT_TRUE(writer->write("kStats", changed).has_value());

    auto lines = readAllLines();
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(payloadOf(lines[0]), R"({"k1":10,"k2":"Value2","k3":{"k31":310,"k32":"Value32"}})");
    EXPECT_EQ(payloadOf(lines[1]), R"({"k1":9876})");
    EXPECT_EQ(payloadOf(lines[2]), "{}");
}

TEST_F(StatLoggerTest, DedupBaselinesArePerType) {
    auto writer = createStatLogger(makeConfig(4096, 4, true));

    ASSERT_TRUE(writer->write("kA", stats::Snapshot{{"x", 1}}).has_value());
    ASSERT_TRUE(writer->write("kB", stats::Snapshot{{"x", 1}}).has_value());
    ASSERT_TRUE(writer->write("kA", stats::Snapshot{{"x", 1}}).has_value());

    auto lines = readAllLines();
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(payloadOf(lines[0]), R"({"x":1})");
    EXPECT_EQ(payloadOf(lines[1]), R"({"x":1})");
    EXPECT_EQ(payloadOf(lines[2]), "{}");
}

TEST_F(StatLoggerTest, DedupWritesFullRecordAfterRotation) {
    auto writer = createStatLogger(makeConfig(1, 10, true));
    stats::Snapshot snapshot{{"k1", 1}, {"k2", "same"}};

    ASSERT_TRUE(writer->write("kStats", snapshot).has_value());
    ASSERT_TRUE(writer->write("kStats", snapshot).has_value());

    // Every write rotated, so each segment starts with a full record.
    auto lines = readAllLines();
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(payloadOf(lines[0]), R"({"k1":1,"k2":"same"})");
    EXPECT_EQ(payloadOf(lines[1]), R"({"k1":1,"k2":"same"})");
}

TEST_F(StatLoggerTest, DedupBaselineAdvancesOnlyOnSuccess) {
    auto writer = createStatLogger(makeConfig(4096, 4, true));

    ASSERT_TRUE(writer->write("kStats", stats::Snapshot{{"a", 1}, {"b", 2}}).has_value());
    auto failed = writer->write(
        "kStats", stats::Snapshot{{"a", 5}, {"b", 2}, {"bad", stats::OpaqueValue{"{"}}});
    ASSERT_FALSE(failed.has_value());
    ASSERT_TRUE(writer->write("kStats", stats::Snapshot{{"a", 1}, {"b", 3}}).has_value());

    auto lines = readAllLines();
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(payloadOf(lines[1]), R"({"b":3})");
}

TEST_F(StatLoggerTest, FailedSyncKeepsBaselineInStepWithFile) {
    // fsync on a FIFO fails with EINVAL after the line went through.
    const auto fifo = dir_ / "stats.00.log";
    ASSERT_EQ(::mkfifo(fifo.c_str(), 0644), 0);
    const int readFd = ::open(fifo.c_str(), O_RDONLY | O_NONBLOCK);
    ASSERT_GE(readFd, 0);

    {
        auto writer = createStatLogger(makeConfig(4096, 4, true));
        EXPECT_TRUE(writer->write("kStats", stats::Snapshot{{"a", 1}, {"b", 1}}).has_value());

        writer->setDurable(true);
        auto failed = writer->write("kStats", stats::Snapshot{{"a", 2}, {"b", 1}});
        ASSERT_FALSE(failed.has_value());
        EXPECT_EQ(failed.error().code(), ErrorCode::kIOError);

        writer->setDurable(false);
        EXPECT_TRUE(writer->write("kStats", stats::Snapshot{{"a", 1}, {"b", 1}}).has_value());
    }

    std::string text;
    char buffer[4096];
    ssize_t count = 0;
    while ((count = ::read(readFd, buffer, sizeof(buffer))) > 0) {
        text.append(buffer, static_cast<std::size_t>(count));
    }
    ::close(readFd);

    std::vector<std::string> lines;
    std::istringstream in(text);
    for (std::string line; std::getline(in, line);) {
        lines.push_back(line);
    }
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(payloadOf(lines[0]), R"({"a":1,"b":1})");
    EXPECT_EQ(payloadOf(lines[1]), R"({"a":2})");
    EXPECT_EQ(payloadOf(lines[2]), R"({"a":1})");
}

TEST_F(StatLoggerTest, FailedRotationWritesNothingAndRecovers) {
    auto writer = createStatLogger(makeConfig(1, 3, true));
    ASSERT_TRUE(writer->write("kStats", stats::Snapshot{{"a", 1}, {"b", 1}}).has_value());

    const auto blocker = dir_ / "stats.01.log.gz.tmp";
    std::filesystem::create_directories(blocker / "inner");

    auto failed = writer->write("kStats", stats::Snapshot{{"a", 1}, {"b", 2}});
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().code(), ErrorCode::kIOError);
    ASSERT_EQ(readAllLines().size(), 1u);
    EXPECT_EQ(writer->stats().failedWrites, 1u);

    std::filesystem::remove_all(blocker);
    ASSERT_TRUE(writer->write("kStats", stats::Snapshot{{"a", 1}, {"b", 2}}).has_value());

    auto lines = readAllLines();
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(payloadOf(lines[0]), R"({"a":1,"b":1})");
    EXPECT_EQ(payloadOf(lines[1]), R"({"a":1,"b":2})");
    EXPECT_TRUE(std::filesystem::exists(dir_ / "stats.01.log.gz"));
}

}  // namespace statlog::writer::test
