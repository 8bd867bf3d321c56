// =============================================================================
// statlog - Segment Store Tests
// =============================================================================
// Unit tests for segment naming, rotation and retention.
// =============================================================================

#include "statlog/io/segment_store.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <string>
#include <vector>

#include "statlog/io/compressed_stream.h"

namespace statlog::io::test {

// =============================================================================
// Test Fixtures
// =============================================================================

class SegmentStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        static std::atomic<int> counter{0};
        dir_ = std::filesystem::temp_directory_path() /
               ("statlog_segment_test_" + std::to_string(counter++) + "_" +
                std::to_string(std::random_device{}()));
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    [[nodiscard]] SegmentStoreConfig makeConfig(std::uint64_t sizeLimit, SegmentIndex numFiles,
                                                bool compress = true) const {
        SegmentStoreConfig config;
        config.path = dir_ / "stats";
        config.sizeLimit = sizeLimit;
        config.numFiles = numFiles;
        config.compress = compress;
        return config;
    }

    /// @brief File names in the test directory, sorted.
    [[nodiscard]] std::vector<std::string> fileNames() const {
        std::vector<std::string> names;
        for (const auto& entry : std::filesystem::directory_iterator(dir_)) {
            names.push_back(entry.path().filename().string());
        }
        std::sort(names.begin(), names.end());
        return names;
    }

    [[nodiscard]] static std::string readSegment(const std::filesystem::path& path) {
        auto in = openInputFile(path);
        return {std::istreambuf_iterator<char>(*in), std::istreambuf_iterator<char>()};
    }

    std::filesystem::path dir_;
};

// =============================================================================
// Naming
// =============================================================================

TEST_F(SegmentStoreTest, NormalizeAppendsLogSuffix) {
    EXPECT_EQ(normalizeLogPath("var/stats"), std::filesystem::path("var/stats.log"));
    EXPECT_EQ(normalizeLogPath("var/stats.log"), std::filesystem::path("var/stats.log"));
    EXPECT_EQ(normalizeLogPath("stats.txt"), std::filesystem::path("stats.txt.log"));
}

TEST_F(SegmentStoreTest, NormalizeRejectsMissingFileName) {
    EXPECT_THROW((void)normalizeLogPath(""), ValidationError);
    EXPECT_THROW((void)normalizeLogPath("var/"), ValidationError);
    EXPECT_THROW((void)normalizeLogPath("var/.log"), ValidationError);
}

TEST_F(SegmentStoreTest, SegmentPathsAreZeroPadded) {
    const std::filesystem::path base = "var/stats.log";
    EXPECT_EQ(segmentPath(base, 0, false), std::filesystem::path("var/stats.00.log"));
    EXPECT_EQ(segmentPath(base, 7, true), std::filesystem::path("var/stats.07.log.gz"));
    EXPECT_EQ(segmentPath(base, 42, false), std::filesystem::path("var/stats.42.log"));
}

TEST_F(SegmentStoreTest, ListSegmentsIgnoresUnrelatedFiles) {
    for (const char* name : {"stats.00.log", "stats.02.log.gz", "stats.01.log", "stats.log",
                             "stats.1.log", "stats.03.log.gz.tmp", "other.01.log",
                             "stats_duped.log"}) {
        std::ofstream(dir_ / name) << "x";
    }

    auto segments = listSegments(dir_ / "stats.log");
    ASSERT_EQ(segments.size(), 3u);
    EXPECT_EQ(segments[0].index, 0u);
    EXPECT_EQ(segments[1].index, 1u);
    EXPECT_FALSE(segments[1].compressed);
    EXPECT_EQ(segments[2].index, 2u);
    EXPECT_TRUE(segments[2].compressed);
}

TEST_F(SegmentStoreTest, ListSegmentsOfMissingDirectoryIsEmpty) {
    EXPECT_TRUE(listSegments(dir_ / "missing" / "stats.log").empty());
}

// =============================================================================
// Construction
// =============================================================================

TEST_F(SegmentStoreTest, RejectsInvalidSegmentCount) {
    EXPECT_THROW({ SegmentStore store(makeConfig(100, 0)); }, ValidationError);
    EXPECT_THROW({ SegmentStore store(makeConfig(100, kMaxSegmentCount + 1)); }, ValidationError);
}

TEST_F(SegmentStoreTest, CreatesDirectoryAndActiveSegment) {
    auto config = makeConfig(100, 3);
    config.path = dir_ / "nested" / "deeper" / "stats.log";
    SegmentStore store(config);

    EXPECT_TRUE(std::filesystem::exists(dir_ / "nested" / "deeper" / "stats.00.log"));
    EXPECT_EQ(store.size(), 0u);
}

TEST_F(SegmentStoreTest, ReopenContinuesExistingActiveSegment) {
    {
        SegmentStore store(makeConfig(100, 3));
        store.append("1 t {}\n");
    }
    SegmentStore store(makeConfig(100, 3));
    EXPECT_EQ(store.size(), 7u);
    store.append("2 t {}\n");
    EXPECT_EQ(readSegment(store.activePath()), "1 t {}\n2 t {}\n");
}

// =============================================================================
// Rotation
// =============================================================================

TEST_F(SegmentStoreTest, RotatesOnlyAfterReachingTheLimit) {
    SegmentStore store(makeConfig(10, 3));

    store.append("12345\n");
    EXPECT_FALSE(store.rotateIfNeeded());
    store.append("67890\n");
    EXPECT_TRUE(store.needsRotation());
    EXPECT_TRUE(store.rotateIfNeeded());

    EXPECT_EQ(store.size(), 0u);
    EXPECT_EQ(store.rotationCount(), 1u);
    EXPECT_EQ(fileNames(), (std::vector<std::string>{"stats.00.log", "stats.01.log.gz"}));
    EXPECT_EQ(readSegment(dir_ / "stats.01.log.gz"), "12345\n67890\n");
}

TEST_F(SegmentStoreTest, OversizedRecordIsNeverSplit) {
    SegmentStore store(makeConfig(4, 3));
    const std::string big(64, 'x');

    store.append(big);
    EXPECT_EQ(store.size(), big.size());
    EXPECT_EQ(readSegment(store.activePath()), big);
}

TEST_F(SegmentStoreTest, RetainsAtMostNumFilesSegments) {
    SegmentStore store(makeConfig(1, 3));

    for (int i = 0; i < 6; ++i) {
        store.rotateIfNeeded();
        store.append(std::to_string(i) + "\n");
    }

    EXPECT_EQ(fileNames(),
              (std::vector<std::string>{"stats.00.log", "stats.01.log.gz", "stats.02.log.gz"}));
    EXPECT_EQ(readSegment(dir_ / "stats.00.log"), "5\n");
    EXPECT_EQ(readSegment(dir_ / "stats.01.log.gz"), "4\n");
    EXPECT_EQ(readSegment(dir_ / "stats.02.log.gz"), "3\n");
}

TEST_F(SegmentStoreTest, PlainSealingKeepsTextSegments) {
    SegmentStore store(makeConfig(1, 3, false));

    for (int i = 0; i < 3; ++i) {
        store.rotateIfNeeded();
        store.append(std::to_string(i) + "\n");
    }

    EXPECT_EQ(fileNames(),
              (std::vector<std::string>{"stats.00.log", "stats.01.log", "stats.02.log"}));
    EXPECT_EQ(readSegment(dir_ / "stats.02.log"), "0\n");
}

TEST_F(SegmentStoreTest, SingleSegmentDiscardsOnRotation) {
    SegmentStore store(makeConfig(1, 1));

    store.append("old\n");
    EXPECT_TRUE(store.rotateIfNeeded());
    store.append("new\n");

    EXPECT_EQ(fileNames(), (std::vector<std::string>{"stats.00.log"}));
    EXPECT_EQ(readSegment(dir_ / "stats.00.log"), "new\n");
}

TEST_F(SegmentStoreTest, ShrinkingNumFilesDropsOverflowSegments) {
    {
        SegmentStore store(makeConfig(1, 5));
        for (int i = 0; i < 5; ++i) {
            store.rotateIfNeeded();
            store.append(std::to_string(i) + "\n");
        }
    }
    ASSERT_EQ(fileNames().size(), 5u);

    SegmentStore store(makeConfig(1, 2));
    store.rotate();

    EXPECT_EQ(fileNames(), (std::vector<std::string>{"stats.00.log", "stats.01.log.gz"}));
    EXPECT_EQ(readSegment(dir_ / "stats.01.log.gz"), "4\n");
}

TEST_F(SegmentStoreTest, FailedSealKeepsActiveSegmentUsable) {
    SegmentStore store(makeConfig(1, 3));
    store.append("a\n");
    const auto generation = store.generation();

    // A non-empty directory in place of the temporary gzip target.
    const auto blocker = dir_ / "stats.01.log.gz.tmp";
    std::filesystem::create_directories(blocker / "inner");

    EXPECT_THROW(store.rotateIfNeeded(), IOError);
    EXPECT_EQ(store.rotationCount(), 0u);
    EXPECT_GT(store.generation(), generation);
    EXPECT_EQ(readSegment(store.activePath()), "a\n");
    EXPECT_FALSE(std::filesystem::exists(dir_ / "stats.01.log.gz"));

    std::filesystem::remove_all(blocker);
    EXPECT_TRUE(store.rotateIfNeeded());
    store.append("b\n");
    EXPECT_EQ(readSegment(dir_ / "stats.01.log.gz"), "a\n");
    EXPECT_EQ(readSegment(store.activePath()), "b\n");
}

TEST_F(SegmentStoreTest, MixedSuffixesShiftTogether) {
    {
        SegmentStore store(makeConfig(1, 4, false));
        store.append("a\n");
        store.rotate();
    }
    SegmentStore store(makeConfig(1, 4, true));
    store.append("b\n");
    store.rotate();

    EXPECT_EQ(fileNames(),
              (std::vector<std::string>{"stats.00.log", "stats.01.log.gz", "stats.02.log"}));
    EXPECT_EQ(readSegment(dir_ / "stats.02.log"), "a\n");
    EXPECT_EQ(readSegment(dir_ / "stats.01.log.gz"), "b\n");
}

}  // namespace statlog::io::test
