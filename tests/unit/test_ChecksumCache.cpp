#include <gtest/gtest.h>
#include "cache/ChecksumCache.hpp"
#include "fakes.hpp"

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using namespace ferry::cache;

class ChecksumCacheTest : public ::testing::Test {
protected:
    fs::path test_dir;
    fs::path cache_file;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "ferry_checksum_cache_test";
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
        cache_file = test_dir / "checksums.db";
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }
};

TEST_F(ChecksumCacheTest, LoadMissingFileYieldsEmptyMap) {
    ChecksumCache cache;
    EXPECT_EQ(cache.load(test_dir / "nope.db"), 0u);
    EXPECT_EQ(cache.size(), 0u);
}

TEST_F(ChecksumCacheTest, SaveThenLoadReproducesMapping) {
    ChecksumCache cache;
    cache.update("/data/a.txt", "aaaa", 100);
    cache.update("/data/b.txt", "bbbb", 200);
    cache.update("/data/with|pipe.txt", "cccc", 300);
    cache.save(cache_file);

    ChecksumCache reloaded;
    EXPECT_EQ(reloaded.load(cache_file), 3u);
    EXPECT_EQ(reloaded.snapshot(), cache.snapshot());
}

TEST_F(ChecksumCacheTest, LookupRequiresMatchingMtime) {
    ChecksumCache cache;
    cache.update("/data/a.txt", "aaaa", 100);

    ASSERT_TRUE(cache.lookup("/data/a.txt", 100).has_value());
    EXPECT_EQ(*cache.lookup("/data/a.txt", 100), "aaaa");
    EXPECT_FALSE(cache.lookup("/data/a.txt", 101).has_value());
    EXPECT_FALSE(cache.lookup("/data/missing.txt", 100).has_value());
}

TEST_F(ChecksumCacheTest, UpdateOverwritesExistingEntry) {
    ChecksumCache cache;
    cache.update("/data/a.txt", "old", 100);
    cache.update("/data/a.txt", "new", 150);

    EXPECT_EQ(cache.size(), 1u);
    EXPECT_FALSE(cache.lookup("/data/a.txt", 100).has_value());
    EXPECT_EQ(cache.lookup("/data/a.txt", 150).value_or(""), "new");
}

TEST_F(ChecksumCacheTest, MalformedLinesAreSkipped) {
    ferry::test::writeTextFile(cache_file,
        "/ok/one|abcd|10\n"
        "garbage line\n"
        "/bad/mtime|abcd|notanumber\n"
        "/bad/empty||10\n"
        "|abcd|10\n"
        "\n"
        "/ok/two|ef01|20\r\n");

    ChecksumCache cache;
    EXPECT_EQ(cache.load(cache_file), 2u);
    EXPECT_EQ(cache.lookup("/ok/one", 10).value_or(""), "abcd");
    EXPECT_EQ(cache.lookup("/ok/two", 20).value_or(""), "ef01");
}

TEST_F(ChecksumCacheTest, DuplicateKeysLastWriteWins) {
    ferry::test::writeTextFile(cache_file, "/x|first|1\n/x|second|2\n");

    ChecksumCache cache;
    cache.load(cache_file);
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_EQ(cache.lookup("/x", 2).value_or(""), "second");
}

TEST_F(ChecksumCacheTest, SaveReplacesPreviousContentAndLeavesNoTempFiles) {
    ferry::test::writeTextFile(cache_file, "/stale|dead|1\n");

    ChecksumCache cache;
    cache.update("/fresh", "beef", 2);
    cache.save(cache_file);

    const auto map = ChecksumCache::read(cache_file);
    EXPECT_EQ(map.size(), 1u);
    EXPECT_TRUE(map.contains("/fresh"));

    size_t files = 0;
    for (const auto& e : fs::directory_iterator(test_dir)) {
        (void)e;
        ++files;
    }
    EXPECT_EQ(files, 1u);
}

TEST_F(ChecksumCacheTest, SaveCreatesParentDirectories) {
    ChecksumCache cache;
    cache.update("/a", "00", 1);
    const auto nested = test_dir / "deeper" / "still" / "checksums.db";
    cache.save(nested);
    EXPECT_TRUE(fs::exists(nested));
}

TEST_F(ChecksumCacheTest, ParseLineSplitsOnLastTwoSeparators) {
    const auto rec = ChecksumCache::parseLine("/a|b/c.txt|ff00|42");
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->first, "/a|b/c.txt");
    EXPECT_EQ(rec->second.fingerprint, "ff00");
    EXPECT_EQ(rec->second.mtime, 42);
    EXPECT_EQ(ChecksumCache::formatLine(rec->first, rec->second), "/a|b/c.txt|ff00|42");
}
