#include <gtest/gtest.h>
#include "sync/Classifier.hpp"
#include "cache/ChecksumCache.hpp"
#include "util/files.hpp"
#include "fakes.hpp"

#include <filesystem>

namespace fs = std::filesystem;
using namespace ferry;
using namespace ferry::sync;
using namespace ferry::sync::model;
using ferry::test::FakeRemote;
using ferry::test::writeTextFile;

class ClassifierTest : public ::testing::Test {
protected:
    fs::path test_dir;
    SourceFolder source;
    std::shared_ptr<FakeRemote> remote;
    cache::ChecksumCache cache;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "ferry_classifier_test" / "photos";
        fs::remove_all(test_dir.parent_path());
        fs::create_directories(test_dir);
        source = SourceFolder::under(test_dir, "/volume1/backup");
        remote = std::make_shared<FakeRemote>();
    }

    void TearDown() override {
        fs::remove_all(test_dir.parent_path());
    }

    Classifier make(const bool checksum = false, const bool exhaustive = false) {
        return {remote, cache, ClassifierOptions{.checksum = checksum, .exhaustive = exhaustive}};
    }
};

TEST_F(ClassifierTest, RemotePrefixMirrorsRsyncLayout) {
    EXPECT_EQ(source.remote_prefix, "/volume1/backup/photos");
    EXPECT_EQ(source.remotePathFor("2024/a.jpg"), "/volume1/backup/photos/2024/a.jpg");
}

TEST_F(ClassifierTest, EmptyTreeYieldsEmptyBuckets) {
    const auto buckets = make().classify(source);
    EXPECT_TRUE(buckets.empty());
    EXPECT_EQ(remote->existsCalls, 0u);
}

TEST_F(ClassifierTest, AbsentRemoteFilesAreNew) {
    writeTextFile(test_dir / "a.txt", "alpha");
    writeTextFile(test_dir / "sub" / "b.txt", "beta");

    const auto buckets = make().classify(source);
    ASSERT_EQ(buckets.transfer.size(), 2u);
    EXPECT_TRUE(buckets.identical.empty());
    for (const auto& f : buckets.transfer) EXPECT_EQ(f.classification, Classification::New);
    EXPECT_EQ(buckets.transfer[1].remote, "/volume1/backup/photos/sub/b.txt");
}

TEST_F(ClassifierTest, EqualSizeIsIdenticalWithoutChecksum) {
    writeTextFile(test_dir / "a.txt", "alpha");
    remote->put(source.remotePathFor("a.txt"), 5);

    const auto buckets = make().classify(source);
    ASSERT_EQ(buckets.identical.size(), 1u);
    EXPECT_EQ(buckets.identical[0].classification, Classification::Identical);
    EXPECT_FALSE(buckets.identical[0].fingerprint.has_value());
}

TEST_F(ClassifierTest, DifferentSizeIsSizeMismatch) {
    writeTextFile(test_dir / "a.txt", "alpha");
    remote->put(source.remotePathFor("a.txt"), 3);

    const auto buckets = make().classify(source);
    ASSERT_EQ(buckets.transfer.size(), 1u);
    EXPECT_EQ(buckets.transfer[0].classification, Classification::SizeMismatch);
}

TEST_F(ClassifierTest, TenFilesSevenNewThreeIdentical) {
    for (int i = 0; i < 10; ++i) writeTextFile(test_dir / ("f" + std::to_string(i) + ".bin"), "0123456789");
    for (int i = 0; i < 3; ++i) remote->put(source.remotePathFor("f" + std::to_string(i) + ".bin"), 10);

    const auto buckets = make().classify(source);
    EXPECT_EQ(buckets.transfer.size(), 7u);
    EXPECT_EQ(buckets.identical.size(), 3u);
    for (const auto& f : buckets.transfer) EXPECT_EQ(f.classification, Classification::New);
}

TEST_F(ClassifierTest, ChecksumModeFingerprintsAndCachesIdenticalFiles) {
    writeTextFile(test_dir / "a.txt", "alpha");
    remote->put(source.remotePathFor("a.txt"), 5);

    const auto buckets = make(true).classify(source);
    ASSERT_EQ(buckets.identical.size(), 1u);
    ASSERT_TRUE(buckets.identical[0].fingerprint.has_value());
    EXPECT_EQ(buckets.identical[0].fingerprint->size(), 64u);

    const auto local = (test_dir / "a.txt").string();
    EXPECT_EQ(cache.lookup(local, util::mtimeSeconds(local)), buckets.identical[0].fingerprint);
}

TEST_F(ClassifierTest, CachedFingerprintIsReusedWhileMtimeMatches) {
    writeTextFile(test_dir / "a.txt", "alpha");
    const auto local = test_dir / "a.txt";
    const auto mtime = util::mtimeSeconds(local);
    cache.update(local.string(), "cafebabe", mtime);

    const auto c = make(true);
    EXPECT_EQ(c.fingerprint(local, mtime), "cafebabe");
    // A different mtime invalidates the entry and forces a recompute
    EXPECT_NE(c.fingerprint(local, mtime + 1), "cafebabe");
    EXPECT_EQ(cache.lookup(local.string(), mtime + 1)->size(), 64u);
}

TEST_F(ClassifierTest, ExhaustiveChecksumSendsSizeMatchingFiles) {
    writeTextFile(test_dir / "a.txt", "alpha");
    writeTextFile(test_dir / "b.txt", "beta");
    remote->put(source.remotePathFor("a.txt"), 5);

    const auto buckets = make(true, true).classify(source);
    EXPECT_EQ(buckets.transfer.size(), 2u);
    EXPECT_TRUE(buckets.identical.empty());
    EXPECT_EQ(buckets.transfer[0].classification, Classification::Identical);
    EXPECT_EQ(buckets.transfer[1].classification, Classification::New);
}

TEST_F(ClassifierTest, MissingSourceRootThrows) {
    const SourceFolder missing(test_dir / "does-not-exist", "/dst/x");
    EXPECT_THROW((void)make().classify(missing), fs::filesystem_error);
}
