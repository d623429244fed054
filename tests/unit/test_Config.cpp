#include <gtest/gtest.h>
#include "config/Config.hpp"
#include "config/env.hpp"
#include "fakes.hpp"

#include <filesystem>

namespace fs = std::filesystem;
using namespace ferry::config;
using ferry::test::writeTextFile;

class ConfigTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "ferry_config_test";
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }
};

TEST_F(ConfigTest, EnvParseHandlesCommentsQuotesAndExport) {
    const auto vars = env::parse(
        "# comment\n"
        "NAS_HOST=backup@nas.local\n"
        "export DESTINATION=\"/volume1/my backup\"\n"
        "  SOURCE_1 = '/home/me/docs'  \n"
        "not a pair\n"
        "=novalue\n");

    EXPECT_EQ(vars.at("NAS_HOST"), "backup@nas.local");
    EXPECT_EQ(vars.at("DESTINATION"), "/volume1/my backup");
    EXPECT_EQ(vars.at("SOURCE_1"), "/home/me/docs");
    EXPECT_EQ(vars.size(), 3u);
}

TEST_F(ConfigTest, SourcesAreOrderedNumerically) {
    const auto sources = env::orderedSources({
        {"SOURCE_10", "/ten"}, {"SOURCE_2", "/two"}, {"SOURCE_1", "/one"},
        {"SOURCE_X", "/ignored"}, {"SOURCE_3", ""}, {"OTHER", "/nope"}});

    EXPECT_EQ(sources, (std::vector<fs::path>{"/one", "/two", "/ten"}));
}

TEST_F(ConfigTest, EnvOverridesDefaults) {
    const auto cfg = env::toConfig({
        {"NAS_HOST", "nas"}, {"DESTINATION", "/dst"}, {"SOURCE_1", "/a"},
        {"MAX_ATTEMPTS", "5"}, {"RSYNC_EXTRA_OPTS", "--bwlimit=1000  --delete-excluded"},
        {"USE_CHECKSUM", "no"}, {"PARALLEL_JOBS", "4"}, {"CHECKSUM_CACHE", "/var/cache/c.db"}});

    EXPECT_EQ(cfg.sync.max_attempts, 5u);
    EXPECT_EQ(cfg.sync.parallel_jobs, 4u);
    EXPECT_FALSE(cfg.sync.checksum);
    EXPECT_EQ(cfg.transfer.options, (std::vector<std::string>{"--bwlimit=1000", "--delete-excluded"}));
    EXPECT_EQ(cfg.paths.checksum_cache, "/var/cache/c.db");
    EXPECT_EQ(cfg.fullDestination(), "nas:/dst");
}

TEST_F(ConfigTest, EnvRejectsInvalidNumbers) {
    EXPECT_THROW(env::toConfig({{"MAX_ATTEMPTS", "three"}}), ConfigurationError);
    EXPECT_THROW(env::toConfig({{"USE_CHECKSUM", "maybe"}}), ConfigurationError);
}

TEST_F(ConfigTest, DefaultMaxAttemptsIsThree) {
    EXPECT_EQ(env::toConfig({}).sync.max_attempts, 3u);
}

TEST_F(ConfigTest, ValidateRequiresHostDestinationAndSources) {
    Config cfg;
    EXPECT_THROW(cfg.validate(), ConfigurationError);

    cfg.remote.host = "nas";
    EXPECT_THROW(cfg.validate(), ConfigurationError);

    cfg.remote.destination = "/dst";
    EXPECT_THROW(cfg.validate(), ConfigurationError);

    cfg.sources = {"/src"};
    EXPECT_NO_THROW(cfg.validate());
}

TEST_F(ConfigTest, LoadConfigFilePicksDotenvLoader) {
    const auto path = test_dir / ".env";
    writeTextFile(path, "NAS_HOST=nas\nDESTINATION=/dst\nSOURCE_1=/a\nSOURCE_2=/b\n");

    const auto cfg = loadConfigFile(path);
    EXPECT_EQ(cfg.remote.host, "nas");
    EXPECT_EQ(cfg.sources.size(), 2u);
}

TEST_F(ConfigTest, MissingDotenvIsAConfigurationError) {
    EXPECT_THROW(loadConfigFile(test_dir / ".env"), ConfigurationError);
}

TEST_F(ConfigTest, LoadsYaml) {
    const auto path = test_dir / "ferry.yaml";
    writeTextFile(path,
        "remote:\n"
        "  host: backup@nas.local\n"
        "  destination: /volume1/backup\n"
        "  ssh:\n"
        "    connect_timeout: 10\n"
        "    options: [\"Port=2222\"]\n"
        "sources:\n"
        "  - /home/me/docs\n"
        "  - /home/me/photos\n"
        "sync:\n"
        "  per_file: true\n"
        "  max_attempts: 4\n"
        "  retry_base_delay: 5\n"
        "  excludes: [\"*.tmp\"]\n"
        "transfer:\n"
        "  compress: true\n"
        "paths:\n"
        "  checksum_cache: /tmp/c.db\n"
        "logging:\n"
        "  console_log_level: debug\n"
        "  subsystem_levels:\n"
        "    remote: err\n");

    const auto cfg = loadConfigFile(path);
    EXPECT_EQ(cfg.remote.host, "backup@nas.local");
    EXPECT_EQ(cfg.remote.ssh.connect_timeout, 10u);
    EXPECT_EQ(cfg.remote.ssh.server_alive_interval, 60u);
    EXPECT_EQ(cfg.remote.ssh.options, (std::vector<std::string>{"Port=2222"}));
    EXPECT_EQ(cfg.sources.size(), 2u);
    EXPECT_TRUE(cfg.sync.per_file);
    EXPECT_TRUE(cfg.sync.checksum);
    EXPECT_EQ(cfg.sync.max_attempts, 4u);
    EXPECT_EQ(cfg.sync.retry_base_delay, 5u);
    EXPECT_EQ(cfg.sync.excludes, (std::vector<std::string>{"*.tmp"}));
    EXPECT_TRUE(cfg.transfer.compress);
    EXPECT_TRUE(cfg.transfer.partial);
    EXPECT_EQ(cfg.paths.checksum_cache, "/tmp/c.db");
    EXPECT_EQ(cfg.logging.console_log_level, spdlog::level::debug);
    EXPECT_EQ(cfg.logging.subsystem_levels.remote, spdlog::level::err);
    EXPECT_EQ(cfg.logging.subsystem_levels.sync, spdlog::level::info);
}

TEST_F(ConfigTest, MalformedYamlIsAConfigurationError) {
    const auto path = test_dir / "broken.yml";
    writeTextFile(path, "remote: [unclosed\n");
    EXPECT_THROW(loadConfigFile(path), ConfigurationError);
}
