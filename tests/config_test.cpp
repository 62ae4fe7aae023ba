#include <gtest/gtest.h>

#include "fslogger/common/config.hpp"
#include "test_utils.hpp"

#include <cstdlib>

namespace fslogger {
namespace common {

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        unsetenv("FSLOGGER_CONFIG");
        Config::instance().reset();
    }

    void TearDown() override {
        unsetenv("FSLOGGER_CONFIG");
        Config::instance().reset();
    }

    tests::TempDir dir_;
};

TEST_F(ConfigTest, DefaultsMatchDocumentedValues) {
    auto defaults = Config::createDefaultConfig();

    EXPECT_EQ(defaults.log_level, LogLevel::INFO);
    EXPECT_EQ(defaults.scan.max_file_size_mb, 50);
    EXPECT_TRUE(defaults.scan.recursive);
    EXPECT_TRUE(defaults.scan.allowed_types.empty());
    EXPECT_TRUE(defaults.scan.blocked_patterns.empty());
    EXPECT_EQ(defaults.scan.worker_count, 4);
    EXPECT_EQ(defaults.scan.queue_capacity, 1000);
    EXPECT_EQ(defaults.scan.traversal_threads, 0);
    EXPECT_FALSE(defaults.scan.export_blocked);
    EXPECT_EQ(defaults.scan.export_filename, "blocked_files.json");
    EXPECT_EQ(defaults.logging.format, LogFormat::TEXT);
}

TEST_F(ConfigTest, LoadsAllSections) {
    auto path = dir_ / "fslogger.toml";
    tests::writeFile(path, R"(
[global]
log_level = "debug"
log_file = "/var/log/fslogger/fslogger.log"

[logging]
format = "json"
rotation_size_mb = 20
max_files = 7

[scan]
max_file_size_mb = 5
recursive = false
allowed_types = [".pdf", ".txt"]
blocked_patterns = ["*.tmp", "~*"]
worker_count = 8
queue_capacity = 64
traversal_threads = 2
export_blocked = true
export_filename = "report.json"
)");

    auto& config = Config::instance();
    ASSERT_TRUE(config.load(path.string()));
    EXPECT_EQ(config.getConfigPath(), path.string());

    const auto& global = config.global();
    EXPECT_EQ(global.log_level, LogLevel::DEBUG);
    EXPECT_EQ(global.log_file, "/var/log/fslogger/fslogger.log");
    EXPECT_EQ(global.logging.format, LogFormat::JSON);
    EXPECT_EQ(global.logging.rotation_size_mb, 20u);
    EXPECT_EQ(global.logging.max_files, 7u);

    auto scan = config.scanConfiguration();
    EXPECT_EQ(scan.max_file_size_mb, 5);
    EXPECT_FALSE(scan.recursive);
    EXPECT_EQ(scan.allowed_types, (std::vector<std::string>{".pdf", ".txt"}));
    EXPECT_EQ(scan.blocked_patterns, (std::vector<std::string>{"*.tmp", "~*"}));
    EXPECT_EQ(scan.worker_count, 8);
    EXPECT_EQ(scan.queue_capacity, 64);
    EXPECT_EQ(scan.traversal_threads, 2);
    EXPECT_TRUE(scan.export_blocked);
    EXPECT_EQ(scan.export_filename, "report.json");
    EXPECT_EQ(scan.maxFileSizeBytes(), 5u * 1024u * 1024u);
}

TEST_F(ConfigTest, PartialFileKeepsDefaults) {
    auto path = dir_ / "partial.toml";
    tests::writeFile(path, "[scan]\nworker_count = 2\n");

    auto& config = Config::instance();
    ASSERT_TRUE(config.load(path.string()));

    auto scan = config.scanConfiguration();
    EXPECT_EQ(scan.worker_count, 2);
    EXPECT_EQ(scan.queue_capacity, 1000);
    EXPECT_EQ(scan.max_file_size_mb, 50);
    EXPECT_TRUE(scan.recursive);
}

TEST_F(ConfigTest, InvalidSizingResolvesToDefaults) {
    auto path = dir_ / "invalid.toml";
    tests::writeFile(path, "[scan]\nworker_count = 0\nqueue_capacity = -1\ntraversal_threads = -3\n");

    auto& config = Config::instance();
    ASSERT_TRUE(config.load(path.string()));

    auto scan = config.scanConfiguration();
    EXPECT_EQ(scan.worker_count, 4);
    EXPECT_EQ(scan.queue_capacity, 1000);
    EXPECT_EQ(scan.traversal_threads, 0);
}

TEST_F(ConfigTest, MissingExplicitFileFails) {
    auto& config = Config::instance();
    EXPECT_FALSE(config.load((dir_ / "absent.toml").string()));
    EXPECT_TRUE(config.getConfigPath().empty());
    EXPECT_EQ(config.scanConfiguration().worker_count, 4);
}

TEST_F(ConfigTest, MalformedFileFailsAndRestoresDefaults) {
    auto path = dir_ / "broken.toml";
    tests::writeFile(path, "[scan\nworker_count = = 3\n");

    auto& config = Config::instance();
    EXPECT_FALSE(config.load(path.string()));
    EXPECT_FALSE(config.getLastError().empty());
    EXPECT_EQ(config.scanConfiguration().worker_count, 4);

    tests::writeFile(path, "[scan]\nworker_count = 3\n");
    ASSERT_TRUE(config.load(path.string()));
    EXPECT_TRUE(config.getLastError().empty());
}

TEST_F(ConfigTest, MissingFileReportsCause) {
    auto path = dir_ / "absent.toml";
    auto& config = Config::instance();
    EXPECT_FALSE(config.load(path.string()));
    EXPECT_NE(config.getLastError().find(path.string()), std::string::npos);
}

TEST_F(ConfigTest, LargeSizeLimitIsKeptWithoutTruncation) {
    auto path = dir_ / "large.toml";
    tests::writeFile(path, "[scan]\nmax_file_size_mb = 40000000000000\n");

    auto& config = Config::instance();
    ASSERT_TRUE(config.load(path.string()));
    EXPECT_EQ(config.scanConfiguration().max_file_size_mb, 40000000000000LL);
}

TEST_F(ConfigTest, EnvironmentVariableIsSearchedFirst) {
    auto path = dir_ / "from_env.toml";
    tests::writeFile(path, "[scan]\nqueue_capacity = 12\n");
    setenv("FSLOGGER_CONFIG", path.c_str(), 1);

    auto paths = Config::instance().getConfigSearchPaths();
    ASSERT_FALSE(paths.empty());
    EXPECT_EQ(paths.front(), path.string());

    auto& config = Config::instance();
    ASSERT_TRUE(config.load());
    EXPECT_EQ(config.getConfigPath(), path.string());
    EXPECT_EQ(config.scanConfiguration().queue_capacity, 12);
}

TEST_F(ConfigTest, ParseLogLevel) {
    EXPECT_EQ(Config::parseLogLevel("debug"), LogLevel::DEBUG);
    EXPECT_EQ(Config::parseLogLevel("WARN"), LogLevel::WARN);
    EXPECT_EQ(Config::parseLogLevel("error"), LogLevel::ERROR);
    EXPECT_FALSE(Config::parseLogLevel("verbose").has_value());
}

}}
