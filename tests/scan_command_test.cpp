#include <gtest/gtest.h>

#include "cli/scan_command.hpp"

namespace fslogger {
namespace cli {
namespace {

common::ScanConfiguration parseAndBuild(const std::vector<std::string>& args,
                                        const common::ScanConfiguration& base) {
    CLI::App app{"fslogger"};
    ScanCommand command;
    command.setup(app.add_subcommand("scan", "Scan"));

    std::vector<std::string> argv = {"fslogger", "scan"};
    argv.insert(argv.end(), args.begin(), args.end());
    std::vector<char*> raw;
    for (auto& arg : argv) {
        raw.push_back(arg.data());
    }
    app.parse(static_cast<int>(raw.size()), raw.data());

    EXPECT_TRUE(command.wasCalled());
    return command.buildConfiguration(base);
}

}

TEST(ScanCommand, KeepsConfiguredValuesWithoutOverrides) {
    common::ScanConfiguration base;
    base.max_file_size_mb = 7;
    base.recursive = false;
    base.blocked_patterns = {"*.bak"};

    auto config = parseAndBuild({"/data"}, base);
    EXPECT_EQ(config.max_file_size_mb, 7);
    EXPECT_FALSE(config.recursive);
    EXPECT_EQ(config.blocked_patterns, (std::vector<std::string>{"*.bak"}));
    EXPECT_EQ(config.worker_count, 4);
}

TEST(ScanCommand, OverridesFromCommandLine) {
    common::ScanConfiguration base;
    base.recursive = false;
    base.blocked_patterns = {"*.bak"};

    auto config = parseAndBuild({"/data", "-r", "-w", "16", "--queue-capacity", "32", "-m", "3",
                                 "-a", ".pdf", "-a", ".txt", "-b", "*.tmp", "-e"}, base);

    EXPECT_TRUE(config.recursive);
    EXPECT_EQ(config.worker_count, 16);
    EXPECT_EQ(config.queue_capacity, 32);
    EXPECT_EQ(config.max_file_size_mb, 3);
    EXPECT_EQ(config.allowed_types, (std::vector<std::string>{".pdf", ".txt"}));
    EXPECT_EQ(config.blocked_patterns, (std::vector<std::string>{"*.bak", "*.tmp"}));
    EXPECT_TRUE(config.export_blocked);
}

TEST(ScanCommand, NoRecursiveOverridesConfig) {
    common::ScanConfiguration base;
    base.recursive = true;

    auto config = parseAndBuild({"/data", "--no-recursive"}, base);
    EXPECT_FALSE(config.recursive);
}

TEST(ScanCommand, ExitCodes) {
    common::ScanResult clean;
    clean.success = true;
    EXPECT_EQ(ScanCommand::exitCodeFor(clean), 0);

    common::ScanResult blocked = clean;
    blocked.progress.blocked_files = 1;
    EXPECT_EQ(ScanCommand::exitCodeFor(blocked), 1);

    common::ScanResult with_errors;
    with_errors.success = false;
    EXPECT_EQ(ScanCommand::exitCodeFor(with_errors), 1);
}

}}
