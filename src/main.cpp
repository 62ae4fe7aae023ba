#include <CLI/CLI.hpp>
#include <iostream>
#include <memory>
#include <string>

#include "fslogger/common/config.hpp"
#include "fslogger/common/constants.hpp"
#include "fslogger/common/logger.hpp"
#include "cli/main_command.hpp"
#include "cli/scan_command.hpp"

int main(int argc, char** argv) {
    try {
        CLI::App app{fslogger::constants::system::APPLICATION_NAME, "fslogger"};
        app.set_version_flag("--version,-v", fslogger::constants::version::getFullVersion());
        app.require_subcommand(0, 1);

        std::string config_file;
        std::string log_level;
        app.add_option("-c,--config", config_file, "Configuration file path");
        app.add_option("--log-level", log_level, "Log level (error, warn, info, debug)");

        auto scan_cmd = std::make_unique<fslogger::cli::ScanCommand>();
        scan_cmd->setup(app.add_subcommand("scan", "Scan a directory tree or a single file"));

        CLI11_PARSE(app, argc, argv);

        auto& config = fslogger::common::Config::instance();
        if (!config.load(config_file)) {
            std::cerr << "Error: Failed to load configuration";
            if (!config_file.empty()) {
                std::cerr << ": " << config_file;
            }
            std::cerr << std::endl;
            if (!config.getLastError().empty()) {
                std::cerr << config.getLastError() << std::endl;
            }
            return 2;
        }

        if (!log_level.empty()) {
            auto parsed = fslogger::common::Config::parseLogLevel(log_level);
            if (!parsed) {
                std::cerr << "Error: Unknown log level: " << log_level << std::endl;
                return 2;
            }
            config.global().log_level = *parsed;
        }

        const auto& global = config.global();
        fslogger::common::Logger::instance().initialize(
            global.log_file.empty() ? fslogger::common::LogMode::CONSOLE_ONLY
                                    : fslogger::common::LogMode::FILE_ONLY,
            global.log_file,
            global.log_level,
            global.logging
        );

        if (scan_cmd->wasCalled()) {
            int exit_code = scan_cmd->execute();
            fslogger::common::Logger::instance().shutdown();
            return exit_code;
        }

        scan_cmd->printHelp();
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 2;
    }
}
