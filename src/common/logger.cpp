#include "fslogger/common/logger.hpp"
#include "fslogger/common/constants.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <iostream>
#include <filesystem>
#include <cstdlib>

namespace fslogger {
namespace common {

static bool isRunningInContainer() {
    if (std::getenv(constants::system::CONTAINER_ENV)) {
        return true;
    }

    if (std::filesystem::exists("/.dockerenv")) {
        return true;
    }

    return std::getenv("KUBERNETES_SERVICE_HOST") != nullptr;
}

static std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> makeConsoleSink(spdlog::level::level_enum level) {
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(level);
    return console_sink;
}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(LogMode mode, const std::string& log_file, LogLevel level, const LoggingConfig& logging_config) {
    if (initialized_) {
        if (logger_) {
            logger_->warn("[Logger] Already initialized, ignoring duplicate initialization");
        }
        return;
    }

    if (logger_) {
        spdlog::drop(constants::system::LOGGER_NAME);
        logger_.reset();
    }

    try {
        auto spdlog_level = toSpdlogLevel(level);
        std::vector<spdlog::sink_ptr> sinks;

        LogMode effective_mode = mode;
        if (isRunningInContainer() && mode == LogMode::FILE_ONLY) {
            effective_mode = LogMode::CONSOLE_ONLY;
        }

        if (effective_mode == LogMode::FILE_ONLY) {
            if (log_file.empty()) {
                throw spdlog::spdlog_ex("Log file path required for FILE_ONLY mode");
            }

            std::filesystem::path log_dir = std::filesystem::path(log_file).parent_path();

            std::error_code ec;
            if (!log_dir.empty() && !std::filesystem::exists(log_dir, ec)) {
                std::filesystem::create_directories(log_dir, ec);
            }

            if (ec) {
                std::cerr << "[Logger] Failed to create log directory: " << log_dir
                         << " - " << ec.message() << std::endl;
                std::cerr << "[Logger] Falling back to console output" << std::endl;
                sinks.push_back(makeConsoleSink(spdlog_level));
            } else {
                try {
                    std::string effective_log_file = getLogFileWithSuffix(logging_config.format, log_file);

                    size_t max_size = logging_config.rotation_size_mb * 1024 * 1024;
                    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                        effective_log_file, max_size, logging_config.max_files);
                    file_sink->set_level(spdlog_level);
                    sinks.push_back(file_sink);

                    current_format_ = logging_config.format;
                } catch (const spdlog::spdlog_ex& ex) {
                    std::cerr << "[Logger] Failed to open log file: " << log_file
                             << " - " << ex.what() << std::endl;
                    std::cerr << "[Logger] Falling back to console output" << std::endl;
                    sinks.push_back(makeConsoleSink(spdlog_level));
                }
            }
        } else {
            sinks.push_back(makeConsoleSink(spdlog_level));
            current_format_ = logging_config.format;
        }

        logger_ = std::make_shared<spdlog::logger>(constants::system::LOGGER_NAME, sinks.begin(), sinks.end());

        if (current_format_ == LogFormat::JSON) {
            logger_->set_pattern(R"({"timestamp":"%Y-%m-%dT%H:%M:%S.%e","level":"%l","thread":%t,"message":"%v"})");
        } else {
            logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
        }

        logger_->set_level(spdlog_level);

        if (effective_mode == LogMode::FILE_ONLY) {
            logger_->flush_on(spdlog::level::info);
            spdlog::flush_every(std::chrono::seconds(3));
        }

        spdlog::register_logger(logger_);
        initialized_ = true;

    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "[Logger] Initialization failed: " << ex.what() << std::endl;
        logger_ = std::make_shared<spdlog::logger>(constants::system::LOGGER_NAME, makeConsoleSink(toSpdlogLevel(level)));
        logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
        logger_->set_level(toSpdlogLevel(level));
        spdlog::register_logger(logger_);
        initialized_ = true;
    }
}

void Logger::shutdown() {
    if (logger_) {
        logger_->flush();
        spdlog::drop(constants::system::LOGGER_NAME);
        logger_.reset();
    }
    spdlog::shutdown();
    initialized_ = false;
}

spdlog::level::level_enum Logger::toSpdlogLevel(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return spdlog::level::err;
        case LogLevel::WARN: return spdlog::level::warn;
        case LogLevel::INFO: return spdlog::level::info;
        case LogLevel::DEBUG: return spdlog::level::debug;
        default: return spdlog::level::info;
    }
}

std::string Logger::getLogFileWithSuffix(LogFormat format, const std::string& base_path) const {
    if (format != LogFormat::JSON) {
        return base_path;
    }

    std::filesystem::path p(base_path);
    std::string file_name = p.stem().string() + ".json" + p.extension().string();
    if (p.parent_path().empty()) {
        return file_name;
    }
    return (p.parent_path() / file_name).string();
}

}}
