#pragma once

#include "types.hpp"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace fslogger {
namespace common {

enum class LogLevel {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3
};

enum class LogFormat {
    TEXT,
    JSON
};

struct ScanSection {
    int64_t max_file_size_mb;
    bool recursive;
    std::vector<std::string> allowed_types;
    std::vector<std::string> blocked_patterns;
    int worker_count;
    int queue_capacity;
    int traversal_threads;
    bool export_blocked;
    std::string export_filename;
};

struct LoggingConfig {
    size_t rotation_size_mb;
    size_t max_files;
    LogFormat format;
};

struct GlobalConfig {
    std::string log_file;
    LogLevel log_level;
    ScanSection scan;
    LoggingConfig logging;
};

class Config {
public:
    static Config& instance();

    bool load(const std::string& config_file = "");
    void reset();

    const GlobalConfig& global() const { return global_; }
    GlobalConfig& global() { return global_; }

    ScanConfiguration scanConfiguration() const;

    std::optional<std::string> findBestConfig() const;
    std::vector<std::string> getConfigSearchPaths() const;
    const std::string& getConfigPath() const { return current_config_path_; }
    // Cause of the last failed load, empty after a successful one.
    const std::string& getLastError() const { return last_error_; }

    static GlobalConfig createDefaultConfig();
    static std::optional<LogLevel> parseLogLevel(const std::string& level);

private:
    Config();
    GlobalConfig global_;
    std::string current_config_path_;
    std::string last_error_;

    bool tryLoadTomlFile(const std::string& path);
};

}}
