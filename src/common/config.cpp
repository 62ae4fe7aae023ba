#include "fslogger/common/config.hpp"
#include "fslogger/common/constants.hpp"
#include "fslogger/common/logger.hpp"
#include <toml.hpp>
#include <filesystem>
#include <cstdlib>
#include <unistd.h>

namespace fslogger {
namespace common {

Config& Config::instance() {
    static Config instance;
    return instance;
}

Config::Config() {
    global_ = createDefaultConfig();
}

GlobalConfig Config::createDefaultConfig() {
    using namespace constants::config_defaults;

    GlobalConfig config;

    config.log_level = LogLevel::INFO;
    config.log_file = "";

    config.scan.max_file_size_mb = MAX_FILE_SIZE_MB;
    config.scan.recursive = RECURSIVE;
    config.scan.allowed_types.clear();
    config.scan.blocked_patterns.clear();
    config.scan.worker_count = WORKER_COUNT;
    config.scan.queue_capacity = QUEUE_CAPACITY;
    config.scan.traversal_threads = TRAVERSAL_THREADS;
    config.scan.export_blocked = EXPORT_BLOCKED;
    config.scan.export_filename = EXPORT_FILENAME;

    config.logging.rotation_size_mb = LOG_ROTATION_SIZE_MB;
    config.logging.max_files = LOG_MAX_FILES;
    config.logging.format = LogFormat::TEXT;

    return config;
}

std::optional<LogLevel> Config::parseLogLevel(const std::string& level) {
    if (level == "DEBUG" || level == "debug") return LogLevel::DEBUG;
    if (level == "INFO" || level == "info") return LogLevel::INFO;
    if (level == "WARN" || level == "warn") return LogLevel::WARN;
    if (level == "ERROR" || level == "error") return LogLevel::ERROR;
    return std::nullopt;
}

void Config::reset() {
    global_ = createDefaultConfig();
    current_config_path_.clear();
    last_error_.clear();
}

std::vector<std::string> Config::getConfigSearchPaths() const {
    std::vector<std::string> paths;

    if (const char* env_path = std::getenv(constants::system::CONFIG_ENV)) {
        if (*env_path) {
            paths.emplace_back(env_path);
        }
    }

    paths.emplace_back(constants::system::CONFIG_FILE_NAME);

    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        paths.push_back((std::filesystem::path(xdg) / "fslogger" / constants::system::CONFIG_FILE_NAME).string());
    } else if (const char* home = std::getenv("HOME"); home && *home) {
        paths.push_back((std::filesystem::path(home) / ".config" / "fslogger" / constants::system::CONFIG_FILE_NAME).string());
    }

    paths.emplace_back(constants::system::SYSTEM_CONFIG_FILE);
    return paths;
}

std::optional<std::string> Config::findBestConfig() const {
    for (const auto& path : getConfigSearchPaths()) {
        std::error_code ec;
        if (std::filesystem::is_regular_file(path, ec) && access(path.c_str(), R_OK) == 0) {
            return path;
        }
    }

    return std::nullopt;
}

bool Config::load(const std::string& config_file) {
    global_ = createDefaultConfig();
    current_config_path_.clear();
    last_error_.clear();

    std::string effective_config_file = config_file;
    if (effective_config_file.empty()) {
        auto best = findBestConfig();
        if (!best) {
            Logger::instance().debug("[Config] No config file found, using defaults");
            return true;
        }
        effective_config_file = *best;
    }

    if (!tryLoadTomlFile(effective_config_file)) {
        global_ = createDefaultConfig();
        return false;
    }

    current_config_path_ = effective_config_file;
    return true;
}

bool Config::tryLoadTomlFile(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        Logger::instance().warn("[Config] Not found | path={}", path);
        last_error_ = "file not found: " + path;
        return false;
    }

    if (access(path.c_str(), R_OK) != 0) {
        Logger::instance().warn("[Config] Not readable | path={}", path);
        last_error_ = "file not readable: " + path;
        return false;
    }

    try {
        auto data = toml::parse(path);

        if (data.contains("global")) {
            auto global_section = data.at("global");

            if (global_section.contains("log_file")) {
                global_.log_file = toml::find<std::string>(global_section, "log_file");
            }
            if (global_section.contains("log_level")) {
                std::string level = toml::find<std::string>(global_section, "log_level");
                if (auto parsed = parseLogLevel(level)) {
                    global_.log_level = *parsed;
                } else {
                    Logger::instance().warn("[Config] Unknown log level | value={}", level);
                }
            }
        }

        if (data.contains("scan")) {
            auto scan_section = data.at("scan");

            if (scan_section.contains("max_file_size_mb")) {
                global_.scan.max_file_size_mb = toml::find<int64_t>(scan_section, "max_file_size_mb");
            }
            if (scan_section.contains("recursive")) {
                global_.scan.recursive = toml::find<bool>(scan_section, "recursive");
            }
            if (scan_section.contains("allowed_types")) {
                global_.scan.allowed_types = toml::find<std::vector<std::string>>(scan_section, "allowed_types");
            }
            if (scan_section.contains("blocked_patterns")) {
                global_.scan.blocked_patterns = toml::find<std::vector<std::string>>(scan_section, "blocked_patterns");
            }
            if (scan_section.contains("worker_count")) {
                global_.scan.worker_count = toml::find<int>(scan_section, "worker_count");
            }
            if (scan_section.contains("queue_capacity")) {
                global_.scan.queue_capacity = toml::find<int>(scan_section, "queue_capacity");
            }
            if (scan_section.contains("traversal_threads")) {
                global_.scan.traversal_threads = toml::find<int>(scan_section, "traversal_threads");
            }
            if (scan_section.contains("export_blocked")) {
                global_.scan.export_blocked = toml::find<bool>(scan_section, "export_blocked");
            }
            if (scan_section.contains("export_filename")) {
                global_.scan.export_filename = toml::find<std::string>(scan_section, "export_filename");
            }
        }

        if (data.contains("logging")) {
            auto logging_section = data.at("logging");

            if (logging_section.contains("rotation_size_mb")) {
                global_.logging.rotation_size_mb = toml::find<size_t>(logging_section, "rotation_size_mb");
            }
            if (logging_section.contains("max_files")) {
                global_.logging.max_files = toml::find<size_t>(logging_section, "max_files");
            }
            if (logging_section.contains("format")) {
                std::string format_str = toml::find<std::string>(logging_section, "format");
                global_.logging.format = (format_str == "json") ? LogFormat::JSON : LogFormat::TEXT;
            }
        }

        Logger::instance().info("[Config] Loaded | path={}", path);
        return true;
    } catch (const std::exception& e) {
        Logger::instance().error("[Config] Parse failed | path={} | error={}", path, e.what());
        last_error_ = e.what();
        return false;
    }
}

ScanConfiguration Config::scanConfiguration() const {
    ScanConfiguration config;
    config.max_file_size_mb = global_.scan.max_file_size_mb;
    config.recursive = global_.scan.recursive;
    config.allowed_types = global_.scan.allowed_types;
    config.blocked_patterns = global_.scan.blocked_patterns;
    config.worker_count = global_.scan.worker_count;
    config.queue_capacity = global_.scan.queue_capacity;
    config.traversal_threads = global_.scan.traversal_threads;
    config.export_blocked = global_.scan.export_blocked;
    config.export_filename = global_.scan.export_filename;
    return config.resolved();
}

}}
