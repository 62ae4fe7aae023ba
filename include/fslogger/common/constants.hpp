#pragma once

#include <string>
#include <cstddef>
#include <cstdint>

namespace fslogger {
namespace constants {

namespace version {
    constexpr const char* CLI_VERSION = "1.0.0";

    inline std::string getFullVersion() {
        return std::string("fslogger v") + CLI_VERSION;
    }
}

namespace system {
    constexpr const char* APPLICATION_NAME = "fslogger";
    constexpr const char* LOGGER_NAME = "fslogger";
    constexpr const char* CONFIG_ENV = "FSLOGGER_CONFIG";
    constexpr const char* CONTAINER_ENV = "FSLOGGER_CONTAINER";
    constexpr const char* CONFIG_FILE_NAME = "fslogger.toml";
    constexpr const char* SYSTEM_CONFIG_FILE = "/etc/fslogger/fslogger.toml";
}

namespace limits {
    constexpr int DEFAULT_MAX_FILE_SIZE_MB = 50;
    constexpr int DEFAULT_WORKER_COUNT = 4;
    constexpr int DEFAULT_QUEUE_CAPACITY = 1000;
    constexpr int DEFAULT_TRAVERSAL_THREADS = 0;

    constexpr size_t SNIFF_LENGTH = 512;
    constexpr uint64_t BYTES_PER_MB = 1024ull * 1024ull;

    constexpr size_t DEFAULT_LOG_ROTATION_SIZE_MB = 10;
    constexpr size_t DEFAULT_LOG_MAX_FILES = 3;
}

namespace config_defaults {
    constexpr int MAX_FILE_SIZE_MB = limits::DEFAULT_MAX_FILE_SIZE_MB;
    constexpr bool RECURSIVE = true;
    constexpr int WORKER_COUNT = limits::DEFAULT_WORKER_COUNT;
    constexpr int QUEUE_CAPACITY = limits::DEFAULT_QUEUE_CAPACITY;
    constexpr int TRAVERSAL_THREADS = limits::DEFAULT_TRAVERSAL_THREADS;
    constexpr bool EXPORT_BLOCKED = false;
    constexpr const char* EXPORT_FILENAME = "blocked_files.json";

    constexpr size_t LOG_ROTATION_SIZE_MB = limits::DEFAULT_LOG_ROTATION_SIZE_MB;
    constexpr size_t LOG_MAX_FILES = limits::DEFAULT_LOG_MAX_FILES;
}

namespace block_reasons {
    constexpr const char* SIZE_EXCEEDED = "File size exceeds limit";
    constexpr const char* TYPE_NOT_ALLOWED = "File type not allowed";
    constexpr const char* PATTERN_PREFIX = "File matches blocked pattern: ";
    constexpr const char* FILE_NOT_ACCESSIBLE = "File not accessible";
    constexpr const char* DIRECTORY_NOT_READABLE = "Directory not readable";
    constexpr const char* UNKNOWN = "Unknown reason";
}

}
}
