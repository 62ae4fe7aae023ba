#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <cstdint>

namespace fslogger {
namespace common {

enum class ScanState {
    IDLE,
    VALIDATING,
    RUNNING,
    DRAINING,
    COMPLETED,
    FAILED
};

struct ScanConfiguration {
    int64_t max_file_size_mb = 50;
    bool recursive = true;
    std::vector<std::string> allowed_types;
    std::vector<std::string> blocked_patterns;
    int worker_count = 4;
    int queue_capacity = 1000;
    int traversal_threads = 0;
    bool export_blocked = false;
    std::string export_filename = "blocked_files.json";

    uint64_t maxFileSizeBytes() const;
    ScanConfiguration resolved() const;
};

struct FileRecord {
    std::string path;
    std::string name;
    int64_t size = 0;
    std::string mime_type;
    std::string file_type;
    std::string extension;
    std::chrono::system_clock::time_point mod_time{};
    bool is_directory = false;
    bool is_blocked = false;
    std::optional<std::string> block_reason;
    std::optional<std::string> access_error;
};

struct WorkItem {
    std::string path;
    bool is_directory = false;
};

struct ScanProgress {
    int64_t total_files = 0;
    int64_t scanned_files = 0;
    int64_t total_size = 0;
    int64_t scanned_size = 0;
    int64_t blocked_files = 0;
    std::vector<std::string> errors;
    std::chrono::system_clock::time_point start_time{};
    std::chrono::system_clock::time_point last_updated{};
    std::string current_directory;
};

struct ScanResult {
    std::vector<FileRecord> files;
    ScanProgress progress;
    std::chrono::milliseconds duration{0};
    bool success = false;
    bool cancelled = false;
    std::optional<std::string> error;
};

std::string to_string(ScanState state);

}}
