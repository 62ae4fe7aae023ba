#pragma once

#include "../common/types.hpp"
#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <vector>
#include <cstdint>

namespace fslogger {
namespace scan {

// Shared progress of a running scan.
//
// Counters are lock-free and only ever incremented. The error log, the
// timestamps and the current directory share a single mutex. Readers outside
// the scan only see deep copies produced by snapshot().
class ProgressTracker {
public:
    ProgressTracker();

    void start(std::chrono::system_clock::time_point when = std::chrono::system_clock::now());

    void addDiscoveredFile(int64_t bytes = 0);
    void addProcessedFile(int64_t bytes, bool blocked);
    // Blocked entries that never reach a worker (unreadable directories)
    void addBlockedEntry();

    void recordError(const std::string& message);
    void recordActivity(const std::string& current_directory);

    common::ScanProgress snapshot() const;

    int64_t totalFiles() const { return total_files_.load(); }
    size_t errorCount() const;

private:
    std::atomic<int64_t> total_files_{0};
    std::atomic<int64_t> scanned_files_{0};
    std::atomic<int64_t> total_size_{0};
    std::atomic<int64_t> scanned_size_{0};
    std::atomic<int64_t> blocked_files_{0};

    mutable std::mutex mutex_;
    std::vector<std::string> errors_;
    std::chrono::system_clock::time_point start_time_;
    std::chrono::system_clock::time_point last_updated_;
    std::string current_directory_;
};

}}
