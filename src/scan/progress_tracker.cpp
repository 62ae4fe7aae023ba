#include "fslogger/scan/progress_tracker.hpp"

namespace fslogger {
namespace scan {

ProgressTracker::ProgressTracker()
    : start_time_(std::chrono::system_clock::now()),
      last_updated_(start_time_) {}

void ProgressTracker::start(std::chrono::system_clock::time_point when) {
    std::lock_guard<std::mutex> lock(mutex_);
    start_time_ = when;
    last_updated_ = when;
}

void ProgressTracker::addDiscoveredFile(int64_t bytes) {
    total_files_.fetch_add(1);
    if (bytes > 0) {
        total_size_.fetch_add(bytes);
    }
}

void ProgressTracker::addProcessedFile(int64_t bytes, bool blocked) {
    scanned_files_.fetch_add(1);
    if (bytes > 0) {
        scanned_size_.fetch_add(bytes);
    }
    if (blocked) {
        blocked_files_.fetch_add(1);
    }
}

void ProgressTracker::addBlockedEntry() {
    blocked_files_.fetch_add(1);
}

void ProgressTracker::recordError(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    errors_.push_back(message);
    last_updated_ = std::chrono::system_clock::now();
}

void ProgressTracker::recordActivity(const std::string& current_directory) {
    std::lock_guard<std::mutex> lock(mutex_);
    last_updated_ = std::chrono::system_clock::now();
    current_directory_ = current_directory;
}

common::ScanProgress ProgressTracker::snapshot() const {
    common::ScanProgress progress;

    progress.total_files = total_files_.load();
    progress.scanned_files = scanned_files_.load();
    progress.total_size = total_size_.load();
    progress.scanned_size = scanned_size_.load();
    progress.blocked_files = blocked_files_.load();

    std::lock_guard<std::mutex> lock(mutex_);
    progress.errors = errors_;
    progress.start_time = start_time_;
    progress.last_updated = last_updated_;
    progress.current_directory = current_directory_;

    return progress;
}

size_t ProgressTracker::errorCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return errors_.size();
}

}}
