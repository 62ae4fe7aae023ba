#pragma once

#include "../common/types.hpp"
#include "scanner.hpp"
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace fslogger {
namespace scan {

enum class JobState {
    RUNNING,
    COMPLETED,
    ERROR,
    NOT_FOUND
};

struct ScanStatus {
    JobState state = JobState::NOT_FOUND;
    std::optional<common::ScanProgress> progress;
    std::optional<common::ScanResult> result;
    std::optional<std::string> error;
};

// Background scans keyed by their root path. Each job owns a Scanner running
// on its own std::async task; status() never blocks on a running scan.
class ScanRegistry {
public:
    ScanRegistry() = default;
    ~ScanRegistry();

    ScanRegistry(const ScanRegistry&) = delete;
    ScanRegistry& operator=(const ScanRegistry&) = delete;

    // Throws ScanError for an empty path. Returns false when a scan of the
    // same path is still running; a finished job is replaced.
    bool start(const std::string& path, const common::ScanConfiguration& config);

    ScanStatus status(const std::string& id);
    ScanStatus wait(const std::string& id);
    bool cancel(const std::string& id);

    std::vector<std::string> ids() const;

private:
    struct Job {
        std::shared_ptr<Scanner> scanner;
        std::shared_future<common::ScanResult> future;
        JobState state = JobState::RUNNING;
        std::optional<common::ScanResult> result;
        std::optional<std::string> error;
    };

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Job>> jobs_;

    static void refresh(Job& job);
    static ScanStatus describe(const Job& job);
};

std::string to_string(JobState state);

}}
