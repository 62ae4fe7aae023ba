#pragma once

#include "../common/types.hpp"
#include "classifier.hpp"
#include "progress_tracker.hpp"
#include <tbb/concurrent_queue.h>
#include <tbb/task_group.h>
#include <atomic>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace fslogger {
namespace scan {

// One message on the result queue. A record may carry an error at the same
// time (unreadable entries are still reported). end_of_stream closes the queue.
struct ScanOutcome {
    std::optional<common::FileRecord> record;
    std::optional<std::string> error;
    bool end_of_stream = false;
};

// Runs a single scan of a directory tree.
//
// Directory traversal runs as one TBB task per directory inside a dedicated
// arena; the arena caps the threads, not the number of tasks. Files found
// during traversal go through a bounded work queue to a fixed pool of worker
// threads, which classify them and push outcomes through a bounded result
// queue to a single collector thread. Both queues block producers when full.
//
// progress() and cancel() may be called from any thread while scan() runs.
// A Scanner instance runs one scan only.
class Scanner {
public:
    explicit Scanner(common::ScanConfiguration config);
    ~Scanner();

    Scanner(const Scanner&) = delete;
    Scanner& operator=(const Scanner&) = delete;

    // Throws ScanError when the root is empty, missing or not accessible.
    common::ScanResult scan(const std::filesystem::path& root);

    common::ScanProgress progress() const;
    common::ScanState state() const { return state_.load(); }

    void cancel();

    const common::ScanConfiguration& config() const { return config_; }

    // Invoked on the collector thread for every record, in arrival order.
    void setResultCallback(std::function<void(const common::FileRecord&)> callback);

private:
    common::ScanConfiguration config_;
    Classifier classifier_;
    ProgressTracker progress_;

    std::atomic<common::ScanState> state_{common::ScanState::IDLE};
    std::atomic<bool> started_{false};
    std::atomic<bool> cancelled_{false};

    tbb::concurrent_bounded_queue<common::WorkItem> work_queue_;
    tbb::concurrent_bounded_queue<ScanOutcome> result_queue_;

    std::filesystem::path root_;
    std::function<void(const common::FileRecord&)> result_callback_;

    std::filesystem::path validateRoot(const std::filesystem::path& root);

    void runTraversal();
    void traverseDirectory(const std::filesystem::path& directory, tbb::task_group& group);
    void handleEntry(const std::filesystem::directory_entry& entry, bool is_root, tbb::task_group& group);
    void enqueueFile(const std::filesystem::path& path, int64_t size);
    void emitDirectory(common::FileRecord record, std::optional<std::string> error);
    common::FileRecord makeDirectoryRecord(const std::filesystem::path& path) const;

    void runWorker(int worker_id);
    ScanOutcome processWork(const common::WorkItem& item);

    void collectResults(std::vector<common::FileRecord>& files);

    void exportBlockedFiles(common::ScanResult& result);
    std::filesystem::path exportPath() const;
    bool isExportFile(const std::filesystem::path& path) const;
};

}}
