#include "fslogger/scan/scanner.hpp"
#include "fslogger/scan/content_sniffer.hpp"
#include "fslogger/scan/error_codes.hpp"
#include "fslogger/report/exporter.hpp"
#include "fslogger/common/constants.hpp"
#include "fslogger/common/logger.hpp"
#include <tbb/task_arena.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <sys/stat.h>
#include <system_error>
#include <thread>

namespace fslogger {
namespace scan {

namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

// "<message> <path>: <cause>"
std::string entryError(ScanErrorCode code, const std::string& path, const std::string& cause) {
    return fmt::format("{} {}: {}", ScanErrorCodeHelper::getMessage(code), path, cause);
}

std::chrono::system_clock::time_point toTimePoint(const struct timespec& ts) {
    auto since_epoch = std::chrono::seconds(ts.tv_sec) + std::chrono::nanoseconds(ts.tv_nsec);
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(since_epoch));
}

std::string displayName(const std::filesystem::path& path) {
    auto name = path.filename().string();
    return name.empty() ? path.string() : name;
}

}

Scanner::Scanner(common::ScanConfiguration config)
    : config_(config.resolved()),
      classifier_(config_) {
    work_queue_.set_capacity(config_.queue_capacity);
    result_queue_.set_capacity(config_.queue_capacity);
}

Scanner::~Scanner() = default;

void Scanner::setResultCallback(std::function<void(const common::FileRecord&)> callback) {
    result_callback_ = std::move(callback);
}

common::ScanProgress Scanner::progress() const {
    return progress_.snapshot();
}

void Scanner::cancel() {
    if (!cancelled_.exchange(true)) {
        common::Logger::instance().info("[Scanner] Cancellation requested | state={}",
                                       common::to_string(state_.load()));
    }
}

std::filesystem::path Scanner::validateRoot(const std::filesystem::path& root) {
    common::ErrorContext context{"Scanner", {{"path", root.string()}}, std::chrono::system_clock::now()};

    if (root.empty()) {
        state_ = common::ScanState::FAILED;
        common::Logger::instance().error("[Scanner] Scan failed | code={}",
                                        ScanErrorCodeHelper::toString(ScanErrorCode::EMPTY_PATH));
        throw ScanError(ScanErrorCode::EMPTY_PATH, "", context);
    }

    std::error_code ec;
    auto status = std::filesystem::status(root, ec);
    if (status.type() == std::filesystem::file_type::not_found) {
        state_ = common::ScanState::FAILED;
        common::Logger::instance().error("[Scanner] Scan failed | code={} | path={}",
                                        ScanErrorCodeHelper::toString(ScanErrorCode::ROOT_NOT_FOUND),
                                        root.string());
        throw ScanError(ScanErrorCode::ROOT_NOT_FOUND, root.string(), context);
    }
    if (ec) {
        state_ = common::ScanState::FAILED;
        common::Logger::instance().error("[Scanner] Scan failed | code={} | path={} | error={}",
                                        ScanErrorCodeHelper::toString(ScanErrorCode::ROOT_NOT_ACCESSIBLE),
                                        root.string(), ec.message());
        throw ScanError(ScanErrorCode::ROOT_NOT_ACCESSIBLE, root.string() + ": " + ec.message(), context);
    }

    auto absolute = std::filesystem::absolute(root, ec);
    if (ec) {
        absolute = root;
    }
    absolute = absolute.lexically_normal();
    if (!absolute.has_filename() && absolute.has_relative_path()) {
        absolute = absolute.parent_path();
    }
    return absolute;
}

common::ScanResult Scanner::scan(const std::filesystem::path& root) {
    if (started_.exchange(true)) {
        throw ScanError(ScanErrorCode::SCANNER_ALREADY_USED, root.string(),
                        common::ErrorContext{"Scanner", {{"path", root.string()}}, std::nullopt});
    }

    state_ = common::ScanState::VALIDATING;
    root_ = validateRoot(root);

    auto started_at = std::chrono::steady_clock::now();
    progress_.start();
    state_ = common::ScanState::RUNNING;

    common::Logger::instance().info(
        "[Scanner] Starting | path={} | recursive={} | workers={} | queue_capacity={} | traversal_threads={}",
        root_.string(), config_.recursive, config_.worker_count, config_.queue_capacity,
        config_.traversal_threads);

    std::vector<common::FileRecord> files;
    std::thread collector([this, &files] { collectResults(files); });

    std::vector<std::thread> workers;
    workers.reserve(static_cast<size_t>(config_.worker_count));
    for (int i = 0; i < config_.worker_count; ++i) {
        workers.emplace_back([this, i] { runWorker(i); });
    }

    runTraversal();

    state_ = common::ScanState::DRAINING;
    common::Logger::instance().debug("[Scanner] Traversal finished | discovered={}", progress_.totalFiles());

    // one end-of-stream marker per worker; the empty path never comes from traversal
    for (int i = 0; i < config_.worker_count; ++i) {
        work_queue_.push(common::WorkItem{});
    }
    for (auto& worker : workers) {
        worker.join();
    }

    ScanOutcome end_of_stream;
    end_of_stream.end_of_stream = true;
    result_queue_.push(std::move(end_of_stream));
    collector.join();

    common::ScanResult result;
    result.files = std::move(files);
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started_at);

    if (cancelled_.load()) {
        result.cancelled = true;
        progress_.recordError(ScanErrorCodeHelper::getMessage(ScanErrorCode::SCAN_CANCELLED));
    }

    result.progress = progress_.snapshot();
    result.success = result.progress.errors.empty();
    state_ = common::ScanState::COMPLETED;

    if (config_.export_blocked) {
        exportBlockedFiles(result);
    }

    common::Logger::instance().info(
        "[Scanner] Complete | files={} | processed={} | blocked={} | errors={} | cancelled={} | duration_ms={}",
        result.progress.total_files, result.progress.scanned_files, result.progress.blocked_files,
        result.progress.errors.size(), result.cancelled, common::formatDuration(result.duration));

    return result;
}

void Scanner::runTraversal() {
    int concurrency = config_.traversal_threads > 0
        ? config_.traversal_threads
        : static_cast<int>(tbb::task_arena::automatic);
    tbb::task_arena arena(concurrency);
    tbb::task_group group;

    arena.execute([&] {
        group.run([this, &group] {
            std::error_code ec;
            if (std::filesystem::is_directory(root_, ec)) {
                traverseDirectory(root_, group);
                return;
            }

            // a regular file root is scanned as a single item
            auto size = std::filesystem::file_size(root_, ec);
            enqueueFile(root_, ec ? 0 : static_cast<int64_t>(size));
        });
    });
    arena.execute([&] { group.wait(); });
}

common::FileRecord Scanner::makeDirectoryRecord(const std::filesystem::path& path) const {
    common::FileRecord record;
    record.path = path.string();
    record.name = displayName(path);
    record.is_directory = true;

    struct stat st;
    if (::stat(record.path.c_str(), &st) == 0) {
        record.mod_time = toTimePoint(st.st_mtim);
    }
    return record;
}

void Scanner::emitDirectory(common::FileRecord record, std::optional<std::string> error) {
    progress_.addDiscoveredFile(0);
    if (record.is_blocked) {
        progress_.addBlockedEntry();
    }

    ScanOutcome outcome;
    outcome.record = std::move(record);
    outcome.error = std::move(error);
    result_queue_.push(std::move(outcome));
}

void Scanner::traverseDirectory(const std::filesystem::path& directory, tbb::task_group& group) {
    if (cancelled_.load()) {
        return;
    }

    const bool is_root = directory == root_;

    try {
        std::error_code ec;
        std::filesystem::directory_iterator it(directory, ec);

        auto record = makeDirectoryRecord(directory);
        if (ec) {
            common::Logger::instance().warn("[Scanner] Directory not readable | path={} | error={}",
                                           directory.string(), ec.message());
            record.access_error = ec.message();
            classifier_.apply(record);
            emitDirectory(std::move(record),
                          entryError(ScanErrorCode::DIRECTORY_READ_FAILED, directory.string(), ec.message()));
            return;
        }
        emitDirectory(std::move(record), std::nullopt);

        for (const std::filesystem::directory_iterator end; !ec && it != end; it.increment(ec)) {
            if (cancelled_.load()) {
                return;
            }
            handleEntry(*it, is_root, group);
        }

        if (ec) {
            common::Logger::instance().warn("[Scanner] Directory listing interrupted | path={} | error={}",
                                           directory.string(), ec.message());
            ScanOutcome outcome;
            outcome.error = entryError(ScanErrorCode::DIRECTORY_READ_FAILED, directory.string(), ec.message());
            result_queue_.push(std::move(outcome));
        }
    } catch (const std::exception& e) {
        common::Logger::instance().error("[Scanner] Traversal failed | path={} | error={}",
                                        directory.string(), e.what());
        ScanOutcome outcome;
        outcome.error = entryError(ScanErrorCode::DIRECTORY_READ_FAILED, directory.string(), e.what());
        result_queue_.push(std::move(outcome));
    }
}

void Scanner::handleEntry(const std::filesystem::directory_entry& entry, bool is_root,
                          tbb::task_group& group) {
    std::error_code ec;
    auto status = entry.symlink_status(ec);
    if (ec) {
        ScanOutcome outcome;
        outcome.error = entryError(ScanErrorCode::FILE_STAT_FAILED, entry.path().string(), ec.message());
        result_queue_.push(std::move(outcome));
        return;
    }

    if (std::filesystem::is_directory(status)) {
        if (config_.recursive) {
            group.run([this, path = entry.path(), &group] { traverseDirectory(path, group); });
        } else if (is_root) {
            emitDirectory(makeDirectoryRecord(entry.path()), std::nullopt);
        }
        return;
    }

    if (!std::filesystem::is_regular_file(status) && !std::filesystem::is_symlink(status)) {
        common::Logger::instance().debug("[Scanner] Skipping special file | path={}", entry.path().string());
        return;
    }

    if (isExportFile(entry.path())) {
        common::Logger::instance().debug("[Scanner] Skipping export file | path={}", entry.path().string());
        return;
    }

    auto size = entry.file_size(ec);
    enqueueFile(entry.path(), ec ? 0 : static_cast<int64_t>(size));
}

void Scanner::enqueueFile(const std::filesystem::path& path, int64_t size) {
    progress_.addDiscoveredFile(size);
    work_queue_.push(common::WorkItem{path.string(), false});
}

bool Scanner::isExportFile(const std::filesystem::path& path) const {
    return config_.export_blocked && path.filename() == config_.export_filename;
}

void Scanner::runWorker(int worker_id) {
    size_t processed = 0;
    size_t discarded = 0;

    while (true) {
        common::WorkItem item;
        work_queue_.pop(item);
        if (item.path.empty()) {
            break;
        }

        // keep draining so traversal never blocks on a full queue after cancel
        if (cancelled_.load()) {
            ++discarded;
            continue;
        }

        ScanOutcome outcome;
        try {
            outcome = processWork(item);
        } catch (const std::exception& e) {
            common::Logger::instance().error("[Worker] Processing failed | worker={} | path={} | error={}",
                                            worker_id, item.path, e.what());
            common::FileRecord record;
            record.path = item.path;
            record.name = displayName(item.path);
            record.access_error = e.what();
            classifier_.apply(record);
            progress_.addProcessedFile(0, record.is_blocked);

            outcome = ScanOutcome{};
            outcome.error = entryError(ScanErrorCode::INTERNAL_ERROR, item.path, e.what());
            outcome.record = std::move(record);
        }

        result_queue_.push(std::move(outcome));
        ++processed;
    }

    common::Logger::instance().debug("[Worker] Finished | worker={} | processed={} | discarded={}",
                                    worker_id, processed, discarded);
}

ScanOutcome Scanner::processWork(const common::WorkItem& item) {
    ScanOutcome outcome;
    std::filesystem::path path(item.path);

    common::FileRecord record;
    record.path = item.path;
    record.name = displayName(path);
    record.extension = toLower(path.extension().string());

    struct stat st;
    if (::stat(item.path.c_str(), &st) != 0) {
        std::string cause = std::error_code(errno, std::generic_category()).message();
        record.access_error = cause;
        classifier_.apply(record);
        progress_.addProcessedFile(0, record.is_blocked);

        outcome.error = entryError(ScanErrorCode::FILE_STAT_FAILED, item.path, cause);
        outcome.record = std::move(record);
        return outcome;
    }

    record.mod_time = toTimePoint(st.st_mtim);
    record.is_directory = S_ISDIR(st.st_mode);
    record.size = record.is_directory ? 0 : static_cast<int64_t>(st.st_size);

    if (!record.is_directory && !S_ISREG(st.st_mode)) {
        // link target is a fifo, socket or device node; opening it may block
        record.size = 0;
        record.mime_type = "application/octet-stream";
    } else if (!record.is_directory) {
        auto sniff = ContentSniffer::sniffFile(path, constants::limits::SNIFF_LENGTH);
        if (sniff.error) {
            record.access_error = *sniff.error;
            outcome.error = entryError(ScanErrorCode::FILE_READ_FAILED, item.path, *sniff.error);
        } else {
            record.mime_type = sniff.mime_type;
        }
    }

    record.file_type = record.extension.size() > 1
        ? record.extension.substr(1)
        : ContentSniffer::primaryType(record.mime_type);

    classifier_.apply(record);
    progress_.addProcessedFile(record.size, record.is_blocked);

    if (record.is_blocked) {
        common::Logger::instance().debug("[Worker] Blocked | path={} | reason={}",
                                        record.path, record.block_reason.value_or(""));
    }

    outcome.record = std::move(record);
    return outcome;
}

void Scanner::collectResults(std::vector<common::FileRecord>& files) {
    while (true) {
        ScanOutcome outcome;
        result_queue_.pop(outcome);
        if (outcome.end_of_stream) {
            break;
        }

        if (outcome.error) {
            progress_.recordError(*outcome.error);
        }

        if (!outcome.record) {
            continue;
        }

        progress_.recordActivity(std::filesystem::path(outcome.record->path).parent_path().string());

        if (result_callback_) {
            try {
                result_callback_(*outcome.record);
            } catch (const std::exception& e) {
                common::Logger::instance().warn("[Scanner] Result callback failed | path={} | error={}",
                                               outcome.record->path, e.what());
            }
        }

        files.push_back(std::move(*outcome.record));
    }
}

std::filesystem::path Scanner::exportPath() const {
    std::error_code ec;
    if (std::filesystem::is_directory(root_, ec)) {
        return root_ / config_.export_filename;
    }
    return root_.parent_path() / config_.export_filename;
}

void Scanner::exportBlockedFiles(common::ScanResult& result) {
    auto output = exportPath();

    report::BlockedFilesExporter exporter;
    auto error = exporter.exportBlockedFiles(result, output);
    if (!error) {
        common::Logger::instance().info("[Scanner] Blocked files exported | path={}", output.string());
        return;
    }

    auto message = common::describeError(ScanErrorCode::EXPORT_FAILED, *error);
    common::Logger::instance().warn("[Scanner] Export failed | path={} | error={}", output.string(), *error);

    progress_.recordError(message);
    result.progress.errors.push_back(message);
    result.success = false;
}

}}
