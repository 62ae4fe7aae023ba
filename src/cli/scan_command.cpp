#include "scan_command.hpp"
#include "fslogger/common/config.hpp"
#include "fslogger/common/logger.hpp"
#include "fslogger/common/progress_bar.hpp"
#include "fslogger/scan/error_codes.hpp"
#include "fslogger/scan/result_formatter.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>
#include <unistd.h>

namespace fslogger {
namespace cli {

namespace {

std::atomic<bool> g_interrupted{false};

void handleInterrupt(int) {
    g_interrupted.store(true);
}

constexpr auto POLL_INTERVAL = std::chrono::milliseconds(100);

}

ScanCommand::ScanCommand() : was_called_(false) {}

void ScanCommand::setup(CLI::App* subcommand) {
    subcommand_ = subcommand;

    subcommand->add_option("target", target_path_, "Directory or file to scan")
               ->required();

    subcommand->add_flag("-r,--recursive", recursive_,
                        "Descend into subdirectories (default: from config)");
    subcommand->add_flag("--no-recursive", no_recursive_,
                        "Only list the top-level directory");
    subcommand->add_option("-w,--workers", workers_,
                          "Number of classification workers")
                          ->check(CLI::Range(1, 1024));
    subcommand->add_option("--queue-capacity", queue_capacity_,
                          "Capacity of the work and result queues")
                          ->check(CLI::Range(1, 1000000));
    subcommand->add_option("--traversal-threads", traversal_threads_,
                          "Threads listing directories (0 = automatic)")
                          ->check(CLI::Range(0, 1024));
    subcommand->add_option("-m,--max-size", max_file_size_,
                          "Maximum file size in MB (default: from config)")
                          ->check(CLI::Range(int64_t{1}, int64_t{1024 * 1024}));
    subcommand->add_option("-a,--allow", allowed_types_,
                          "Allowed extension, repeatable (e.g. .pdf)");
    subcommand->add_option("-b,--block", blocked_patterns_,
                          "Blocked name pattern, repeatable (e.g. '*.tmp')");
    subcommand->add_flag("-e,--export", export_,
                        "Write blocked files to a JSON manifest in the scan root");
    subcommand->add_option("--export-file", export_filename_,
                          "Manifest file name (default: from config)");
    subcommand->add_flag("-p,--no-progress", no_progress_,
                        "Disable progress indicator");
    subcommand->add_flag("--json", json_output_,
                        "Output as JSON");
    subcommand->add_flag("-q,--quiet", quiet_,
                        "Quiet mode");
    subcommand->add_flag("-l,--list", list_all_,
                        "List every entry, not only blocked ones");

    subcommand->callback([this]() { was_called_ = true; });
}

bool ScanCommand::wasCalled() const {
    return was_called_;
}

bool ScanCommand::validateArguments() const {
    if (recursive_ && no_recursive_) {
        std::cerr << "Error: --recursive and --no-recursive are mutually exclusive" << std::endl;
        return false;
    }
    return true;
}

bool ScanCommand::shouldShowProgress() const {
    return !no_progress_ && !quiet_ && !json_output_ && isatty(STDOUT_FILENO);
}

common::ScanConfiguration ScanCommand::buildConfiguration(const common::ScanConfiguration& base) const {
    auto config = base;

    if (recursive_) {
        config.recursive = true;
    } else if (no_recursive_) {
        config.recursive = false;
    }

    if (workers_ > 0) {
        config.worker_count = workers_;
    }
    if (queue_capacity_ > 0) {
        config.queue_capacity = queue_capacity_;
    }
    if (traversal_threads_ >= 0) {
        config.traversal_threads = traversal_threads_;
    }
    if (max_file_size_ > 0) {
        config.max_file_size_mb = max_file_size_;
    }
    if (!allowed_types_.empty()) {
        config.allowed_types = allowed_types_;
    }
    if (!blocked_patterns_.empty()) {
        config.blocked_patterns.insert(config.blocked_patterns.end(),
                                       blocked_patterns_.begin(), blocked_patterns_.end());
    }
    if (export_) {
        config.export_blocked = true;
    }
    if (!export_filename_.empty()) {
        config.export_filename = export_filename_;
    }

    return config.resolved();
}

int ScanCommand::exitCodeFor(const common::ScanResult& result) {
    if (!result.success || result.progress.blocked_files > 0) {
        return 1;
    }
    return 0;
}

int ScanCommand::execute() {
    if (!validateArguments()) {
        return 2;
    }

    auto config = buildConfiguration(common::Config::instance().scanConfiguration());

    common::Logger::instance().debug(
        "[ScanCommand] Configuration | target={} | recursive={} | workers={} | max_size_mb={} | allowed={} | patterns={}",
        target_path_, config.recursive, config.worker_count, config.max_file_size_mb,
        config.allowed_types.size(), config.blocked_patterns.size());

    scan::ScanRegistry registry;
    try {
        registry.start(target_path_, config);
    } catch (const scan::ScanError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 2;
    }

    g_interrupted.store(false);
    auto previous_handler = std::signal(SIGINT, handleInterrupt);

    int exit_code = waitForCompletion(registry, target_path_);

    std::signal(SIGINT, previous_handler == SIG_ERR ? SIG_DFL : previous_handler);
    return exit_code;
}

int ScanCommand::waitForCompletion(scan::ScanRegistry& registry, const std::string& id) {
    const bool show_progress = shouldShowProgress();
    common::ProgressBarRenderer progress_bar("Scanning", true);
    bool cancel_sent = false;

    while (true) {
        auto status = registry.status(id);
        if (status.state != scan::JobState::RUNNING) {
            break;
        }

        if (g_interrupted.load() && !cancel_sent) {
            cancel_sent = registry.cancel(id);
            if (!quiet_) {
                if (show_progress) {
                    progress_bar.clear();
                }
                std::cerr << "Cancelling scan..." << std::endl;
            }
        }

        if (show_progress && status.progress) {
            progress_bar.update(status.progress->scanned_files, status.progress->total_files,
                                status.progress->blocked_files, status.progress->current_directory);
            progress_bar.render(std::cout);
        }

        std::this_thread::sleep_for(POLL_INTERVAL);
    }

    auto status = registry.wait(id);

    if (show_progress) {
        progress_bar.complete();
        progress_bar.render(std::cout);
    }

    if (status.state == scan::JobState::ERROR) {
        std::cerr << "Error: " << status.error.value_or("scan failed") << std::endl;
        return 2;
    }

    if (!status.result) {
        std::cerr << "Error: scan result unavailable" << std::endl;
        return 2;
    }

    const auto& result = *status.result;

    if (json_output_) {
        scan::ResultFormatter formatter(scan::OutputFormat::JSON);
        formatter.setVerbose(list_all_);
        formatter.formatScanSummary(result, std::cout);
    } else if (!quiet_) {
        scan::ResultFormatter formatter(scan::OutputFormat::TEXT);
        formatter.setColorsEnabled(isatty(STDOUT_FILENO));
        formatter.setVerbose(list_all_);
        formatter.formatScanSummary(result, std::cout);
    }

    return exitCodeFor(result);
}

}}
