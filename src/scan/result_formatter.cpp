#include "fslogger/scan/result_formatter.hpp"
#include "fslogger/format/json_formatter.hpp"
#include <nlohmann/json.hpp>
#include <iomanip>
#include <sstream>
#include <ctime>

namespace fslogger {
namespace scan {

ResultFormatter::ResultFormatter(OutputFormat format) : format_(format) {}

void ResultFormatter::formatScanSummary(const common::ScanResult& result, std::ostream& out) {
    if (format_ == OutputFormat::JSON) {
        formatJsonSummary(result, out);
    } else {
        formatTextSummary(result, out);
    }
}

void ResultFormatter::formatTextRecord(const common::FileRecord& record, std::ostream& out) {
    std::string status_str;
    std::string color;

    if (record.is_blocked) {
        status_str = "BLOCKED";
        color = "\033[31m";
    } else if (record.is_directory) {
        status_str = "DIR";
        color = "\033[36m";
    } else {
        status_str = "OK";
        color = "\033[32m";
    }

    out << colorize(status_str, color) << ": " << record.path;

    if (record.block_reason) {
        out << " (" << *record.block_reason << ")";
    }

    if (verbose_ && !record.is_directory) {
        out << " [" << (record.mime_type.empty() ? "unknown" : record.mime_type)
            << ", " << formatFileSize(record.size) << "]";
    }

    if (record.access_error && verbose_) {
        out << " - " << *record.access_error;
    }

    out << "\n";
}

void ResultFormatter::formatTextSummary(const common::ScanResult& result, std::ostream& out) {
    for (const auto& record : result.files) {
        if (verbose_ || record.is_blocked) {
            formatTextRecord(record, out);
        }
    }

    const auto& progress = result.progress;

    out << "\n" << colorize("----------- SCAN SUMMARY -----------", "\033[1m") << "\n";
    out << "Entries found: " << progress.total_files << "\n";
    out << "Files processed: " << progress.scanned_files << "\n";

    if (progress.blocked_files > 0) {
        out << "  - " << colorize("Blocked", "\033[31m") << ": " << progress.blocked_files << "\n";
    }

    if (!progress.errors.empty()) {
        out << "Errors: " << progress.errors.size() << "\n";
        for (const auto& error : progress.errors) {
            out << "  - " << error << "\n";
        }
    }

    if (result.cancelled) {
        out << colorize("Scan was cancelled", "\033[33m") << "\n";
    }

    double total_seconds = result.duration.count() / 1000.0;
    out << "Scan time: " << std::fixed << std::setprecision(3) << total_seconds << " sec\n";
    out << "Data found: " << formatFileSize(progress.total_size) << "\n";
    out << "Data processed: " << formatFileSize(progress.scanned_size) << "\n";

    auto format_time = [](const std::chrono::system_clock::time_point& tp) {
        auto tt = std::chrono::system_clock::to_time_t(tp);
        std::tm tm{};
        localtime_r(&tt, &tm);
        std::ostringstream oss;
        oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
        return oss.str();
    };

    out << "Start time: " << format_time(progress.start_time) << "\n";
    out << "End time:   " << format_time(progress.last_updated) << "\n";
}

void ResultFormatter::formatJsonSummary(const common::ScanResult& result, std::ostream& out) {
    nlohmann::json json = format::JsonFormatter::format(result, verbose_);

    if (!verbose_) {
        nlohmann::json blocked = nlohmann::json::array();
        for (const auto& record : result.files) {
            if (record.is_blocked) {
                blocked.push_back(format::JsonFormatter::format(record));
            }
        }
        json["blocked_files"] = blocked;
    }

    out << json.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
}

std::string ResultFormatter::colorize(const std::string& text, const std::string& color) {
    if (colors_enabled_) {
        return color + text + "\033[0m";
    }
    return text;
}

std::string ResultFormatter::formatFileSize(int64_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    int unit_index = 0;
    double size = static_cast<double>(bytes < 0 ? 0 : bytes);

    while (size >= 1024.0 && unit_index < 4) {
        size /= 1024.0;
        unit_index++;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << size << " " << units[unit_index];
    return oss.str();
}

std::string ResultFormatter::formatDuration(std::chrono::milliseconds ms) {
    auto count = ms.count();

    if (count < 1000) {
        return std::to_string(count) + "ms";
    } else if (count < 60000) {
        return std::to_string(count / 1000) + "." + std::to_string((count % 1000) / 100) + "s";
    } else {
        auto minutes = count / 60000;
        auto seconds = (count % 60000) / 1000;
        return std::to_string(minutes) + "m " + std::to_string(seconds) + "s";
    }
}

}}
