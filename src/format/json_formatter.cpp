#include "fslogger/format/json_formatter.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace fslogger {
namespace format {

nlohmann::json JsonFormatter::format(const common::FileRecord& record) {
    nlohmann::json json;

    json["path"] = record.path;
    json["name"] = record.name;
    json["size"] = record.size;
    json["mime_type"] = record.mime_type;
    json["file_type"] = record.file_type;
    json["extension"] = record.extension;
    json["mod_time"] = formatTimestamp(record.mod_time);
    json["is_directory"] = record.is_directory;
    json["is_blocked"] = record.is_blocked;
    json["block_reason"] = optionalString(record.block_reason);
    json["access_error"] = optionalString(record.access_error);

    return json;
}

nlohmann::json JsonFormatter::format(const common::ScanProgress& progress) {
    nlohmann::json json;

    json["total_files"] = progress.total_files;
    json["scanned_files"] = progress.scanned_files;
    json["total_size"] = progress.total_size;
    json["scanned_size"] = progress.scanned_size;
    json["blocked_files"] = progress.blocked_files;
    json["errors"] = progress.errors;
    json["start_time"] = formatTimestamp(progress.start_time);
    json["last_updated"] = formatTimestamp(progress.last_updated);
    json["current_directory"] = progress.current_directory;

    return json;
}

nlohmann::json JsonFormatter::format(const common::ScanResult& result, bool include_files) {
    nlohmann::json json;

    json["success"] = result.success;
    json["cancelled"] = result.cancelled;
    json["duration_ms"] = result.duration.count();
    json["progress"] = format(result.progress);
    json["error"] = optionalString(result.error);

    if (include_files) {
        nlohmann::json files = nlohmann::json::array();
        for (const auto& record : result.files) {
            files.push_back(format(record));
        }
        json["files"] = files;
    }

    return json;
}

std::string JsonFormatter::formatTimestamp(std::chrono::system_clock::time_point time) {
    auto time_t_val = std::chrono::system_clock::to_time_t(time);
    std::tm tm{};
    gmtime_r(&time_t_val, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

nlohmann::json JsonFormatter::optionalString(const std::optional<std::string>& value) {
    if (value) {
        return *value;
    }
    return nullptr;
}

}}
