#include "fslogger/report/exporter.hpp"
#include "fslogger/format/json_formatter.hpp"
#include "fslogger/common/logger.hpp"
#include <fstream>
#include <system_error>

namespace fslogger {
namespace report {

nlohmann::json BlockedFilesExporter::buildManifest(const common::ScanResult& result,
                                                   std::chrono::system_clock::time_point exported_at) {
    nlohmann::json blocked = nlohmann::json::array();
    int64_t blocked_size = 0;

    for (const auto& record : result.files) {
        if (record.is_blocked) {
            blocked.push_back(format::JsonFormatter::format(record));
            blocked_size += record.size;
        }
    }

    nlohmann::json manifest;
    manifest["timestamp"] = format::JsonFormatter::formatTimestamp(exported_at);
    manifest["total_files"] = result.progress.total_files;
    manifest["blocked_count"] = blocked.size();
    manifest["blocked_files"] = blocked;
    manifest["scan_duration_ms"] = result.duration.count();
    manifest["total_size"] = result.progress.total_size;
    manifest["blocked_size"] = blocked_size;
    return manifest;
}

std::optional<std::string> BlockedFilesExporter::exportBlockedFiles(
        const common::ScanResult& result, const std::filesystem::path& output_path) const {
    try {
        auto manifest = buildManifest(result, std::chrono::system_clock::now());
        // file names are raw bytes; invalid UTF-8 is written as U+FFFD
        auto content = manifest.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);

        auto parent = output_path.parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
            if (ec) {
                return "failed to create output directory: " + ec.message();
            }
        }

        std::ofstream file(output_path);
        if (!file) {
            common::Logger::instance().error("[Exporter] Failed to create file | path={}", output_path.string());
            return "failed to create output file: " + output_path.string();
        }

        file << content << '\n';
        file.close();
        if (!file) {
            return "failed to write output file: " + output_path.string();
        }

        common::Logger::instance().debug("[Exporter] Saved | path={} | blocked={}",
                                        output_path.string(), manifest["blocked_count"].get<size_t>());
        return std::nullopt;
    } catch (const std::exception& e) {
        common::Logger::instance().error("[Exporter] Export failed | path={} | error={}",
                                        output_path.string(), e.what());
        return std::string("failed to build manifest: ") + e.what();
    }
}

}}
