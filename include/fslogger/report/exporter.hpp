#pragma once

#include "../common/types.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace fslogger {
namespace report {

// Writes the blocked records of a finished scan as a JSON manifest.
class BlockedFilesExporter {
public:
    // Creates missing parent directories. Returns a description of the
    // failure, or nullopt when the manifest was written.
    std::optional<std::string> exportBlockedFiles(const common::ScanResult& result,
                                                  const std::filesystem::path& output_path) const;

    static nlohmann::json buildManifest(const common::ScanResult& result,
                                        std::chrono::system_clock::time_point exported_at);
};

}}
