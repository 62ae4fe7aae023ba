#pragma once

#include "../common/types.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <string>

namespace fslogger {
namespace format {

class JsonFormatter {
public:
    static nlohmann::json format(const common::FileRecord& record);
    static nlohmann::json format(const common::ScanProgress& progress);
    static nlohmann::json format(const common::ScanResult& result, bool include_files = true);

    // ISO-8601 UTC, second precision
    static std::string formatTimestamp(std::chrono::system_clock::time_point time);

private:
    static nlohmann::json optionalString(const std::optional<std::string>& value);
};

}}
