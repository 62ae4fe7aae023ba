#pragma once

#include "../common/types.hpp"
#include <string>
#include <ostream>
#include <chrono>

namespace fslogger {
namespace scan {

enum class OutputFormat {
    TEXT,
    JSON
};

class ResultFormatter {
public:
    explicit ResultFormatter(OutputFormat format = OutputFormat::TEXT);

    void formatScanSummary(const common::ScanResult& result, std::ostream& out);

    void setColorsEnabled(bool enabled) { colors_enabled_ = enabled; }
    // Lists every record instead of the blocked ones only
    void setVerbose(bool verbose) { verbose_ = verbose; }

    static std::string formatFileSize(int64_t bytes);
    static std::string formatDuration(std::chrono::milliseconds ms);

private:
    OutputFormat format_;
    bool colors_enabled_ = true;
    bool verbose_ = false;

    void formatTextRecord(const common::FileRecord& record, std::ostream& out);
    void formatTextSummary(const common::ScanResult& result, std::ostream& out);
    void formatJsonSummary(const common::ScanResult& result, std::ostream& out);

    std::string colorize(const std::string& text, const std::string& color);
};

}}
