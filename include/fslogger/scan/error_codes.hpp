#pragma once

#include "../common/error_framework.hpp"
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>

namespace fslogger {
namespace scan {

enum class ScanErrorCode {
    EMPTY_PATH = 100,
    ROOT_NOT_FOUND = 101,
    ROOT_NOT_ACCESSIBLE = 102,
    SCANNER_ALREADY_USED = 103,

    DIRECTORY_READ_FAILED = 200,
    FILE_STAT_FAILED = 201,
    FILE_READ_FAILED = 202,

    EXPORT_FAILED = 300,

    SCAN_CANCELLED = 400,
    INTERNAL_ERROR = 500
};

using ScanErrorCodeHelper = common::ErrorRegistry<ScanErrorCode>;

}
}

namespace fslogger {
namespace common {

template<>
inline const std::unordered_map<scan::ScanErrorCode, ErrorInfo<scan::ScanErrorCode>>&
ErrorRegistry<scan::ScanErrorCode>::getInfoMap() {
    static const std::unordered_map<scan::ScanErrorCode, ErrorInfo<scan::ScanErrorCode>> map = {
        {scan::ScanErrorCode::EMPTY_PATH, {
            scan::ScanErrorCode::EMPTY_PATH,
            "EMPTY_PATH",
            "Empty path provided"
        }},
        {scan::ScanErrorCode::ROOT_NOT_FOUND, {
            scan::ScanErrorCode::ROOT_NOT_FOUND,
            "ROOT_NOT_FOUND",
            "Scan root does not exist"
        }},
        {scan::ScanErrorCode::ROOT_NOT_ACCESSIBLE, {
            scan::ScanErrorCode::ROOT_NOT_ACCESSIBLE,
            "ROOT_NOT_ACCESSIBLE",
            "Scan root is not accessible"
        }},
        {scan::ScanErrorCode::SCANNER_ALREADY_USED, {
            scan::ScanErrorCode::SCANNER_ALREADY_USED,
            "SCANNER_ALREADY_USED",
            "Scanner has already been started"
        }},
        {scan::ScanErrorCode::DIRECTORY_READ_FAILED, {
            scan::ScanErrorCode::DIRECTORY_READ_FAILED,
            "DIRECTORY_READ_FAILED",
            "Error reading directory"
        }},
        {scan::ScanErrorCode::FILE_STAT_FAILED, {
            scan::ScanErrorCode::FILE_STAT_FAILED,
            "FILE_STAT_FAILED",
            "Error getting info"
        }},
        {scan::ScanErrorCode::FILE_READ_FAILED, {
            scan::ScanErrorCode::FILE_READ_FAILED,
            "FILE_READ_FAILED",
            "Error reading file"
        }},
        {scan::ScanErrorCode::EXPORT_FAILED, {
            scan::ScanErrorCode::EXPORT_FAILED,
            "EXPORT_FAILED",
            "Failed to export blocked files"
        }},
        {scan::ScanErrorCode::SCAN_CANCELLED, {
            scan::ScanErrorCode::SCAN_CANCELLED,
            "SCAN_CANCELLED",
            "Scan cancelled"
        }},
        {scan::ScanErrorCode::INTERNAL_ERROR, {
            scan::ScanErrorCode::INTERNAL_ERROR,
            "INTERNAL_ERROR",
            "Internal scanner error"
        }}
    };
    return map;
}

}
}

namespace fslogger {
namespace scan {

class ScanError : public std::runtime_error {
public:
    ScanError(ScanErrorCode code, const std::string& detail, common::ErrorContext context = {})
        : std::runtime_error(common::describeError(code, detail)),
          code_(code),
          context_(std::move(context)) {}

    ScanErrorCode code() const { return code_; }
    const common::ErrorContext& context() const { return context_; }

private:
    ScanErrorCode code_;
    common::ErrorContext context_;
};

}
}
