#include "fslogger/common/types.hpp"
#include "fslogger/common/constants.hpp"
#include <limits>

namespace fslogger {
namespace common {

uint64_t ScanConfiguration::maxFileSizeBytes() const {
    if (max_file_size_mb <= 0) {
        return 0;
    }
    auto mb = static_cast<uint64_t>(max_file_size_mb);
    if (mb > std::numeric_limits<uint64_t>::max() / constants::limits::BYTES_PER_MB) {
        return std::numeric_limits<uint64_t>::max();
    }
    return mb * constants::limits::BYTES_PER_MB;
}

ScanConfiguration ScanConfiguration::resolved() const {
    ScanConfiguration config = *this;

    if (config.worker_count <= 0) {
        config.worker_count = constants::config_defaults::WORKER_COUNT;
    }
    if (config.queue_capacity <= 0) {
        config.queue_capacity = constants::config_defaults::QUEUE_CAPACITY;
    }
    if (config.traversal_threads < 0) {
        config.traversal_threads = 0;
    }
    if (config.export_filename.empty()) {
        config.export_filename = constants::config_defaults::EXPORT_FILENAME;
    }

    return config;
}

std::string to_string(ScanState state) {
    switch (state) {
        case ScanState::IDLE: return "IDLE";
        case ScanState::VALIDATING: return "VALIDATING";
        case ScanState::RUNNING: return "RUNNING";
        case ScanState::DRAINING: return "DRAINING";
        case ScanState::COMPLETED: return "COMPLETED";
        case ScanState::FAILED: return "FAILED";
        default: return "UNKNOWN";
    }
}

}}
