#include "fslogger/scan/classifier.hpp"
#include "fslogger/common/constants.hpp"
#include <algorithm>
#include <cctype>
#include <fnmatch.h>

namespace fslogger {
namespace scan {

namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string normalizeExtension(const std::string& type) {
    std::string ext = toLower(type);
    if (!ext.empty() && ext.front() != '.') {
        ext.insert(ext.begin(), '.');
    }
    return ext;
}

}

Classifier::Classifier(const common::ScanConfiguration& config)
    : max_size_bytes_(config.maxFileSizeBytes()),
      blocked_patterns_(config.blocked_patterns) {
    allowed_types_.reserve(config.allowed_types.size());
    for (const auto& type : config.allowed_types) {
        if (!type.empty()) {
            allowed_types_.push_back(normalizeExtension(type));
        }
    }
}

bool Classifier::isFileSizeAllowed(int64_t size) const {
    return size <= 0 || static_cast<uint64_t>(size) <= max_size_bytes_;
}

bool Classifier::isTypeAllowed(const std::string& extension) const {
    if (allowed_types_.empty()) {
        return true;
    }

    std::string ext = toLower(extension);
    return std::find(allowed_types_.begin(), allowed_types_.end(), ext) != allowed_types_.end();
}

std::optional<std::string> Classifier::matchingPattern(const std::string& name) const {
    for (const auto& pattern : blocked_patterns_) {
        // an unterminated bracket is matched literally
        if (fnmatch(pattern.c_str(), name.c_str(), 0) == 0) {
            return pattern;
        }
    }
    return std::nullopt;
}

BlockRule Classifier::firstViolatedRule(const common::FileRecord& record) const {
    if (!record.is_directory) {
        if (!isFileSizeAllowed(record.size)) {
            return BlockRule::SIZE;
        }

        if (!isTypeAllowed(record.extension)) {
            return BlockRule::TYPE;
        }

        if (matchingPattern(record.name)) {
            return BlockRule::PATTERN;
        }
    }

    if (record.access_error) {
        return BlockRule::ACCESS;
    }

    return BlockRule::NONE;
}

bool Classifier::shouldBlock(const common::FileRecord& record) const {
    return firstViolatedRule(record) != BlockRule::NONE;
}

std::string Classifier::blockReason(const common::FileRecord& record) const {
    using namespace constants::block_reasons;

    switch (firstViolatedRule(record)) {
        case BlockRule::SIZE:
            return SIZE_EXCEEDED;
        case BlockRule::TYPE:
            return TYPE_NOT_ALLOWED;
        case BlockRule::PATTERN:
            return std::string(PATTERN_PREFIX) + matchingPattern(record.name).value_or("");
        case BlockRule::ACCESS:
            return record.is_directory ? DIRECTORY_NOT_READABLE : FILE_NOT_ACCESSIBLE;
        case BlockRule::NONE:
        default:
            return UNKNOWN;
    }
}

Classification Classifier::classify(const common::FileRecord& record) const {
    Classification result;
    result.rule = firstViolatedRule(record);
    result.blocked = result.rule != BlockRule::NONE;
    if (result.blocked) {
        result.reason = blockReason(record);
    }
    return result;
}

void Classifier::apply(common::FileRecord& record) const {
    auto classification = classify(record);
    record.is_blocked = classification.blocked;
    record.block_reason = classification.reason;
}

}}
