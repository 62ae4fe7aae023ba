#pragma once

#include "../common/types.hpp"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace fslogger {
namespace scan {

enum class BlockRule {
    NONE,
    SIZE,
    TYPE,
    PATTERN,
    ACCESS
};

struct Classification {
    bool blocked = false;
    BlockRule rule = BlockRule::NONE;
    std::optional<std::string> reason;
};

// Decides whether a record is blocked. Rules are evaluated in a fixed order
// (size, allowed type, pattern, access) and the first violated rule supplies
// the reason. Stateless after construction, safe to share between workers.
class Classifier {
public:
    explicit Classifier(const common::ScanConfiguration& config);

    bool isFileSizeAllowed(int64_t size) const;
    bool isTypeAllowed(const std::string& extension) const;
    std::optional<std::string> matchingPattern(const std::string& name) const;

    bool shouldBlock(const common::FileRecord& record) const;
    std::string blockReason(const common::FileRecord& record) const;

    Classification classify(const common::FileRecord& record) const;
    void apply(common::FileRecord& record) const;

private:
    uint64_t max_size_bytes_;
    std::vector<std::string> allowed_types_;
    std::vector<std::string> blocked_patterns_;

    BlockRule firstViolatedRule(const common::FileRecord& record) const;
};

}}
