#include <gtest/gtest.h>

#include "fslogger/scan/classifier.hpp"

#include <cctype>
#include <limits>

namespace fslogger {
namespace scan {
namespace {

common::FileRecord makeFile(const std::string& name, int64_t size) {
    common::FileRecord record;
    record.path = "/data/" + name;
    record.name = name;
    record.size = size;
    auto dot = name.rfind('.');
    if (dot != std::string::npos && dot != 0) {
        record.extension = name.substr(dot);
        for (auto& c : record.extension) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
    }
    return record;
}

common::ScanConfiguration configWithMaxSize(int64_t mb) {
    common::ScanConfiguration config;
    config.max_file_size_mb = mb;
    return config;
}

}

TEST(Classifier, SizeBoundaryIsInclusive) {
    Classifier classifier(configWithMaxSize(1));

    auto at_limit = makeFile("at_limit.bin", 1024 * 1024);
    EXPECT_FALSE(classifier.shouldBlock(at_limit));
    EXPECT_FALSE(classifier.classify(at_limit).reason.has_value());

    auto over_limit = makeFile("over_limit.bin", 1024 * 1024 + 1);
    auto result = classifier.classify(over_limit);
    EXPECT_TRUE(result.blocked);
    EXPECT_EQ(result.rule, BlockRule::SIZE);
    ASSERT_TRUE(result.reason.has_value());
    EXPECT_EQ(*result.reason, "File size exceeds limit");
}

TEST(Classifier, HugeSizeLimitDoesNotWrapAround) {
    auto config = configWithMaxSize(int64_t{1} << 50);
    EXPECT_EQ(config.maxFileSizeBytes(), std::numeric_limits<uint64_t>::max());

    Classifier classifier(config);
    EXPECT_FALSE(classifier.shouldBlock(makeFile("large.bin", 5 * 1024 * 1024)));
    EXPECT_FALSE(classifier.shouldBlock(makeFile("largest.bin", std::numeric_limits<int64_t>::max())));
}

TEST(Classifier, EmptyAllowListAllowsEverything) {
    Classifier classifier(configWithMaxSize(10));

    EXPECT_TRUE(classifier.isTypeAllowed(".exe"));
    EXPECT_TRUE(classifier.isTypeAllowed(""));
    EXPECT_FALSE(classifier.shouldBlock(makeFile("tool.exe", 10)));
}

TEST(Classifier, AllowListIsCaseInsensitive) {
    auto config = configWithMaxSize(10);
    config.allowed_types = {".PDF", "txt"};
    Classifier classifier(config);

    EXPECT_TRUE(classifier.isTypeAllowed(".pdf"));
    EXPECT_TRUE(classifier.isTypeAllowed(".PdF"));
    EXPECT_TRUE(classifier.isTypeAllowed(".txt"));
    EXPECT_FALSE(classifier.isTypeAllowed(".exe"));
    EXPECT_FALSE(classifier.isTypeAllowed(""));

    EXPECT_FALSE(classifier.shouldBlock(makeFile("Report.PDF", 10)));

    auto result = classifier.classify(makeFile("tool.exe", 10));
    EXPECT_TRUE(result.blocked);
    EXPECT_EQ(result.rule, BlockRule::TYPE);
    EXPECT_EQ(result.reason.value_or(""), "File type not allowed");
}

TEST(Classifier, PatternReasonNamesFirstMatchingPattern) {
    auto config = configWithMaxSize(10);
    config.blocked_patterns = {"*.tmp", "cache_*", "*.t?p"};
    Classifier classifier(config);

    auto result = classifier.classify(makeFile("session.tmp", 10));
    EXPECT_TRUE(result.blocked);
    EXPECT_EQ(result.rule, BlockRule::PATTERN);
    EXPECT_EQ(result.reason.value_or(""), "File matches blocked pattern: *.tmp");

    result = classifier.classify(makeFile("cache_01.dat", 10));
    EXPECT_EQ(result.reason.value_or(""), "File matches blocked pattern: cache_*");

    result = classifier.classify(makeFile("notes.txp", 10));
    EXPECT_EQ(result.reason.value_or(""), "File matches blocked pattern: *.t?p");
}

TEST(Classifier, PatternsAreCaseSensitive) {
    auto config = configWithMaxSize(10);
    config.blocked_patterns = {"*.tmp"};
    Classifier classifier(config);

    EXPECT_FALSE(classifier.shouldBlock(makeFile("SESSION.TMP", 10)));
    EXPECT_TRUE(classifier.shouldBlock(makeFile("session.tmp", 10)));
}

TEST(Classifier, UnterminatedBracketOnlyMatchesLiterally) {
    auto config = configWithMaxSize(10);
    config.blocked_patterns = {"[abc"};
    Classifier classifier(config);

    EXPECT_FALSE(classifier.matchingPattern("a").has_value());
    EXPECT_FALSE(classifier.shouldBlock(makeFile("abc.txt", 10)));
}

TEST(Classifier, SizeRuleTakesPrecedence) {
    auto config = configWithMaxSize(1);
    config.allowed_types = {".txt"};
    config.blocked_patterns = {"*.exe"};
    Classifier classifier(config);

    auto record = makeFile("huge.exe", 2 * 1024 * 1024);
    EXPECT_EQ(classifier.classify(record).rule, BlockRule::SIZE);
    EXPECT_EQ(classifier.blockReason(record), "File size exceeds limit");

    record.size = 10;
    EXPECT_EQ(classifier.classify(record).rule, BlockRule::TYPE);

    config.allowed_types.clear();
    Classifier pattern_only(config);
    EXPECT_EQ(pattern_only.classify(record).rule, BlockRule::PATTERN);
}

TEST(Classifier, DecisionAndReasonAgree) {
    auto config = configWithMaxSize(1);
    config.allowed_types = {".txt", ".log"};
    config.blocked_patterns = {"secret*"};
    Classifier classifier(config);

    const std::vector<common::FileRecord> records = {
        makeFile("a.txt", 10),
        makeFile("b.bin", 10),
        makeFile("secret.txt", 10),
        makeFile("big.log", 3 * 1024 * 1024),
        makeFile("README", 0),
    };

    for (const auto& record : records) {
        auto result = classifier.classify(record);
        EXPECT_EQ(result.blocked, classifier.shouldBlock(record)) << record.name;
        EXPECT_EQ(result.blocked, result.reason.has_value()) << record.name;
        if (result.blocked) {
            EXPECT_EQ(*result.reason, classifier.blockReason(record)) << record.name;
        } else {
            EXPECT_EQ(classifier.blockReason(record), "Unknown reason") << record.name;
        }
    }
}

TEST(Classifier, AccessErrorBlocksByPolicy) {
    Classifier classifier(configWithMaxSize(10));

    auto file = makeFile("locked.txt", 10);
    file.access_error = "Permission denied";
    classifier.apply(file);
    EXPECT_TRUE(file.is_blocked);
    EXPECT_EQ(file.block_reason.value_or(""), "File not accessible");

    common::FileRecord directory;
    directory.path = "/data/locked";
    directory.name = "locked";
    directory.is_directory = true;
    directory.access_error = "Permission denied";
    classifier.apply(directory);
    EXPECT_TRUE(directory.is_blocked);
    EXPECT_EQ(directory.block_reason.value_or(""), "Directory not readable");
}

TEST(Classifier, DirectoriesSkipFileRules) {
    auto config = configWithMaxSize(1);
    config.allowed_types = {".txt"};
    config.blocked_patterns = {"*"};
    Classifier classifier(config);

    common::FileRecord directory;
    directory.path = "/data/subdir";
    directory.name = "subdir";
    directory.is_directory = true;
    directory.size = 4096;

    classifier.apply(directory);
    EXPECT_FALSE(directory.is_blocked);
    EXPECT_FALSE(directory.block_reason.has_value());
}

TEST(Classifier, ApplyClearsPreviousDecision) {
    Classifier classifier(configWithMaxSize(10));

    auto record = makeFile("ok.txt", 10);
    record.is_blocked = true;
    record.block_reason = "stale";
    classifier.apply(record);

    EXPECT_FALSE(record.is_blocked);
    EXPECT_FALSE(record.block_reason.has_value());
}

}}
