#pragma once

#include "main_command.hpp"
#include "fslogger/common/types.hpp"
#include "fslogger/scan/scan_registry.hpp"
#include <CLI/CLI.hpp>
#include <string>
#include <vector>

namespace fslogger {
namespace cli {

// Exit codes: 0 nothing blocked and no errors, 1 blocked entries or errors,
// 2 the scan could not run.
class ScanCommand : public MainCommand {
public:
    ScanCommand();

    void setup(CLI::App* subcommand);
    bool wasCalled() const;
    int execute();

    bool validateArguments() const override;

    // Applies command line overrides on top of the configured defaults
    common::ScanConfiguration buildConfiguration(const common::ScanConfiguration& base) const;

    static int exitCodeFor(const common::ScanResult& result);

private:
    bool was_called_;
    std::string target_path_;
    bool recursive_ = false;
    bool no_recursive_ = false;
    int workers_ = 0;
    int queue_capacity_ = 0;
    int traversal_threads_ = -1;
    int64_t max_file_size_ = 0;
    std::vector<std::string> allowed_types_;
    std::vector<std::string> blocked_patterns_;
    bool export_ = false;
    std::string export_filename_;
    bool no_progress_ = false;
    bool json_output_ = false;
    bool quiet_ = false;
    bool list_all_ = false;

    bool shouldShowProgress() const;
    int waitForCompletion(scan::ScanRegistry& registry, const std::string& id);
};

}}
