#pragma once

#include <string>
#include <chrono>
#include <ostream>
#include <cstdint>

namespace fslogger {
namespace common {

// Single-line scan progress for a terminal. Nothing is drawn when stdout is
// not a tty.
class ProgressBarRenderer {
public:
    explicit ProgressBarRenderer(const std::string& label, bool use_colors = true);

    void update(int64_t processed_files, int64_t total_files, int64_t blocked_files,
                const std::string& current_directory);
    void complete();
    void clear();

    void render(std::ostream& out);

    // Keeps the tail of a path so the line fits in width characters.
    static std::string truncatePath(const std::string& path, size_t width);

private:
    std::string label_;
    bool use_colors_;
    bool completed_;

    int64_t processed_files_;
    int64_t total_files_;
    int64_t blocked_files_;
    std::string current_directory_;

    std::chrono::steady_clock::time_point start_time_;

    std::string formatRate(double files_per_sec) const;
    int getTerminalWidth() const;
};

}}
