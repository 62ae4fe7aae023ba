#include "fslogger/common/progress_bar.hpp"
#include <sstream>
#include <iostream>
#include <iomanip>
#include <algorithm>
#include <sys/ioctl.h>
#include <unistd.h>

namespace fslogger {
namespace common {

ProgressBarRenderer::ProgressBarRenderer(const std::string& label, bool use_colors)
    : label_(label),
      use_colors_(use_colors),
      completed_(false),
      processed_files_(0),
      total_files_(0),
      blocked_files_(0) {
    start_time_ = std::chrono::steady_clock::now();
}

void ProgressBarRenderer::update(int64_t processed_files, int64_t total_files, int64_t blocked_files,
                                 const std::string& current_directory) {
    processed_files_ = processed_files;
    total_files_ = total_files;
    blocked_files_ = blocked_files;
    current_directory_ = current_directory;
}

void ProgressBarRenderer::complete() {
    completed_ = true;
}

void ProgressBarRenderer::clear() {
    if (!isatty(STDOUT_FILENO)) return;
    std::cout << "\r\033[K" << std::flush;
}

void ProgressBarRenderer::render(std::ostream& out) {
    if (!isatty(STDOUT_FILENO) && !completed_) {
        return;
    }

    if (completed_) {
        out << "\r\033[K";
        return;
    }

    std::ostringstream oss;
    oss << "\r\033[K";

    if (use_colors_) {
        oss << "\033[36m";
    }

    // totals keep growing while traversal runs, so the bar may move backwards
    double progress = total_files_ > 0
        ? std::min(1.0, static_cast<double>(processed_files_) / total_files_)
        : 0.0;
    int percent = static_cast<int>(progress * 100);

    int bar_width = 20;
    int filled = static_cast<int>(bar_width * progress);

    oss << label_ << ": [";
    for (int i = 0; i < bar_width; ++i) {
        if (i < filled) {
            oss << "=";
        } else if (i == filled) {
            oss << ">";
        } else {
            oss << " ";
        }
    }
    oss << "] " << percent << "% ";

    if (use_colors_) {
        oss << "\033[0m";
    }

    oss << "(" << processed_files_ << "/" << total_files_ << " files";
    if (blocked_files_ > 0) {
        oss << ", " << blocked_files_ << " blocked";
    }
    oss << ")";

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time_);
    if (elapsed.count() > 0 && processed_files_ > 0) {
        oss << " @ " << formatRate(processed_files_ / (elapsed.count() / 1000.0));
    }

    std::string line = oss.str();
    int width = getTerminalWidth();
    // escape sequences do not take up columns
    size_t visible = line.size() - (use_colors_ ? 13 : 4);
    if (!current_directory_.empty() && static_cast<int>(visible) + 4 < width) {
        line += " " + truncatePath(current_directory_, static_cast<size_t>(width) - visible - 2);
    }

    out << line << std::flush;
}

std::string ProgressBarRenderer::truncatePath(const std::string& path, size_t width) {
    if (path.size() <= width) {
        return path;
    }
    if (width <= 3) {
        return path.substr(path.size() - width);
    }
    return "..." + path.substr(path.size() - (width - 3));
}

std::string ProgressBarRenderer::formatRate(double files_per_sec) const {
    std::ostringstream oss;

    if (files_per_sec < 1000) {
        oss << std::fixed << std::setprecision(0) << files_per_sec << " files/s";
    } else {
        oss << std::fixed << std::setprecision(1) << (files_per_sec / 1000.0) << "k files/s";
    }

    return oss.str();
}

int ProgressBarRenderer::getTerminalWidth() const {
    struct winsize w;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0) {
        return w.ws_col;
    }
    return 80;
}

}}
