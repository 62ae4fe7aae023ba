#pragma once

#include <filesystem>
#include <fstream>
#include <random>
#include <stdexcept>
#include <string>
#include <system_error>
#include <unistd.h>

namespace fslogger {
namespace tests {

// Unique directory under the system temp dir, removed with its content.
class TempDir {
public:
    TempDir() {
        auto base = std::filesystem::temp_directory_path();
        std::random_device rd;
        for (int attempt = 0; attempt < 100; ++attempt) {
            auto candidate = base / ("fslogger_test_" + std::to_string(getpid()) + "_" + std::to_string(rd()));
            std::error_code ec;
            if (std::filesystem::create_directory(candidate, ec)) {
                path_ = candidate;
                return;
            }
        }
        throw std::runtime_error("unable to create temporary directory");
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

    std::filesystem::path operator/(const std::string& relative) const {
        return path_ / relative;
    }

private:
    std::filesystem::path path_;
};

// Restores owner permissions so the tree can be removed afterwards
class PermissionGuard {
public:
    PermissionGuard(std::filesystem::path path, std::filesystem::perms revoked_to)
        : path_(std::move(path)) {
        std::filesystem::permissions(path_, revoked_to);
    }

    ~PermissionGuard() {
        std::error_code ec;
        std::filesystem::permissions(path_, std::filesystem::perms::owner_all, ec);
    }

private:
    std::filesystem::path path_;
};

inline void writeFile(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out << content;
}

inline void writeFileOfSize(const std::filesystem::path& path, size_t size, char fill = 'a') {
    writeFile(path, std::string(size, fill));
}

// small.txt (100 B), large.txt (5 MiB), subdir/test.txt (200 B)
inline void buildBasicTree(const std::filesystem::path& root) {
    writeFileOfSize(root / "small.txt", 100);
    writeFileOfSize(root / "large.txt", 5 * 1024 * 1024);
    writeFileOfSize(root / "subdir" / "test.txt", 200);
}

inline bool runningAsRoot() {
    return geteuid() == 0;
}

}}
