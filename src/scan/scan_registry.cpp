#include "fslogger/scan/scan_registry.hpp"
#include "fslogger/scan/error_codes.hpp"
#include "fslogger/common/logger.hpp"
#include <chrono>

namespace fslogger {
namespace scan {

ScanRegistry::~ScanRegistry() {
    std::map<std::string, std::shared_ptr<Job>> jobs;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        jobs.swap(jobs_);
    }

    for (auto& [id, job] : jobs) {
        if (job->future.valid() &&
            job->future.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
            common::Logger::instance().debug("[Registry] Cancelling on shutdown | id={}", id);
            job->scanner->cancel();
        }
        if (job->future.valid()) {
            job->future.wait();
        }
    }
}

bool ScanRegistry::start(const std::string& path, const common::ScanConfiguration& config) {
    if (path.empty()) {
        throw ScanError(ScanErrorCode::EMPTY_PATH, "", common::ErrorContext{"Registry", {}, std::nullopt});
    }

    std::lock_guard<std::mutex> lock(mutex_);

    auto it = jobs_.find(path);
    if (it != jobs_.end()) {
        refresh(*it->second);
        if (it->second->state == JobState::RUNNING) {
            common::Logger::instance().warn("[Registry] Scan already running | id={}", path);
            return false;
        }
    }

    auto job = std::make_shared<Job>();
    job->scanner = std::make_shared<Scanner>(config);

    auto scanner = job->scanner;
    job->future = std::async(std::launch::async, [scanner, path] {
        return scanner->scan(path);
    }).share();

    jobs_[path] = job;
    common::Logger::instance().info("[Registry] Scan started | id={}", path);
    return true;
}

void ScanRegistry::refresh(Job& job) {
    if (job.state != JobState::RUNNING) {
        return;
    }
    if (job.future.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
        return;
    }

    try {
        job.result = job.future.get();
        job.state = JobState::COMPLETED;
    } catch (const ScanError& e) {
        job.state = JobState::ERROR;
        job.error = e.what();
        common::Logger::instance().error("[Registry] Scan failed | code={} | error={} | {}",
                                        ScanErrorCodeHelper::toString(e.code()), e.what(),
                                        common::formatContext(e.context()));
    } catch (const std::exception& e) {
        job.state = JobState::ERROR;
        job.error = e.what();
        common::Logger::instance().error("[Registry] Scan failed | error={}", e.what());
    }
}

ScanStatus ScanRegistry::describe(const Job& job) {
    ScanStatus status;
    status.state = job.state;

    switch (job.state) {
        case JobState::RUNNING:
            status.progress = job.scanner->progress();
            break;
        case JobState::COMPLETED:
            status.result = job.result;
            if (job.result) {
                status.progress = job.result->progress;
            }
            break;
        case JobState::ERROR:
            status.error = job.error;
            break;
        case JobState::NOT_FOUND:
            break;
    }
    return status;
}

ScanStatus ScanRegistry::status(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        return ScanStatus{};
    }

    refresh(*it->second);
    return describe(*it->second);
}

ScanStatus ScanRegistry::wait(const std::string& id) {
    std::shared_ptr<Job> job;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = jobs_.find(id);
        if (it == jobs_.end()) {
            return ScanStatus{};
        }
        job = it->second;
    }

    job->future.wait();

    std::lock_guard<std::mutex> lock(mutex_);
    refresh(*job);
    return describe(*job);
}

bool ScanRegistry::cancel(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        return false;
    }

    refresh(*it->second);
    if (it->second->state != JobState::RUNNING) {
        return false;
    }

    it->second->scanner->cancel();
    return true;
}

std::vector<std::string> ScanRegistry::ids() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> result;
    result.reserve(jobs_.size());
    for (const auto& [id, job] : jobs_) {
        result.push_back(id);
    }
    return result;
}

std::string to_string(JobState state) {
    switch (state) {
        case JobState::RUNNING: return "running";
        case JobState::COMPLETED: return "completed";
        case JobState::ERROR: return "error";
        case JobState::NOT_FOUND: return "not_found";
        default: return "unknown";
    }
}

}}
