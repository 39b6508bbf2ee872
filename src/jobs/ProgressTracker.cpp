#include "jobs/ProgressTracker.hpp"
#include "server/Logger.hpp"
#include <algorithm>

namespace salescast {
namespace jobs {

json JobStatus::toJson() const {
    return json{
        {"complete", complete},
        {"progress", progress},
        {"error", error ? json(*error) : json(nullptr)}
    };
}

ProgressTracker& ProgressTracker::instance() {
    static ProgressTracker instance;
    return instance;
}

void ProgressTracker::create(const std::string& jobId) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_jobs.find(jobId);
    if (it != m_jobs.end() && !it->second.complete) {
        throw JobConflictError(jobId);
    }

    TrainingJob job;
    job.jobId = jobId;
    job.createdAt = std::chrono::steady_clock::now();
    m_jobs[jobId] = std::move(job);

    LOG_DEBUG("Created job: " + jobId);
}

TrainingJob* ProgressTracker::findRunning(const std::string& jobId, const char* operation) {
    auto it = m_jobs.find(jobId);
    if (it == m_jobs.end()) {
        LOG_WARN(std::string(operation) + " on unknown job: " + jobId);
        return nullptr;
    }
    if (it->second.complete) {
        LOG_WARN(std::string(operation) + " on finished job: " + jobId);
        return nullptr;
    }
    return &it->second;
}

bool ProgressTracker::update(
    const std::string& jobId,
    int progress,
    size_t groupsProcessed,
    size_t totalGroups
) {
    std::lock_guard<std::mutex> lock(m_mutex);

    TrainingJob* job = findRunning(jobId, "update");
    if (!job) return false;

    job->progress = std::max(job->progress, std::clamp(progress, 0, 100));
    job->groupsProcessed = std::max(job->groupsProcessed, groupsProcessed);
    job->totalGroups = totalGroups;
    return true;
}

bool ProgressTracker::complete(const std::string& jobId, DataFramePtr result, size_t forecastGroups) {
    std::lock_guard<std::mutex> lock(m_mutex);

    TrainingJob* job = findRunning(jobId, "complete");
    if (!job) return false;

    job->result = std::move(result);
    job->forecastGroups = forecastGroups;
    job->groupsProcessed = job->totalGroups;
    job->progress = 100;
    job->finishedAt = std::chrono::steady_clock::now();
    job->complete = true;

    LOG_DEBUG("Job complete: " + jobId);
    return true;
}

bool ProgressTracker::fail(const std::string& jobId, const std::string& error) {
    std::lock_guard<std::mutex> lock(m_mutex);

    TrainingJob* job = findRunning(jobId, "fail");
    if (!job) return false;

    job->error = error;
    job->result.reset();
    job->finishedAt = std::chrono::steady_clock::now();
    job->complete = true;

    LOG_DEBUG("Job failed: " + jobId);
    return true;
}

std::optional<TrainingJob> ProgressTracker::get(const std::string& jobId) const {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_jobs.find(jobId);
    if (it == m_jobs.end()) {
        return std::nullopt;
    }
    return it->second;
}

JobStatus ProgressTracker::status(const std::string& jobId) const {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_jobs.find(jobId);
    if (it == m_jobs.end()) {
        return JobStatus{};
    }
    return it->second.status();
}

DataFramePtr ProgressTracker::result(const std::string& jobId) const {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_jobs.find(jobId);
    if (it == m_jobs.end()) {
        return nullptr;
    }
    return it->second.result;
}

bool ProgressTracker::isRunning(const std::string& jobId) const {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_jobs.find(jobId);
    return it != m_jobs.end() && !it->second.complete;
}

void ProgressTracker::cleanupByAge(std::chrono::minutes maxAge) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto now = std::chrono::steady_clock::now();
    size_t removed = 0;

    for (auto it = m_jobs.begin(); it != m_jobs.end(); ) {
        if (it->second.complete && now - it->second.finishedAt > maxAge) {
            it = m_jobs.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }

    if (removed > 0) {
        LOG_DEBUG("Cleaned up " + std::to_string(removed) + " old jobs");
    }
}

void ProgressTracker::cleanupByCount(size_t maxJobs) {
    std::lock_guard<std::mutex> lock(m_mutex);

    while (m_jobs.size() > maxJobs) {
        auto oldest = m_jobs.end();
        for (auto it = m_jobs.begin(); it != m_jobs.end(); ++it) {
            if (!it->second.complete) continue;  // running jobs are never evicted
            if (oldest == m_jobs.end() || it->second.finishedAt < oldest->second.finishedAt) {
                oldest = it;
            }
        }
        if (oldest == m_jobs.end()) break;

        LOG_DEBUG("Removing oldest job: " + oldest->first);
        m_jobs.erase(oldest);
    }
}

size_t ProgressTracker::jobCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_jobs.size();
}

void ProgressTracker::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_jobs.clear();
}

} // namespace jobs
} // namespace salescast
