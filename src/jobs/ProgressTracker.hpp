#pragma once

#include "dataframe/DataFrame.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace salescast {
namespace jobs {

using json = nlohmann::json;

/**
 * A job with this id is still running
 */
class JobConflictError : public std::runtime_error {
public:
    explicit JobConflictError(const std::string& jobId)
        : std::runtime_error("Training already in progress for '" + jobId + "'") {}
};

/**
 * What a polling client sees
 */
struct JobStatus {
    bool complete = false;
    int progress = 0;
    std::optional<std::string> error;

    json toJson() const;
};

/**
 * State of one training job
 */
struct TrainingJob {
    std::string jobId;
    int progress = 0;                   // 0-100, never decreases
    bool complete = false;
    std::optional<std::string> error;
    size_t groupsProcessed = 0;
    size_t totalGroups = 0;
    size_t forecastGroups = 0;
    DataFramePtr result;                // successful jobs only
    std::chrono::steady_clock::time_point createdAt;
    std::chrono::steady_clock::time_point finishedAt;

    JobStatus status() const { return JobStatus{complete, progress, error}; }
};

/**
 * Registry of training jobs: job id -> TrainingJob
 *
 * One worker writes a given job, any number of clients read it. Every
 * operation takes the registry mutex, so readers always get a consistent
 * copy. Once a job is complete, further update/complete/fail calls on it
 * are ignored until the id is created again.
 */
class ProgressTracker {
public:
    ProgressTracker() = default;
    ProgressTracker(const ProgressTracker&) = delete;
    ProgressTracker& operator=(const ProgressTracker&) = delete;

    /// Process-wide registry used by the HTTP server
    static ProgressTracker& instance();

    /**
     * Starts (or restarts) a job at progress 0.
     * Throws JobConflictError if the id is still running.
     */
    void create(const std::string& jobId);

    /// Records progress after a group; lower values than the current one are ignored
    bool update(const std::string& jobId, int progress, size_t groupsProcessed, size_t totalGroups);

    /// Success: progress forced to 100, result kept
    bool complete(const std::string& jobId, DataFramePtr result, size_t forecastGroups = 0);

    /// Failure: error set, progress left as is, partial result dropped
    bool fail(const std::string& jobId, const std::string& error);

    std::optional<TrainingJob> get(const std::string& jobId) const;

    /// Unknown ids read as {complete: false, progress: 0, error: null}
    JobStatus status(const std::string& jobId) const;

    DataFramePtr result(const std::string& jobId) const;

    bool isRunning(const std::string& jobId) const;

    /// Removes finished jobs older than maxAge
    void cleanupByAge(std::chrono::minutes maxAge = std::chrono::minutes(60));

    /// Removes the oldest finished jobs until at most maxJobs remain
    void cleanupByCount(size_t maxJobs = 50);

    size_t jobCount() const;

    void clear();

private:
    TrainingJob* findRunning(const std::string& jobId, const char* operation);

    std::unordered_map<std::string, TrainingJob> m_jobs;
    mutable std::mutex m_mutex;
};

} // namespace jobs
} // namespace salescast
