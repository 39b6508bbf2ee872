#include "jobs/TrainingJobRunner.hpp"
#include "dataframe/DataFrameIO.hpp"
#include "forecast/SalesSchema.hpp"
#include "server/Logger.hpp"
#include "server/Profiler.hpp"
#include <filesystem>

namespace salescast {
namespace jobs {

namespace fs = std::filesystem;
using server::ScopedTimer;

namespace {

class JobAbortedError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // anonymous namespace

TrainingJobRunner::TrainingJobRunner(ProgressTracker& tracker, JobRunnerOptions options)
    : m_tracker(tracker)
    , m_options(std::move(options))
    , m_pipeline(m_options.pipeline)
{
}

TrainingJobRunner::~TrainingJobRunner() {
    shutdown();
}

void TrainingJobRunner::validateJobId(const std::string& jobId) {
    if (jobId.empty() || jobId == "." || jobId == ".." ||
        jobId.find('/') != std::string::npos || jobId.find('\\') != std::string::npos) {
        throw InvalidJobIdError(jobId);
    }
}

std::string TrainingJobRunner::datasetPath(const std::string& jobId) const {
    return (fs::path(m_options.uploadsDir) / jobId).string();
}

std::string TrainingJobRunner::resultPath(const std::string& jobId) const {
    return (fs::path(m_options.uploadsDir) / ("forecast_" + jobId + ".csv")).string();
}

DataFramePtr TrainingJobRunner::loadDataset(const std::string& jobId) const {
    validateJobId(jobId);

    std::string path = datasetPath(jobId);
    if (!fs::is_regular_file(path)) {
        throw DatasetNotFoundError(path);
    }

    ScopedTimer timer("loadDataset");
    auto df = DataFrameIO::readCSV(path);
    double duration = timer.stop();

    LOG_INFO("Dataset loaded: " + path + " (" + std::to_string(df->rowCount()) + " rows in " +
             std::to_string(static_cast<int>(duration)) + "ms)");
    return df;
}

DataFramePtr TrainingJobRunner::loadResult(const std::string& jobId) const {
    validateJobId(jobId);

    if (auto job = m_tracker.get(jobId)) {
        if (!job->complete || job->error) {
            return nullptr;
        }
        if (job->result) {
            return job->result;
        }
    }

    std::string path = resultPath(jobId);
    if (!fs::is_regular_file(path)) {
        return nullptr;
    }
    return DataFrameIO::readCSV(path);
}

void TrainingJobRunner::start(const std::string& jobId) {
    validateJobId(jobId);

    // Conflit détecté avant de charger un fichier potentiellement gros
    if (m_tracker.isRunning(jobId)) {
        throw JobConflictError(jobId);
    }

    start(jobId, loadDataset(jobId));
}

void TrainingJobRunner::start(const std::string& jobId, DataFramePtr sales) {
    validateJobId(jobId);

    if (!sales) {
        throw std::invalid_argument("No sales table for job " + jobId);
    }
    forecast::SalesSchema::validate(*sales);

    std::lock_guard<std::mutex> lock(m_workersMutex);

    if (m_stopping) {
        throw std::runtime_error("Job runner is shutting down");
    }

    m_tracker.create(jobId);
    reapFinishedWorkers();

    // L'ancien worker de cet id a fini son job (create aurait levé sinon)
    auto it = m_workers.find(jobId);
    if (it != m_workers.end()) {
        if (it->second.thread.joinable()) it->second.thread.join();
        m_workers.erase(it);
    }

    auto done = std::make_shared<std::atomic<bool>>(false);
    std::thread thread(&TrainingJobRunner::runJob, this, jobId, std::move(sales), done);
    m_workers.emplace(jobId, Worker{std::move(thread), std::move(done)});
    LOG_INFO("Training started: " + jobId);

    m_tracker.cleanupByCount(m_options.maxRetainedJobs);
}

void TrainingJobRunner::reapFinishedWorkers() {
    for (auto it = m_workers.begin(); it != m_workers.end();) {
        if (*it->second.done) {
            if (it->second.thread.joinable()) it->second.thread.join();
            it = m_workers.erase(it);
        } else {
            ++it;
        }
    }
}

size_t TrainingJobRunner::workerCount() const {
    std::lock_guard<std::mutex> lock(m_workersMutex);
    return m_workers.size();
}

void TrainingJobRunner::runJob(const std::string& jobId, DataFramePtr sales,
                               std::shared_ptr<std::atomic<bool>> done) {
    server::Logger::Context logContext("job " + jobId);
    auto startedAt = std::chrono::steady_clock::now();
    const auto timeout = m_options.timeout;

    auto onProgress = [&](const forecast::PipelineProgress& progress) {
        m_tracker.update(jobId, progress.percent, progress.groupsProcessed, progress.totalGroups);

        if (m_stopping) {
            throw JobAbortedError("Training cancelled: server shutting down");
        }
        if (timeout.count() > 0 && std::chrono::steady_clock::now() - startedAt > timeout) {
            throw JobAbortedError("Training timed out after " + std::to_string(timeout.count()) + " s");
        }
    };

    try {
        ScopedTimer timer("job");

        forecast::PipelineResult result = m_pipeline.run(*sales, onProgress);

        std::string path = resultPath(jobId);
        DataFrameIO::writeCSV(*result.table, path);

        double duration = timer.stop();
        LOG_INFO("Training complete -> " + path + " (" +
                 std::to_string(static_cast<int>(duration)) + "ms)");

        m_tracker.complete(jobId, result.table, result.forecastGroups);
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Training failed: ") + e.what());

        // Le résultat d'une exécution précédente ne doit plus être servi
        std::error_code ec;
        fs::remove(resultPath(jobId), ec);
        if (ec) {
            LOG_WARN("Cannot remove stale result " + resultPath(jobId) + ": " + ec.message());
        }
        m_tracker.fail(jobId, e.what());
    }
    *done = true;
}

void TrainingJobRunner::wait(const std::string& jobId) {
    std::thread worker;
    {
        std::lock_guard<std::mutex> lock(m_workersMutex);
        auto it = m_workers.find(jobId);
        if (it == m_workers.end()) return;
        worker = std::move(it->second.thread);
        m_workers.erase(it);
    }
    if (worker.joinable()) worker.join();
}

void TrainingJobRunner::shutdown() {
    m_stopping = true;

    std::unordered_map<std::string, Worker> workers;
    {
        std::lock_guard<std::mutex> lock(m_workersMutex);
        workers.swap(m_workers);
    }

    if (!workers.empty()) {
        LOG_INFO("Waiting for " + std::to_string(workers.size()) + " training workers");
    }
    for (auto& [jobId, worker] : workers) {
        if (worker.thread.joinable()) worker.thread.join();
    }
}

} // namespace jobs
} // namespace salescast
