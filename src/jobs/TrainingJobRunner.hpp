#pragma once

#include "jobs/ProgressTracker.hpp"
#include "forecast/ForecastPipeline.hpp"
#include "dataframe/DataFrame.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>

namespace salescast {
namespace jobs {

/**
 * Aucun fichier de ventes pour ce job dans le répertoire d'uploads
 */
class DatasetNotFoundError : public std::runtime_error {
public:
    explicit DatasetNotFoundError(const std::string& path)
        : std::runtime_error("Dataset not found: " + path) {}
};

/**
 * Identifiant de job refusé (vide, séparateur de chemin, "..")
 */
class InvalidJobIdError : public std::invalid_argument {
public:
    explicit InvalidJobIdError(const std::string& jobId)
        : std::invalid_argument("Invalid job id: '" + jobId + "'") {}
};

struct JobRunnerOptions {
    std::string uploadsDir = "uploads";
    forecast::PipelineOptions pipeline;
    std::chrono::seconds timeout{0};   // 0 = unlimited
    size_t maxRetainedJobs = 50;
};

/**
 * Lance les entraînements en arrière-plan, un thread par job
 *
 * start() fait tout ce qui peut échouer immédiatement (id, fichier, schéma,
 * conflit) dans le thread appelant; le worker n'exécute que le pipeline.
 * Le worker consulte un drapeau d'arrêt et le budget de temps entre deux
 * groupes. shutdown() lève le drapeau et joint tous les workers.
 */
class TrainingJobRunner {
public:
    TrainingJobRunner(ProgressTracker& tracker, JobRunnerOptions options);
    ~TrainingJobRunner();

    TrainingJobRunner(const TrainingJobRunner&) = delete;
    TrainingJobRunner& operator=(const TrainingJobRunner&) = delete;

    /**
     * Charge <uploadsDir>/<jobId> et démarre l'entraînement.
     * Throws InvalidJobIdError, DatasetNotFoundError, SchemaError,
     * JobConflictError.
     */
    void start(const std::string& jobId);

    /// Même chose avec une table déjà chargée
    void start(const std::string& jobId, DataFramePtr sales);

    /// Bloque jusqu'à la fin du worker du job (no-op si aucun)
    void wait(const std::string& jobId);

    /// Annule les jobs en cours et joint tous les workers
    void shutdown();

    bool isStopping() const { return m_stopping; }

    /// Workers pas encore joints (en cours ou terminés depuis le dernier start)
    size_t workerCount() const;

    std::string datasetPath(const std::string& jobId) const;
    std::string resultPath(const std::string& jobId) const;

    /// Résultat en mémoire, sinon forecast_<id>.csv déjà écrit.
    /// nullptr si aucun, si le job tourne ou si sa dernière exécution a échoué.
    DataFramePtr loadResult(const std::string& jobId) const;

    /// Charge la table de ventes d'un job (throws DatasetNotFoundError)
    DataFramePtr loadDataset(const std::string& jobId) const;

    const JobRunnerOptions& options() const { return m_options; }

    static void validateJobId(const std::string& jobId);

private:
    void runJob(const std::string& jobId, DataFramePtr sales, std::shared_ptr<std::atomic<bool>> done);

    ProgressTracker& m_tracker;
    JobRunnerOptions m_options;
    forecast::ForecastPipeline m_pipeline;

    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    // Joint les workers terminés (appelé sous m_workersMutex)
    void reapFinishedWorkers();

    std::atomic<bool> m_stopping{false};
    mutable std::mutex m_workersMutex;
    std::unordered_map<std::string, Worker> m_workers;
};

} // namespace jobs
} // namespace salescast
