#pragma once

#include "forecast/ForecastPipeline.hpp"
#include "jobs/TrainingJobRunner.hpp"
#include "summary/DashboardSummary.hpp"
#include "server/Logger.hpp"
#include <map>
#include <optional>
#include <stdexcept>
#include <string>

namespace salescast {
namespace config {

/**
 * Valeur de configuration invalide (clé inconnue, nombre mal formé, ...)
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error(message) {}
};

enum class RunMode {
    Server,
    Forecast,   // --forecast FILE [--out CSV]
    Activity,   // --activity FILE [--out CSV]
    Summary,    // --summary FILE
    Help
};

/**
 * Paramètres de l'application
 *
 * Sources, par priorité croissante: valeurs par défaut, fichier --config
 * (lignes key=value), options de la ligne de commande.
 */
struct AppConfig {
    // server
    std::string address = "0.0.0.0";
    unsigned short port = 8080;
    std::string uploadsDir = "uploads";

    // log
    server::LogLevel logLevel = server::LogLevel::INFO;
    std::string logFile;
    bool enableProfiler = true;

    // forecast
    forecast::PipelineOptions pipeline;

    // job
    int jobTimeoutSeconds = 0;

    // summary
    summary::SummaryOptions summary;

    // one-shot modes
    RunMode mode = RunMode::Server;
    std::string inputFile;
    std::string outputFile;
    std::string configFile;

    /// Applique une clé du fichier de config (throws ConfigError)
    void set(const std::string& key, const std::string& value);

    /// Lit un fichier key=value ('#' commentaires, préfixe '@' accepté)
    void loadFile(const std::string& path);

    jobs::JobRunnerOptions runnerOptions() const;

    /**
     * Parse argv. Le fichier --config est appliqué avant les autres options,
     * quelle que soit sa position.
     */
    static AppConfig fromCommandLine(int argc, const char* const argv[]);

    /// Paires key=value d'un fichier de config, sans interprétation
    static std::map<std::string, std::string> parseFile(const std::string& path);

    static std::string usage(const std::string& program);
};

} // namespace config
} // namespace salescast
