#pragma once

#include "jobs/ProgressTracker.hpp"
#include "jobs/TrainingJobRunner.hpp"
#include "summary/DashboardSummary.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace salescast {
namespace server {

using json = nlohmann::json;

/// Route handler result: {HTTP status code, JSON body}
using RouteResult = std::pair<unsigned, json>;

/// Réponse prête à envoyer, indépendante du transport
struct Reply {
    unsigned status = 200;
    std::string contentType;   // vide pour un preflight
    std::string body;
    std::string attachment;    // nom de fichier si téléchargement
};

/**
 * Gestionnaire de requêtes - traite la logique métier
 *
 * Indépendant de Beast: HttpSession ne fait que le transport, le routage
 * et la traduction des erreurs en codes HTTP se font ici.
 */
class RequestHandler {
public:
    RequestHandler(jobs::TrainingJobRunner& runner, jobs::ProgressTracker& tracker,
                   summary::SummaryOptions summaryOptions = {});

    /**
     * Point d'entrée de HttpSession: preflight, téléchargement CSV,
     * routes JSON, 404 et 500. Ne lève jamais d'exception métier.
     */
    Reply handle(const std::string& method, const std::string& target);

    /**
     * Dispatch d'une requête JSON. nullopt si aucune route ne correspond.
     * Le target peut contenir une query string (ignorée).
     */
    std::optional<RouteResult> route(const std::string& method, const std::string& target);

    /// GET /api/forecast/:id/download - CSV brut du résultat, nullopt si absent
    /// (throws InvalidJobIdError)
    std::optional<std::string> forecastCsv(const std::string& jobId);

    // Handlers
    json handleHealth();
    RouteResult handleStartTraining(const std::string& jobId);
    RouteResult handleTrainingStatus(const std::string& jobId);
    RouteResult handleForecast(const std::string& jobId);
    RouteResult handleActivity(const std::string& jobId);
    RouteResult handleSummary(const std::string& jobId);

    /// Décodage %XX et '+' d'un segment d'URL
    static std::string urlDecode(const std::string& value);

    /// "/api/training/a%20b.csv/status" -> {"api", "training", "a b.csv", "status"}
    static std::vector<std::string> splitPath(const std::string& target);

private:
    static json errorBody(const std::string& message);
    static Reply jsonReply(unsigned status, const json& body);
    Reply handleDownload(const std::string& jobId);

    jobs::TrainingJobRunner& m_runner;
    jobs::ProgressTracker& m_tracker;
    summary::DashboardSummary m_summary;
};

} // namespace server
} // namespace salescast
