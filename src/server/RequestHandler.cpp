#include "server/RequestHandler.hpp"
#include "server/Logger.hpp"
#include "server/Profiler.hpp"
#include "cohort/CohortActivityAnalyzer.hpp"
#include "dataframe/DataFrameIO.hpp"
#include "forecast/SalesSchema.hpp"
#include "util/DateUtil.hpp"
#include <sstream>

namespace salescast {
namespace server {

RequestHandler::RequestHandler(jobs::TrainingJobRunner& runner, jobs::ProgressTracker& tracker,
                               summary::SummaryOptions summaryOptions)
    : m_runner(runner)
    , m_tracker(tracker)
    , m_summary(std::move(summaryOptions))
{
}

json RequestHandler::errorBody(const std::string& message) {
    return json{{"status", "error"}, {"message", message}};
}

Reply RequestHandler::jsonReply(unsigned status, const json& body) {
    return Reply{status, "application/json", body.dump(), ""};
}

Reply RequestHandler::handle(const std::string& method, const std::string& target) {
    if (method == "OPTIONS") {
        return Reply{};
    }

    try {
        auto segments = splitPath(target);
        if (method == "GET" && segments.size() == 4 && segments[0] == "api" &&
            segments[1] == "forecast" && segments[3] == "download") {
            return handleDownload(segments[2]);
        }

        if (auto result = route(method, target)) {
            return jsonReply(result->first, result->second);
        }
        return jsonReply(404, errorBody("Endpoint not found: " + method + " " + target));
    } catch (const std::exception& e) {
        LOG_ERROR("Request failed: " + method + " " + target + ": " + e.what());
        return jsonReply(500, errorBody(e.what()));
    }
}

Reply RequestHandler::handleDownload(const std::string& jobId) {
    std::optional<std::string> csv;
    try {
        csv = forecastCsv(jobId);
    } catch (const jobs::InvalidJobIdError& e) {
        return jsonReply(400, errorBody(e.what()));
    }
    if (!csv) {
        return jsonReply(404, errorBody("No forecast available for " + jobId));
    }
    return Reply{200, "text/csv; charset=utf-8", std::move(*csv), "forecast_" + jobId + ".csv"};
}

std::string RequestHandler::urlDecode(const std::string& value) {
    auto hexValue = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };

    std::string out;
    out.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        char c = value[i];
        if (c == '%' && i + 2 < value.size()) {
            int hi = hexValue(value[i + 1]);
            int lo = hexValue(value[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out += static_cast<char>(hi * 16 + lo);
                i += 2;
                continue;
            }
        }
        out += (c == '+') ? ' ' : c;
    }
    return out;
}

std::vector<std::string> RequestHandler::splitPath(const std::string& target) {
    std::string path = target.substr(0, target.find('?'));

    std::vector<std::string> segments;
    size_t pos = 0;
    while (pos <= path.size()) {
        size_t slash = path.find('/', pos);
        if (slash == std::string::npos) slash = path.size();
        if (slash > pos) {
            segments.push_back(urlDecode(path.substr(pos, slash - pos)));
        }
        pos = slash + 1;
    }
    return segments;
}

std::optional<RouteResult> RequestHandler::route(const std::string& method, const std::string& target) {
    auto segments = splitPath(target);
    if (segments.size() < 2 || segments[0] != "api") {
        return std::nullopt;
    }

    // GET /api/health
    if (method == "GET" && segments.size() == 2 && segments[1] == "health") {
        return RouteResult{200, handleHealth()};
    }

    // /api/training/:id/start, /api/training/:id/status
    if (segments.size() == 4 && segments[1] == "training") {
        if (method == "POST" && segments[3] == "start") {
            return handleStartTraining(segments[2]);
        }
        if (method == "GET" && segments[3] == "status") {
            return handleTrainingStatus(segments[2]);
        }
    }

    // GET /api/forecast/:id
    if (method == "GET" && segments.size() == 3 && segments[1] == "forecast") {
        return handleForecast(segments[2]);
    }

    // GET /api/activity/:id
    if (method == "GET" && segments.size() == 3 && segments[1] == "activity") {
        return handleActivity(segments[2]);
    }

    // GET /api/summary/:id
    if (method == "GET" && segments.size() == 3 && segments[1] == "summary") {
        return handleSummary(segments[2]);
    }

    return std::nullopt;
}

json RequestHandler::handleHealth() {
    json body{
        {"status", "ok"},
        {"service", "SalesCast"},
        {"version", "1.0.0"},
        {"uploads_dir", m_runner.options().uploadsDir},
        {"jobs", m_tracker.jobCount()}
    };
    if (Profiler::instance().isEnabled()) {
        body["timings"] = Profiler::instance().toJson();
    }
    return body;
}

RouteResult RequestHandler::handleStartTraining(const std::string& jobId) {
    try {
        m_runner.start(jobId);
        return {200, json{{"status", "started"}}};
    } catch (const jobs::InvalidJobIdError& e) {
        return {400, errorBody(e.what())};
    } catch (const jobs::DatasetNotFoundError& e) {
        LOG_WARN(e.what());
        return {404, errorBody(e.what())};
    } catch (const forecast::SchemaError& e) {
        LOG_WARN("Rejected " + jobId + ": " + e.what());
        return {422, errorBody(e.what())};
    } catch (const jobs::JobConflictError& e) {
        LOG_WARN(e.what());
        return {409, errorBody(e.what())};
    }
}

RouteResult RequestHandler::handleTrainingStatus(const std::string& jobId) {
    try {
        jobs::TrainingJobRunner::validateJobId(jobId);
    } catch (const jobs::InvalidJobIdError& e) {
        return {400, errorBody(e.what())};
    }
    return {200, m_tracker.status(jobId).toJson()};
}

RouteResult RequestHandler::handleForecast(const std::string& jobId) {
    DataFramePtr result;
    try {
        result = m_runner.loadResult(jobId);
    } catch (const jobs::InvalidJobIdError& e) {
        return {400, errorBody(e.what())};
    }

    if (!result) {
        return {404, errorBody("No forecast available for " + jobId)};
    }

    ScopedTimer timer("serializeForecast");
    return {200, json{
        {"status", "ok"},
        {"rows", result->rowCount()},
        {"forecast", result->toJson()}
    }};
}

std::optional<std::string> RequestHandler::forecastCsv(const std::string& jobId) {
    auto result = m_runner.loadResult(jobId);
    if (!result) {
        return std::nullopt;
    }
    std::ostringstream oss;
    DataFrameIO::writeCSV(*result, oss);
    return oss.str();
}

RouteResult RequestHandler::handleActivity(const std::string& jobId) {
    try {
        auto sales = m_runner.loadDataset(jobId);
        auto activity = cohort::CohortActivityAnalyzer::analyze(*sales);
        return {200, json{
            {"status", "ok"},
            {"quarterly_activity", cohort::CohortActivityAnalyzer::toJson(activity)}
        }};
    } catch (const jobs::InvalidJobIdError& e) {
        return {400, errorBody(e.what())};
    } catch (const jobs::DatasetNotFoundError& e) {
        return {404, errorBody(e.what())};
    } catch (const forecast::SchemaError& e) {
        return {422, errorBody(e.what())};
    } catch (const DateParseError& e) {
        return {422, errorBody(e.what())};
    }
}

RouteResult RequestHandler::handleSummary(const std::string& jobId) {
    try {
        auto sales = m_runner.loadDataset(jobId);
        return {200, json{
            {"status", "ok"},
            {"summary", m_summary.summarize(*sales).toJson()}
        }};
    } catch (const jobs::InvalidJobIdError& e) {
        return {400, errorBody(e.what())};
    } catch (const jobs::DatasetNotFoundError& e) {
        return {404, errorBody(e.what())};
    } catch (const forecast::SchemaError& e) {
        return {422, errorBody(e.what())};
    }
}

} // namespace server
} // namespace salescast
