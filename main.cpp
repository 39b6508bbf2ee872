#include "server/HttpServer.hpp"
#include "server/RequestHandler.hpp"
#include "server/Logger.hpp"
#include "server/Profiler.hpp"
#include "config/AppConfig.hpp"
#include "cohort/CohortActivityAnalyzer.hpp"
#include "summary/DashboardSummary.hpp"
#include "dataframe/DataFrameIO.hpp"
#include "forecast/ForecastPipeline.hpp"
#include "jobs/ProgressTracker.hpp"
#include "jobs/TrainingJobRunner.hpp"
#include <filesystem>
#include <iostream>

using namespace salescast;
using namespace salescast::server;

namespace {

int runForecast(const config::AppConfig& cfg) {
    LOG_INFO("Loading " + cfg.inputFile);
    auto sales = DataFrameIO::readCSV(cfg.inputFile);

    forecast::ForecastPipeline pipeline(cfg.pipeline);
    auto result = pipeline.run(*sales, [](const forecast::PipelineProgress& progress) {
        LOG_DEBUG("Progress: " + std::to_string(progress.percent) + "% (" +
                  std::to_string(progress.groupsProcessed) + "/" +
                  std::to_string(progress.totalGroups) + ")");
    });

    std::string output = cfg.outputFile;
    if (output.empty()) {
        std::filesystem::path input(cfg.inputFile);
        output = (input.parent_path() / ("forecast_" + input.filename().string() + ".csv")).string();
    }
    DataFrameIO::writeCSV(*result.table, output);

    std::cout << "Scheme: " << forecast::SalesSchema::schemeName(result.scheme) << "\n"
              << "Groups: " << result.totalGroups << " (" << result.forecastGroups << " forecast, "
              << result.skippedGroups << " skipped)\n"
              << "Rows: " << result.table->rowCount() << "\n"
              << "Output: " << output << std::endl;

    if (Profiler::instance().isEnabled()) {
        std::cerr << Profiler::instance().formatStats() << std::endl;
    }
    return 0;
}

int runActivity(const config::AppConfig& cfg) {
    auto sales = DataFrameIO::readCSV(cfg.inputFile);
    auto activity = cohort::CohortActivityAnalyzer::analyze(*sales);

    if (!cfg.outputFile.empty()) {
        DataFrameIO::writeCSV(*cohort::CohortActivityAnalyzer::toDataFrame(activity), cfg.outputFile);
        LOG_INFO("Quarterly activity written to " + cfg.outputFile);
    }

    std::cout << cohort::CohortActivityAnalyzer::toJson(activity).dump(2) << std::endl;
    return 0;
}

int runSummary(const config::AppConfig& cfg) {
    auto sales = DataFrameIO::readCSV(cfg.inputFile);
    summary::DashboardSummary dashboard(cfg.summary);
    std::cout << dashboard.summarize(*sales).toJson().dump(2) << std::endl;
    return 0;
}

int runServer(const config::AppConfig& cfg) {
    std::cout << "=== SalesCast ===" << std::endl;
    std::cout << std::endl;

    std::filesystem::create_directories(cfg.uploadsDir);
    LOG_INFO("Uploads directory: " + cfg.uploadsDir);

    auto& tracker = jobs::ProgressTracker::instance();
    jobs::TrainingJobRunner runner(tracker, cfg.runnerOptions());
    RequestHandler handler(runner, tracker, cfg.summary);

    // Créer le contexte IO
    net::io_context ioc{1};

    // Créer et démarrer le serveur
    HttpServer server(ioc, cfg.address, cfg.port, handler);
    server.run();

    // Gérer le signal d'arrêt
    net::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const beast::error_code& ec, int /*signal*/) {
        if (ec) return;
        LOG_INFO("Shutting down...");

        server.stop();
        ioc.stop();
    });

    std::cout << "Listening on http://" << cfg.address << ":" << server.port() << std::endl;
    std::cout << std::endl;
    std::cout << "Endpoints:" << std::endl;
    std::cout << "  GET  /api/health                 - Health check" << std::endl;
    std::cout << "  POST /api/training/:id/start     - Start forecasting <uploads>/<id>" << std::endl;
    std::cout << "  GET  /api/training/:id/status    - Training progress" << std::endl;
    std::cout << "  GET  /api/forecast/:id           - Forecast result (JSON)" << std::endl;
    std::cout << "  GET  /api/forecast/:id/download  - Forecast result (CSV)" << std::endl;
    std::cout << "  GET  /api/activity/:id           - Quarterly customer activity" << std::endl;
    std::cout << "  GET  /api/summary/:id            - Top customers, cities, items, salespeople" << std::endl;
    std::cout << std::endl;
    std::cout << "Press Ctrl+C to stop" << std::endl;
    std::cout << std::endl;

    // Lancer la boucle d'événements
    ioc.run();

    // Les jobs en cours sont annulés entre deux groupes
    runner.shutdown();

    // Afficher les stats du profiler
    if (Profiler::instance().isEnabled()) {
        std::cout << Profiler::instance().formatStats() << std::endl;
    }
    return 0;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        auto cfg = config::AppConfig::fromCommandLine(argc, argv);

        if (cfg.mode == config::RunMode::Help) {
            std::cout << config::AppConfig::usage(argv[0]);
            return 0;
        }

        // Configure Logger
        auto& logger = Logger::instance();
        logger.setLevel(cfg.logLevel);
        if (cfg.mode != config::RunMode::Server) {
            logger.setOutputStream(&std::cerr);  // stdout réservé au résultat
        }
        if (!cfg.logFile.empty()) {
            logger.enableFileLogging(cfg.logFile);
        }
        if (!cfg.configFile.empty()) {
            LOG_INFO("Loaded app parameters from " + cfg.configFile);
        }

        // Configure Profiler
        Profiler::instance().setEnabled(cfg.enableProfiler);

        switch (cfg.mode) {
            case config::RunMode::Forecast:
                return runForecast(cfg);
            case config::RunMode::Activity:
                return runActivity(cfg);
            case config::RunMode::Summary:
                return runSummary(cfg);
            default:
                return runServer(cfg);
        }

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
