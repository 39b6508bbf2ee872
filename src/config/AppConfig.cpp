#include "config/AppConfig.hpp"
#include <fstream>
#include <sstream>

namespace salescast {
namespace config {

namespace {

std::string trim(std::string s) {
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r' || s.back() == '\n')) s.pop_back();
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.erase(s.begin());
    return s;
}

long long parseInteger(const std::string& key, const std::string& value, long long min, long long max) {
    size_t pos = 0;
    long long result = 0;
    try {
        result = std::stoll(value, &pos);
    } catch (const std::exception&) {
        throw ConfigError("Invalid integer for " + key + ": '" + value + "'");
    }
    if (pos != value.size()) {
        throw ConfigError("Invalid integer for " + key + ": '" + value + "'");
    }
    if (result < min || result > max) {
        throw ConfigError(key + " out of range [" + std::to_string(min) + ", " +
                          std::to_string(max) + "]: " + value);
    }
    return result;
}

double parseDouble(const std::string& key, const std::string& value) {
    size_t pos = 0;
    double result = 0.0;
    try {
        result = std::stod(value, &pos);
    } catch (const std::exception&) {
        throw ConfigError("Invalid number for " + key + ": '" + value + "'");
    }
    if (pos != value.size()) {
        throw ConfigError("Invalid number for " + key + ": '" + value + "'");
    }
    return result;
}

bool parseBool(const std::string& key, const std::string& value) {
    if (value == "true" || value == "1" || value == "yes" || value == "on") return true;
    if (value == "false" || value == "0" || value == "no" || value == "off") return false;
    throw ConfigError("Invalid boolean for " + key + ": '" + value + "'");
}

} // anonymous namespace

void AppConfig::set(const std::string& key, const std::string& value) {
    if (key == "server.address") {
        address = value;
    } else if (key == "server.port") {
        port = static_cast<unsigned short>(parseInteger(key, value, 0, 65535));
    } else if (key == "uploads.dir") {
        uploadsDir = value;
    } else if (key == "log.level") {
        auto level = server::Logger::parseLevel(value);
        if (!level) {
            throw ConfigError("Unknown log level: '" + value + "'");
        }
        logLevel = *level;
    } else if (key == "log.file") {
        logFile = value;
    } else if (key == "forecast.horizon") {
        pipeline.engine.horizon = static_cast<int>(parseInteger(key, value, 1, 120));
    } else if (key == "forecast.min_observations") {
        pipeline.minObservations = static_cast<size_t>(parseInteger(key, value, 3, 1000));
    } else if (key == "forecast.fourier_order") {
        pipeline.engine.fourierOrder = static_cast<int>(parseInteger(key, value, 0, 5));
    } else if (key == "forecast.interval_width") {
        double width = parseDouble(key, value);
        if (!(width > 0.0 && width < 1.0)) {
            throw ConfigError("forecast.interval_width must be in (0, 1): " + value);
        }
        pipeline.engine.intervalWidth = width;
    } else if (key == "forecast.include_fitted_history") {
        pipeline.merger.includeFittedHistory = parseBool(key, value);
    } else if (key == "summary.exchange_rates") {
        try {
            summary.exchangeRates = summary::DashboardSummary::parseExchangeRates(value);
        } catch (const std::invalid_argument& e) {
            throw ConfigError("Invalid summary.exchange_rates: " + std::string(e.what()));
        }
    } else if (key == "job.timeout_seconds") {
        jobTimeoutSeconds = static_cast<int>(parseInteger(key, value, 0, 7 * 24 * 3600));
    } else {
        throw ConfigError("Unknown config key: '" + key + "'");
    }
}

std::map<std::string, std::string> AppConfig::parseFile(const std::string& filepath) {
    std::string path = filepath;
    if (!path.empty() && path[0] == '@') path = path.substr(1);

    std::ifstream paramFile(path);
    if (!paramFile.is_open()) {
        throw ConfigError("Cannot open config file: " + path);
    }

    std::map<std::string, std::string> params;
    std::string line;
    while (std::getline(paramFile, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        std::string key = trim(line.substr(0, eq));
        std::string val = trim(line.substr(eq + 1));
        params[key] = val;
    }
    return params;
}

void AppConfig::loadFile(const std::string& path) {
    for (const auto& [key, value] : parseFile(path)) {
        set(key, value);
    }
    configFile = path;
}

jobs::JobRunnerOptions AppConfig::runnerOptions() const {
    jobs::JobRunnerOptions options;
    options.uploadsDir = uploadsDir;
    options.pipeline = pipeline;
    options.timeout = std::chrono::seconds(jobTimeoutSeconds);
    return options;
}

AppConfig AppConfig::fromCommandLine(int argc, const char* const argv[]) {
    AppConfig config;

    auto requireValue = [&](int& i, const std::string& arg) -> std::string {
        if (i + 1 >= argc) {
            throw ConfigError("Missing value for " + arg);
        }
        return argv[++i];
    };

    // Le fichier de config d'abord, la ligne de commande le surcharge
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config") {
            config.loadFile(requireValue(i, arg));
        }
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-p" || arg == "--port") {
            config.set("server.port", requireValue(i, arg));
        } else if (arg == "-a" || arg == "--address") {
            config.set("server.address", requireValue(i, arg));
        } else if (arg == "-u" || arg == "--uploads") {
            config.set("uploads.dir", requireValue(i, arg));
        } else if (arg == "-l" || arg == "--log-level") {
            config.set("log.level", requireValue(i, arg));
        } else if (arg == "--log-file") {
            config.set("log.file", requireValue(i, arg));
        } else if (arg == "--no-profiler") {
            config.enableProfiler = false;
        } else if (arg == "--config") {
            ++i;  // déjà appliqué
        } else if (arg == "--forecast") {
            config.mode = RunMode::Forecast;
            config.inputFile = requireValue(i, arg);
        } else if (arg == "--activity") {
            config.mode = RunMode::Activity;
            config.inputFile = requireValue(i, arg);
        } else if (arg == "--summary") {
            config.mode = RunMode::Summary;
            config.inputFile = requireValue(i, arg);
        } else if (arg == "-o" || arg == "--out") {
            config.outputFile = requireValue(i, arg);
        } else if (arg == "-h" || arg == "--help") {
            config.mode = RunMode::Help;
        } else {
            throw ConfigError("Unknown option: " + arg);
        }
    }

    return config;
}

std::string AppConfig::usage(const std::string& program) {
    std::ostringstream oss;
    oss << "Usage: " << program << " [options]\n"
        << "Options:\n"
        << "  -p, --port PORT        Port to listen on (default: 8080)\n"
        << "  -a, --address ADDR     Address to bind to (default: 0.0.0.0)\n"
        << "  -u, --uploads DIR      Directory holding uploaded sales files (default: uploads)\n"
        << "  --config FILE          App parameters file (key=value lines, @file syntax)\n"
        << "  -l, --log-level LVL    Log level: debug, info, warn, error (default: info)\n"
        << "  --log-file PATH        Also write logs to PATH\n"
        << "  --no-profiler          Disable profiler\n"
        << "  --forecast FILE        Run the forecast on FILE and exit\n"
        << "  --activity FILE        Print the quarterly customer activity of FILE and exit\n"
        << "  --summary FILE         Print the top customers/cities/items/salespeople of FILE and exit\n"
        << "  -o, --out PATH         Output CSV for --forecast / --activity\n"
        << "  -h, --help             Show this help\n"
        << "\n"
        << "Config keys: server.address, server.port, uploads.dir, log.level, log.file,\n"
        << "  forecast.horizon, forecast.min_observations, forecast.fourier_order,\n"
        << "  forecast.interval_width, forecast.include_fitted_history, job.timeout_seconds,\n"
        << "  summary.exchange_rates (CURRENCY:RATE,...; amounts are raw by default)\n";
    return oss.str();
}

} // namespace config
} // namespace salescast
