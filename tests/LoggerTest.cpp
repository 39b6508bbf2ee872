#include <catch2/catch.hpp>
#include "server/Logger.hpp"
#include <sstream>

using namespace salescast::server;

namespace {

// Redirige le logger vers un buffer et restaure l'état en sortie
struct CapturedLogs {
    std::ostringstream out;
    LogLevel previous;

    explicit CapturedLogs(LogLevel level) : previous(Logger::instance().level()) {
        Logger::instance().setOutputStream(&out);
        Logger::instance().setLevel(level);
    }
    ~CapturedLogs() {
        Logger::instance().setOutputStream(&std::cout);
        Logger::instance().setLevel(previous);
        Logger::instance().setLogRequests(true);
    }
};

} // anonymous namespace

TEST_CASE("Logger filters below the configured level", "[Logger]") {
    CapturedLogs logs(LogLevel::WARN);

    LOG_DEBUG("debug message");
    LOG_INFO("info message");
    LOG_WARN("warn message");
    LOG_ERROR("error message");

    std::string text = logs.out.str();
    REQUIRE(text.find("debug message") == std::string::npos);
    REQUIRE(text.find("info message") == std::string::npos);
    REQUIRE(text.find("[WARN ] warn message") != std::string::npos);
    REQUIRE(text.find("[ERROR] error message") != std::string::npos);
}

TEST_CASE("Logger debug level shows everything", "[Logger]") {
    CapturedLogs logs(LogLevel::DEBUG);

    LOG_DEBUG("fine detail");

    REQUIRE(logs.out.str().find("[DEBUG] fine detail") != std::string::npos);
}

TEST_CASE("Logger request and response correlation", "[Logger]") {
    CapturedLogs logs(LogLevel::DEBUG);

    auto trace = Logger::instance().logRequest("GET", "/api/health");
    Logger::instance().logResponse(trace, 200, 2048);

    std::string text = logs.out.str();
    std::string tag = "[REQ-" + std::to_string(trace.id) + "]";
    REQUIRE(text.find(tag + " GET /api/health") != std::string::npos);
    REQUIRE(text.find(tag + " RESPONSE 200 | Size: 2.0 ko") != std::string::npos);
}

TEST_CASE("Logger successful responses are DEBUG only", "[Logger]") {
    CapturedLogs logs(LogLevel::INFO);
    Logger::instance().setLogRequests(true);

    auto ok = Logger::instance().logRequest("GET", "/api/training/a/status");
    Logger::instance().logResponse(ok, 200, 10);
    auto missing = Logger::instance().logRequest("GET", "/api/nothing");
    Logger::instance().logResponse(missing, 404, 10);

    std::string text = logs.out.str();
    REQUIRE(text.find("RESPONSE 200") == std::string::npos);
    REQUIRE(text.find("RESPONSE 404") != std::string::npos);
}

TEST_CASE("Logger request logging can be disabled", "[Logger]") {
    CapturedLogs logs(LogLevel::DEBUG);
    Logger::instance().setLogRequests(false);

    auto trace = Logger::instance().logRequest("POST", "/api/training/x/start");
    Logger::instance().logResponse(trace, 500, 0);

    REQUIRE(logs.out.str().empty());
}

TEST_CASE("Logger request ids increase", "[Logger]") {
    CapturedLogs logs(LogLevel::ERROR);

    auto first = Logger::instance().logRequest("GET", "/a");
    auto second = Logger::instance().logRequest("GET", "/b");

    REQUIRE(second.id > first.id);
}

TEST_CASE("Logger context tags lines of the current thread", "[Logger]") {
    CapturedLogs logs(LogLevel::INFO);

    {
        Logger::Context outer("job sales.csv");
        LOG_INFO("inside");
        {
            Logger::Context inner("nested");
            LOG_INFO("deeper");
        }
        REQUIRE(Logger::currentContext() == "job sales.csv");
    }
    LOG_INFO("outside");

    std::string text = logs.out.str();
    REQUIRE(text.find("[INFO ] [job sales.csv] inside") != std::string::npos);
    REQUIRE(text.find("[INFO ] [nested] deeper") != std::string::npos);
    REQUIRE(text.find("[INFO ] outside") != std::string::npos);
    REQUIRE(Logger::currentContext().empty());
}

TEST_CASE("Logger parseLevel", "[Logger]") {
    REQUIRE(Logger::parseLevel("debug") == LogLevel::DEBUG);
    REQUIRE(Logger::parseLevel("INFO") == LogLevel::INFO);
    REQUIRE(Logger::parseLevel("warning") == LogLevel::WARN);
    REQUIRE(Logger::parseLevel("Error") == LogLevel::ERROR);
    REQUIRE_FALSE(Logger::parseLevel("verbose").has_value());
}

TEST_CASE("Logger levelToString is fixed width", "[Logger]") {
    REQUIRE(Logger::levelToString(LogLevel::INFO) == "INFO ");
    REQUIRE(Logger::levelToString(LogLevel::DEBUG).size() == 5);
}

TEST_CASE("Logger formatSize", "[Logger]") {
    REQUIRE(Logger::formatSize(512) == "512 o");
    REQUIRE(Logger::formatSize(1536) == "1.5 ko");
    REQUIRE(Logger::formatSize(3 * 1024 * 1024) == "3.00 Mo");
}
