#include "Logger.hpp"
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace salescast {
namespace server {

namespace {
thread_local std::string t_context;
}

Logger::Context::Context(std::string tag)
    : m_previous(std::move(t_context))
{
    t_context = std::move(tag);
}

Logger::Context::~Context() {
    t_context = std::move(m_previous);
}

const std::string& Logger::currentContext() {
    return t_context;
}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::setOutputStream(std::ostream* os) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_output = os ? os : &std::cout;
}

void Logger::enableFileLogging(const std::string& filepath) {
    std::ofstream file(filepath, std::ios::app);
    if (!file) {
        throw std::runtime_error("Cannot open log file: " + filepath);
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    m_file = std::move(file);
    m_output = &m_file;
}

std::string Logger::timestamp() {
    auto now = std::chrono::system_clock::now();
    auto seconds = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;

    std::tm utc{};
    gmtime_r(&seconds, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << millis << 'Z';
    return oss.str();
}

std::string Logger::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
    }
    return "?????";
}

std::optional<LogLevel> Logger::parseLevel(const std::string& name) {
    std::string key(name);
    for (auto& c : key) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (key == "debug") return LogLevel::DEBUG;
    if (key == "info") return LogLevel::INFO;
    if (key == "warn" || key == "warning") return LogLevel::WARN;
    if (key == "error") return LogLevel::ERROR;
    return std::nullopt;
}

std::string Logger::formatSize(size_t bytes) {
    std::ostringstream oss;
    if (bytes < 1024) {
        oss << bytes << " o";
    } else if (bytes < 1024 * 1024) {
        oss << std::fixed << std::setprecision(1) << (bytes / 1024.0) << " ko";
    } else {
        oss << std::fixed << std::setprecision(2) << (bytes / (1024.0 * 1024.0)) << " Mo";
    }
    return oss.str();
}

void Logger::write(LogLevel level, const std::string& message) {
    if (!enabled(level)) return;

    std::string line = timestamp() + " [" + levelToString(level) + "] ";
    if (!t_context.empty()) {
        line += "[" + t_context + "] ";
    }
    line += message;

    std::lock_guard<std::mutex> lock(m_mutex);
    *m_output << line << '\n';
    m_output->flush();
}

Logger::RequestTrace Logger::logRequest(const std::string& method, const std::string& target) {
    RequestTrace trace{++m_lastRequestId, std::chrono::steady_clock::now()};
    if (m_logRequests) {
        write(LogLevel::INFO, "[REQ-" + std::to_string(trace.id) + "] " + method + " " + target);
    }
    return trace;
}

void Logger::logResponse(const RequestTrace& trace, int statusCode, size_t bodySize) {
    if (!m_logRequests) return;

    double elapsedMs = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - trace.received).count();

    std::ostringstream oss;
    oss << "[REQ-" << trace.id << "] RESPONSE " << statusCode;
    if (bodySize > 0) {
        oss << " | Size: " << formatSize(bodySize);
    }
    oss << " | Time: " << std::fixed << std::setprecision(1) << elapsedMs << "ms";

    write(statusCode >= 400 ? LogLevel::INFO : LogLevel::DEBUG, oss.str());
}

} // namespace server
} // namespace salescast
