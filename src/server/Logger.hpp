#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>

namespace salescast {
namespace server {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

/**
 * Logger singleton - gestion centralisée des logs
 *
 * Format: "<horodatage UTC> [LEVEL] [contexte] message". Le contexte est
 * propre au thread (id du job pour un worker d'entraînement), voir
 * Logger::Context. Chaque ligne est écrite sous mutex.
 */
class Logger {
public:
    /// Requête HTTP en cours: id de corrélation + instant de réception
    struct RequestTrace {
        uint64_t id = 0;
        std::chrono::steady_clock::time_point received;
    };

    /// Tag de contexte pour le thread courant, restauré à la destruction
    class Context {
    public:
        explicit Context(std::string tag);
        ~Context();
        Context(const Context&) = delete;
        Context& operator=(const Context&) = delete;

    private:
        std::string m_previous;
    };

    static Logger& instance();

    void setLevel(LogLevel level) { m_level = level; }
    LogLevel level() const { return m_level; }
    bool enabled(LogLevel level) const { return level >= m_level; }

    // nullptr = stdout
    void setOutputStream(std::ostream* os);
    // Ajoute au fichier; throw std::runtime_error si impossible à ouvrir
    void enableFileLogging(const std::string& filepath);
    void setLogRequests(bool enabled) { m_logRequests = enabled; }

    void write(LogLevel level, const std::string& message);

    RequestTrace logRequest(const std::string& method, const std::string& target);
    // Réponses 2xx en DEBUG: les polls de statut sont fréquents
    void logResponse(const RequestTrace& trace, int statusCode, size_t bodySize);

    static std::string levelToString(LogLevel level);
    static std::optional<LogLevel> parseLevel(const std::string& name);
    static std::string formatSize(size_t bytes);
    static const std::string& currentContext();

private:
    Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static std::string timestamp();

    std::atomic<LogLevel> m_level{LogLevel::INFO};
    std::atomic<bool> m_logRequests{true};
    std::atomic<uint64_t> m_lastRequestId{0};

    std::mutex m_mutex;
    std::ostream* m_output = &std::cout;
    std::ofstream m_file;
};

#define LOG_DEBUG(msg) salescast::server::Logger::instance().write(salescast::server::LogLevel::DEBUG, msg)
#define LOG_INFO(msg) salescast::server::Logger::instance().write(salescast::server::LogLevel::INFO, msg)
#define LOG_WARN(msg) salescast::server::Logger::instance().write(salescast::server::LogLevel::WARN, msg)
#define LOG_ERROR(msg) salescast::server::Logger::instance().write(salescast::server::LogLevel::ERROR, msg)

} // namespace server
} // namespace salescast
