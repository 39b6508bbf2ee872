#pragma once

#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <limits>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace salescast {
namespace server {

/**
 * Profiler - agrège les durées par opération
 *
 * Opérations enregistrées: loadDataset, job, forecast.pipeline,
 * forecast.fit (un par groupe), cohort.analyze, serializeForecast.
 * Partagé par les workers d'entraînement et le thread HTTP.
 */
class Profiler {
public:
    struct Stats {
        size_t count = 0;
        double totalMs = 0.0;
        double minMs = std::numeric_limits<double>::max();
        double maxMs = 0.0;

        double avgMs() const { return count > 0 ? totalMs / count : 0.0; }
    };

    static Profiler& instance();

    void setEnabled(bool enabled) { m_enabled = enabled; }
    bool isEnabled() const { return m_enabled; }

    /// No-op when disabled
    void record(const std::string& name, double durationMs);

    Stats getStats(const std::string& name) const;

    void reset();

    /// Opérations triées par temps total décroissant
    std::vector<std::pair<std::string, Stats>> snapshot() const;

    /// Tableau texte de snapshot(), avec la part de chaque opération
    std::string formatStats() const;

    /// {"<operation>": {count, total_ms, avg_ms, min_ms, max_ms}}
    nlohmann::json toJson() const;

private:
    Profiler() = default;
    Profiler(const Profiler&) = delete;
    Profiler& operator=(const Profiler&) = delete;

    std::atomic<bool> m_enabled{true};
    mutable std::mutex m_mutex;
    std::map<std::string, Stats> m_stats;
};

/**
 * RAII Scoped timer - records into the Profiler when destroyed
 *
 * stop() returns the measured duration even when the Profiler is disabled,
 * so callers can log it.
 */
class ScopedTimer {
public:
    explicit ScopedTimer(std::string name)
        : m_name(std::move(name))
        , m_start(std::chrono::steady_clock::now())
    {}

    ~ScopedTimer() {
        stop();
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

    double stop() {
        if (!m_stopped) {
            m_stopped = true;
            m_duration = std::chrono::duration<double, std::milli>(
                std::chrono::steady_clock::now() - m_start).count();
            Profiler::instance().record(m_name, m_duration);
        }
        return m_duration;
    }

private:
    std::string m_name;
    std::chrono::steady_clock::time_point m_start;
    bool m_stopped = false;
    double m_duration = 0.0;
};

} // namespace server
} // namespace salescast
