#include "Profiler.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>
#include <vector>

namespace salescast {
namespace server {

Profiler& Profiler::instance() {
    static Profiler instance;
    return instance;
}

void Profiler::record(const std::string& name, double durationMs) {
    if (!m_enabled) return;

    std::lock_guard<std::mutex> lock(m_mutex);
    Stats& stats = m_stats[name];
    stats.count++;
    stats.totalMs += durationMs;
    stats.minMs = std::min(stats.minMs, durationMs);
    stats.maxMs = std::max(stats.maxMs, durationMs);
}

Profiler::Stats Profiler::getStats(const std::string& name) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_stats.find(name);
    return it != m_stats.end() ? it->second : Stats{};
}

void Profiler::reset() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_stats.clear();
}

std::vector<std::pair<std::string, Profiler::Stats>> Profiler::snapshot() const {
    std::vector<std::pair<std::string, Stats>> rows;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        rows.assign(m_stats.begin(), m_stats.end());
    }
    std::stable_sort(rows.begin(), rows.end(), [](const auto& lhs, const auto& rhs) {
        return lhs.second.totalMs > rhs.second.totalMs;
    });
    return rows;
}

std::string Profiler::formatStats() const {
    auto rows = snapshot();
    if (rows.empty()) {
        return "No profiling data available.";
    }

    double grandTotal = 0.0;
    for (const auto& row : rows) grandTotal += row.second.totalMs;

    auto cell = [](std::ostream& os, int width) -> std::ostream& {
        return os << std::right << std::setw(width);
    };

    std::ostringstream oss;
    oss << "---- TIMINGS (ms) ----\n" << std::left << std::setw(22) << "operation";
    for (const char* title : {"calls", "total", "mean", "min", "max", "share"}) {
        cell(oss, 10) << title;
    }
    oss << "\n" << std::fixed << std::setprecision(1);

    for (const auto& [name, stats] : rows) {
        oss << std::left << std::setw(22) << name;
        cell(oss, 10) << stats.count;
        cell(oss, 10) << stats.totalMs;
        cell(oss, 10) << stats.avgMs();
        cell(oss, 10) << stats.minMs;
        cell(oss, 10) << stats.maxMs;
        cell(oss, 9) << (grandTotal > 0 ? 100.0 * stats.totalMs / grandTotal : 0.0) << "%\n";
    }
    return oss.str();
}

nlohmann::json Profiler::toJson() const {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto out = nlohmann::json::object();
    for (const auto& [name, stats] : m_stats) {
        out[name] = {
            {"count", stats.count},
            {"total_ms", stats.totalMs},
            {"avg_ms", stats.avgMs()},
            {"min_ms", stats.minMs},
            {"max_ms", stats.maxMs}
        };
    }
    return out;
}

} // namespace server
} // namespace salescast
