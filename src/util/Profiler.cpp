#include "util/Profiler.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace marshal {
namespace util {

void Profiler::Stats::merge(const Stats& other) {
    if (other.count == 0) return;
    count += other.count;
    bytes += other.bytes;
    totalMs += other.totalMs;
    minMs = std::min(minMs, other.minMs);
    maxMs = std::max(maxMs, other.maxMs);
}

Profiler& Profiler::instance() {
    static Profiler instance;
    return instance;
}

size_t Profiler::start(const std::string& operation, const std::string& mediaType) {
    if (!m_enabled) return 0;

    std::lock_guard<std::mutex> lock(m_mutex);
    size_t id = ++m_nextTimerId;
    m_activeTimers[id] = Timer{Key{operation, mediaType}, std::chrono::steady_clock::now()};
    return id;
}

double Profiler::stop(size_t timerId, size_t bytes) {
    if (timerId == 0) return 0.0;

    auto endTime = std::chrono::steady_clock::now();

    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_activeTimers.find(timerId);
    if (it == m_activeTimers.end()) {
        return 0.0;
    }

    double durationMs = std::chrono::duration<double, std::milli>(endTime - it->second.start).count();

    Stats sample;
    sample.count = 1;
    sample.bytes = bytes;
    sample.totalMs = durationMs;
    sample.minMs = durationMs;
    sample.maxMs = durationMs;
    m_stats[it->second.key].merge(sample);

    m_activeTimers.erase(it);
    return durationMs;
}

Profiler::Stats Profiler::getStats(const std::string& operation, const std::string& mediaType) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_stats.find(Key{operation, mediaType});
    return it != m_stats.end() ? it->second : Stats{};
}

Profiler::Stats Profiler::getMediaTypeTotals(const std::string& mediaType) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    Stats totals;
    for (const auto& [key, stats] : m_stats) {
        if (key.second == mediaType) {
            totals.merge(stats);
        }
    }
    return totals;
}

std::map<Profiler::Key, Profiler::Stats> Profiler::getAllStats() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_stats;
}

void Profiler::reset() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_stats.clear();
    m_activeTimers.clear();
}

namespace {

void writeRow(std::ostringstream& oss, const std::string& label, const Profiler::Stats& stats) {
    oss << "  " << std::left << std::setw(14) << label
        << std::right << std::setw(8) << stats.count
        << std::setw(12) << stats.bytes
        << std::setw(12) << std::fixed << std::setprecision(2) << stats.totalMs
        << std::setw(10) << stats.avgMs()
        << std::setw(10) << (stats.count > 0 ? stats.minMs : 0.0)
        << std::setw(10) << stats.maxMs
        << std::setw(12) << stats.kbPerSecond()
        << "\n";
}

} // namespace

std::string Profiler::formatStats() const {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_stats.empty()) {
        return "No profiling data available.";
    }

    // m_stats is ordered by (operation, media type); regroup by media type
    std::map<std::string, std::map<std::string, Stats>> byMediaType;
    for (const auto& [key, stats] : m_stats) {
        byMediaType[key.second][key.first] = stats;
    }

    std::ostringstream oss;
    oss << "\n========== PROFILER STATS ==========\n";
    oss << "  " << std::left << std::setw(14) << "Operation"
        << std::right << std::setw(8) << "Count"
        << std::setw(12) << "Bytes"
        << std::setw(12) << "Total(ms)"
        << std::setw(10) << "Avg(ms)"
        << std::setw(10) << "Min(ms)"
        << std::setw(10) << "Max(ms)"
        << std::setw(12) << "KB/s"
        << "\n";

    for (const auto& [mediaType, operations] : byMediaType) {
        oss << std::string(90, '-') << "\n" << mediaType << "\n";
        Stats total;
        for (const auto& [operation, stats] : operations) {
            writeRow(oss, operation, stats);
            total.merge(stats);
        }
        if (operations.size() > 1) {
            writeRow(oss, "total", total);
        }
    }
    oss << "=====================================\n";

    return oss.str();
}

} // namespace util
} // namespace marshal
