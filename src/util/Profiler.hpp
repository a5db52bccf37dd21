#pragma once

#include <chrono>
#include <cstddef>
#include <limits>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

namespace marshal {
namespace util {

/**
 * Profiler - timings of serialize/parse calls per media type
 *
 * Each measurement is keyed by an operation ("serialize", "parse") and the
 * media type it ran under, and carries the number of bytes produced or
 * consumed so formatStats() can report throughput.
 *
 * Usage:
 *   ProfileScope scope("serialize", "application/json");
 *   std::string out = ...;
 *   scope.setBytes(out.size());
 */
class Profiler {
public:
    struct Stats {
        size_t count = 0;
        size_t bytes = 0;
        double totalMs = 0.0;
        double minMs = std::numeric_limits<double>::max();
        double maxMs = 0.0;

        double avgMs() const { return count > 0 ? totalMs / count : 0.0; }

        /**
         * Kilobytes per second over all recorded calls, 0 without timing data
         */
        double kbPerSecond() const {
            return totalMs > 0.0 ? (static_cast<double>(bytes) / 1024.0) / (totalMs / 1000.0) : 0.0;
        }

        void merge(const Stats& other);
    };

    /**
     * (operation, media type)
     */
    using Key = std::pair<std::string, std::string>;

    static Profiler& instance();

    void setEnabled(bool enabled) { m_enabled = enabled; }
    bool isEnabled() const { return m_enabled; }

    /**
     * Start a measurement, returns its id (0 when disabled)
     */
    size_t start(const std::string& operation, const std::string& mediaType);

    /**
     * Stop a measurement and record it with the bytes processed
     * Returns the duration in milliseconds
     */
    double stop(size_t timerId, size_t bytes = 0);

    Stats getStats(const std::string& operation, const std::string& mediaType) const;

    /**
     * Stats of every operation that ran under mediaType, merged
     */
    Stats getMediaTypeTotals(const std::string& mediaType) const;

    std::map<Key, Stats> getAllStats() const;

    void reset();

    /**
     * Table grouped by media type, one row per operation and a total row
     */
    std::string formatStats() const;

private:
    Profiler() = default;
    Profiler(const Profiler&) = delete;
    Profiler& operator=(const Profiler&) = delete;

    struct Timer {
        Key key;
        std::chrono::steady_clock::time_point start;
    };

    bool m_enabled = false;
    mutable std::mutex m_mutex;
    std::map<Key, Stats> m_stats;
    std::unordered_map<size_t, Timer> m_activeTimers;
    size_t m_nextTimerId = 0;
};

/**
 * RAII measurement - recorded when destroyed or stopped
 */
class ProfileScope {
public:
    ProfileScope(const std::string& operation, const std::string& mediaType)
        : m_timerId(Profiler::instance().start(operation, mediaType))
    {}

    ~ProfileScope() {
        stop();
    }

    ProfileScope(const ProfileScope&) = delete;
    ProfileScope& operator=(const ProfileScope&) = delete;

    void setBytes(size_t bytes) { m_bytes = bytes; }

    double stop() {
        if (!m_stopped) {
            m_stopped = true;
            m_duration = Profiler::instance().stop(m_timerId, m_bytes);
        }
        return m_duration;
    }

private:
    size_t m_timerId;
    size_t m_bytes = 0;
    bool m_stopped = false;
    double m_duration = 0.0;
};

} // namespace util
} // namespace marshal
