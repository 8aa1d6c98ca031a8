#ifndef PERFORMANCEMONITOR_H
#define PERFORMANCEMONITOR_H

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <deque>
#include <fstream>
#include <limits>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <QObject>
#include <QString>

/**
 * A single timed operation
 */
struct PerformanceMeasurement {
    std::string name;
    std::string category;
    std::chrono::steady_clock::time_point startTime;
    double durationMs = 0.0;
    std::unordered_map<std::string, std::string> metadata;

    PerformanceMeasurement() = default;
    PerformanceMeasurement(const std::string& measurementName, const std::string& measurementCategory)
        : name(measurementName), category(measurementCategory), startTime(std::chrono::steady_clock::now()) {
    }

    void finish() {
        auto elapsed = std::chrono::steady_clock::now() - startTime;
        durationMs = std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count() / 1000.0;
    }
};

/**
 * Aggregated timings for one operation name
 */
struct PerformanceStats {
    std::string name;
    std::string category;
    int count = 0;
    double totalTimeMs = 0.0;
    double averageTimeMs = 0.0;
    double minTimeMs = std::numeric_limits<double>::max();
    double maxTimeMs = 0.0;
    double standardDeviation = 0.0;
    std::deque<double> recentMeasurements;

    void addMeasurement(double timeMs) {
        count++;
        totalTimeMs += timeMs;
        averageTimeMs = totalTimeMs / count;
        minTimeMs = std::min(minTimeMs, timeMs);
        maxTimeMs = std::max(maxTimeMs, timeMs);

        recentMeasurements.push_back(timeMs);
        if (recentMeasurements.size() > MAX_RECENT) {
            recentMeasurements.pop_front();
        }

        if (recentMeasurements.size() > 1) {
            double mean = 0.0;
            for (double value : recentMeasurements) {
                mean += value;
            }
            mean /= recentMeasurements.size();

            double sum = 0.0;
            for (double value : recentMeasurements) {
                sum += (value - mean) * (value - mean);
            }
            standardDeviation = std::sqrt(sum / recentMeasurements.size());
        }
    }

    static constexpr size_t MAX_RECENT = 100;
};

/**
 * RAII timer, records into PerformanceMonitor when it goes out of scope
 */
class PerformanceTimer {
public:
    PerformanceTimer(const std::string& name, const std::string& category = "");
    ~PerformanceTimer();

    PerformanceTimer(const PerformanceTimer&) = delete;
    PerformanceTimer& operator=(const PerformanceTimer&) = delete;

    void addMetadata(const std::string& key, const std::string& value);
    void finish();

private:
    std::unique_ptr<PerformanceMeasurement> m_measurement;
};

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error,
    Critical
};

struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    LogLevel level = LogLevel::Info;
    std::string category;
    std::string message;
    std::string threadId;
};

/**
 * Process-wide logging and timing facility
 *
 * Log entries are kept in a bounded in-memory ring and optionally appended
 * to a file. Messages at Error and above are echoed to stderr.
 * All methods are thread-safe.
 */
class PerformanceMonitor : public QObject {
    Q_OBJECT

public:
    /**
     * Get the singleton instance of PerformanceMonitor
     * @return Reference to the singleton instance
     */
    static PerformanceMonitor& getInstance();

    /**
     * Record a completed measurement and update its statistics
     * @param measurement Finished measurement
     */
    void addMeasurement(const PerformanceMeasurement& measurement);

    /**
     * Get a snapshot of the statistics for one operation
     * @param name Measurement name
     * @return Statistics, or empty if nothing was recorded under that name
     */
    std::optional<PerformanceStats> getStats(const std::string& name) const;

    std::vector<PerformanceStats> getStatsByCategory(const std::string& category) const;

    void log(LogLevel level, const std::string& category, const std::string& message);

    void logDebug(const std::string& category, const std::string& message);
    void logInfo(const std::string& category, const std::string& message);
    void logWarning(const std::string& category, const std::string& message);
    void logError(const std::string& category, const std::string& message);
    void logCritical(const std::string& category, const std::string& message);

    void setMonitoringEnabled(bool enabled) { m_monitoringEnabled = enabled; }
    bool isMonitoringEnabled() const { return m_monitoringEnabled; }

    void setLoggingEnabled(bool enabled) { m_loggingEnabled = enabled; }
    bool isLoggingEnabled() const { return m_loggingEnabled; }

    void setMinLogLevel(LogLevel level) { m_minLogLevel = level; }
    LogLevel getMinLogLevel() const { return m_minLogLevel; }

    /**
     * Enable or disable appending log entries to a file
     * @param enabled Whether to write to the file
     * @param filePath Path to log file (empty keeps the current path)
     * @return true if the file is open when enabling
     */
    bool setFileLoggingEnabled(bool enabled, const std::string& filePath = "");

    void clearPerformanceData();
    void clearLogEntries();

    /**
     * Write all statistics to a JSON file
     * @param filePath Destination path
     * @return true if the file was written
     */
    bool exportPerformanceData(const std::string& filePath) const;

    /**
     * Build a plain-text summary grouped by category
     * @param includeDetails Whether to list the most recent samples
     * @return Report text
     */
    std::string generatePerformanceReport(bool includeDetails = false) const;

    /**
     * Get the most recent log entries, newest first
     * @param maxEntries Maximum number of entries to return
     * @param minLevel Minimum log level to include
     * @return Matching entries
     */
    std::vector<LogEntry> getRecentLogEntries(int maxEntries = 100, LogLevel minLevel = LogLevel::Debug) const;

    static std::string logLevelToString(LogLevel level);
    static LogLevel stringToLogLevel(const std::string& levelStr);

signals:
    void measurementRecorded(const QString& name, double durationMs);
    void messageLogged(int level, const QString& category, const QString& message);

private:
    PerformanceMonitor();
    ~PerformanceMonitor() override;

    PerformanceMonitor(const PerformanceMonitor&) = delete;
    PerformanceMonitor& operator=(const PerformanceMonitor&) = delete;

    void writeLogToFile(const LogEntry& entry);
    static std::string currentThreadId();

    std::unordered_map<std::string, PerformanceStats> m_performanceStats;
    size_t m_totalMeasurements = 0;

    std::deque<LogEntry> m_logEntries;
    std::string m_logFilePath;
    std::unique_ptr<std::ofstream> m_logFile;

    std::atomic<bool> m_monitoringEnabled{true};
    std::atomic<bool> m_loggingEnabled{true};
    bool m_fileLoggingEnabled = false;
    std::atomic<LogLevel> m_minLogLevel{LogLevel::Debug};
    static constexpr size_t MAX_LOG_ENTRIES = 5000;

    mutable std::mutex m_performanceMutex;
    mutable std::mutex m_loggingMutex;
};

#define PERF_TIMER(name) PerformanceTimer _perf_timer(name)
#define PERF_TIMER_CAT(name, category) PerformanceTimer _perf_timer(name, category)

#define LOG_DEBUG(category, message) PerformanceMonitor::getInstance().logDebug(category, message)
#define LOG_INFO(category, message) PerformanceMonitor::getInstance().logInfo(category, message)
#define LOG_WARNING(category, message) PerformanceMonitor::getInstance().logWarning(category, message)
#define LOG_ERROR(category, message) PerformanceMonitor::getInstance().logError(category, message)
#define LOG_CRITICAL(category, message) PerformanceMonitor::getInstance().logCritical(category, message)

#endif // PERFORMANCEMONITOR_H
