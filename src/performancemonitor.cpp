#include "performancemonitor.h"
#include <iostream>
#include <sstream>
#include <iomanip>
#include <map>
#include <thread>
#include <QDir>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QStandardPaths>

// ============================================================================
// PerformanceTimer Implementation
// ============================================================================

PerformanceTimer::PerformanceTimer(const std::string& name, const std::string& category) {
    if (PerformanceMonitor::getInstance().isMonitoringEnabled()) {
        m_measurement = std::make_unique<PerformanceMeasurement>(name, category);
    }
}

PerformanceTimer::~PerformanceTimer() {
    finish();
}

void PerformanceTimer::addMetadata(const std::string& key, const std::string& value) {
    if (m_measurement) {
        m_measurement->metadata[key] = value;
    }
}

void PerformanceTimer::finish() {
    if (m_measurement) {
        m_measurement->finish();
        PerformanceMonitor::getInstance().addMeasurement(*m_measurement);
        m_measurement.reset();
    }
}

// ============================================================================
// PerformanceMonitor Implementation
// ============================================================================

PerformanceMonitor& PerformanceMonitor::getInstance() {
    static PerformanceMonitor instance;
    return instance;
}

PerformanceMonitor::PerformanceMonitor() {
    QString dataDir = QStandardPaths::writableLocation(QStandardPaths::TempLocation);
    m_logFilePath = QDir(dataDir).filePath("pagediff.log").toStdString();
}

PerformanceMonitor::~PerformanceMonitor() {
    if (m_logFile && m_logFile->is_open()) {
        m_logFile->close();
    }
}

void PerformanceMonitor::addMeasurement(const PerformanceMeasurement& measurement) {
    if (!m_monitoringEnabled) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(m_performanceMutex);

        auto& stats = m_performanceStats[measurement.name];
        if (stats.name.empty()) {
            stats.name = measurement.name;
            stats.category = measurement.category;
        }
        stats.addMeasurement(measurement.durationMs);
        m_totalMeasurements++;
    }

    emit measurementRecorded(QString::fromStdString(measurement.name), measurement.durationMs);

    std::ostringstream oss;
    oss << measurement.name << " completed in "
        << std::fixed << std::setprecision(2) << measurement.durationMs << " ms";
    if (!measurement.metadata.empty()) {
        // Sorted so the line is stable between runs
        std::map<std::string, std::string> sorted(measurement.metadata.begin(), measurement.metadata.end());
        oss << " [";
        bool first = true;
        for (const auto& [key, value] : sorted) {
            if (!first) oss << ", ";
            oss << key << "=" << value;
            first = false;
        }
        oss << "]";
    }
    logDebug("Performance", oss.str());
}

std::optional<PerformanceStats> PerformanceMonitor::getStats(const std::string& name) const {
    std::lock_guard<std::mutex> lock(m_performanceMutex);

    auto it = m_performanceStats.find(name);
    if (it == m_performanceStats.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<PerformanceStats> PerformanceMonitor::getStatsByCategory(const std::string& category) const {
    std::lock_guard<std::mutex> lock(m_performanceMutex);

    std::vector<PerformanceStats> result;
    for (const auto& [name, stats] : m_performanceStats) {
        if (stats.category == category) {
            result.push_back(stats);
        }
    }
    return result;
}

void PerformanceMonitor::log(LogLevel level, const std::string& category, const std::string& message) {
    if (!m_loggingEnabled || level < m_minLogLevel) {
        return;
    }

    LogEntry entry;
    entry.timestamp = std::chrono::system_clock::now();
    entry.level = level;
    entry.category = category;
    entry.message = message;
    entry.threadId = currentThreadId();

    {
        std::lock_guard<std::mutex> lock(m_loggingMutex);

        m_logEntries.push_back(entry);
        if (m_logEntries.size() > MAX_LOG_ENTRIES) {
            m_logEntries.pop_front();
        }

        if (m_fileLoggingEnabled) {
            writeLogToFile(entry);
        }
    }

    emit messageLogged(static_cast<int>(level), QString::fromStdString(category),
                       QString::fromStdString(message));

    if (level >= LogLevel::Error) {
        std::cerr << "[" << logLevelToString(level) << "] " << category << ": " << message << std::endl;
    }
}

void PerformanceMonitor::logDebug(const std::string& category, const std::string& message) {
    log(LogLevel::Debug, category, message);
}

void PerformanceMonitor::logInfo(const std::string& category, const std::string& message) {
    log(LogLevel::Info, category, message);
}

void PerformanceMonitor::logWarning(const std::string& category, const std::string& message) {
    log(LogLevel::Warning, category, message);
}

void PerformanceMonitor::logError(const std::string& category, const std::string& message) {
    log(LogLevel::Error, category, message);
}

void PerformanceMonitor::logCritical(const std::string& category, const std::string& message) {
    log(LogLevel::Critical, category, message);
}

bool PerformanceMonitor::setFileLoggingEnabled(bool enabled, const std::string& filePath) {
    std::lock_guard<std::mutex> lock(m_loggingMutex);

    if (!filePath.empty()) {
        m_logFilePath = filePath;
    }

    if (m_logFile) {
        m_logFile->close();
        m_logFile.reset();
    }
    m_fileLoggingEnabled = false;

    if (!enabled) {
        return true;
    }

    m_logFile = std::make_unique<std::ofstream>(m_logFilePath, std::ios::app);
    if (!m_logFile->is_open()) {
        std::cerr << "Failed to open log file: " << m_logFilePath << std::endl;
        m_logFile.reset();
        return false;
    }

    m_fileLoggingEnabled = true;
    return true;
}

void PerformanceMonitor::clearPerformanceData() {
    std::lock_guard<std::mutex> lock(m_performanceMutex);
    m_performanceStats.clear();
    m_totalMeasurements = 0;
}

void PerformanceMonitor::clearLogEntries() {
    std::lock_guard<std::mutex> lock(m_loggingMutex);
    m_logEntries.clear();
}

bool PerformanceMonitor::exportPerformanceData(const std::string& filePath) const {
    QJsonArray statsArray;
    {
        std::lock_guard<std::mutex> lock(m_performanceMutex);

        for (const auto& [name, stats] : m_performanceStats) {
            QJsonObject statsObj;
            statsObj["name"] = QString::fromStdString(stats.name);
            statsObj["category"] = QString::fromStdString(stats.category);
            statsObj["count"] = stats.count;
            statsObj["totalTimeMs"] = stats.totalTimeMs;
            statsObj["averageTimeMs"] = stats.averageTimeMs;
            statsObj["minTimeMs"] = stats.minTimeMs;
            statsObj["maxTimeMs"] = stats.maxTimeMs;
            statsObj["standardDeviation"] = stats.standardDeviation;

            QJsonArray recentArray;
            for (double value : stats.recentMeasurements) {
                recentArray.append(value);
            }
            statsObj["recentMeasurements"] = recentArray;

            statsArray.append(statsObj);
        }
    }

    QJsonObject root;
    root["performanceStats"] = statsArray;

    QFile file(QString::fromStdString(filePath));
    if (!file.open(QIODevice::WriteOnly)) {
        LOG_WARNING("Performance", "Cannot open export file: " + filePath);
        return false;
    }

    QByteArray data = QJsonDocument(root).toJson();
    return file.write(data) == data.size();
}

std::string PerformanceMonitor::generatePerformanceReport(bool includeDetails) const {
    std::lock_guard<std::mutex> lock(m_performanceMutex);

    std::ostringstream oss;
    oss << "=== Performance Report ===\n\n";
    oss << "Total Measurements: " << m_totalMeasurements << "\n";
    oss << "Unique Operations: " << m_performanceStats.size() << "\n\n";

    std::map<std::string, std::vector<const PerformanceStats*>> byCategory;
    for (const auto& [name, stats] : m_performanceStats) {
        byCategory[stats.category].push_back(&stats);
    }

    for (auto& [category, statsList] : byCategory) {
        oss << "Category: " << (category.empty() ? "Uncategorized" : category) << "\n";
        oss << std::string(50, '-') << "\n";

        std::sort(statsList.begin(), statsList.end(),
                  [](const PerformanceStats* a, const PerformanceStats* b) {
                      return a->averageTimeMs > b->averageTimeMs;
                  });

        for (const auto* stats : statsList) {
            oss << std::left << std::setw(30) << stats->name
                << " Count: " << std::setw(6) << stats->count
                << " Avg: " << std::fixed << std::setprecision(2) << std::setw(8) << stats->averageTimeMs << "ms"
                << " Min: " << std::setw(8) << stats->minTimeMs << "ms"
                << " Max: " << std::setw(8) << stats->maxTimeMs << "ms";
            if (stats->standardDeviation > 0) {
                oss << " StdDev: " << std::setw(8) << stats->standardDeviation << "ms";
            }
            oss << "\n";

            if (includeDetails && !stats->recentMeasurements.empty()) {
                oss << "  Recent: ";
                int shown = 0;
                for (auto it = stats->recentMeasurements.rbegin();
                     it != stats->recentMeasurements.rend() && shown < 5; ++it, ++shown) {
                    if (shown > 0) oss << ", ";
                    oss << std::fixed << std::setprecision(1) << *it << "ms";
                }
                oss << "\n";
            }
        }
        oss << "\n";
    }

    return oss.str();
}

std::vector<LogEntry> PerformanceMonitor::getRecentLogEntries(int maxEntries, LogLevel minLevel) const {
    std::lock_guard<std::mutex> lock(m_loggingMutex);

    std::vector<LogEntry> result;
    for (auto it = m_logEntries.rbegin();
         it != m_logEntries.rend() && static_cast<int>(result.size()) < maxEntries; ++it) {
        if (it->level >= minLevel) {
            result.push_back(*it);
        }
    }
    return result;
}

std::string PerformanceMonitor::logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        default: return "UNKNOWN";
    }
}

LogLevel PerformanceMonitor::stringToLogLevel(const std::string& levelStr) {
    if (levelStr == "DEBUG") return LogLevel::Debug;
    if (levelStr == "INFO") return LogLevel::Info;
    if (levelStr == "WARNING") return LogLevel::Warning;
    if (levelStr == "ERROR") return LogLevel::Error;
    if (levelStr == "CRITICAL") return LogLevel::Critical;
    return LogLevel::Info;
}

void PerformanceMonitor::writeLogToFile(const LogEntry& entry) {
    if (!m_logFile || !m_logFile->is_open()) {
        return;
    }

    auto time = std::chrono::system_clock::to_time_t(entry.timestamp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        entry.timestamp.time_since_epoch()) % 1000;

    *m_logFile << std::put_time(std::localtime(&time), "%Y-%m-%d %H:%M:%S")
               << "." << std::setfill('0') << std::setw(3) << ms.count() << std::setfill(' ')
               << " [" << logLevelToString(entry.level) << "]"
               << " [" << entry.threadId << "] "
               << entry.category << ": " << entry.message << '\n';
    m_logFile->flush();
}

std::string PerformanceMonitor::currentThreadId() {
    std::ostringstream oss;
    oss << std::this_thread::get_id();
    return oss.str();
}
