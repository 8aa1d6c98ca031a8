#ifndef CONFIGMANAGER_H
#define CONFIGMANAGER_H

#include <QObject>
#include <QSettings>
#include <QString>
#include "diffoptions.h"
#include "normalizer.h"
#include "performancemonitor.h"

struct AppConfig {
    DiffOptions diffOptions;
    NormalizationStrategy normalization;

    int canvasPoolSize;
    int renderCacheSize;
    bool enableGPU;
    bool useBackgroundWorker;

    bool enablePerformanceLogging;
    LogLevel minLogLevel;
    QString logFilePath;

    // Default values
    AppConfig() :
        canvasPoolSize(15),
        renderCacheSize(10),
        enableGPU(true),
        useBackgroundWorker(false),
        enablePerformanceLogging(true),
        minLogLevel(LogLevel::Info)
    {}
};

class ConfigManager : public QObject
{
    Q_OBJECT

public:
    /**
     * Use the platform's native settings store
     */
    explicit ConfigManager(QObject *parent = nullptr);

    /**
     * Use an INI file at the given path
     */
    explicit ConfigManager(const QString& settingsPath, QObject *parent = nullptr);

    /**
     * Load configuration from persistent storage. Out of range values are
     * clamped and unknown names fall back to the defaults.
     * @return AppConfig structure with loaded settings
     */
    AppConfig loadConfig();

    /**
     * Save configuration to persistent storage
     * @param config Configuration to save
     */
    void saveConfig(const AppConfig& config);

    /**
     * Route the logger according to the configuration
     */
    static void applyLoggingConfig(const AppConfig& config);

    QString settingsLocation() const;

private:
    QSettings* m_settings;

    // Configuration keys
    static const QString KEY_DIFF_MODE;
    static const QString KEY_THRESHOLD;
    static const QString KEY_OVERLAY_OPACITY;
    static const QString KEY_USE_GRAYSCALE;
    static const QString KEY_NORMALIZATION_TYPE;
    static const QString KEY_ALIGNMENT;
    static const QString KEY_BACKGROUND_COLOR;
    static const QString KEY_SCALE_TO_FIT;
    static const QString KEY_CANVAS_POOL_SIZE;
    static const QString KEY_RENDER_CACHE_SIZE;
    static const QString KEY_ENABLE_GPU;
    static const QString KEY_USE_BACKGROUND_WORKER;
    static const QString KEY_ENABLE_PERFORMANCE_LOGGING;
    static const QString KEY_MIN_LOG_LEVEL;
    static const QString KEY_LOG_FILE_PATH;
};

#endif // CONFIGMANAGER_H
