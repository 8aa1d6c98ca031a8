#include "configmanager.h"
#include <QColor>
#include <algorithm>

// Configuration keys
const QString ConfigManager::KEY_DIFF_MODE = "diff/mode";
const QString ConfigManager::KEY_THRESHOLD = "diff/threshold";
const QString ConfigManager::KEY_OVERLAY_OPACITY = "diff/overlayOpacity";
const QString ConfigManager::KEY_USE_GRAYSCALE = "diff/useGrayscale";
const QString ConfigManager::KEY_NORMALIZATION_TYPE = "normalization/type";
const QString ConfigManager::KEY_ALIGNMENT = "normalization/alignment";
const QString ConfigManager::KEY_BACKGROUND_COLOR = "normalization/backgroundColor";
const QString ConfigManager::KEY_SCALE_TO_FIT = "normalization/scaleToFit";
const QString ConfigManager::KEY_CANVAS_POOL_SIZE = "resources/canvasPoolSize";
const QString ConfigManager::KEY_RENDER_CACHE_SIZE = "resources/renderCacheSize";
const QString ConfigManager::KEY_ENABLE_GPU = "resources/enableGPU";
const QString ConfigManager::KEY_USE_BACKGROUND_WORKER = "resources/useBackgroundWorker";
const QString ConfigManager::KEY_ENABLE_PERFORMANCE_LOGGING = "logging/enablePerformanceLogging";
const QString ConfigManager::KEY_MIN_LOG_LEVEL = "logging/minLevel";
const QString ConfigManager::KEY_LOG_FILE_PATH = "logging/filePath";

ConfigManager::ConfigManager(QObject *parent)
    : QObject(parent)
{
    m_settings = new QSettings("PageDiff", "PageDiff", this);
}

ConfigManager::ConfigManager(const QString& settingsPath, QObject *parent)
    : QObject(parent)
{
    m_settings = new QSettings(settingsPath, QSettings::IniFormat, this);
}

AppConfig ConfigManager::loadConfig()
{
    AppConfig config;
    bool ok = false;

    QString modeName = m_settings->value(KEY_DIFF_MODE, QString::fromStdString(diffModeToString(config.diffOptions.mode))).toString();
    DiffMode mode = diffModeFromString(modeName.toStdString(), &ok);
    if (ok) {
        config.diffOptions.mode = mode;
    } else {
        LOG_WARNING("Config", "Unknown diff mode '" + modeName.toStdString() + "', using default");
    }

    double threshold = m_settings->value(KEY_THRESHOLD, config.diffOptions.threshold).toDouble();
    config.diffOptions.threshold = std::clamp(threshold, 0.0, 255.0);
    double opacity = m_settings->value(KEY_OVERLAY_OPACITY, config.diffOptions.overlayOpacity).toDouble();
    config.diffOptions.overlayOpacity = std::clamp(opacity, 0.0, 1.0);
    config.diffOptions.useGrayscale = m_settings->value(KEY_USE_GRAYSCALE, config.diffOptions.useGrayscale).toBool();

    QString typeName = m_settings->value(KEY_NORMALIZATION_TYPE, CanvasNormalizer::typeToString(config.normalization.type)).toString();
    config.normalization.type = CanvasNormalizer::typeFromString(typeName);

    QString alignmentName = m_settings->value(KEY_ALIGNMENT, CanvasNormalizer::alignmentToString(config.normalization.alignment)).toString();
    config.normalization.alignment = CanvasNormalizer::alignmentFromString(alignmentName);

    QColor background(m_settings->value(KEY_BACKGROUND_COLOR, config.normalization.backgroundColor.name()).toString());
    if (background.isValid()) {
        config.normalization.backgroundColor = background;
    }
    config.normalization.scaleToFit = m_settings->value(KEY_SCALE_TO_FIT, config.normalization.scaleToFit).toBool();

    config.canvasPoolSize = std::clamp(m_settings->value(KEY_CANVAS_POOL_SIZE, config.canvasPoolSize).toInt(), 0, 256);
    config.renderCacheSize = std::clamp(m_settings->value(KEY_RENDER_CACHE_SIZE, config.renderCacheSize).toInt(), 1, 256);
    config.enableGPU = m_settings->value(KEY_ENABLE_GPU, config.enableGPU).toBool();
    config.useBackgroundWorker = m_settings->value(KEY_USE_BACKGROUND_WORKER, config.useBackgroundWorker).toBool();

    config.enablePerformanceLogging = m_settings->value(KEY_ENABLE_PERFORMANCE_LOGGING, config.enablePerformanceLogging).toBool();
    QString levelName = m_settings->value(KEY_MIN_LOG_LEVEL, QString::fromStdString(PerformanceMonitor::logLevelToString(config.minLogLevel))).toString();
    config.minLogLevel = PerformanceMonitor::stringToLogLevel(levelName.toUpper().toStdString());
    config.logFilePath = m_settings->value(KEY_LOG_FILE_PATH, config.logFilePath).toString();

    return config;
}

void ConfigManager::saveConfig(const AppConfig& config)
{
    m_settings->setValue(KEY_DIFF_MODE, QString::fromStdString(diffModeToString(config.diffOptions.mode)));
    m_settings->setValue(KEY_THRESHOLD, config.diffOptions.threshold);
    m_settings->setValue(KEY_OVERLAY_OPACITY, config.diffOptions.overlayOpacity);
    m_settings->setValue(KEY_USE_GRAYSCALE, config.diffOptions.useGrayscale);

    m_settings->setValue(KEY_NORMALIZATION_TYPE, CanvasNormalizer::typeToString(config.normalization.type));
    m_settings->setValue(KEY_ALIGNMENT, CanvasNormalizer::alignmentToString(config.normalization.alignment));
    m_settings->setValue(KEY_BACKGROUND_COLOR, config.normalization.backgroundColor.name());
    m_settings->setValue(KEY_SCALE_TO_FIT, config.normalization.scaleToFit);

    m_settings->setValue(KEY_CANVAS_POOL_SIZE, config.canvasPoolSize);
    m_settings->setValue(KEY_RENDER_CACHE_SIZE, config.renderCacheSize);
    m_settings->setValue(KEY_ENABLE_GPU, config.enableGPU);
    m_settings->setValue(KEY_USE_BACKGROUND_WORKER, config.useBackgroundWorker);

    m_settings->setValue(KEY_ENABLE_PERFORMANCE_LOGGING, config.enablePerformanceLogging);
    m_settings->setValue(KEY_MIN_LOG_LEVEL, QString::fromStdString(PerformanceMonitor::logLevelToString(config.minLogLevel)));
    m_settings->setValue(KEY_LOG_FILE_PATH, config.logFilePath);

    m_settings->sync();
}

void ConfigManager::applyLoggingConfig(const AppConfig& config)
{
    PerformanceMonitor& monitor = PerformanceMonitor::getInstance();
    monitor.setMonitoringEnabled(config.enablePerformanceLogging);
    monitor.setMinLogLevel(config.minLogLevel);

    if (!config.logFilePath.isEmpty()) {
        if (!monitor.setFileLoggingEnabled(true, config.logFilePath.toStdString())) {
            LOG_WARNING("Config", "File logging disabled, cannot open " + config.logFilePath.toStdString());
        }
    }
}

QString ConfigManager::settingsLocation() const
{
    return m_settings->fileName();
}
