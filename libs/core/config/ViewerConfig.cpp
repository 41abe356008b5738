#include "ViewerConfig.hpp"
#include "TabulaLogging.hpp"
#include <QFile>
#include <QSettings>
#include <stdexcept>
#include <string>

ViewerConfig ViewerConfig::fromSettings(QSettings& settings) {
    ViewerConfig config;
    config.rowHeight = settings.value("viewport/rowHeight", config.rowHeight).toDouble();
    config.bufferSize = settings.value("viewport/bufferSize", config.bufferSize).toInt();
    config.maxPhysicalExtent = settings.value("viewport/maxPhysicalExtent", config.maxPhysicalExtent).toDouble();

    config.workerThreads = settings.value("provider/workerThreads", config.workerThreads).toInt();
    config.latencyMs = settings.value("provider/latencyMs", config.latencyMs).toInt();
    config.timeoutMs = settings.value("provider/timeoutMs", config.timeoutMs).toInt();

    config.dataSource = settings.value("data/source", config.dataSource).toString();
    config.syntheticRows = settings.value("data/syntheticRows", static_cast<qlonglong>(config.syntheticRows)).toLongLong();
    config.importChunkRows = settings.value("data/importChunkRows", static_cast<qlonglong>(config.importChunkRows)).toLongLong();

    config.validate();
    return config;
}

QString ViewerConfig::defaultPath() {
    const QString env = qEnvironmentVariable("TABULA_CONFIG");
    return env.isEmpty() ? QStringLiteral("config.ini") : env;
}

ViewerConfig ViewerConfig::load(const QString& path) {
    const QString configPath = path.isEmpty() ? defaultPath() : path;
    if (!QFile::exists(configPath)) {
        tLog_App("Config" << configPath << "not found - using defaults");
    }

    QSettings settings(configPath, QSettings::IniFormat);
    ViewerConfig config = fromSettings(settings);

    tLog_App("Config loaded from" << configPath << "- rowHeight:" << config.rowHeight
             << "buffer:" << config.bufferSize << "maxExtent:" << config.maxPhysicalExtent);
    return config;
}

void ViewerConfig::validate() const {
    if (!(rowHeight > 0.0)) {
        throw std::invalid_argument("viewport/rowHeight must be positive, got " + std::to_string(rowHeight));
    }
    if (bufferSize < 0) {
        throw std::invalid_argument("viewport/bufferSize must be >= 0, got " + std::to_string(bufferSize));
    }
    if (!(maxPhysicalExtent > 0.0) || maxPhysicalExtent >= kHostScrollCeiling) {
        throw std::invalid_argument("viewport/maxPhysicalExtent must be in (0, " +
                                    std::to_string(static_cast<int64_t>(kHostScrollCeiling)) + "), got " +
                                    std::to_string(maxPhysicalExtent));
    }
    if (maxPhysicalExtent < rowHeight) {
        throw std::invalid_argument("viewport/maxPhysicalExtent must hold at least one row");
    }
    if (workerThreads < 1) {
        throw std::invalid_argument("provider/workerThreads must be >= 1");
    }
    if (latencyMs < 0 || timeoutMs <= 0) {
        throw std::invalid_argument("provider/latencyMs must be >= 0 and provider/timeoutMs > 0");
    }
    if (syntheticRows < 0 || importChunkRows < 0) {
        throw std::invalid_argument("data/syntheticRows and data/importChunkRows must be >= 0");
    }
}
