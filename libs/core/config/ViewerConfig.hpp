#pragma once
#include <QString>
#include <cstdint>

class QSettings;

// Tuning knobs for the viewer; loaded from an INI file through QSettings.
struct ViewerConfig {
    // viewport/*
    double  rowHeight = 32.0;
    int     bufferSize = 10;
    double  maxPhysicalExtent = 33'000'000.0;   // safe limit below the host's addressable ceiling

    // provider/*
    int     workerThreads = 2;
    int     latencyMs = 0;
    int     timeoutMs = 5000;

    // data/*
    QString dataSource;                  // JSON file; empty means synthetic rows
    int64_t syntheticRows = 1'000'000;
    int64_t importChunkRows = 0;         // > 0 imports progressively in chunks

    static constexpr double kHostScrollCeiling = 2147483647.0;  // QScrollBar range is int

    static ViewerConfig fromSettings(QSettings& settings);
    static ViewerConfig load(const QString& path = QString());
    static QString defaultPath();

    // Throws std::invalid_argument naming the first bad key
    void validate() const;
};
