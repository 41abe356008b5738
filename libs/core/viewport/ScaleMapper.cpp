#include "ScaleMapper.hpp"
#include "TabulaErrors.hpp"
#include "TabulaLogging.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

double ScaleMapper::computeScaleFactor(int64_t totalRows, double rowHeight, double maxExtent) {
    if (totalRows <= 0 || rowHeight <= EPSILON || maxExtent <= EPSILON) {
        return 1.0;
    }

    const double fullExtent = static_cast<double>(totalRows) * rowHeight;
    if (fullExtent <= maxExtent) {
        return 1.0;
    }

    double factor = fullExtent / maxExtent;

    // Division can land one ulp short of the ceiling; nudge until the spacer fits.
    while (fullExtent / factor > maxExtent) {
        factor = std::nextafter(factor, std::numeric_limits<double>::infinity());
    }
    return factor;
}

ScaleMapping ScaleMapper::makeMapping(int64_t totalRows, double rowHeight, double maxExtent) {
    if (totalRows < 0) {
        const QString msg = QString("ScaleMapper: negative totalRows %1").arg(totalRows);
        if constexpr (tabula::kStrictInvariants) {
            throw InvariantViolation(msg.toStdString());
        }
        tLog_Warning(msg << "- clamping to 0");
        totalRows = 0;
    }

    ScaleMapping mapping;
    mapping.rowHeight = rowHeight;
    mapping.totalRows = totalRows;
    mapping.maxPhysicalExtent = maxExtent;
    mapping.scaleFactor = computeScaleFactor(totalRows, rowHeight, maxExtent);

    if (spacerExtent(mapping) > maxExtent) {
        const QString msg = QString("ScaleMapper: spacer exceeds ceiling: %1").arg(mappingDebugString(mapping));
        if constexpr (tabula::kStrictInvariants) {
            throw InvariantViolation(msg.toStdString());
        }
        tLog_Warning(msg);
        mapping.scaleFactor = std::nextafter(spacerExtent(mapping) * mapping.scaleFactor / maxExtent,
                                             std::numeric_limits<double>::infinity());
    }

    tLog_Render("Scale mapping:" << mappingDebugString(mapping));
    return mapping;
}

double ScaleMapper::logicalToPhysical(double index, const ScaleMapping& mapping) {
    return (index * mapping.rowHeight) / mapping.scaleFactor;
}

double ScaleMapper::physicalToLogical(double offset, const ScaleMapping& mapping) {
    if (mapping.rowHeight <= EPSILON) return 0.0;
    return (offset * mapping.scaleFactor) / mapping.rowHeight;
}

double ScaleMapper::spacerExtent(int64_t totalRows, double rowHeight, double scaleFactor) {
    if (totalRows <= 0 || scaleFactor <= EPSILON) return 0.0;
    return (static_cast<double>(totalRows) * rowHeight) / scaleFactor;
}

double ScaleMapper::spacerExtent(const ScaleMapping& mapping) {
    return spacerExtent(mapping.totalRows, mapping.rowHeight, mapping.scaleFactor);
}

double ScaleMapper::maxScrollOffset(const ScaleMapping& mapping, double viewportHeight) {
    return std::max(0.0, spacerExtent(mapping) - std::max(0.0, viewportHeight));
}

double ScaleMapper::clampScrollOffset(double offset, const ScaleMapping& mapping, double viewportHeight) {
    if (!std::isfinite(offset)) return 0.0;
    return std::clamp(offset, 0.0, maxScrollOffset(mapping, viewportHeight));
}

bool ScaleMapper::validateMapping(const ScaleMapping& mapping) {
    return mapping.rowHeight > EPSILON &&
           mapping.maxPhysicalExtent > EPSILON &&
           mapping.totalRows >= 0 &&
           mapping.scaleFactor >= 1.0 &&
           spacerExtent(mapping) <= mapping.maxPhysicalExtent;
}

QString ScaleMapper::mappingDebugString(const ScaleMapping& mapping) {
    return QString("ScaleMapping{rows: %1, rowHeight: %2, scale: %3, spacer: %4/%5}")
        .arg(mapping.totalRows)
        .arg(mapping.rowHeight)
        .arg(mapping.scaleFactor, 0, 'f', 4)
        .arg(spacerExtent(mapping), 0, 'f', 1)
        .arg(mapping.maxPhysicalExtent, 0, 'f', 1);
}
