#include "WindowCalculator.hpp"
#include <algorithm>
#include <cmath>

namespace {

int64_t clampRow(double value, int64_t totalRows) {
    if (std::isnan(value) || value <= 0.0) return 0;
    if (value >= static_cast<double>(totalRows)) return totalRows;
    return static_cast<int64_t>(value);
}

}

VisibleRange WindowCalculator::visibleRange(const ViewportMetrics& viewport, const ScaleMapping& mapping) {
    VisibleRange range;
    if (mapping.totalRows <= 0) return range;

    const double top = std::max(0.0, viewport.physicalScrollOffset);
    const double bottom = top + std::max(0.0, viewport.physicalHeight);

    range.start = clampRow(std::floor(ScaleMapper::physicalToLogical(top, mapping)), mapping.totalRows);
    range.end = clampRow(std::ceil(ScaleMapper::physicalToLogical(bottom, mapping)), mapping.totalRows);

    // Scrolled past the spacer: keep the last row visible instead of an empty range
    if (range.start >= mapping.totalRows) {
        range.start = mapping.totalRows - 1;
    }
    range.end = std::max(range.end, range.start + 1);
    range.end = std::min(range.end, mapping.totalRows);
    return range;
}

RowWindow WindowCalculator::compute(const ViewportMetrics& viewport, const ScaleMapping& mapping, int bufferSize) {
    RowWindow window;
    if (mapping.totalRows <= 0) return window;

    const int64_t buffer = std::max(0, bufferSize);
    const VisibleRange visible = visibleRange(viewport, mapping);

    window.startIndex = std::clamp<int64_t>(visible.start - buffer, 0, mapping.totalRows);
    window.count = std::clamp<int64_t>(visible.end + buffer, 0, mapping.totalRows) - window.startIndex;
    return window;
}

QString WindowCalculator::windowDebugString(const RowWindow& window) {
    return QString("Window{%1..%2, count: %3}")
        .arg(window.startIndex)
        .arg(window.endIndex())
        .arg(window.count);
}
