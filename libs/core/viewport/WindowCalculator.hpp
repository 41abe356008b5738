/*
Tabula — WindowCalculator
Role: Derives the buffered logical row window from the viewport and the current scale mapping.
Inputs/Outputs: Takes ViewportMetrics, ScaleMapping and a buffer size; outputs a half-open RowWindow.
Threading: Pure functions; safe from any thread.
Integration: Called by ScrollController on every scroll, resize and row-count change.
Related: WindowCalculator.cpp, ScaleMapper.hpp.
*/
#pragma once
#include "ScaleMapper.hpp"
#include <QString>
#include <cstdint>

struct ViewportMetrics {
    double physicalScrollOffset = 0.0;
    double physicalHeight = 0.0;
};

// Half-open logical row range [startIndex, startIndex + count)
struct RowWindow {
    int64_t startIndex = 0;
    int64_t count = 0;

    int64_t endIndex() const { return startIndex + count; }
    bool empty() const { return count <= 0; }
    bool contains(int64_t index) const { return index >= startIndex && index < endIndex(); }
    bool covers(int64_t start, int64_t end) const { return start >= startIndex && end <= endIndex(); }

    bool operator==(const RowWindow&) const = default;
};

// Rows actually on screen, before buffering: [start, end)
struct VisibleRange {
    int64_t start = 0;
    int64_t end = 0;

    bool operator==(const VisibleRange&) const = default;
};

class WindowCalculator {
public:
    static VisibleRange visibleRange(const ViewportMetrics& viewport, const ScaleMapping& mapping);
    static RowWindow compute(const ViewportMetrics& viewport, const ScaleMapping& mapping, int bufferSize);

    static QString windowDebugString(const RowWindow& window);
};
