/*
Tabula — ScaleMapper
Role: Maps between logical row space and the bounded physical scroll space of the host surface.
Inputs/Outputs: Takes row counts, row height and the physical ceiling; outputs scale factors and offsets.
Threading: Pure functions; safe from any thread.
Performance: Constant-time arithmetic, called on every scroll tick.
Integration: Used by WindowCalculator, ScrollController and the grid widget's scroll bar.
Observability: Invariant repairs are logged through tLog_Warning.
Related: ScaleMapper.cpp, WindowCalculator.hpp, ScrollController.hpp.
Assumptions: rowHeight and maxPhysicalExtent are positive (ViewerConfig validates them).
*/
#pragma once
#include <QString>
#include <cstdint>

struct ScaleMapping {
    double  rowHeight = 32.0;
    int64_t totalRows = 0;
    double  scaleFactor = 1.0;
    double  maxPhysicalExtent = 33'000'000.0;

    bool operator==(const ScaleMapping&) const = default;
};

class ScaleMapper {
public:
    // Core transformation functions
    static double computeScaleFactor(int64_t totalRows, double rowHeight, double maxExtent);
    static ScaleMapping makeMapping(int64_t totalRows, double rowHeight, double maxExtent);

    static double logicalToPhysical(double index, const ScaleMapping& mapping);
    static double physicalToLogical(double offset, const ScaleMapping& mapping);

    static double spacerExtent(int64_t totalRows, double rowHeight, double scaleFactor);
    static double spacerExtent(const ScaleMapping& mapping);

    // Largest scroll offset that still shows a full viewport
    static double maxScrollOffset(const ScaleMapping& mapping, double viewportHeight);
    static double clampScrollOffset(double offset, const ScaleMapping& mapping, double viewportHeight);

    // Validation and debugging
    static bool validateMapping(const ScaleMapping& mapping);
    static QString mappingDebugString(const ScaleMapping& mapping);

private:
    static constexpr double EPSILON = 1e-10;
};
