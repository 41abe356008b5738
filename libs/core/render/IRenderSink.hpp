#pragma once
#include "fetch/RowBatch.hpp"

// Paint surface the viewer core draws into; no rendering technology leaks back.
class IRenderSink {
public:
    virtual ~IRenderSink() = default;

    // At most once per resolved, non-stale fetch
    virtual void renderBatch(double physicalOffset, const RowBatch& rows) = 0;

    // On table-identity replacement, before the new session's first batch
    virtual void clear() = 0;
};
