#pragma once
#include "RowBatch.hpp"
#include <functional>
#include <string>

// Windowed access to a remote/backing table store (no viewer logic).
// Implementations must invoke callbacks on the thread that owns the caller's
// event loop, exactly once per call: either the result or the error callback.
class ITableProvider {
public:
    using FetchCb = std::function<void(FetchResult)>;
    using ErrorCb = std::function<void(ProviderError)>;
    using DoneCb  = std::function<void()>;

    ITableProvider() = default;
    virtual ~ITableProvider() = default;

    virtual void fetchWindow(const std::string& tableId, int64_t startIndex, int64_t count,
                             FetchCb onResult, ErrorCb onError) = 0;

    virtual void dropTable(const std::string& tableId, DoneCb onDone, ErrorCb onError) = 0;
};
