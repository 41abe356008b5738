/*
Tabula — FetchOrchestrator
Role: Issues windowed fetches against the active session and lets only current results through.
Inputs/Outputs: Takes (session, window) requests; emits batchReady / fetchFailed for the latest request only.
Threading: Lives on the event thread; provider callbacks are expected on the same thread.
Performance: Requests made within one event-loop turn collapse into one dispatch; while the latest
             request of a generation is in flight, newer windows wait and only the newest is sent.
Integration: Owned by the viewer context; driven by ScrollController.
Observability: Accepted fetches and failures via tLog_Data; stale discards via tLog_Debug.
Related: FetchOrchestrator.cpp, ITableProvider.hpp, TableSessionRegistry.hpp.
Assumptions: The provider and the registry outlive this object.
*/
#pragma once
#include "ITableProvider.hpp"
#include "RowBatch.hpp"
#include "session/TableSession.hpp"
#include "viewport/WindowCalculator.hpp"
#include <QObject>
#include <QString>
#include <chrono>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>

class TableSessionRegistry;

struct FetchRequest {
    uint64_t    requestId = 0;
    uint64_t    generation = 0;
    std::string tableId;
    RowWindow   window;
    std::chrono::steady_clock::time_point issuedAt{};
};

struct FetchStats {
    uint64_t issued = 0;
    uint64_t coalesced = 0;      // pending window replaced before dispatch
    uint64_t deduplicated = 0;   // identical to the latest request
    uint64_t accepted = 0;
    uint64_t discarded = 0;      // stale on arrival
    uint64_t failed = 0;
};

class FetchOrchestrator : public QObject {
    Q_OBJECT

public:
    FetchOrchestrator(ITableProvider& provider, const TableSessionRegistry& registry, QObject* parent = nullptr);

    void request(const TableSession& session, const RowWindow& window);
    void dispatchPending();

    // Drop the table through the provider once no fetch references it
    void releaseTable(const std::string& tableId);

    bool hasPendingRequest() const { return m_pending.has_value(); }
    bool isLatestInFlight() const { return m_latestState == LatestState::InFlight; }
    bool isLoading() const { return hasPendingRequest() || isLatestInFlight(); }
    int inFlightCount() const;
    const std::optional<FetchRequest>& latestRequest() const { return m_latest; }
    const FetchStats& stats() const { return m_stats; }

signals:
    void batchReady(const FetchRequest& request, const RowBatch& batch, int64_t totalRows);
    void fetchFailed(const FetchRequest& request, const QString& message);
    void loadingChanged(bool loading);

private:
    enum class LatestState { None, InFlight, Succeeded, Failed };

    struct PendingRequest {
        uint64_t    generation = 0;
        std::string tableId;
        RowWindow   window;
    };

    void scheduleDispatch();
    void issue(const PendingRequest& pending);
    void onResult(const FetchRequest& request, FetchResult result);
    void onError(const FetchRequest& request, const ProviderError& error);
    void settle(const FetchRequest& request);
    bool isAcceptable(const FetchRequest& request) const;
    bool matchesLatest(const PendingRequest& candidate) const;
    void updateLoading();
    void dropNow(const std::string& tableId);

    ITableProvider&                      m_provider;
    const TableSessionRegistry&          m_registry;

    std::optional<PendingRequest>        m_pending;
    std::optional<FetchRequest>          m_latest;
    LatestState                          m_latestState = LatestState::None;
    uint64_t                             m_nextRequestId = 0;
    bool                                 m_dispatchScheduled = false;
    bool                                 m_loading = false;

    std::unordered_map<std::string, int> m_inFlightByTable;
    std::set<std::string>                m_pendingDrops;
    FetchStats                           m_stats;
};
