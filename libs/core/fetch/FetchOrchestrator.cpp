#include "FetchOrchestrator.hpp"
#include "session/TableSessionRegistry.hpp"
#include "TabulaLogging.hpp"
#include <QMetaObject>
#include <QPointer>
#include <exception>
#include <numeric>

FetchOrchestrator::FetchOrchestrator(ITableProvider& provider, const TableSessionRegistry& registry, QObject* parent)
    : QObject(parent)
    , m_provider(provider)
    , m_registry(registry) {
}

void FetchOrchestrator::request(const TableSession& session, const RowWindow& window) {
    if (window.empty()) {
        // Nothing to show; anything still in flight is now obsolete
        m_pending.reset();
        FetchRequest empty;
        empty.requestId = ++m_nextRequestId;
        empty.generation = session.generation;
        empty.tableId = session.tableId;
        empty.window = window;
        empty.issuedAt = std::chrono::steady_clock::now();
        m_latest = std::move(empty);
        m_latestState = LatestState::Succeeded;
        updateLoading();
        return;
    }

    PendingRequest candidate{session.generation, session.tableId, window};

    if (matchesLatest(candidate)) {
        if (m_pending) ++m_stats.coalesced;
        m_pending.reset();
        ++m_stats.deduplicated;
        updateLoading();
        return;
    }

    if (m_pending) {
        ++m_stats.coalesced;
        tLog_Debug("Coalesced pending window" << WindowCalculator::windowDebugString(m_pending->window)
                   << "->" << WindowCalculator::windowDebugString(window));
    }
    m_pending = std::move(candidate);
    updateLoading();
    scheduleDispatch();
}

void FetchOrchestrator::scheduleDispatch() {
    if (m_dispatchScheduled) return;
    m_dispatchScheduled = true;

    QPointer<FetchOrchestrator> self(this);
    QMetaObject::invokeMethod(this, [self]{
        if (!self) return;
        self->dispatchPending();
    }, Qt::QueuedConnection);
}

void FetchOrchestrator::dispatchPending() {
    m_dispatchScheduled = false;
    if (!m_pending) return;

    if (!m_registry.isCurrent(m_pending->generation)) {
        tLog_Debug("Dropping pending window for retired generation" << m_pending->generation);
        m_pending.reset();
        updateLoading();
        return;
    }

    // Same generation already in flight: wait for it, then send only the newest window
    if (m_latestState == LatestState::InFlight && m_latest && m_latest->generation == m_pending->generation) {
        return;
    }

    PendingRequest next = std::move(*m_pending);
    m_pending.reset();
    issue(next);
}

void FetchOrchestrator::issue(const PendingRequest& pending) {
    FetchRequest request;
    request.requestId = ++m_nextRequestId;
    request.generation = pending.generation;
    request.tableId = pending.tableId;
    request.window = pending.window;
    request.issuedAt = std::chrono::steady_clock::now();

    m_latest = request;
    m_latestState = LatestState::InFlight;
    ++m_inFlightByTable[request.tableId];
    m_pendingDrops.erase(request.tableId);
    ++m_stats.issued;
    updateLoading();

    tLog_Data("Fetch #" << request.requestId << "gen" << request.generation
              << QString::fromStdString(request.tableId) << WindowCalculator::windowDebugString(request.window));

    QPointer<FetchOrchestrator> self(this);
    try {
        m_provider.fetchWindow(request.tableId, request.window.startIndex, request.window.count,
            [self, request](FetchResult result) {
                if (!self) return;
                self->onResult(request, std::move(result));
            },
            [self, request](ProviderError error) {
                if (!self) return;
                self->onError(request, error);
            });
    } catch (const std::exception& e) {
        onError(request, ProviderError{ProviderErrorKind::Internal, e.what()});
    }
}

void FetchOrchestrator::onResult(const FetchRequest& request, FetchResult result) {
    if (isAcceptable(request)) {
        m_latestState = LatestState::Succeeded;
        ++m_stats.accepted;

        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - request.issuedAt).count();
        tLog_Data("Fetch #" << request.requestId << "accepted:" << result.batch.size()
                  << "rows in" << elapsed << "ms, provider total" << result.totalRows);

        result.batch.startIndex = request.window.startIndex;
        settle(request);
        emit batchReady(request, result.batch, result.totalRows);
        return;
    }

    ++m_stats.discarded;
    tLog_Debug("Fetch #" << request.requestId << "stale on arrival (gen" << request.generation << ") - discarded");
    settle(request);
}

void FetchOrchestrator::onError(const FetchRequest& request, const ProviderError& error) {
    if (isAcceptable(request)) {
        m_latestState = LatestState::Failed;
        ++m_stats.failed;

        const QString message = QString("%1: %2")
            .arg(toString(error.kind))
            .arg(QString::fromStdString(error.message));
        tLog_Warning("Fetch #" << request.requestId << "failed:" << message);

        settle(request);
        emit fetchFailed(request, message);
        return;
    }

    ++m_stats.discarded;
    tLog_Debug("Fetch #" << request.requestId << "failed after being superseded - ignored");
    settle(request);
}

void FetchOrchestrator::settle(const FetchRequest& request) {
    auto it = m_inFlightByTable.find(request.tableId);
    if (it != m_inFlightByTable.end()) {
        if (--it->second <= 0) {
            m_inFlightByTable.erase(it);
            if (m_pendingDrops.erase(request.tableId) > 0) {
                dropNow(request.tableId);
            }
        }
    }

    if (m_pending) {
        scheduleDispatch();
    }
    updateLoading();
}

bool FetchOrchestrator::isAcceptable(const FetchRequest& request) const {
    return m_latest
        && m_latest->requestId == request.requestId
        && m_latestState == LatestState::InFlight
        && m_registry.isCurrent(request.generation);
}

bool FetchOrchestrator::matchesLatest(const PendingRequest& candidate) const {
    if (!m_latest) return false;
    if (m_latestState == LatestState::Failed || m_latestState == LatestState::None) return false;
    return m_latest->generation == candidate.generation
        && m_latest->tableId == candidate.tableId
        && m_latest->window == candidate.window;
}

void FetchOrchestrator::releaseTable(const std::string& tableId) {
    if (m_inFlightByTable.count(tableId) > 0) {
        m_pendingDrops.insert(tableId);
        tLog_Data("Table" << QString::fromStdString(tableId) << "released; drop deferred until fetches settle");
        return;
    }
    dropNow(tableId);
}

void FetchOrchestrator::dropNow(const std::string& tableId) {
    tLog_Data("Dropping table" << QString::fromStdString(tableId));
    try {
        m_provider.dropTable(tableId,
            [tableId] {
                tLog_Data("Table" << QString::fromStdString(tableId) << "dropped");
            },
            [tableId](ProviderError error) {
                tLog_Warning("Dropping table" << QString::fromStdString(tableId) << "failed:"
                             << QString::fromStdString(error.message));
            });
    } catch (const std::exception& e) {
        tLog_Warning("Dropping table" << QString::fromStdString(tableId) << "failed:" << e.what());
    }
}

int FetchOrchestrator::inFlightCount() const {
    return std::accumulate(m_inFlightByTable.begin(), m_inFlightByTable.end(), 0,
                           [](int acc, const auto& entry) { return acc + entry.second; });
}

void FetchOrchestrator::updateLoading() {
    const bool loading = isLoading();
    if (loading == m_loading) return;
    m_loading = loading;
    emit loadingChanged(loading);
}
