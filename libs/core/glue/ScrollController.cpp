#include "ScrollController.hpp"
#include "render/IRenderSink.hpp"
#include "session/TableSessionRegistry.hpp"
#include "TabulaLogging.hpp"
#include <QLocale>
#include <algorithm>
#include <cmath>
#include <exception>

namespace {

QString formatCount(int64_t value) {
    static const QLocale locale(QLocale::English, QLocale::UnitedStates);
    return locale.toString(static_cast<qlonglong>(value));
}

}

ScrollController::ScrollController(const ViewerConfig& config,
                                   TableSessionRegistry& registry,
                                   FetchOrchestrator& fetcher,
                                   IRenderSink& sink,
                                   QObject* parent)
    : QObject(parent)
    , m_config(config)
    , m_registry(registry)
    , m_fetcher(fetcher)
    , m_sink(sink)
    , m_rowHeight(config.rowHeight)
    , m_mapping(ScaleMapper::makeMapping(0, config.rowHeight, config.maxPhysicalExtent)) {
    connect(&m_fetcher, &FetchOrchestrator::batchReady, this, &ScrollController::onBatchReady);
    connect(&m_fetcher, &FetchOrchestrator::fetchFailed, this, &ScrollController::onFetchFailed);
    connect(&m_fetcher, &FetchOrchestrator::loadingChanged, this, &ScrollController::onLoadingChanged);
}

void ScrollController::handle(const ViewportEvent& event) {
    std::visit([this](const auto& e) { apply(e); }, event);
}

// -----------------------------------------------------------------------------
// Viewport events
// -----------------------------------------------------------------------------

void ScrollController::apply(const ScrollEvent& event) {
    moveScrollOffset(event.physicalOffset, false);
    tLog_Render("Scroll to" << m_viewport.physicalScrollOffset << "of" << spacerExtent());
    evaluateWindow();
}

void ScrollController::apply(const ResizeEvent& event) {
    m_viewport.physicalHeight = std::max(0.0, event.physicalHeight);
    moveScrollOffset(m_viewport.physicalScrollOffset, true);
    tLog_Render("Viewport height" << m_viewport.physicalHeight);
    evaluateWindow();
}

void ScrollController::apply(const RowHeightEvent& event) {
    if (!(event.rowHeight > 0.0)) {
        tLog_Warning("ScrollController: ignoring non-positive row height" << event.rowHeight);
        return;
    }
    m_rowHeight = event.rowHeight;
    recomputeMapping(m_mapping.totalRows);
    // Physical offset stays; its logical meaning moved with the new mapping
    moveScrollOffset(m_viewport.physicalScrollOffset, true);
    evaluateWindow();
}

void ScrollController::apply(const ScrollToRowEvent& event) {
    if (!m_registry.hasActiveSession()) return;
    const int64_t index = std::clamp<int64_t>(event.index, 0, std::max<int64_t>(0, m_mapping.totalRows - 1));
    moveScrollOffset(ScaleMapper::logicalToPhysical(static_cast<double>(index), m_mapping), true);
    tLog_Render("Scroll to row" << index << "->" << m_viewport.physicalScrollOffset);
    evaluateWindow();
}

void ScrollController::apply(const RowCountEvent& event) {
    if (!m_registry.hasActiveSession()) {
        tLog_Warning("ScrollController: row count update before any table was loaded");
        return;
    }
    if (!m_registry.updateTotalRows(event.totalRows)) return;

    // Scale recompute happens-before the window is re-evaluated
    recomputeMapping(m_registry.active().totalRows);
    moveScrollOffset(m_viewport.physicalScrollOffset, true);
    emit rowCountChanged(rowCountText());
    evaluateWindow();
}

void ScrollController::apply(const TableIdentityEvent& event) {
    const std::optional<TableSession> previous = m_registry.activeSession();
    const std::string previousBase = m_registry.baseTableId();

    const TableSession session = previous
        ? m_registry.replaceSession(event.tableId, event.totalRows, event.change)
        : m_registry.createSession(event.tableId, event.totalRows, event.change);

    if (previous && shouldRelease(*previous, session)) {
        m_fetcher.releaseTable(previous->tableId);
    }
    // A new import unpins the old root even when a derived view was on screen
    if (event.change == TableChange::Import && !previousBase.empty() && previousBase != session.tableId
        && (!previous || previous->tableId != previousBase)) {
        m_fetcher.releaseTable(previousBase);
    }

    recomputeMapping(session.totalRows);
    m_painted = RowWindow{};
    m_error.clear();
    emit errorStateChanged(false, QString());

    // A failing sink still leaves the new session scrolled to the top and fetching
    QString clearFailure;
    try {
        m_sink.clear();
    } catch (const std::exception& e) {
        clearFailure = QString("Failed to clear view: %1").arg(e.what());
    }

    // Fresh view starts at the top
    moveScrollOffset(0.0, true);

    setStatus(describe(event, session));
    emit rowCountChanged(rowCountText());
    tLog_App("Table" << toString(event.change) << ":" << sessionDebugString(session));

    setState(session.totalRows > 0 ? ViewState::Loading : ViewState::Ready);
    if (!clearFailure.isEmpty()) {
        tLog_Warning("ScrollController:" << clearFailure);
        setError(clearFailure);
    }
    evaluateWindow();
}

// -----------------------------------------------------------------------------
// Pipeline
// -----------------------------------------------------------------------------

void ScrollController::recomputeMapping(int64_t totalRows) {
    const ScaleMapping next = ScaleMapper::makeMapping(totalRows, m_rowHeight, m_config.maxPhysicalExtent);
    if (next == m_mapping) return;
    m_mapping = next;
    emit scaleChanged(m_mapping);
}

void ScrollController::moveScrollOffset(double offset, bool notifyHost) {
    const double clamped = ScaleMapper::clampScrollOffset(offset, m_mapping, m_viewport.physicalHeight);
    m_viewport.physicalScrollOffset = clamped;
    // A host-reported offset that needed clamping is corrected on the host too
    if (notifyHost || clamped != offset) {
        emit scrollPositionChanged(clamped);
    }
}

void ScrollController::evaluateWindow() {
    if (!m_registry.hasActiveSession()) return;

    const TableSession& session = m_registry.active();
    m_window = WindowCalculator::compute(m_viewport, m_mapping, m_config.bufferSize);
    tLog_Render("Window" << WindowCalculator::windowDebugString(m_window) << "gen" << session.generation);

    m_fetcher.request(session, m_window);
}

void ScrollController::onBatchReady(const FetchRequest& request, const RowBatch& batch, int64_t totalRows) {
    const double paintOffset = ScaleMapper::logicalToPhysical(static_cast<double>(batch.startIndex), m_mapping);
    bool painted = true;
    try {
        m_sink.renderBatch(paintOffset, batch);
    } catch (const std::exception& e) {
        painted = false;
        tLog_Warning("ScrollController: render of" << batch.size() << "rows failed:" << e.what());
        setError(QString("Failed to render rows %1-%2: %3")
                     .arg(request.window.startIndex + 1)
                     .arg(request.window.endIndex())
                     .arg(e.what()));
    }

    if (painted) {
        m_painted = request.window;
        tLog_Render("Painted" << batch.size() << "rows at" << paintOffset);

        if (!m_error.isEmpty()) {
            m_error.clear();
            emit errorStateChanged(false, QString());
        }
        setState(ViewState::Ready);
    }

    if (m_registry.hasActiveSession() && totalRows != m_registry.active().totalRows) {
        handle(RowCountEvent{totalRows});
    }
}

void ScrollController::onFetchFailed(const FetchRequest& request, const QString& message) {
    setError(QString("Failed to load rows %1-%2: %3")
                 .arg(request.window.startIndex + 1)
                 .arg(request.window.endIndex())
                 .arg(message));
}

void ScrollController::onLoadingChanged(bool loading) {
    emit loadingChanged(loading);
    if (m_state == ViewState::Error || m_state == ViewState::Empty) return;
    if (loading) {
        setState(ViewState::Loading);
    } else if (m_state == ViewState::Loading) {
        setState(ViewState::Ready);
    }
}

// -----------------------------------------------------------------------------
// Helpers
// -----------------------------------------------------------------------------

bool ScrollController::shouldRelease(const TableSession& previous, const TableSession& next) const {
    if (previous.tableId == next.tableId) return false;
    // The imported root stays pinned: reset-to-original returns to it
    return previous.tableId != m_registry.baseTableId();
}

QString ScrollController::describe(const TableIdentityEvent& event, const TableSession& session) const {
    const QString detail = QString::fromStdString(event.detail);
    switch (event.change) {
        case TableChange::Import:
            return QString("Loaded %1").arg(detail.isEmpty() ? QString::fromStdString(session.tableId) : detail);
        case TableChange::Sort:
            return detail.isEmpty() ? QString("Sorted") : QString("Sorted by %1").arg(detail);
        case TableChange::Filter:
            return QString("Filtered: %1 of %2 rows")
                .arg(formatCount(session.totalRows))
                .arg(formatCount(m_registry.baseRowCount()));
        case TableChange::Reset:
            return QString("Showing original dataset: %1 rows").arg(formatCount(session.totalRows));
    }
    return QString();
}

QString ScrollController::rowCountText() const {
    if (!m_registry.hasActiveSession()) return QString();
    return QString("%1 rows").arg(formatCount(m_registry.active().totalRows));
}

void ScrollController::setState(ViewState state) {
    if (m_state == state) return;
    m_state = state;
    emit stateChanged(state);
}

void ScrollController::setStatus(const QString& status) {
    if (m_status == status) return;
    m_status = status;
    emit statusChanged(status);
}

void ScrollController::setError(const QString& message) {
    m_error = message;
    setState(ViewState::Error);
    emit errorStateChanged(true, message);
}
