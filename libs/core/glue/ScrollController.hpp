/*
Tabula — ScrollController
Role: State machine wiring viewport events to the scale mapper, window calculator and fetch orchestrator.
Inputs/Outputs: Consumes ViewportEvent values; paints accepted batches into the IRenderSink and emits
                scroll range, scroll position, status and error changes for the host widget.
Threading: Lives on the event thread; every mutation of viewport, session and mapping happens here.
Integration: Owned by the viewer context next to the registry and the orchestrator.
Observability: Scroll ticks via tLog_Render (throttled), identity changes via tLog_App.
Related: ScrollController.cpp, ViewportEvents.hpp, FetchOrchestrator.hpp, IRenderSink.hpp.
Assumptions: The registry, orchestrator and sink outlive this object.
*/
#pragma once
#include "ViewportEvents.hpp"
#include "config/ViewerConfig.hpp"
#include "fetch/FetchOrchestrator.hpp"
#include "viewport/ScaleMapper.hpp"
#include "viewport/WindowCalculator.hpp"
#include <QObject>
#include <QString>

class IRenderSink;
class TableSessionRegistry;

enum class ViewState {
    Empty,      // no table yet
    Loading,
    Ready,
    Error
};

class ScrollController : public QObject {
    Q_OBJECT

public:
    ScrollController(const ViewerConfig& config,
                     TableSessionRegistry& registry,
                     FetchOrchestrator& fetcher,
                     IRenderSink& sink,
                     QObject* parent = nullptr);

    void handle(const ViewportEvent& event);

    void onScroll(double physicalOffset) { handle(ScrollEvent{physicalOffset}); }
    void onResize(double physicalHeight) { handle(ResizeEvent{physicalHeight}); }
    void scrollToRow(int64_t index) { handle(ScrollToRowEvent{index}); }

    const ScaleMapping& mapping() const { return m_mapping; }
    const ViewportMetrics& viewport() const { return m_viewport; }
    const RowWindow& currentWindow() const { return m_window; }
    const RowWindow& lastPaintedWindow() const { return m_painted; }
    VisibleRange visibleRange() const { return WindowCalculator::visibleRange(m_viewport, m_mapping); }
    double spacerExtent() const { return ScaleMapper::spacerExtent(m_mapping); }
    double maxScrollOffset() const { return ScaleMapper::maxScrollOffset(m_mapping, m_viewport.physicalHeight); }

    ViewState state() const { return m_state; }
    const QString& statusText() const { return m_status; }
    QString rowCountText() const;
    const QString& errorMessage() const { return m_error; }

signals:
    void scaleChanged(const ScaleMapping& mapping);
    void scrollPositionChanged(double physicalOffset);   // controller-initiated moves only
    void stateChanged(ViewState state);
    void statusChanged(const QString& status);
    void rowCountChanged(const QString& label);
    void errorStateChanged(bool hasError, const QString& message);
    void loadingChanged(bool loading);

private:
    void apply(const ScrollEvent& event);
    void apply(const ResizeEvent& event);
    void apply(const RowHeightEvent& event);
    void apply(const ScrollToRowEvent& event);
    void apply(const RowCountEvent& event);
    void apply(const TableIdentityEvent& event);

    void recomputeMapping(int64_t totalRows);
    void moveScrollOffset(double offset, bool notifyHost);
    void evaluateWindow();
    void onBatchReady(const FetchRequest& request, const RowBatch& batch, int64_t totalRows);
    void onFetchFailed(const FetchRequest& request, const QString& message);
    void onLoadingChanged(bool loading);

    bool shouldRelease(const TableSession& previous, const TableSession& next) const;
    QString describe(const TableIdentityEvent& event, const TableSession& session) const;
    void setState(ViewState state);
    void setStatus(const QString& status);
    void setError(const QString& message);

    ViewerConfig           m_config;
    TableSessionRegistry&  m_registry;
    FetchOrchestrator&     m_fetcher;
    IRenderSink&           m_sink;

    double                 m_rowHeight;
    ScaleMapping           m_mapping;
    ViewportMetrics        m_viewport;
    RowWindow              m_window;
    RowWindow              m_painted;

    ViewState              m_state = ViewState::Empty;
    QString                m_status;
    QString                m_error;
};
