/*
Tabula — VirtualGridWidget
Role: Scrollable grid surface; the scroll bar spans the scaled spacer, only the fetched window is painted.
Inputs/Outputs: Receives batches through IRenderSink; forwards scroll and resize to the ScrollController.
Threading: GUI thread only.
Performance: Paints the visible rows of the last batch; never holds more than one window of rows.
Integration: Created by MainWindow, which wires it to the controller with attachController().
Observability: Range and paint diagnostics via tLog_Render.
Related: VirtualGridWidget.cpp, IRenderSink.hpp, ScrollController.hpp.
Assumptions: Scroll bar ranges are int; the configured extent stays below INT_MAX.
*/
#pragma once
#include "render/IRenderSink.hpp"
#include "fetch/RowBatch.hpp"
#include "viewport/ScaleMapper.hpp"
#include <QAbstractScrollArea>
#include <QPointer>

class ScrollController;

class VirtualGridWidget : public QAbstractScrollArea, public IRenderSink {
    Q_OBJECT

public:
    explicit VirtualGridWidget(QWidget* parent = nullptr);
    ~VirtualGridWidget() override = default;

    void attachController(ScrollController* controller);

    // IRenderSink
    void renderBatch(double physicalOffset, const RowBatch& rows) override;
    void clear() override;

    const RowBatch& currentBatch() const { return m_batch; }
    int headerHeight() const { return m_headerHeight; }

protected:
    void paintEvent(QPaintEvent* event) override;
    void resizeEvent(QResizeEvent* event) override;
    void scrollContentsBy(int dx, int dy) override;

private slots:
    void onScaleChanged(const ScaleMapping& mapping);
    void onScrollPositionChanged(double physicalOffset);

private:
    void updateScrollRanges();
    void reportViewport();
    double dataHeight() const;
    int contentWidth() const;
    static QString cellText(const Cell& cell);

    QPointer<ScrollController> m_controller;
    RowBatch                   m_batch;
    double                     m_batchOffset = 0.0;
    bool                       m_hasBatch = false;
    bool                       m_syncing = false;

    int                        m_headerHeight = 28;
    int                        m_indexColumnWidth = 96;
    int                        m_columnWidth = 150;
};
