#include "VirtualGridWidget.hpp"
#include "glue/ScrollController.hpp"
#include "TabulaLogging.hpp"
#include <QPainter>
#include <QResizeEvent>
#include <QScrollBar>
#include <algorithm>
#include <climits>
#include <cmath>

namespace {
const QColor kBackground(0x1e, 0x1e, 0x1e);
const QColor kHeaderBackground(0x2b, 0x2b, 0x2b);
const QColor kGridLine(0x3a, 0x3a, 0x3a);
const QColor kText(0xdd, 0xdd, 0xdd);
const QColor kDimText(0x77, 0x77, 0x77);
const QColor kAltRow(0x24, 0x24, 0x24);
}

VirtualGridWidget::VirtualGridWidget(QWidget* parent)
    : QAbstractScrollArea(parent) {
    setVerticalScrollBarPolicy(Qt::ScrollBarAlwaysOn);
    setHorizontalScrollBarPolicy(Qt::ScrollBarAsNeeded);
    viewport()->setAutoFillBackground(true);
    QPalette pal = viewport()->palette();
    pal.setColor(QPalette::Window, kBackground);
    viewport()->setPalette(pal);
    setMinimumSize(480, 320);
}

void VirtualGridWidget::attachController(ScrollController* controller) {
    m_controller = controller;
    connect(controller, &ScrollController::scaleChanged, this, &VirtualGridWidget::onScaleChanged);
    connect(controller, &ScrollController::scrollPositionChanged, this, &VirtualGridWidget::onScrollPositionChanged);
    reportViewport();
    updateScrollRanges();
}

// -----------------------------------------------------------------------------
// IRenderSink
// -----------------------------------------------------------------------------

void VirtualGridWidget::renderBatch(double physicalOffset, const RowBatch& rows) {
    const bool columnsChanged = rows.columns != m_batch.columns;
    m_batch = rows;
    m_batchOffset = physicalOffset;
    m_hasBatch = true;
    if (columnsChanged) updateScrollRanges();
    viewport()->update();
}

void VirtualGridWidget::clear() {
    m_batch = RowBatch{};
    m_hasBatch = false;
    horizontalScrollBar()->setValue(0);
    viewport()->update();
}

// -----------------------------------------------------------------------------
// Scrolling
// -----------------------------------------------------------------------------

void VirtualGridWidget::onScaleChanged(const ScaleMapping& mapping) {
    tLog_Render("Grid spacer" << ScaleMapper::spacerExtent(mapping) << "scale" << mapping.scaleFactor);
    updateScrollRanges();
}

void VirtualGridWidget::onScrollPositionChanged(double physicalOffset) {
    // Controller-initiated move; do not echo it back
    m_syncing = true;
    updateScrollRanges();
    verticalScrollBar()->setValue(static_cast<int>(std::lround(physicalOffset)));
    m_syncing = false;
    viewport()->update();
}

void VirtualGridWidget::scrollContentsBy(int dx, int dy) {
    Q_UNUSED(dx);
    if (dy != 0 && !m_syncing && m_controller) {
        m_controller->onScroll(static_cast<double>(verticalScrollBar()->value()));
    }
    viewport()->update();
}

void VirtualGridWidget::resizeEvent(QResizeEvent* event) {
    QAbstractScrollArea::resizeEvent(event);
    reportViewport();
    updateScrollRanges();
}

void VirtualGridWidget::reportViewport() {
    if (m_controller) {
        m_controller->onResize(dataHeight());
    }
}

void VirtualGridWidget::updateScrollRanges() {
    QScrollBar* vbar = verticalScrollBar();
    if (!m_controller) {
        vbar->setRange(0, 0);
        return;
    }

    const ScaleMapping& mapping = m_controller->mapping();
    const double maxOffset = std::min(m_controller->maxScrollOffset(), static_cast<double>(INT_MAX));
    const double rowStep = mapping.rowHeight / mapping.scaleFactor;

    const bool wasSyncing = m_syncing;
    m_syncing = true;
    vbar->setRange(0, static_cast<int>(std::ceil(maxOffset)));
    vbar->setPageStep(std::max(1, static_cast<int>(dataHeight())));
    vbar->setSingleStep(std::max(1, static_cast<int>(std::lround(rowStep))));

    QScrollBar* hbar = horizontalScrollBar();
    hbar->setRange(0, std::max(0, contentWidth() - viewport()->width()));
    hbar->setPageStep(viewport()->width());
    hbar->setSingleStep(m_columnWidth / 4);
    m_syncing = wasSyncing;
}

double VirtualGridWidget::dataHeight() const {
    return std::max(0, viewport()->height() - m_headerHeight);
}

int VirtualGridWidget::contentWidth() const {
    return m_indexColumnWidth + m_columnWidth * static_cast<int>(m_batch.columns.size());
}

// -----------------------------------------------------------------------------
// Painting
// -----------------------------------------------------------------------------

QString VirtualGridWidget::cellText(const Cell& cell) {
    if (cell.is_null()) return QStringLiteral("NULL");
    if (cell.is_string()) return QString::fromStdString(cell.get<std::string>());
    if (cell.is_boolean()) return cell.get<bool>() ? QStringLiteral("true") : QStringLiteral("false");
    return QString::fromStdString(cell.dump());
}

void VirtualGridWidget::paintEvent(QPaintEvent* event) {
    Q_UNUSED(event);
    QPainter painter(viewport());
    const int width = viewport()->width();
    const int height = viewport()->height();
    const int xOffset = horizontalScrollBar()->value();

    if (!m_controller || !m_hasBatch) {
        painter.setPen(kDimText);
        const bool loading = m_controller && m_controller->state() == ViewState::Loading;
        painter.drawText(viewport()->rect(), Qt::AlignCenter, loading ? "Loading rows..." : "No data");
        return;
    }

    const ScaleMapping& mapping = m_controller->mapping();
    const double rowHeight = mapping.rowHeight;
    const double topRow = ScaleMapper::physicalToLogical(m_controller->viewport().physicalScrollOffset, mapping);
    const int64_t firstRow = static_cast<int64_t>(std::floor(topRow));
    const double yStart = m_headerHeight - (topRow - static_cast<double>(firstRow)) * rowHeight;
    const int64_t visibleRows = static_cast<int64_t>(std::ceil(dataHeight() / rowHeight)) + 1;

    const int64_t batchStart = m_batch.startIndex;
    const int64_t batchEnd = batchStart + static_cast<int64_t>(m_batch.rows.size());
    const QFontMetrics metrics(font());

    for (int64_t k = 0; k < visibleRows; ++k) {
        const int64_t row = firstRow + k;
        if (row >= mapping.totalRows) break;
        const int y = static_cast<int>(std::lround(yStart + static_cast<double>(k) * rowHeight));
        const int h = static_cast<int>(std::lround(rowHeight));

        if (row % 2 == 1) painter.fillRect(0, y, width, h, kAltRow);

        // Row number column
        painter.setPen(kDimText);
        painter.drawText(QRect(4, y, m_indexColumnWidth - 12, h), Qt::AlignRight | Qt::AlignVCenter,
                         QString::number(row + 1));

        if (row < batchStart || row >= batchEnd) {
            painter.drawText(QRect(m_indexColumnWidth - xOffset + 8, y, m_columnWidth, h),
                             Qt::AlignLeft | Qt::AlignVCenter, QStringLiteral("..."));
            continue;
        }

        const Row& cells = m_batch.rows[static_cast<std::size_t>(row - batchStart)];
        for (std::size_t c = 0; c < m_batch.columns.size(); ++c) {
            const int x = m_indexColumnWidth + static_cast<int>(c) * m_columnWidth - xOffset;
            if (x + m_columnWidth < m_indexColumnWidth || x > width) continue;

            const Cell& cell = c < cells.size() ? cells[c] : Cell();
            const Qt::Alignment align = cell.is_number() ? Qt::AlignRight : Qt::AlignLeft;
            painter.setPen(cell.is_null() ? kDimText : kText);
            const QRect box(std::max(x, m_indexColumnWidth) + 8, y, m_columnWidth - 16, h);
            painter.drawText(box, align | Qt::AlignVCenter,
                             metrics.elidedText(cellText(cell), Qt::ElideRight, box.width()));
        }
    }

    // Header and grid lines on top of the rows
    painter.fillRect(0, 0, width, m_headerHeight, kHeaderBackground);
    painter.setPen(kText);
    painter.drawText(QRect(4, 0, m_indexColumnWidth - 12, m_headerHeight), Qt::AlignRight | Qt::AlignVCenter,
                     QStringLiteral("#"));
    for (std::size_t c = 0; c < m_batch.columns.size(); ++c) {
        const int x = m_indexColumnWidth + static_cast<int>(c) * m_columnWidth - xOffset;
        if (x + m_columnWidth < m_indexColumnWidth || x > width) continue;
        painter.setPen(kText);
        painter.drawText(QRect(std::max(x, m_indexColumnWidth) + 8, 0, m_columnWidth - 16, m_headerHeight),
                         Qt::AlignLeft | Qt::AlignVCenter, QString::fromStdString(m_batch.columns[c]));
        painter.setPen(kGridLine);
        if (x >= m_indexColumnWidth) painter.drawLine(x, 0, x, height);
    }
    painter.setPen(kGridLine);
    painter.drawLine(0, m_headerHeight, width, m_headerHeight);
    painter.drawLine(m_indexColumnWidth, 0, m_indexColumnWidth, height);

    tLog_Render("Painted grid rows" << firstRow << "+" << visibleRows << "from batch at" << m_batchOffset);
}
