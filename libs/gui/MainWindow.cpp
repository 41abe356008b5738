#include "MainWindow.hpp"
#include "widgets/StatusBar.hpp"
#include "widgets/VirtualGridWidget.hpp"
#include "fetch/FetchOrchestrator.hpp"
#include "glue/ScrollController.hpp"
#include "provider/AsioTableProvider.hpp"
#include "provider/FilterCondition.hpp"
#include "provider/MemoryTableStore.hpp"
#include "provider/TableLoader.hpp"
#include "session/TableSessionRegistry.hpp"
#include "TabulaLogging.hpp"
#include <QAction>
#include <QFileDialog>
#include <QInputDialog>
#include <QLineEdit>
#include <QMessageBox>
#include <QStatusBar>
#include <QToolBar>
#include <chrono>

MainWindow::MainWindow(const ViewerConfig& config, QWidget* parent)
    : QMainWindow(parent)
    , m_config(config)
{
    AsioTableProvider::Options options;
    options.workerThreads = config.workerThreads;
    options.latency = std::chrono::milliseconds(config.latencyMs);
    options.timeout = std::chrono::milliseconds(config.timeoutMs);

    m_store = std::make_unique<MemoryTableStore>();
    m_provider = std::make_unique<AsioTableProvider>(*m_store, options);
    m_registry = std::make_unique<TableSessionRegistry>();
    m_fetcher = std::make_unique<FetchOrchestrator>(*m_provider, *m_registry);

    setupUI();

    m_controller = std::make_unique<ScrollController>(m_config, *m_registry, *m_fetcher, *m_grid);
    connectController();
    m_grid->attachController(m_controller.get());

    m_provider->start();
    tLog_App("MainWindow created");
}

MainWindow::~MainWindow() {
    // Stop workers before the store and the stack above them go away
    m_provider->stop();
    tLog_App("MainWindow destroyed");
}

void MainWindow::setupUI() {
    setWindowTitle("Tabula");
    resize(1200, 760);

    m_grid = new VirtualGridWidget(this);
    setCentralWidget(m_grid);

    QToolBar* toolbar = addToolBar("Table");
    toolbar->setMovable(false);
    m_openAction = toolbar->addAction("Open...", this, &MainWindow::onOpen);
    toolbar->addSeparator();
    m_sortAction = toolbar->addAction("Sort", this, &MainWindow::onSort);
    m_filterAction = toolbar->addAction("Filter", this, &MainWindow::onFilter);
    m_resetAction = toolbar->addAction("Reset", this, &MainWindow::onReset);
    toolbar->addSeparator();
    m_gotoAction = toolbar->addAction("Go to row", this, &MainWindow::onGoToRow);

    m_statusBar = new StatusBar(this);
    statusBar()->addPermanentWidget(m_statusBar, 1);
    statusBar()->setStyleSheet("QStatusBar { background-color: #1e1e1e; border-top: 1px solid #333; }");
}

void MainWindow::connectController() {
    connect(m_controller.get(), &ScrollController::statusChanged, m_statusBar, [this](const QString& status) {
        m_statusBar->setReadyStatus(status);
    });
    connect(m_controller.get(), &ScrollController::rowCountChanged, m_statusBar, &StatusBar::setRowCount);
    connect(m_controller.get(), &ScrollController::loadingChanged, m_statusBar, &StatusBar::setLoading);
    connect(m_controller.get(), &ScrollController::errorStateChanged, m_statusBar, &StatusBar::setError);
}

// -----------------------------------------------------------------------------
// Data jobs
// -----------------------------------------------------------------------------

void MainWindow::loadInitialData() {
    if (!m_config.dataSource.isEmpty()) {
        importFile(m_config.dataSource);
        return;
    }

    setBusy(true);
    m_statusBar->setReadyStatus(QString("Generating %1 rows...").arg(m_config.syntheticRows));
    m_provider->importSyntheticAsync("synthetic", m_config.syntheticRows,
        [this](TableIdentityEvent event) { applyIdentity(event); },
        [this](ProviderError error) { onJobFailed("import", error); });
}

void MainWindow::importFile(const QString& path) {
    LoadedTable table;
    try {
        table = TableLoader::loadFile(path.toStdString());
    } catch (const std::exception& e) {
        tLog_Warning("Import failed:" << e.what());
        QMessageBox::warning(this, "Import failed", QString::fromUtf8(e.what()));
        return;
    }

    tLog_App("Importing" << path << "with" << table.rows.size() << "rows");
    setBusy(true);
    m_statusBar->setReadyStatus(QString("Importing %1...").arg(QString::fromStdString(table.name)));

    m_provider->importRowsAsync(table.name, std::move(table.columns), std::move(table.rows),
        m_config.importChunkRows,
        [this](TableIdentityEvent event) { m_controller->handle(event); },
        [this](RowCountEvent event) { m_controller->handle(event); },
        [this]() { setBusy(false); },
        [this](ProviderError error) { onJobFailed("import", error); });
}

void MainWindow::applyIdentity(const TableIdentityEvent& event) {
    setBusy(false);
    m_controller->handle(event);
}

void MainWindow::onJobFailed(const char* job, const ProviderError& error) {
    setBusy(false);
    const QString message = QString("%1 failed (%2): %3")
        .arg(job).arg(toString(error.kind)).arg(QString::fromStdString(error.message));
    tLog_Warning("MainWindow:" << message);
    m_statusBar->setError(true, message);
}

void MainWindow::setBusy(bool busy) {
    m_busy = busy;
    m_openAction->setEnabled(!busy);
    m_sortAction->setEnabled(!busy);
    m_filterAction->setEnabled(!busy);
    m_resetAction->setEnabled(!busy);
    m_statusBar->setLoading(busy);
}

std::string MainWindow::activeTableId() const {
    const auto session = m_registry->activeSession();
    return session ? session->tableId : std::string();
}

QStringList MainWindow::activeColumns() const {
    QStringList result;
    const std::string tableId = activeTableId();
    if (tableId.empty() || !m_store->contains(tableId)) return result;
    for (const auto& column : m_store->columns(tableId)) {
        result << QString::fromStdString(column);
    }
    return result;
}

// -----------------------------------------------------------------------------
// Toolbar actions
// -----------------------------------------------------------------------------

void MainWindow::onOpen() {
    const QString path = QFileDialog::getOpenFileName(this, "Open table", QString(), "JSON tables (*.json)");
    if (!path.isEmpty()) importFile(path);
}

void MainWindow::onSort() {
    const QStringList columns = activeColumns();
    if (columns.isEmpty() || m_busy) return;

    bool ok = false;
    const QString column = QInputDialog::getItem(this, "Sort", "Column:", columns, 0, false, &ok);
    if (!ok) return;
    const QString direction = QInputDialog::getItem(this, "Sort", "Direction:",
                                                    {"ascending", "descending"}, 0, false, &ok);
    if (!ok) return;

    setBusy(true);
    m_provider->sortAsync(activeTableId(), column.toStdString(), direction == "ascending",
        [this](TableIdentityEvent event) { applyIdentity(event); },
        [this](ProviderError error) { onJobFailed("sort", error); });
}

void MainWindow::onFilter() {
    const QStringList columns = activeColumns();
    if (columns.isEmpty() || m_busy) return;

    bool ok = false;
    const QString column = QInputDialog::getItem(this, "Filter", "Column:", columns, 0, false, &ok);
    if (!ok) return;
    const QString op = QInputDialog::getItem(this, "Filter", "Operator:",
                                             {"=", "!=", ">", ">=", "<", "<=", "contains"}, 0, false, &ok);
    if (!ok) return;
    const QString value = QInputDialog::getText(this, "Filter", "Value:", QLineEdit::Normal, QString(), &ok);
    if (!ok) return;

    FilterCondition condition;
    condition.column = column.toStdString();
    condition.op = FilterCondition::parseOp(op.toStdString()).value_or(FilterCondition::Op::Eq);
    condition.value = FilterCondition::parseValue(value.toStdString());

    setBusy(true);
    m_provider->filterAsync(activeTableId(), {condition},
        [this](TableIdentityEvent event) { applyIdentity(event); },
        [this](ProviderError error) { onJobFailed("filter", error); });
}

void MainWindow::onReset() {
    const std::string tableId = activeTableId();
    if (tableId.empty() || m_busy) return;

    setBusy(true);
    m_provider->resetAsync(tableId,
        [this](TableIdentityEvent event) { applyIdentity(event); },
        [this](ProviderError error) { onJobFailed("reset", error); });
}

void MainWindow::onGoToRow() {
    if (!m_registry->hasActiveSession()) return;
    const int64_t total = m_registry->active().totalRows;

    bool ok = false;
    const QString text = QInputDialog::getText(this, "Go to row",
                                               QString("Row (1 - %1):").arg(total),
                                               QLineEdit::Normal, QString(), &ok);
    if (!ok) return;
    const qlonglong row = text.trimmed().toLongLong(&ok);
    if (!ok || row < 1 || row > total) {
        QMessageBox::information(this, "Go to row", QString("Enter a row between 1 and %1").arg(total));
        return;
    }
    m_controller->scrollToRow(static_cast<int64_t>(row - 1));
}

void MainWindow::closeEvent(QCloseEvent* event) {
    m_provider->stop();
    QMainWindow::closeEvent(event);
}
