/*
Tabula — MainWindow
Role: Top-level viewer window: virtual grid, toolbar actions and status strip.
Inputs/Outputs: Turns toolbar actions into provider jobs; feeds their identity events to the ScrollController.
Threading: Runs on the main GUI thread; provider completions arrive here already marshalled.
Performance: UI setup is a one-time cost; not on the scroll hot path.
Integration: Instantiated in apps/tabula_gui/main.cpp with a validated ViewerConfig.
Observability: Lifecycle via tLog_App, job failures via tLog_Warning.
Related: MainWindow.cpp, VirtualGridWidget.hpp, ScrollController.hpp, AsioTableProvider.hpp.
Assumptions: Owns the whole viewer stack; nothing outlives the window.
*/
#pragma once

#include <QMainWindow>
#include <QCloseEvent>
#include <memory>
#include "config/ViewerConfig.hpp"
#include "fetch/RowBatch.hpp"
#include "glue/ViewportEvents.hpp"

class AsioTableProvider;
class FetchOrchestrator;
class MemoryTableStore;
class ScrollController;
class StatusBar;
class TableSessionRegistry;
class VirtualGridWidget;
class QAction;

class MainWindow : public QMainWindow {
    Q_OBJECT

public:
    explicit MainWindow(const ViewerConfig& config, QWidget* parent = nullptr);
    ~MainWindow() override;

    // Kicks off the initial import: the configured file, or synthetic rows
    void loadInitialData();

private slots:
    void onOpen();
    void onSort();
    void onFilter();
    void onReset();
    void onGoToRow();

protected:
    void closeEvent(QCloseEvent* event) override;

private:
    void setupUI();
    void connectController();
    void importFile(const QString& path);
    void applyIdentity(const TableIdentityEvent& event);
    void onJobFailed(const char* job, const ProviderError& error);
    void setBusy(bool busy);
    std::string activeTableId() const;
    QStringList activeColumns() const;

    ViewerConfig                          m_config;
    std::unique_ptr<MemoryTableStore>     m_store;
    std::unique_ptr<AsioTableProvider>    m_provider;
    std::unique_ptr<TableSessionRegistry> m_registry;
    std::unique_ptr<FetchOrchestrator>    m_fetcher;
    std::unique_ptr<ScrollController>     m_controller;

    VirtualGridWidget* m_grid = nullptr;
    StatusBar*         m_statusBar = nullptr;
    QAction*           m_openAction = nullptr;
    QAction*           m_sortAction = nullptr;
    QAction*           m_filterAction = nullptr;
    QAction*           m_resetAction = nullptr;
    QAction*           m_gotoAction = nullptr;
    bool               m_busy = false;
};
