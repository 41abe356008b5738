/*
Tabula — main.cpp
Role: Entry point for the Tabula GUI viewer.
*/
#include "MainWindow.hpp"
#include "config/ViewerConfig.hpp"
#include "TabulaLogging.hpp"
#include <QApplication>
#include <QMessageBox>
#include <stdexcept>

int main(int argc, char *argv[])
{
    tLog_App("[Tabula viewer starting...]");

    QApplication app(argc, argv);
    QApplication::setApplicationName("Tabula");

    // Optional first argument: config file path
    const QString configPath = argc > 1 ? QString::fromLocal8Bit(argv[1]) : QString();

    ViewerConfig config;
    try {
        config = ViewerConfig::load(configPath);
    } catch (const std::invalid_argument& e) {
        tLog_Error("Invalid configuration:" << e.what());
        QMessageBox::critical(nullptr, "Tabula", QString("Invalid configuration: %1").arg(e.what()));
        return 1;
    }

    MainWindow window(config);
    window.show();
    window.loadInitialData();

    tLog_App("Starting Qt event loop");
    return app.exec();
}
