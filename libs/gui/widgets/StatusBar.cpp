#include "StatusBar.hpp"
#include <QHBoxLayout>
#include <QTimer>

namespace {
const char* kSpinnerFrames[] = {"Loading   ", "Loading.  ", "Loading.. ", "Loading..."};
}

StatusBar::StatusBar(QWidget* parent)
    : QWidget(parent)
{
    setStyleSheet(
        "StatusBar { "
        "  background-color: transparent; "  // Let parent QStatusBar handle background
        "  border: none; "
        "}"
    );

    QHBoxLayout* layout = new QHBoxLayout(this);
    layout->setContentsMargins(8, 2, 8, 2);
    layout->setSpacing(12);

    // Left: table status
    m_readyLabel = new QLabel("Ready", this);
    m_readyLabel->setStyleSheet("QLabel { color: #888; font-size: 10px; }");
    layout->addWidget(m_readyLabel);

    // Failed fetch, hidden until one happens
    m_errorLabel = new QLabel(this);
    m_errorLabel->setStyleSheet("QLabel { color: #ff4444; font-size: 10px; }");
    m_errorLabel->hide();
    layout->addWidget(m_errorLabel);

    layout->addStretch();

    // Right: loading indicator and row count
    m_loadingLabel = new QLabel(this);
    m_loadingLabel->setStyleSheet("QLabel { color: #ffaa00; font-size: 10px; }");
    m_loadingLabel->setMinimumWidth(60);
    layout->addWidget(m_loadingLabel);

    m_rowCountLabel = new QLabel("0 rows", this);
    m_rowCountLabel->setStyleSheet("QLabel { color: #888; font-size: 10px; }");
    layout->addWidget(m_rowCountLabel);

    setLayout(layout);

    m_spinnerTimer = new QTimer(this);
    connect(m_spinnerTimer, &QTimer::timeout, this, &StatusBar::advanceSpinner);
}

void StatusBar::setReadyStatus(const QString& status) {
    m_readyLabel->setText(status);
}

void StatusBar::setRowCount(const QString& label) {
    m_rowCountLabel->setText(label);
}

void StatusBar::setLoading(bool loading) {
    if (m_loading == loading) return;
    m_loading = loading;
    if (loading) {
        m_spinnerFrame = 0;
        m_loadingLabel->setText(kSpinnerFrames[0]);
        m_spinnerTimer->start(250);
    } else {
        m_spinnerTimer->stop();
        m_loadingLabel->clear();
    }
}

void StatusBar::setError(bool hasError, const QString& message) {
    if (hasError) {
        m_errorLabel->setText(QString("⚠ %1").arg(message));
        m_errorLabel->setToolTip(message);
        m_errorLabel->show();
    } else {
        m_errorLabel->clear();
        m_errorLabel->hide();
    }
}

void StatusBar::advanceSpinner() {
    m_spinnerFrame = (m_spinnerFrame + 1) % 4;
    m_loadingLabel->setText(kSpinnerFrames[m_spinnerFrame]);
}
