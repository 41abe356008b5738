#pragma once

#include <QWidget>
#include <QLabel>
#include <QHBoxLayout>
#include <QTimer>

/**
 * Bottom status strip for the Tabula viewer.
 * Shows the table status ("Sorted by price (ascending)"), the row count,
 * a loading indicator and the message of the last failed fetch.
 */
class StatusBar : public QWidget {
    Q_OBJECT

public:
    explicit StatusBar(QWidget* parent = nullptr);
    ~StatusBar() override = default;

    void setReadyStatus(const QString& status = "Ready");
    void setRowCount(const QString& label);
    void setLoading(bool loading);
    void setError(bool hasError, const QString& message = QString());

    QString readyStatus() const { return m_readyLabel->text(); }
    QString rowCountText() const { return m_rowCountLabel->text(); }
    bool isLoading() const { return m_loading; }

private slots:
    void advanceSpinner();

private:
    QLabel* m_readyLabel;
    QLabel* m_errorLabel;
    QLabel* m_loadingLabel;
    QLabel* m_rowCountLabel;

    bool m_loading = false;
    int m_spinnerFrame = 0;

    QTimer* m_spinnerTimer;
};
