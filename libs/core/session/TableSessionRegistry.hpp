/*
Tabula — TableSessionRegistry
Role: Single source of truth for the active backing table and its generation.
Inputs/Outputs: Takes table-identity changes and row-count corrections; emits sessionReplaced / totalRowsChanged.
Threading: Lives on the event thread; it is the only writer of the active session.
Integration: Owned by the viewer context; read by FetchOrchestrator for staleness checks and by ScrollController.
Observability: Logs every identity change via tLog_Data.
Related: TableSessionRegistry.cpp, TableSession.hpp, FetchOrchestrator.hpp.
Assumptions: Sessions are replaced, never edited in place (except the row count of the same identity).
*/
#pragma once
#include "TableSession.hpp"
#include <QObject>
#include <optional>
#include <vector>

enum class RegistryState {
    Uninitialized,
    Active
};

class TableSessionRegistry : public QObject {
    Q_OBJECT

public:
    explicit TableSessionRegistry(QObject* parent = nullptr);

    // First call yields generation 0; later calls continue the global counter.
    const TableSession& createSession(const std::string& tableId, int64_t initialTotalRows,
                                      TableChange origin = TableChange::Import);

    // Always produces a new session with the next generation; the previous one is retired.
    const TableSession& replaceSession(const std::string& tableId, int64_t newTotalRows, TableChange origin);

    // Same identity, corrected row count; the generation is left alone.
    bool updateTotalRows(int64_t newTotalRows);

    RegistryState state() const { return m_active ? RegistryState::Active : RegistryState::Uninitialized; }
    bool hasActiveSession() const { return m_active.has_value(); }
    const TableSession& active() const;
    std::optional<TableSession> activeSession() const { return m_active; }

    uint64_t currentGeneration() const;
    bool isCurrent(uint64_t generation) const { return m_active && m_active->generation == generation; }

    // Row count of the last imported (root) table, for "X of Y rows" style status
    int64_t baseRowCount() const { return m_baseRowCount; }
    const std::string& baseTableId() const { return m_baseTableId; }

    const std::vector<TableSession>& retiredSessions() const { return m_retired; }

signals:
    void sessionReplaced(const TableSession& current, const TableSession& previous);
    void sessionCreated(const TableSession& current);
    void totalRowsChanged(int64_t totalRows);

private:
    int64_t sanitizeRowCount(int64_t rows) const;
    void trackRoot(const TableSession& session);

    std::optional<TableSession> m_active;
    std::vector<TableSession>   m_retired;
    uint64_t                    m_nextGeneration = 0;
    int64_t                     m_baseRowCount = 0;
    std::string                 m_baseTableId;

    static constexpr std::size_t kMaxRetiredHistory = 64;
};
