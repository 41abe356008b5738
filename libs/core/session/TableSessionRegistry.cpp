#include "TableSessionRegistry.hpp"
#include "TabulaErrors.hpp"
#include "TabulaLogging.hpp"
#include <stdexcept>

TableSessionRegistry::TableSessionRegistry(QObject* parent)
    : QObject(parent) {
}

const TableSession& TableSessionRegistry::createSession(const std::string& tableId, int64_t initialTotalRows,
                                                        TableChange origin) {
    if (m_active) {
        return replaceSession(tableId, initialTotalRows, origin);
    }

    TableSession session;
    session.tableId = tableId;
    session.generation = m_nextGeneration++;
    session.totalRows = sanitizeRowCount(initialTotalRows);
    session.origin = origin;

    m_active = session;
    trackRoot(*m_active);

    tLog_Data("Session created:" << sessionDebugString(*m_active));
    emit sessionCreated(*m_active);
    return *m_active;
}

const TableSession& TableSessionRegistry::replaceSession(const std::string& tableId, int64_t newTotalRows,
                                                         TableChange origin) {
    if (!m_active) {
        return createSession(tableId, newTotalRows, origin);
    }

    TableSession next;
    next.tableId = tableId;
    next.generation = m_nextGeneration++;
    next.totalRows = sanitizeRowCount(newTotalRows);
    next.origin = origin;

    // Build the replacement fully before swapping it in
    TableSession previous = *m_active;
    m_retired.push_back(previous);
    if (m_retired.size() > kMaxRetiredHistory) {
        m_retired.erase(m_retired.begin());
    }
    m_active = std::move(next);
    trackRoot(*m_active);

    tLog_Data("Session replaced:" << sessionDebugString(previous) << "->" << sessionDebugString(*m_active));
    emit sessionReplaced(*m_active, previous);
    return *m_active;
}

bool TableSessionRegistry::updateTotalRows(int64_t newTotalRows) {
    if (!m_active) {
        tLog_Warning("TableSessionRegistry: row count update without an active session ignored");
        return false;
    }

    const int64_t rows = sanitizeRowCount(newTotalRows);
    if (rows == m_active->totalRows) return false;

    m_active->totalRows = rows;
    if (m_active->tableId == m_baseTableId) {
        m_baseRowCount = rows;
    }

    tLog_Data("Row count corrected:" << sessionDebugString(*m_active));
    emit totalRowsChanged(rows);
    return true;
}

const TableSession& TableSessionRegistry::active() const {
    if (!m_active) {
        throw std::logic_error("TableSessionRegistry: no active session");
    }
    return *m_active;
}

uint64_t TableSessionRegistry::currentGeneration() const {
    if (!m_active) {
        throw std::logic_error("TableSessionRegistry: no active session");
    }
    return m_active->generation;
}

int64_t TableSessionRegistry::sanitizeRowCount(int64_t rows) const {
    if (rows >= 0) return rows;

    const QString msg = QString("TableSessionRegistry: negative row count %1").arg(rows);
    if constexpr (tabula::kStrictInvariants) {
        throw InvariantViolation(msg.toStdString());
    }
    tLog_Warning(msg << "- clamping to 0");
    return 0;
}

void TableSessionRegistry::trackRoot(const TableSession& session) {
    if (session.origin == TableChange::Import) {
        m_baseTableId = session.tableId;
        m_baseRowCount = session.totalRows;
    } else if (session.origin == TableChange::Reset && session.tableId == m_baseTableId) {
        m_baseRowCount = session.totalRows;
    }
}
