#pragma once
#include <QString>
#include <cstdint>
#include <string>

// What produced a table identity; import and reset land on root tables.
enum class TableChange {
    Import,
    Sort,
    Filter,
    Reset
};

inline const char* toString(TableChange change) {
    switch (change) {
        case TableChange::Import: return "import";
        case TableChange::Sort:   return "sort";
        case TableChange::Filter: return "filter";
        case TableChange::Reset:  return "reset";
    }
    return "unknown";
}

struct TableSession {
    std::string tableId;
    uint64_t    generation = 0;
    int64_t     totalRows = 0;
    TableChange origin = TableChange::Import;

    bool operator==(const TableSession&) const = default;
};

inline QString sessionDebugString(const TableSession& session) {
    return QString("Session{table: %1, gen: %2, rows: %3, origin: %4}")
        .arg(QString::fromStdString(session.tableId))
        .arg(session.generation)
        .arg(session.totalRows)
        .arg(toString(session.origin));
}
