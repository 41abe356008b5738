/*
Tabula — MemoryTableStore
Role: Thread-safe in-memory table engine behind the provider: import, sort, filter, windowed fetch, drop.
Inputs/Outputs: Takes rows or synthetic row counts; hands out table ids and windowed FetchResults.
Threading: Fully thread-safe using a std::shared_mutex for concurrent reads and exclusive writes.
Performance: Sort and filter build index vectors over shared row storage; rows are never copied.
             Synthetic tables generate cells on demand, so very large row counts cost no memory.
Integration: Used by AsioTableProvider on its worker threads.
Observability: No internal logging; diagnostics are the responsibility of its clients.
Related: MemoryTableStore.cpp, FilterCondition.hpp, AsioTableProvider.hpp.
Assumptions: Derived tables (sort/filter) are snapshots of their source at creation time.
*/
#pragma once
#include "FilterCondition.hpp"
#include "fetch/RowBatch.hpp"
#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

class MemoryTableStore {
public:
    MemoryTableStore() = default;
    MemoryTableStore(const MemoryTableStore&) = delete;
    MemoryTableStore& operator=(const MemoryTableStore&) = delete;

    // Root tables
    std::string importTable(const std::string& name, std::vector<std::string> columns, std::vector<Row> rows);
    std::string importSynthetic(const std::string& name, int64_t rowCount);

    // Progressive import: identity is fixed up front, rows arrive in chunks
    std::string beginImport(const std::string& name, std::vector<std::string> columns);
    int64_t appendRows(const std::string& tableId, std::vector<Row> rows);

    // Derived tables
    std::string sortTable(const std::string& sourceId, const std::string& column, bool ascending);
    std::string filterTable(const std::string& sourceId, const std::vector<FilterCondition>& conditions);

    [[nodiscard]] FetchResult fetch(const std::string& tableId, int64_t startIndex, int64_t count) const;
    [[nodiscard]] int64_t rowCount(const std::string& tableId) const;
    [[nodiscard]] std::vector<std::string> columns(const std::string& tableId) const;
    [[nodiscard]] std::string rootOf(const std::string& tableId) const;
    [[nodiscard]] bool contains(const std::string& tableId) const;
    [[nodiscard]] std::size_t tableCount() const;
    bool drop(const std::string& tableId);

    // Deterministic generated dataset
    static std::vector<std::string> syntheticColumns();
    static Row syntheticRow(int64_t index);

private:
    class RowSource;
    class MaterializedSource;
    class SyntheticSource;

    struct Table {
        std::string                                 id;
        std::string                                 rootId;
        std::vector<std::string>                    columns;
        std::shared_ptr<RowSource>                  source;
        std::shared_ptr<const std::vector<int64_t>> index;   // null: identity over source

        int64_t size() const;
        int64_t sourceRow(int64_t i) const;
    };

    const Table& findLocked(const std::string& tableId) const;
    std::size_t columnIndex(const Table& table, const std::string& column) const;
    std::string nextId(const std::string& base, const char* kind);
    std::string addRoot(const std::string& name, std::vector<std::string> columns, std::shared_ptr<RowSource> source);

    mutable std::shared_mutex              m_mx;
    std::unordered_map<std::string, Table> m_tables;
    uint64_t                               m_counter = 0;
};
