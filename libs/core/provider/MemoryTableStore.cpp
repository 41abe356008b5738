#include "MemoryTableStore.hpp"
#include "TabulaErrors.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <array>
#include <mutex>
#include <numeric>
#include <stdexcept>

// -----------------------------------------------------------------------------
// Row storage
// -----------------------------------------------------------------------------

class MemoryTableStore::RowSource {
public:
    virtual ~RowSource() = default;
    virtual int64_t size() const = 0;
    virtual Cell cell(int64_t row, std::size_t column) const = 0;
    virtual Row row(int64_t row) const = 0;
};

class MemoryTableStore::MaterializedSource : public RowSource {
public:
    explicit MaterializedSource(std::vector<Row> rows) : m_rows(std::move(rows)) {}

    int64_t size() const override { return static_cast<int64_t>(m_rows.size()); }
    Cell cell(int64_t row, std::size_t column) const override {
        const Row& r = m_rows[static_cast<std::size_t>(row)];
        return column < r.size() ? r[column] : Cell();
    }
    Row row(int64_t row) const override { return m_rows[static_cast<std::size_t>(row)]; }

    void append(std::vector<Row> rows) {
        m_rows.insert(m_rows.end(), std::make_move_iterator(rows.begin()), std::make_move_iterator(rows.end()));
    }

private:
    std::vector<Row> m_rows;
};

class MemoryTableStore::SyntheticSource : public RowSource {
public:
    explicit SyntheticSource(int64_t rows) : m_rows(rows) {}

    int64_t size() const override { return m_rows; }
    Cell cell(int64_t row, std::size_t column) const override {
        Row r = syntheticRow(row);
        return column < r.size() ? std::move(r[column]) : Cell();
    }
    Row row(int64_t row) const override { return syntheticRow(row); }

private:
    int64_t m_rows;
};

namespace {

uint64_t splitmix64(uint64_t x) {
    x += 0x9E3779B97F4A7C15ull;
    x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ull;
    x = (x ^ (x >> 27)) * 0x94D049BB133111EBull;
    return x ^ (x >> 31);
}

constexpr std::array<const char*, 5> kCategories = {"alpha", "beta", "gamma", "delta", "epsilon"};

}

std::vector<std::string> MemoryTableStore::syntheticColumns() {
    return {"id", "name", "category", "price", "quantity", "active", "note"};
}

Row MemoryTableStore::syntheticRow(int64_t index) {
    const uint64_t h = splitmix64(static_cast<uint64_t>(index));
    Row row;
    row.reserve(7);
    row.emplace_back(index + 1);
    row.emplace_back(fmt::format("row-{:09}", index + 1));
    row.emplace_back(kCategories[h % kCategories.size()]);
    row.emplace_back(static_cast<double>(h % 1'000'000) / 100.0);
    row.emplace_back(static_cast<int64_t>((h >> 20) % 500));
    row.emplace_back(((h >> 40) & 1u) == 1u);
    row.emplace_back(index % 7 == 3 ? Cell() : Cell(fmt::format("n{}", (h >> 8) % 97)));
    return row;
}

// -----------------------------------------------------------------------------
// Table
// -----------------------------------------------------------------------------

int64_t MemoryTableStore::Table::size() const {
    return index ? static_cast<int64_t>(index->size()) : source->size();
}

int64_t MemoryTableStore::Table::sourceRow(int64_t i) const {
    return index ? (*index)[static_cast<std::size_t>(i)] : i;
}

// -----------------------------------------------------------------------------
// Import
// -----------------------------------------------------------------------------

std::string MemoryTableStore::importTable(const std::string& name, std::vector<std::string> columns,
                                          std::vector<Row> rows) {
    return addRoot(name, std::move(columns), std::make_shared<MaterializedSource>(std::move(rows)));
}

std::string MemoryTableStore::importSynthetic(const std::string& name, int64_t rowCount) {
    if (rowCount < 0) {
        throw std::invalid_argument("MemoryTableStore: negative synthetic row count");
    }
    return addRoot(name, syntheticColumns(), std::make_shared<SyntheticSource>(rowCount));
}

std::string MemoryTableStore::beginImport(const std::string& name, std::vector<std::string> columns) {
    return addRoot(name, std::move(columns), std::make_shared<MaterializedSource>(std::vector<Row>{}));
}

int64_t MemoryTableStore::appendRows(const std::string& tableId, std::vector<Row> rows) {
    std::unique_lock<std::shared_mutex> lock(m_mx);
    const Table& table = findLocked(tableId);
    auto* source = dynamic_cast<MaterializedSource*>(table.source.get());
    if (!source || table.index || table.rootId != table.id) {
        throw std::invalid_argument("MemoryTableStore: table " + tableId + " does not accept appended rows");
    }
    source->append(std::move(rows));
    return source->size();
}

std::string MemoryTableStore::addRoot(const std::string& name, std::vector<std::string> columns,
                                      std::shared_ptr<RowSource> source) {
    std::unique_lock<std::shared_mutex> lock(m_mx);
    Table table;
    table.id = nextId(name, "t");
    table.rootId = table.id;
    table.columns = std::move(columns);
    table.source = std::move(source);
    const std::string id = table.id;
    m_tables.emplace(id, std::move(table));
    return id;
}

// -----------------------------------------------------------------------------
// Derived tables
// -----------------------------------------------------------------------------

std::string MemoryTableStore::sortTable(const std::string& sourceId, const std::string& column, bool ascending) {
    Table derived;
    {
        std::shared_lock<std::shared_mutex> lock(m_mx);
        const Table& source = findLocked(sourceId);
        const std::size_t col = columnIndex(source, column);
        const int64_t n = source.size();

        std::vector<Cell> keys;
        keys.reserve(static_cast<std::size_t>(n));
        for (int64_t i = 0; i < n; ++i) {
            keys.push_back(source.source->cell(source.sourceRow(i), col));
        }

        std::vector<int64_t> order(static_cast<std::size_t>(n));
        std::iota(order.begin(), order.end(), int64_t{0});
        std::stable_sort(order.begin(), order.end(), [&](int64_t a, int64_t b) {
            const int cmp = compareCells(keys[static_cast<std::size_t>(a)], keys[static_cast<std::size_t>(b)]);
            return ascending ? cmp < 0 : cmp > 0;
        });

        auto index = std::make_shared<std::vector<int64_t>>();
        index->reserve(order.size());
        for (int64_t pos : order) {
            index->push_back(source.sourceRow(pos));
        }

        derived.rootId = source.rootId;
        derived.columns = source.columns;
        derived.source = source.source;
        derived.index = std::move(index);
    }

    std::unique_lock<std::shared_mutex> lock(m_mx);
    derived.id = nextId(derived.rootId, "sort");
    const std::string id = derived.id;
    m_tables.emplace(id, std::move(derived));
    return id;
}

std::string MemoryTableStore::filterTable(const std::string& sourceId, const std::vector<FilterCondition>& conditions) {
    Table derived;
    {
        std::shared_lock<std::shared_mutex> lock(m_mx);
        const Table& source = findLocked(sourceId);

        std::vector<std::size_t> columnsUsed;
        columnsUsed.reserve(conditions.size());
        for (const auto& condition : conditions) {
            columnsUsed.push_back(columnIndex(source, condition.column));
        }

        auto index = std::make_shared<std::vector<int64_t>>();
        const int64_t n = source.size();
        for (int64_t i = 0; i < n; ++i) {
            const int64_t row = source.sourceRow(i);
            bool keep = true;
            for (std::size_t c = 0; c < conditions.size() && keep; ++c) {
                keep = conditions[c].matches(source.source->cell(row, columnsUsed[c]));
            }
            if (keep) index->push_back(row);
        }

        derived.rootId = source.rootId;
        derived.columns = source.columns;
        derived.source = source.source;
        derived.index = std::move(index);
    }

    std::unique_lock<std::shared_mutex> lock(m_mx);
    derived.id = nextId(derived.rootId, "filter");
    const std::string id = derived.id;
    m_tables.emplace(id, std::move(derived));
    return id;
}

// -----------------------------------------------------------------------------
// Queries
// -----------------------------------------------------------------------------

FetchResult MemoryTableStore::fetch(const std::string& tableId, int64_t startIndex, int64_t count) const {
    if (startIndex < 0 || count < 0) {
        throw std::invalid_argument(fmt::format("MemoryTableStore: invalid window {}+{}", startIndex, count));
    }

    std::shared_lock<std::shared_mutex> lock(m_mx);
    const Table& table = findLocked(tableId);
    const int64_t total = table.size();
    const int64_t begin = std::min(startIndex, total);
    const int64_t end = std::min(total, begin + count);

    FetchResult result;
    result.totalRows = total;
    result.batch.startIndex = begin;
    result.batch.columns = table.columns;
    result.batch.rows.reserve(static_cast<std::size_t>(end - begin));
    for (int64_t i = begin; i < end; ++i) {
        result.batch.rows.push_back(table.source->row(table.sourceRow(i)));
    }
    return result;
}

int64_t MemoryTableStore::rowCount(const std::string& tableId) const {
    std::shared_lock<std::shared_mutex> lock(m_mx);
    return findLocked(tableId).size();
}

std::vector<std::string> MemoryTableStore::columns(const std::string& tableId) const {
    std::shared_lock<std::shared_mutex> lock(m_mx);
    return findLocked(tableId).columns;
}

std::string MemoryTableStore::rootOf(const std::string& tableId) const {
    std::shared_lock<std::shared_mutex> lock(m_mx);
    return findLocked(tableId).rootId;
}

bool MemoryTableStore::contains(const std::string& tableId) const {
    std::shared_lock<std::shared_mutex> lock(m_mx);
    return m_tables.count(tableId) > 0;
}

std::size_t MemoryTableStore::tableCount() const {
    std::shared_lock<std::shared_mutex> lock(m_mx);
    return m_tables.size();
}

bool MemoryTableStore::drop(const std::string& tableId) {
    std::unique_lock<std::shared_mutex> lock(m_mx);
    // Derived tables keep the shared row storage alive on their own
    return m_tables.erase(tableId) > 0;
}

const MemoryTableStore::Table& MemoryTableStore::findLocked(const std::string& tableId) const {
    auto it = m_tables.find(tableId);
    if (it == m_tables.end()) {
        throw TableNotFoundError(tableId);
    }
    return it->second;
}

std::size_t MemoryTableStore::columnIndex(const Table& table, const std::string& column) const {
    auto it = std::find(table.columns.begin(), table.columns.end(), column);
    if (it == table.columns.end()) {
        throw std::invalid_argument("MemoryTableStore: unknown column '" + column + "' in " + table.id);
    }
    return static_cast<std::size_t>(std::distance(table.columns.begin(), it));
}

std::string MemoryTableStore::nextId(const std::string& base, const char* kind) {
    return fmt::format("{}:{}{}", base, kind, ++m_counter);
}
