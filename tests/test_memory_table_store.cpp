#include <gtest/gtest.h>
#include "provider/MemoryTableStore.hpp"
#include "TabulaErrors.hpp"
#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

class MemoryTableStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        // id, name, score (null for dave)
        people = store.importTable("people", {"id", "name", "score"}, {
            {Cell(1), Cell("alice"), Cell(82.5)},
            {Cell(2), Cell("bob"),   Cell(91)},
            {Cell(3), Cell("carol"), Cell(82.5)},
            {Cell(4), Cell("dave"),  Cell()},
            {Cell(5), Cell("erin"),  Cell(70)},
        });
    }

    std::vector<int64_t> ids(const std::string& tableId) const {
        std::vector<int64_t> out;
        for (const auto& row : store.fetch(tableId, 0, 100).batch.rows) {
            out.push_back(row[0].get<int64_t>());
        }
        return out;
    }

    MemoryTableStore store;
    std::string      people;
};

TEST_F(MemoryTableStoreTest, FetchReturnsRequestedWindow) {
    FetchResult result = store.fetch(people, 1, 2);

    EXPECT_EQ(result.totalRows, 5);
    EXPECT_EQ(result.batch.startIndex, 1);
    EXPECT_EQ(result.batch.columns, (std::vector<std::string>{"id", "name", "score"}));
    ASSERT_EQ(result.batch.size(), 2u);
    EXPECT_EQ(result.batch.rows[0][1], Cell("bob"));
    EXPECT_EQ(result.batch.rows[1][1], Cell("carol"));
}

TEST_F(MemoryTableStoreTest, FetchClampsToTableEnd) {
    FetchResult tail = store.fetch(people, 3, 50);
    EXPECT_EQ(tail.batch.size(), 2u);

    FetchResult past = store.fetch(people, 40, 10);
    EXPECT_TRUE(past.batch.empty());
    EXPECT_EQ(past.batch.startIndex, 5);
    EXPECT_EQ(past.totalRows, 5);
}

TEST_F(MemoryTableStoreTest, InvalidRequestsThrow) {
    EXPECT_THROW(store.fetch("nope", 0, 10), TableNotFoundError);
    EXPECT_THROW(store.fetch(people, -1, 10), std::invalid_argument);
    EXPECT_THROW(store.fetch(people, 0, -10), std::invalid_argument);
    EXPECT_THROW(store.rowCount("nope"), TableNotFoundError);
    EXPECT_THROW(store.sortTable(people, "missing", true), std::invalid_argument);
    EXPECT_THROW(store.importSynthetic("neg", -1), std::invalid_argument);

    try {
        store.columns("ghost");
        FAIL() << "expected TableNotFoundError";
    } catch (const TableNotFoundError& e) {
        EXPECT_EQ(e.tableId(), "ghost");
    }
}

TEST_F(MemoryTableStoreTest, SortIsStableAndPutsNullsFirst) {
    const std::string ascending = store.sortTable(people, "score", true);
    EXPECT_EQ(ids(ascending), (std::vector<int64_t>{4, 5, 1, 3, 2}));

    const std::string descending = store.sortTable(people, "score", false);
    EXPECT_EQ(ids(descending), (std::vector<int64_t>{2, 1, 3, 5, 4}));

    // Source table untouched
    EXPECT_EQ(ids(people), (std::vector<int64_t>{1, 2, 3, 4, 5}));
}

TEST_F(MemoryTableStoreTest, SortOfSortedTableUsesItsOrder) {
    const std::string byName = store.sortTable(people, "name", false);
    const std::string byScore = store.sortTable(byName, "score", true);

    // Ties (alice/carol at 82.5) keep the descending-name order
    EXPECT_EQ(ids(byScore), (std::vector<int64_t>{4, 5, 3, 1, 2}));
    EXPECT_EQ(store.rootOf(byScore), people);
}

TEST_F(MemoryTableStoreTest, FilterAppliesAllConditions) {
    FilterCondition high{"score", FilterCondition::Op::Ge, Cell(80)};
    const std::string filtered = store.filterTable(people, {high});
    EXPECT_EQ(ids(filtered), (std::vector<int64_t>{1, 2, 3}));

    FilterCondition notBob{"name", FilterCondition::Op::Ne, Cell("bob")};
    const std::string both = store.filterTable(people, {high, notBob});
    EXPECT_EQ(ids(both), (std::vector<int64_t>{1, 3}));

    FilterCondition hasR{"name", FilterCondition::Op::Contains, Cell("r")};
    EXPECT_EQ(ids(store.filterTable(people, {hasR})), (std::vector<int64_t>{3, 5}));

    FilterCondition none{"score", FilterCondition::Op::Gt, Cell(1000)};
    const std::string empty = store.filterTable(people, {none});
    EXPECT_EQ(store.rowCount(empty), 0);
    EXPECT_EQ(store.columns(empty), store.columns(people));
}

TEST_F(MemoryTableStoreTest, FilterOfSortedViewKeepsOrder) {
    const std::string sorted = store.sortTable(people, "id", false);
    FilterCondition odd{"id", FilterCondition::Op::Ne, Cell(2)};
    const std::string filtered = store.filterTable(sorted, {odd});

    EXPECT_EQ(ids(filtered), (std::vector<int64_t>{5, 4, 3, 1}));
    EXPECT_EQ(store.rootOf(filtered), people);
}

TEST_F(MemoryTableStoreTest, TableIdsAreUniqueAndDerivedFromRoot) {
    const std::string a = store.sortTable(people, "id", true);
    const std::string b = store.sortTable(people, "id", true);
    const std::string other = store.importTable("people", {"x"}, {});

    EXPECT_NE(a, b);
    EXPECT_NE(other, people);
    EXPECT_EQ(a.rfind(people, 0), 0u);
    EXPECT_EQ(store.rootOf(people), people);
    EXPECT_EQ(store.tableCount(), 4u);
}

TEST_F(MemoryTableStoreTest, DroppingRootKeepsDerivedViewsReadable) {
    const std::string sorted = store.sortTable(people, "name", true);

    EXPECT_TRUE(store.drop(people));
    EXPECT_FALSE(store.drop(people));
    EXPECT_FALSE(store.contains(people));

    FetchResult result = store.fetch(sorted, 0, 1);
    EXPECT_EQ(result.batch.rows[0][1], Cell("alice"));
}

TEST_F(MemoryTableStoreTest, ProgressiveImportGrowsSameTable) {
    const std::string id = store.beginImport("stream", {"n"});
    EXPECT_EQ(store.rowCount(id), 0);

    EXPECT_EQ(store.appendRows(id, {{Cell(1)}, {Cell(2)}}), 2);
    EXPECT_EQ(store.appendRows(id, {{Cell(3)}}), 3);
    EXPECT_EQ(store.rowCount(id), 3);
    EXPECT_EQ(store.fetch(id, 2, 5).batch.rows[0][0], Cell(3));

    const std::string view = store.sortTable(id, "n", false);
    EXPECT_THROW(store.appendRows(view, {{Cell(9)}}), std::invalid_argument);
    EXPECT_THROW(store.appendRows(store.importSynthetic("s", 10), {{Cell(9)}}), std::invalid_argument);
}

TEST_F(MemoryTableStoreTest, ShortRowsReadAsNull) {
    const std::string id = store.importTable("ragged", {"a", "b"}, {{Cell(1)}});
    const std::string sorted = store.sortTable(id, "b", true);

    EXPECT_EQ(store.rowCount(sorted), 1);
    FilterCondition isNull{"b", FilterCondition::Op::Eq, Cell()};
    EXPECT_EQ(store.rowCount(store.filterTable(id, {isNull})), 1);
}

TEST(MemoryTableStoreSynthetic, RowsAreDeterministicAndLazy) {
    MemoryTableStore store;
    const std::string id = store.importSynthetic("synthetic", 3'000'000'000LL);

    EXPECT_EQ(store.rowCount(id), 3'000'000'000LL);
    EXPECT_EQ(store.columns(id), MemoryTableStore::syntheticColumns());

    FetchResult tail = store.fetch(id, 2'999'999'990LL, 50);
    ASSERT_EQ(tail.batch.size(), 10u);
    EXPECT_EQ(tail.batch.rows.back()[0], Cell(3'000'000'000LL));
    EXPECT_EQ(tail.batch.rows.back(), MemoryTableStore::syntheticRow(2'999'999'999LL));
}

TEST(MemoryTableStoreSynthetic, RowShape) {
    const Row row = MemoryTableStore::syntheticRow(41);

    ASSERT_EQ(row.size(), MemoryTableStore::syntheticColumns().size());
    EXPECT_EQ(row[0], Cell(42));
    EXPECT_EQ(row[1], Cell("row-000000042"));
    EXPECT_TRUE(row[2].is_string());
    EXPECT_TRUE(row[3].is_number_float());
    EXPECT_TRUE(row[4].is_number_integer());
    EXPECT_TRUE(row[5].is_boolean());
    EXPECT_EQ(row, MemoryTableStore::syntheticRow(41));

    EXPECT_TRUE(MemoryTableStore::syntheticRow(3)[6].is_null());
    EXPECT_TRUE(MemoryTableStore::syntheticRow(10)[6].is_null());
    EXPECT_TRUE(MemoryTableStore::syntheticRow(4)[6].is_string());
}

TEST(MemoryTableStoreSynthetic, SortAndFilterOverGeneratedRows) {
    MemoryTableStore store;
    const std::string id = store.importSynthetic("synthetic", 5000);

    const std::string byPrice = store.sortTable(id, "price", true);
    FetchResult sorted = store.fetch(byPrice, 0, 5000);
    for (std::size_t i = 1; i < sorted.batch.rows.size(); ++i) {
        ASSERT_LE(sorted.batch.rows[i - 1][3].get<double>(), sorted.batch.rows[i][3].get<double>());
    }

    FilterCondition gamma{"category", FilterCondition::Op::Eq, Cell("gamma")};
    const std::string filtered = store.filterTable(id, {gamma});
    const int64_t count = store.rowCount(filtered);
    EXPECT_GT(count, 0);
    EXPECT_LT(count, 5000);
    for (const auto& row : store.fetch(filtered, 0, count).batch.rows) {
        ASSERT_EQ(row[2], Cell("gamma"));
    }
}

TEST(MemoryTableStoreConcurrency, ParallelReadersAndWriters) {
    MemoryTableStore store;
    const std::string id = store.importSynthetic("synthetic", 200'000);
    std::atomic<int> errors{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < 200; ++i) {
                FetchResult r = store.fetch(id, (t * 7919 + i * 997) % 200'000, 50);
                if (r.totalRows != 200'000 || r.batch.empty()) ++errors;
            }
        });
    }
    threads.emplace_back([&] {
        for (int i = 0; i < 3; ++i) {
            const std::string sorted = store.sortTable(id, "quantity", i % 2 == 0);
            if (store.rowCount(sorted) != 200'000) ++errors;
            store.drop(sorted);
        }
    });
    for (auto& thread : threads) thread.join();

    EXPECT_EQ(errors.load(), 0);
    EXPECT_EQ(store.tableCount(), 1u);
}

TEST_F(MemoryTableStoreTest, TableWithoutColumnsIsViewableButNotSortable) {
    const std::string empty = store.importTable("empty", {}, {});

    EXPECT_TRUE(store.columns(empty).empty());
    EXPECT_EQ(store.rowCount(empty), 0);
    EXPECT_TRUE(store.fetch(empty, 0, 20).batch.empty());
    EXPECT_THROW(store.sortTable(empty, "id", true), std::invalid_argument);
    EXPECT_EQ(store.rootOf(empty), empty);
}
