#include <gtest/gtest.h>
#include "session/TableSessionRegistry.hpp"
#include "TabulaErrors.hpp"
#include <stdexcept>

TEST(TableSessionRegistry, StartsWithoutSession) {
    TableSessionRegistry registry;

    EXPECT_EQ(registry.state(), RegistryState::Uninitialized);
    EXPECT_FALSE(registry.hasActiveSession());
    EXPECT_FALSE(registry.activeSession().has_value());
    EXPECT_FALSE(registry.isCurrent(0));
    EXPECT_THROW(registry.active(), std::logic_error);
    EXPECT_THROW(registry.currentGeneration(), std::logic_error);
}

TEST(TableSessionRegistry, FirstSessionIsGenerationZero) {
    TableSessionRegistry registry;
    int created = 0;
    QObject::connect(&registry, &TableSessionRegistry::sessionCreated, [&](const TableSession&) { ++created; });

    const TableSession& session = registry.createSession("orders:t1", 1200);

    EXPECT_EQ(registry.state(), RegistryState::Active);
    EXPECT_EQ(session.generation, 0u);
    EXPECT_EQ(session.tableId, "orders:t1");
    EXPECT_EQ(session.totalRows, 1200);
    EXPECT_EQ(session.origin, TableChange::Import);
    EXPECT_TRUE(registry.isCurrent(0));
    EXPECT_EQ(created, 1);
}

TEST(TableSessionRegistry, ReplaceBumpsGenerationAndRetiresPrevious) {
    TableSessionRegistry registry;
    registry.createSession("orders:t1", 1200);

    TableSession current, previous;
    QObject::connect(&registry, &TableSessionRegistry::sessionReplaced,
                     [&](const TableSession& c, const TableSession& p) { current = c; previous = p; });

    registry.replaceSession("orders:t1:sort2", 1200, TableChange::Sort);

    EXPECT_EQ(registry.currentGeneration(), 1u);
    EXPECT_FALSE(registry.isCurrent(0));
    EXPECT_TRUE(registry.isCurrent(1));
    EXPECT_EQ(current.tableId, "orders:t1:sort2");
    EXPECT_EQ(previous.tableId, "orders:t1");
    ASSERT_EQ(registry.retiredSessions().size(), 1u);
    EXPECT_EQ(registry.retiredSessions().front().generation, 0u);
}

TEST(TableSessionRegistry, GenerationsAreStrictlyIncreasing) {
    TableSessionRegistry registry;
    uint64_t last = registry.createSession("root", 10).generation;

    for (int i = 0; i < 200; ++i) {
        const TableChange change = (i % 3 == 0) ? TableChange::Filter : TableChange::Sort;
        const uint64_t gen = registry.replaceSession("view" + std::to_string(i), i, change).generation;
        EXPECT_GT(gen, last);
        last = gen;
    }
    EXPECT_EQ(last, 200u);
    EXPECT_LE(registry.retiredSessions().size(), 64u);
}

TEST(TableSessionRegistry, ReplacingWithSameTableStillBumpsGeneration) {
    TableSessionRegistry registry;
    registry.createSession("root", 10);
    registry.replaceSession("root", 10, TableChange::Reset);

    EXPECT_EQ(registry.currentGeneration(), 1u);
}

TEST(TableSessionRegistry, CreateOnActiveRegistryReplaces) {
    TableSessionRegistry registry;
    registry.createSession("first", 10);
    const TableSession& second = registry.createSession("second", 20);

    EXPECT_EQ(second.generation, 1u);
    EXPECT_EQ(registry.retiredSessions().size(), 1u);
}

TEST(TableSessionRegistry, RowCountUpdateKeepsGeneration) {
    TableSessionRegistry registry;
    registry.createSession("import", 0);

    std::vector<int64_t> notified;
    QObject::connect(&registry, &TableSessionRegistry::totalRowsChanged, [&](int64_t rows) { notified.push_back(rows); });

    EXPECT_TRUE(registry.updateTotalRows(5000));
    EXPECT_FALSE(registry.updateTotalRows(5000));   // unchanged
    EXPECT_TRUE(registry.updateTotalRows(12000));

    EXPECT_EQ(registry.currentGeneration(), 0u);
    EXPECT_EQ(registry.active().totalRows, 12000);
    EXPECT_EQ(notified, (std::vector<int64_t>{5000, 12000}));
}

TEST(TableSessionRegistry, RowCountUpdateWithoutSessionIsIgnored) {
    TableSessionRegistry registry;
    EXPECT_FALSE(registry.updateTotalRows(10));
    EXPECT_FALSE(registry.hasActiveSession());
}

TEST(TableSessionRegistry, TracksImportedRoot) {
    TableSessionRegistry registry;
    registry.createSession("sales:t1", 1000, TableChange::Import);
    registry.replaceSession("sales:t1:filter2", 40, TableChange::Filter);

    EXPECT_EQ(registry.baseTableId(), "sales:t1");
    EXPECT_EQ(registry.baseRowCount(), 1000);

    registry.replaceSession("sales:t1", 1000, TableChange::Reset);
    EXPECT_EQ(registry.baseTableId(), "sales:t1");

    // Progressive import growing the root updates the base count too
    registry.updateTotalRows(1500);
    EXPECT_EQ(registry.baseRowCount(), 1500);

    registry.replaceSession("other:t3", 7, TableChange::Import);
    EXPECT_EQ(registry.baseTableId(), "other:t3");
    EXPECT_EQ(registry.baseRowCount(), 7);
}

TEST(TableSessionRegistry, NegativeRowCountIsAnInvariantViolation) {
    TableSessionRegistry registry;
    if (tabula::kStrictInvariants) {
        EXPECT_THROW(registry.createSession("broken", -1), InvariantViolation);
        EXPECT_FALSE(registry.hasActiveSession());
    } else {
        EXPECT_EQ(registry.createSession("broken", -1).totalRows, 0);
    }
}

TEST(TableSessionRegistry, DebugStringNamesTheSession) {
    TableSession session{"orders:t1", 4, 250, TableChange::Sort};
    const QString text = sessionDebugString(session);

    EXPECT_TRUE(text.contains("orders:t1"));
    EXPECT_TRUE(text.contains("gen: 4"));
    EXPECT_TRUE(text.contains("sort"));
}
