/*
Tabula — AsioTableProvider Tests
Role: Async provider over the in-memory store, driven from the Qt test thread
Coverage: owner-thread delivery, error kinds, identity jobs, progressive import, controller integration
*/
#include <gtest/gtest.h>
#include "provider/AsioTableProvider.hpp"
#include "glue/ScrollController.hpp"
#include "session/TableSessionRegistry.hpp"
#include "fixtures/event_loop.hpp"
#include "fixtures/spy_render_sink.hpp"
#include <fmt/format.h>
#include <QThread>
#include <algorithm>
#include <memory>
#include <optional>
#include <vector>

using fixtures::drainEvents;
using fixtures::waitUntil;

class AsioTableProviderTest : public ::testing::Test {
protected:
    void SetUp() override {
        rootId = store.importSynthetic("demo", 1000);
    }

    void TearDown() override {
        if (provider) provider->stop();
    }

    AsioTableProvider& startProvider(AsioTableProvider::Options options = {}) {
        provider = std::make_unique<AsioTableProvider>(store, options);
        provider->start();
        return *provider;
    }

    std::optional<TableIdentityEvent> runIdentity(
        const std::function<void(AsioTableProvider::IdentityCb, ITableProvider::ErrorCb)>& call) {
        std::optional<TableIdentityEvent> event;
        std::optional<ProviderError> error;
        call([&](TableIdentityEvent e) { event = std::move(e); },
             [&](ProviderError e) { error = std::move(e); });
        EXPECT_TRUE(waitUntil([&] { return event.has_value() || error.has_value(); }));
        EXPECT_FALSE(error.has_value()) << (error ? error->message : std::string());
        return event;
    }

    MemoryTableStore                    store;
    std::string                         rootId;
    std::unique_ptr<AsioTableProvider>  provider;
};

TEST_F(AsioTableProviderTest, FetchDeliversOnOwnerThread) {
    auto& p = startProvider();

    std::optional<FetchResult> result;
    QThread* deliveredOn = nullptr;
    p.fetchWindow(rootId, 10, 5,
                  [&](FetchResult r) { result = std::move(r); deliveredOn = QThread::currentThread(); },
                  [](ProviderError) { FAIL() << "unexpected error"; });

    ASSERT_TRUE(waitUntil([&] { return result.has_value(); }));
    EXPECT_EQ(deliveredOn, QThread::currentThread());
    EXPECT_EQ(result->totalRows, 1000);
    EXPECT_EQ(result->batch.startIndex, 10);
    ASSERT_EQ(result->batch.size(), 5u);
    EXPECT_EQ(result->batch.rows.front()[0], Cell(11));
    EXPECT_EQ(result->batch.columns, MemoryTableStore::syntheticColumns());
}

TEST_F(AsioTableProviderTest, UnknownTableReportsTableMissing) {
    auto& p = startProvider();

    std::optional<ProviderError> error;
    p.fetchWindow("nope:t9", 0, 10, [](FetchResult) { FAIL() << "unexpected result"; },
                  [&](ProviderError e) { error = std::move(e); });

    ASSERT_TRUE(waitUntil([&] { return error.has_value(); }));
    EXPECT_EQ(error->kind, ProviderErrorKind::TableMissing);
}

TEST_F(AsioTableProviderTest, NotRunningReportsUnreachable) {
    provider = std::make_unique<AsioTableProvider>(store, AsioTableProvider::Options{});

    std::optional<ProviderError> error;
    provider->fetchWindow(rootId, 0, 10, [](FetchResult) { FAIL() << "unexpected result"; },
                          [&](ProviderError e) { error = std::move(e); });

    // Never synchronous
    EXPECT_FALSE(error.has_value());
    drainEvents();
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind, ProviderErrorKind::Unreachable);
}

TEST_F(AsioTableProviderTest, OfflineReportsUnreachableUntilBackOnline) {
    auto& p = startProvider();
    p.setOffline(true);

    std::optional<ProviderError> error;
    p.fetchWindow(rootId, 0, 10, [](FetchResult) { FAIL() << "unexpected result"; },
                  [&](ProviderError e) { error = std::move(e); });
    ASSERT_TRUE(waitUntil([&] { return error.has_value(); }));
    EXPECT_EQ(error->kind, ProviderErrorKind::Unreachable);

    p.setOffline(false);
    std::optional<FetchResult> result;
    p.fetchWindow(rootId, 0, 10, [&](FetchResult r) { result = std::move(r); },
                  [](ProviderError) { FAIL() << "unexpected error"; });
    ASSERT_TRUE(waitUntil([&] { return result.has_value(); }));
    EXPECT_EQ(result->batch.size(), 10u);
}

TEST_F(AsioTableProviderTest, SlowJobTimesOut) {
    AsioTableProvider::Options options;
    options.latency = std::chrono::milliseconds(300);
    options.timeout = std::chrono::milliseconds(20);
    auto& p = startProvider(options);

    std::optional<ProviderError> error;
    bool resultSeen = false;
    p.fetchWindow(rootId, 0, 10, [&](FetchResult) { resultSeen = true; },
                  [&](ProviderError e) { error = std::move(e); });

    ASSERT_TRUE(waitUntil([&] { return error.has_value(); }));
    EXPECT_EQ(error->kind, ProviderErrorKind::Timeout);

    // Exactly one callback per call
    waitUntil([] { return false; }, 400);
    EXPECT_FALSE(resultSeen);
}

TEST_F(AsioTableProviderTest, TimeoutCoversStoreWork) {
    const std::string wide = store.importSynthetic("wide", 500'000);
    AsioTableProvider::Options options;
    options.timeout = std::chrono::milliseconds(5);
    auto& p = startProvider(options);

    std::optional<ProviderError> error;
    bool sorted = false;
    p.sortAsync(wide, "price", true, [&](TableIdentityEvent) { sorted = true; },
                [&](ProviderError e) { error = std::move(e); });

    ASSERT_TRUE(waitUntil([&] { return error.has_value() || sorted; }, 10000));
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind, ProviderErrorKind::Timeout);
    EXPECT_FALSE(sorted);
}

TEST_F(AsioTableProviderTest, RacingDeadlinesDeliverExactlyOnce) {
    AsioTableProvider::Options options;
    options.workerThreads = 4;
    options.latency = std::chrono::milliseconds(1);
    options.timeout = std::chrono::milliseconds(1);
    auto& p = startProvider(options);

    constexpr int kJobs = 200;
    std::vector<int> callbacks(kJobs, 0);
    for (int i = 0; i < kJobs; ++i) {
        p.fetchWindow(rootId, i, 5,
                      [&callbacks, i](FetchResult) { ++callbacks[i]; },
                      [&callbacks, i](ProviderError) { ++callbacks[i]; });
    }

    ASSERT_TRUE(waitUntil([&] {
        return std::all_of(callbacks.begin(), callbacks.end(), [](int n) { return n > 0; });
    }, 10000));
    waitUntil([] { return false; }, 50);
    for (int i = 0; i < kJobs; ++i) {
        EXPECT_EQ(callbacks[i], 1) << "job " << i;
    }
}

TEST_F(AsioTableProviderTest, SortFilterAndResetProduceIdentityEvents) {
    auto& p = startProvider();

    auto sorted = runIdentity([&](auto onDone, auto onError) {
        p.sortAsync(rootId, "price", false, onDone, onError);
    });
    ASSERT_TRUE(sorted.has_value());
    EXPECT_EQ(sorted->change, TableChange::Sort);
    EXPECT_NE(sorted->tableId, rootId);
    EXPECT_EQ(sorted->totalRows, 1000);
    EXPECT_EQ(sorted->detail, "price (descending)");

    auto filtered = runIdentity([&](auto onDone, auto onError) {
        p.filterAsync(sorted->tableId,
                      {FilterCondition{"id", FilterCondition::Op::Le, Cell(100)},
                       FilterCondition{"active", FilterCondition::Op::Eq, Cell(true)}},
                      onDone, onError);
    });
    ASSERT_TRUE(filtered.has_value());
    EXPECT_EQ(filtered->change, TableChange::Filter);
    EXPECT_GT(filtered->totalRows, 0);
    EXPECT_LE(filtered->totalRows, 100);
    EXPECT_EQ(filtered->detail, "id <= 100 AND active = true");

    auto reset = runIdentity([&](auto onDone, auto onError) {
        p.resetAsync(filtered->tableId, onDone, onError);
    });
    ASSERT_TRUE(reset.has_value());
    EXPECT_EQ(reset->change, TableChange::Reset);
    EXPECT_EQ(reset->tableId, rootId);
    EXPECT_EQ(reset->totalRows, 1000);
}

TEST_F(AsioTableProviderTest, SortOnUnknownColumnReportsInternal) {
    auto& p = startProvider();

    std::optional<ProviderError> error;
    p.sortAsync(rootId, "missing", true, [](TableIdentityEvent) { FAIL() << "unexpected result"; },
                [&](ProviderError e) { error = std::move(e); });

    ASSERT_TRUE(waitUntil([&] { return error.has_value(); }));
    EXPECT_EQ(error->kind, ProviderErrorKind::Internal);
}

TEST_F(AsioTableProviderTest, ImportSyntheticRegistersRoot) {
    auto& p = startProvider();

    auto imported = runIdentity([&](auto onDone, auto onError) {
        p.importSyntheticAsync("big", 5'000'000, onDone, onError);
    });
    ASSERT_TRUE(imported.has_value());
    EXPECT_EQ(imported->change, TableChange::Import);
    EXPECT_EQ(imported->totalRows, 5'000'000);
    EXPECT_EQ(imported->detail, "big");
    EXPECT_TRUE(store.contains(imported->tableId));
}

TEST_F(AsioTableProviderTest, ProgressiveImportReportsEachChunk) {
    auto& p = startProvider();

    std::vector<Row> rows;
    for (int i = 0; i < 25; ++i) rows.push_back({Cell(i), Cell(fmt::format("r{}", i))});

    std::optional<TableIdentityEvent> started;
    std::vector<int64_t> progress;
    bool done = false;
    p.importRowsAsync("file", {"n", "label"}, std::move(rows), 10,
                      [&](TableIdentityEvent e) { started = std::move(e); },
                      [&](RowCountEvent e) { progress.push_back(e.totalRows); },
                      [&] { done = true; },
                      [](ProviderError e) { FAIL() << e.message; });

    ASSERT_TRUE(waitUntil([&] { return done; }));
    ASSERT_TRUE(started.has_value());
    EXPECT_EQ(started->totalRows, 0);
    EXPECT_EQ(started->detail, "file");
    EXPECT_EQ(progress, (std::vector<int64_t>{10, 20, 25}));
    EXPECT_EQ(store.rowCount(started->tableId), 25);
}

TEST_F(AsioTableProviderTest, SmallImportCompletesInOneShot) {
    auto& p = startProvider();

    std::optional<TableIdentityEvent> started;
    int progressCalls = 0;
    bool done = false;
    p.importRowsAsync("small", {"n"}, {{Cell(1)}, {Cell(2)}}, 10,
                      [&](TableIdentityEvent e) { started = std::move(e); },
                      [&](RowCountEvent) { ++progressCalls; },
                      [&] { done = true; },
                      [](ProviderError e) { FAIL() << e.message; });

    ASSERT_TRUE(waitUntil([&] { return done; }));
    ASSERT_TRUE(started.has_value());
    EXPECT_EQ(started->totalRows, 2);
    EXPECT_EQ(progressCalls, 0);
}

TEST_F(AsioTableProviderTest, DroppedTableIsMissingAfterwards) {
    auto& p = startProvider();

    bool dropped = false;
    p.dropTable(rootId, [&] { dropped = true; }, [](ProviderError e) { FAIL() << e.message; });
    ASSERT_TRUE(waitUntil([&] { return dropped; }));
    EXPECT_FALSE(store.contains(rootId));

    std::optional<ProviderError> error;
    p.dropTable(rootId, [] { FAIL() << "second drop succeeded"; }, [&](ProviderError e) { error = std::move(e); });
    ASSERT_TRUE(waitUntil([&] { return error.has_value(); }));
    EXPECT_EQ(error->kind, ProviderErrorKind::TableMissing);
}

TEST_F(AsioTableProviderTest, StopAbandonsOutstandingJobs) {
    AsioTableProvider::Options options;
    options.latency = std::chrono::milliseconds(500);
    auto& p = startProvider(options);

    bool called = false;
    p.fetchWindow(rootId, 0, 10, [&](FetchResult) { called = true; }, [&](ProviderError) { called = true; });
    p.stop();
    drainEvents();
    EXPECT_FALSE(called);
    EXPECT_FALSE(p.isRunning());
}

TEST_F(AsioTableProviderTest, RestartDoesNotResumeAbandonedJobs) {
    AsioTableProvider::Options options;
    options.latency = std::chrono::milliseconds(200);
    auto& p = startProvider(options);

    bool abandonedFired = false;
    p.fetchWindow(rootId, 0, 10, [&](FetchResult) { abandonedFired = true; },
                  [&](ProviderError) { abandonedFired = true; });
    p.stop();
    p.start();
    ASSERT_TRUE(p.isRunning());

    std::optional<FetchResult> result;
    p.fetchWindow(rootId, 20, 10, [&](FetchResult r) { result = std::move(r); },
                  [](ProviderError e) { FAIL() << e.message; });
    ASSERT_TRUE(waitUntil([&] { return result.has_value(); }));
    EXPECT_EQ(result->batch.startIndex, 20);

    waitUntil([] { return false; }, 300);
    EXPECT_FALSE(abandonedFired);
}

TEST_F(AsioTableProviderTest, DrivesScrollControllerEndToEnd) {
    auto& p = startProvider();

    ViewerConfig config;
    TableSessionRegistry registry;
    SpyRenderSink sink;
    FetchOrchestrator fetcher(p, registry);
    ScrollController controller(config, registry, fetcher, sink);

    controller.onResize(320.0);
    p.importSyntheticAsync("demo", 2'000'000,
                           [&](TableIdentityEvent e) { controller.handle(e); },
                           [](ProviderError e) { FAIL() << e.message; });

    ASSERT_TRUE(waitUntil([&] { return sink.paintCount() >= 1; }));
    EXPECT_EQ(sink.lastPaint().batch.rows.front()[0], Cell(1));
    EXPECT_EQ(controller.state(), ViewState::Ready);
    EXPECT_GT(controller.mapping().scaleFactor, 1.0);

    controller.scrollToRow(1'999'999);
    ASSERT_TRUE(waitUntil([&] {
        return !sink.lastPaint().batch.empty()
            && sink.lastPaint().batch.rows.back()[0] == Cell(2'000'000);
    }));
    EXPECT_EQ(controller.state(), ViewState::Ready);
    EXPECT_TRUE(controller.lastPaintedWindow().contains(1'999'999));
}
