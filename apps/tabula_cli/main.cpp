// Headless driver: runs the viewer pipeline against a console render sink and
// walks a fixed script (middle, bottom, go to row, sort, filter, reset).
#include "Log.hpp"
#include "config/ViewerConfig.hpp"
#include "fetch/FetchOrchestrator.hpp"
#include "glue/ScrollController.hpp"
#include "provider/AsioTableProvider.hpp"
#include "provider/MemoryTableStore.hpp"
#include "provider/TableLoader.hpp"
#include "render/IRenderSink.hpp"
#include "session/TableSessionRegistry.hpp"
#include <QCoreApplication>
#include <QTimer>
#include <chrono>
#include <deque>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

constexpr const char* kCat = "cli";
constexpr double kViewportHeight = 640.0;

class ConsoleRenderSink : public IRenderSink {
public:
    void renderBatch(double physicalOffset, const RowBatch& rows) override {
        ++m_batches;
        if (rows.empty()) {
            LOG_I(kCat, "paint #{} @{:.1f}: empty", m_batches, physicalOffset);
            return;
        }
        LOG_I(kCat, "paint #{} @{:.1f}: rows {}-{}", m_batches, physicalOffset,
              rows.startIndex + 1, rows.startIndex + static_cast<int64_t>(rows.size()));
        LOG_I(kCat, "  first: {}", nlohmann::json(rows.rows.front()).dump());
        LOG_D(kCat, "  last:  {}", nlohmann::json(rows.rows.back()).dump());
    }

    void clear() override {
        LOG_I(kCat, "clear");
    }

private:
    int m_batches = 0;
};

}

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);

    ViewerConfig config;
    try {
        config = ViewerConfig::load(argc > 1 ? QString::fromLocal8Bit(argv[1]) : QString());
    } catch (const std::invalid_argument& e) {
        LOG_E(kCat, "invalid configuration: {}", e.what());
        return 1;
    }

    AsioTableProvider::Options options;
    options.workerThreads = config.workerThreads;
    options.latency = std::chrono::milliseconds(config.latencyMs);
    options.timeout = std::chrono::milliseconds(config.timeoutMs);

    MemoryTableStore store;
    AsioTableProvider provider(store, options);
    TableSessionRegistry registry;
    FetchOrchestrator fetcher(provider, registry);
    ConsoleRenderSink sink;
    ScrollController controller(config, registry, fetcher, sink);

    QObject::connect(&controller, &ScrollController::statusChanged, [](const QString& status) {
        LOG_I(kCat, "status: {}", status.toStdString());
    });
    QObject::connect(&controller, &ScrollController::scaleChanged, [](const ScaleMapping& mapping) {
        LOG_I(kCat, "scale: {}", ScaleMapper::mappingDebugString(mapping).toStdString());
    });
    QObject::connect(&controller, &ScrollController::errorStateChanged, [&app](bool hasError, const QString& message) {
        if (!hasError) return;
        LOG_E(kCat, "{}", message.toStdString());
        app.exit(1);
    });

    bool awaitingJob = false;
    auto identityDone = [&](TableIdentityEvent event) {
        awaitingJob = false;
        controller.handle(event);
    };
    auto jobFailed = [&app, &awaitingJob](ProviderError error) {
        awaitingJob = false;
        LOG_E(kCat, "job failed ({}): {}", toString(error.kind), error.message);
        app.exit(1);
    };
    auto activeId = [&registry]() { return registry.active().tableId; };

    std::deque<std::pair<const char*, std::function<void()>>> steps;
    steps.emplace_back("import", [&] {
        awaitingJob = true;
        if (config.dataSource.isEmpty()) {
            provider.importSyntheticAsync("synthetic", config.syntheticRows, identityDone, jobFailed);
            return;
        }
        LoadedTable table;
        try {
            table = TableLoader::loadFile(config.dataSource.toStdString());
        } catch (const std::runtime_error& e) {
            LOG_E(kCat, "{}", e.what());
            app.exit(1);
            return;
        }
        provider.importRowsAsync(table.name, std::move(table.columns), std::move(table.rows), config.importChunkRows,
            [&](TableIdentityEvent event) { controller.handle(event); },
            [&](RowCountEvent event) { controller.handle(event); },
            [&] { awaitingJob = false; },
            jobFailed);
    });
    steps.emplace_back("scroll to middle", [&] { controller.onScroll(controller.maxScrollOffset() / 2.0); });
    steps.emplace_back("scroll to bottom", [&] { controller.onScroll(controller.maxScrollOffset()); });
    steps.emplace_back("go to row 1000", [&] { controller.scrollToRow(999); });
    // Sort and filter work on the first column; a table without columns skips them
    auto firstColumn = [&](const char* step) -> std::optional<std::string> {
        const std::vector<std::string> columns = store.columns(activeId());
        if (columns.empty()) {
            LOG_W(kCat, "skipping {}: table {} has no columns", step, activeId());
            return std::nullopt;
        }
        return columns.front();
    };

    steps.emplace_back("sort", [&] {
        const auto column = firstColumn("sort");
        if (!column) return;
        awaitingJob = true;
        provider.sortAsync(activeId(), *column, false, identityDone, jobFailed);
    });
    steps.emplace_back("filter", [&] {
        const auto column = firstColumn("filter");
        if (!column) return;
        awaitingJob = true;
        FilterCondition condition;
        condition.column = *column;
        condition.op = FilterCondition::Op::Le;
        condition.value = 100;
        provider.filterAsync(activeId(), {condition}, identityDone, jobFailed);
    });
    steps.emplace_back("reset", [&] {
        awaitingJob = true;
        provider.resetAsync(activeId(), identityDone, jobFailed);
    });

    // Advance one step whenever the pipeline is idle
    QTimer ticker;
    QObject::connect(&ticker, &QTimer::timeout, [&] {
        const bool idle = !awaitingJob && !fetcher.isLoading() && controller.state() != ViewState::Loading;
        if (!idle) return;
        if (steps.empty()) {
            const FetchStats& stats = fetcher.stats();
            LOG_I(kCat, "done: issued={} accepted={} discarded={} coalesced={} deduplicated={} failed={}",
                  stats.issued, stats.accepted, stats.discarded, stats.coalesced, stats.deduplicated, stats.failed);
            app.quit();
            return;
        }
        auto [name, step] = std::move(steps.front());
        steps.pop_front();
        LOG_I(kCat, "--- {} ---", name);
        step();
    });

    provider.start();
    controller.onResize(kViewportHeight);
    ticker.start(10);

    const int rc = app.exec();
    provider.stop();
    return rc;
}
