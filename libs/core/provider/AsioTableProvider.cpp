#include "AsioTableProvider.hpp"
#include "TabulaErrors.hpp"
#include "TabulaLogging.hpp"
#include <boost/asio/bind_executor.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <QMetaObject>
#include <QPointer>
#include <QString>
#include <algorithm>
#include <iterator>

AsioTableProvider::AsioTableProvider(MemoryTableStore& store, Options options, QObject* parent)
    : QObject(parent)
    , m_store(store)
    , m_options(options) {
    m_options.workerThreads = std::max(1, m_options.workerThreads);
}

AsioTableProvider::~AsioTableProvider() {
    stop();
}

void AsioTableProvider::start() {
    if (m_running.exchange(true)) return;

    tLog_App("Starting table provider with" << m_options.workerThreads << "worker threads");

    // Fresh context per run so nothing abandoned by stop() is ever resumed
    m_ioc = std::make_unique<net::io_context>();
    m_workGuard.emplace(m_ioc->get_executor());

    for (int i = 0; i < m_options.workerThreads; ++i) {
        m_workers.emplace_back([ioc = m_ioc.get()] { ioc->run(); });
    }
}

void AsioTableProvider::stop() {
    if (!m_running.exchange(false)) return;

    tLog_App("Stopping table provider");

    // Outstanding jobs are abandoned; their callbacks never fire
    m_workGuard.reset();
    m_ioc->stop();
    for (auto& worker : m_workers) {
        if (worker.joinable()) worker.join();
    }
    m_workers.clear();
    m_ioc.reset();
}

// -----------------------------------------------------------------------------
// Job plumbing
// -----------------------------------------------------------------------------

void AsioTableProvider::submit(const char* what, Job job, ErrorCb onError) {
    if (!m_running.load()) {
        fail(std::move(onError), {ProviderErrorKind::Unreachable, "table provider is not running"});
        return;
    }

    const uint64_t jobId = ++m_jobCount;
    tLog_Data("Job" << jobId << what << "submitted");

    struct Operation {
        explicit Operation(net::io_context& ioc)
            : strand(net::make_strand(ioc))
            , latency(strand)
            , deadline(strand) {}

        net::strand<net::io_context::executor_type> strand;
        net::steady_timer latency;
        net::steady_timer deadline;
        bool              finished = false;   // guarded by strand
    };

    auto op = std::make_shared<Operation>(*m_ioc);
    auto sharedJob = std::make_shared<Job>(std::move(job));

    // Timers are armed and cancelled only on the job's strand
    net::post(op->strand, [this, op, what, jobId, sharedJob, onError]() {
        op->deadline.expires_after(m_options.timeout);
        op->deadline.async_wait(net::bind_executor(op->strand,
            [this, op, what, jobId, onError](const boost::system::error_code& ec) {
                if (ec || op->finished) return;
                op->finished = true;
                op->latency.cancel();
                fail(onError, {ProviderErrorKind::Timeout,
                               fmt::format("{} timed out after {} ms", what, m_options.timeout.count())});
                tLog_Warning("Job" << jobId << what << "timed out");
            }));

        op->latency.expires_after(m_options.latency);
        op->latency.async_wait(net::bind_executor(op->strand,
            [this, op, what, jobId, sharedJob, onError](const boost::system::error_code& ec) {
                if (ec || op->finished) return;

                if (m_offline.load()) {
                    op->finished = true;
                    op->deadline.cancel();
                    fail(onError, {ProviderErrorKind::Unreachable, fmt::format("{}: backend unreachable", what)});
                    return;
                }

                // Store work runs off the strand so the deadline keeps ticking
                net::post(op->strand.get_inner_executor(), [this, op, what, jobId, sharedJob, onError]() {
                    std::function<void()> continuation;
                    std::optional<ProviderError> error;
                    try {
                        continuation = (*sharedJob)();
                    } catch (const std::exception& e) {
                        error = toProviderError(e);
                    }

                    net::post(op->strand, [this, op, what, jobId, onError,
                                           continuation = std::move(continuation),
                                           error = std::move(error)]() mutable {
                        if (op->finished) return;   // timed out while running
                        op->finished = true;
                        op->deadline.cancel();
                        if (error) {
                            tLog_Warning("Job" << jobId << what << "failed:" << QString::fromStdString(error->message));
                            fail(onError, std::move(*error));
                            return;
                        }
                        deliver(std::move(continuation));
                    });
                });
            }));
    });
}

void AsioTableProvider::deliver(std::function<void()> fn) {
    QPointer<AsioTableProvider> self(this);
    QMetaObject::invokeMethod(this, [self, fn = std::move(fn)] {
        if (!self) return;
        fn();
    }, Qt::QueuedConnection);
}

void AsioTableProvider::fail(ErrorCb onError, ProviderError error) {
    deliver([onError = std::move(onError), error = std::move(error)] {
        if (onError) onError(error);
    });
}

ProviderError AsioTableProvider::toProviderError(const std::exception& e) {
    if (dynamic_cast<const TableNotFoundError*>(&e)) {
        return {ProviderErrorKind::TableMissing, e.what()};
    }
    return {ProviderErrorKind::Internal, e.what()};
}

// -----------------------------------------------------------------------------
// ITableProvider
// -----------------------------------------------------------------------------

void AsioTableProvider::fetchWindow(const std::string& tableId, int64_t startIndex, int64_t count,
                                    FetchCb onResult, ErrorCb onError) {
    submit("fetch", [this, tableId, startIndex, count, onResult = std::move(onResult)]() -> std::function<void()> {
        auto result = std::make_shared<FetchResult>(m_store.fetch(tableId, startIndex, count));
        return [onResult, result] { onResult(std::move(*result)); };
    }, std::move(onError));
}

void AsioTableProvider::dropTable(const std::string& tableId, DoneCb onDone, ErrorCb onError) {
    submit("drop", [this, tableId, onDone = std::move(onDone)]() -> std::function<void()> {
        if (!m_store.drop(tableId)) {
            throw TableNotFoundError(tableId);
        }
        return [onDone] { if (onDone) onDone(); };
    }, std::move(onError));
}

// -----------------------------------------------------------------------------
// Table identity jobs
// -----------------------------------------------------------------------------

void AsioTableProvider::importSyntheticAsync(const std::string& name, int64_t rowCount,
                                             IdentityCb onDone, ErrorCb onError) {
    submit("import", [this, name, rowCount, onDone = std::move(onDone)]() -> std::function<void()> {
        TableIdentityEvent event;
        event.change = TableChange::Import;
        event.tableId = m_store.importSynthetic(name, rowCount);
        event.totalRows = m_store.rowCount(event.tableId);
        event.detail = name;
        return [onDone, event] { onDone(event); };
    }, std::move(onError));
}

void AsioTableProvider::sortAsync(const std::string& tableId, const std::string& column, bool ascending,
                                  IdentityCb onDone, ErrorCb onError) {
    submit("sort", [this, tableId, column, ascending, onDone = std::move(onDone)]() -> std::function<void()> {
        TableIdentityEvent event;
        event.change = TableChange::Sort;
        event.tableId = m_store.sortTable(tableId, column, ascending);
        event.totalRows = m_store.rowCount(event.tableId);
        event.detail = fmt::format("{} ({})", column, ascending ? "ascending" : "descending");
        return [onDone, event] { onDone(event); };
    }, std::move(onError));
}

void AsioTableProvider::filterAsync(const std::string& tableId, std::vector<FilterCondition> conditions,
                                    IdentityCb onDone, ErrorCb onError) {
    submit("filter", [this, tableId, conditions = std::move(conditions), onDone = std::move(onDone)]()
               -> std::function<void()> {
        TableIdentityEvent event;
        event.change = TableChange::Filter;
        event.tableId = m_store.filterTable(tableId, conditions);
        event.totalRows = m_store.rowCount(event.tableId);
        std::vector<std::string> parts;
        parts.reserve(conditions.size());
        for (const auto& condition : conditions) parts.push_back(condition.describe());
        event.detail = fmt::format("{}", fmt::join(parts, " AND "));
        return [onDone, event] { onDone(event); };
    }, std::move(onError));
}

void AsioTableProvider::resetAsync(const std::string& tableId, IdentityCb onDone, ErrorCb onError) {
    submit("reset", [this, tableId, onDone = std::move(onDone)]() -> std::function<void()> {
        TableIdentityEvent event;
        event.change = TableChange::Reset;
        event.tableId = m_store.rootOf(tableId);
        event.totalRows = m_store.rowCount(event.tableId);
        event.detail = event.tableId;
        return [onDone, event] { onDone(event); };
    }, std::move(onError));
}

// -----------------------------------------------------------------------------
// Progressive import
// -----------------------------------------------------------------------------

struct AsioTableProvider::ImportState {
    std::string      tableId;
    std::vector<Row> rows;
    std::size_t      next = 0;
    std::size_t      chunk = 0;
    ProgressCb       onProgress;
    DoneCb           onDone;
    ErrorCb          onError;
};

void AsioTableProvider::importRowsAsync(const std::string& name, std::vector<std::string> columns,
                                        std::vector<Row> rows, int64_t chunkRows, IdentityCb onStarted,
                                        ProgressCb onProgress, DoneCb onDone, ErrorCb onError) {
    if (chunkRows <= 0 || static_cast<std::size_t>(chunkRows) >= rows.size()) {
        submit("import", [this, name, columns = std::move(columns), rows = std::move(rows),
                          onStarted = std::move(onStarted), onDone = std::move(onDone)]() mutable
                   -> std::function<void()> {
            TableIdentityEvent event;
            event.change = TableChange::Import;
            event.tableId = m_store.importTable(name, std::move(columns), std::move(rows));
            event.totalRows = m_store.rowCount(event.tableId);
            event.detail = name;
            return [onStarted, onDone, event] {
                onStarted(event);
                if (onDone) onDone();
            };
        }, std::move(onError));
        return;
    }

    auto state = std::make_shared<ImportState>();
    state->rows = std::move(rows);
    state->chunk = static_cast<std::size_t>(chunkRows);
    state->onProgress = std::move(onProgress);
    state->onDone = std::move(onDone);
    state->onError = onError;

    submit("import", [this, name, columns = std::move(columns), state, onStarted = std::move(onStarted)]() mutable
               -> std::function<void()> {
        state->tableId = m_store.beginImport(name, std::move(columns));
        TableIdentityEvent event;
        event.change = TableChange::Import;
        event.tableId = state->tableId;
        event.totalRows = 0;
        event.detail = name;
        return [this, state, onStarted, event] {
            onStarted(event);
            importNextChunk(state);
        };
    }, std::move(onError));
}

void AsioTableProvider::importNextChunk(std::shared_ptr<ImportState> state) {
    if (state->next >= state->rows.size()) {
        tLog_Data("Import of" << QString::fromStdString(state->tableId) << "complete");
        if (state->onDone) state->onDone();
        return;
    }

    submit("append", [this, state]() -> std::function<void()> {
        const std::size_t end = std::min(state->rows.size(), state->next + state->chunk);
        std::vector<Row> chunk(std::make_move_iterator(state->rows.begin() + static_cast<std::ptrdiff_t>(state->next)),
                               std::make_move_iterator(state->rows.begin() + static_cast<std::ptrdiff_t>(end)));
        state->next = end;
        const int64_t total = m_store.appendRows(state->tableId, std::move(chunk));
        return [this, state, total] {
            if (state->onProgress) state->onProgress(RowCountEvent{total});
            importNextChunk(state);
        };
    }, state->onError);
}
