/*
Tabula — AsioTableProvider
Role: Asynchronous ITableProvider over MemoryTableStore; also runs sort/filter/reset/import as async jobs.
Inputs/Outputs: Takes window and table-identity requests; answers through callbacks on the owner thread.
Threading: Work runs on a Boost.Asio io_context driven by worker threads (one strand per request);
           completions are marshalled back to the Qt thread that owns this object.
Performance: Store reads use shared locking, so concurrent fetches proceed in parallel.
Integration: Created by the front ends; injected into FetchOrchestrator as its ITableProvider.
Observability: Job lifecycle via tLog_Data, failures via tLog_Warning.
Related: AsioTableProvider.cpp, MemoryTableStore.hpp, ITableProvider.hpp, ViewportEvents.hpp.
Assumptions: The store outlives this object; callbacks never fire after destruction.
*/
#pragma once
#include "MemoryTableStore.hpp"
#include "fetch/ITableProvider.hpp"
#include "glue/ViewportEvents.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <QObject>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

namespace net = boost::asio;

class AsioTableProvider : public QObject, public ITableProvider {
    Q_OBJECT

public:
    struct Options {
        int                       workerThreads = 2;
        std::chrono::milliseconds latency{0};      // simulated round trip per job
        std::chrono::milliseconds timeout{5000};   // per job, measured from submission; covers store work
    };

    using IdentityCb = std::function<void(TableIdentityEvent)>;
    using ProgressCb = std::function<void(RowCountEvent)>;

    AsioTableProvider(MemoryTableStore& store, Options options, QObject* parent = nullptr);
    ~AsioTableProvider() override;                  // RAII shutdown

    // Non-copyable, non-movable (manages threads)
    AsioTableProvider(const AsioTableProvider&) = delete;
    AsioTableProvider& operator=(const AsioTableProvider&) = delete;
    AsioTableProvider(AsioTableProvider&&) = delete;
    AsioTableProvider& operator=(AsioTableProvider&&) = delete;

    void start();
    void stop();
    bool isRunning() const { return m_running.load(); }

    // Simulates an unreachable backend; jobs fail with ProviderErrorKind::Unreachable
    void setOffline(bool offline) { m_offline.store(offline); }
    bool isOffline() const { return m_offline.load(); }

    // ITableProvider
    void fetchWindow(const std::string& tableId, int64_t startIndex, int64_t count,
                     FetchCb onResult, ErrorCb onError) override;
    void dropTable(const std::string& tableId, DoneCb onDone, ErrorCb onError) override;

    // Table identity jobs
    void importSyntheticAsync(const std::string& name, int64_t rowCount, IdentityCb onDone, ErrorCb onError);
    void sortAsync(const std::string& tableId, const std::string& column, bool ascending,
                   IdentityCb onDone, ErrorCb onError);
    void filterAsync(const std::string& tableId, std::vector<FilterCondition> conditions,
                     IdentityCb onDone, ErrorCb onError);
    void resetAsync(const std::string& tableId, IdentityCb onDone, ErrorCb onError);

    // Progressive import: onStarted carries the (empty) table identity, then one
    // onProgress per appended chunk, then onDone. chunkRows <= 0 imports in one shot.
    void importRowsAsync(const std::string& name, std::vector<std::string> columns, std::vector<Row> rows,
                         int64_t chunkRows, IdentityCb onStarted, ProgressCb onProgress,
                         DoneCb onDone, ErrorCb onError);

private:
    // A job runs on a worker and returns the continuation to run on the owner thread
    using Job = std::function<std::function<void()>()>;

    struct ImportState;

    void submit(const char* what, Job job, ErrorCb onError);
    void deliver(std::function<void()> fn);
    void fail(ErrorCb onError, ProviderError error);
    void importNextChunk(std::shared_ptr<ImportState> state);
    static ProviderError toProviderError(const std::exception& e);

    MemoryTableStore&   m_store;
    Options             m_options;

    std::unique_ptr<net::io_context> m_ioc;
    std::optional<net::executor_work_guard<net::io_context::executor_type>> m_workGuard;
    std::vector<std::thread> m_workers;

    std::atomic<bool>   m_running{false};
    std::atomic<bool>   m_offline{false};
    std::atomic<uint64_t> m_jobCount{0};
};
