#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <type_traits>
#include <mediadex/metadata/database.h>

namespace mediadex::metadata {

/**
 * @brief Configuration for connection pool
 */
struct ConnectionPoolConfig {
    size_t minConnections = 2;                     ///< Connections opened at initialization
    size_t maxConnections = 10;                    ///< Maximum connections allowed
    std::chrono::milliseconds busyTimeout{2000};   ///< SQLite busy timeout
    std::chrono::milliseconds acquireTimeout{30000}; ///< Wait limit when the pool is exhausted
    bool enableWAL = true;                         ///< Readers proceed during writes
    bool enableForeignKeys = true;                 ///< Needed for cascading sampler rows
};

/**
 * @brief Database connection wrapper that returns itself to the pool
 */
class PooledConnection {
public:
    PooledConnection(std::unique_ptr<Database> db,
                     std::function<void(PooledConnection*)> returnFunc);
    ~PooledConnection();

    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

    Database* operator->() { return db_.get(); }
    Database& operator*() { return *db_; }

    [[nodiscard]] bool isValid() const { return db_ != nullptr; }

private:
    friend class ConnectionPool;

    std::unique_ptr<Database> db_;
    std::function<void(PooledConnection*)> returnFunc_;
    bool returned_ = false;
};

/**
 * @brief Thread-safe database connection pool
 */
class ConnectionPool {
public:
    explicit ConnectionPool(std::string dbPath, const ConnectionPoolConfig& config = {});
    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    Result<void> initialize();
    void shutdown();

    [[nodiscard]] bool isShutdown() const { return shutdown_.load(); }

    /**
     * @brief Acquire a connection, opening a new one while below the maximum
     */
    Result<std::unique_ptr<PooledConnection>> acquire();

    /**
     * @brief Execute a function with a connection
     */
    template <typename Func>
    auto withConnection(Func&& func) -> std::invoke_result_t<Func, Database&> {
        auto connResult = acquire();
        if (!connResult) {
            return connResult.error();
        }
        auto conn = std::move(connResult).value();
        try {
            return func(**conn);
        } catch (const std::exception& e) {
            return Error{ErrorCode::DatabaseError, e.what()};
        }
    }

    struct Stats {
        size_t totalConnections = 0;
        size_t availableConnections = 0;
        size_t activeConnections = 0;
    };
    [[nodiscard]] Stats getStats() const;

    const std::string& path() const { return dbPath_; }

private:
    Result<std::unique_ptr<Database>> createConnection();
    Result<void> configureConnection(Database& db);
    void returnConnection(PooledConnection* conn);
    bool isConnectionValid(Database& db) const;
    std::unique_ptr<PooledConnection> wrap(std::unique_ptr<Database> db);

    std::string dbPath_;
    ConnectionPoolConfig config_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::queue<std::unique_ptr<PooledConnection>> available_;
    size_t totalConnections_ = 0;
    size_t activeConnections_ = 0;
    std::atomic<bool> shutdown_{false};
};

} // namespace mediadex::metadata
