#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstdlib>
#include <string>
#include <mediadex/metadata/connection_pool.h>

namespace mediadex::metadata {

// PooledConnection implementation
PooledConnection::PooledConnection(std::unique_ptr<Database> db,
                                   std::function<void(PooledConnection*)> returnFunc)
    : db_(std::move(db)), returnFunc_(std::move(returnFunc)) {}

PooledConnection::~PooledConnection() {
    if (db_ && returnFunc_ && !returned_) {
        returnFunc_(this);
    }
}

// ConnectionPool implementation
ConnectionPool::ConnectionPool(std::string dbPath, const ConnectionPoolConfig& config)
    : dbPath_(std::move(dbPath)), config_(config) {
    if (config_.maxConnections == 0) {
        config_.maxConnections = 1;
    }
    config_.minConnections = std::min(config_.minConnections, config_.maxConnections);
}

ConnectionPool::~ConnectionPool() {
    shutdown();
}

std::unique_ptr<PooledConnection> ConnectionPool::wrap(std::unique_ptr<Database> db) {
    return std::make_unique<PooledConnection>(
        std::move(db), [this](PooledConnection* conn) { returnConnection(conn); });
}

Result<void> ConnectionPool::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (shutdown_) {
        return Error{ErrorCode::InvalidState, "Pool is shut down"};
    }

    for (size_t i = 0; i < config_.minConnections; ++i) {
        auto connResult = createConnection();
        if (!connResult) {
            while (!available_.empty()) {
                available_.front()->returned_ = true;
                available_.pop();
            }
            totalConnections_ = 0;
            return connResult.error();
        }
        available_.push(wrap(std::move(connResult).value()));
        totalConnections_++;
    }

    spdlog::debug("[ConnectionPool] initialized with {} connections to {}", config_.minConnections,
                  dbPath_);
    return {};
}

void ConnectionPool::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_) {
        return;
    }
    shutdown_ = true;
    cv_.notify_all();

    while (!available_.empty()) {
        available_.front()->returned_ = true;
        available_.pop();
    }
    totalConnections_ = 0;
    activeConnections_ = 0;
}

Result<std::unique_ptr<PooledConnection>> ConnectionPool::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);

    if (shutdown_) {
        return Error{ErrorCode::NotInitialized, "Pool is shut down"};
    }

    auto deadline = std::chrono::steady_clock::now() + config_.acquireTimeout;
    while (available_.empty()) {
        if (totalConnections_ < config_.maxConnections) {
            totalConnections_++;
            lock.unlock();
            auto connResult = createConnection();
            lock.lock();
            if (!connResult) {
                totalConnections_--;
                return connResult.error();
            }
            activeConnections_++;
            return wrap(std::move(connResult).value());
        }

        if (!cv_.wait_until(lock, deadline, [this] { return !available_.empty() || shutdown_; })) {
            return Error{ErrorCode::Timeout, "Timeout acquiring connection"};
        }
        if (shutdown_) {
            return Error{ErrorCode::NotInitialized, "Pool is shut down"};
        }
    }

    auto conn = std::move(available_.front());
    available_.pop();
    activeConnections_++;
    return conn;
}

ConnectionPool::Stats ConnectionPool::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {totalConnections_, available_.size(), activeConnections_};
}

Result<std::unique_ptr<Database>> ConnectionPool::createConnection() {
    auto db = std::make_unique<Database>();

    auto openResult = db->open(dbPath_, ConnectionMode::Create);
    if (!openResult) {
        return openResult.error();
    }

    auto configResult = configureConnection(*db);
    if (!configResult) {
        return configResult.error();
    }
    return db;
}

Result<void> ConnectionPool::configureConnection(Database& db) {
    auto timeoutResult = db.setBusyTimeout(config_.busyTimeout);
    if (!timeoutResult) {
        return timeoutResult.error();
    }

    if (config_.enableWAL) {
        auto walResult = db.enableWAL();
        if (!walResult) {
            spdlog::warn("[ConnectionPool] WAL enable failed: {}", walResult.error().message);
        }
    }

    if (config_.enableForeignKeys) {
        auto fkResult = db.execute("PRAGMA foreign_keys = ON");
        if (!fkResult) {
            return fkResult.error();
        }
    }

    // Durability is relaxed when running tests
    auto syncResult = db.execute(std::getenv("MEDIADEX_TEST_TMPDIR") ? "PRAGMA synchronous = OFF"
                                                                     : "PRAGMA synchronous = NORMAL");
    if (!syncResult) {
        return syncResult.error();
    }
    return db.execute("PRAGMA temp_store = MEMORY");
}

void ConnectionPool::returnConnection(PooledConnection* conn) {
    if (!conn || !conn->db_)
        return;

    if (conn->db_->inTransaction()) {
        auto rolledBack = conn->db_->rollback();
        if (!rolledBack) {
            spdlog::warn("[ConnectionPool] rollback on return failed: {}",
                         rolledBack.error().message);
        }
    }
    bool valid = isConnectionValid(*conn->db_);

    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_) {
        return;
    }
    activeConnections_--;
    if (!valid) {
        totalConnections_--;
        spdlog::warn("[ConnectionPool] returned connection is invalid, discarding");
        cv_.notify_one();
        return;
    }

    available_.push(wrap(std::move(conn->db_)));
    cv_.notify_one();
}

bool ConnectionPool::isConnectionValid(Database& db) const {
    if (!db.isOpen()) {
        return false;
    }
    auto stmtResult = db.prepare("SELECT 1");
    if (!stmtResult)
        return false;
    Statement stmt = std::move(stmtResult).value();
    return stmt.step().has_value();
}

} // namespace mediadex::metadata
