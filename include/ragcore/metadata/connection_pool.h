#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <type_traits>
#include <vector>
#include <ragcore/metadata/database.h>

namespace ragcore::metadata {

struct ConnectionPoolConfig {
    size_t minConnections = 1; ///< Opened eagerly by initialize()
    size_t maxConnections = 8;
    std::chrono::milliseconds busyTimeout{5000};
    std::chrono::milliseconds acquireTimeout{10000};
    bool enableWAL = true;
    bool enableForeignKeys = true; ///< Required for chunk cascade on document delete
};

class ConnectionPool;

/**
 * @brief A connection checked out of a pool; goes back on destruction
 */
class PooledConnection {
public:
    PooledConnection(std::unique_ptr<Database> db, ConnectionPool* owner)
        : db_(std::move(db)), owner_(owner) {}
    ~PooledConnection();

    PooledConnection(PooledConnection&&) noexcept = default;
    PooledConnection& operator=(PooledConnection&&) = delete;
    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

    Database& operator*() { return *db_; }
    Database* operator->() { return db_.get(); }

private:
    std::unique_ptr<Database> db_;
    ConnectionPool* owner_;
};

/**
 * @brief Thread-safe pool of connections to one SQLite file. Connections are
 * opened on demand up to maxConnections; callers beyond that wait up to
 * acquireTimeout.
 */
class ConnectionPool {
public:
    explicit ConnectionPool(std::string dbPath, const ConnectionPoolConfig& config = {});
    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    Result<void> initialize();

    // Closes idle connections; checked-out ones close when they come back
    void shutdown();

    Result<PooledConnection> acquire();

    /**
     * @brief Run func with a checked-out connection. Exceptions thrown by func
     * become DatabaseError.
     */
    template <typename Func>
    auto withConnection(Func&& func) -> std::invoke_result_t<Func, Database&> {
        auto conn = acquire();
        if (!conn) {
            return conn.error();
        }
        try {
            return func(*conn.value());
        } catch (const std::exception& e) {
            return Error{ErrorCode::DatabaseError, e.what()};
        }
    }

private:
    friend class PooledConnection;

    Result<std::unique_ptr<Database>> openConnection();
    void release(std::unique_ptr<Database> db);

    std::string dbPath_;
    ConnectionPoolConfig config_;

    std::mutex mutex_;
    std::condition_variable returned_;
    std::vector<std::unique_ptr<Database>> idle_;
    size_t open_ = 0;
    bool shutdown_ = false;
};

} // namespace ragcore::metadata
