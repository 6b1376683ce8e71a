#include <spdlog/spdlog.h>
#include <ragcore/metadata/connection_pool.h>

namespace ragcore::metadata {

PooledConnection::~PooledConnection() {
    if (db_ && owner_) {
        owner_->release(std::move(db_));
    }
}

ConnectionPool::ConnectionPool(std::string dbPath, const ConnectionPoolConfig& config)
    : dbPath_(std::move(dbPath)), config_(config) {}

ConnectionPool::~ConnectionPool() {
    shutdown();
}

Result<void> ConnectionPool::initialize() {
    std::vector<std::unique_ptr<Database>> opened;
    for (size_t i = 0; i < config_.minConnections; ++i) {
        auto db = openConnection();
        if (!db) {
            return db.error();
        }
        opened.push_back(std::move(db).value());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_) {
        return Error{ErrorCode::InvalidState, "Pool is shut down"};
    }
    open_ += opened.size();
    for (auto& db : opened) {
        idle_.push_back(std::move(db));
    }
    spdlog::debug("Connection pool for {} opened {} connections", dbPath_, opened.size());
    return {};
}

void ConnectionPool::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    shutdown_ = true;
    open_ -= idle_.size();
    idle_.clear();
    returned_.notify_all();
}

Result<PooledConnection> ConnectionPool::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    const auto deadline = std::chrono::steady_clock::now() + config_.acquireTimeout;
    while (true) {
        if (shutdown_) {
            return Error{ErrorCode::InvalidState, "Pool is shut down"};
        }
        if (!idle_.empty()) {
            auto db = std::move(idle_.back());
            idle_.pop_back();
            return PooledConnection(std::move(db), this);
        }
        if (open_ < config_.maxConnections) {
            ++open_;
            lock.unlock();
            auto db = openConnection();
            if (!db) {
                lock.lock();
                --open_;
                return db.error();
            }
            return PooledConnection(std::move(db).value(), this);
        }
        if (returned_.wait_until(lock, deadline) == std::cv_status::timeout && idle_.empty()) {
            return Error{ErrorCode::Timeout, "Timed out waiting for a connection to " + dbPath_};
        }
    }
}

Result<std::unique_ptr<Database>> ConnectionPool::openConnection() {
    auto db = std::make_unique<Database>();
    auto opened = db->open(dbPath_);
    if (!opened) {
        return opened.error();
    }
    auto timeout = db->setBusyTimeout(config_.busyTimeout);
    if (!timeout) {
        return timeout.error();
    }
    if (config_.enableWAL) {
        auto wal = db->enableWAL();
        if (!wal) {
            spdlog::warn("WAL unavailable for {}: {}", dbPath_, wal.error().message);
        }
    }
    if (config_.enableForeignKeys) {
        auto fk = db->execute("PRAGMA foreign_keys = ON");
        if (!fk) {
            return fk.error();
        }
    }
    auto sync = db->execute("PRAGMA synchronous = NORMAL");
    if (!sync) {
        spdlog::debug("synchronous pragma ignored: {}", sync.error().message);
    }
    return db;
}

void ConnectionPool::release(std::unique_ptr<Database> db) {
    // A connection never goes back mid-transaction
    if (db->rollback()) {
        spdlog::warn("Connection to {} returned with an open transaction; rolled back", dbPath_);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_) {
        --open_;
        return;
    }
    idle_.push_back(std::move(db));
    returned_.notify_one();
}

} // namespace ragcore::metadata
