#pragma once

#include <sqlite3.h>
#include <chrono>
#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include <ragcore/core/types.h>

namespace ragcore::metadata {

class Database;

/**
 * @brief Prepared statement owned by RAII; obtained from Database::prepare
 */
class Statement {
public:
    ~Statement();

    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    /**
     * @brief Bind one parameter (1-based index). Timestamps are stored as unix
     * seconds.
     */
    Result<void> bind(int index, std::nullptr_t);
    Result<void> bind(int index, int value);
    Result<void> bind(int index, int64_t value);
    Result<void> bind(int index, const std::string& value);
    Result<void> bind(int index, std::string_view value);
    Result<void> bind(int index, std::span<const std::byte> blob);
    Result<void> bind(int index, std::chrono::sys_seconds tp);
    Result<void> bind(int index, const char* value) { return bind(index, std::string_view(value)); }

    // Binds args to parameters 1..N in order
    template <typename... Args> Result<void> bindAll(Args&&... args) {
        return bindFrom(1, std::forward<Args>(args)...);
    }

    // Run to completion; for statements that return no rows
    Result<void> execute();

    /**
     * @brief Advance to the next row
     * @return true if a row is available, false when done
     */
    Result<bool> step();

    int getInt(int column) const;
    int64_t getInt64(int column) const;
    std::string getString(int column) const;
    std::vector<std::byte> getBlob(int column) const;
    std::chrono::sys_seconds getTime(int column) const;
    bool isNull(int column) const;

    Result<void> reset();
    Result<void> clearBindings();

private:
    friend class Database;
    explicit Statement(sqlite3_stmt* stmt) : stmt_(stmt) {}

    // Steps once, retrying briefly while the database is locked
    int stepRetrying();
    Result<void> checkBind(int rc, int index, const char* kind) const;

    template <typename T, typename... Rest>
    Result<void> bindFrom(int index, T&& value, Rest&&... rest) {
        auto result = bind(index, std::forward<T>(value));
        if (!result)
            return result;
        if constexpr (sizeof...(rest) > 0) {
            return bindFrom(index + 1, std::forward<Rest>(rest)...);
        }
        return {};
    }

    Result<void> bindFrom(int) { return {}; }

    sqlite3_stmt* stmt_ = nullptr;
};

/**
 * @brief One SQLite connection to the knowledge database
 */
class Database {
public:
    Database() = default;
    ~Database();

    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;
    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    // Opens read-write, creating the file when missing
    Result<void> open(const std::string& path);
    void close();
    [[nodiscard]] bool isOpen() const { return db_ != nullptr; }

    Result<Statement> prepare(const std::string& sql);

    // Runs one or more statements that return no rows
    Result<void> execute(const std::string& sql);

    /**
     * @brief Begin a write transaction (BEGIN IMMEDIATE, so concurrent writers
     * queue on the busy handler instead of failing on lock upgrade)
     */
    Result<void> beginTransaction();
    Result<void> commit();
    Result<void> rollback();

    /**
     * @brief Execute func inside a transaction; rolls back when it returns an
     * error or throws
     */
    template <typename Func> Result<void> transaction(Func&& func) {
        auto beginResult = beginTransaction();
        if (!beginResult)
            return beginResult;

        try {
            Result<void> result = func();
            if (!result) {
                rollbackQuietly();
                return result;
            }
            return commit();
        } catch (...) {
            rollbackQuietly();
            throw;
        }
    }

    int64_t lastInsertRowId() const;
    int changes() const;

    Result<void> setBusyTimeout(std::chrono::milliseconds timeout);
    Result<void> enableWAL();

private:
    void rollbackQuietly();

    sqlite3* db_ = nullptr;
    std::string path_;
    bool inTransaction_ = false;
};

} // namespace ragcore::metadata
