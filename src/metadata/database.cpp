#include <spdlog/spdlog.h>
#include <cstring>
#include <thread>
#include <utility>
#include <ragcore/metadata/database.h>

namespace ragcore::metadata {

namespace {

constexpr int kLockedAttempts = 5;
constexpr auto kFirstLockedWait = std::chrono::milliseconds(10);
constexpr size_t kSqlInErrors = 80;

bool isLocked(int rc) {
    return rc == SQLITE_BUSY || rc == SQLITE_LOCKED;
}

// Leading part of a statement's SQL, for error messages
std::string sqlExcerpt(const char* sql) {
    if (!sql)
        return {};
    const size_t len = std::strlen(sql);
    if (len <= kSqlInErrors)
        return sql;
    return std::string(sql, kSqlInErrors) + "...";
}

Error stepError(sqlite3_stmt* stmt, int rc) {
    std::string message = std::string("SQLite step failed: ") + sqlite3_errstr(rc);
    if (rc == SQLITE_CONSTRAINT) {
        message += " (" + std::string(sqlite3_errmsg(sqlite3_db_handle(stmt))) + ") in [" +
                   sqlExcerpt(sqlite3_sql(stmt)) + "]";
    }
    return Error{ErrorCode::DatabaseError, std::move(message)};
}

} // namespace

Statement::~Statement() {
    sqlite3_finalize(stmt_);
}

Statement::Statement(Statement&& other) noexcept : stmt_(other.stmt_) {
    other.stmt_ = nullptr;
}

Statement& Statement::operator=(Statement&& other) noexcept {
    if (this != &other) {
        sqlite3_finalize(stmt_);
        stmt_ = other.stmt_;
        other.stmt_ = nullptr;
    }
    return *this;
}

Result<void> Statement::checkBind(int rc, int index, const char* kind) const {
    if (rc == SQLITE_OK)
        return {};
    return Error{ErrorCode::DatabaseError, "Cannot bind " + std::string(kind) + " to parameter " +
                                               std::to_string(index) + ": " + sqlite3_errstr(rc)};
}

Result<void> Statement::bind(int index, std::nullptr_t) {
    return checkBind(sqlite3_bind_null(stmt_, index), index, "NULL");
}

Result<void> Statement::bind(int index, int value) {
    return checkBind(sqlite3_bind_int(stmt_, index, value), index, "int");
}

Result<void> Statement::bind(int index, int64_t value) {
    return checkBind(sqlite3_bind_int64(stmt_, index, value), index, "int64");
}

Result<void> Statement::bind(int index, const std::string& value) {
    return bind(index, std::string_view(value));
}

Result<void> Statement::bind(int index, std::string_view value) {
    const int rc = sqlite3_bind_text(stmt_, index, value.data(), static_cast<int>(value.size()),
                                     SQLITE_TRANSIENT);
    return checkBind(rc, index, "text");
}

Result<void> Statement::bind(int index, std::span<const std::byte> blob) {
    const int rc = sqlite3_bind_blob(stmt_, index, blob.data(), static_cast<int>(blob.size()),
                                     SQLITE_TRANSIENT);
    return checkBind(rc, index, "blob");
}

Result<void> Statement::bind(int index, std::chrono::sys_seconds tp) {
    return bind(index, static_cast<int64_t>(tp.time_since_epoch().count()));
}

int Statement::stepRetrying() {
    auto wait = kFirstLockedWait;
    int rc = sqlite3_step(stmt_);
    for (int attempt = 1; isLocked(rc) && attempt < kLockedAttempts; ++attempt) {
        sqlite3_reset(stmt_);
        std::this_thread::sleep_for(wait);
        wait *= 2;
        rc = sqlite3_step(stmt_);
    }
    return rc;
}

Result<void> Statement::execute() {
    const int rc = stepRetrying();
    if (rc == SQLITE_DONE)
        return {};
    return stepError(stmt_, rc);
}

Result<bool> Statement::step() {
    const int rc = stepRetrying();
    if (rc == SQLITE_ROW)
        return true;
    if (rc == SQLITE_DONE)
        return false;
    return stepError(stmt_, rc);
}

int Statement::getInt(int column) const {
    return sqlite3_column_int(stmt_, column);
}

int64_t Statement::getInt64(int column) const {
    return sqlite3_column_int64(stmt_, column);
}

std::string Statement::getString(int column) const {
    const auto* text = sqlite3_column_text(stmt_, column);
    if (!text)
        return {};
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<size_t>(sqlite3_column_bytes(stmt_, column)));
}

std::vector<std::byte> Statement::getBlob(int column) const {
    const auto* data = static_cast<const std::byte*>(sqlite3_column_blob(stmt_, column));
    const int size = sqlite3_column_bytes(stmt_, column);
    if (!data || size <= 0)
        return {};
    return std::vector<std::byte>(data, data + size);
}

std::chrono::sys_seconds Statement::getTime(int column) const {
    return std::chrono::sys_seconds{std::chrono::seconds{getInt64(column)}};
}

bool Statement::isNull(int column) const {
    return sqlite3_column_type(stmt_, column) == SQLITE_NULL;
}

Result<void> Statement::reset() {
    // sqlite3_reset repeats the last step error; the step already reported it
    sqlite3_reset(stmt_);
    return {};
}

Result<void> Statement::clearBindings() {
    if (sqlite3_clear_bindings(stmt_) != SQLITE_OK) {
        return Error{ErrorCode::DatabaseError, "Cannot clear statement bindings"};
    }
    return {};
}

Database::~Database() {
    close();
}

Database::Database(Database&& other) noexcept
    : db_(std::exchange(other.db_, nullptr)), path_(std::move(other.path_)),
      inTransaction_(std::exchange(other.inTransaction_, false)) {}

Database& Database::operator=(Database&& other) noexcept {
    if (this != &other) {
        close();
        db_ = std::exchange(other.db_, nullptr);
        path_ = std::move(other.path_);
        inTransaction_ = std::exchange(other.inTransaction_, false);
    }
    return *this;
}

Result<void> Database::open(const std::string& path) {
    close();
    // Pooled connections move between threads
    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    const int rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string reason = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
        sqlite3_close(db_);
        db_ = nullptr;
        return Error{ErrorCode::DatabaseError, "Cannot open " + path + ": " + reason};
    }
    path_ = path;
    return setBusyTimeout(std::chrono::milliseconds(5000));
}

void Database::close() {
    sqlite3_close(db_);
    db_ = nullptr;
    path_.clear();
    inTransaction_ = false;
}

Result<Statement> Database::prepare(const std::string& sql) {
    if (!db_) {
        return Error{ErrorCode::NotInitialized, "Database not open"};
    }
    sqlite3_stmt* stmt = nullptr;
    const int rc = sqlite3_prepare_v2(db_, sql.c_str(), static_cast<int>(sql.size()), &stmt,
                                      nullptr);
    if (rc != SQLITE_OK) {
        sqlite3_finalize(stmt);
        return Error{ErrorCode::DatabaseError, "Cannot prepare [" + sqlExcerpt(sql.c_str()) +
                                                   "]: " + sqlite3_errmsg(db_)};
    }
    return Statement(stmt);
}

Result<void> Database::execute(const std::string& sql) {
    if (!db_) {
        return Error{ErrorCode::NotInitialized, "Database not open"};
    }
    char* errMsg = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errMsg) != SQLITE_OK) {
        std::string reason = errMsg ? errMsg : "unknown error";
        sqlite3_free(errMsg);
        spdlog::error("SQL failed on {}: {} [{}]", path_, reason, sqlExcerpt(sql.c_str()));
        return Error{ErrorCode::DatabaseError, "SQL failed: " + reason};
    }
    return {};
}

Result<void> Database::beginTransaction() {
    if (inTransaction_) {
        return Error{ErrorCode::InvalidState, "Transaction already open on " + path_};
    }
    auto begun = execute("BEGIN IMMEDIATE");
    if (begun) {
        inTransaction_ = true;
    }
    return begun;
}

Result<void> Database::commit() {
    if (!inTransaction_) {
        return Error{ErrorCode::InvalidState, "No open transaction to commit"};
    }
    auto committed = execute("COMMIT");
    if (committed) {
        inTransaction_ = false;
        return {};
    }
    rollbackQuietly();
    return Error{ErrorCode::TransactionFailed, committed.error().message};
}

Result<void> Database::rollback() {
    if (!inTransaction_) {
        return Error{ErrorCode::InvalidState, "No open transaction to roll back"};
    }
    inTransaction_ = false;
    return execute("ROLLBACK");
}

void Database::rollbackQuietly() {
    auto r = rollback();
    if (!r) {
        spdlog::warn("rollback failed on {}: {}", path_, r.error().message);
    }
}

int64_t Database::lastInsertRowId() const {
    return db_ ? sqlite3_last_insert_rowid(db_) : 0;
}

int Database::changes() const {
    return db_ ? sqlite3_changes(db_) : 0;
}

Result<void> Database::setBusyTimeout(std::chrono::milliseconds timeout) {
    if (!db_) {
        return Error{ErrorCode::NotInitialized, "Database not open"};
    }
    if (sqlite3_busy_timeout(db_, static_cast<int>(timeout.count())) != SQLITE_OK) {
        return Error{ErrorCode::DatabaseError, "Cannot set busy timeout on " + path_};
    }
    return {};
}

Result<void> Database::enableWAL() {
    return execute("PRAGMA journal_mode=WAL");
}

} // namespace ragcore::metadata
