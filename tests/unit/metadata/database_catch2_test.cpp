// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright 2025 ragcore Contributors

#include <atomic>
#include <chrono>
#include <filesystem>
#include <thread>
#include <vector>

#include <catch2/catch_test_macros.hpp>

#include <ragcore/metadata/connection_pool.h>
#include <ragcore/metadata/database.h>
#include <ragcore/metadata/migration.h>
#include "support/temp_dir_scope.hpp"

using namespace ragcore;
using namespace ragcore::metadata;

namespace {
struct DatabaseFixture {
    DatabaseFixture() : dir_(test_support::TempDirScope::unique_under("ragcore-db")) {
        dbPath_ = dir_.file("database_catch2_test.db");
    }

    test_support::TempDirScope dir_;
    std::filesystem::path dbPath_;
};

Result<int64_t> countRows(Database& db, const std::string& table) {
    auto stmt = db.prepare("SELECT COUNT(*) FROM " + table);
    if (!stmt) {
        return stmt.error();
    }
    auto& s = stmt.value();
    auto row = s.step();
    if (!row) {
        return row.error();
    }
    return s.getInt64(0);
}
} // namespace

TEST_CASE("Database: open and close", "[unit][metadata][database]") {
    DatabaseFixture fix;
    Database db;

    REQUIRE_FALSE(db.isOpen());

    SECTION("Open creates database file") {
        auto result = db.open(fix.dbPath_.string());
        REQUIRE(result.has_value());
        REQUIRE(db.isOpen());
        CHECK(std::filesystem::exists(fix.dbPath_));

        SECTION("Close marks database as closed") {
            db.close();
            CHECK_FALSE(db.isOpen());
        }
    }
}

TEST_CASE("Database: bind and read values", "[unit][metadata][database]") {
    DatabaseFixture fix;
    Database db;
    REQUIRE(db.open(fix.dbPath_.string()).has_value());
    REQUIRE(db.execute("CREATE TABLE t (i INTEGER, r INTEGER, s TEXT, b BLOB, ts INTEGER, n TEXT)")
                .has_value());

    const std::vector<std::byte> blob{std::byte{1}, std::byte{0}, std::byte{255}};
    const auto when = std::chrono::sys_seconds{std::chrono::seconds{1700000000}};
    {
        auto stmt = db.prepare("INSERT INTO t VALUES (?, ?, ?, ?, ?, ?)");
        REQUIRE(stmt.has_value());
        auto& s = stmt.value();
        REQUIRE(s.bindAll(int64_t{42}, 7, std::string("hello"),
                          std::span<const std::byte>(blob), when, nullptr)
                    .has_value());
        REQUIRE(s.execute().has_value());
    }
    CHECK(db.lastInsertRowId() == 1);
    CHECK(db.changes() == 1);

    auto stmt = db.prepare("SELECT i, r, s, b, ts, n FROM t");
    REQUIRE(stmt.has_value());
    auto& s = stmt.value();
    auto row = s.step();
    REQUIRE(row.has_value());
    REQUIRE(row.value());
    CHECK(s.getInt64(0) == 42);
    CHECK(s.getInt(1) == 7);
    CHECK(s.getString(2) == "hello");
    CHECK(s.getBlob(3) == blob);
    CHECK(s.getTime(4) == when);
    CHECK(s.isNull(5));

    auto done = s.step();
    REQUIRE(done.has_value());
    CHECK_FALSE(done.value());
}

TEST_CASE("Database: transaction commits and rolls back", "[unit][metadata][database]") {
    DatabaseFixture fix;
    Database db;
    REQUIRE(db.open(fix.dbPath_.string()).has_value());
    REQUIRE(db.execute("CREATE TABLE t (v INTEGER)").has_value());

    SECTION("commit") {
        auto r = db.transaction([&]() -> Result<void> {
            return db.execute("INSERT INTO t VALUES (1)");
        });
        REQUIRE(r.has_value());
        CHECK(countRows(db, "t").value() == 1);
    }

    SECTION("error result rolls back") {
        auto r = db.transaction([&]() -> Result<void> {
            auto ins = db.execute("INSERT INTO t VALUES (1)");
            if (!ins) {
                return ins;
            }
            return Error{ErrorCode::InvalidData, "abort"};
        });
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code == ErrorCode::InvalidData);
        CHECK(countRows(db, "t").value() == 0);
    }

    SECTION("exception rolls back and propagates") {
        CHECK_THROWS_AS(db.transaction([&]() -> Result<void> {
            auto ins = db.execute("INSERT INTO t VALUES (1)");
            if (!ins) {
                return ins;
            }
            throw std::runtime_error("boom");
        }),
                        std::runtime_error);
        CHECK(countRows(db, "t").value() == 0);

        // Connection is usable for a new transaction afterwards
        auto r = db.transaction([&]() -> Result<void> {
            return db.execute("INSERT INTO t VALUES (2)");
        });
        CHECK(r.has_value());
    }
}

TEST_CASE("Database: invalid SQL is an error", "[unit][metadata][database]") {
    DatabaseFixture fix;
    Database db;
    REQUIRE(db.open(fix.dbPath_.string()).has_value());

    auto prepared = db.prepare("SELEC nothing");
    REQUIRE_FALSE(prepared.has_value());
    CHECK(prepared.error().code == ErrorCode::DatabaseError);
}

TEST_CASE("MigrationManager: applies knowledge schema once", "[unit][metadata][migration]") {
    DatabaseFixture fix;
    Database db;
    REQUIRE(db.open(fix.dbPath_.string()).has_value());

    MigrationManager mm(db);
    REQUIRE(mm.initialize().has_value());
    mm.registerMigrations(KnowledgeSchemaMigrations::getAllMigrations());

    REQUIRE(mm.needsMigration().value());
    REQUIRE(mm.migrate().has_value());
    CHECK(mm.getCurrentVersion().value() == mm.getLatestVersion());
    CHECK_FALSE(mm.needsMigration().value());

    for (const char* table : {"documents", "chunks"}) {
        auto count =
            db.prepare("SELECT COUNT(*) FROM sqlite_master WHERE type = 'table' AND name = ?");
        REQUIRE(count.has_value());
        REQUIRE(count.value().bind(1, table).has_value());
        REQUIRE(count.value().step().value());
        CHECK(count.value().getInt(0) == 1);
    }

    // Re-running is a no-op
    REQUIRE(mm.migrate().has_value());
    auto history = mm.getHistory();
    REQUIRE(history.has_value());
    CHECK(static_cast<int>(history.value().size()) == mm.getLatestVersion());
}

TEST_CASE("ConnectionPool: concurrent connections", "[unit][metadata][pool]") {
    DatabaseFixture fix;
    ConnectionPoolConfig config;
    config.minConnections = 1;
    config.maxConnections = 4;
    ConnectionPool pool(fix.dbPath_.string(), config);
    REQUIRE(pool.initialize().has_value());

    REQUIRE(pool.withConnection([](Database& db) -> Result<void> {
                    return db.execute("CREATE TABLE t (v INTEGER)");
                })
                .has_value());

    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&pool, &failures, i]() {
            for (int j = 0; j < 10; ++j) {
                auto r = pool.withConnection([&](Database& db) -> Result<void> {
                    return db.transaction([&]() -> Result<void> {
                        return db.execute("INSERT INTO t VALUES (" + std::to_string(i * 100 + j) +
                                          ")");
                    });
                });
                if (!r) {
                    failures.fetch_add(1);
                }
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    CHECK(failures.load() == 0);

    auto count = pool.withConnection([](Database& db) { return countRows(db, "t"); });
    REQUIRE(count.has_value());
    CHECK(count.value() == 40);
    pool.shutdown();
}

TEST_CASE("ConnectionPool: checkout limits", "[unit][metadata][pool]") {
    DatabaseFixture fix;
    ConnectionPoolConfig config;
    config.minConnections = 0;
    config.maxConnections = 1;
    config.acquireTimeout = std::chrono::milliseconds(50);
    ConnectionPool pool(fix.dbPath_.string(), config);
    REQUIRE(pool.initialize().has_value());

    SECTION("waiting caller times out while the only connection is out") {
        auto held = pool.acquire();
        REQUIRE(held.has_value());
        auto second = pool.acquire();
        REQUIRE_FALSE(second.has_value());
        CHECK(second.error().code == ErrorCode::Timeout);
    }

    SECTION("returned connection is reused with its transaction rolled back") {
        {
            auto conn = pool.acquire();
            REQUIRE(conn.has_value());
            auto& db = *conn.value();
            REQUIRE(db.execute("CREATE TABLE t (v INTEGER)").has_value());
            REQUIRE(db.beginTransaction().has_value());
            REQUIRE(db.execute("INSERT INTO t VALUES (1)").has_value());
        }
        auto count = pool.withConnection([](Database& db) { return countRows(db, "t"); });
        REQUIRE(count.has_value());
        CHECK(count.value() == 0);
    }

    SECTION("shut down pool refuses checkouts") {
        pool.shutdown();
        auto conn = pool.acquire();
        REQUIRE_FALSE(conn.has_value());
        CHECK(conn.error().code == ErrorCode::InvalidState);
    }
}
