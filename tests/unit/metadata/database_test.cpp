#include <gtest/gtest.h>
#include <dlcore/metadata/database.h>

#include "common/test_helpers.h"

#include <filesystem>
#include <optional>
#include <stdexcept>

using namespace dlcore;
using namespace dlcore::metadata;

class DatabaseTest : public ::testing::Test {
protected:
    void SetUp() override {
        dbPath_ = dir_.path / "dlcore_test.db";
        ASSERT_TRUE(db_.open(dbPath_.string(), ConnectionMode::Create).has_value());
        ASSERT_TRUE(db_.execute("CREATE TABLE t (id INTEGER PRIMARY KEY, name TEXT, size INTEGER)")
                        .has_value());
    }

    int64_t count() {
        auto prepared = db_.prepare("SELECT COUNT(*) FROM t");
        EXPECT_TRUE(prepared.has_value());
        Statement stmt = std::move(prepared).value();
        EXPECT_TRUE(stmt.step().value());
        return stmt.getInt64(0);
    }

    tests::TempDir dir_{"dlcore_db_"};
    std::filesystem::path dbPath_;
    Database db_;
};

TEST_F(DatabaseTest, OpenAndClose) {
    EXPECT_TRUE(db_.isOpen());
    EXPECT_EQ(db_.path(), dbPath_.string());
    db_.close();
    EXPECT_FALSE(db_.isOpen());
    EXPECT_TRUE(db_.path().empty());

    auto stmt = db_.prepare("SELECT 1");
    ASSERT_FALSE(stmt.has_value());
    EXPECT_EQ(stmt.error().code, ErrorCode::InvalidState);
}

TEST_F(DatabaseTest, ReadWriteModeDoesNotCreateFiles) {
    Database db;
    auto result = db.open((dir_.path / "missing.db").string(), ConnectionMode::ReadWrite);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::DatabaseError);
    EXPECT_FALSE(std::filesystem::exists(dir_.path / "missing.db"));
}

TEST_F(DatabaseTest, SecondOpenIsRejected) {
    auto again = db_.open(dbPath_.string(), ConnectionMode::Create);
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, ErrorCode::InvalidState);
}

TEST_F(DatabaseTest, BindAllAndReadBack) {
    auto insert = db_.prepare("INSERT INTO t (id, name, size) VALUES (?, ?, ?)");
    ASSERT_TRUE(insert.has_value());
    Statement stmt = std::move(insert).value();
    ASSERT_TRUE(stmt.bindAll(int64_t{7}, std::string("archive.zip"), 4096).has_value());
    ASSERT_TRUE(stmt.execute().has_value());

    auto select = db_.prepare("SELECT id, name, size FROM t WHERE id = ?");
    ASSERT_TRUE(select.has_value());
    Statement row = std::move(select).value();
    ASSERT_TRUE(row.bind(1, int64_t{7}).has_value());
    auto found = row.step();
    ASSERT_TRUE(found.has_value());
    ASSERT_TRUE(found.value());
    EXPECT_EQ(row.getInt64(0), 7);
    EXPECT_EQ(row.getString(1), "archive.zip");
    EXPECT_EQ(row.getInt(2), 4096);

    auto done = row.step();
    ASSERT_TRUE(done.has_value());
    EXPECT_FALSE(done.value());
}

TEST_F(DatabaseTest, OptionalBindsNull) {
    auto insert = db_.prepare("INSERT INTO t (id, name, size) VALUES (?, ?, ?)");
    ASSERT_TRUE(insert.has_value());
    Statement stmt = std::move(insert).value();
    std::optional<int64_t> size;
    std::optional<std::string> name{"partial.bin"};
    ASSERT_TRUE(stmt.bindAll(int64_t{1}, name, size).has_value());
    ASSERT_TRUE(stmt.execute().has_value());

    auto select = db_.prepare("SELECT name, size FROM t");
    ASSERT_TRUE(select.has_value());
    Statement row = std::move(select).value();
    ASSERT_TRUE(row.step().value());
    EXPECT_FALSE(row.isNull(0));
    EXPECT_EQ(row.getString(0), "partial.bin");
    EXPECT_TRUE(row.isNull(1));
    EXPECT_EQ(row.getString(1), "");
}

TEST_F(DatabaseTest, ConstraintViolationIsAnError) {
    ASSERT_TRUE(db_.execute("INSERT INTO t (id, name) VALUES (1, 'a')").has_value());
    auto insert = db_.prepare("INSERT INTO t (id, name) VALUES (?, ?)");
    ASSERT_TRUE(insert.has_value());
    Statement stmt = std::move(insert).value();
    ASSERT_TRUE(stmt.bindAll(int64_t{1}, "b").has_value());
    auto r = stmt.execute();
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::DatabaseError);
}

TEST_F(DatabaseTest, TransactionCommitsOnSuccess) {
    auto r = db_.transaction([&]() -> Result<void> {
        return db_.execute("INSERT INTO t (id, name) VALUES (1, 'a'), (2, 'b')");
    });
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(count(), 2);
}

TEST_F(DatabaseTest, TransactionRollsBackOnError) {
    auto r = db_.transaction([&]() -> Result<void> {
        if (auto inserted = db_.execute("INSERT INTO t (id, name) VALUES (1, 'a')"); !inserted)
            return inserted;
        return Error{ErrorCode::InvalidState, "abort"};
    });
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::InvalidState);
    EXPECT_EQ(count(), 0);

    // Connection is usable for the next transaction
    ASSERT_TRUE(db_.transaction([&]() -> Result<void> {
                       return db_.execute("INSERT INTO t (id, name) VALUES (3, 'c')");
                   })
                    .has_value());
    EXPECT_EQ(count(), 1);
}

TEST_F(DatabaseTest, TransactionRollsBackOnException) {
    EXPECT_THROW(db_.transaction([&]() -> Result<void> {
        (void)db_.execute("INSERT INTO t (id, name) VALUES (1, 'a')");
        throw std::runtime_error("boom");
    }),
                 std::runtime_error);
    EXPECT_EQ(count(), 0);
}

TEST_F(DatabaseTest, UserVersionPersists) {
    auto v0 = db_.userVersion();
    ASSERT_TRUE(v0.has_value());
    EXPECT_EQ(v0.value(), 0);
    ASSERT_TRUE(db_.setUserVersion(3).has_value());
    db_.close();

    Database reopened;
    ASSERT_TRUE(reopened.open(dbPath_.string(), ConnectionMode::ReadWrite).has_value());
    auto v = reopened.userVersion();
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v.value(), 3);
}

TEST_F(DatabaseTest, WalOnFileDatabaseOnly) {
    ASSERT_TRUE(db_.enableWAL().has_value());
    auto mode = db_.prepare("PRAGMA journal_mode");
    ASSERT_TRUE(mode.has_value());
    Statement stmt = std::move(mode).value();
    ASSERT_TRUE(stmt.step().value());
    EXPECT_EQ(stmt.getString(0), "wal");

    Database memory;
    ASSERT_TRUE(memory.open(":memory:", ConnectionMode::Memory).has_value());
    EXPECT_TRUE(memory.enableWAL().has_value());
    auto memMode = memory.prepare("PRAGMA journal_mode");
    ASSERT_TRUE(memMode.has_value());
    Statement memStmt = std::move(memMode).value();
    ASSERT_TRUE(memStmt.step().value());
    EXPECT_EQ(memStmt.getString(0), "memory");
}

TEST_F(DatabaseTest, MalformedSqlIsReported) {
    auto r = db_.execute("CREATE TABLOID nope");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::DatabaseError);

    auto stmt = db_.prepare("SELECT * FROM missing_table");
    ASSERT_FALSE(stmt.has_value());
    EXPECT_EQ(stmt.error().code, ErrorCode::DatabaseError);
}
