/*
 * dlcore/src/downloader/task_store_sqlite.cpp
 *
 * SQLite-backed ITaskStore (default backend).
 *
 * - Table download_tasks holds one row per task; registry_meta holds the id sequence
 * - Schema version tracked with PRAGMA user_version; migrations applied in order on open
 * - WAL journal so readers never block the single writer
 */

#include <dlcore/downloader/downloader.hpp>
#include <dlcore/metadata/database.h>

#include "task_codec.h"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace dlcore::downloader {

namespace fs = std::filesystem;
using metadata::ConnectionMode;
using metadata::Database;
using metadata::Statement;

namespace {

struct SchemaStep {
    int version;
    const char* name;
    const char* sql;
};

// Append only; never edit an applied step.
constexpr SchemaStep kSchema[] = {
    {1, "initial_schema",
     R"sql(
CREATE TABLE IF NOT EXISTS download_tasks (
    id INTEGER PRIMARY KEY,
    url TEXT NOT NULL,
    name TEXT NOT NULL,
    path TEXT NOT NULL,
    total_size INTEGER,
    downloaded INTEGER NOT NULL DEFAULT 0,
    status TEXT NOT NULL,
    created_at INTEGER NOT NULL,
    updated_at INTEGER NOT NULL
);
CREATE TABLE IF NOT EXISTS registry_meta (
    key TEXT PRIMARY KEY,
    value INTEGER NOT NULL
);
)sql"},
    {2, "task_error_and_completion",
     R"sql(
ALTER TABLE download_tasks ADD COLUMN error TEXT;
ALTER TABLE download_tasks ADD COLUMN retryable INTEGER NOT NULL DEFAULT 1;
ALTER TABLE download_tasks ADD COLUMN completed_at INTEGER;
)sql"},
    {3, "task_checksum",
     R"sql(
ALTER TABLE download_tasks ADD COLUMN checksum TEXT;
)sql"},
};

constexpr const char* kSelectAll =
    "SELECT id, url, name, path, total_size, downloaded, status, created_at, updated_at, "
    "error, retryable, completed_at, checksum FROM download_tasks ORDER BY id";

constexpr const char* kUpsert =
    "INSERT INTO download_tasks (id, url, name, path, total_size, downloaded, status, "
    "created_at, updated_at, error, retryable, completed_at, checksum) "
    "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?) "
    "ON CONFLICT(id) DO UPDATE SET url=excluded.url, name=excluded.name, path=excluded.path, "
    "total_size=excluded.total_size, downloaded=excluded.downloaded, status=excluded.status, "
    "created_at=excluded.created_at, updated_at=excluded.updated_at, error=excluded.error, "
    "retryable=excluded.retryable, completed_at=excluded.completed_at, "
    "checksum=excluded.checksum";

Result<Task> readRow(const Statement& stmt) {
    Task t;
    t.id = stmt.getInt64(0);
    t.url = stmt.getString(1);
    t.name = stmt.getString(2);
    t.path = fs::path(stmt.getString(3));
    if (!stmt.isNull(4)) {
        t.totalBytes = static_cast<std::uint64_t>(stmt.getInt64(4));
    }
    t.downloadedBytes = static_cast<std::uint64_t>(stmt.getInt64(5));
    auto status = parseTaskStatus(stmt.getString(6));
    if (!status) {
        return Error{ErrorCode::CorruptedData, "Task " + std::to_string(t.id) +
                                                   " has unknown status '" + stmt.getString(6) +
                                                   "'"};
    }
    t.status = *status;
    t.createdAt = detail::from_unix_millis(stmt.getInt64(7));
    t.updatedAt = detail::from_unix_millis(stmt.getInt64(8));
    if (!stmt.isNull(9)) {
        t.error = stmt.getString(9);
    }
    t.retryable = stmt.getInt(10) != 0;
    if (!stmt.isNull(11)) {
        t.completedAt = detail::from_unix_millis(stmt.getInt64(11));
    }
    if (!stmt.isNull(12)) {
        auto sum = parseChecksum(stmt.getString(12));
        if (!sum) {
            return Error{ErrorCode::CorruptedData, "Task " + std::to_string(t.id) +
                                                       " has invalid checksum: " +
                                                       sum.error().message};
        }
        t.expectedChecksum = std::move(sum).value();
    }
    return t;
}

} // namespace

class SqliteTaskStore final : public ITaskStore {
public:
    explicit SqliteTaskStore(Database db) : db_(std::move(db)) {}
    ~SqliteTaskStore() override = default;

    Result<void> migrate() {
        auto current = db_.userVersion();
        if (!current)
            return current.error();
        for (const auto& step : kSchema) {
            if (step.version <= current.value())
                continue;
            auto applied = db_.transaction([&]() -> Result<void> {
                if (auto r = db_.execute(step.sql); !r)
                    return r;
                return db_.setUserVersion(step.version);
            });
            if (!applied) {
                return Error{ErrorCode::DatabaseError, std::string("Schema migration '") +
                                                           step.name +
                                                           "' failed: " + applied.error().message};
            }
            spdlog::debug("TaskStore: applied schema v{} ({})", step.version, step.name);
        }
        return {};
    }

    Result<std::vector<Task>> loadAll() override {
        std::lock_guard lk(mutex_);
        auto stmtResult = db_.prepare(kSelectAll);
        if (!stmtResult)
            return stmtResult.error();
        Statement stmt = std::move(stmtResult).value();

        std::vector<Task> out;
        while (true) {
            auto row = stmt.step();
            if (!row)
                return row.error();
            if (!row.value())
                break;
            auto task = readRow(stmt);
            if (!task) {
                spdlog::warn("TaskStore: skipping row: {}", task.error().message);
                continue;
            }
            out.push_back(std::move(task).value());
        }
        return out;
    }

    Result<void> save(const Task& task) override {
        std::lock_guard lk(mutex_);
        auto stmtResult = db_.prepare(kUpsert);
        if (!stmtResult)
            return stmtResult.error();
        Statement stmt = std::move(stmtResult).value();

        std::optional<int64_t> total;
        if (task.totalBytes)
            total = static_cast<int64_t>(*task.totalBytes);
        std::optional<int64_t> completed;
        if (task.completedAt)
            completed = detail::to_unix_millis(*task.completedAt);
        std::optional<std::string> checksum;
        if (task.expectedChecksum)
            checksum = toString(*task.expectedChecksum);

        auto bound = stmt.bindAll(
            static_cast<int64_t>(task.id), task.url, task.name, task.path.string(), total,
            static_cast<int64_t>(task.downloadedBytes), std::string_view(toString(task.status)),
            detail::to_unix_millis(task.createdAt), detail::to_unix_millis(task.updatedAt),
            task.error, task.retryable ? 1 : 0, completed, checksum);
        if (!bound)
            return bound;
        return stmt.execute();
    }

    Result<void> remove(TaskId id) override {
        std::lock_guard lk(mutex_);
        auto stmtResult = db_.prepare("DELETE FROM download_tasks WHERE id = ?");
        if (!stmtResult)
            return stmtResult.error();
        Statement stmt = std::move(stmtResult).value();
        if (auto r = stmt.bind(1, static_cast<int64_t>(id)); !r)
            return r;
        return stmt.execute();
    }

    Result<TaskId> loadSequence() override {
        std::lock_guard lk(mutex_);
        auto stmtResult = db_.prepare("SELECT value FROM registry_meta WHERE key = 'next_id'");
        if (!stmtResult)
            return stmtResult.error();
        Statement stmt = std::move(stmtResult).value();
        auto row = stmt.step();
        if (!row)
            return row.error();
        // Stored value is the next id to hand out
        return row.value() ? static_cast<TaskId>(stmt.getInt64(0) - 1) : TaskId{0};
    }

    Result<void> saveSequence(TaskId lastAssigned) override {
        std::lock_guard lk(mutex_);
        auto stmtResult =
            db_.prepare("INSERT INTO registry_meta (key, value) VALUES ('next_id', ?) "
                        "ON CONFLICT(key) DO UPDATE SET value = MAX(value, excluded.value)");
        if (!stmtResult)
            return stmtResult.error();
        Statement stmt = std::move(stmtResult).value();
        if (auto r = stmt.bind(1, static_cast<int64_t>(lastAssigned + 1)); !r)
            return r;
        return stmt.execute();
    }

    std::string_view backendName() const noexcept override { return "sqlite"; }

private:
    Database db_;
    std::mutex mutex_;
};

Result<std::unique_ptr<ITaskStore>> makeSqliteTaskStore(const fs::path& dbPath) {
    Database db;
    const bool inMemory = dbPath.empty() || dbPath == ":memory:";
    if (!inMemory && dbPath.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(dbPath.parent_path(), ec);
        if (ec) {
            return Error{ErrorCode::DatabaseError, "Cannot create database directory " +
                                                       dbPath.parent_path().string() + ": " +
                                                       ec.message()};
        }
    }
    auto opened = inMemory ? db.open(":memory:", ConnectionMode::Memory)
                           : db.open(dbPath.string(), ConnectionMode::Create);
    if (!opened)
        return opened.error();
    if (auto r = db.enableWAL(); !r) {
        spdlog::warn("TaskStore: WAL unavailable for {}: {}", db.path(), r.error().message);
    }
    if (auto r = db.execute("PRAGMA synchronous=NORMAL"); !r)
        return r.error();

    auto store = std::make_unique<SqliteTaskStore>(std::move(db));
    if (auto r = store->migrate(); !r)
        return r.error();
    spdlog::debug("TaskStore: sqlite registry at {}", inMemory ? ":memory:" : dbPath.string());
    return std::unique_ptr<ITaskStore>(std::move(store));
}

} // namespace dlcore::downloader
