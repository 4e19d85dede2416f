#pragma once

#include <dlcore/core/types.h>
#include <sqlite3.h>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace dlcore::metadata {

enum class ConnectionMode {
    ReadWrite, // existing file only
    Create,    // create the file if missing
    Memory
};

/**
 * Prepared statement owned by one connection. Obtained from Database::prepare.
 * Parameter indices are 1-based, column indices 0-based (SQLite convention).
 */
class Statement {
public:
    Statement() = default;
    ~Statement();

    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Result<void> bind(int index, std::nullptr_t);
    Result<void> bind(int index, int value);
    Result<void> bind(int index, int64_t value);
    Result<void> bind(int index, std::string_view value);

    /// nullopt binds NULL.
    template <typename T> Result<void> bind(int index, const std::optional<T>& value) {
        if (!value)
            return bind(index, nullptr);
        return bind(index, *value);
    }

    /// Binds args to parameters 1..N in order, stopping at the first failure.
    template <typename... Args> Result<void> bindAll(const Args&... args) {
        int index = 0;
        Result<void> result;
        ((result = result ? bind(++index, args) : result), ...);
        return result;
    }

    /// Run a statement that returns no rows.
    Result<void> execute();

    /// Advance to the next row; false once the result set is exhausted.
    Result<bool> step();

    int getInt(int column) const;
    int64_t getInt64(int column) const;
    std::string getString(int column) const;
    bool isNull(int column) const;

private:
    friend class Database;
    explicit Statement(sqlite3_stmt* stmt) : stmt_(stmt) {}

    int stepRetrying();

    sqlite3_stmt* stmt_ = nullptr;
};

/**
 * Single SQLite connection. Not thread-safe; callers serialize access.
 */
class Database {
public:
    Database() = default;
    ~Database();

    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;
    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    Result<void> open(const std::string& path, ConnectionMode mode = ConnectionMode::ReadWrite);
    void close();

    [[nodiscard]] bool isOpen() const { return db_ != nullptr; }
    [[nodiscard]] const std::string& path() const { return path_; }

    Result<Statement> prepare(std::string_view sql);

    /// Run one or more statements that return no rows.
    Result<void> execute(const std::string& sql);

    /**
     * Run func inside BEGIN IMMEDIATE / COMMIT. A failed Result or an exception from func
     * rolls back.
     */
    template <typename Func> Result<void> transaction(Func&& func) {
        if (auto begun = execute("BEGIN IMMEDIATE"); !begun)
            return begun;
        Result<void> result;
        try {
            result = func();
        } catch (...) {
            rollback();
            throw;
        }
        if (!result) {
            rollback();
            return result;
        }
        return execute("COMMIT");
    }

    /// journal_mode=WAL; in-memory databases keep their journal.
    Result<void> enableWAL();

    /// Schema version kept in PRAGMA user_version.
    Result<int> userVersion();
    Result<void> setUserVersion(int version);

private:
    void rollback();

    sqlite3* db_ = nullptr;
    std::string path_;
};

} // namespace dlcore::metadata
