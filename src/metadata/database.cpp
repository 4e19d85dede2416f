#include <dlcore/metadata/database.h>

#include <spdlog/spdlog.h>

#include <chrono>
#include <thread>
#include <utility>

namespace dlcore::metadata {

namespace {

// SQLITE_BUSY/LOCKED survive the connection busy timeout only under heavy contention
constexpr int kStepAttempts = 5;
constexpr auto kStepBackoff = std::chrono::milliseconds(10);
constexpr int kBusyTimeoutMs = 5000;

Error sqliteError(const char* what, int rc) {
    return Error{ErrorCode::DatabaseError, std::string(what) + ": " + sqlite3_errstr(rc)};
}

Result<void> checkBind(int rc) {
    if (rc != SQLITE_OK) {
        return sqliteError("Failed to bind parameter", rc);
    }
    return {};
}

} // namespace

Statement::~Statement() {
    sqlite3_finalize(stmt_);
}

Statement::Statement(Statement&& other) noexcept : stmt_(std::exchange(other.stmt_, nullptr)) {}

Statement& Statement::operator=(Statement&& other) noexcept {
    if (this != &other) {
        sqlite3_finalize(stmt_);
        stmt_ = std::exchange(other.stmt_, nullptr);
    }
    return *this;
}

Result<void> Statement::bind(int index, std::nullptr_t) {
    return checkBind(sqlite3_bind_null(stmt_, index));
}

Result<void> Statement::bind(int index, int value) {
    return checkBind(sqlite3_bind_int(stmt_, index, value));
}

Result<void> Statement::bind(int index, int64_t value) {
    return checkBind(sqlite3_bind_int64(stmt_, index, value));
}

Result<void> Statement::bind(int index, std::string_view value) {
    return checkBind(sqlite3_bind_text(stmt_, index, value.data(),
                                       static_cast<int>(value.size()), SQLITE_TRANSIENT));
}

int Statement::stepRetrying() {
    auto backoff = kStepBackoff;
    int rc = sqlite3_step(stmt_);
    for (int attempt = 1; (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) && attempt < kStepAttempts;
         ++attempt) {
        sqlite3_reset(stmt_);
        std::this_thread::sleep_for(backoff);
        backoff *= 2;
        rc = sqlite3_step(stmt_);
    }
    return rc;
}

Result<void> Statement::execute() {
    if (!stmt_) {
        return Error{ErrorCode::InvalidState, "Statement not prepared"};
    }
    const int rc = stepRetrying();
    if (rc == SQLITE_DONE || rc == SQLITE_ROW) {
        return {};
    }
    const char* sql = sqlite3_sql(stmt_);
    spdlog::debug("SQLite step failed ({}): {}", sqlite3_errstr(rc), sql ? sql : "");
    return sqliteError("Failed to execute statement", rc);
}

Result<bool> Statement::step() {
    if (!stmt_) {
        return Error{ErrorCode::InvalidState, "Statement not prepared"};
    }
    const int rc = stepRetrying();
    if (rc == SQLITE_ROW) {
        return true;
    }
    if (rc == SQLITE_DONE) {
        return false;
    }
    return sqliteError("Failed to step statement", rc);
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
                       static_cast<std::size_t>(sqlite3_column_bytes(stmt_, column)));
}

bool Statement::isNull(int column) const {
    return sqlite3_column_type(stmt_, column) == SQLITE_NULL;
}

Database::~Database() {
    close();
}

Database::Database(Database&& other) noexcept
    : db_(std::exchange(other.db_, nullptr)), path_(std::move(other.path_)) {}

Database& Database::operator=(Database&& other) noexcept {
    if (this != &other) {
        close();
        db_ = std::exchange(other.db_, nullptr);
        path_ = std::move(other.path_);
    }
    return *this;
}

Result<void> Database::open(const std::string& path, ConnectionMode mode) {
    if (db_) {
        return Error{ErrorCode::InvalidState, "Database already open: " + path_};
    }

    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_FULLMUTEX;
    if (mode != ConnectionMode::ReadWrite) {
        flags |= SQLITE_OPEN_CREATE;
    }
    if (mode == ConnectionMode::Memory) {
        flags |= SQLITE_OPEN_MEMORY;
    }

    sqlite3* handle = nullptr;
    const int rc = sqlite3_open_v2(path.c_str(), &handle, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string detail = handle ? sqlite3_errmsg(handle) : sqlite3_errstr(rc);
        sqlite3_close(handle);
        return Error{ErrorCode::DatabaseError, "Failed to open " + path + ": " + detail};
    }
    sqlite3_busy_timeout(handle, kBusyTimeoutMs);

    db_ = handle;
    path_ = path;
    return {};
}

void Database::close() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
    path_.clear();
}

Result<Statement> Database::prepare(std::string_view sql) {
    if (!db_) {
        return Error{ErrorCode::InvalidState, "Database not open"};
    }
    sqlite3_stmt* stmt = nullptr;
    const int rc =
        sqlite3_prepare_v2(db_, sql.data(), static_cast<int>(sql.size()), &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return Error{ErrorCode::DatabaseError,
                     std::string("Failed to prepare statement: ") + sqlite3_errmsg(db_)};
    }
    return Statement(stmt);
}

Result<void> Database::execute(const std::string& sql) {
    if (!db_) {
        return Error{ErrorCode::InvalidState, "Database not open"};
    }
    char* errMsg = nullptr;
    const int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        std::string detail = errMsg ? errMsg : sqlite3_errstr(rc);
        sqlite3_free(errMsg);
        spdlog::error("SQL exec failed ({}): {}", detail, sql);
        return Error{ErrorCode::DatabaseError, "Failed to execute SQL: " + detail};
    }
    return {};
}

void Database::rollback() {
    if (auto r = execute("ROLLBACK"); !r) {
        spdlog::warn("Rollback on {} failed: {}", path_, r.error().message);
    }
}

Result<void> Database::enableWAL() {
    if (path_ == ":memory:") {
        return {};
    }
    return execute("PRAGMA journal_mode=WAL");
}

Result<int> Database::userVersion() {
    auto prepared = prepare("PRAGMA user_version");
    if (!prepared)
        return prepared.error();
    Statement stmt = std::move(prepared).value();
    auto row = stmt.step();
    if (!row)
        return row.error();
    return row.value() ? stmt.getInt(0) : 0;
}

Result<void> Database::setUserVersion(int version) {
    return execute("PRAGMA user_version = " + std::to_string(version));
}

} // namespace dlcore::metadata
