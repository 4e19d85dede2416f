#pragma once

/*
 * dlcore Downloader - Public Types and Component Interfaces (C++20)
 *
 * This header defines the task model, configuration and the abstract seams of the
 * download core. It intentionally contains no implementation details.
 *
 * Components:
 * - IHttpAdapter: one streaming GET (optionally ranged) per call
 * - IDiskWriter: owns the destination file handle for one transfer
 * - IIntegrityVerifier: streaming digest for optional checksum verification
 * - IRateLimiter: token-bucket throttling
 * - ITaskStore: durable persistence behind the task registry
 */

#include <dlcore/core/types.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace dlcore::downloader {

// ================================
// Fundamental enums and constants
// ================================

using TaskId = std::int64_t;

/**
 * Task lifecycle states.
 *
 * pending|paused -> downloading -> paused|completed|failed
 * any state except completed -> cancelled
 * failed -> pending (explicit retry)
 */
enum class TaskStatus { Pending, Downloading, Paused, Completed, Cancelled, Failed };

/**
 * Hash algorithms supported for integrity verification.
 */
enum class HashAlgo {
    Sha256,
    Sha512,
    Md5 // optional; discouraged for security-critical verification
};

/**
 * Persistence backends for the task registry.
 */
enum class StoreBackend { Sqlite, Json, Memory };

/// Stable identifier used for persistence ("pending", "downloading", ...).
[[nodiscard]] const char* toString(TaskStatus status) noexcept;

/// Human-readable status text ("Waiting", "Downloading", ...).
[[nodiscard]] const char* statusText(TaskStatus status) noexcept;

[[nodiscard]] std::optional<TaskStatus> parseTaskStatus(std::string_view value) noexcept;

[[nodiscard]] const char* toString(HashAlgo algo) noexcept;

[[nodiscard]] std::optional<StoreBackend> parseStoreBackend(std::string_view value) noexcept;

// ===================
// Small data objects
// ===================

/**
 * HTTP header key/value pair.
 */
struct Header {
    std::string name;
    std::string value;
};

/**
 * Checksum descriptor (algorithm + lower-case hex digest).
 */
struct Checksum {
    HashAlgo algo{HashAlgo::Sha256};
    std::string hex;
};

/// Parse "<algo>:<hex>" (algo = sha256|sha512|md5). A bare 64-char hex is taken as SHA-256.
[[nodiscard]] Result<Checksum> parseChecksum(std::string_view value);

/// Render as "<algo>:<hex>".
[[nodiscard]] std::string toString(const Checksum& checksum);

/**
 * Rate limit configuration in bytes per second (0 = unlimited).
 */
struct RateLimit {
    std::uint64_t globalBps{0};
    std::uint64_t perConnectionBps{0};
};

/**
 * TLS configuration.
 */
struct TlsConfig {
    bool insecure{false};
    std::string caPath; // empty = system default
};

/**
 * Download service configuration ([downloader] section of config.toml).
 */
struct DownloaderConfig {
    std::filesystem::path downloadDir;
    std::size_t chunkSizeBytes{DEFAULT_CHUNK_SIZE};
    std::chrono::milliseconds connectTimeout{30000};
    // Abort when the transfer stays below 1 byte/s for this long (0 = never)
    std::chrono::milliseconds lowSpeedTimeout{300000};
    std::chrono::milliseconds speedWindow{3000};
    std::chrono::milliseconds persistInterval{1000};
    std::uint64_t globalRateLimitBps{0};
    std::uint64_t perTaskRateLimitBps{0};
    std::string userAgent;
    std::optional<std::string> proxy;
    TlsConfig tls{};
    std::vector<Header> headers;
    bool followRedirects{true};
};

/**
 * Registry persistence configuration ([storage] section of config.toml).
 */
struct StorageConfig {
    StoreBackend backend{StoreBackend::Sqlite};
    std::filesystem::path path; // database or JSON file; unused for Memory
};

// ===================
// Task model
// ===================

/**
 * One user-initiated download and its tracked state. Values of this type are
 * snapshots: the service hands out copies, never references into the registry.
 */
struct Task {
    TaskId id{0};
    std::string url;
    std::string name;
    std::filesystem::path path;
    std::optional<std::uint64_t> totalBytes{};
    std::uint64_t downloadedBytes{0};
    TaskStatus status{TaskStatus::Pending};
    TimePoint createdAt{};
    TimePoint updatedAt{};
    std::optional<TimePoint> completedAt{};
    std::optional<std::string> error{};
    bool retryable{true};
    std::optional<Checksum> expectedChecksum{};

    /// downloaded / total in percent; 0 when the total is unknown or zero, capped at 100.
    [[nodiscard]] double progressPercent() const noexcept;
    [[nodiscard]] std::string progressText() const;
    [[nodiscard]] std::string formattedDownloaded() const;
    [[nodiscard]] std::string formattedTotal() const;
    [[nodiscard]] const char* statusText() const noexcept;

    [[nodiscard]] bool isActive() const noexcept;
    [[nodiscard]] bool isTerminal() const noexcept;
    [[nodiscard]] bool canResume() const noexcept;

    [[nodiscard]] std::string filename() const;
    /// Lower-case extension including the dot, or empty.
    [[nodiscard]] std::string extension() const;
};

/**
 * Point-in-time status report for one task.
 */
struct DownloadStatus {
    TaskStatus status{TaskStatus::Pending};
    double progressPercent{0.0};
    std::uint64_t downloadedBytes{0};
    std::optional<std::uint64_t> totalBytes{};
    double speedBps{0.0};
    bool engineActive{false};
    std::optional<std::string> error{};
};

// ===================
// Callback signatures
// ===================

using ProgressCallback = std::function<void(const Task&)>;
using StatusCallback = std::function<void(const Task&, std::string_view message)>;
using ShouldCancel = std::function<bool()>; // return true to stop ASAP

// ==========================
// HTTP adapter
// ==========================

/**
 * Parsed "Content-Range" header: "bytes <first>-<last>/<total>" or "bytes *\/<total>".
 */
struct ContentRange {
    std::optional<std::uint64_t> first{};
    std::optional<std::uint64_t> last{};
    std::optional<std::uint64_t> total{}; // nullopt for "/*"
};

/**
 * A single GET request. offset > 0 adds "Range: bytes=<offset>-".
 */
struct HttpRequest {
    std::string url;
    std::vector<Header> headers;
    std::uint64_t offset{0};
    std::size_t bufferSize{DEFAULT_CHUNK_SIZE};
    std::chrono::milliseconds connectTimeout{30000};
    std::chrono::milliseconds lowSpeedTimeout{300000};
    TlsConfig tls{};
    std::optional<std::string> proxy;
    std::string userAgent;
    bool followRedirects{true};
};

/**
 * Response metadata of the final (post-redirect) response.
 */
struct HttpResponseInfo {
    long status{0};
    std::optional<std::uint64_t> contentLength{};
    std::optional<ContentRange> contentRange{};
    bool acceptRangesBytes{false};
    std::optional<std::string> etag{};
    std::optional<std::string> lastModified{};
};

using ResponseHandler = std::function<Result<void>(const HttpResponseInfo&)>;
using BodySink = std::function<Result<void>(std::span<const std::byte>)>;

/**
 * HTTP adapter abstraction (libcurl-based implementation satisfies this).
 * Implementations must be safe to call concurrently from several engine threads.
 */
class IHttpAdapter {
public:
    virtual ~IHttpAdapter() = default;

    /**
     * Perform one GET. onResponse is invoked exactly once with the final response's
     * metadata before the first body byte reaches sink (or after the exchange when the
     * body is empty). An error returned from onResponse or sink aborts the transfer and is
     * returned unchanged. shouldCancel is polled between reads and while waiting on the
     * network; a cancelled transfer returns ErrorCode::OperationCancelled.
     */
    virtual Result<HttpResponseInfo> get(const HttpRequest& request,
                                         const ResponseHandler& onResponse, const BodySink& sink,
                                         const ShouldCancel& shouldCancel) = 0;
};

// ==========================
// Disk, integrity, rate limit
// ==========================

/**
 * Destination file writer. One instance per transfer; not thread-safe.
 */
class IDiskWriter {
public:
    virtual ~IDiskWriter() = default;

    /**
     * Open (creating parent directories and the file if needed) for appending.
     * With truncate set, existing content is discarded. Returns the current length.
     */
    virtual Result<std::uint64_t> open(const std::filesystem::path& path, bool truncate) = 0;

    /// Shrink (or extend) the open file to size; subsequent appends continue from there.
    virtual Result<void> truncate(std::uint64_t size) = 0;

    virtual Result<void> append(std::span<const std::byte> data) = 0;

    /// fsync file and its directory.
    virtual Result<void> sync() = 0;

    virtual void close() noexcept = 0;

    [[nodiscard]] virtual std::uint64_t size() const noexcept = 0;
};

/**
 * Integrity verifier interface (streaming hash calculator).
 */
class IIntegrityVerifier {
public:
    virtual ~IIntegrityVerifier() = default;
    virtual void reset(HashAlgo algo) = 0;
    virtual void update(std::span<const std::byte> data) = 0;
    virtual Checksum finalize() = 0;
};

/**
 * Token-bucket style limiter interface.
 */
class IRateLimiter {
public:
    virtual ~IRateLimiter() = default;

    /**
     * Blocks until 'bytes' tokens are available based on configured limits.
     * Returns early when shouldCancel fires.
     */
    virtual void acquire(std::uint64_t bytes, const ShouldCancel& shouldCancel) = 0;

    /**
     * Set runtime limits (0 = unlimited).
     */
    virtual void setLimits(const RateLimit& limit) = 0;
};

// ==========================
// Persistence
// ==========================

/**
 * Durable task storage behind the registry. Implementations are called by one writer at
 * a time (the registry serializes access).
 */
class ITaskStore {
public:
    virtual ~ITaskStore() = default;

    /// All persisted tasks in ascending id order.
    virtual Result<std::vector<Task>> loadAll() = 0;

    /// Insert or replace.
    virtual Result<void> save(const Task& task) = 0;

    virtual Result<void> remove(TaskId id) = 0;

    /// Highest id ever assigned (0 when none).
    virtual Result<TaskId> loadSequence() = 0;
    virtual Result<void> saveSequence(TaskId lastAssigned) = 0;

    [[nodiscard]] virtual std::string_view backendName() const noexcept = 0;
};

// ==========================
// Factories
// ==========================

std::shared_ptr<IHttpAdapter> makeCurlHttpAdapter();
std::unique_ptr<IDiskWriter> makeDiskWriter();
std::unique_ptr<IIntegrityVerifier> makeIntegrityVerifier();
std::unique_ptr<IRateLimiter> makeRateLimiter();

std::unique_ptr<ITaskStore> makeMemoryTaskStore();
Result<std::unique_ptr<ITaskStore>> makeSqliteTaskStore(const std::filesystem::path& dbPath);
Result<std::unique_ptr<ITaskStore>> makeJsonTaskStore(const std::filesystem::path& jsonPath);
Result<std::unique_ptr<ITaskStore>> makeTaskStore(const StorageConfig& storage);

/// Stream a file through the verifier.
Result<Checksum> computeFileChecksum(const std::filesystem::path& path, HashAlgo algo);

} // namespace dlcore::downloader
