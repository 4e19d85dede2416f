#pragma once

#include <dlcore/downloader/downloader.hpp>
#include <dlcore/downloader/task_registry.h>
#include <dlcore/downloader/transfer_engine.h>

#include <chrono>
#include <condition_variable>
#include <deque>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>
#include <vector>

namespace dlcore::downloader {

/**
 * Facade over the task registry and the transfer engines.
 *
 * Control operations never block on network I/O: they validate, mutate the registry and
 * return. Engine events and observer notifications flow through one queue drained by a
 * single dispatcher thread, so callbacks run on that thread, in order, per task.
 */
class DownloadService {
public:
    /**
     * Loads the registry (downloading tasks come back paused) and starts the dispatcher.
     * A null store selects an in-memory store; a null adapter selects libcurl.
     */
    explicit DownloadService(DownloaderConfig config, std::unique_ptr<ITaskStore> store = nullptr,
                             std::shared_ptr<IHttpAdapter> http = nullptr);

    /// Pauses and joins running transfers, delivers pending notifications.
    ~DownloadService();

    DownloadService(const DownloadService&) = delete;
    DownloadService& operator=(const DownloadService&) = delete;

    /**
     * Register a new pending task. name defaults to the URL's file name, path to
     * <download dir>/<name>; a relative path is taken relative to the download directory.
     * No network I/O.
     */
    Result<Task> createDownloadTask(std::string_view url,
                                    std::optional<std::string> name = std::nullopt,
                                    std::optional<std::filesystem::path> path = std::nullopt,
                                    std::optional<Checksum> expectedChecksum = std::nullopt);

    Result<void> startDownload(TaskId id);
    Result<void> pauseDownload(TaskId id);
    Result<void> resumeDownload(TaskId id);
    Result<void> cancelDownload(TaskId id);

    /// Removes the task, stopping its transfer first. The file is kept unless deleteFile.
    Result<void> deleteTask(TaskId id, bool deleteFile = false);

    /// failed (retryable) -> pending, with downloaded re-read from the partial file.
    Result<void> retryDownload(TaskId id);

    [[nodiscard]] std::vector<Task> getAllTasks() const;
    [[nodiscard]] std::vector<Task> getActiveTasks() const;
    [[nodiscard]] Result<Task> getTaskById(TaskId id) const;

    /// Bytes per second over the rolling speed window; 0 unless downloading.
    [[nodiscard]] double getDownloadSpeed(TaskId id) const;
    [[nodiscard]] Result<DownloadStatus> getDownloadStatus(TaskId id) const;

    /// Error from loading the store at construction; while set, createDownloadTask fails.
    [[nodiscard]] Result<void> registryStatus() const;

    Result<void> setDownloadDirectory(const std::filesystem::path& dir);
    [[nodiscard]] std::filesystem::path downloadDirectory() const;

    void registerProgressCallback(ProgressCallback callback);
    void registerStatusCallback(StatusCallback callback);

    /**
     * Block until the task has no live engine and every queued notification for it has been
     * delivered. Must not be called from an observer callback.
     */
    bool waitForIdle(TaskId id, std::chrono::milliseconds timeout);

private:
    struct Notification {
        Task task;
        std::optional<std::string> status; // nullopt = progress notification
    };

    struct QueueItem {
        TaskId taskId{0};
        std::optional<TransferEvent> event;
        std::optional<Notification> notification;
    };

    struct Running {
        std::unique_ptr<TransferEngine> engine;
        std::uint64_t attempt{0};
        std::filesystem::path path;
    };

    struct SpeedSample {
        std::chrono::steady_clock::time_point at;
        std::uint64_t downloaded{0};
    };

    // All *Locked helpers require mutex_.
    Result<void> startLocked(Task task);
    Result<void> retryLocked(Task& task);
    void enqueueLocked(QueueItem item);
    void notifyStatusLocked(const Task& task, std::string message);
    void notifyProgressLocked(const Task& task);
    std::unique_ptr<TransferEngine> applyEventLocked(const TransferEvent& ev);
    void recordSampleLocked(TaskId id, std::uint64_t downloaded, bool reset);
    double speedLocked(TaskId id) const;
    bool idleLocked(TaskId id) const;

    void onEngineEvent(TransferEvent ev);
    void dispatchLoop();
    void deliver(const Notification& note);

    DownloaderConfig config_;
    std::shared_ptr<IHttpAdapter> http_;
    std::shared_ptr<IRateLimiter> sharedLimiter_;
    TaskRegistry registry_;

    mutable std::mutex mutex_;
    std::condition_variable queueCv_;
    std::condition_variable idleCv_;
    std::deque<QueueItem> queue_;
    std::unordered_map<TaskId, std::size_t> pending_;
    std::map<TaskId, Running> running_;
    std::multiset<std::filesystem::path> closingPaths_; // deleted tasks whose engine is joining
    std::uint64_t lastAttempt_{0}; // unique across tasks; tags engine events
    std::unordered_map<TaskId, std::deque<SpeedSample>> samples_;
    bool stopping_{false};
    std::optional<Error> loadError_;

    std::mutex callbacksMutex_;
    std::vector<ProgressCallback> progressCallbacks_;
    std::vector<StatusCallback> statusCallbacks_;

    std::thread dispatcher_;
};

/// Build a service whose registry lives in the configured backend.
Result<std::unique_ptr<DownloadService>>
makeDownloadService(DownloaderConfig config, const StorageConfig& storage,
                    std::shared_ptr<IHttpAdapter> http = nullptr);

} // namespace dlcore::downloader
