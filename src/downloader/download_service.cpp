#include <dlcore/downloader/download_service.h>
#include <dlcore/downloader/url.h>

#include "task_codec.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <system_error>

#include <unistd.h>

namespace dlcore::downloader {

namespace fs = std::filesystem;

namespace {

Result<void> ensureWritableDirectory(const fs::path& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return Error{ErrorCode::InvalidArgument,
                     "Cannot create directory " + dir.string() + ": " + ec.message()};
    }
    if (!fs::is_directory(dir, ec)) {
        return Error{ErrorCode::InvalidArgument, "Not a directory: " + dir.string()};
    }
    if (::access(dir.c_str(), W_OK) != 0) {
        return Error{ErrorCode::InvalidArgument, "Directory not writable: " + dir.string()};
    }
    return {};
}

} // namespace

DownloadService::DownloadService(DownloaderConfig config, std::unique_ptr<ITaskStore> store,
                                 std::shared_ptr<IHttpAdapter> http)
    : config_(std::move(config)), http_(std::move(http)), sharedLimiter_(makeRateLimiter()),
      registry_(std::move(store), config_.persistInterval) {
    if (!http_) {
        http_ = makeCurlHttpAdapter();
    }
    sharedLimiter_->setLimits(RateLimit{config_.globalRateLimitBps, 0});
    if (config_.chunkSizeBytes < MIN_CHUNK_SIZE || config_.chunkSizeBytes > MAX_CHUNK_SIZE) {
        spdlog::warn("DownloadService: chunk size {} out of range, using {}",
                     config_.chunkSizeBytes, DEFAULT_CHUNK_SIZE);
        config_.chunkSizeBytes = DEFAULT_CHUNK_SIZE;
    }

    if (auto loaded = registry_.load(); !loaded) {
        // New tasks are refused until the registry is readable; existing ids stay reserved
        loadError_ = loaded.error();
        spdlog::error("DownloadService: failed to load task registry ({} store): {}",
                      registry_.backendName(), loadError_->message);
    }
    if (!config_.downloadDir.empty()) {
        if (auto r = ensureWritableDirectory(config_.downloadDir); !r) {
            spdlog::warn("DownloadService: {}", r.error().message);
        }
    }

    dispatcher_ = std::thread([this] { dispatchLoop(); });
}

DownloadService::~DownloadService() {
    std::unique_lock lk(mutex_);
    for (auto& [id, run] : running_) {
        run.engine->requestStop(StopReason::Pause);
    }
    idleCv_.wait(lk, [this] { return running_.empty() && queue_.empty() && pending_.empty(); });
    stopping_ = true;
    lk.unlock();
    queueCv_.notify_all();
    if (dispatcher_.joinable()) {
        dispatcher_.join();
    }
    registry_.flush();
}

// ---------------------------------------------------------------------------
// Control operations
// ---------------------------------------------------------------------------

Result<Task> DownloadService::createDownloadTask(std::string_view url,
                                                 std::optional<std::string> name,
                                                 std::optional<fs::path> path,
                                                 std::optional<Checksum> expectedChecksum) {
    if (auto valid = validateHttpUrl(url); !valid) {
        return valid.error();
    }

    std::unique_lock lk(mutex_);
    Task task;
    task.url = std::string(url);
    task.createdAt = detail::now_millis();
    task.updatedAt = task.createdAt;

    if (name && !name->empty()) {
        task.name = *name;
    } else {
        task.name = fileNameFromUrl(url);
        if (task.name.empty()) {
            const auto secs = std::chrono::duration_cast<std::chrono::seconds>(
                                  task.createdAt.time_since_epoch())
                                  .count();
            task.name = "download_" + std::to_string(secs);
        }
    }

    if (path && !path->empty()) {
        task.path = path->is_absolute() ? *path : config_.downloadDir / *path;
    } else {
        task.path = config_.downloadDir / task.name;
    }
    task.path = task.path.lexically_normal();

    std::error_code ec;
    if (fs::is_directory(task.path, ec)) {
        return Error{ErrorCode::InvalidArgument,
                     "Destination is a directory: " + task.path.string()};
    }
    if (auto r = ensureWritableDirectory(task.path.parent_path()); !r) {
        return Error{ErrorCode::InvalidArgument,
                     "Destination not writable: " + r.error().message};
    }

    auto id = registry_.allocateId();
    if (!id) {
        return Error{ErrorCode::InvalidState,
                     "Cannot create task: " +
                         (loadError_ ? loadError_->message : id.error().message)};
    }
    task.expectedChecksum = std::move(expectedChecksum);
    task.id = id.value();
    registry_.put(task);
    spdlog::info("Task {} created: {} -> {}", task.id, task.url, task.path.string());
    notifyStatusLocked(task, "Task created");
    return task;
}

Result<void> DownloadService::startDownload(TaskId id) {
    std::unique_lock lk(mutex_);
    auto task = registry_.get(id);
    if (!task) {
        return Error{ErrorCode::NotFound, "Task " + std::to_string(id) + " not found"};
    }
    return startLocked(std::move(*task));
}

Result<void> DownloadService::startLocked(Task task) {
    const TaskId id = task.id;
    switch (task.status) {
        case TaskStatus::Downloading:
        case TaskStatus::Completed:
            return {};
        case TaskStatus::Cancelled:
        case TaskStatus::Failed:
            return Error{ErrorCode::InvalidState, "Task " + std::to_string(id) + " is " +
                                                      toString(task.status)};
        case TaskStatus::Pending:
        case TaskStatus::Paused:
            break;
    }

    if (running_.count(id) != 0) {
        return Error{ErrorCode::InvalidState,
                     "Task " + std::to_string(id) + " is still stopping"};
    }
    for (const auto& [otherId, run] : running_) {
        if (run.path == task.path) {
            return Error{ErrorCode::InvalidState, "Destination " + task.path.string() +
                                                      " is in use by task " +
                                                      std::to_string(otherId)};
        }
    }
    if (closingPaths_.count(task.path) != 0) {
        return Error{ErrorCode::InvalidState,
                     "Destination " + task.path.string() + " is in use by a deleted task"};
    }

    const bool resuming = task.status == TaskStatus::Paused;
    TransferSession session;
    session.taskId = id;
    session.attempt = ++lastAttempt_;
    session.path = task.path;
    // A pending task with recorded progress comes from a retry and keeps its partial file
    session.freshStart = task.status == TaskStatus::Pending && task.downloadedBytes == 0;
    session.expectedChecksum = task.expectedChecksum;
    session.request.url = task.url;
    session.request.headers = config_.headers;
    session.request.bufferSize = config_.chunkSizeBytes;
    session.request.connectTimeout = config_.connectTimeout;
    session.request.lowSpeedTimeout = config_.lowSpeedTimeout;
    session.request.tls = config_.tls;
    session.request.proxy = config_.proxy;
    session.request.userAgent = config_.userAgent;
    session.request.followRedirects = config_.followRedirects;

    auto engine = std::make_unique<TransferEngine>(
        std::move(session), http_, sharedLimiter_, config_.perTaskRateLimitBps,
        [this](TransferEvent ev) { onEngineEvent(std::move(ev)); });

    task.status = TaskStatus::Downloading;
    task.error.reset();
    task.retryable = true;
    task.updatedAt = detail::now_millis();
    registry_.update(task);
    samples_.erase(id);

    Running run;
    run.attempt = lastAttempt_;
    run.path = task.path;
    run.engine = std::move(engine);
    auto& slot = running_[id];
    slot = std::move(run);
    slot.engine->start();

    spdlog::info("Task {}: download {} ({})", id, resuming ? "resumed" : "started", task.url);
    notifyStatusLocked(task, resuming ? "Download resumed" : "Download started");
    return {};
}

Result<void> DownloadService::pauseDownload(TaskId id) {
    std::unique_lock lk(mutex_);
    auto task = registry_.get(id);
    if (!task) {
        return Error{ErrorCode::NotFound, "Task " + std::to_string(id) + " not found"};
    }
    if (task->status != TaskStatus::Downloading) {
        return {};
    }
    auto it = running_.find(id);
    if (it != running_.end()) {
        // Transition happens when the engine confirms
        it->second.engine->requestStop(StopReason::Pause);
        spdlog::debug("Task {}: pause requested", id);
        return {};
    }
    task->status = TaskStatus::Paused;
    task->updatedAt = detail::now_millis();
    registry_.update(*task);
    notifyStatusLocked(*task, "Download paused");
    return {};
}

Result<void> DownloadService::resumeDownload(TaskId id) {
    std::unique_lock lk(mutex_);
    auto task = registry_.get(id);
    if (!task) {
        return Error{ErrorCode::NotFound, "Task " + std::to_string(id) + " not found"};
    }
    if (task->status == TaskStatus::Failed && task->retryable) {
        if (auto r = retryLocked(*task); !r) {
            return r;
        }
        return startLocked(std::move(*task));
    }
    if (task->status != TaskStatus::Paused) {
        return {};
    }
    return startLocked(std::move(*task));
}

Result<void> DownloadService::cancelDownload(TaskId id) {
    std::unique_lock lk(mutex_);
    auto task = registry_.get(id);
    if (!task) {
        return Error{ErrorCode::NotFound, "Task " + std::to_string(id) + " not found"};
    }
    if (task->status == TaskStatus::Completed || task->status == TaskStatus::Cancelled) {
        return {};
    }
    auto it = running_.find(id);
    if (it != running_.end()) {
        it->second.engine->requestStop(StopReason::Cancel);
        spdlog::debug("Task {}: cancel requested", id);
        return {};
    }
    task->status = TaskStatus::Cancelled;
    task->updatedAt = detail::now_millis();
    registry_.update(*task);
    spdlog::info("Task {}: download cancelled", id);
    notifyStatusLocked(*task, "Download cancelled");
    return {};
}

Result<void> DownloadService::deleteTask(TaskId id, bool deleteFile) {
    std::unique_ptr<TransferEngine> engine;
    fs::path enginePath;
    {
        std::unique_lock lk(mutex_);
        if (!registry_.get(id)) {
            return Error{ErrorCode::NotFound, "Task " + std::to_string(id) + " not found"};
        }
        auto it = running_.find(id);
        if (it != running_.end()) {
            engine = std::move(it->second.engine);
            enginePath = it->second.path;
            // The path stays reserved until the engine has been joined
            closingPaths_.insert(enginePath);
            running_.erase(it);
        }
    }

    if (engine) {
        // Events from this attempt are dropped: it is no longer in running_
        engine->requestStop(StopReason::Cancel);
        engine->join();
        engine.reset();
    }

    Task task;
    {
        std::unique_lock lk(mutex_);
        if (!enginePath.empty()) {
            closingPaths_.erase(closingPaths_.find(enginePath));
        }
        auto current = registry_.get(id);
        if (!current) {
            return Error{ErrorCode::NotFound, "Task " + std::to_string(id) + " not found"};
        }
        task = std::move(*current);
        registry_.remove(id);
        samples_.erase(id);
        spdlog::info("Task {} deleted{}", id, deleteFile ? " (with file)" : "");
        notifyStatusLocked(task, "Task deleted");
        idleCv_.notify_all();
    }

    if (deleteFile) {
        std::error_code ec;
        fs::remove(task.path, ec);
        if (ec) {
            spdlog::error("Task {}: failed to delete {}: {}", id, task.path.string(),
                          ec.message());
            return Error{ErrorCode::DiskError,
                         "Failed to delete " + task.path.string() + ": " + ec.message()};
        }
    }
    return {};
}

Result<void> DownloadService::retryDownload(TaskId id) {
    std::unique_lock lk(mutex_);
    auto task = registry_.get(id);
    if (!task) {
        return Error{ErrorCode::NotFound, "Task " + std::to_string(id) + " not found"};
    }
    return retryLocked(*task);
}

Result<void> DownloadService::retryLocked(Task& task) {
    if (task.status != TaskStatus::Failed || !task.retryable) {
        return Error{ErrorCode::InvalidState,
                     "Task " + std::to_string(task.id) + " is not a retryable failure"};
    }

    std::error_code ec;
    std::uint64_t onDisk = 0;
    if (fs::exists(task.path, ec)) {
        onDisk = fs::file_size(task.path, ec);
        if (ec) {
            onDisk = 0;
        }
    }
    if (task.totalBytes && onDisk > *task.totalBytes) {
        fs::resize_file(task.path, *task.totalBytes, ec);
        if (ec) {
            return Error{ErrorCode::DiskError,
                         "Failed to truncate " + task.path.string() + ": " + ec.message()};
        }
        onDisk = *task.totalBytes;
    }

    task.downloadedBytes = onDisk;
    task.status = TaskStatus::Pending;
    task.error.reset();
    task.retryable = true;
    task.updatedAt = detail::now_millis();
    registry_.update(task);
    spdlog::info("Task {}: retry scheduled from byte {}", task.id, onDisk);
    notifyStatusLocked(task, "Retry scheduled");
    return {};
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

std::vector<Task> DownloadService::getAllTasks() const {
    return registry_.list();
}

std::vector<Task> DownloadService::getActiveTasks() const {
    auto all = registry_.list();
    all.erase(std::remove_if(all.begin(), all.end(), [](const Task& t) { return !t.isActive(); }),
              all.end());
    return all;
}

Result<Task> DownloadService::getTaskById(TaskId id) const {
    auto task = registry_.get(id);
    if (!task) {
        return Error{ErrorCode::NotFound, "Task " + std::to_string(id) + " not found"};
    }
    return std::move(*task);
}

double DownloadService::getDownloadSpeed(TaskId id) const {
    std::unique_lock lk(mutex_);
    return speedLocked(id);
}

double DownloadService::speedLocked(TaskId id) const {
    if (running_.count(id) == 0) {
        return 0.0;
    }
    auto it = samples_.find(id);
    if (it == samples_.end() || it->second.size() < 2) {
        return 0.0;
    }
    const auto horizon = std::chrono::steady_clock::now() - config_.speedWindow;
    auto first = std::find_if(it->second.begin(), it->second.end(),
                              [&](const SpeedSample& s) { return s.at >= horizon; });
    if (first == it->second.end() || std::next(first) == it->second.end()) {
        return 0.0;
    }
    const auto& last = it->second.back();
    const double seconds = std::chrono::duration<double>(last.at - first->at).count();
    if (seconds <= 0.0 || last.downloaded < first->downloaded) {
        return 0.0;
    }
    return static_cast<double>(last.downloaded - first->downloaded) / seconds;
}

Result<DownloadStatus> DownloadService::getDownloadStatus(TaskId id) const {
    std::unique_lock lk(mutex_);
    auto task = registry_.get(id);
    if (!task) {
        return Error{ErrorCode::NotFound, "Task " + std::to_string(id) + " not found"};
    }
    DownloadStatus st;
    st.status = task->status;
    st.progressPercent = task->progressPercent();
    st.downloadedBytes = task->downloadedBytes;
    st.totalBytes = task->totalBytes;
    st.speedBps = task->status == TaskStatus::Downloading ? speedLocked(id) : 0.0;
    st.engineActive = running_.count(id) != 0;
    st.error = task->error;
    return st;
}

Result<void> DownloadService::setDownloadDirectory(const fs::path& dir) {
    if (dir.empty()) {
        return Error{ErrorCode::InvalidArgument, "Download directory is empty"};
    }
    if (auto r = ensureWritableDirectory(dir); !r) {
        return r;
    }
    std::unique_lock lk(mutex_);
    config_.downloadDir = dir;
    spdlog::info("Download directory set to {}", dir.string());
    return {};
}

Result<void> DownloadService::registryStatus() const {
    if (loadError_) {
        return *loadError_;
    }
    return {};
}

fs::path DownloadService::downloadDirectory() const {
    std::unique_lock lk(mutex_);
    return config_.downloadDir;
}

void DownloadService::registerProgressCallback(ProgressCallback callback) {
    if (!callback)
        return;
    std::lock_guard lk(callbacksMutex_);
    progressCallbacks_.push_back(std::move(callback));
}

void DownloadService::registerStatusCallback(StatusCallback callback) {
    if (!callback)
        return;
    std::lock_guard lk(callbacksMutex_);
    statusCallbacks_.push_back(std::move(callback));
}

bool DownloadService::waitForIdle(TaskId id, std::chrono::milliseconds timeout) {
    std::unique_lock lk(mutex_);
    return idleCv_.wait_for(lk, timeout, [&] { return idleLocked(id); });
}

bool DownloadService::idleLocked(TaskId id) const {
    return running_.count(id) == 0 && pending_.count(id) == 0;
}

// ---------------------------------------------------------------------------
// Event plumbing
// ---------------------------------------------------------------------------

void DownloadService::enqueueLocked(QueueItem item) {
    ++pending_[item.taskId];
    queue_.push_back(std::move(item));
    queueCv_.notify_one();
}

void DownloadService::notifyStatusLocked(const Task& task, std::string message) {
    QueueItem item;
    item.taskId = task.id;
    item.notification = Notification{task, std::move(message)};
    enqueueLocked(std::move(item));
}

void DownloadService::notifyProgressLocked(const Task& task) {
    QueueItem item;
    item.taskId = task.id;
    item.notification = Notification{task, std::nullopt};
    enqueueLocked(std::move(item));
}

void DownloadService::onEngineEvent(TransferEvent ev) {
    std::lock_guard lk(mutex_);
    QueueItem item;
    item.taskId = ev.taskId;
    item.event = std::move(ev);
    enqueueLocked(std::move(item));
}

void DownloadService::recordSampleLocked(TaskId id, std::uint64_t downloaded, bool reset) {
    auto& samples = samples_[id];
    if (reset) {
        samples.clear();
    }
    const auto now = std::chrono::steady_clock::now();
    samples.push_back(SpeedSample{now, downloaded});
    // Keep one sample older than the window as the left edge
    while (samples.size() > 2 && samples[1].at < now - config_.speedWindow) {
        samples.pop_front();
    }
}

std::unique_ptr<TransferEngine> DownloadService::applyEventLocked(const TransferEvent& ev) {
    auto run = running_.find(ev.taskId);
    if (run == running_.end() || run->second.attempt != ev.attempt) {
        return nullptr; // stale attempt
    }
    auto current = registry_.get(ev.taskId);
    if (!current) {
        return nullptr;
    }
    Task task = std::move(*current);

    auto applyCounters = [&] {
        task.downloadedBytes = ev.downloaded;
        if (ev.total) {
            task.totalBytes = std::max(*ev.total, ev.downloaded);
        } else if (task.totalBytes && ev.downloaded > *task.totalBytes) {
            task.totalBytes.reset();
        }
        task.updatedAt = detail::now_millis();
    };

    switch (ev.kind) {
        case TransferEvent::Kind::Started:
        case TransferEvent::Kind::OffsetReset:
            applyCounters();
            if (ev.kind == TransferEvent::Kind::OffsetReset) {
                // Size from an earlier attempt no longer applies
                task.totalBytes = ev.total;
            }
            registry_.update(task, TaskRegistry::Persist::Always);
            recordSampleLocked(task.id, task.downloadedBytes, true);
            // No bytes moved yet; observers only see progress deltas
            return nullptr;

        case TransferEvent::Kind::Progress:
            applyCounters();
            registry_.update(task, TaskRegistry::Persist::Throttle);
            recordSampleLocked(task.id, task.downloadedBytes, false);
            notifyProgressLocked(task);
            return nullptr;

        case TransferEvent::Kind::Finished:
            break;
    }

    applyCounters();
    std::string message;
    switch (ev.outcome) {
        case TransferOutcome::Completed:
            task.status = TaskStatus::Completed;
            if (!task.totalBytes) {
                task.totalBytes = task.downloadedBytes;
            }
            task.completedAt = task.updatedAt;
            task.error.reset();
            message = "Download completed";
            spdlog::info("Task {}: download completed ({} bytes)", task.id, task.downloadedBytes);
            break;
        case TransferOutcome::Paused:
            task.status = TaskStatus::Paused;
            message = "Download paused";
            spdlog::info("Task {}: download paused at {} bytes", task.id, task.downloadedBytes);
            break;
        case TransferOutcome::Cancelled:
            task.status = TaskStatus::Cancelled;
            message = "Download cancelled";
            spdlog::info("Task {}: download cancelled", task.id);
            break;
        case TransferOutcome::Failed: {
            task.status = TaskStatus::Failed;
            const std::string detail = ev.error ? ev.error->message : std::string("unknown error");
            task.error = detail;
            task.retryable = ev.retryable;
            message = "Download failed: " + detail;
            break;
        }
    }
    registry_.update(task, TaskRegistry::Persist::Always);
    samples_.erase(task.id);
    if (task.status == TaskStatus::Completed) {
        notifyProgressLocked(task);
    }
    notifyStatusLocked(task, std::move(message));

    auto engine = std::move(run->second.engine);
    running_.erase(run);
    return engine;
}

void DownloadService::dispatchLoop() {
    std::unique_lock lk(mutex_);
    while (true) {
        queueCv_.wait(lk, [this] { return stopping_ || !queue_.empty(); });
        if (queue_.empty()) {
            if (stopping_)
                break;
            continue;
        }
        QueueItem item = std::move(queue_.front());
        queue_.pop_front();

        std::unique_ptr<TransferEngine> finished;
        if (item.event) {
            finished = applyEventLocked(*item.event);
        }

        lk.unlock();
        if (finished) {
            finished->join();
            finished.reset();
        }
        if (item.notification) {
            deliver(*item.notification);
        }
        lk.lock();

        auto it = pending_.find(item.taskId);
        if (it != pending_.end() && --it->second == 0) {
            pending_.erase(it);
        }
        idleCv_.notify_all();
    }
}

void DownloadService::deliver(const Notification& note) {
    std::vector<ProgressCallback> progress;
    std::vector<StatusCallback> status;
    {
        std::lock_guard lk(callbacksMutex_);
        if (note.status) {
            status = statusCallbacks_;
        } else {
            progress = progressCallbacks_;
        }
    }

    for (std::size_t i = 0; i < progress.size(); ++i) {
        try {
            progress[i](note.task);
        } catch (const std::exception& e) {
            spdlog::error("Progress callback #{} threw for task {}: {}", i, note.task.id,
                          e.what());
        } catch (...) {
            spdlog::error("Progress callback #{} threw a non-standard exception for task {}", i,
                          note.task.id);
        }
    }
    for (std::size_t i = 0; i < status.size(); ++i) {
        try {
            status[i](note.task, *note.status);
        } catch (const std::exception& e) {
            spdlog::error("Status callback #{} threw for task {}: {}", i, note.task.id,
                          e.what());
        } catch (...) {
            spdlog::error("Status callback #{} threw a non-standard exception for task {}", i,
                          note.task.id);
        }
    }
}

Result<std::unique_ptr<DownloadService>>
makeDownloadService(DownloaderConfig config, const StorageConfig& storage,
                    std::shared_ptr<IHttpAdapter> http) {
    auto store = makeTaskStore(storage);
    if (!store) {
        return store.error();
    }
    auto service = std::make_unique<DownloadService>(std::move(config), std::move(store).value(),
                                                     std::move(http));
    if (auto ready = service->registryStatus(); !ready) {
        return ready.error();
    }
    return service;
}

} // namespace dlcore::downloader
