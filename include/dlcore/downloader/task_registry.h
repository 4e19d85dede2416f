#pragma once

#include <dlcore/downloader/downloader.hpp>

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace dlcore::downloader {

/**
 * In-memory id -> Task map (ascending id order) mirrored to an ITaskStore.
 *
 * Readers run concurrently; writers are exclusive. Store failures are logged and never fail
 * the in-memory operation. Progress-only updates are flushed at most once per persist
 * interval per task; every other update is written through.
 */
class TaskRegistry {
public:
    enum class Persist {
        Always,  // status transitions, creation, retry
        Throttle // progress counters
    };

    TaskRegistry(std::unique_ptr<ITaskStore> store, std::chrono::milliseconds persistInterval);

    /**
     * Populate from the store. Tasks persisted as downloading have no engine after a restart
     * and are reset to paused (written back). Returns the number of tasks loaded.
     */
    Result<std::size_t> load();

    /**
     * Next id; never reused, including across restarts and after removal. Fails with
     * InvalidState until load() has succeeded, since the persisted tasks are unknown until then.
     */
    Result<TaskId> allocateId();

    [[nodiscard]] bool isLoaded() const;

    void put(const Task& task);
    void update(const Task& task, Persist persist = Persist::Always);
    [[nodiscard]] std::optional<Task> get(TaskId id) const;
    [[nodiscard]] std::vector<Task> list() const;
    bool remove(TaskId id);

    /// Write any throttled progress that has not reached the store yet.
    void flush();

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::string_view backendName() const noexcept;

private:
    void persistLocked(const Task& task);

    std::unique_ptr<ITaskStore> store_;
    std::chrono::milliseconds persistInterval_;

    mutable std::shared_mutex mutex_;
    std::map<TaskId, Task> tasks_;
    std::unordered_map<TaskId, std::chrono::steady_clock::time_point> lastPersist_;
    std::unordered_map<TaskId, bool> dirty_;
    TaskId lastId_{0};
    bool loaded_{false};
};

} // namespace dlcore::downloader
