#include <dlcore/downloader/task_registry.h>

#include "task_codec.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <mutex>
#include <string>

namespace dlcore::downloader {

TaskRegistry::TaskRegistry(std::unique_ptr<ITaskStore> store,
                           std::chrono::milliseconds persistInterval)
    : store_(std::move(store)), persistInterval_(persistInterval) {
    if (!store_) {
        store_ = makeMemoryTaskStore();
    }
}

Result<std::size_t> TaskRegistry::load() {
    // The id floor is taken first so a failed task load still never hands out a used id
    auto sequence = store_->loadSequence();
    if (!sequence) {
        return sequence.error();
    }
    {
        std::unique_lock lk(mutex_);
        lastId_ = std::max(lastId_, sequence.value());
    }
    auto loaded = store_->loadAll();
    if (!loaded) {
        return loaded.error();
    }

    std::unique_lock lk(mutex_);
    tasks_.clear();
    lastPersist_.clear();
    dirty_.clear();

    std::size_t reconciled = 0;
    for (auto& task : std::move(loaded).value()) {
        lastId_ = std::max(lastId_, task.id);
        if (task.status == TaskStatus::Downloading) {
            task.status = TaskStatus::Paused;
            task.updatedAt = detail::now_millis();
            persistLocked(task);
            ++reconciled;
        }
        tasks_.emplace(task.id, std::move(task));
    }
    loaded_ = true;
    if (reconciled > 0) {
        spdlog::info("TaskRegistry: {} interrupted download(s) reset to paused", reconciled);
    }
    spdlog::debug("TaskRegistry: loaded {} task(s) from {} store (last id {})", tasks_.size(),
                  store_->backendName(), lastId_);
    return tasks_.size();
}

Result<TaskId> TaskRegistry::allocateId() {
    std::unique_lock lk(mutex_);
    if (!loaded_) {
        return Error{ErrorCode::InvalidState,
                     "Task registry has not been loaded from the " +
                         std::string(store_->backendName()) + " store"};
    }
    const TaskId id = ++lastId_;
    if (auto r = store_->saveSequence(id); !r) {
        spdlog::warn("TaskRegistry: failed to persist id sequence: {}", r.error().message);
    }
    return id;
}

bool TaskRegistry::isLoaded() const {
    std::shared_lock lk(mutex_);
    return loaded_;
}

void TaskRegistry::put(const Task& task) {
    std::unique_lock lk(mutex_);
    lastId_ = std::max(lastId_, task.id);
    tasks_[task.id] = task;
    persistLocked(task);
}

void TaskRegistry::update(const Task& task, Persist persist) {
    std::unique_lock lk(mutex_);
    auto it = tasks_.find(task.id);
    if (it == tasks_.end()) {
        return;
    }
    it->second = task;

    if (persist == Persist::Throttle) {
        const auto now = std::chrono::steady_clock::now();
        auto last = lastPersist_.find(task.id);
        if (last != lastPersist_.end() && now - last->second < persistInterval_) {
            dirty_[task.id] = true;
            return;
        }
    }
    persistLocked(task);
}

std::optional<Task> TaskRegistry::get(TaskId id) const {
    std::shared_lock lk(mutex_);
    auto it = tasks_.find(id);
    if (it == tasks_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Task> TaskRegistry::list() const {
    std::shared_lock lk(mutex_);
    std::vector<Task> out;
    out.reserve(tasks_.size());
    for (const auto& [id, task] : tasks_) {
        out.push_back(task);
    }
    return out;
}

bool TaskRegistry::remove(TaskId id) {
    std::unique_lock lk(mutex_);
    if (tasks_.erase(id) == 0) {
        return false;
    }
    lastPersist_.erase(id);
    dirty_.erase(id);
    if (auto r = store_->remove(id); !r) {
        spdlog::warn("TaskRegistry: failed to remove task {} from store: {}", id,
                     r.error().message);
    }
    return true;
}

void TaskRegistry::flush() {
    std::unique_lock lk(mutex_);
    for (auto it = dirty_.begin(); it != dirty_.end();) {
        auto task = tasks_.find(it->first);
        const bool pending = it->second;
        it = dirty_.erase(it);
        if (pending && task != tasks_.end()) {
            persistLocked(task->second);
        }
    }
}

std::size_t TaskRegistry::size() const {
    std::shared_lock lk(mutex_);
    return tasks_.size();
}

std::string_view TaskRegistry::backendName() const noexcept {
    return store_->backendName();
}

void TaskRegistry::persistLocked(const Task& task) {
    lastPersist_[task.id] = std::chrono::steady_clock::now();
    dirty_.erase(task.id);
    if (auto r = store_->save(task); !r) {
        spdlog::warn("TaskRegistry: failed to persist task {}: {}", task.id, r.error().message);
    }
}

} // namespace dlcore::downloader
