/*
 * dlcore/src/downloader/task_store_memory.cpp
 *
 * In-memory ITaskStore (tests and ephemeral use) and the backend factory.
 */

#include <dlcore/downloader/downloader.hpp>

#include <algorithm>
#include <map>
#include <mutex>
#include <shared_mutex>

namespace dlcore::downloader {

class InMemoryTaskStore final : public ITaskStore {
public:
    InMemoryTaskStore() = default;
    ~InMemoryTaskStore() override = default;

    Result<std::vector<Task>> loadAll() override {
        std::shared_lock lk(mutex_);
        std::vector<Task> out;
        out.reserve(table_.size());
        for (const auto& [id, task] : table_) {
            out.push_back(task);
        }
        return out;
    }

    Result<void> save(const Task& task) override {
        if (task.id <= 0) {
            return Error{ErrorCode::InvalidArgument, "TaskStore.save: invalid task id"};
        }
        std::unique_lock lk(mutex_);
        table_[task.id] = task;
        return {};
    }

    Result<void> remove(TaskId id) override {
        std::unique_lock lk(mutex_);
        (void)table_.erase(id);
        return {};
    }

    Result<TaskId> loadSequence() override {
        std::shared_lock lk(mutex_);
        return sequence_;
    }

    Result<void> saveSequence(TaskId lastAssigned) override {
        std::unique_lock lk(mutex_);
        sequence_ = std::max(sequence_, lastAssigned);
        return {};
    }

    std::string_view backendName() const noexcept override { return "memory"; }

private:
    std::map<TaskId, Task> table_;
    TaskId sequence_{0};
    mutable std::shared_mutex mutex_;
};

std::unique_ptr<ITaskStore> makeMemoryTaskStore() {
    return std::make_unique<InMemoryTaskStore>();
}

Result<std::unique_ptr<ITaskStore>> makeTaskStore(const StorageConfig& storage) {
    switch (storage.backend) {
        case StoreBackend::Memory:
            return makeMemoryTaskStore();
        case StoreBackend::Sqlite:
            return makeSqliteTaskStore(storage.path);
        case StoreBackend::Json:
            return makeJsonTaskStore(storage.path);
    }
    return Error{ErrorCode::InvalidArgument, "Unknown task store backend"};
}

} // namespace dlcore::downloader
