/*
 * dlcore/src/downloader/task_store_json.cpp
 *
 * JSON-file ITaskStore.
 * File layout:
 * {
 *   "next_id": 4,
 *   "tasks": [
 *     { "id": 1, "url": "https://example.com/a.zip", "name": "a.zip", "path": "/dl/a.zip",
 *       "total_size": 1048576, "downloaded": 524288, "status": "paused",
 *       "created_at": 1724058000000, "updated_at": 1724058012000 },
 *     ...
 *   ]
 * }
 * Every mutation rewrites the file through a temp file + rename.
 */

#include <dlcore/downloader/downloader.hpp>

#include "task_codec.h"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>

namespace dlcore::downloader {

namespace fs = std::filesystem;
using nlohmann::json;

namespace {

json toJson(const Task& t) {
    json j;
    j["id"] = t.id;
    j["url"] = t.url;
    j["name"] = t.name;
    j["path"] = t.path.string();
    j["total_size"] = t.totalBytes ? json(*t.totalBytes) : json(nullptr);
    j["downloaded"] = t.downloadedBytes;
    j["status"] = toString(t.status);
    j["created_at"] = detail::to_unix_millis(t.createdAt);
    j["updated_at"] = detail::to_unix_millis(t.updatedAt);
    j["retryable"] = t.retryable;
    if (t.error)
        j["error"] = *t.error;
    if (t.completedAt)
        j["completed_at"] = detail::to_unix_millis(*t.completedAt);
    if (t.expectedChecksum)
        j["checksum"] = toString(*t.expectedChecksum);
    return j;
}

Result<Task> fromJson(const json& j) {
    try {
        Task t;
        t.id = j.at("id").get<TaskId>();
        t.url = j.at("url").get<std::string>();
        t.name = j.value("name", std::string{});
        t.path = fs::path(j.at("path").get<std::string>());
        if (j.contains("total_size") && j["total_size"].is_number_unsigned()) {
            t.totalBytes = j["total_size"].get<std::uint64_t>();
        }
        t.downloadedBytes = j.value("downloaded", std::uint64_t{0});
        auto status = parseTaskStatus(j.at("status").get<std::string>());
        if (!status) {
            return Error{ErrorCode::CorruptedData,
                         "Unknown status '" + j["status"].get<std::string>() + "'"};
        }
        t.status = *status;
        t.createdAt = detail::from_unix_millis(j.value("created_at", std::int64_t{0}));
        t.updatedAt = detail::from_unix_millis(j.value("updated_at", std::int64_t{0}));
        t.retryable = j.value("retryable", true);
        if (j.contains("error") && j["error"].is_string()) {
            t.error = j["error"].get<std::string>();
        }
        if (j.contains("completed_at") && j["completed_at"].is_number_integer()) {
            t.completedAt = detail::from_unix_millis(j["completed_at"].get<std::int64_t>());
        }
        if (j.contains("checksum") && j["checksum"].is_string()) {
            auto sum = parseChecksum(j["checksum"].get<std::string>());
            if (!sum)
                return sum.error();
            t.expectedChecksum = std::move(sum).value();
        }
        return t;
    } catch (const json::exception& e) {
        return Error{ErrorCode::CorruptedData, std::string("Malformed task entry: ") + e.what()};
    }
}

} // namespace

class JsonTaskStore final : public ITaskStore {
public:
    explicit JsonTaskStore(fs::path path) : path_(std::move(path)) {}
    ~JsonTaskStore() override = default;

    Result<void> loadFile() {
        std::error_code ec;
        if (!fs::exists(path_, ec)) {
            return {};
        }
        std::ifstream in(path_);
        if (!in) {
            return Error{ErrorCode::DiskError, "Failed to open task registry " + path_.string()};
        }
        json root;
        try {
            in >> root;
        } catch (const json::parse_error& e) {
            // Keep the damaged file for inspection and start empty
            fs::path aside = path_;
            aside += ".corrupt";
            fs::rename(path_, aside, ec);
            spdlog::error("TaskStore: {} is not valid JSON ({}); moved to {}", path_.string(),
                          e.what(), aside.string());
            return {};
        }
        if (!root.is_object()) {
            return Error{ErrorCode::CorruptedData, "Task registry root must be an object"};
        }
        nextId_ = root.value("next_id", TaskId{1});
        if (root.contains("tasks") && root["tasks"].is_array()) {
            for (const auto& entry : root["tasks"]) {
                auto task = fromJson(entry);
                if (!task) {
                    spdlog::warn("TaskStore: skipping entry: {}", task.error().message);
                    continue;
                }
                Task t = std::move(task).value();
                nextId_ = std::max(nextId_, t.id + 1);
                tasks_[t.id] = std::move(t);
            }
        }
        return {};
    }

    Result<std::vector<Task>> loadAll() override {
        std::lock_guard lk(mutex_);
        std::vector<Task> out;
        out.reserve(tasks_.size());
        for (const auto& [id, t] : tasks_) {
            out.push_back(t);
        }
        return out;
    }

    Result<void> save(const Task& task) override {
        std::lock_guard lk(mutex_);
        tasks_[task.id] = task;
        nextId_ = std::max(nextId_, task.id + 1);
        return writeFile();
    }

    Result<void> remove(TaskId id) override {
        std::lock_guard lk(mutex_);
        if (tasks_.erase(id) == 0) {
            return {};
        }
        return writeFile();
    }

    Result<TaskId> loadSequence() override {
        std::lock_guard lk(mutex_);
        return nextId_ - 1;
    }

    Result<void> saveSequence(TaskId lastAssigned) override {
        std::lock_guard lk(mutex_);
        if (lastAssigned + 1 <= nextId_) {
            return {};
        }
        nextId_ = lastAssigned + 1;
        return writeFile();
    }

    std::string_view backendName() const noexcept override { return "json"; }

private:
    Result<void> writeFile() const {
        json root;
        root["next_id"] = nextId_;
        root["tasks"] = json::array();
        for (const auto& [id, t] : tasks_) {
            root["tasks"].push_back(toJson(t));
        }

        fs::path tmp = path_;
        tmp += ".tmp";
        {
            std::ofstream out(tmp, std::ios::trunc);
            if (!out) {
                return Error{ErrorCode::DiskError,
                             "Failed to open task registry for write: " + tmp.string()};
            }
            out << root.dump(2);
            out.flush();
            if (!out) {
                return Error{ErrorCode::DiskError, "Failed to write " + tmp.string()};
            }
        }
        std::error_code ec;
        fs::rename(tmp, path_, ec);
        if (ec) {
            return Error{ErrorCode::DiskError,
                         "Failed to replace " + path_.string() + ": " + ec.message()};
        }
        return {};
    }

    fs::path path_;
    std::map<TaskId, Task> tasks_;
    TaskId nextId_{1};
    std::mutex mutex_;
};

Result<std::unique_ptr<ITaskStore>> makeJsonTaskStore(const fs::path& jsonPath) {
    if (jsonPath.empty()) {
        return Error{ErrorCode::InvalidArgument, "JSON task store needs a file path"};
    }
    if (jsonPath.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(jsonPath.parent_path(), ec);
        if (ec) {
            return Error{ErrorCode::DiskError, "Cannot create " +
                                                   jsonPath.parent_path().string() + ": " +
                                                   ec.message()};
        }
    }
    auto store = std::make_unique<JsonTaskStore>(jsonPath);
    if (auto r = store->loadFile(); !r) {
        return r.error();
    }
    return std::unique_ptr<ITaskStore>(std::move(store));
}

} // namespace dlcore::downloader
