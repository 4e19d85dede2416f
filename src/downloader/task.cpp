#include <dlcore/common/format.h>
#include <dlcore/downloader/downloader.hpp>

#include <algorithm>
#include <cctype>

namespace dlcore::downloader {

const char* toString(TaskStatus status) noexcept {
    switch (status) {
        case TaskStatus::Pending:
            return "pending";
        case TaskStatus::Downloading:
            return "downloading";
        case TaskStatus::Paused:
            return "paused";
        case TaskStatus::Completed:
            return "completed";
        case TaskStatus::Cancelled:
            return "cancelled";
        case TaskStatus::Failed:
            return "failed";
    }
    return "pending";
}

const char* statusText(TaskStatus status) noexcept {
    switch (status) {
        case TaskStatus::Pending:
            return "Waiting";
        case TaskStatus::Downloading:
            return "Downloading";
        case TaskStatus::Paused:
            return "Paused";
        case TaskStatus::Completed:
            return "Completed";
        case TaskStatus::Cancelled:
            return "Cancelled";
        case TaskStatus::Failed:
            return "Failed";
    }
    return "Unknown";
}

std::optional<TaskStatus> parseTaskStatus(std::string_view value) noexcept {
    static constexpr TaskStatus all[] = {TaskStatus::Pending,   TaskStatus::Downloading,
                                         TaskStatus::Paused,    TaskStatus::Completed,
                                         TaskStatus::Cancelled, TaskStatus::Failed};
    for (auto s : all) {
        if (value == toString(s))
            return s;
    }
    return std::nullopt;
}

const char* toString(HashAlgo algo) noexcept {
    switch (algo) {
        case HashAlgo::Sha256:
            return "sha256";
        case HashAlgo::Sha512:
            return "sha512";
        case HashAlgo::Md5:
            return "md5";
    }
    return "sha256";
}

std::optional<StoreBackend> parseStoreBackend(std::string_view value) noexcept {
    if (value == "sqlite")
        return StoreBackend::Sqlite;
    if (value == "json")
        return StoreBackend::Json;
    if (value == "memory")
        return StoreBackend::Memory;
    return std::nullopt;
}

Result<Checksum> parseChecksum(std::string_view value) {
    Checksum out;
    std::string_view hex = value;
    auto colon = value.find(':');
    if (colon != std::string_view::npos) {
        std::string algo(value.substr(0, colon));
        std::transform(algo.begin(), algo.end(), algo.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (algo == "sha256") {
            out.algo = HashAlgo::Sha256;
        } else if (algo == "sha512") {
            out.algo = HashAlgo::Sha512;
        } else if (algo == "md5") {
            out.algo = HashAlgo::Md5;
        } else {
            return Error{ErrorCode::InvalidArgument, "Unsupported checksum algorithm: " + algo};
        }
        hex = value.substr(colon + 1);
    }

    const std::size_t expected =
        out.algo == HashAlgo::Sha256 ? 64 : (out.algo == HashAlgo::Sha512 ? 128 : 32);
    if (hex.size() != expected ||
        !std::all_of(hex.begin(), hex.end(), [](unsigned char c) { return std::isxdigit(c); })) {
        return Error{ErrorCode::InvalidArgument,
                     "Checksum must be " + std::to_string(expected) + " hex characters"};
    }
    out.hex.reserve(hex.size());
    for (unsigned char c : hex) {
        out.hex.push_back(static_cast<char>(std::tolower(c)));
    }
    return out;
}

std::string toString(const Checksum& checksum) {
    return std::string(toString(checksum.algo)) + ":" + checksum.hex;
}

double Task::progressPercent() const noexcept {
    if (!totalBytes || *totalBytes == 0) {
        return 0.0;
    }
    double pct = static_cast<double>(downloadedBytes) * 100.0 / static_cast<double>(*totalBytes);
    return std::min(pct, 100.0);
}

std::string Task::progressText() const {
    return formatPercent(progressPercent());
}

std::string Task::formattedDownloaded() const {
    return formatBytes(downloadedBytes);
}

std::string Task::formattedTotal() const {
    return formatBytes(totalBytes);
}

const char* Task::statusText() const noexcept {
    return downloader::statusText(status);
}

bool Task::isActive() const noexcept {
    return status == TaskStatus::Pending || status == TaskStatus::Downloading;
}

bool Task::isTerminal() const noexcept {
    return status == TaskStatus::Completed || status == TaskStatus::Cancelled ||
           (status == TaskStatus::Failed && !retryable);
}

bool Task::canResume() const noexcept {
    return status == TaskStatus::Paused || (status == TaskStatus::Failed && retryable);
}

std::string Task::filename() const {
    return path.filename().string();
}

std::string Task::extension() const {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

} // namespace dlcore::downloader
