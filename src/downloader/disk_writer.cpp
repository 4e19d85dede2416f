/*
 * dlcore/src/downloader/disk_writer.cpp
 *
 * DiskWriter implementation:
 * - Writes straight into the destination file; its length is the resume offset
 * - Parent directories are created on open
 * - fsync of file and directory on sync() so a completed download survives a crash
 */

#include <dlcore/downloader/downloader.hpp>

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <string>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace dlcore::downloader {

namespace fs = std::filesystem;

namespace {

Error errno_error(int err, std::string_view what, const fs::path& p) {
    ErrorCode code = ErrorCode::DiskError;
    if (err == EACCES || err == EPERM || err == EROFS) {
        code = ErrorCode::PermissionDenied;
    } else if (err == EISDIR || err == ENOTDIR) {
        code = ErrorCode::InvalidArgument;
    }
    return Error{code, std::string(what) + " failed for " + p.string() + ": " + std::strerror(err)};
}

Result<void> fsync_dir(const fs::path& dir) {
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) {
        return errno_error(errno, "open(O_DIRECTORY)", dir);
    }
    if (::fsync(fd) != 0) {
        int err = errno;
        ::close(fd);
        return errno_error(err, "fsync(dir)", dir);
    }
    ::close(fd);
    return {};
}

} // namespace

class DiskWriter final : public IDiskWriter {
public:
    DiskWriter() = default;
    ~DiskWriter() override { close(); }

    Result<std::uint64_t> open(const fs::path& path, bool truncate) override {
        close();

        std::error_code ec;
        if (path.has_parent_path()) {
            fs::create_directories(path.parent_path(), ec);
            if (ec) {
                ErrorCode code = ErrorCode::DiskError;
                if (ec == std::errc::permission_denied || ec == std::errc::read_only_file_system) {
                    code = ErrorCode::PermissionDenied;
                } else if (ec == std::errc::not_a_directory || ec == std::errc::file_exists) {
                    // A path component is a regular file
                    code = ErrorCode::InvalidArgument;
                }
                return Error{code, "Cannot create directory " + path.parent_path().string() +
                                       ": " + ec.message()};
            }
        }

        int flags = O_WRONLY | O_CREAT | O_CLOEXEC;
        if (truncate)
            flags |= O_TRUNC;
        int fd = ::open(path.c_str(), flags, 0644);
        if (fd < 0) {
            return errno_error(errno, "open", path);
        }

        struct stat st {};
        if (::fstat(fd, &st) != 0) {
            int err = errno;
            ::close(fd);
            return errno_error(err, "fstat", path);
        }
        if (!S_ISREG(st.st_mode)) {
            ::close(fd);
            return Error{ErrorCode::InvalidArgument,
                         "Destination is not a regular file: " + path.string()};
        }

        fd_ = fd;
        path_ = path;
        size_ = static_cast<std::uint64_t>(st.st_size);
        spdlog::debug("DiskWriter: opened {} (size {}, truncate={})", path_.string(), size_,
                      truncate);
        return size_;
    }

    Result<void> truncate(std::uint64_t size) override {
        if (fd_ < 0) {
            return Error{ErrorCode::InvalidState, "DiskWriter not open"};
        }
        if (::ftruncate(fd_, static_cast<off_t>(size)) != 0) {
            return errno_error(errno, "ftruncate", path_);
        }
        size_ = size;
        return {};
    }

    Result<void> append(std::span<const std::byte> data) override {
        if (fd_ < 0) {
            return Error{ErrorCode::InvalidState, "DiskWriter not open"};
        }
        const char* p = reinterpret_cast<const char*>(data.data());
        std::size_t remaining = data.size();
        while (remaining > 0) {
            ssize_t n = ::pwrite(fd_, p, remaining, static_cast<off_t>(size_));
            if (n < 0) {
                if (errno == EINTR)
                    continue;
                return errno_error(errno, "write", path_);
            }
            p += n;
            remaining -= static_cast<std::size_t>(n);
            size_ += static_cast<std::uint64_t>(n);
        }
        return {};
    }

    Result<void> sync() override {
        if (fd_ < 0) {
            return Error{ErrorCode::InvalidState, "DiskWriter not open"};
        }
        if (::fsync(fd_) != 0) {
            return errno_error(errno, "fsync", path_);
        }
        if (path_.has_parent_path()) {
            return fsync_dir(path_.parent_path());
        }
        return {};
    }

    void close() noexcept override {
        if (fd_ >= 0) {
            if (::close(fd_) != 0) {
                spdlog::warn("DiskWriter: close failed for {}: {}", path_.string(),
                             std::strerror(errno));
            }
            fd_ = -1;
        }
    }

    std::uint64_t size() const noexcept override { return size_; }

private:
    int fd_{-1};
    fs::path path_;
    std::uint64_t size_{0};
};

std::unique_ptr<IDiskWriter> makeDiskWriter() {
    return std::make_unique<DiskWriter>();
}

} // namespace dlcore::downloader
