// Scripted in-process HTTP server for engine and service tests
#pragma once

#include <dlcore/downloader/downloader.hpp>

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace dlcore::tests {

class FakeHttpAdapter final : public downloader::IHttpAdapter {
public:
    struct Options {
        std::string body;
        bool supportsRanges{true};
        std::size_t chunk{1000};
        // Deliver bytes up to this absolute position, then block until released or cancelled.
        // Consumed by the first request that reaches it.
        std::optional<std::uint64_t> gateAt{};
        // Answer every request with this status and no body
        std::optional<long> failStatus{};
        // Claim a 206 starting here regardless of the requested offset
        std::optional<std::uint64_t> rangeStartOverride{};
        // Stop sending at this absolute position while still advertising the full length
        std::optional<std::uint64_t> truncateAt{};
        // Omit Content-Length from 200 responses
        bool unknownLength{false};
    };

    explicit FakeHttpAdapter(Options options) : options_(std::move(options)) {}

    Result<downloader::HttpResponseInfo> get(const downloader::HttpRequest& request,
                                             const downloader::ResponseHandler& onResponse,
                                             const downloader::BodySink& sink,
                                             const downloader::ShouldCancel& shouldCancel) override {
        Options opts;
        {
            std::lock_guard lk(mutex_);
            requests_.push_back(request);
            opts = options_;
        }
        const std::uint64_t size = opts.body.size();

        downloader::HttpResponseInfo info;
        info.acceptRangesBytes = opts.supportsRanges;
        std::uint64_t start = 0;

        if (opts.failStatus) {
            info.status = *opts.failStatus;
            if (auto r = onResponse(info); !r)
                return r.error();
            return info;
        }

        if (opts.supportsRanges && request.offset > 0) {
            if (request.offset >= size) {
                info.status = 416;
                info.contentRange = downloader::ContentRange{std::nullopt, std::nullopt, size};
                if (auto r = onResponse(info); !r)
                    return r.error();
                return info;
            }
            start = opts.rangeStartOverride.value_or(request.offset);
            info.status = 206;
            info.contentRange = downloader::ContentRange{start, size - 1, size};
            info.contentLength = size - start;
        } else {
            info.status = 200;
            if (!opts.unknownLength)
                info.contentLength = size;
        }

        if (auto r = onResponse(info); !r)
            return r.error();

        const std::uint64_t end = std::min<std::uint64_t>(opts.truncateAt.value_or(size), size);
        std::uint64_t pos = start;
        while (pos < end) {
            if (shouldCancel && shouldCancel())
                return Error{ErrorCode::OperationCancelled, "cancelled"};

            std::uint64_t limit = end;
            {
                std::unique_lock lk(mutex_);
                if (options_.gateAt && pos >= *options_.gateAt) {
                    options_.gateAt.reset();
                    gateReached_ = true;
                    cv_.notify_all();
                    while (!gateReleased_) {
                        if (shouldCancel && shouldCancel())
                            return Error{ErrorCode::OperationCancelled, "cancelled"};
                        cv_.wait_for(lk, std::chrono::milliseconds(5));
                    }
                } else if (options_.gateAt) {
                    limit = std::min<std::uint64_t>(limit, *options_.gateAt);
                }
            }

            const std::uint64_t n = std::min<std::uint64_t>(opts.chunk, limit - pos);
            auto piece = std::as_bytes(
                std::span<const char>(opts.body.data() + pos, static_cast<std::size_t>(n)));
            if (auto r = sink(piece); !r)
                return r.error();
            pos += n;
        }
        return info;
    }

    /// Blocks until a request is parked at the gate.
    bool waitForGate(std::chrono::milliseconds timeout) {
        std::unique_lock lk(mutex_);
        return cv_.wait_for(lk, timeout, [this] { return gateReached_; });
    }

    void releaseGate() {
        std::lock_guard lk(mutex_);
        gateReleased_ = true;
        cv_.notify_all();
    }

    void setOptions(Options options) {
        std::lock_guard lk(mutex_);
        options_ = std::move(options);
        gateReached_ = false;
        gateReleased_ = false;
    }

    std::vector<downloader::HttpRequest> requests() const {
        std::lock_guard lk(mutex_);
        return requests_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    Options options_;
    std::vector<downloader::HttpRequest> requests_;
    bool gateReached_{false};
    bool gateReleased_{false};
};

/// Deterministic payload: "0123456789" repeated.
inline std::string makeBody(std::size_t size) {
    std::string s(size, '\0');
    for (std::size_t i = 0; i < size; ++i)
        s[i] = static_cast<char>('0' + (i % 10));
    return s;
}

} // namespace dlcore::tests
