#pragma once

#include <dlcore/downloader/downloader.hpp>

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <thread>

namespace dlcore::downloader {

enum class StopReason : int { None = 0, Pause = 1, Cancel = 2 };

enum class TransferOutcome { Completed, Paused, Cancelled, Failed };

/**
 * Everything one attempt needs. Built by the service from the task and its config.
 */
struct TransferSession {
    TaskId taskId{0};
    std::uint64_t attempt{0};
    std::filesystem::path path;
    bool freshStart{false}; // truncate an existing file instead of resuming from its length
    std::optional<Checksum> expectedChecksum{};
    HttpRequest request{}; // url, headers, timeouts, TLS; offset is filled in by the engine
};

/**
 * Engine -> service notification. downloaded is always the absolute byte count on disk.
 */
struct TransferEvent {
    enum class Kind {
        Started,     // connected to the file; downloaded = resume offset
        OffsetReset, // server ignored Range; file truncated to 0
        Progress,    // chunk written; delta = chunk size
        Finished     // attempt over; no further events follow
    };

    Kind kind{Kind::Progress};
    TaskId taskId{0};
    std::uint64_t attempt{0};
    std::uint64_t downloaded{0};
    std::optional<std::uint64_t> total{};
    std::uint64_t delta{0};
    TransferOutcome outcome{TransferOutcome::Completed};
    std::optional<Error> error{};
    bool retryable{true};
};

using TransferEventSink = std::function<void(TransferEvent)>;
using DiskWriterFactory = std::function<std::unique_ptr<IDiskWriter>()>;

/**
 * Performs one HTTP(S) download attempt for one task on its own thread. The stop signal is
 * observed before connecting, around every chunk and from the transport's progress hook.
 */
class TransferEngine {
public:
    TransferEngine(TransferSession session, std::shared_ptr<IHttpAdapter> http,
                   std::shared_ptr<IRateLimiter> sharedLimiter, std::uint64_t perTaskRateBps,
                   TransferEventSink sink, DiskWriterFactory writerFactory = makeDiskWriter);
    ~TransferEngine();

    TransferEngine(const TransferEngine&) = delete;
    TransferEngine& operator=(const TransferEngine&) = delete;

    /// Spawn the worker thread.
    void start();

    /// Run the attempt on the calling thread.
    void run();

    /// Cancel takes precedence over Pause; a second Pause is ignored.
    void requestStop(StopReason reason) noexcept;

    void join();

    [[nodiscard]] StopReason stopReason() const noexcept {
        return static_cast<StopReason>(stop_.load(std::memory_order_acquire));
    }
    [[nodiscard]] bool finished() const noexcept {
        return finished_.load(std::memory_order_acquire);
    }
    [[nodiscard]] const TransferSession& session() const noexcept { return session_; }

private:
    bool stopRequested() const noexcept { return stopReason() != StopReason::None; }
    void emit(TransferEvent ev);
    void finish(TransferOutcome outcome, std::optional<Error> error = std::nullopt,
                bool retryable = true);
    void finishStopped();

    TransferSession session_;
    std::shared_ptr<IHttpAdapter> http_;
    std::shared_ptr<IRateLimiter> sharedLimiter_;
    std::unique_ptr<IRateLimiter> taskLimiter_;
    TransferEventSink sink_;
    DiskWriterFactory writerFactory_;

    std::atomic<int> stop_{0};
    std::atomic<bool> finished_{false};
    std::thread thread_;

    std::uint64_t downloaded_{0};
    std::optional<std::uint64_t> total_{};
};

} // namespace dlcore::downloader
