#include <dlcore/downloader/transfer_engine.h>
#include <dlcore/downloader/url.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <string>

namespace dlcore::downloader {

namespace {

// Failures that a retry cannot fix.
bool isTerminal(ErrorCode code) {
    return code == ErrorCode::InvalidArgument || code == ErrorCode::PermissionDenied ||
           code == ErrorCode::ChecksumMismatch;
}

} // namespace

TransferEngine::TransferEngine(TransferSession session, std::shared_ptr<IHttpAdapter> http,
                               std::shared_ptr<IRateLimiter> sharedLimiter,
                               std::uint64_t perTaskRateBps, TransferEventSink sink,
                               DiskWriterFactory writerFactory)
    : session_(std::move(session)), http_(std::move(http)),
      sharedLimiter_(std::move(sharedLimiter)), sink_(std::move(sink)),
      writerFactory_(std::move(writerFactory)) {
    if (perTaskRateBps > 0) {
        taskLimiter_ = makeRateLimiter();
        taskLimiter_->setLimits(RateLimit{perTaskRateBps, 0});
    }
}

TransferEngine::~TransferEngine() {
    if (thread_.joinable()) {
        requestStop(StopReason::Pause);
        thread_.join();
    }
}

void TransferEngine::start() {
    thread_ = std::thread([this] { run(); });
}

void TransferEngine::join() {
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
    }
}

void TransferEngine::requestStop(StopReason reason) noexcept {
    if (reason == StopReason::Cancel) {
        stop_.store(static_cast<int>(StopReason::Cancel), std::memory_order_release);
        return;
    }
    int expected = static_cast<int>(StopReason::None);
    stop_.compare_exchange_strong(expected, static_cast<int>(reason), std::memory_order_acq_rel);
}

void TransferEngine::emit(TransferEvent ev) {
    ev.taskId = session_.taskId;
    ev.attempt = session_.attempt;
    ev.downloaded = downloaded_;
    ev.total = total_;
    if (sink_) {
        sink_(std::move(ev));
    }
}

void TransferEngine::finish(TransferOutcome outcome, std::optional<Error> error, bool retryable) {
    TransferEvent ev;
    ev.kind = TransferEvent::Kind::Finished;
    ev.outcome = outcome;
    ev.error = std::move(error);
    ev.retryable = retryable;
    finished_.store(true, std::memory_order_release);
    emit(std::move(ev));
}

void TransferEngine::finishStopped() {
    finish(stopReason() == StopReason::Cancel ? TransferOutcome::Cancelled
                                              : TransferOutcome::Paused);
}

void TransferEngine::run() {
    const TaskId id = session_.taskId;
    const ShouldCancel shouldCancel = [this] { return stopRequested(); };

    if (auto valid = validateHttpUrl(session_.request.url); !valid) {
        finish(TransferOutcome::Failed, valid.error(), false);
        return;
    }

    auto writer = writerFactory_ ? writerFactory_() : makeDiskWriter();
    auto opened = writer->open(session_.path, session_.freshStart);
    if (!opened) {
        const Error& err = opened.error();
        spdlog::error("Task {}: cannot open {}: {}", id, session_.path.string(), err.message);
        finish(TransferOutcome::Failed, err, !isTerminal(err.code));
        return;
    }
    std::uint64_t offset = opened.value();
    downloaded_ = offset;

    {
        TransferEvent ev;
        ev.kind = TransferEvent::Kind::Started;
        emit(std::move(ev));
    }

    if (stopRequested()) {
        writer->close();
        finishStopped();
        return;
    }

    HttpRequest request = session_.request;
    request.offset = offset;

    bool alreadyComplete = false;
    std::optional<Error> rangeMismatch;

    auto onResponse = [&](const HttpResponseInfo& info) -> Result<void> {
        const long status = info.status;
        if (status == 206) {
            const auto& cr = info.contentRange;
            if (!cr || !cr->first || *cr->first != offset) {
                rangeMismatch = Error{
                    ErrorCode::NetworkError,
                    "Range mismatch: requested offset " + std::to_string(offset) +
                        ", server sent " +
                        (cr && cr->first ? std::to_string(*cr->first) : std::string("none"))};
                return *rangeMismatch;
            }
            if (cr->total) {
                total_ = cr->total;
            } else if (info.contentLength) {
                total_ = offset + *info.contentLength;
            }
            if (offset > 0) {
                spdlog::debug("Task {}: resuming at byte {}", id, offset);
            }
            return {};
        }
        if (status >= 200 && status < 300) {
            if (offset > 0) {
                spdlog::warn("Task {}: server ignored Range (HTTP {}), restarting from 0", id,
                             status);
                if (auto r = writer->truncate(0); !r) {
                    return r;
                }
                offset = 0;
                downloaded_ = 0;
                TransferEvent ev;
                ev.kind = TransferEvent::Kind::OffsetReset;
                emit(std::move(ev));
            }
            total_ = info.contentLength;
            return {};
        }
        if (status == 416 && info.contentRange && info.contentRange->total &&
            *info.contentRange->total == offset && offset > 0) {
            spdlog::info("Task {}: file already complete ({} bytes)", id, offset);
            alreadyComplete = true;
            total_ = offset;
            return {};
        }
        return Error{ErrorCode::NetworkError, "HTTP error " + std::to_string(status)};
    };

    auto onBody = [&](std::span<const std::byte> data) -> Result<void> {
        if (alreadyComplete) {
            return {};
        }
        const std::size_t chunk = std::max<std::size_t>(request.bufferSize, MIN_CHUNK_SIZE);
        while (!data.empty()) {
            if (stopRequested()) {
                return Error{ErrorCode::OperationCancelled, "Transfer stopped"};
            }
            auto piece = data.first(std::min(chunk, data.size()));
            if (sharedLimiter_) {
                sharedLimiter_->acquire(piece.size(), shouldCancel);
            }
            if (taskLimiter_) {
                taskLimiter_->acquire(piece.size(), shouldCancel);
            }
            if (stopRequested()) {
                return Error{ErrorCode::OperationCancelled, "Transfer stopped"};
            }
            if (auto r = writer->append(piece); !r) {
                return r;
            }
            downloaded_ += piece.size();
            TransferEvent ev;
            ev.kind = TransferEvent::Kind::Progress;
            ev.delta = piece.size();
            emit(std::move(ev));
            data = data.subspan(piece.size());
        }
        return {};
    };

    Result<HttpResponseInfo> result = Error{ErrorCode::InternalError, "not started"};
    try {
        result = http_->get(request, onResponse, onBody, shouldCancel);
    } catch (const std::exception& e) {
        result = Error{ErrorCode::InternalError, std::string("HTTP adapter threw: ") + e.what()};
    }

    if (!result) {
        const Error& err = result.error();
        if (stopRequested()) {
            writer->close();
            spdlog::debug("Task {}: stopped at {} bytes", id, downloaded_);
            finishStopped();
            return;
        }
        if (rangeMismatch) {
            // Not silently concatenated: next attempt restarts from zero
            if (auto r = writer->truncate(0); !r) {
                spdlog::warn("Task {}: truncate after range mismatch failed: {}", id,
                             r.error().message);
            } else {
                downloaded_ = 0;
            }
            writer->close();
            spdlog::error("Task {}: {}", id, rangeMismatch->message);
            finish(TransferOutcome::Failed, *rangeMismatch, true);
            return;
        }
        writer->close();
        spdlog::error("Task {}: download failed: {}", id, err.message);
        finish(TransferOutcome::Failed, err, !isTerminal(err.code));
        return;
    }

    if (!alreadyComplete) {
        if (total_ && downloaded_ < *total_) {
            writer->close();
            Error err{ErrorCode::NetworkError, "Transfer ended at " + std::to_string(downloaded_) +
                                                   " of " + std::to_string(*total_) + " bytes"};
            spdlog::error("Task {}: {}", id, err.message);
            finish(TransferOutcome::Failed, std::move(err), true);
            return;
        }
        if (!total_) {
            total_ = downloaded_;
        }
    }

    if (auto synced = writer->sync(); !synced) {
        writer->close();
        finish(TransferOutcome::Failed, synced.error(), true);
        return;
    }
    writer->close();

    if (session_.expectedChecksum) {
        const auto& expected = *session_.expectedChecksum;
        auto actual = computeFileChecksum(session_.path, expected.algo);
        if (!actual) {
            finish(TransferOutcome::Failed, actual.error(), true);
            return;
        }
        if (actual.value().hex != expected.hex) {
            Error err{ErrorCode::ChecksumMismatch, "Checksum mismatch: expected " +
                                                       toString(expected) + ", got " +
                                                       toString(actual.value())};
            spdlog::error("Task {}: {}", id, err.message);
            finish(TransferOutcome::Failed, std::move(err), false);
            return;
        }
    }

    spdlog::debug("Task {}: transfer complete ({} bytes)", id, downloaded_);
    finish(TransferOutcome::Completed);
}

} // namespace dlcore::downloader
