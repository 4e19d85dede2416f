#include <gtest/gtest.h>
#include <dlcore/downloader/transfer_engine.h>

#include "common/test_helpers.h"
#include "fake_http_adapter.h"

#include <mutex>
#include <vector>

using namespace dlcore;
using namespace dlcore::downloader;
using namespace std::chrono_literals;

namespace {

class EventLog {
public:
    TransferEventSink sink() {
        return [this](TransferEvent ev) {
            std::lock_guard lk(mutex_);
            events_.push_back(std::move(ev));
        };
    }

    std::vector<TransferEvent> events() const {
        std::lock_guard lk(mutex_);
        return events_;
    }

    std::vector<TransferEvent> ofKind(TransferEvent::Kind kind) const {
        std::vector<TransferEvent> out;
        for (auto& ev : events()) {
            if (ev.kind == kind)
                out.push_back(ev);
        }
        return out;
    }

    TransferEvent finished() const {
        auto all = ofKind(TransferEvent::Kind::Finished);
        EXPECT_EQ(all.size(), 1u);
        return all.empty() ? TransferEvent{} : all.front();
    }

private:
    mutable std::mutex mutex_;
    std::vector<TransferEvent> events_;
};

} // namespace

class TransferEngineTest : public ::testing::Test {
protected:
    void SetUp() override { body_ = tests::makeBody(10000); }

    TransferSession session(bool freshStart = true) {
        TransferSession s;
        s.taskId = 1;
        s.attempt = 1;
        s.path = dir_.path / "file.bin";
        s.freshStart = freshStart;
        s.request.url = "https://example.com/file.bin";
        return s;
    }

    std::shared_ptr<tests::FakeHttpAdapter> server(tests::FakeHttpAdapter::Options opts) {
        if (opts.body.empty())
            opts.body = body_;
        return std::make_shared<tests::FakeHttpAdapter>(std::move(opts));
    }

    void runSync(TransferSession s, std::shared_ptr<IHttpAdapter> http) {
        TransferEngine engine(std::move(s), std::move(http), nullptr, 0, log_.sink());
        engine.run();
        EXPECT_TRUE(engine.finished());
    }

    tests::TempDir dir_{"dlcore_engine_"};
    std::string body_;
    EventLog log_;
};

TEST_F(TransferEngineTest, FreshDownloadCompletes) {
    auto http = server({});
    runSync(session(), http);

    auto events = log_.events();
    ASSERT_GE(events.size(), 3u);
    EXPECT_EQ(events.front().kind, TransferEvent::Kind::Started);
    EXPECT_EQ(events.front().downloaded, 0u);

    auto progress = log_.ofKind(TransferEvent::Kind::Progress);
    ASSERT_EQ(progress.size(), 10u);
    std::uint64_t last = 0;
    for (const auto& ev : progress) {
        EXPECT_GE(ev.downloaded, last);
        EXPECT_EQ(ev.delta, 1000u);
        EXPECT_EQ(ev.taskId, 1);
        EXPECT_EQ(ev.attempt, 1u);
        last = ev.downloaded;
    }

    auto fin = log_.finished();
    EXPECT_EQ(fin.outcome, TransferOutcome::Completed);
    EXPECT_EQ(fin.downloaded, 10000u);
    EXPECT_EQ(fin.total, std::optional<std::uint64_t>{10000});
    EXPECT_EQ(tests::read_file(dir_.path / "file.bin"), body_);
    EXPECT_EQ(http->requests().front().offset, 0u);
}

TEST_F(TransferEngineTest, ResumesFromPartialFileLength) {
    tests::write_file(dir_.path / "file.bin", body_.substr(0, 3000));
    auto http = server({});
    runSync(session(false), http);

    ASSERT_EQ(http->requests().size(), 1u);
    EXPECT_EQ(http->requests().front().offset, 3000u);
    EXPECT_EQ(log_.events().front().downloaded, 3000u);
    EXPECT_EQ(log_.finished().outcome, TransferOutcome::Completed);
    EXPECT_EQ(tests::read_file(dir_.path / "file.bin"), body_);
}

TEST_F(TransferEngineTest, FreshStartDiscardsExistingFile) {
    tests::write_file(dir_.path / "file.bin", std::string(4000, 'x'));
    auto http = server({});
    runSync(session(true), http);

    EXPECT_EQ(http->requests().front().offset, 0u);
    EXPECT_EQ(tests::read_file(dir_.path / "file.bin"), body_);
}

TEST_F(TransferEngineTest, ServerIgnoringRangeRestartsFromZero) {
    tests::write_file(dir_.path / "file.bin", std::string(3000, 'x'));
    tests::FakeHttpAdapter::Options opts;
    opts.supportsRanges = false;
    auto http = server(opts);
    runSync(session(false), http);

    EXPECT_EQ(http->requests().front().offset, 3000u);
    auto resets = log_.ofKind(TransferEvent::Kind::OffsetReset);
    ASSERT_EQ(resets.size(), 1u);
    EXPECT_EQ(resets.front().downloaded, 0u);
    EXPECT_EQ(log_.finished().outcome, TransferOutcome::Completed);
    // Never concatenated onto the stale prefix
    EXPECT_EQ(tests::read_file(dir_.path / "file.bin"), body_);
}

TEST_F(TransferEngineTest, MismatchedRangeFailsAndDiscardsPartial) {
    tests::write_file(dir_.path / "file.bin", body_.substr(0, 3000));
    tests::FakeHttpAdapter::Options opts;
    opts.rangeStartOverride = 0;
    runSync(session(false), server(opts));

    auto fin = log_.finished();
    EXPECT_EQ(fin.outcome, TransferOutcome::Failed);
    EXPECT_TRUE(fin.retryable);
    ASSERT_TRUE(fin.error.has_value());
    EXPECT_NE(fin.error->message.find("Range mismatch"), std::string::npos);
    EXPECT_EQ(std::filesystem::file_size(dir_.path / "file.bin"), 0u);
}

TEST_F(TransferEngineTest, AlreadyCompleteFileFinishesOn416) {
    tests::write_file(dir_.path / "file.bin", body_);
    auto http = server({});
    runSync(session(false), http);

    EXPECT_EQ(http->requests().front().offset, 10000u);
    auto fin = log_.finished();
    EXPECT_EQ(fin.outcome, TransferOutcome::Completed);
    EXPECT_EQ(fin.downloaded, 10000u);
    EXPECT_TRUE(log_.ofKind(TransferEvent::Kind::Progress).empty());
}

TEST_F(TransferEngineTest, HttpErrorIsRetryableFailure) {
    tests::FakeHttpAdapter::Options opts;
    opts.failStatus = 503;
    runSync(session(), server(opts));

    auto fin = log_.finished();
    EXPECT_EQ(fin.outcome, TransferOutcome::Failed);
    EXPECT_TRUE(fin.retryable);
    ASSERT_TRUE(fin.error.has_value());
    EXPECT_EQ(fin.error->message, "HTTP error 503");
}

TEST_F(TransferEngineTest, ShortBodyFails) {
    tests::FakeHttpAdapter::Options opts;
    opts.truncateAt = 6000;
    runSync(session(), server(opts));

    auto fin = log_.finished();
    EXPECT_EQ(fin.outcome, TransferOutcome::Failed);
    EXPECT_TRUE(fin.retryable);
    EXPECT_EQ(fin.downloaded, 6000u);
    ASSERT_TRUE(fin.error.has_value());
    EXPECT_EQ(fin.error->code, ErrorCode::NetworkError);
    // Partial data stays for a later resume
    EXPECT_EQ(std::filesystem::file_size(dir_.path / "file.bin"), 6000u);
}

TEST_F(TransferEngineTest, UnknownLengthCompletesWithObservedSize) {
    tests::FakeHttpAdapter::Options opts;
    opts.unknownLength = true;
    runSync(session(), server(opts));

    auto started = log_.ofKind(TransferEvent::Kind::Progress);
    ASSERT_FALSE(started.empty());
    EXPECT_FALSE(started.front().total.has_value());
    auto fin = log_.finished();
    EXPECT_EQ(fin.outcome, TransferOutcome::Completed);
    EXPECT_EQ(fin.total, std::optional<std::uint64_t>{10000});
}

TEST_F(TransferEngineTest, InvalidUrlIsTerminal) {
    auto s = session();
    s.request.url = "ftp://example.com/file.bin";
    auto http = server({});
    runSync(std::move(s), http);

    auto fin = log_.finished();
    EXPECT_EQ(fin.outcome, TransferOutcome::Failed);
    EXPECT_FALSE(fin.retryable);
    EXPECT_TRUE(http->requests().empty());
}

TEST_F(TransferEngineTest, UnwritableDestinationIsTerminal) {
    tests::write_file(dir_.path / "blocker", "file, not a directory");
    auto s = session();
    s.path = dir_.path / "blocker" / "file.bin";
    auto http = server({});
    runSync(std::move(s), http);

    auto fin = log_.finished();
    EXPECT_EQ(fin.outcome, TransferOutcome::Failed);
    EXPECT_FALSE(fin.retryable);
    EXPECT_TRUE(http->requests().empty());
}

TEST_F(TransferEngineTest, DiskErrorOnOpenIsRetryable) {
    class FullDiskWriter final : public IDiskWriter {
    public:
        Result<std::uint64_t> open(const std::filesystem::path& path, bool) override {
            return Error{ErrorCode::DiskError,
                         "open failed for " + path.string() + ": No space left on device"};
        }
        Result<void> truncate(std::uint64_t) override { return ErrorCode::InvalidState; }
        Result<void> append(std::span<const std::byte>) override {
            return ErrorCode::InvalidState;
        }
        Result<void> sync() override { return ErrorCode::InvalidState; }
        void close() noexcept override {}
        std::uint64_t size() const noexcept override { return 0; }
    };

    auto http = server({});
    TransferEngine engine(session(), http, nullptr, 0, log_.sink(),
                          [] { return std::make_unique<FullDiskWriter>(); });
    engine.run();

    auto fin = log_.finished();
    EXPECT_EQ(fin.outcome, TransferOutcome::Failed);
    ASSERT_TRUE(fin.error.has_value());
    EXPECT_EQ(fin.error->code, ErrorCode::DiskError);
    EXPECT_TRUE(fin.retryable);
    EXPECT_TRUE(http->requests().empty());
}

TEST_F(TransferEngineTest, ChecksumVerifiedOnCompletion) {
    auto reference = tests::write_file(dir_.path / "reference.bin", body_);
    auto expected = computeFileChecksum(reference, HashAlgo::Sha256);
    ASSERT_TRUE(expected.has_value());

    auto s = session();
    s.expectedChecksum = expected.value();
    runSync(std::move(s), server({}));
    EXPECT_EQ(log_.finished().outcome, TransferOutcome::Completed);
}

TEST_F(TransferEngineTest, ChecksumMismatchIsTerminal) {
    auto s = session();
    s.expectedChecksum = Checksum{HashAlgo::Sha256, std::string(64, '0')};
    runSync(std::move(s), server({}));

    auto fin = log_.finished();
    EXPECT_EQ(fin.outcome, TransferOutcome::Failed);
    EXPECT_FALSE(fin.retryable);
    ASSERT_TRUE(fin.error.has_value());
    EXPECT_EQ(fin.error->code, ErrorCode::ChecksumMismatch);
}

TEST_F(TransferEngineTest, PauseStopsAtCurrentOffset) {
    tests::FakeHttpAdapter::Options opts;
    opts.gateAt = 3000;
    auto http = server(opts);

    TransferEngine engine(session(), http, nullptr, 0, log_.sink());
    engine.start();
    ASSERT_TRUE(http->waitForGate(5s));
    engine.requestStop(StopReason::Pause);
    engine.join();

    auto fin = log_.finished();
    EXPECT_EQ(fin.outcome, TransferOutcome::Paused);
    EXPECT_EQ(fin.downloaded, 3000u);
    EXPECT_EQ(std::filesystem::file_size(dir_.path / "file.bin"), 3000u);
}

TEST_F(TransferEngineTest, CancelKeepsPartialFile) {
    tests::FakeHttpAdapter::Options opts;
    opts.gateAt = 5000;
    auto http = server(opts);

    TransferEngine engine(session(), http, nullptr, 0, log_.sink());
    engine.start();
    ASSERT_TRUE(http->waitForGate(5s));
    engine.requestStop(StopReason::Cancel);
    engine.join();

    EXPECT_EQ(log_.finished().outcome, TransferOutcome::Cancelled);
    EXPECT_TRUE(std::filesystem::exists(dir_.path / "file.bin"));
}

TEST_F(TransferEngineTest, CancelTakesPrecedenceOverPause) {
    TransferEngine engine(session(), server({}), nullptr, 0, log_.sink());
    engine.requestStop(StopReason::Pause);
    EXPECT_EQ(engine.stopReason(), StopReason::Pause);
    engine.requestStop(StopReason::Cancel);
    EXPECT_EQ(engine.stopReason(), StopReason::Cancel);
    engine.requestStop(StopReason::Pause);
    EXPECT_EQ(engine.stopReason(), StopReason::Cancel);
}

TEST_F(TransferEngineTest, StopBeforeConnectSkipsRequest) {
    auto http = server({});
    TransferEngine engine(session(), http, nullptr, 0, log_.sink());
    engine.requestStop(StopReason::Pause);
    engine.run();
    EXPECT_EQ(log_.finished().outcome, TransferOutcome::Paused);
    EXPECT_TRUE(http->requests().empty());
}

TEST_F(TransferEngineTest, PerTaskRateLimitSlowsTransfer) {
    tests::FakeHttpAdapter::Options opts;
    opts.body = tests::makeBody(6000);
    auto http = server(opts);
    TransferEngine engine(session(), http, nullptr, 4000, log_.sink());
    const auto start = std::chrono::steady_clock::now();
    engine.run();
    EXPECT_GE(std::chrono::steady_clock::now() - start, 400ms);
    EXPECT_EQ(log_.finished().outcome, TransferOutcome::Completed);
}
