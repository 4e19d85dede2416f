/*
 * dlcore/src/downloader/rate_limiter.cpp
 *
 * Token-bucket RateLimiter
 * - Honors limits.globalBps and limits.perConnectionBps if > 0
 * - No-ops when both limits are zero (unlimited)
 * - Cooperative cancellation via ShouldCancel
 *
 * Notes:
 * - Capacity = rate (burst <= 1 second of allowance).
 * - A request larger than the capacity is granted once the bucket is full and leaves the
 *   bucket in debt, so chunk sizes above the rate still average out to the rate.
 * - Thread-safe for concurrent acquire() calls; one instance is shared by every transfer
 *   for the service-wide cap, and each transfer owns another for its own cap.
 */

#include <dlcore/downloader/downloader.hpp>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <thread>

namespace dlcore::downloader {

namespace {

using clock_type = std::chrono::steady_clock;

struct Bucket {
    // rate in bytes per second (0 => unlimited)
    double rate_bps{0.0};
    double capacity{0.0};
    // current tokens (bytes); negative while in debt
    double tokens{0.0};
    clock_type::time_point last_refill{clock_type::now()};
};

class TokenBucketLimiter final : public IRateLimiter {
public:
    TokenBucketLimiter() = default;
    ~TokenBucketLimiter() override = default;

    void setLimits(const RateLimit& limit) override {
        std::lock_guard<std::mutex> lk(mutex_);
        const auto now = clock_type::now();
        initBucket(global_, static_cast<double>(limit.globalBps), now);
        initBucket(per_conn_, static_cast<double>(limit.perConnectionBps), now);
    }

    void acquire(std::uint64_t bytes, const ShouldCancel& shouldCancel) override {
        if (bytes == 0)
            return;

        while (true) {
            if (shouldCancel && shouldCancel()) {
                return;
            }

            double wait_seconds = 0.0;
            {
                std::lock_guard<std::mutex> lk(mutex_);
                if (global_.rate_bps <= 0.0 && per_conn_.rate_bps <= 0.0) {
                    return;
                }
                const auto now = clock_type::now();
                refill(global_, now);
                refill(per_conn_, now);

                const double need_global = needFor(global_, bytes);
                const double need_conn = needFor(per_conn_, bytes);
                if (need_global <= 0.0 && need_conn <= 0.0) {
                    deduct(global_, bytes);
                    deduct(per_conn_, bytes);
                    return;
                }
                wait_seconds = std::max(timeToAccumulate(global_, need_global),
                                        timeToAccumulate(per_conn_, need_conn));
            }

            // Sleep in small increments to allow cancel checks
            constexpr auto max_slice = std::chrono::milliseconds(50);
            auto sleep_for = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::duration<double>(wait_seconds));
            if (sleep_for.count() <= 0) {
                std::this_thread::yield();
            } else {
                std::this_thread::sleep_for(std::min(sleep_for, max_slice));
            }
        }
    }

private:
    static void initBucket(Bucket& b, double rate_bps, clock_type::time_point now) {
        b.rate_bps = rate_bps;
        b.capacity = rate_bps > 0.0 ? rate_bps : 0.0;
        b.tokens = b.capacity;
        b.last_refill = now;
    }

    static void refill(Bucket& b, clock_type::time_point now) {
        if (b.rate_bps <= 0.0) {
            b.last_refill = now;
            return;
        }
        const auto dt = std::chrono::duration<double>(now - b.last_refill).count();
        if (dt <= 0.0)
            return;
        b.tokens = std::min(b.capacity, b.tokens + b.rate_bps * dt);
        b.last_refill = now;
    }

    static double needFor(const Bucket& b, std::uint64_t bytes) {
        if (b.rate_bps <= 0.0)
            return 0.0;
        const double want = std::min(static_cast<double>(bytes), b.capacity);
        const double need = want - b.tokens;
        return need > 0.0 ? need : 0.0;
    }

    static double timeToAccumulate(const Bucket& b, double need) {
        if (b.rate_bps <= 0.0 || need <= 0.0)
            return 0.0;
        return need / b.rate_bps;
    }

    static void deduct(Bucket& b, std::uint64_t bytes) {
        if (b.rate_bps <= 0.0)
            return;
        b.tokens -= static_cast<double>(bytes);
    }

    std::mutex mutex_;
    Bucket global_{};
    Bucket per_conn_{};
};

} // namespace

std::unique_ptr<IRateLimiter> makeRateLimiter() {
    return std::make_unique<TokenBucketLimiter>();
}

} // namespace dlcore::downloader
