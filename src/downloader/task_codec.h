#pragma once

// Shared by the persistent task stores and the service: timestamps are persisted as Unix
// milliseconds, so in-memory timestamps are kept at that precision too.

#include <dlcore/downloader/downloader.hpp>

#include <chrono>
#include <cstdint>

namespace dlcore::downloader::detail {

inline TimePoint now_millis() {
    return std::chrono::time_point_cast<TimePoint::duration>(
        std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now()));
}

inline std::int64_t to_unix_millis(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

inline TimePoint from_unix_millis(std::int64_t ms) {
    return TimePoint{std::chrono::duration_cast<TimePoint::duration>(std::chrono::milliseconds{ms})};
}

} // namespace dlcore::downloader::detail
