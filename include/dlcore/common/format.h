// Human-readable formatting for byte counts, transfer rates and durations.
// Output is locale-independent and uses binary (1024) multiples.

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace dlcore {

// "0 B", "512 B", "1.00 KB", "1.50 MB", ... up to TB.
std::string formatBytes(std::uint64_t bytes);

// Like formatBytes but renders an unknown size as "unknown".
std::string formatBytes(const std::optional<std::uint64_t>& bytes);

// "1.50 MB/s"; non-positive rates render as "0 B/s".
std::string formatSpeed(double bytesPerSecond);

// "42.0%"
std::string formatPercent(double percent);

// "1h 02m 03s", "4m 05s", "7s"
std::string formatDuration(std::chrono::seconds duration);

} // namespace dlcore
