#include <dlcore/common/format.h>

#include <spdlog/fmt/fmt.h>

#include <array>

namespace dlcore {

namespace {

constexpr std::array<const char*, 5> kUnits{"B", "KB", "MB", "GB", "TB"};

std::string scaled(double value) {
    std::size_t unit = 0;
    while (value >= 1024.0 && unit < kUnits.size() - 1) {
        value /= 1024.0;
        ++unit;
    }
    if (unit == 0) {
        return fmt::format("{:.0f} {}", value, kUnits[unit]);
    }
    return fmt::format("{:.2f} {}", value, kUnits[unit]);
}

} // namespace

std::string formatBytes(std::uint64_t bytes) {
    if (bytes == 0)
        return "0 B";
    return scaled(static_cast<double>(bytes));
}

std::string formatBytes(const std::optional<std::uint64_t>& bytes) {
    if (!bytes)
        return "unknown";
    return formatBytes(*bytes);
}

std::string formatSpeed(double bytesPerSecond) {
    if (!(bytesPerSecond > 0.0))
        return "0 B/s";
    return scaled(bytesPerSecond) + "/s";
}

std::string formatPercent(double percent) {
    return fmt::format("{:.1f}%", percent);
}

std::string formatDuration(std::chrono::seconds duration) {
    auto total = duration.count();
    if (total < 0)
        total = 0;
    const auto hours = total / 3600;
    const auto minutes = (total % 3600) / 60;
    const auto seconds = total % 60;
    if (hours > 0)
        return fmt::format("{}h {:02}m {:02}s", hours, minutes, seconds);
    if (minutes > 0)
        return fmt::format("{}m {:02}s", minutes, seconds);
    return fmt::format("{}s", seconds);
}

} // namespace dlcore
