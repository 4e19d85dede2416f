#pragma once

#include <dlcore/downloader/downloader.hpp>

#include <cstdint>
#include <optional>
#include <string_view>

namespace dlcore::downloader {

/// "bytes 100-199/1000", "bytes 100-199/*", "bytes */1000". Case-insensitive unit.
std::optional<ContentRange> parseContentRange(std::string_view value);

std::optional<std::uint64_t> parseContentLength(std::string_view value);

/**
 * Accumulates raw response header lines as delivered by the transport. A status line
 * ("HTTP/1.1 302 Found") starts a new response, so after redirects and interim 1xx
 * responses only the final response's headers remain.
 */
class ResponseHeaderParser {
public:
    void feedLine(std::string_view line);

    /// True once the blank line terminating a header block has been seen.
    [[nodiscard]] bool complete() const noexcept { return complete_; }

    [[nodiscard]] const HttpResponseInfo& info() const noexcept { return info_; }
    HttpResponseInfo& info() noexcept { return info_; }

private:
    HttpResponseInfo info_{};
    bool complete_{false};
};

} // namespace dlcore::downloader
