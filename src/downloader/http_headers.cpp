#include <dlcore/downloader/http_headers.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <string>

namespace dlcore::downloader {

namespace {

std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s)
        out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

std::string_view trim(std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return s.substr(b, e - b);
}

std::optional<std::uint64_t> parse_u64(std::string_view s) {
    s = trim(s);
    if (s.empty())
        return std::nullopt;
    std::uint64_t v{0};
    auto res = std::from_chars(s.data(), s.data() + s.size(), v);
    if (res.ec != std::errc() || res.ptr != s.data() + s.size())
        return std::nullopt;
    return v;
}

bool istarts_with(std::string_view s, std::string_view prefix) {
    if (s.size() < prefix.size())
        return false;
    for (size_t i = 0; i < prefix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(s[i])) !=
            std::tolower(static_cast<unsigned char>(prefix[i]))) {
            return false;
        }
    }
    return true;
}

} // namespace

std::optional<ContentRange> parseContentRange(std::string_view value) {
    auto v = trim(value);
    if (!istarts_with(v, "bytes"))
        return std::nullopt;
    v = trim(v.substr(5));
    auto slash = v.find('/');
    if (slash == std::string_view::npos)
        return std::nullopt;

    ContentRange cr;
    auto range = trim(v.substr(0, slash));
    auto total = trim(v.substr(slash + 1));

    if (total != "*") {
        cr.total = parse_u64(total);
        if (!cr.total)
            return std::nullopt;
    }

    if (range != "*") {
        auto dash = range.find('-');
        if (dash == std::string_view::npos)
            return std::nullopt;
        cr.first = parse_u64(range.substr(0, dash));
        cr.last = parse_u64(range.substr(dash + 1));
        if (!cr.first || !cr.last || *cr.last < *cr.first)
            return std::nullopt;
    } else if (!cr.total) {
        return std::nullopt; // "bytes */*" carries nothing
    }
    return cr;
}

std::optional<std::uint64_t> parseContentLength(std::string_view value) {
    return parse_u64(value);
}

void ResponseHeaderParser::feedLine(std::string_view line) {
    // Strip CRLF
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.remove_suffix(1);
    }

    if (istarts_with(line, "HTTP/")) {
        info_ = HttpResponseInfo{};
        complete_ = false;
        auto sp = line.find(' ');
        if (sp != std::string_view::npos) {
            auto rest = line.substr(sp + 1);
            auto code = parse_u64(rest.substr(0, rest.find(' ')));
            if (code)
                info_.status = static_cast<long>(*code);
        }
        return;
    }

    if (line.empty()) {
        complete_ = true;
        return;
    }

    // We expect "Key: Value"
    auto colon = line.find(':');
    if (colon == std::string_view::npos)
        return;

    auto key = to_lower(trim(line.substr(0, colon)));
    auto val = trim(line.substr(colon + 1));

    if (key == "accept-ranges") {
        info_.acceptRangesBytes = to_lower(val) == "bytes";
    } else if (key == "content-length") {
        info_.contentLength = parseContentLength(val);
    } else if (key == "content-range") {
        info_.contentRange = parseContentRange(val);
    } else if (key == "etag") {
        // Strip surrounding quotes if present
        std::string v(val);
        if (v.size() >= 2 && (v.front() == '"' && v.back() == '"')) {
            v = v.substr(1, v.size() - 2);
        }
        info_.etag = std::move(v);
    } else if (key == "last-modified") {
        info_.lastModified = std::string(val);
    }
}

} // namespace dlcore::downloader
