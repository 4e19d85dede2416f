#include <dlcore/downloader/url.h>

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <memory>

namespace dlcore::downloader {

namespace {

struct CurlUrlDeleter {
    void operator()(CURLU* u) const noexcept { curl_url_cleanup(u); }
};
using CurlUrlPtr = std::unique_ptr<CURLU, CurlUrlDeleter>;

struct CurlStrDeleter {
    void operator()(char* p) const noexcept { curl_free(p); }
};
using CurlStr = std::unique_ptr<char, CurlStrDeleter>;

CurlStr get_part(CURLU* u, CURLUPart part, unsigned int flags = 0) {
    char* out = nullptr;
    if (curl_url_get(u, part, &out, flags) != CURLUE_OK) {
        return CurlStr{};
    }
    return CurlStr{out};
}

CurlUrlPtr parse(std::string_view url) {
    CurlUrlPtr u{curl_url()};
    if (!u) {
        return u;
    }
    std::string s(url);
    if (curl_url_set(u.get(), CURLUPART_URL, s.c_str(), 0) != CURLUE_OK) {
        u.reset();
    }
    return u;
}

} // namespace

Result<void> validateHttpUrl(std::string_view url) {
    if (url.empty()) {
        return Error{ErrorCode::InvalidArgument, "URL is empty"};
    }
    if (std::any_of(url.begin(), url.end(),
                    [](unsigned char c) { return std::isspace(c) || std::iscntrl(c); })) {
        return Error{ErrorCode::InvalidArgument, "URL contains whitespace"};
    }
    auto u = parse(url);
    if (!u) {
        return Error{ErrorCode::InvalidArgument, "Malformed URL: " + std::string(url)};
    }
    auto scheme = get_part(u.get(), CURLUPART_SCHEME);
    if (!scheme) {
        return Error{ErrorCode::InvalidArgument, "URL has no scheme"};
    }
    std::string sch(scheme.get());
    std::transform(sch.begin(), sch.end(), sch.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (sch != "http" && sch != "https") {
        return Error{ErrorCode::InvalidArgument, "Unsupported URL scheme: " + sch};
    }
    auto host = get_part(u.get(), CURLUPART_HOST);
    if (!host || *host.get() == '\0') {
        return Error{ErrorCode::InvalidArgument, "URL has no host"};
    }
    return {};
}

std::string fileNameFromUrl(std::string_view url) {
    auto u = parse(url);
    if (!u) {
        return {};
    }
    auto path = get_part(u.get(), CURLUPART_PATH, CURLU_URLDECODE);
    if (!path) {
        return {};
    }
    std::string p(path.get());
    auto slash = p.find_last_of('/');
    std::string name = slash == std::string::npos ? p : p.substr(slash + 1);
    // Decoded names must not escape the download directory
    std::replace_if(
        name.begin(), name.end(),
        [](unsigned char c) { return c == '\\' || c == '/' || std::iscntrl(c); }, '_');
    if (name == "." || name == "..") {
        return {};
    }
    return name;
}

} // namespace dlcore::downloader
