#pragma once

#include <dlcore/core/types.h>

#include <string>
#include <string_view>

namespace dlcore::downloader {

/// InvalidArgument unless url is an absolute http:// or https:// URL with a host.
Result<void> validateHttpUrl(std::string_view url);

/**
 * Last path segment of url, percent-decoded, with query and fragment removed.
 * Empty when the URL has no usable file name ("https://host/", "https://host/dir/").
 */
std::string fileNameFromUrl(std::string_view url);

} // namespace dlcore::downloader
