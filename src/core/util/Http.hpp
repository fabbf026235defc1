#pragma once
#include <chrono>
#include <string>
#include <utility>

#include <httplib.h>

namespace sai {

// Splits "http://host:port/some/path" into {"http://host:port", "/some/path"}.
std::pair<std::string, std::string> split_url(const std::string& url);

// Client with connect/read/write timeouts applied.
void apply_timeouts(httplib::Client& cli, std::chrono::seconds timeout);

// Throws IndexerError for a failed request: Timeout for connect/read
// timeouts, Transport for other transport errors.
[[noreturn]] void throw_http_failure(const httplib::Result& res, const std::string& what);

} // namespace sai
