#include "Http.hpp"

#include "core/util/Errors.hpp"

namespace sai {

std::pair<std::string, std::string> split_url(const std::string& url) {
  const auto scheme = url.find("://");
  const size_t hostStart = scheme == std::string::npos ? 0 : scheme + 3;
  const auto slash = url.find('/', hostStart);
  if (slash == std::string::npos) return {url, "/"};
  return {url.substr(0, slash), url.substr(slash)};
}

void apply_timeouts(httplib::Client& cli, std::chrono::seconds timeout) {
  cli.set_connection_timeout(timeout);
  cli.set_read_timeout(timeout);
  cli.set_write_timeout(timeout);
}

void throw_http_failure(const httplib::Result& res, const std::string& what) {
  if (!res) {
    const auto err = res.error();
    const std::string msg = what + ": " + httplib::to_string(err);
    if (err == httplib::Error::ConnectionTimeout || err == httplib::Error::Read) {
      throw IndexerError(ErrorKind::Timeout, msg);
    }
    throw IndexerError(ErrorKind::Transport, msg);
  }
  if (res->status == 404) {
    throw IndexerError(ErrorKind::NotFound, what + ": HTTP 404");
  }
  throw IndexerError(ErrorKind::Transport, what + ": HTTP " + std::to_string(res->status));
}

} // namespace sai
