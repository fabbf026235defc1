#include "IpfsContentStore.hpp"

#include <cctype>
#include <cstdlib>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "core/util/Errors.hpp"
#include "core/util/Http.hpp"

using nlohmann::json;

namespace sai {

static std::string url_encode(const std::string& s) {
  static const char* k = "0123456789ABCDEF";
  std::string out;
  for (unsigned char c : s) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || c == '/') {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back('%');
      out.push_back(k[c >> 4]);
      out.push_back(k[c & 0xF]);
    }
  }
  return out;
}

IpfsContentStore::IpfsContentStore(std::string apiUrl, std::string gatewayUrl, std::chrono::seconds timeout)
  : apiUrl_(std::move(apiUrl)), gatewayUrl_(std::move(gatewayUrl)), timeout_(timeout) {
  while (!apiUrl_.empty() && apiUrl_.back() == '/') apiUrl_.pop_back();
  while (!gatewayUrl_.empty() && gatewayUrl_.back() == '/') gatewayUrl_.pop_back();
}

std::string IpfsContentStore::apiPost(const std::string& endpoint, const std::string& arg) {
  httplib::Client cli(apiUrl_);
  apply_timeouts(cli, timeout_);
  std::string path = "/api/v0/" + endpoint;
  if (!arg.empty()) path += "?arg=" + url_encode(arg);
  auto res = cli.Post(path, std::string(), "application/octet-stream");
  if (!res || res->status != 200) throw_http_failure(res, "ipfs " + endpoint);
  return res->body;
}

ContentStat IpfsContentStore::stat(const std::string& address) {
  const std::string body = apiPost("object/stat", address);
  ContentStat st;
  try {
    const json j = json::parse(body);
    st.child_count = j.value("NumLinks", static_cast<uint64_t>(0));
  } catch (const json::exception& e) {
    throw IndexerError(ErrorKind::Transport, "ipfs object/stat: invalid response: " + std::string(e.what()));
  }
  st.is_directory = st.child_count > 0;
  return st;
}

std::string IpfsContentStore::fetch(const std::string& address, size_t maxBytes) {
  httplib::Client cli(gatewayUrl_);
  apply_timeouts(cli, timeout_);

  std::string body;
  bool tooLarge = false;
  int status = 0;
  auto res = cli.Get(
    "/ipfs/" + url_encode(address),
    [&](const httplib::Response& r) {
      status = r.status;
      if (r.status != 200) return false;
      const std::string len = r.get_header_value("Content-Length");
      if (!len.empty() && std::strtoull(len.c_str(), nullptr, 10) > maxBytes) {
        tooLarge = true;
        return false;
      }
      return true;
    },
    [&](const char* data, size_t n) {
      if (body.size() + n > maxBytes) {
        tooLarge = true;
        return false;
      }
      body.append(data, n);
      return true;
    });

  if (tooLarge) {
    throw IndexerError(ErrorKind::TooLarge,
                       "content too large: " + address + " exceeds " + std::to_string(maxBytes) + " bytes");
  }
  if (status == 404) throw IndexerError(ErrorKind::NotFound, "ipfs fetch " + address + ": HTTP 404");
  if (status != 0 && status != 200) {
    throw IndexerError(ErrorKind::Transport, "ipfs fetch " + address + ": HTTP " + std::to_string(status));
  }
  if (!res) throw_http_failure(res, "ipfs fetch " + address);
  return body;
}

void IpfsContentStore::pin(const std::string& address) {
  apiPost("pin/add", address);
  spdlog::info("pinned {}", address);
}

std::string IpfsContentStore::version() {
  const json j = json::parse(apiPost("version", std::string()), nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    throw IndexerError(ErrorKind::Transport, "ipfs version: invalid response");
  }
  return j.value("Version", std::string("unknown"));
}

} // namespace sai
