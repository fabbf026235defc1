#pragma once
#include <chrono>
#include <string>

#include "core/content/ContentStore.hpp"

namespace sai {

// ContentStore over the IPFS HTTP RPC API (stat, pin, version) and an
// HTTP gateway (streamed reads with a size guard).
class IpfsContentStore : public ContentStore {
public:
  IpfsContentStore(std::string apiUrl, std::string gatewayUrl, std::chrono::seconds timeout);

  ContentStat stat(const std::string& address) override;
  std::string fetch(const std::string& address, size_t maxBytes) override;
  void pin(const std::string& address) override;

  // Node version string; used as a reachability check at startup.
  std::string version();

private:
  std::string apiPost(const std::string& endpoint, const std::string& arg);

  std::string apiUrl_;
  std::string gatewayUrl_;
  std::chrono::seconds timeout_;
};

} // namespace sai
