#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

namespace sai {

struct ContentStat {
  bool     is_directory = false;
  uint64_t child_count = 0;
};

// Content-addressed store. Addresses may carry a sub-path ("<cid>/manifest.json").
// Implementations throw IndexerError (TooLarge when fetch exceeds maxBytes).
class ContentStore {
public:
  virtual ~ContentStore() = default;

  virtual ContentStat stat(const std::string& address) = 0;
  virtual std::string fetch(const std::string& address, size_t maxBytes) = 0;
  virtual void pin(const std::string& address) = 0;
};

} // namespace sai
