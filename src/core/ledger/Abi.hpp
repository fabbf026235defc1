#pragma once
#include <cstdint>
#include <string>
#include <string_view>

namespace sai {

// Decodes "0x"-prefixed (or bare) hex. Throws IndexerError(Decode).
std::string hex_to_bytes(std::string_view hex);
uint64_t hex_to_u64(std::string_view hex);

// Read-only view over Solidity ABI-encoded data (32-byte head words,
// dynamic values addressed by offset). All accessors bounds-check and
// throw IndexerError(Decode).
class AbiReader {
public:
  static constexpr size_t kWord = 32;

  explicit AbiReader(std::string_view data) : data_(data) {}

  size_t words() const { return data_.size() / kWord; }

  std::string bytes32Hex(size_t slot) const;   // "0x" + 64 hex
  bool        isZero(size_t slot) const;
  std::string address(size_t slot) const;      // "0x" + 40 hex
  uint64_t    uint64At(size_t slot) const;
  bool        boolAt(size_t slot) const;
  std::string dynamicBytes(size_t slot) const; // bytes/string behind an offset word

private:
  std::string_view word(size_t byteOffset) const;
  uint64_t readU64(size_t byteOffset, const char* what) const;

  std::string_view data_;
};

} // namespace sai
