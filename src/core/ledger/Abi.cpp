#include "Abi.hpp"

#include "core/util/Errors.hpp"
#include "core/util/Hash.hpp"

namespace sai {

static int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

static std::string_view strip_0x(std::string_view hex) {
  if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) hex.remove_prefix(2);
  return hex;
}

std::string hex_to_bytes(std::string_view hex) {
  hex = strip_0x(hex);
  if (hex.size() % 2 != 0) throw IndexerError(ErrorKind::Decode, "odd-length hex string");
  std::string out(hex.size() / 2, '\0');
  for (size_t i = 0; i < out.size(); ++i) {
    int hi = hex_value(hex[2*i]), lo = hex_value(hex[2*i+1]);
    if (hi < 0 || lo < 0) throw IndexerError(ErrorKind::Decode, "invalid hex digit");
    out[i] = static_cast<char>((hi << 4) | lo);
  }
  return out;
}

uint64_t hex_to_u64(std::string_view hex) {
  hex = strip_0x(hex);
  if (hex.empty() || hex.size() > 16) throw IndexerError(ErrorKind::Decode, "invalid hex quantity");
  uint64_t v = 0;
  for (char c : hex) {
    int d = hex_value(c);
    if (d < 0) throw IndexerError(ErrorKind::Decode, "invalid hex quantity");
    v = (v << 4) | static_cast<uint64_t>(d);
  }
  return v;
}

std::string_view AbiReader::word(size_t byteOffset) const {
  if (byteOffset > data_.size() || data_.size() - byteOffset < kWord) {
    throw IndexerError(ErrorKind::Decode, "abi data truncated at offset " + std::to_string(byteOffset));
  }
  return data_.substr(byteOffset, kWord);
}

// Big-endian word that must fit in 64 bits.
uint64_t AbiReader::readU64(size_t byteOffset, const char* what) const {
  std::string_view w = word(byteOffset);
  for (size_t i = 0; i < kWord - 8; ++i) {
    if (w[i] != '\0') throw IndexerError(ErrorKind::Decode, std::string(what) + " does not fit in 64 bits");
  }
  uint64_t v = 0;
  for (size_t i = kWord - 8; i < kWord; ++i) v = (v << 8) | static_cast<unsigned char>(w[i]);
  return v;
}

std::string AbiReader::bytes32Hex(size_t slot) const {
  std::string_view w = word(slot * kWord);
  return "0x" + to_hex(reinterpret_cast<const uint8_t*>(w.data()), w.size());
}

bool AbiReader::isZero(size_t slot) const {
  for (char c : word(slot * kWord)) if (c != '\0') return false;
  return true;
}

std::string AbiReader::address(size_t slot) const {
  std::string_view w = word(slot * kWord);
  for (size_t i = 0; i < 12; ++i) {
    if (w[i] != '\0') throw IndexerError(ErrorKind::Decode, "address word has non-zero padding");
  }
  return "0x" + to_hex(reinterpret_cast<const uint8_t*>(w.data() + 12), 20);
}

uint64_t AbiReader::uint64At(size_t slot) const {
  return readU64(slot * kWord, "uint64");
}

bool AbiReader::boolAt(size_t slot) const {
  uint64_t v = readU64(slot * kWord, "bool");
  if (v > 1) throw IndexerError(ErrorKind::Decode, "bool word out of range");
  return v == 1;
}

std::string AbiReader::dynamicBytes(size_t slot) const {
  const uint64_t offset = readU64(slot * kWord, "offset");
  if (offset > data_.size()) throw IndexerError(ErrorKind::Decode, "dynamic offset out of bounds");
  const uint64_t len = readU64(static_cast<size_t>(offset), "length");
  const size_t start = static_cast<size_t>(offset) + kWord;
  if (len > data_.size() - start) throw IndexerError(ErrorKind::Decode, "dynamic length out of bounds");
  return std::string(data_.substr(start, static_cast<size_t>(len)));
}

} // namespace sai
