#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace sai {

std::string to_hex(const uint8_t* data, size_t len);

// Lowercase hex SHA-256 of bytes, no prefix.
std::string sha256_hex(std::string_view bytes);

// Canonical byte form of a scanprint stream: split on '\n', strip ASCII
// whitespace from each line, drop empty lines, re-join with a single '\n'
// in original order, no trailing separator.
std::string canonical_scanprint(std::string_view stream);

// "0x" + sha256_hex(canonical_scanprint(stream)); empty when the canonical
// stream is empty.
std::string scanprint_root(std::string_view stream);

// Lowercases and adds a "0x" prefix so attested and computed roots compare
// byte-for-byte. Empty input stays empty.
std::string normalize_root(std::string_view root);

} // namespace sai
