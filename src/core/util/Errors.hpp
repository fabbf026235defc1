#pragma once
#include <stdexcept>
#include <string>

namespace sai {

enum class ErrorKind {
  Transport,
  Timeout,
  RangeUnavailable,
  NotFound,
  TooLarge,
  NotABundle,
  MalformedManifest,
  MalformedRecords,
  IntegrityMismatch,
  Decode,
  Storage,
  Config
};

inline const char* to_string(ErrorKind k) {
  switch (k) {
    case ErrorKind::Transport:         return "transport";
    case ErrorKind::Timeout:           return "timeout";
    case ErrorKind::RangeUnavailable:  return "range_unavailable";
    case ErrorKind::NotFound:          return "not_found";
    case ErrorKind::TooLarge:          return "too_large";
    case ErrorKind::NotABundle:        return "not_a_bundle";
    case ErrorKind::MalformedManifest: return "malformed_manifest";
    case ErrorKind::MalformedRecords:  return "malformed_records";
    case ErrorKind::IntegrityMismatch: return "integrity_mismatch";
    case ErrorKind::Decode:            return "decode";
    case ErrorKind::Storage:           return "storage";
    case ErrorKind::Config:            return "config";
  }
  return "unknown";
}

// Transport and timeout failures may succeed on a later attempt; every
// other kind is terminal for the operation that raised it.
inline bool is_retryable(ErrorKind k) {
  return k == ErrorKind::Transport || k == ErrorKind::Timeout;
}

class IndexerError : public std::runtime_error {
public:
  IndexerError(ErrorKind kind, const std::string& what)
    : std::runtime_error(what), kind_(kind) {}

  ErrorKind kind() const noexcept { return kind_; }
  bool retryable() const noexcept { return is_retryable(kind_); }

private:
  ErrorKind kind_;
};

} // namespace sai
