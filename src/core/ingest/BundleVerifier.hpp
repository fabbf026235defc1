#pragma once
#include <cstddef>
#include <map>
#include <string>
#include <variant>
#include <vector>

#include "core/content/ContentStore.hpp"
#include "core/model/Types.hpp"
#include "core/util/Errors.hpp"

namespace sai {

struct VerifiedBundle {
  BundleManifest manifest;
  std::string    manifest_sha256;
  std::string    scanprint_root;     // recomputed, "0x"-prefixed
  std::vector<ScanRecord> records;
  std::map<std::string, std::string> artifacts;   // path -> bytes, best effort
};

struct BundleError {
  ErrorKind   kind;
  std::string message;

  bool retryable() const { return is_retryable(kind); }
};

// Either a verified bundle or the reason it was rejected.
class FetchOutcome {
public:
  static FetchOutcome success(VerifiedBundle b) { return FetchOutcome(std::move(b)); }
  static FetchOutcome failure(ErrorKind kind, std::string message) {
    return FetchOutcome(BundleError{kind, std::move(message)});
  }

  bool ok() const { return std::holds_alternative<VerifiedBundle>(v_); }
  const VerifiedBundle& bundle() const { return std::get<VerifiedBundle>(v_); }
  VerifiedBundle& bundle() { return std::get<VerifiedBundle>(v_); }
  const BundleError& error() const { return std::get<BundleError>(v_); }

private:
  explicit FetchOutcome(VerifiedBundle b) : v_(std::move(b)) {}
  explicit FetchOutcome(BundleError e) : v_(std::move(e)) {}

  std::variant<VerifiedBundle, BundleError> v_;
};

// Retrieves <cid>/manifest.json and the scanprint it names, re-derives the
// scanprint root and checks it against every attested root. No partial
// record sets: any malformed line rejects the bundle.
class BundleVerifier {
public:
  static constexpr const char* kManifestName = "manifest.json";

  BundleVerifier(ContentStore& store, size_t maxBundleSize);

  // attestedRoot / attestedManifestSha256 may be empty (not attested).
  FetchOutcome fetch(const std::string& cid,
                     const std::string& attestedRoot = std::string(),
                     const std::string& attestedManifestSha256 = std::string());

private:
  VerifiedBundle fetchOrThrow(const std::string& cid,
                              const std::string& attestedRoot,
                              const std::string& attestedManifestSha256);
  void fetchArtifacts(const std::string& cid, VerifiedBundle& bundle);

  ContentStore& store_;
  size_t maxBytes_;
};

} // namespace sai
