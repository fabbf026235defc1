#include "BundleVerifier.hpp"

#include <cctype>

#include <spdlog/spdlog.h>

#include "core/model/ModelJson.hpp"
#include "core/util/Hash.hpp"

namespace sai {

static std::string lower_hex(std::string s) {
  if (s.size() >= 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) s.erase(0, 2);
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

BundleVerifier::BundleVerifier(ContentStore& store, size_t maxBundleSize)
  : store_(store), maxBytes_(maxBundleSize) {}

FetchOutcome BundleVerifier::fetch(const std::string& cid,
                                   const std::string& attestedRoot,
                                   const std::string& attestedManifestSha256) {
  try {
    return FetchOutcome::success(fetchOrThrow(cid, attestedRoot, attestedManifestSha256));
  } catch (const IndexerError& e) {
    spdlog::error("bundle {} rejected ({}): {}", cid, to_string(e.kind()), e.what());
    return FetchOutcome::failure(e.kind(), e.what());
  }
}

VerifiedBundle BundleVerifier::fetchOrThrow(const std::string& cid,
                                            const std::string& attestedRoot,
                                            const std::string& attestedManifestSha256) {
  const ContentStat st = store_.stat(cid);
  if (!st.is_directory || st.child_count == 0) {
    throw IndexerError(ErrorKind::NotABundle, "not a bundle directory: " + cid);
  }

  VerifiedBundle b;
  const std::string manifestBytes = store_.fetch(cid + "/" + kManifestName, maxBytes_);
  b.manifest = parse_manifest(manifestBytes);
  b.manifest_sha256 = sha256_hex(manifestBytes);

  if (!attestedManifestSha256.empty() && lower_hex(attestedManifestSha256) != b.manifest_sha256) {
    throw IndexerError(ErrorKind::IntegrityMismatch,
                       "integrity mismatch: manifest sha256 " + b.manifest_sha256 +
                       ", attested " + attestedManifestSha256);
  }

  const std::string stream = store_.fetch(cid + "/" + b.manifest.scanprint_path, maxBytes_);
  b.records = parse_scanprint(stream);
  b.scanprint_root = scanprint_root(stream);

  for (const std::string& expected : {b.manifest.scanprint_root, attestedRoot}) {
    const std::string want = normalize_root(expected);
    if (want.empty()) continue;
    if (want != b.scanprint_root) {
      throw IndexerError(ErrorKind::IntegrityMismatch,
                         "integrity mismatch: expected root " + want + ", computed " +
                         (b.scanprint_root.empty() ? std::string("<empty>") : b.scanprint_root));
    }
  }

  fetchArtifacts(cid, b);
  spdlog::info("bundle {} verified: {} records, root {}", cid, b.records.size(), b.scanprint_root);
  return b;
}

void BundleVerifier::fetchArtifacts(const std::string& cid, VerifiedBundle& b) {
  for (const auto& a : b.manifest.artifacts) {
    if (a.path.empty() || a.path == b.manifest.scanprint_path) continue;
    try {
      std::string bytes = store_.fetch(cid + "/" + a.path, maxBytes_);
      if (!a.sha256.empty() && lower_hex(a.sha256) != sha256_hex(bytes)) {
        spdlog::warn("artifact {}/{} sha256 mismatch, dropped", cid, a.path);
        continue;
      }
      b.artifacts.emplace(a.path, std::move(bytes));
    } catch (const IndexerError& e) {
      spdlog::warn("artifact {}/{} unavailable: {}", cid, a.path, e.what());
    }
  }
}

} // namespace sai
