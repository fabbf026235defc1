#include <gtest/gtest.h>

#include <algorithm>
#include <cctype>

#include "TestSupport.hpp"
#include "core/ingest/BundleVerifier.hpp"

using namespace sai;
using namespace sai::test;
using nlohmann::json;

class BundleVerifierTest : public ::testing::Test {
protected:
  FakeContentStore content;
  BundleVerifier verifier{content, 1024 * 1024};
};

TEST_F(BundleVerifierTest, VerifiesMatchingBundle) {
  const std::string root = content.addBundle("bafyABC", three_record_stream());

  FetchOutcome out = verifier.fetch("bafyABC", root);
  ASSERT_TRUE(out.ok()) << out.error().message;
  EXPECT_EQ(out.bundle().records.size(), 3u);
  EXPECT_EQ(out.bundle().scanprint_root, root);
  EXPECT_EQ(out.bundle().manifest.tool, "nmap");
  EXPECT_EQ(out.bundle().manifest_sha256, sha256_hex(content.files["bafyABC/manifest.json"]));
}

TEST_F(BundleVerifierTest, AttestedRootComparisonIgnoresCase) {
  std::string root = content.addBundle("bafyABC", three_record_stream());
  std::transform(root.begin() + 2, root.end(), root.begin() + 2, ::toupper);
  EXPECT_TRUE(verifier.fetch("bafyABC", root).ok());
}

TEST_F(BundleVerifierTest, UnattestedRootIsAccepted) {
  content.addBundle("bafyABC", three_record_stream());
  EXPECT_TRUE(verifier.fetch("bafyABC").ok());
}

TEST_F(BundleVerifierTest, AttestedRootMismatchRejects) {
  content.addBundle("bafyABC", three_record_stream());
  const std::string wrong = "0x" + std::string(64, 'd');

  FetchOutcome out = verifier.fetch("bafyABC", wrong);
  ASSERT_FALSE(out.ok());
  EXPECT_EQ(out.error().kind, ErrorKind::IntegrityMismatch);
  EXPECT_FALSE(out.error().retryable());
  EXPECT_NE(out.error().message.find("integrity mismatch"), std::string::npos);
}

TEST_F(BundleVerifierTest, ManifestRootMismatchRejects) {
  content.addBundle("bafyABC", three_record_stream(), "0x" + std::string(64, 'e'));
  FetchOutcome out = verifier.fetch("bafyABC");
  ASSERT_FALSE(out.ok());
  EXPECT_EQ(out.error().kind, ErrorKind::IntegrityMismatch);
}

TEST_F(BundleVerifierTest, TamperedStreamRejects) {
  const std::string root = content.addBundle("bafyABC", three_record_stream());
  std::string& stream = content.files["bafyABC/scans.jsonl"];
  stream[stream.find("10.0.0.2")] = '9';

  FetchOutcome out = verifier.fetch("bafyABC", root);
  ASSERT_FALSE(out.ok());
  EXPECT_EQ(out.error().kind, ErrorKind::IntegrityMismatch);
}

TEST_F(BundleVerifierTest, ManifestDigestMismatchRejects) {
  content.addBundle("bafyABC", three_record_stream());
  FetchOutcome out = verifier.fetch("bafyABC", "", std::string(64, 'a'));
  ASSERT_FALSE(out.ok());
  EXPECT_EQ(out.error().kind, ErrorKind::IntegrityMismatch);
  EXPECT_NE(out.error().message.find("manifest sha256"), std::string::npos);

  const std::string good = sha256_hex(content.files["bafyABC/manifest.json"]);
  EXPECT_TRUE(verifier.fetch("bafyABC", "", good).ok());
}

TEST_F(BundleVerifierTest, NonDirectoryIsNotABundle) {
  content.files["bafyFILE"] = "plain bytes";
  FetchOutcome out = verifier.fetch("bafyFILE");
  ASSERT_FALSE(out.ok());
  EXPECT_EQ(out.error().kind, ErrorKind::NotABundle);

  content.dirs["bafyEMPTY"] = 0;
  EXPECT_EQ(verifier.fetch("bafyEMPTY").error().kind, ErrorKind::NotABundle);
}

TEST_F(BundleVerifierTest, MissingContentIsNotRetryable) {
  FetchOutcome out = verifier.fetch("bafyGONE");
  ASSERT_FALSE(out.ok());
  EXPECT_EQ(out.error().kind, ErrorKind::NotFound);
  EXPECT_FALSE(out.error().retryable());
}

TEST_F(BundleVerifierTest, TransportFailureIsRetryable) {
  content.addBundle("bafyABC", three_record_stream());
  content.transientFailures = 1;
  FetchOutcome out = verifier.fetch("bafyABC");
  ASSERT_FALSE(out.ok());
  EXPECT_TRUE(out.error().retryable());
  EXPECT_TRUE(verifier.fetch("bafyABC").ok());
}

TEST_F(BundleVerifierTest, OversizedStreamRejects) {
  content.addBundle("bafyABC", three_record_stream());
  BundleVerifier small(content, content.files["bafyABC/manifest.json"].size());
  FetchOutcome out = small.fetch("bafyABC");
  ASSERT_FALSE(out.ok());
  EXPECT_EQ(out.error().kind, ErrorKind::TooLarge);
}

TEST_F(BundleVerifierTest, MalformedRecordRejectsWholeBundle) {
  content.addBundle("bafyABC", three_record_stream() + "{\"ip\": 5}\n");
  FetchOutcome out = verifier.fetch("bafyABC");
  ASSERT_FALSE(out.ok());
  EXPECT_EQ(out.error().kind, ErrorKind::MalformedRecords);
}

TEST_F(BundleVerifierTest, MalformedManifestRejects) {
  content.addBundle("bafyABC", three_record_stream());
  content.files["bafyABC/manifest.json"] = "{\"schema\": 1}";
  FetchOutcome out = verifier.fetch("bafyABC");
  ASSERT_FALSE(out.ok());
  EXPECT_EQ(out.error().kind, ErrorKind::MalformedManifest);
}

TEST_F(BundleVerifierTest, ArtifactsAreBestEffort) {
  content.addBundle("bafyABC", three_record_stream());
  json artifacts = json::array({
    {{"path", "raw/good.xml"}, {"sha256", sha256_hex("<xml/>")}},
    {{"path", "raw/bad.xml"}, {"sha256", std::string(64, '0')}},
    {{"path", "raw/missing.xml"}}
  });
  content.files["bafyABC/manifest.json"] = manifest_json("scans.jsonl", "", artifacts);
  content.files["bafyABC/raw/good.xml"] = "<xml/>";
  content.files["bafyABC/raw/bad.xml"] = "<tampered/>";

  FetchOutcome out = verifier.fetch("bafyABC");
  ASSERT_TRUE(out.ok()) << out.error().message;
  EXPECT_EQ(out.bundle().artifacts.size(), 1u);
  EXPECT_EQ(out.bundle().artifacts.count("raw/good.xml"), 1u);
}
