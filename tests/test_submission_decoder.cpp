#include <gtest/gtest.h>

#include <cctype>

#include "TestSupport.hpp"

using namespace sai;
using namespace sai::test;

namespace {

Attestation attestation_with(const std::string& schema, const std::string& data) {
  Attestation a;
  a.uid = uid_of(1);
  a.schema_uid = schema;
  a.attester = kAttester;
  a.timestamp = 1700000700;
  a.data = data;
  return a;
}

} // namespace

TEST(SubmissionDecoderTest, DecodesScanPayload) {
  ScanSubmissionPayload in = sample_payload("bafyABC", "0x" + std::string(64, 'c'));
  in.manifest_sha256 = std::string(64, 'f');
  SubmissionDecoder decoder(kScanSchema);

  const DecodeResult r = decoder.decode(attestation_with(kScanSchema, encode_payload(in)));
  ASSERT_TRUE(std::holds_alternative<ScanSubmissionPayload>(r));
  const auto& p = std::get<ScanSubmissionPayload>(r);
  EXPECT_EQ(p.job_id, in.job_id);
  EXPECT_EQ(p.cid, "bafyABC");
  EXPECT_EQ(p.merkle_root, in.merkle_root);
  EXPECT_EQ(p.target_spec_cid, "bafyTARGETS");
  EXPECT_EQ(p.started_at, 1700000000);
  EXPECT_EQ(p.finished_at, 1700000600);
  EXPECT_EQ(p.tool, "nmap");
  EXPECT_EQ(p.tool_version, "7.94");
  EXPECT_EQ(p.vantage, "eu-west");
  EXPECT_EQ(p.manifest_sha256, std::string(64, 'f'));
  EXPECT_EQ(p.namespace_name, "acme");
  EXPECT_EQ(p.dataset_type, "port-scan");
}

TEST(SubmissionDecoderTest, ZeroDigestsDecodeAsEmpty) {
  SubmissionDecoder decoder(kScanSchema);
  const DecodeResult r = decoder.decode(attestation_with(kScanSchema, encode_payload(sample_payload(""))));
  ASSERT_TRUE(std::holds_alternative<ScanSubmissionPayload>(r));
  EXPECT_EQ(std::get<ScanSubmissionPayload>(r).merkle_root, "");
  EXPECT_EQ(std::get<ScanSubmissionPayload>(r).manifest_sha256, "");
  EXPECT_EQ(std::get<ScanSubmissionPayload>(r).cid, "");
}

TEST(SubmissionDecoderTest, OtherSchemaIsUnrecognized) {
  SubmissionDecoder decoder(kScanSchema);
  const DecodeResult r = decoder.decode(attestation_with(kOtherSchema, encode_payload(sample_payload("x"))));
  ASSERT_TRUE(std::holds_alternative<UnrecognizedSchema>(r));
  EXPECT_EQ(std::get<UnrecognizedSchema>(r).schema_uid, kOtherSchema);
}

TEST(SubmissionDecoderTest, SchemaMatchIgnoresCase) {
  std::string upper = kScanSchema;
  for (size_t i = 2; i < upper.size(); ++i) upper[i] = static_cast<char>(::toupper(upper[i]));
  SubmissionDecoder decoder(upper);
  EXPECT_TRUE(std::holds_alternative<ScanSubmissionPayload>(
    decoder.decode(attestation_with(kScanSchema, encode_payload(sample_payload("x"))))));
}

TEST(SubmissionDecoderTest, TruncatedPayloadIsDecodeError) {
  SubmissionDecoder decoder(kScanSchema);
  std::string data = encode_payload(sample_payload("bafyABC"));
  data.resize(5 * 32);
  const DecodeResult r = decoder.decode(attestation_with(kScanSchema, data));
  ASSERT_TRUE(std::holds_alternative<DecodeError>(r));
  EXPECT_FALSE(std::get<DecodeError>(r).message.empty());
}

TEST(SubmissionDecoderTest, SkeletonAndApply) {
  const Attestation a = attestation_with(kScanSchema, "raw");
  AttestationEvent ev;
  ev.uid = uid_of(1);
  ev.block_number = 99;

  Submission s = SubmissionDecoder::skeleton(a, ev);
  EXPECT_EQ(s.uid, uid_of(1));
  EXPECT_EQ(s.submitter, kAttester);
  EXPECT_EQ(s.extra, "raw");
  EXPECT_EQ(s.timestamp, 1700000700);
  EXPECT_EQ(s.block_number, 99u);
  EXPECT_EQ(s.status, SubmissionStatus::Pending);

  SubmissionDecoder::apply(sample_payload("bafyABC"), s);
  EXPECT_EQ(s.cid, "bafyABC");
  EXPECT_EQ(s.version, "7.94");
  EXPECT_EQ(s.namespace_name, "acme");
}
