#pragma once
#include <chrono>
#include <string>

#include <nlohmann/json_fwd.hpp>

#include "core/ledger/LedgerClient.hpp"

namespace sai {

// keccak256("AttestationMade(bytes32,address,address)")
inline constexpr const char* kAttestationMadeTopic =
  "0x8801ef8bf38d81927148638c673d641b12c9d06ccaea4bc22d822f72e841e323";
// bytes4(keccak256("getAttestation(bytes32)"))
inline constexpr const char* kGetAttestationSelector = "a3112a64";

// LedgerClient over Ethereum JSON-RPC (HTTP POST).
class EthRpcLedgerClient : public LedgerClient {
public:
  EthRpcLedgerClient(const std::string& rpcUrl,
                     std::string contractAddress,
                     std::chrono::seconds timeout);

  uint64_t currentHead() override;
  std::vector<AttestationEvent> filterEvents(uint64_t from, uint64_t to) override;
  std::vector<AttestationEvent> queryEvents(uint64_t from, uint64_t to) override;
  std::optional<Attestation> resolveAttestation(const std::string& uid) override;

private:
  nlohmann::json call(const std::string& method, const nlohmann::json& params);
  nlohmann::json logFilter(uint64_t from, uint64_t to) const;
  std::vector<AttestationEvent> decodeLogs(const nlohmann::json& logs) const;

  std::string baseUrl_;   // scheme://host[:port]
  std::string path_;      // request path, "/" when the URL has none
  std::string contract_;
  std::chrono::seconds timeout_;
  uint64_t nextId_ = 1;
};

} // namespace sai
