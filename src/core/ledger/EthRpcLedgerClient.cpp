#include "EthRpcLedgerClient.hpp"

#include <algorithm>
#include <cctype>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "core/ledger/Abi.hpp"
#include "core/util/Errors.hpp"
#include "core/util/Http.hpp"

using nlohmann::json;

namespace sai {

static std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

static std::string to_quantity(uint64_t v) {
  static const char* k = "0123456789abcdef";
  if (v == 0) return "0x0";
  std::string s;
  while (v) { s.insert(s.begin(), k[v & 0xf]); v >>= 4; }
  return "0x" + s;
}

// JSON-RPC codes that mean "this range/block is not served right now"
// (EIP-1474 resource not found / unavailable, geth "header not found").
static bool is_range_unavailable(int code, const std::string& message) {
  if (code == -32001 || code == -32002) return true;
  return code == -32000 && lower(message).find("not found") != std::string::npos;
}

EthRpcLedgerClient::EthRpcLedgerClient(const std::string& rpcUrl,
                                       std::string contractAddress,
                                       std::chrono::seconds timeout)
  : contract_(lower(std::move(contractAddress))), timeout_(timeout) {
  auto parts = split_url(rpcUrl);
  baseUrl_ = std::move(parts.first);
  path_ = std::move(parts.second);
}

json EthRpcLedgerClient::call(const std::string& method, const json& params) {
  httplib::Client cli(baseUrl_);
  apply_timeouts(cli, timeout_);

  const json req = {
    {"jsonrpc", "2.0"},
    {"id", nextId_++},
    {"method", method},
    {"params", params}
  };
  auto res = cli.Post(path_, req.dump(), "application/json");
  if (!res || res->status != 200) throw_http_failure(res, method);

  json body;
  try {
    body = json::parse(res->body);
  } catch (const json::exception& e) {
    throw IndexerError(ErrorKind::Transport, method + ": invalid JSON-RPC response: " + e.what());
  }

  if (auto it = body.find("error"); it != body.end() && !it->is_null()) {
    const int code = it->value("code", 0);
    const std::string message = it->value("message", std::string());
    if (is_range_unavailable(code, message)) {
      throw IndexerError(ErrorKind::RangeUnavailable, method + ": " + message);
    }
    throw IndexerError(ErrorKind::Transport,
                       method + ": rpc error " + std::to_string(code) + ": " + message);
  }
  auto it = body.find("result");
  return it == body.end() ? json() : *it;
}

json EthRpcLedgerClient::logFilter(uint64_t from, uint64_t to) const {
  return json{
    {"address", contract_},
    {"fromBlock", to_quantity(from)},
    {"toBlock", to_quantity(to)},
    {"topics", json::array({kAttestationMadeTopic})}
  };
}

std::vector<AttestationEvent> EthRpcLedgerClient::decodeLogs(const json& logs) const {
  std::vector<AttestationEvent> out;
  if (!logs.is_array()) return out;
  for (const auto& log : logs) {
    if (log.value("removed", false)) continue;
    const auto topics = log.value("topics", json::array());
    if (topics.size() < 4) {
      spdlog::warn("skipping log without indexed uid/attester/subject (tx {})",
                   log.value("transactionHash", std::string("?")));
      continue;
    }
    AttestationEvent ev;
    ev.uid          = lower(topics[1].get<std::string>());
    ev.attester     = "0x" + lower(topics[2].get<std::string>()).substr(26);
    ev.subject      = "0x" + lower(topics[3].get<std::string>()).substr(26);
    ev.block_number = hex_to_u64(log.value("blockNumber", std::string("0x0")));
    out.push_back(std::move(ev));
  }
  return out;
}

uint64_t EthRpcLedgerClient::currentHead() {
  const json r = call("eth_blockNumber", json::array());
  if (!r.is_string()) throw IndexerError(ErrorKind::Transport, "eth_blockNumber: unexpected result");
  return hex_to_u64(r.get<std::string>());
}

std::vector<AttestationEvent> EthRpcLedgerClient::filterEvents(uint64_t from, uint64_t to) {
  const json filterId = call("eth_newFilter", json::array({logFilter(from, to)}));
  auto uninstall = [&]() {
    try {
      call("eth_uninstallFilter", json::array({filterId}));
    } catch (const IndexerError& e) {
      spdlog::warn("eth_uninstallFilter failed: {}", e.what());
    }
  };
  std::vector<AttestationEvent> events;
  try {
    events = decodeLogs(call("eth_getFilterLogs", json::array({filterId})));
  } catch (...) {
    uninstall();
    throw;
  }
  uninstall();
  return events;
}

std::vector<AttestationEvent> EthRpcLedgerClient::queryEvents(uint64_t from, uint64_t to) {
  return decodeLogs(call("eth_getLogs", json::array({logFilter(from, to)})));
}

std::optional<Attestation> EthRpcLedgerClient::resolveAttestation(const std::string& uid) {
  std::string uidHex = lower(uid);
  if (uidHex.rfind("0x", 0) == 0) uidHex.erase(0, 2);
  if (uidHex.size() != 64) throw IndexerError(ErrorKind::Decode, "attestation uid must be 32 bytes: " + uid);

  const json tx = {
    {"to", contract_},
    {"data", std::string("0x") + kGetAttestationSelector + uidHex}
  };
  const json r = call("eth_call", json::array({tx, "latest"}));
  if (!r.is_string()) throw IndexerError(ErrorKind::Transport, "eth_call: unexpected result");

  const std::string raw = hex_to_bytes(r.get<std::string>());
  if (raw.empty()) return std::nullopt;

  // (bytes32 uid, address attester, address subject, bytes32 schema,
  //  uint64 time, uint64 expiration, bool revoked, bytes data)
  AbiReader abi(raw);
  if (abi.words() < 8) throw IndexerError(ErrorKind::Decode, "getAttestation result too short");
  if (abi.isZero(0)) return std::nullopt;

  Attestation a;
  a.uid             = abi.bytes32Hex(0);
  a.attester        = abi.address(1);
  a.subject         = abi.address(2);
  a.schema_uid      = abi.bytes32Hex(3);
  a.timestamp       = abi.uint64At(4);
  a.expiration_time = abi.uint64At(5);
  a.revoked         = abi.boolAt(6);
  a.data            = abi.dynamicBytes(7);
  return a;
}

} // namespace sai
