#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "core/model/Types.hpp"

namespace sai {

// Read side of the attestation ledger. Implementations throw IndexerError:
// RangeUnavailable when the requested positions are not (yet) served,
// Transport/Timeout for everything that may clear up on retry.
class LedgerClient {
public:
  virtual ~LedgerClient() = default;

  virtual uint64_t currentHead() = 0;

  // Push-style path: events captured by an installed filter over [from, to].
  virtual std::vector<AttestationEvent> filterEvents(uint64_t from, uint64_t to) = 0;

  // Direct range query over [from, to]; the source of truth.
  virtual std::vector<AttestationEvent> queryEvents(uint64_t from, uint64_t to) = 0;

  // nullopt when the ledger has no attestation under uid.
  virtual std::optional<Attestation> resolveAttestation(const std::string& uid) = 0;
};

} // namespace sai
