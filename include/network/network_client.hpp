#ifndef ARLOADER_NETWORK_CLIENT_HPP
#define ARLOADER_NETWORK_CLIENT_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "status/status.hpp"
#include "transaction/pricing.hpp"
#include "transaction/transaction.hpp"

namespace arloader {

/// Result of GET /tx/{id}/status.
struct NetworkStatus {
  StatusCode code{StatusCode::NotFound};
  std::optional<RawStatus> raw;
};

/**
 * @brief Operations the uploader needs from the storage network.
 *
 * Implementations must be callable from several upload workers at once.
 */
class NetworkClient {
public:
  virtual ~NetworkClient() = default;

  /// GET /price/{bytes}; throws Error(GetPrice).
  virtual uint64_t getPrice(uint64_t bytes) = 0;
  /// GET /wallet/{address}/balance in winstons.
  virtual uint64_t getWalletBalance(const std::string &address) = 0;
  /// GET /tx_anchor
  virtual Bytes getTxAnchor() = 0;
  /// GET /tx/{id}
  virtual Transaction getTransaction(const Bytes &id) = 0;
  /// GET /tx/{id}/status
  virtual NetworkStatus getStatus(const Bytes &id) = 0;
  /// GET /tx/pending
  virtual std::vector<std::string> getPending() = 0;
  /// POST /tx; throws Error(Post) on a non-200 answer.
  virtual void postTransaction(const Transaction &tx, bool includeData) = 0;
  /// POST /chunk; throws Error(Post) on a non-200 answer.
  virtual void postChunk(const ChunkPayload &chunk) = 0;
  /// USD prices from the oracle; throws Error(OraclePrice).
  virtual OraclePrices getOraclePrices() = 0;
};

} // namespace arloader

#endif // ARLOADER_NETWORK_CLIENT_HPP
