#ifndef ARLOADER_HTTP_NETWORK_CLIENT_HPP
#define ARLOADER_HTTP_NETWORK_CLIENT_HPP

#include <string>

#include "network/network_client.hpp"
#include "utilities/http.hpp"

namespace arloader {

/// NetworkClient speaking JSON over HTTP/1.1 to a gateway.
class HttpNetworkClient : public NetworkClient {
public:
  HttpNetworkClient(const std::string &baseUrl, const std::string &oracleUrl,
                    std::string userAgent);

  uint64_t getPrice(uint64_t bytes) override;
  uint64_t getWalletBalance(const std::string &address) override;
  Bytes getTxAnchor() override;
  Transaction getTransaction(const Bytes &id) override;
  NetworkStatus getStatus(const Bytes &id) override;
  std::vector<std::string> getPending() override;
  void postTransaction(const Transaction &tx, bool includeData) override;
  void postChunk(const ChunkPayload &chunk) override;
  OraclePrices getOraclePrices() override;

  /**
   * @brief Maps a /tx/{id}/status answer to a NetworkStatus.
   *
   * 200 "Pending" and 202 are Pending, other 200 bodies are Confirmed with
   * raw details, 404 is NotFound.
   * @throws Error(Http) for any other code.
   */
  static NetworkStatus statusFromResponse(int code, const std::string &body);

private:
  HTTP::HTTPRESPONSE get(const std::string &path) const;

  HTTP::URL base_;
  std::string oracleUrl_;
  HTTP::HttpClient client_;
};

} // namespace arloader

#endif // ARLOADER_HTTP_NETWORK_CLIENT_HPP
