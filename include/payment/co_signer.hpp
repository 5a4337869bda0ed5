#ifndef ARLOADER_CO_SIGNER_HPP
#define ARLOADER_CO_SIGNER_HPP

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

#include "crypto/deep_hash.hpp"
#include "utilities/http.hpp"

namespace arloader {

/// Signature material returned by the co-signer for a paid transaction.
struct SigResponse {
  Bytes arTxSig;
  Bytes arTxId;
  Bytes arTxOwner;
  std::string solTxSig;
  uint64_t lamports{0};

  bool operator==(const SigResponse &other) const = default;
};

void to_json(nlohmann::json &j, const SigResponse &response);
void from_json(const nlohmann::json &j, SigResponse &response);

/**
 * @brief Service that signs an upload transaction from a shared wallet
 * in exchange for a payment on the secondary chain.
 */
class CoSigner {
public:
  virtual ~CoSigner() = default;

  /**
   * @param item deep-hash input of the transaction to sign.
   * @param paymentTx base58 encoded, signed payment transaction.
   * @throws Error(CoSignerError)
   */
  virtual SigResponse coSign(const DeepHashItem &item,
                             const std::string &paymentTx) = 0;
};

/// CoSigner that posts {deep_hash_item, sol_tx} as JSON to a URL.
class HttpCoSigner : public CoSigner {
public:
  HttpCoSigner(const std::string &url, std::string userAgent);

  SigResponse coSign(const DeepHashItem &item,
                     const std::string &paymentTx) override;

private:
  HTTP::URL url_;
  HTTP::HttpClient client_;
};

} // namespace arloader

#endif // ARLOADER_CO_SIGNER_HPP
