#include "payment/co_signer.hpp"
#include "utilities/encoding.hpp"
#include "utilities/errors.hpp"
#include "utilities/logger.h"

namespace arloader {

void to_json(nlohmann::json &j, const SigResponse &response) {
  j = nlohmann::json{{"ar_tx_sig", b64_encode(response.arTxSig)},
                     {"ar_tx_id", b64_encode(response.arTxId)},
                     {"ar_tx_owner", b64_encode(response.arTxOwner)},
                     {"sol_tx_sig", response.solTxSig},
                     {"lamports", response.lamports}};
}

void from_json(const nlohmann::json &j, SigResponse &response) {
  response.arTxSig = b64_decode(j.at("ar_tx_sig").get<std::string>());
  response.arTxId = b64_decode(j.at("ar_tx_id").get<std::string>());
  response.arTxOwner = b64_decode(j.at("ar_tx_owner").get<std::string>());
  response.solTxSig = j.at("sol_tx_sig").get<std::string>();
  response.lamports = j.at("lamports").get<uint64_t>();
}

HttpCoSigner::HttpCoSigner(const std::string &url, std::string userAgent)
    : url_(HTTP::ParseURL(url)), client_(std::move(userAgent)) {}

SigResponse HttpCoSigner::coSign(const DeepHashItem &item,
                                 const std::string &paymentTx) {
  nlohmann::json body{{"deep_hash_item", item}, {"sol_tx", paymentTx}};
  HTTP::HTTPRESPONSE response;
  try {
    response = client_.postJson(url_, body.dump());
  } catch (const Error &e) {
    throwError(ErrorKind::CoSignerError, e.what());
  }
  if (response.statusCodeNumber != 200) {
    throwError(ErrorKind::CoSignerError,
               "co-signer answered " +
                   std::to_string(response.statusCodeNumber) + ": " +
                   response.body);
  }
  try {
    SigResponse sig = nlohmann::json::parse(response.body).get<SigResponse>();
    Logger::getInstance().log(LogLevel::DEBUG,
                              "co-signed transaction " + b64_encode(sig.arTxId) +
                                  " for " + std::to_string(sig.lamports) +
                                  " lamports");
    return sig;
  } catch (const nlohmann::json::exception &e) {
    throwError(ErrorKind::CoSignerError,
               std::string("bad co-signer response: ") + e.what());
  } catch (const Error &e) {
    throwError(ErrorKind::CoSignerError, e.what());
  }
}

} // namespace arloader
