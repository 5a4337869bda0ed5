#include "network/http_network_client.hpp"
#include "utilities/encoding.hpp"
#include "utilities/errors.hpp"
#include "utilities/logger.h"

#include <cmath>

namespace arloader {

namespace {

uint64_t parseU64(const std::string &body, ErrorKind kind,
                  const std::string &what) {
  try {
    auto j = nlohmann::json::parse(trim(body));
    if (j.is_number_unsigned())
      return j.get<uint64_t>();
    if (j.is_string())
      return std::stoull(j.get<std::string>());
  } catch (const std::exception &e) {
    throwError(kind, what + ": " + e.what());
  }
  throwError(kind, what + ": unexpected body \"" + body + "\"");
}

} // namespace

HttpNetworkClient::HttpNetworkClient(const std::string &baseUrl,
                                     const std::string &oracleUrl,
                                     std::string userAgent)
    : base_(HTTP::ParseURL(baseUrl)), oracleUrl_(oracleUrl),
      client_(std::move(userAgent)) {}

HTTP::HTTPRESPONSE HttpNetworkClient::get(const std::string &path) const {
  return client_.get(base_.join(path));
}

uint64_t HttpNetworkClient::getPrice(uint64_t bytes) {
  HTTP::HTTPRESPONSE response;
  try {
    response = get("price/" + std::to_string(bytes));
  } catch (const Error &e) {
    throwError(ErrorKind::GetPrice, e.what());
  }
  if (response.statusCodeNumber != 200) {
    throwError(ErrorKind::GetPrice,
               "price endpoint answered " +
                   std::to_string(response.statusCodeNumber));
  }
  return parseU64(response.body, ErrorKind::GetPrice, "price");
}

uint64_t HttpNetworkClient::getWalletBalance(const std::string &address) {
  auto response = get("wallet/" + address + "/balance");
  if (response.statusCodeNumber != 200) {
    throwError(ErrorKind::Http, "balance endpoint answered " +
                                    std::to_string(response.statusCodeNumber));
  }
  return parseU64(response.body, ErrorKind::Http, "balance");
}

Bytes HttpNetworkClient::getTxAnchor() {
  auto response = get("tx_anchor");
  if (response.statusCodeNumber != 200) {
    throwError(ErrorKind::Http, "tx_anchor answered " +
                                    std::to_string(response.statusCodeNumber));
  }
  return b64_decode(trim(response.body));
}

Transaction HttpNetworkClient::getTransaction(const Bytes &id) {
  auto response = get("tx/" + b64_encode(id));
  if (response.statusCodeNumber != 200) {
    throwError(ErrorKind::Http, "tx/" + b64_encode(id) + " answered " +
                                    std::to_string(response.statusCodeNumber));
  }
  try {
    return Transaction::fromJson(nlohmann::json::parse(response.body));
  } catch (const nlohmann::json::exception &e) {
    throwError(ErrorKind::Json, e.what());
  }
}

NetworkStatus HttpNetworkClient::statusFromResponse(int code,
                                                    const std::string &body) {
  NetworkStatus status;
  switch (code) {
  case 200:
    if (trim(body) == "Pending") {
      status.code = StatusCode::Pending;
    } else {
      try {
        status.raw = nlohmann::json::parse(body).get<RawStatus>();
      } catch (const nlohmann::json::exception &e) {
        throwError(ErrorKind::Json, std::string("raw status: ") + e.what());
      }
      status.code = StatusCode::Confirmed;
    }
    break;
  case 202:
    status.code = StatusCode::Pending;
    break;
  case 404:
    status.code = StatusCode::NotFound;
    break;
  default:
    throwError(ErrorKind::Http,
               "status endpoint answered " + std::to_string(code));
  }
  return status;
}

NetworkStatus HttpNetworkClient::getStatus(const Bytes &id) {
  auto response = get("tx/" + b64_encode(id) + "/status");
  return statusFromResponse(response.statusCodeNumber, response.body);
}

std::vector<std::string> HttpNetworkClient::getPending() {
  auto response = get("tx/pending");
  if (response.statusCodeNumber != 200) {
    throwError(ErrorKind::Http, "tx/pending answered " +
                                    std::to_string(response.statusCodeNumber));
  }
  try {
    return nlohmann::json::parse(response.body).get<std::vector<std::string>>();
  } catch (const nlohmann::json::exception &e) {
    throwError(ErrorKind::Json, e.what());
  }
}

void HttpNetworkClient::postTransaction(const Transaction &tx,
                                        bool includeData) {
  if (!tx.isSigned())
    throwError(ErrorKind::UnsignedTransaction);
  auto response =
      client_.postJson(base_.join("tx/"), tx.toJson(includeData).dump());
  Logger::getInstance().log(LogLevel::DEBUG,
                            "post_transaction " + b64_encode(tx.id) + " -> " +
                                std::to_string(response.statusCodeNumber));
  if (response.statusCodeNumber != 200) {
    throwError(ErrorKind::Post, "tx " + b64_encode(tx.id) + " answered " +
                                    std::to_string(response.statusCodeNumber) +
                                    " " + response.body);
  }
}

void HttpNetworkClient::postChunk(const ChunkPayload &chunk) {
  auto response = client_.postJson(base_.join("chunk/"), chunk.toJson().dump());
  if (response.statusCodeNumber != 200) {
    throwError(ErrorKind::Post, "chunk at offset " +
                                    std::to_string(chunk.offset) +
                                    " answered " +
                                    std::to_string(response.statusCodeNumber));
  }
}

OraclePrices HttpNetworkClient::getOraclePrices() {
  try {
    auto response = client_.get(HTTP::ParseURL(oracleUrl_));
    if (response.statusCodeNumber != 200) {
      throwError(ErrorKind::OraclePrice,
                 "oracle answered " + std::to_string(response.statusCodeNumber));
    }
    auto j = nlohmann::json::parse(response.body);
    OraclePrices prices;
    prices.usdCentsPerAr = static_cast<uint64_t>(
        std::floor(j.at("arweave").at("usd").get<double>() * 100.0));
    prices.usdCentsPerSol = static_cast<uint64_t>(
        std::floor(j.at("solana").at("usd").get<double>() * 100.0));
    return prices;
  } catch (const nlohmann::json::exception &e) {
    throwError(ErrorKind::OraclePrice, e.what());
  } catch (const Error &e) {
    if (e.kind() == ErrorKind::OraclePrice)
      throw;
    throwError(ErrorKind::OraclePrice, e.what());
  }
}

} // namespace arloader
