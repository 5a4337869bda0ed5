#include "payment/solana.hpp"
#include "utilities/encoding.hpp"
#include "utilities/errors.hpp"
#include "utilities/logger.h"

#include <fstream>
#include <nlohmann/json.hpp>
#include <sodium.h>

namespace arloader {

namespace {

void putCompactU16(Bytes &out, uint16_t value) {
  while (value >= 0x80) {
    out.push_back(static_cast<uint8_t>((value & 0x7f) | 0x80));
    value >>= 7;
  }
  out.push_back(static_cast<uint8_t>(value));
}

void putLe(Bytes &out, uint64_t value, size_t width) {
  for (size_t i = 0; i < width; ++i)
    out.push_back(static_cast<uint8_t>(value >> (8 * i)));
}

constexpr uint32_t SYSTEM_TRANSFER = 2;

} // namespace

SolanaKeypair SolanaKeypair::fromFile(const std::filesystem::path &path) {
  std::ifstream in(path);
  if (!in)
    throwError(ErrorKind::Io, "cannot open keypair " + path.string());
  std::vector<int> values;
  try {
    values = nlohmann::json::parse(in).get<std::vector<int>>();
  } catch (const nlohmann::json::exception &e) {
    throwError(ErrorKind::KeyRejected, path.string() + ": " + e.what());
  }
  SolanaKeypair keypair;
  if (values.size() != keypair.secret.size())
    throwError(ErrorKind::KeyRejected, "keypair must hold 64 bytes");
  for (size_t i = 0; i < values.size(); ++i) {
    if (values[i] < 0 || values[i] > 255)
      throwError(ErrorKind::KeyRejected, "keypair byte out of range");
    keypair.secret[i] = static_cast<uint8_t>(values[i]);
  }
  return keypair;
}

Bytes buildTransferTransaction(const SolanaKeypair &from, ByteView to,
                               uint64_t lamports, ByteView recentBlockhash) {
  if (to.size() != 32 || recentBlockhash.size() != 32)
    throwError(ErrorKind::InvalidHash, "payment keys and blockhash are 32 bytes");
  if (sodium_init() < 0)
    throwError(ErrorKind::SigningFailed, "libsodium initialisation failed");

  Bytes message;
  message.insert(message.end(), {1, 0, 1});
  putCompactU16(message, 3);
  auto fromKey = from.publicKey();
  message.insert(message.end(), fromKey.begin(), fromKey.end());
  message.insert(message.end(), to.begin(), to.end());
  message.insert(message.end(), 32, 0); // system program
  message.insert(message.end(), recentBlockhash.begin(), recentBlockhash.end());
  putCompactU16(message, 1);
  message.push_back(2);
  putCompactU16(message, 2);
  message.insert(message.end(), {0, 1});
  putCompactU16(message, 12);
  putLe(message, SYSTEM_TRANSFER, 4);
  putLe(message, lamports, 8);

  std::array<uint8_t, crypto_sign_BYTES> signature{};
  if (crypto_sign_detached(signature.data(), nullptr, message.data(),
                           message.size(), from.secret.data()) != 0) {
    throwError(ErrorKind::SigningFailed, "ed25519 signing failed");
  }

  Bytes tx;
  tx.reserve(1 + signature.size() + message.size());
  putCompactU16(tx, 1);
  tx.insert(tx.end(), signature.begin(), signature.end());
  tx.insert(tx.end(), message.begin(), message.end());
  return tx;
}

SolanaClient::SolanaClient(const std::string &rpcUrl, SolanaKeypair keypair,
                           std::string userAgent)
    : url_(HTTP::ParseURL(rpcUrl)), keypair_(keypair),
      client_(std::move(userAgent)) {}

nlohmann::json SolanaClient::call(const std::string &method,
                                  nlohmann::json params) {
  nlohmann::json request{{"jsonrpc", "2.0"},
                         {"id", 1},
                         {"method", method},
                         {"params", std::move(params)}};
  auto response = client_.postJson(url_, request.dump());
  if (response.statusCodeNumber != 200) {
    throwError(ErrorKind::Http, method + " answered " +
                                    std::to_string(response.statusCodeNumber));
  }
  try {
    auto j = nlohmann::json::parse(response.body);
    if (j.contains("error"))
      throwError(ErrorKind::Http, method + ": " + j["error"].dump());
    return j.at("result");
  } catch (const nlohmann::json::exception &e) {
    throwError(ErrorKind::Json, method + ": " + e.what());
  }
}

Bytes SolanaClient::getRecentBlockhash() {
  auto result = call("getRecentBlockhash", nlohmann::json::array());
  try {
    return b58_decode(result.at("value").at("blockhash").get<std::string>());
  } catch (const nlohmann::json::exception &e) {
    throwError(ErrorKind::Json, std::string("blockhash: ") + e.what());
  }
}

uint64_t SolanaClient::getBalance() {
  auto result = call("getBalance", nlohmann::json::array(
                                       {b58_encode(keypair_.publicKey())}));
  try {
    return result.at("value").get<uint64_t>();
  } catch (const nlohmann::json::exception &e) {
    throwError(ErrorKind::Json, std::string("balance: ") + e.what());
  }
}

std::string SolanaClient::createPayment(uint64_t lamports) {
  Bytes blockhash = getRecentBlockhash();
  uint64_t balance = getBalance();
  if (balance < lamports) {
    throwError(ErrorKind::InsufficientFunds,
               "balance of " + std::to_string(balance) +
                   " lamports is below " + std::to_string(lamports));
  }
  Bytes to = b58_decode(SOL_AR_PUBKEY);
  Bytes tx = buildTransferTransaction(keypair_, to, lamports, blockhash);
  Logger::getInstance().log(LogLevel::DEBUG,
                            "created payment of " + std::to_string(lamports) +
                                " lamports");
  return b58_encode(tx);
}

} // namespace arloader
