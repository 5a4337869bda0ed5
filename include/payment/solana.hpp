#ifndef ARLOADER_SOLANA_HPP
#define ARLOADER_SOLANA_HPP

#include <array>
#include <cstdint>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>

#include "utilities/digest.hpp"
#include "utilities/http.hpp"

namespace arloader {

/// Account that receives payments for co-signed uploads.
inline constexpr const char *SOL_AR_PUBKEY =
    "6AaM5L2SeA7ciwDNaYLhKqQzsDVaQM9CRqXVDdWPeAQ9";

/**
 * @brief Secondary chain used to pay for co-signed uploads.
 */
class PaymentChain {
public:
  virtual ~PaymentChain() = default;

  /**
   * @brief Builds and signs a transfer of @p lamports to the co-signer.
   * @return base58 text of the serialized transaction.
   * @throws Error(InsufficientFunds) when the balance is too low.
   */
  virtual std::string createPayment(uint64_t lamports) = 0;
};

/// ed25519 keypair in the 64-byte secret || public layout.
struct SolanaKeypair {
  std::array<uint8_t, 64> secret{};

  ByteView publicKey() const { return ByteView(secret).subspan(32, 32); }

  /**
   * @brief Reads a JSON array of 64 byte values.
   * @throws Error(Io) or Error(KeyRejected)
   */
  static SolanaKeypair fromFile(const std::filesystem::path &path);
};

/**
 * @brief Serializes a signed legacy system-program transfer.
 *
 * Layout: compact-u16 signature count, signature, then the message
 * (header [1,0,1], keys [from, to, system program], recent blockhash, one
 * instruction with data u32 2 || u64 lamports, all little endian).
 */
Bytes buildTransferTransaction(const SolanaKeypair &from, ByteView to,
                               uint64_t lamports, ByteView recentBlockhash);

/// JSON-RPC client for the payment chain.
class SolanaClient : public PaymentChain {
public:
  SolanaClient(const std::string &rpcUrl, SolanaKeypair keypair,
               std::string userAgent);

  Bytes getRecentBlockhash();
  uint64_t getBalance();

  std::string createPayment(uint64_t lamports) override;

private:
  nlohmann::json call(const std::string &method, nlohmann::json params);

  HTTP::URL url_;
  SolanaKeypair keypair_;
  HTTP::HttpClient client_;
};

} // namespace arloader

#endif // ARLOADER_SOLANA_HPP
