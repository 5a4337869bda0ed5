#ifndef ARLOADER_SIGNER_HPP
#define ARLOADER_SIGNER_HPP

#include <filesystem>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

#include "utilities/digest.hpp"

typedef struct evp_pkey_st EVP_PKEY;

namespace arloader {

/// RSA-4096 modulus and signature length in bytes.
inline constexpr size_t RSA_MODULUS_SIZE = 512;

/**
 * @brief Signing capability shared read-only by upload tasks.
 *
 * Implementations must be safe to call concurrently.
 */
class Signer {
public:
  virtual ~Signer() = default;

  /// RSA-PSS-SHA256 signature over @p message (512 bytes).
  virtual Bytes sign(ByteView message) const = 0;

  /// Big-endian public modulus, left padded to 512 bytes.
  virtual Bytes publicModulus() const = 0;

  /// base64url(SHA256(modulus)).
  std::string walletAddress() const;
};

/**
 * @brief Verifies an RSA-PSS-SHA256 signature made by the owner of the
 * public modulus @p owner (exponent 65537).
 */
bool verifySignature(ByteView owner, ByteView message, ByteView signature);

/**
 * @brief OpenSSL backed signer for an Arweave JWK wallet.
 */
class RsaSigner : public Signer {
public:
  using KeyPtr = std::unique_ptr<EVP_PKEY, void (*)(EVP_PKEY *)>;

  /// @p key must be a 4096-bit RSA private key.
  explicit RsaSigner(KeyPtr key);
  ~RsaSigner() override;

  RsaSigner(const RsaSigner &) = delete;
  RsaSigner &operator=(const RsaSigner &) = delete;

  /**
   * @brief Loads a JWK ({"kty":"RSA","n","e","d","p","q","dp","dq","qi"}).
   * @throws Error(KeyRejected) for malformed or unsupported keys,
   *         Error(Io) when the file cannot be read.
   */
  static std::unique_ptr<RsaSigner> fromJwkFile(const std::filesystem::path &path);
  static std::unique_ptr<RsaSigner> fromJwk(const nlohmann::json &jwk);

  Bytes sign(ByteView message) const override;
  Bytes publicModulus() const override;

private:
  KeyPtr key_;
  Bytes modulus_;
};

} // namespace arloader

#endif // ARLOADER_SIGNER_HPP
