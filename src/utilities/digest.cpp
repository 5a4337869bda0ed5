#include "utilities/digest.hpp"
#include "utilities/errors.hpp"

#include "blake3.h"
#include <mutex>
#include <openssl/evp.h>
#include <sodium.h>

namespace arloader {

namespace {

void ensureSodium() {
  static std::once_flag flag;
  std::call_once(flag, [] {
    if (sodium_init() < 0) {
      throwError(ErrorKind::InvalidHash, "failed to initialize libsodium");
    }
  });
}

} // namespace

Sha256Digest sha256(ByteView data) {
  ensureSodium();
  Sha256Digest out{};
  crypto_hash_sha256(out.data(), data.data(), data.size());
  return out;
}

Sha256Digest sha256_all(std::initializer_list<ByteView> parts) {
  ensureSodium();
  crypto_hash_sha256_state state;
  crypto_hash_sha256_init(&state);
  for (const auto &part : parts) {
    Sha256Digest h = sha256(part);
    crypto_hash_sha256_update(&state, h.data(), h.size());
  }
  Sha256Digest out{};
  crypto_hash_sha256_final(&state, out.data());
  return out;
}

Sha384Digest sha384(ByteView data) {
  Sha384Digest out{};
  unsigned int len = 0;
  if (EVP_Digest(data.data(), data.size(), out.data(), &len, EVP_sha384(),
                 nullptr) != 1 ||
      len != SHA384_SIZE) {
    throwError(ErrorKind::InvalidHash, "EVP_Digest(sha384) failed");
  }
  return out;
}

std::string blake3_hex(ByteView data) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, data.data(), data.size());
  std::array<uint8_t, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out);
}

std::string to_hex(ByteView data) {
  static const char digits[] = "0123456789abcdef";
  std::string hex;
  hex.reserve(data.size() * 2);
  for (uint8_t b : data) {
    hex.push_back(digits[b >> 4]);
    hex.push_back(digits[b & 0x0f]);
  }
  return hex;
}

} // namespace arloader
