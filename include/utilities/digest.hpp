#ifndef ARLOADER_DIGEST_HPP
#define ARLOADER_DIGEST_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace arloader {

using Bytes = std::vector<uint8_t>;
using ByteView = std::span<const uint8_t>;

/// Digest sizes for the hashes used on the wire.
inline constexpr size_t SHA256_SIZE = 32;
inline constexpr size_t SHA384_SIZE = 48;

using Sha256Digest = std::array<uint8_t, SHA256_SIZE>;
using Sha384Digest = std::array<uint8_t, SHA384_SIZE>;

inline ByteView as_bytes(std::string_view s) {
  return ByteView(reinterpret_cast<const uint8_t *>(s.data()), s.size());
}

inline Bytes to_bytes(std::string_view s) {
  return Bytes(s.begin(), s.end());
}

/** SHA-256 of @p data (libsodium). */
Sha256Digest sha256(ByteView data);

/**
 * @brief Hash of concatenated hashes.
 *
 * Computes SHA256(SHA256(p0) || SHA256(p1) || ...). Used for every Merkle
 * node id.
 */
Sha256Digest sha256_all(std::initializer_list<ByteView> parts);

/** SHA-384 of @p data (OpenSSL EVP). */
Sha384Digest sha384(ByteView data);

/** Lower-case hex of the 32-byte BLAKE3 hash of @p data. */
std::string blake3_hex(ByteView data);

std::string to_hex(ByteView data);

} // namespace arloader

#endif // ARLOADER_DIGEST_HPP
