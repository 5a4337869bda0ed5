#ifndef ARLOADER_DATA_ITEM_HPP
#define ARLOADER_DATA_ITEM_HPP

#include <cstdint>
#include <optional>
#include <vector>

#include "crypto/deep_hash.hpp"
#include "crypto/signer.hpp"
#include "transaction/tag.hpp"
#include "utilities/digest.hpp"

namespace arloader {

/// Signature type of RSA-PSS-SHA256 with a 4096-bit key.
inline constexpr uint16_t SIGNATURE_TYPE_ARWEAVE = 1;
inline constexpr size_t DATA_ITEM_ADDRESS_SIZE = 32;

/**
 * @brief Self-signed bundle member.
 *
 * Wire layout (little endian):
 *   sig_type u16 | signature[512] | owner[512]
 *   target flag u8 [+32] | anchor flag u8 [+32]
 *   tag_count u64 | tag_bytes_len u64 | tag_bytes | data
 */
struct DataItem {
  Bytes id;
  uint16_t signatureType{SIGNATURE_TYPE_ARWEAVE};
  Bytes signature;
  Bytes owner;
  std::optional<Bytes> target;
  std::optional<Bytes> anchor;
  std::vector<Tag> tags;
  Bytes data;

  /// Exact length of serialize().
  size_t serializedSize() const;

  /**
   * @brief Appends the wire form to @p out.
   * @throws Error(UnsignedTransaction) when the item is not signed,
   *         Error(InvalidDataItem) on a malformed target, anchor or tag block.
   */
  void serializeTo(Bytes &out) const;
  Bytes serialize() const;

  /**
   * @brief Parses the wire form. The id is recomputed from the signature.
   * @throws Error(InvalidDataItem)
   */
  static DataItem deserialize(ByteView bytes);

  /// List(["dataitem", "1", sig_type, owner, target, anchor, tag_bytes, data])
  DeepHashItem toDeepHashItem() const;

  /// Sets owner, signature and id.
  void sign(const Signer &signer);

  /// Checks the signature over the deep hash against owner.
  bool verify() const;

  bool operator==(const DataItem &other) const = default;
};

} // namespace arloader

#endif // ARLOADER_DATA_ITEM_HPP
