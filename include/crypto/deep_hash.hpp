#ifndef ARLOADER_DEEP_HASH_HPP
#define ARLOADER_DEEP_HASH_HPP

#include <nlohmann/json.hpp>
#include <string_view>
#include <vector>

#include "utilities/digest.hpp"

namespace arloader {

/**
 * @brief Recursive input of the deep hash: either a blob of bytes or a list
 * of further items.
 */
struct DeepHashItem {
  enum class Kind { Blob, List };

  Kind kind{Kind::Blob};
  Bytes blob;
  std::vector<DeepHashItem> children;

  static DeepHashItem fromBlob(Bytes bytes);
  static DeepHashItem fromBlob(ByteView bytes);
  static DeepHashItem fromString(std::string_view text);
  static DeepHashItem fromChildren(std::vector<DeepHashItem> items);

  bool operator==(const DeepHashItem &other) const = default;
};

/**
 * @brief Computes the 48-byte deep hash of @p item.
 *
 * Blob:  SHA384(SHA384("blob" || len) || SHA384(bytes))
 * List:  fold over children starting at SHA384("list" || count), each step
 *        acc = SHA384(acc || deep_hash(child)).
 */
Sha384Digest deepHash(const DeepHashItem &item);

/// {"Blob":[bytes...]} / {"List":[items...]} form understood by the co-signer.
void to_json(nlohmann::json &j, const DeepHashItem &item);
void from_json(const nlohmann::json &j, DeepHashItem &item);

} // namespace arloader

#endif // ARLOADER_DEEP_HASH_HPP
