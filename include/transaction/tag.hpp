#ifndef ARLOADER_TAG_HPP
#define ARLOADER_TAG_HPP

#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <vector>

#include "crypto/deep_hash.hpp"
#include "utilities/digest.hpp"

namespace arloader {

inline constexpr size_t MAX_TAG_COUNT = 128;
inline constexpr size_t MAX_TAG_NAME_SIZE = 1024;
inline constexpr size_t MAX_TAG_VALUE_SIZE = 3072;

/// Name/value pair attached to transactions and data items.
struct Tag {
  Bytes name;
  Bytes value;

  static Tag fromUtf8(std::string_view name, std::string_view value);

  std::string nameUtf8() const { return std::string(name.begin(), name.end()); }
  std::string valueUtf8() const {
    return std::string(value.begin(), value.end());
  }

  /// List([Blob(name), Blob(value)])
  DeepHashItem toDeepHashItem() const;

  bool operator==(const Tag &other) const = default;
};

/// List of tag lists, or an empty blob when there are no tags.
DeepHashItem tagsToDeepHashItem(const std::vector<Tag> &tags);

/**
 * @brief Parses a CLI tag of the form "name:value".
 * @throws Error(InvalidTags) when the separator is missing or the name is
 *         empty.
 */
Tag parseTag(const std::string &text);

/**
 * @brief Enforces count and size limits on a tag list.
 * @throws Error(InvalidTags)
 */
void validateTags(const std::vector<Tag> &tags);

/// {"name": b64, "value": b64}
void to_json(nlohmann::json &j, const Tag &tag);
void from_json(const nlohmann::json &j, Tag &tag);

} // namespace arloader

#endif // ARLOADER_TAG_HPP
