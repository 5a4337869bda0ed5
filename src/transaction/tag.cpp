#include "transaction/tag.hpp"
#include "utilities/encoding.hpp"
#include "utilities/errors.hpp"

namespace arloader {

Tag Tag::fromUtf8(std::string_view name, std::string_view value) {
  return Tag{to_bytes(name), to_bytes(value)};
}

DeepHashItem Tag::toDeepHashItem() const {
  return DeepHashItem::fromChildren(
      {DeepHashItem::fromBlob(ByteView(name)),
       DeepHashItem::fromBlob(ByteView(value))});
}

DeepHashItem tagsToDeepHashItem(const std::vector<Tag> &tags) {
  if (tags.empty())
    return DeepHashItem::fromBlob(Bytes{});
  std::vector<DeepHashItem> children;
  children.reserve(tags.size());
  for (const auto &tag : tags)
    children.push_back(tag.toDeepHashItem());
  return DeepHashItem::fromChildren(std::move(children));
}

Tag parseTag(const std::string &text) {
  auto sep = text.find(':');
  if (sep == std::string::npos || sep == 0) {
    throwError(ErrorKind::InvalidTags,
               "expected name:value, got \"" + text + "\"");
  }
  return Tag::fromUtf8(text.substr(0, sep), text.substr(sep + 1));
}

void validateTags(const std::vector<Tag> &tags) {
  if (tags.size() > MAX_TAG_COUNT) {
    throwError(ErrorKind::InvalidTags,
               std::to_string(tags.size()) + " tags exceeds the limit of " +
                   std::to_string(MAX_TAG_COUNT));
  }
  for (const auto &tag : tags) {
    if (tag.name.empty())
      throwError(ErrorKind::InvalidTags, "empty tag name");
    if (tag.name.size() > MAX_TAG_NAME_SIZE)
      throwError(ErrorKind::InvalidTags, "tag name too long");
    if (tag.value.size() > MAX_TAG_VALUE_SIZE)
      throwError(ErrorKind::InvalidTags,
                 "value of tag " + tag.nameUtf8() + " too long");
  }
}

void to_json(nlohmann::json &j, const Tag &tag) {
  j = nlohmann::json{{"name", b64_encode(tag.name)},
                     {"value", b64_encode(tag.value)}};
}

void from_json(const nlohmann::json &j, Tag &tag) {
  tag.name = b64_decode(j.at("name").get<std::string>());
  tag.value = b64_decode(j.at("value").get<std::string>());
}

} // namespace arloader
