#include "crypto/deep_hash.hpp"
#include "utilities/errors.hpp"

#include <string>

namespace arloader {

DeepHashItem DeepHashItem::fromBlob(Bytes bytes) {
  DeepHashItem item;
  item.kind = Kind::Blob;
  item.blob = std::move(bytes);
  return item;
}

DeepHashItem DeepHashItem::fromBlob(ByteView bytes) {
  return fromBlob(Bytes(bytes.begin(), bytes.end()));
}

DeepHashItem DeepHashItem::fromString(std::string_view text) {
  return fromBlob(to_bytes(text));
}

DeepHashItem DeepHashItem::fromChildren(std::vector<DeepHashItem> items) {
  DeepHashItem item;
  item.kind = Kind::List;
  item.children = std::move(items);
  return item;
}

static Sha384Digest hashPair(const Sha384Digest &a, const Sha384Digest &b) {
  std::array<uint8_t, SHA384_SIZE * 2> joined{};
  std::copy(a.begin(), a.end(), joined.begin());
  std::copy(b.begin(), b.end(), joined.begin() + SHA384_SIZE);
  return sha384(joined);
}

Sha384Digest deepHash(const DeepHashItem &item) {
  if (item.kind == DeepHashItem::Kind::Blob) {
    std::string tag = "blob" + std::to_string(item.blob.size());
    return hashPair(sha384(as_bytes(tag)), sha384(item.blob));
  }
  std::string tag = "list" + std::to_string(item.children.size());
  Sha384Digest acc = sha384(as_bytes(tag));
  for (const auto &child : item.children) {
    acc = hashPair(acc, deepHash(child));
  }
  return acc;
}

void to_json(nlohmann::json &j, const DeepHashItem &item) {
  if (item.kind == DeepHashItem::Kind::Blob) {
    j = nlohmann::json{{"Blob", item.blob}};
  } else {
    nlohmann::json list = nlohmann::json::array();
    for (const auto &child : item.children)
      list.push_back(child);
    j = nlohmann::json{{"List", std::move(list)}};
  }
}

void from_json(const nlohmann::json &j, DeepHashItem &item) {
  if (j.contains("Blob")) {
    item = DeepHashItem::fromBlob(j.at("Blob").get<Bytes>());
  } else if (j.contains("List")) {
    std::vector<DeepHashItem> children;
    for (const auto &child : j.at("List"))
      children.push_back(child.get<DeepHashItem>());
    item = DeepHashItem::fromChildren(std::move(children));
  } else {
    throwError(ErrorKind::Json, "deep hash item is neither Blob nor List");
  }
}

} // namespace arloader
