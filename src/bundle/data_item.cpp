#include "bundle/data_item.hpp"
#include "bundle/avro_tags.hpp"
#include "utilities/errors.hpp"

#include <cstring>

namespace arloader {

namespace {

void putLe(Bytes &out, uint64_t value, size_t width) {
  for (size_t i = 0; i < width; ++i)
    out.push_back(static_cast<uint8_t>(value >> (8 * i)));
}

class ByteReader {
public:
  explicit ByteReader(ByteView bytes) : bytes_(bytes) {}

  ByteView take(size_t n, const char *what) {
    if (n > bytes_.size() - pos_) {
      throwError(ErrorKind::InvalidDataItem,
                 std::string("truncated ") + what);
    }
    ByteView view = bytes_.subspan(pos_, n);
    pos_ += n;
    return view;
  }

  uint64_t readLe(size_t width, const char *what) {
    ByteView raw = take(width, what);
    uint64_t value = 0;
    for (size_t i = 0; i < width; ++i)
      value |= static_cast<uint64_t>(raw[i]) << (8 * i);
    return value;
  }

  std::optional<Bytes> readOptionalAddress(const char *what) {
    uint8_t flag = take(1, what)[0];
    if (flag == 0)
      return std::nullopt;
    if (flag != 1) {
      throwError(ErrorKind::InvalidDataItem,
                 std::string("bad presence byte for ") + what);
    }
    ByteView raw = take(DATA_ITEM_ADDRESS_SIZE, what);
    return Bytes(raw.begin(), raw.end());
  }

  ByteView rest() { return take(bytes_.size() - pos_, "data"); }

private:
  ByteView bytes_;
  size_t pos_{0};
};

void checkAddress(const std::optional<Bytes> &field, const char *what) {
  if (field && field->size() != DATA_ITEM_ADDRESS_SIZE) {
    throwError(ErrorKind::InvalidDataItem,
               std::string(what) + " must be 32 bytes");
  }
}

} // namespace

size_t DataItem::serializedSize() const {
  size_t size = 2 + signature.size() + owner.size() + 2 + 16 + data.size();
  if (target)
    size += target->size();
  if (anchor)
    size += anchor->size();
  if (!tags.empty())
    size += encodeTags(tags).size();
  return size;
}

void DataItem::serializeTo(Bytes &out) const {
  if (signature.size() != RSA_MODULUS_SIZE)
    throwError(ErrorKind::UnsignedTransaction, "data item is not signed");
  if (owner.size() != RSA_MODULUS_SIZE)
    throwError(ErrorKind::InvalidDataItem, "owner must be 512 bytes");
  checkAddress(target, "target");
  checkAddress(anchor, "anchor");

  putLe(out, signatureType, 2);
  out.insert(out.end(), signature.begin(), signature.end());
  out.insert(out.end(), owner.begin(), owner.end());
  for (const auto *field : {&target, &anchor}) {
    if (*field) {
      out.push_back(1);
      out.insert(out.end(), (*field)->begin(), (*field)->end());
    } else {
      out.push_back(0);
    }
  }

  if (tags.empty()) {
    out.insert(out.end(), 16, 0);
  } else {
    Bytes tagBytes = encodeTags(tags);
    if (tagBytes.size() > MAX_TAG_BYTES) {
      throwError(ErrorKind::InvalidDataItem,
                 "encoded tags exceed " + std::to_string(MAX_TAG_BYTES) +
                     " bytes");
    }
    putLe(out, tags.size(), 8);
    putLe(out, tagBytes.size(), 8);
    out.insert(out.end(), tagBytes.begin(), tagBytes.end());
  }

  out.insert(out.end(), data.begin(), data.end());
}

Bytes DataItem::serialize() const {
  Bytes out;
  out.reserve(serializedSize());
  serializeTo(out);
  return out;
}

DataItem DataItem::deserialize(ByteView bytes) {
  ByteReader reader(bytes);
  DataItem item;

  item.signatureType = static_cast<uint16_t>(reader.readLe(2, "signature type"));
  if (item.signatureType != SIGNATURE_TYPE_ARWEAVE) {
    throwError(ErrorKind::InvalidDataItem,
               "unsupported signature type " +
                   std::to_string(item.signatureType));
  }
  ByteView sig = reader.take(RSA_MODULUS_SIZE, "signature");
  item.signature.assign(sig.begin(), sig.end());
  ByteView owner = reader.take(RSA_MODULUS_SIZE, "owner");
  item.owner.assign(owner.begin(), owner.end());
  item.target = reader.readOptionalAddress("target");
  item.anchor = reader.readOptionalAddress("anchor");

  uint64_t tagCount = reader.readLe(8, "tag count");
  uint64_t tagBytesLen = reader.readLe(8, "tag length");
  if (tagBytesLen > MAX_TAG_BYTES) {
    throwError(ErrorKind::InvalidDataItem,
               "tag block of " + std::to_string(tagBytesLen) + " bytes");
  }
  if (tagCount > 0 || tagBytesLen > 0) {
    ByteView tagBytes = reader.take(static_cast<size_t>(tagBytesLen), "tags");
    try {
      item.tags = decodeTags(tagBytes);
    } catch (const Error &e) {
      throwError(ErrorKind::InvalidDataItem, e.detail());
    }
    if (item.tags.size() != tagCount) {
      throwError(ErrorKind::InvalidDataItem,
                 "header declares " + std::to_string(tagCount) +
                     " tags, block holds " + std::to_string(item.tags.size()));
    }
  }

  ByteView data = reader.rest();
  item.data.assign(data.begin(), data.end());

  auto hash = sha256(item.signature);
  item.id.assign(hash.begin(), hash.end());
  return item;
}

DeepHashItem DataItem::toDeepHashItem() const {
  const Bytes empty;
  return DeepHashItem::fromChildren({
      DeepHashItem::fromString("dataitem"),
      DeepHashItem::fromString("1"),
      DeepHashItem::fromString(std::to_string(signatureType)),
      DeepHashItem::fromBlob(ByteView(owner)),
      DeepHashItem::fromBlob(ByteView(target ? *target : empty)),
      DeepHashItem::fromBlob(ByteView(anchor ? *anchor : empty)),
      DeepHashItem::fromBlob(encodeTags(tags)),
      DeepHashItem::fromBlob(ByteView(data)),
  });
}

void DataItem::sign(const Signer &signer) {
  owner = signer.publicModulus();
  auto digest = deepHash(toDeepHashItem());
  signature = signer.sign(digest);
  auto hash = sha256(signature);
  id.assign(hash.begin(), hash.end());
}

bool DataItem::verify() const {
  if (signature.size() != RSA_MODULUS_SIZE)
    return false;
  auto digest = deepHash(toDeepHashItem());
  return verifySignature(owner, digest, signature);
}

} // namespace arloader
