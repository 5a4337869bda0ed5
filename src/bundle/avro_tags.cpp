#include "bundle/avro_tags.hpp"
#include "utilities/encoding.hpp"
#include "utilities/errors.hpp"

#include <string>

namespace arloader {

namespace {

void writeLong(Bytes &out, int64_t value) {
  uint64_t n = (static_cast<uint64_t>(value) << 1) ^
               static_cast<uint64_t>(value >> 63);
  while (n >= 0x80) {
    out.push_back(static_cast<uint8_t>(n | 0x80));
    n >>= 7;
  }
  out.push_back(static_cast<uint8_t>(n));
}

void writeString(Bytes &out, const std::string &text) {
  writeLong(out, static_cast<int64_t>(text.size()));
  out.insert(out.end(), text.begin(), text.end());
}

class AvroReader {
public:
  explicit AvroReader(ByteView bytes) : bytes_(bytes) {}

  int64_t readLong() {
    uint64_t n = 0;
    int shift = 0;
    while (true) {
      if (pos_ >= bytes_.size())
        throwError(ErrorKind::InvalidTags, "truncated varint");
      uint8_t b = bytes_[pos_++];
      if (shift > 63)
        throwError(ErrorKind::InvalidTags, "varint overflow");
      n |= static_cast<uint64_t>(b & 0x7f) << shift;
      if ((b & 0x80) == 0)
        break;
      shift += 7;
    }
    return static_cast<int64_t>(n >> 1) ^ -static_cast<int64_t>(n & 1);
  }

  std::string readString() {
    int64_t len = readLong();
    if (len < 0 || static_cast<uint64_t>(len) > bytes_.size() - pos_)
      throwError(ErrorKind::InvalidTags, "string length out of range");
    std::string text(reinterpret_cast<const char *>(bytes_.data() + pos_),
                     static_cast<size_t>(len));
    pos_ += static_cast<size_t>(len);
    return text;
  }

  bool atEnd() const { return pos_ == bytes_.size(); }

private:
  ByteView bytes_;
  size_t pos_{0};
};

} // namespace

Bytes encodeTags(const std::vector<Tag> &tags) {
  Bytes out;
  if (!tags.empty()) {
    writeLong(out, static_cast<int64_t>(tags.size()));
    for (const auto &tag : tags) {
      writeString(out, b64_encode(tag.name));
      writeString(out, b64_encode(tag.value));
    }
  }
  writeLong(out, 0);
  return out;
}

std::vector<Tag> decodeTags(ByteView bytes) {
  AvroReader reader(bytes);
  std::vector<Tag> tags;
  while (true) {
    int64_t count = reader.readLong();
    if (count == 0)
      break;
    if (count < 0) {
      count = -count;
      reader.readLong(); // block size in bytes
    }
    if (static_cast<uint64_t>(count) > MAX_TAG_BYTES)
      throwError(ErrorKind::InvalidTags, "tag block count too large");
    for (int64_t i = 0; i < count; ++i) {
      Tag tag;
      try {
        tag.name = b64_decode(reader.readString());
        tag.value = b64_decode(reader.readString());
      } catch (const Error &e) {
        if (e.kind() != ErrorKind::Base64Decode)
          throw;
        throwError(ErrorKind::InvalidTags, e.detail());
      }
      tags.push_back(std::move(tag));
    }
  }
  if (!reader.atEnd())
    throwError(ErrorKind::InvalidTags, "trailing bytes after tag array");
  return tags;
}

} // namespace arloader
