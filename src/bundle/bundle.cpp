#include "bundle/bundle.hpp"
#include "utilities/errors.hpp"
#include "utilities/logger.h"

#include <string>

namespace arloader {

namespace {

void putU64(Bytes &out, uint64_t value) {
  for (size_t i = 0; i < 8; ++i)
    out.push_back(static_cast<uint8_t>(value >> (8 * i)));
}

uint64_t getU64(ByteView bytes, size_t at) {
  uint64_t value = 0;
  for (size_t i = 0; i < 8; ++i)
    value |= static_cast<uint64_t>(bytes[at + i]) << (8 * i);
  return value;
}

} // namespace

Bytes createBundle(const std::vector<DataItem> &items) {
  std::vector<size_t> sizes;
  sizes.reserve(items.size());
  size_t total = BUNDLE_HEADER_SIZE + items.size() * BUNDLE_ITEM_HEADER_SIZE;
  for (const auto &item : items) {
    if (item.id.size() != SHA256_SIZE)
      throwError(ErrorKind::UnsignedTransaction, "data item has no id");
    sizes.push_back(item.serializedSize());
    total += sizes.back();
  }

  Bytes out;
  out.reserve(total);
  putU64(out, items.size());
  out.insert(out.end(), 24, 0);
  for (size_t i = 0; i < items.size(); ++i) {
    putU64(out, sizes[i]);
    out.insert(out.end(), 24, 0);
    out.insert(out.end(), items[i].id.begin(), items[i].id.end());
  }
  for (const auto &item : items)
    item.serializeTo(out);

  if (out.size() != total) {
    throwError(ErrorKind::InvalidDataItem,
               "bundle size mismatch: expected " + std::to_string(total) +
                   ", wrote " + std::to_string(out.size()));
  }
  return out;
}

std::vector<DataItem> deserializeBundle(ByteView bytes) {
  if (bytes.size() < BUNDLE_HEADER_SIZE)
    throwError(ErrorKind::InvalidDataItem, "bundle shorter than its header");
  uint64_t count = getU64(bytes, 0);
  if (count > (bytes.size() - BUNDLE_HEADER_SIZE) / BUNDLE_ITEM_HEADER_SIZE) {
    throwError(ErrorKind::InvalidDataItem,
               "bundle declares " + std::to_string(count) + " items");
  }

  struct Entry {
    uint64_t length;
    Bytes id;
  };
  std::vector<Entry> entries;
  entries.reserve(static_cast<size_t>(count));
  size_t pos = BUNDLE_HEADER_SIZE;
  for (uint64_t i = 0; i < count; ++i) {
    Entry entry;
    entry.length = getU64(bytes, pos);
    auto id = bytes.subspan(pos + 32, SHA256_SIZE);
    entry.id.assign(id.begin(), id.end());
    entries.push_back(std::move(entry));
    pos += BUNDLE_ITEM_HEADER_SIZE;
  }

  std::vector<DataItem> items;
  items.reserve(entries.size());
  for (size_t i = 0; i < entries.size(); ++i) {
    if (entries[i].length > bytes.size() - pos) {
      throwError(ErrorKind::InvalidDataItem,
                 "item " + std::to_string(i) + " runs past end of bundle");
    }
    DataItem item = DataItem::deserialize(
        bytes.subspan(pos, static_cast<size_t>(entries[i].length)));
    pos += static_cast<size_t>(entries[i].length);
    bool valid = false;
    try {
      valid = item.verify();
    } catch (const Error &e) {
      throwError(ErrorKind::InvalidDataItem,
                 "item " + std::to_string(i) + ": " + e.what());
    }
    if (!valid) {
      throwError(ErrorKind::InvalidDataItem,
                 "signature of item " + std::to_string(i) + " does not verify");
    }
    item.id = std::move(entries[i].id);
    items.push_back(std::move(item));
  }
  if (pos != bytes.size()) {
    Logger::getInstance().log(LogLevel::DEBUG,
                              "bundle has " +
                                  std::to_string(bytes.size() - pos) +
                                  " trailing bytes");
  }
  return items;
}

} // namespace arloader
