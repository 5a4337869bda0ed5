#ifndef ARLOADER_BUNDLE_HPP
#define ARLOADER_BUNDLE_HPP

#include <vector>

#include "bundle/data_item.hpp"

namespace arloader {

/// Bundle header: item count (u64 LE) followed by 24 reserved zero bytes.
inline constexpr size_t BUNDLE_HEADER_SIZE = 32;
/// Per-item header: body length (u64 LE), 24 zero bytes, item id.
inline constexpr size_t BUNDLE_ITEM_HEADER_SIZE = 64;

/**
 * @brief Packs signed items into one contiguous buffer.
 *
 * Sizes are computed first so the buffer is allocated once; headers are
 * written in a first pass and bodies appended in a second.
 * @throws Error(UnsignedTransaction) if any item lacks a signature.
 */
Bytes createBundle(const std::vector<DataItem> &items);

/**
 * @brief Parses a bundle and verifies every item's signature.
 *
 * Each item's id is taken from its header. Any malformed header, length
 * running past the buffer or failed signature rejects the whole bundle.
 * @throws Error(InvalidDataItem)
 */
std::vector<DataItem> deserializeBundle(ByteView bytes);

} // namespace arloader

#endif // ARLOADER_BUNDLE_HPP
