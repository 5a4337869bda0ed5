#ifndef ARLOADER_AVRO_TAGS_HPP
#define ARLOADER_AVRO_TAGS_HPP

#include <vector>

#include "transaction/tag.hpp"
#include "utilities/digest.hpp"

namespace arloader {

/// Upper bound on the encoded tag block of a data item.
inline constexpr size_t MAX_TAG_BYTES = 2048;

/**
 * @brief Avro binary datum for an array of {name: string, value: string}.
 *
 * Names and values travel as their base64url text. The array is written as
 * one block (zig-zag count, records, terminating zero), so an empty list
 * encodes to a single zero byte.
 */
Bytes encodeTags(const std::vector<Tag> &tags);

/**
 * @brief Decodes an Avro tag array, accepting multi-block and sized
 * (negative count) blocks.
 * @throws Error(InvalidTags) on truncated or malformed input, or trailing
 *         bytes after the terminating block.
 */
std::vector<Tag> decodeTags(ByteView bytes);

} // namespace arloader

#endif // ARLOADER_AVRO_TAGS_HPP
