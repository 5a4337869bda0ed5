#ifndef ARLOADER_ENCODING_HPP
#define ARLOADER_ENCODING_HPP

#include <string>
#include <string_view>

#include "digest.hpp"

namespace arloader {

/**
 * @brief Encodes bytes as unpadded URL-safe base64 (RFC 4648 §5).
 */
std::string b64_encode(ByteView data);

/**
 * @brief Decodes unpadded URL-safe base64.
 * @throws Error(Base64Decode) if the text is not valid base64url.
 */
Bytes b64_decode(std::string_view text);

/// Bitcoin-alphabet base58, used by the payment chain.
std::string b58_encode(ByteView data);

/**
 * @brief Decodes base58 text.
 * @throws Error(Base64Decode) on a character outside the alphabet.
 */
Bytes b58_decode(std::string_view text);

} // namespace arloader

#endif // ARLOADER_ENCODING_HPP
