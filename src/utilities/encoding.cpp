#include "utilities/encoding.hpp"
#include "utilities/errors.hpp"

#include "cppcodec/base64_url_unpadded.hpp"
#include <algorithm>

namespace arloader {

using base64 = cppcodec::base64_url_unpadded;

namespace {
const char B58_ALPHABET[] =
    "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";
} // namespace

std::string b64_encode(ByteView data) {
  return base64::encode(data.data(), data.size());
}

Bytes b64_decode(std::string_view text) {
  try {
    return base64::decode(text.data(), text.size());
  } catch (const std::exception &e) {
    throwError(ErrorKind::Base64Decode,
               "'" + std::string(text) + "': " + e.what());
  }
}

std::string b58_encode(ByteView data) {
  size_t zeros = 0;
  while (zeros < data.size() && data[zeros] == 0)
    ++zeros;

  // base-256 to base-58, little-endian digit buffer
  std::vector<uint8_t> digits;
  digits.reserve(data.size() * 138 / 100 + 1);
  for (size_t i = zeros; i < data.size(); ++i) {
    int carry = data[i];
    for (auto &d : digits) {
      carry += d << 8;
      d = static_cast<uint8_t>(carry % 58);
      carry /= 58;
    }
    while (carry > 0) {
      digits.push_back(static_cast<uint8_t>(carry % 58));
      carry /= 58;
    }
  }

  std::string out(zeros, '1');
  for (auto it = digits.rbegin(); it != digits.rend(); ++it)
    out.push_back(B58_ALPHABET[*it]);
  return out;
}

Bytes b58_decode(std::string_view text) {
  size_t ones = 0;
  while (ones < text.size() && text[ones] == '1')
    ++ones;

  std::vector<uint8_t> bytes; // little-endian
  for (size_t i = ones; i < text.size(); ++i) {
    const char *pos = std::find(B58_ALPHABET, B58_ALPHABET + 58, text[i]);
    if (pos == B58_ALPHABET + 58) {
      throwError(ErrorKind::Base64Decode,
                 "invalid base58 character in '" + std::string(text) + "'");
    }
    int carry = static_cast<int>(pos - B58_ALPHABET);
    for (auto &b : bytes) {
      carry += b * 58;
      b = static_cast<uint8_t>(carry & 0xff);
      carry >>= 8;
    }
    while (carry > 0) {
      bytes.push_back(static_cast<uint8_t>(carry & 0xff));
      carry >>= 8;
    }
  }

  Bytes out(ones, 0);
  out.insert(out.end(), bytes.rbegin(), bytes.rend());
  return out;
}

} // namespace arloader
